#include <cubeland/land/chunk_mesher.hpp>

#include <algorithm>
#include <array>

namespace cubeland::land
{

namespace
{

constexpr int32_t N = Consts::CHUNK_SIZE_BLOCKS;

// Texture axes (u, v) for faces of each normal axis. Side faces
// keep v along world Y so textures are not rotated sideways.
constexpr int UV_AXES[3][2] = {
	{ 2, 1 }, // X faces
	{ 0, 2 }, // Y faces
	{ 0, 1 }, // Z faces
};

void emitQuad(std::vector<ChunkMeshQuad> &quads, BlockFace face, int32_t layer, int32_t u, int32_t v, int32_t w,
	int32_t h, BlockId id)
{
	const int axis = faceAxis(face);
	const int u_axis = (axis + 1) % 3;
	const int v_axis = (axis + 2) % 3;

	glm::vec3 corner;
	corner[axis] = float(isPositiveFace(face) ? layer + 1 : layer);
	corner[u_axis] = float(u);
	corner[v_axis] = float(v);

	glm::vec3 du(0.0f);
	du[u_axis] = float(w);
	glm::vec3 dv(0.0f);
	dv[v_axis] = float(h);

	ChunkMeshQuad quad;

	// cross(du, dv) points along +axis, reverse the order for negative faces
	if (isPositiveFace(face)) {
		quad.positions[0] = corner;
		quad.positions[1] = corner + du;
		quad.positions[2] = corner + du + dv;
		quad.positions[3] = corner + dv;
	} else {
		quad.positions[0] = corner;
		quad.positions[1] = corner + dv;
		quad.positions[2] = corner + du + dv;
		quad.positions[3] = corner + du;
	}

	const int tex_u = UV_AXES[axis][0];
	const int tex_v = UV_AXES[axis][1];
	for (int i = 0; i < 4; i++) {
		const glm::vec3 rel = quad.positions[i] - corner;
		quad.uvs[i] = glm::vec2(rel[tex_u], rel[tex_v]);
	}

	quad.normal = glm::vec3(faceNormal(face));
	quad.atlas_layer = BlockRegistry::textureLayer(id, face);
	quad.block_id = id;
	quad.face = face;
	quad.transparent = BlockRegistry::isTransparent(id);

	quads.emplace_back(quad);
}

} // namespace

ChunkMesher::ChunkMesher() : m_expanded(std::make_unique<ChunkAdjacencyRef::ExpandedArray>()) {}

ChunkMesher::~ChunkMesher() = default;

bool ChunkMesher::isFaceVisible(BlockId block, BlockId neighbor) noexcept
{
	if (!BlockRegistry::isValid(block) || block == BlockRegistry::BlockAir) {
		return false;
	}

	// Same-type faces merge into one volume (stone-stone, water-water, glass-glass)
	if (neighbor == block) {
		return false;
	}

	return !BlockRegistry::isOpaque(neighbor);
}

ChunkMesh ChunkMesher::mesh(const ChunkAdjacencyRef &adj)
{
	ChunkAdjacencyRef::ExpandedArray &ids = *m_expanded;
	adj.expandBlockIds(ids, MISSING_NEIGHBOR_FILL);

	std::vector<ChunkMeshQuad> quads;
	// Block ID of visible face at (u, v) of the current layer, air if no face
	std::array<BlockId, N * N> mask;

	for (uint32_t f = 0; f < NUM_BLOCK_FACES; f++) {
		const BlockFace face = static_cast<BlockFace>(f);
		const int axis = faceAxis(face);
		const int u_axis = (axis + 1) % 3;
		const int v_axis = (axis + 2) % 3;
		const glm::ivec3 normal = faceNormal(face);

		for (int32_t layer = 0; layer < N; layer++) {
			bool have_faces = false;

			for (int32_t v = 0; v < N; v++) {
				for (int32_t u = 0; u < N; u++) {
					// Coordinates in expanded array, shifted by one
					glm::ivec3 c;
					c[axis] = layer + 1;
					c[u_axis] = u + 1;
					c[v_axis] = v + 1;

					const BlockId block = ids[c];
					const bool visible = isFaceVisible(block, ids[c + normal]);
					mask[size_t(v * N + u)] = visible ? block : BlockId(BlockRegistry::BlockAir);
					have_faces |= visible;
				}
			}

			if (!have_faces) {
				continue;
			}

			// Greedy merge: extend along u while IDs match, then extend
			// the whole [u; u + w) row along v while it fully matches
			for (int32_t v = 0; v < N; v++) {
				for (int32_t u = 0; u < N;) {
					const BlockId id = mask[size_t(v * N + u)];
					if (id == BlockRegistry::BlockAir) {
						u++;
						continue;
					}

					int32_t w = 1;
					while (u + w < N && mask[size_t(v * N + u + w)] == id) {
						w++;
					}

					int32_t h = 1;
					for (; v + h < N; h++) {
						bool row_matches = true;
						for (int32_t k = 0; k < w; k++) {
							if (mask[size_t((v + h) * N + u + k)] != id) {
								row_matches = false;
								break;
							}
						}

						if (!row_matches) {
							break;
						}
					}

					emitQuad(quads, face, layer, u, v, w, h, id);

					for (int32_t dv = 0; dv < h; dv++) {
						std::fill_n(mask.begin() + (v + dv) * N + u, w, BlockId(BlockRegistry::BlockAir));
					}

					u += w;
				}
			}
		}
	}

	return ChunkMesh(std::move(quads));
}

} // namespace cubeland::land
