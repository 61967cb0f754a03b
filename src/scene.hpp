#ifndef TEXPACK_SCENE_HPP
#define TEXPACK_SCENE_HPP

#include <cstdint>
#include <vector>

namespace texpack {

/* Interleaved vertex as it is uploaded: position, then texcoord */
struct mesh_vertex {
    float position[3];
    float texcoord[2];
};

struct sphere_mesh {
    std::vector<mesh_vertex> vertices;
    std::vector<uint32_t> indices;
};

/* UV sphere centered on the origin
 *
 * (stacks+1)*(slices+1) vertices, the seam is duplicated so that texcoords
 * span the full [0, 1] range. stacks*slices*6 indices.
 */
void make_sphere(int stacks, int slices, float radius, sphere_mesh& mesh);

/* grid_n x grid_n per-instance offsets (x, y, z) on the XY plane
 *
 * Rows are spacing apart and the grid is centered on the origin.
 */
void make_instance_grid(int grid_n, float spacing, std::vector<float>& offsets);

/* Camera looking down -Z at the whole grid, column-major */
void make_view_proj(
    int grid_n,
    float spacing,
    float radius,
    float aspect,
    float view_proj[16]
);

} // namespace texpack

#endif // TEXPACK_SCENE_HPP
