#include <cmath>
#include <cstddef>
#include <cstring>

#include "scene.hpp"
#include "texpack_mathlib.hpp"

namespace texpack {

static constexpr float PI = 3.14159265358979f;

/* Vertical field of view of the benchmark camera */
static constexpr float FOV_Y = PI / 4.0f;

void make_sphere(int stacks, int slices, float radius, sphere_mesh& mesh)
{
    mesh.vertices.clear();
    mesh.indices.clear();
    mesh.vertices.reserve((stacks + 1) * (slices + 1));
    mesh.indices.reserve(stacks * slices * 6);

    for (int i = 0; i <= stacks; ++i)
    {
        const float v = (float)i / (float)stacks;
        const float phi = v * PI;

        for (int j = 0; j <= slices; ++j)
        {
            const float u = (float)j / (float)slices;
            const float theta = u * 2.0f * PI;

            mesh_vertex vtx;
            vtx.position[0] = radius * std::sin(phi) * std::cos(theta);
            vtx.position[1] = radius * std::cos(phi);
            vtx.position[2] = radius * std::sin(phi) * std::sin(theta);
            vtx.texcoord[0] = u;
            vtx.texcoord[1] = v;
            mesh.vertices.push_back(vtx);
        }
    }

    const uint32_t row = (uint32_t)slices + 1;
    for (int i = 0; i < stacks; ++i)
    {
        for (int j = 0; j < slices; ++j)
        {
            const uint32_t a = (uint32_t)i * row + (uint32_t)j;
            const uint32_t b = a + row;

            mesh.indices.push_back(a);
            mesh.indices.push_back(b);
            mesh.indices.push_back(a + 1);

            mesh.indices.push_back(a + 1);
            mesh.indices.push_back(b);
            mesh.indices.push_back(b + 1);
        }
    }
}

void make_instance_grid(int grid_n, float spacing, std::vector<float>& offsets)
{
    offsets.resize((size_t)grid_n * (size_t)grid_n * 3);

    const float center = 0.5f * (float)(grid_n - 1);
    for (int gy = 0; gy < grid_n; ++gy)
    {
        for (int gx = 0; gx < grid_n; ++gx)
        {
            float* o = offsets.data() + 3 * (gy * grid_n + gx);
            o[0] = ((float)gx - center) * spacing;
            o[1] = ((float)gy - center) * spacing;
            o[2] = 0.0f;
        }
    }
}

void make_view_proj(
    int grid_n,
    float spacing,
    float radius,
    float aspect,
    float view_proj[16]
){
    // Distance at which the grid fits vertically, with a small margin
    const float half_extent = 0.5f * (float)(grid_n - 1) * spacing + radius;
    const float dist = 1.1f * half_extent / std::tan(0.5f * FOV_Y);

    const Mat4f proj = perspective(FOV_Y, aspect, 0.1f, dist + 4.0f * radius);
    const Mat4f view = look_at(
        Vec3f { F(0.0), F(0.0), (decimal)dist },
        Vec3f { F(0.0), F(0.0), F(0.0) },
        Vec3f { F(0.0), F(1.0), F(0.0) }
    );

    const Mat4f vp = proj * view;
    std::memcpy(view_proj, vp.m, sizeof(vp.m));
}

} // namespace texpack
