#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <Tracy.hpp>

// After Tracy, Xlib defines None, Bool and Status as macros
#include "bench.hpp"
#include "gl_backend.hpp"
#include "platform.hpp"
#include "scene.hpp"
#include "texpack.hpp"

namespace texpack {

/* GL objects of a running benchmark */
struct bench_state {
    gl::context ctx;
    gl::instanced_mesh mesh;
    std::vector<GLuint> textures;
    GLuint program = 0;
};

static int submit_frame(void* p)
{
    ZoneScopedN("submit");
    const bench_state* state = static_cast<const bench_state*>(p);
    gl::draw_frame(state->mesh);
    return OK;
}

static void sync_frame(void*)
{
    ZoneScopedN("finish");
    glFinish();
}

static void release(bench_state& state)
{
    if (state.ctx.glc != NULL)
    {
        gl::destroy_mesh(state.mesh);
        if (!state.textures.empty())
        {
            glDeleteTextures((GLsizei)state.textures.size(), state.textures.data());
        }
        if (state.program != 0)
        {
            glDeleteProgram(state.program);
        }
    }
    gl::destroy_context(state.ctx);
}

/* Context, textures, program and mesh, in that order */
static int setup(const bench_config& cfg, const encoded_image& enc, bench_state& state)
{
    ZoneScopedN("setup");

    const std::string title = std::string("texpack - ") + layout_name(cfg.layout);
    int err = gl::create_context(cfg.win_w, cfg.win_h, title.c_str(), state.ctx);
    if (err != OK)
    {
        return err;
    }

    for (size_t i = 0; i < enc.textures.size(); ++i)
    {
        const texture_desc& desc = enc.layout.textures[i];
        const texture_u8& tex = enc.textures[i];
        state.textures.push_back(
            gl::upload_texture(tex.data.data(), desc.unit, tex.w, tex.h, tex.nch));
    }

    std::string log;
    err = gl::compile_program(
        shaders::vertex_source(),
        shaders::fragment_source(cfg.layout),
        state.program,
        log
    );
    if (err != OK)
    {
        LOGE("%s:\n%s\n", err_str(err), log.c_str());
        return err;
    }

    gl::bind_layout_uniforms(state.program, enc.layout);

    float view_proj[16];
    make_view_proj(cfg.grid_n, cfg.spacing, cfg.sphere_radius,
        (float)cfg.win_w / (float)cfg.win_h, view_proj);
    glUniformMatrix4fv(glGetUniformLocation(state.program, "view_proj"),
        1, GL_FALSE, view_proj);

    sphere_mesh mesh;
    make_sphere(cfg.sphere_stacks, cfg.sphere_slices, cfg.sphere_radius, mesh);
    std::vector<float> offsets;
    make_instance_grid(cfg.grid_n, cfg.spacing, offsets);
    gl::upload_mesh(mesh, offsets, state.mesh);

    LOGI("Mesh: %zu vertices, %zu indices, %d instances\n",
        mesh.vertices.size(), mesh.indices.size(), state.mesh.instance_count);

    glViewport(0, 0, cfg.win_w, cfg.win_h);
    glEnable(GL_DEPTH_TEST);
    glClearColor(0.1f, 0.1f, 0.1f, 1.0f);

    if (gl::check_errors("setup") != 0)
    {
        LOGW("GL reported errors during setup, timings may be off\n");
    }

    return OK;
}

int bench_entry(const bench_config& cfg)
{
    LOGI("Layout: %s, grid %dx%d, spacing %.2f, duration %.1f s\n",
        layout_name(cfg.layout), cfg.grid_n, cfg.grid_n,
        (double)cfg.spacing, cfg.duration_s);

    // Everything that can fail on the CPU happens before the GPU is touched
    source_image img;
    int err = load_image(cfg.image, img);
    if (err != OK)
    {
        return err;
    }

    encoded_image enc;
    err = encode(img, cfg.layout, enc);
    if (err != OK)
    {
        return err;
    }

    bench_state state;
    err = setup(cfg, enc, state);
    if (err != OK)
    {
        release(state);
        return err;
    }

    frame_ops ops;
    ops.ctx = &state;
    ops.submit = submit_frame;
    ops.sync = sync_frame;

    frame_stats stats;
    err = run_timed_loop(cfg, ops, stats);
    if (err != OK)
    {
        release(state);
        return err;
    }

    print_summary(cfg, stats);

    // Show the last frame, then cool down before tearing down
    gl::draw_frame(state.mesh);
    gl::present(state.ctx);
    std::this_thread::sleep_for(std::chrono::duration<double>(cfg.cooldown_s));

    release(state);
    return OK;
}

} // namespace texpack
