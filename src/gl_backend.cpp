#include <cstddef>
#include <string>
#include <vector>

#include <Tracy.hpp>

// After Tracy, Xlib defines None, Bool and Status as macros
#include "gl_backend.hpp"
#include "platform.hpp"

namespace texpack::gl {

/* Double buffered RGB with depth, drawable into a window */
static const int FB_ATTRIBUTES[] = {
    GLX_X_RENDERABLE,  True,
    GLX_DRAWABLE_TYPE, GLX_WINDOW_BIT,
    GLX_RENDER_TYPE,   GLX_RGBA_BIT,
    GLX_X_VISUAL_TYPE, GLX_TRUE_COLOR,
    GLX_DOUBLEBUFFER,  True,
    GLX_RED_SIZE,      8,
    GLX_GREEN_SIZE,    8,
    GLX_BLUE_SIZE,     8,
    GLX_DEPTH_SIZE,    24,
    None
};

static const int CONTEXT_ATTRIBUTES[] = {
    GLX_CONTEXT_MAJOR_VERSION_ARB, 3,
    GLX_CONTEXT_MINOR_VERSION_ARB, 3,
    GLX_CONTEXT_PROFILE_MASK_ARB,  GLX_CONTEXT_CORE_PROFILE_BIT_ARB,
    None
};

int create_context(int w, int h, const char* title, context& ctx)
{
    ctx = context();
    ctx.w = w;
    ctx.h = h;

    ctx.display = XOpenDisplay(NULL);
    if (ctx.display == NULL)
    {
        LOGE("Cannot connect to X server\n");
        return ERR_GL_CONTEXT;
    }

    int num_configs = 0;
    GLXFBConfig* fb_configs = glXChooseFBConfig(
        ctx.display,
        DefaultScreen(ctx.display),
        FB_ATTRIBUTES,
        &num_configs
    );
    if ( (fb_configs == NULL) || (num_configs == 0) )
    {
        LOGE("No double buffered GLX framebuffer configuration with depth\n");
        destroy_context(ctx);
        return ERR_GL_CONTEXT;
    }
    const GLXFBConfig fb_config = fb_configs[0];
    XFree(fb_configs);

    XVisualInfo* vi = glXGetVisualFromFBConfig(ctx.display, fb_config);
    if (vi == NULL)
    {
        LOGE("No X visual for the GLX framebuffer configuration\n");
        destroy_context(ctx);
        return ERR_GL_CONTEXT;
    }

    const Window root = RootWindow(ctx.display, vi->screen);
    ctx.cmap = XCreateColormap(ctx.display, root, vi->visual, AllocNone);

    XSetWindowAttributes swa;
    swa.colormap = ctx.cmap;
    swa.event_mask = ExposureMask | StructureNotifyMask;
    ctx.window = XCreateWindow(
        ctx.display, root,
        0, 0, w, h, 0,
        vi->depth, InputOutput, vi->visual,
        CWColormap | CWEventMask, &swa
    );
    XFree(vi);
    if (ctx.window == 0)
    {
        LOGE("Cannot create X window\n");
        destroy_context(ctx);
        return ERR_GL_CONTEXT;
    }
    XStoreName(ctx.display, ctx.window, title);
    XMapWindow(ctx.display, ctx.window);

    PFNGLXCREATECONTEXTATTRIBSARBPROC create_context_attribs =
        (PFNGLXCREATECONTEXTATTRIBSARBPROC)glXGetProcAddressARB(
            (const GLubyte*)"glXCreateContextAttribsARB");
    if (create_context_attribs == NULL)
    {
        LOGE("GLX_ARB_create_context is not supported\n");
        destroy_context(ctx);
        return ERR_GL_CONTEXT;
    }

    ctx.glc = create_context_attribs(
        ctx.display, fb_config, NULL, True, CONTEXT_ATTRIBUTES);
    XSync(ctx.display, False);
    if (ctx.glc == NULL)
    {
        LOGE("Could not create an OpenGL 3.3 core context\n");
        destroy_context(ctx);
        return ERR_GL_CONTEXT;
    }

    if (!glXMakeCurrent(ctx.display, ctx.window, ctx.glc))
    {
        LOGE("Could not make the GLX context current\n");
        destroy_context(ctx);
        return ERR_GL_CONTEXT;
    }

    LOGI("OpenGL %s, %s\n",
        (const char*)glGetString(GL_VERSION),
        (const char*)glGetString(GL_RENDERER));

    return OK;
}

void destroy_context(context& ctx)
{
    if (ctx.display == NULL)
    {
        return;
    }

    if (ctx.glc != NULL)
    {
        glXMakeCurrent(ctx.display, None, NULL);
        glXDestroyContext(ctx.display, ctx.glc);
    }
    if (ctx.window != 0)
    {
        XDestroyWindow(ctx.display, ctx.window);
    }
    if (ctx.cmap != 0)
    {
        XFreeColormap(ctx.display, ctx.cmap);
    }
    XCloseDisplay(ctx.display);

    ctx = context();
}

void present(const context& ctx)
{
    glXSwapBuffers(ctx.display, ctx.window);
}

GLuint upload_texture(const uint8_t* pixels, int unit, int w, int h, int nch)
{
    ZoneScopedN("upload_tex");

    const GLint internal_format = (nch == 1) ? GL_R8 : GL_RGB8;
    const GLenum format = (nch == 1) ? GL_RED : GL_RGB;

    GLuint tex = 0;
    glGenTextures(1, &tex);
    glActiveTexture(GL_TEXTURE0 + unit);
    glBindTexture(GL_TEXTURE_2D, tex);

    // Rows of single-channel or RGB textures are not 4-byte aligned
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, internal_format, w, h, 0,
        format, GL_UNSIGNED_BYTE, pixels);

    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

    LOGD("Texture %u: unit %d, %dx%d, %d ch\n", tex, unit, w, h, nch);
    return tex;
}

/* Compile one stage, log gets the info log on failure */
static GLuint compile_stage(GLenum stage, const char* source, std::string& log)
{
    GLuint shader = glCreateShader(stage);
    glShaderSource(shader, 1, &source, NULL);
    glCompileShader(shader);

    GLint success = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (success != GL_TRUE)
    {
        GLint log_len = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &log_len);
        std::vector<GLchar> info(log_len > 0 ? log_len : 1, '\0');
        glGetShaderInfoLog(shader, (GLsizei)info.size(), NULL, info.data());
        log.assign(info.data());

        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

int compile_program(
    const char* vertex_src,
    const char* fragment_src,
    GLuint& program,
    std::string& log
){
    ZoneScopedN("compile_program");

    program = 0;
    log.clear();

    GLuint vs = compile_stage(GL_VERTEX_SHADER, vertex_src, log);
    if (vs == 0)
    {
        return ERR_SHADER_COMPILE;
    }

    GLuint fs = compile_stage(GL_FRAGMENT_SHADER, fragment_src, log);
    if (fs == 0)
    {
        glDeleteShader(vs);
        return ERR_SHADER_COMPILE;
    }

    program = glCreateProgram();
    glAttachShader(program, vs);
    glAttachShader(program, fs);
    glLinkProgram(program);

    // Linked into the program, no longer needed
    glDeleteShader(vs);
    glDeleteShader(fs);

    GLint success = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (success != GL_TRUE)
    {
        GLint log_len = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &log_len);
        std::vector<GLchar> info(log_len > 0 ? log_len : 1, '\0');
        glGetProgramInfoLog(program, (GLsizei)info.size(), NULL, info.data());
        log.assign(info.data());

        glDeleteProgram(program);
        program = 0;
        return ERR_SHADER_LINK;
    }

    return OK;
}

void bind_layout_uniforms(GLuint program, const sampling_layout& layout)
{
    glUseProgram(program);

    for (const texture_desc& t : layout.textures)
    {
        const GLint loc = glGetUniformLocation(program, t.sampler);
        if (loc < 0)
        {
            LOGW("Sampler '%s' is not used by the program\n", t.sampler);
            continue;
        }
        glUniform1i(loc, t.unit);
    }

    for (const plane_region& r : layout.regions)
    {
        if (r.remap == nullptr)
        {
            continue;
        }

        const GLint loc = glGetUniformLocation(program, r.remap);
        if (loc < 0)
        {
            LOGW("Remap '%s' is not used by the program\n", r.remap);
            continue;
        }

        const uv_remap m = region_remap(layout, r);
        glUniform4f(loc,
            (GLfloat)m.scale_u, (GLfloat)m.scale_v,
            (GLfloat)m.offset_u, (GLfloat)m.offset_v);
        LOGD("%s = (%.6f, %.6f, %.6f, %.6f)\n", r.remap,
            (double)m.scale_u, (double)m.scale_v,
            (double)m.offset_u, (double)m.offset_v);
    }
}

void upload_mesh(
    const sphere_mesh& mesh,
    const std::vector<float>& offsets,
    instanced_mesh& out
){
    ZoneScopedN("upload_mesh");

    out = instanced_mesh();
    out.index_count = (GLsizei)mesh.indices.size();
    out.instance_count = (GLsizei)(offsets.size() / 3);

    glGenVertexArrays(1, &out.vao);
    glBindVertexArray(out.vao);

    glGenBuffers(1, &out.vbo);
    glBindBuffer(GL_ARRAY_BUFFER, out.vbo);
    glBufferData(GL_ARRAY_BUFFER,
        mesh.vertices.size() * sizeof(mesh_vertex),
        mesh.vertices.data(), GL_STATIC_DRAW);

    // location 0: position, location 1: texcoord
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(mesh_vertex),
        (const void*)offsetof(mesh_vertex, position));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, sizeof(mesh_vertex),
        (const void*)offsetof(mesh_vertex, texcoord));

    glGenBuffers(1, &out.ebo);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, out.ebo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER,
        mesh.indices.size() * sizeof(uint32_t),
        mesh.indices.data(), GL_STATIC_DRAW);

    // location 2: per-instance offset
    glGenBuffers(1, &out.instance_vbo);
    glBindBuffer(GL_ARRAY_BUFFER, out.instance_vbo);
    glBufferData(GL_ARRAY_BUFFER,
        offsets.size() * sizeof(float),
        offsets.data(), GL_STATIC_DRAW);
    glEnableVertexAttribArray(2);
    glVertexAttribPointer(2, 3, GL_FLOAT, GL_FALSE, 3 * sizeof(float), (const void*)0);
    glVertexAttribDivisor(2, 1);

    glBindVertexArray(0);
}

void destroy_mesh(instanced_mesh& mesh)
{
    glDeleteBuffers(1, &mesh.instance_vbo);
    glDeleteBuffers(1, &mesh.ebo);
    glDeleteBuffers(1, &mesh.vbo);
    glDeleteVertexArrays(1, &mesh.vao);
    mesh = instanced_mesh();
}

void draw_frame(const instanced_mesh& mesh)
{
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
    glBindVertexArray(mesh.vao);
    glDrawElementsInstanced(GL_TRIANGLES, mesh.index_count, GL_UNSIGNED_INT,
        (const void*)0, mesh.instance_count);
}

int check_errors(const char* where)
{
    int count = 0;
    for (GLenum err = glGetError(); err != GL_NO_ERROR; err = glGetError())
    {
        LOGE("GL error 0x%04x in %s\n", (unsigned)err, where);
        count += 1;
    }
    return count;
}

} // namespace texpack::gl
