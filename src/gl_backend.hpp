#ifndef TEXPACK_GL_BACKEND_HPP
#define TEXPACK_GL_BACKEND_HPP

#include <cstdint>
#include <string>
#include <vector>

#define GL_GLEXT_PROTOTYPES 1
#include <GL/gl.h>
#include <GL/glext.h>
#include <GL/glx.h>
#include <X11/Xlib.h>

#include "scene.hpp"
#include "texpack.hpp"

namespace texpack::gl {

/* X11 window with a current GLX 3.3 core context */
struct context {
    Display*    display = nullptr;
    Window      window  = 0;
    Colormap    cmap    = 0;
    GLXContext  glc     = nullptr;
    int         w       = 0;
    int         h       = 0;
};

/* Open the display, create a double-buffered window with a depth buffer and
 * make a 3.3 core context current on it.
 *
 * Returns ERR_GL_CONTEXT on failure, ctx is left released.
 */
int create_context(int w, int h, const char* title, context& ctx);

/* Release everything create_context() acquired, safe on a partial context */
void destroy_context(context& ctx);

/* Swap the back buffer to the window */
void present(const context& ctx);

/* Upload an 8-bit texture (1 or 3 channels) and leave it bound to unit
 *
 * Linear filtering, clamped to edge.
 */
GLuint upload_texture(const uint8_t* pixels, int unit, int w, int h, int nch);

/* Compile and link a program
 *
 * On failure returns ERR_SHADER_COMPILE or ERR_SHADER_LINK and puts the
 * driver's info log, unmodified, into log.
 */
int compile_program(
    const char* vertex_src,
    const char* fragment_src,
    GLuint& program,
    std::string& log
);

/* Point sampler uniforms at their units and set the region remaps */
void bind_layout_uniforms(GLuint program, const sampling_layout& layout);

/* Mesh, index and per-instance offset buffers behind one VAO */
struct instanced_mesh {
    GLuint vao = 0;
    GLuint vbo = 0;
    GLuint ebo = 0;
    GLuint instance_vbo = 0;
    GLsizei index_count = 0;
    GLsizei instance_count = 0;
};

void upload_mesh(
    const sphere_mesh& mesh,
    const std::vector<float>& offsets,
    instanced_mesh& out
);

void destroy_mesh(instanced_mesh& mesh);

/* Clear color and depth, then one instanced draw of the whole grid */
void draw_frame(const instanced_mesh& mesh);

/* Log pending GL errors, returns the number found */
int check_errors(const char* where);

} // namespace texpack::gl

#endif // TEXPACK_GL_BACKEND_HPP
