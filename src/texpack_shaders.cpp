// GLSL sources of the decode contract
//
// Sampler and remap uniform names must match the ones the encoder puts into
// the sampling layout (texpack_pack.cpp).

#include "texpack.hpp"

namespace texpack::shaders {

static const char* VERTEX_SOURCE =
"#version 330 core\n"
"layout (location = 0) in vec3 position;\n"
"layout (location = 1) in vec2 texcoord;\n"
"layout (location = 2) in vec3 offset;\n"
"uniform mat4 view_proj;\n"
"out vec2 TexCoord;\n"
"void main()\n"
"{\n"
"    gl_Position = view_proj * vec4(position + offset, 1.0);\n"
"    TexCoord = texcoord;\n"
"}\n";

#define FRAG_HEADER \
"#version 330 core\n" \
"in vec2 TexCoord;\n" \
"out vec4 FragColor;\n"

/* xy = scale, zw = offset */
#define FRAG_REMAP \
"vec2 remap(vec4 region, vec2 uv)\n" \
"{\n" \
"    return uv * region.xy + region.zw;\n" \
"}\n"

#define FRAG_YCBCR_TO_RGB \
"vec3 ycbcr_to_rgb(float y, float cb, float cr)\n" \
"{\n" \
"    cb -= 0.5;\n" \
"    cr -= 0.5;\n" \
"    return vec3(\n" \
"        y + 1.402 * cr,\n" \
"        y - 0.344136 * cb - 0.714136 * cr,\n" \
"        y + 1.772 * cb);\n" \
"}\n"

static const char* FRAG_DIRECT_RGB =
FRAG_HEADER
"uniform sampler2D tex_rgb;\n"
"void main()\n"
"{\n"
"    FragColor = vec4(texture(tex_rgb, TexCoord).rgb, 1.0);\n"
"}\n";

static const char* FRAG_CHANNEL_STRIP =
FRAG_HEADER
FRAG_REMAP
"uniform sampler2D tex_strip;\n"
"uniform vec4 region_r;\n"
"uniform vec4 region_g;\n"
"uniform vec4 region_b;\n"
"void main()\n"
"{\n"
"    float r = texture(tex_strip, remap(region_r, TexCoord)).r;\n"
"    float g = texture(tex_strip, remap(region_g, TexCoord)).r;\n"
"    float b = texture(tex_strip, remap(region_b, TexCoord)).r;\n"
"    FragColor = vec4(r, g, b, 1.0);\n"
"}\n";

static const char* FRAG_THREE_TEXTURE =
FRAG_HEADER
FRAG_YCBCR_TO_RGB
"uniform sampler2D tex_y;\n"
"uniform sampler2D tex_cb;\n"
"uniform sampler2D tex_cr;\n"
"void main()\n"
"{\n"
"    float y  = texture(tex_y,  TexCoord).r;\n"
"    float cb = texture(tex_cb, TexCoord).r;\n"
"    float cr = texture(tex_cr, TexCoord).r;\n"
"    FragColor = vec4(ycbcr_to_rgb(y, cb, cr), 1.0);\n"
"}\n";

static const char* FRAG_PACKED_YCBCR =
FRAG_HEADER
FRAG_REMAP
FRAG_YCBCR_TO_RGB
"uniform sampler2D tex_packed;\n"
"uniform vec4 region_y;\n"
"uniform vec4 region_cb;\n"
"uniform vec4 region_cr;\n"
"void main()\n"
"{\n"
"    float y  = texture(tex_packed, remap(region_y,  TexCoord)).r;\n"
"    float cb = texture(tex_packed, remap(region_cb, TexCoord)).r;\n"
"    float cr = texture(tex_packed, remap(region_cr, TexCoord)).r;\n"
"    FragColor = vec4(ycbcr_to_rgb(y, cb, cr), 1.0);\n"
"}\n";

const char* vertex_source()
{
    return VERTEX_SOURCE;
}

const char* fragment_source(layout_t layout)
{
    switch (layout) {
    case THREE_TEXTURE_YCBCR: return FRAG_THREE_TEXTURE;
    case DIRECT_RGB:          return FRAG_DIRECT_RGB;
    case CHANNEL_STRIP_RGB:   return FRAG_CHANNEL_STRIP;
    case PACKED_YCBCR:        return FRAG_PACKED_YCBCR;
    default:                  return nullptr;
    };
}

} // namespace texpack::shaders
