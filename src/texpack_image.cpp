#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include "platform.hpp"
#include "texpack.hpp"

#include <Tracy.hpp>

namespace texpack {

const char* err_str(int err)
{
    switch (err) {
    case OK:                     return "OK";
    case ERR_IMAGE_LOAD:         return "ImageLoadError";
    case ERR_IMAGE_SIZE:         return "ImageSizeError";
    case ERR_UNSUPPORTED_LAYOUT: return "UnsupportedLayoutError";
    case ERR_SHADER_COMPILE:     return "ShaderCompileError";
    case ERR_SHADER_LINK:        return "ShaderLinkError";
    case ERR_GL_CONTEXT:         return "GLContextError";
    case ERR_BAD_ARGS:           return "BadArgumentsError";
    default:                     return "UnknownError";
    };
}

void image_from_rgb8(const uint8_t* pixels, int w, int h, source_image& img)
{
    img.w = w;
    img.h = h;
    const size_t nsamples = (size_t)w * (size_t)h * NCH_RGB;
    img.pixels.resize(nsamples);
    for (size_t i = 0; i < nsamples; ++i)
    {
        img.pixels[i] = (decimal)(pixels[i]) / F(255.0);
    }
}

int load_image(const std::string& path, source_image& img)
{
    ZoneScopedN("load_image");

    int inp_w, inp_h, nch;
    uint8_t *inp_pixels = stbi_load(
        path.c_str(),
        &inp_w,
        &inp_h,
        &nch,
        NCH_RGB
    );
    if (inp_pixels == NULL)
    {
        LOGE("Can't decode '%s': %s\n", path.c_str(), stbi_failure_reason());
        return ERR_IMAGE_LOAD;
    }

    // stb converts grey to RGB on request, but a grey source is not accepted
    if (nch < NCH_RGB)
    {
        LOGE("'%s' has %d channel(s), expected a color image\n",
            path.c_str(), nch);
        stbi_image_free(inp_pixels);
        return ERR_IMAGE_LOAD;
    }

    if (nch > NCH_RGB)
    {
        LOGD("Dropping alpha channel of '%s'\n", path.c_str());
    }

    image_from_rgb8(inp_pixels, inp_w, inp_h, img);
    stbi_image_free(inp_pixels);

    LOGI("Loaded '%s' (%dx%d)\n", path.c_str(), img.w, img.h);
    return OK;
}

} // namespace texpack
