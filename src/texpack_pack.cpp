// Packing of source images into the texture layouts

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <utility>

#include "platform.hpp"
#include "texpack.hpp"
#include "texpack_mathlib.hpp"

#include <Tracy.hpp>

namespace texpack {

uint8_t quantize_u8(decimal v)
{
    return (uint8_t)std::lround(fclamp(v, F(0.0), F(1.0)) * F(255.0));
}

/* Encode the whole image according to the layout
 *
 * Returns zero on success, non-zero on failure.
 */
int encode(const source_image& img, layout_t layout, encoded_image& enc)
{
    ZoneScopedN("encode");

    int (*encode_layout)( const source_image&, encoded_image& );

    switch (layout) {
    case THREE_TEXTURE_YCBCR:
        encode_layout = pack::encode_three_texture;
        break;
    case DIRECT_RGB:
        encode_layout = pack::encode_direct_rgb;
        break;
    case CHANNEL_STRIP_RGB:
        encode_layout = pack::encode_channel_strip;
        break;
    case PACKED_YCBCR:
        encode_layout = pack::encode_packed_ycbcr;
        break;
    default:
        LOGE("Unsupported layout %d\n", (int)layout);
        return ERR_UNSUPPORTED_LAYOUT;
    };

    enc = encoded_image();
    enc.layout.layout = layout;

    int err = encode_layout(img, enc);
    if (err != OK)
    {
        LOGE("Encoding '%s' failed: %s\n", layout_name(layout), err_str(err));
        return err;
    }

    // Encoder and decoder must agree on the geometry before anything is used
    err = validate_layout(enc.layout);
    if (err != OK)
    {
        LOGE("Layout '%s' failed validation\n", layout_name(layout));
        return err;
    }

    for (const texture_desc& t : enc.layout.textures)
    {
        LOGD("%-10s unit %d  %dx%d  %d ch\n", t.sampler, t.unit, t.w, t.h, t.nch);
    }

    return OK;
}

namespace pack {

/* Allocate a zero-filled texture and register it in the layout */
static texture_u8& add_texture(
    encoded_image& enc,
    const char* sampler,
    int w,
    int h,
    int nch
){
    const int unit = (int)enc.textures.size();
    enc.layout.textures.push_back(texture_desc { sampler, unit, w, h, nch });

    texture_u8 tex;
    tex.w = w;
    tex.h = h;
    tex.nch = nch;
    tex.data.assign((size_t)w * h * nch, 0);
    enc.textures.push_back(std::move(tex));

    return enc.textures.back();
}

/* Extract one channel of the source image as a plane */
static void channel_plane(const source_image& img, int channel, float_plane& out)
{
    out.w = img.w;
    out.h = img.h;
    const size_t npx = (size_t)img.w * (size_t)img.h;
    out.data.resize(npx);
    for (size_t i = 0; i < npx; ++i)
    {
        out.data[i] = img.pixels[NCH_RGB * i + channel];
    }
}

/* Full resolution Y and 4:2:0 Cb, Cr */
static int ycbcr_420_planes(
    const source_image& img,
    float_plane& y,
    float_plane& cb_sub,
    float_plane& cr_sub
){
    float_plane cb;
    float_plane cr;
    ycbcr::split_planes(img, y, cb, cr);

    int err = ycbcr::subsample_420(cb, cb_sub);
    if (err != OK)
    {
        return err;
    }
    return ycbcr::subsample_420(cr, cr_sub);
}

void blit_plane(const float_plane& plane, texture_u8& tex, int x, int y)
{
    for (int row = 0; row < plane.h; ++row)
    {
        uint8_t* dst = tex.data.data() + ((size_t)(y + row) * tex.w + x);
        const decimal* src = plane.data.data() + ((size_t)row * plane.w);
        for (int col = 0; col < plane.w; ++col)
        {
            dst[col] = quantize_u8(src[col]);
        }
    }
}

int encode_direct_rgb(const source_image& img, encoded_image& enc)
{
    ZoneScopedN("enc_rgb");

    texture_u8& tex = add_texture(enc, "tex_rgb", img.w, img.h, NCH_RGB);
    for (size_t i = 0; i < img.pixels.size(); ++i)
    {
        tex.data[i] = quantize_u8(img.pixels[i]);
    }

    enc.layout.regions = {
        { "rgb", nullptr, 0, 0, 0, img.w, img.h },
    };

    return OK;
}

int encode_channel_strip(const source_image& img, encoded_image& enc)
{
    ZoneScopedN("enc_strip");

    texture_u8& tex = add_texture(enc, "tex_strip", NCH_RGB * img.w, img.h, 1);

    // R | G | B side by side, each at full resolution
    float_plane plane;
    for (int c = 0; c < NCH_RGB; ++c)
    {
        channel_plane(img, c, plane);
        blit_plane(plane, tex, c * img.w, 0);
    }

    enc.layout.regions = {
        { "r", "region_r", 0, 0 * img.w, 0, img.w, img.h },
        { "g", "region_g", 0, 1 * img.w, 0, img.w, img.h },
        { "b", "region_b", 0, 2 * img.w, 0, img.w, img.h },
    };

    return OK;
}

int encode_three_texture(const source_image& img, encoded_image& enc)
{
    ZoneScopedN("enc_ycbcr3");

    float_plane y, cb, cr;
    int err = ycbcr_420_planes(img, y, cb, cr);
    if (err != OK)
    {
        return err;
    }

    blit_plane(y,  add_texture(enc, "tex_y",  y.w,  y.h,  1), 0, 0);
    blit_plane(cb, add_texture(enc, "tex_cb", cb.w, cb.h, 1), 0, 0);
    blit_plane(cr, add_texture(enc, "tex_cr", cr.w, cr.h, 1), 0, 0);

    enc.layout.regions = {
        { "y",  nullptr, 0, 0, 0, y.w,  y.h  },
        { "cb", nullptr, 1, 0, 0, cb.w, cb.h },
        { "cr", nullptr, 2, 0, 0, cr.w, cr.h },
    };

    return OK;
}

int encode_packed_ycbcr(const source_image& img, encoded_image& enc)
{
    ZoneScopedN("enc_packed");

    float_plane y, cb, cr;
    int err = ycbcr_420_planes(img, y, cb, cr);
    if (err != OK)
    {
        return err;
    }

    //  +-----------+----+
    //  |           | Cb |
    //  |     Y     +----+
    //  |           | Cr |
    //  +-----------+----+
    texture_u8& tex = add_texture(enc, "tex_packed", y.w + cb.w, y.h, 1);
    blit_plane(y,  tex, 0, 0);
    blit_plane(cb, tex, y.w, 0);
    blit_plane(cr, tex, y.w, cb.h);

    // Odd height leaves a padding row under Cr, repeat the last Cr row there
    // so that fetches at the bottom edge clamp like a texture of their own
    const int last_cr = cb.h + cr.h - 1;
    for (int row = last_cr + 1; row < tex.h; ++row)
    {
        const uint8_t* src = tex.data.data() + ((size_t)last_cr * tex.w + y.w);
        std::copy(src, src + cr.w, tex.data.data() + ((size_t)row * tex.w + y.w));
    }

    enc.layout.regions = {
        { "y",  "region_y",  0, 0,   0,    y.w,  y.h  },
        { "cb", "region_cb", 0, y.w, 0,    cb.w, cb.h },
        { "cr", "region_cr", 0, y.w, cb.h, cr.w, cr.h },
    };

    return OK;
}

} // namespace pack

} // namespace texpack
