// Reference decoder: what the fragment shaders compute, evaluated on the CPU

#include <cmath>
#include <vector>

#include "texpack.hpp"
#include "texpack_mathlib.hpp"

#include <Tracy.hpp>

namespace texpack::sampler {

decimal sample_bilinear(const texture_u8& tex, int channel, decimal u, decimal v)
{
    // Texel centers sit at (i + 0.5) / size
    const decimal x = u * (decimal)tex.w - F(0.5);
    const decimal y = v * (decimal)tex.h - F(0.5);

    const decimal x_floor = std::floor(x);
    const decimal y_floor = std::floor(y);
    const decimal fx = x - x_floor;
    const decimal fy = y - y_floor;

    // GL_CLAMP_TO_EDGE
    const int x0 = iclamp((int)x_floor,     0, tex.w - 1);
    const int x1 = iclamp((int)x_floor + 1, 0, tex.w - 1);
    const int y0 = iclamp((int)y_floor,     0, tex.h - 1);
    const int y1 = iclamp((int)y_floor + 1, 0, tex.h - 1);

    auto texel = [&](int tx, int ty) {
        return (decimal)tex.data[tex.nch * (ty * tex.w + tx) + channel];
    };

    const decimal top = texel(x0, y0) * (F(1.0) - fx) + texel(x1, y0) * fx;
    const decimal bot = texel(x0, y1) * (F(1.0) - fx) + texel(x1, y1) * fx;

    return (top * (F(1.0) - fy) + bot * fy) / F(255.0);
}

/* Sample one channel of a region at surface coordinate (u, v) */
static decimal fetch_region(
    const encoded_image& enc,
    int region_idx,
    int channel,
    decimal u,
    decimal v
){
    const plane_region& r = enc.layout.regions.at(region_idx);
    const uv_remap m = region_remap(enc.layout, r);

    return sample_bilinear(
        enc.textures.at(r.texture),
        channel,
        u * m.scale_u + m.offset_u,
        v * m.scale_v + m.offset_v
    );
}

void decode(const encoded_image& enc, decimal u, decimal v, decimal rgb[3])
{
    switch (enc.layout.layout) {
    case DIRECT_RGB:
        for (int c = 0; c < NCH_RGB; ++c)
        {
            rgb[c] = fetch_region(enc, 0, c, u, v);
        }
        break;
    case CHANNEL_STRIP_RGB:
        for (int c = 0; c < NCH_RGB; ++c)
        {
            rgb[c] = fetch_region(enc, c, 0, u, v);
        }
        break;
    case THREE_TEXTURE_YCBCR:
    case PACKED_YCBCR:
    {
        const decimal ycc[3] = {
            fetch_region(enc, 0, 0, u, v),
            fetch_region(enc, 1, 0, u, v),
            fetch_region(enc, 2, 0, u, v),
        };
        ycbcr::ycbcr_to_rgb(ycc, rgb);
        break;
    }
    default:
        rgb[0] = rgb[1] = rgb[2] = F(0.0);
        return;
    };

    // The framebuffer is unsigned normalized
    for (int c = 0; c < NCH_RGB; ++c)
    {
        rgb[c] = fclamp(rgb[c], F(0.0), F(1.0));
    }
}

void reconstruct(const encoded_image& enc, int w, int h, std::vector<uint8_t>& out_rgb8)
{
    ZoneScopedN("reconstruct");

    out_rgb8.resize((size_t)w * (size_t)h * NCH_RGB);
    for (int y = 0; y < h; ++y)
    {
        const decimal v = ((decimal)y + F(0.5)) / (decimal)h;
        for (int x = 0; x < w; ++x)
        {
            const decimal u = ((decimal)x + F(0.5)) / (decimal)w;

            decimal rgb[3];
            decode(enc, u, v, rgb);
            for (int c = 0; c < NCH_RGB; ++c)
            {
                out_rgb8[NCH_RGB * ((size_t)y * w + x) + c] = quantize_u8(rgb[c]);
            }
        }
    }
}

} // namespace texpack::sampler
