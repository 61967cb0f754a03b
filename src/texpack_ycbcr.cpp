// RGB <-> YCbCr conversion (BT.601 full range) and 4:2:0 chroma subsampling

#include <cstddef>

#include "texpack.hpp"
#include "texpack_mathlib.hpp"

#include <Tracy.hpp>

namespace texpack::ycbcr {

/* Forward transform rows, chroma rows sum to zero */
static constexpr Vec3f TO_Y  = {  KR,            KG,            KB            };
static constexpr Vec3f TO_CB = { -F(0.168736),  -F(0.331264),   F(0.5)        };
static constexpr Vec3f TO_CR = {  F(0.5),       -F(0.418688),  -F(0.081312)   };

/* Inverse transform coefficients */
static constexpr decimal CR_TO_R =  F(1.402);
static constexpr decimal CB_TO_G = -F(0.344136);
static constexpr decimal CR_TO_G = -F(0.714136);
static constexpr decimal CB_TO_B =  F(1.772);

void rgb_to_ycbcr(const decimal rgb[3], decimal ycc[3])
{
    const Vec3f px = { rgb[0], rgb[1], rgb[2] };

    ycc[0] = px.dot(TO_Y);
    ycc[1] = px.dot(TO_CB) + CHROMA_OFFSET;
    ycc[2] = px.dot(TO_CR) + CHROMA_OFFSET;
}

void ycbcr_to_rgb(const decimal ycc[3], decimal rgb[3])
{
    const decimal y  = ycc[0];
    const decimal cb = ycc[1] - CHROMA_OFFSET;
    const decimal cr = ycc[2] - CHROMA_OFFSET;

    rgb[0] = y + CR_TO_R * cr;
    rgb[1] = y + CB_TO_G * cb + CR_TO_G * cr;
    rgb[2] = y + CB_TO_B * cb;
}

void split_planes(
    const source_image& img,
    float_plane& y,
    float_plane& cb,
    float_plane& cr
){
    ZoneScopedN("split_ycbcr");

    const size_t npx = (size_t)img.w * (size_t)img.h;
    for (float_plane* p : { &y, &cb, &cr })
    {
        p->w = img.w;
        p->h = img.h;
        p->data.resize(npx);
    }

    for (size_t i = 0; i < npx; ++i)
    {
        decimal ycc[3];
        rgb_to_ycbcr(img.pixels.data() + NCH_RGB * i, ycc);

        y.data[i]  = ycc[0];
        cb.data[i] = ycc[1];
        cr.data[i] = ycc[2];
    }
}

int subsample_420(const float_plane& inp, float_plane& out)
{
    ZoneScopedN("sub420");

    if ( (inp.w < 2) || (inp.h < 2) )
    {
        return ERR_IMAGE_SIZE;
    }

    out.w = chroma_size(inp.w);
    out.h = chroma_size(inp.h);
    out.data.resize(out.w * out.h);

    for (int cy = 0; cy < out.h; ++cy)
    {
        // The last box swallows the trailing row of an odd height
        const int y0 = 2 * cy;
        const int y1 = (cy == out.h - 1) ? inp.h : y0 + 2;

        for (int cx = 0; cx < out.w; ++cx)
        {
            const int x0 = 2 * cx;
            const int x1 = (cx == out.w - 1) ? inp.w : x0 + 2;

            decimal acc = F(0.0);
            for (int y = y0; y < y1; ++y)
            {
                for (int x = x0; x < x1; ++x)
                {
                    acc += inp.data[y * inp.w + x];
                }
            }

            const int nsamples = (y1 - y0) * (x1 - x0);
            out.data[cy * out.w + cx] = acc / (decimal)nsamples;
        }
    }

    return OK;
}

} // namespace texpack::ycbcr
