#include <cstdio>
#include <vector>

#include "texpack.hpp"
#include "test_utils.hpp"

using namespace texpack;

static void test_known_colors()
{
    decimal ycc[3];

    const decimal white[3] = { F(1.0), F(1.0), F(1.0) };
    ycbcr::rgb_to_ycbcr(white, ycc);
    CHECK_NEAR(ycc[0], 1.0, 1e-5);
    CHECK_NEAR(ycc[1], 0.5, 1e-5);
    CHECK_NEAR(ycc[2], 0.5, 1e-5);

    const decimal black[3] = { F(0.0), F(0.0), F(0.0) };
    ycbcr::rgb_to_ycbcr(black, ycc);
    CHECK_NEAR(ycc[0], 0.0, 1e-6);
    CHECK_NEAR(ycc[1], 0.5, 1e-6);
    CHECK_NEAR(ycc[2], 0.5, 1e-6);

    const decimal red[3] = { F(1.0), F(0.0), F(0.0) };
    ycbcr::rgb_to_ycbcr(red, ycc);
    CHECK_NEAR(ycc[0], 0.299, 1e-5);
    CHECK_NEAR(ycc[1], 0.5 - 0.1687, 1e-3);
    CHECK_NEAR(ycc[2], 1.0, 1e-5);

    const decimal blue[3] = { F(0.0), F(0.0), F(1.0) };
    ycbcr::rgb_to_ycbcr(blue, ycc);
    CHECK_NEAR(ycc[0], 0.114, 1e-5);
    CHECK_NEAR(ycc[1], 1.0, 1e-5);
    CHECK_NEAR(ycc[2], 0.5 - 0.0813, 1e-3);
}

static void test_chroma_range()
{
    // Stored chroma stays inside [0, 1] for every corner of the RGB cube
    for (int i = 0; i < 8; ++i)
    {
        const decimal rgb[3] = {
            (decimal)((i >> 0) & 1),
            (decimal)((i >> 1) & 1),
            (decimal)((i >> 2) & 1),
        };
        decimal ycc[3];
        ycbcr::rgb_to_ycbcr(rgb, ycc);
        for (int c = 0; c < 3; ++c)
        {
            CHECK(ycc[c] >= -1e-6);
            CHECK(ycc[c] <= 1.0 + 1e-6);
        }
    }
}

static void test_inverse()
{
    for (int r = 0; r <= 255; r += 15)
    {
        for (int g = 0; g <= 255; g += 15)
        {
            for (int b = 0; b <= 255; b += 15)
            {
                const decimal rgb[3] = {
                    (decimal)r / F(255.0),
                    (decimal)g / F(255.0),
                    (decimal)b / F(255.0),
                };
                decimal ycc[3];
                decimal back[3];
                ycbcr::rgb_to_ycbcr(rgb, ycc);
                ycbcr::ycbcr_to_rgb(ycc, back);
                for (int c = 0; c < 3; ++c)
                {
                    CHECK_NEAR(back[c], rgb[c], 1e-3);
                }
            }
        }
    }
}

static void test_subsample_even()
{
    float_plane p;
    p.w = 4;
    p.h = 4;
    p.data = {
        F(0.0), F(0.2), F(0.4), F(0.4),
        F(0.4), F(0.2), F(0.4), F(0.4),
        F(1.0), F(1.0), F(0.0), F(0.1),
        F(1.0), F(1.0), F(0.2), F(0.3),
    };

    float_plane out;
    CHECK(ycbcr::subsample_420(p, out) == OK);
    CHECK(out.w == 2);
    CHECK(out.h == 2);
    CHECK(out.data.size() == 4);
    CHECK_NEAR(out.data[0], 0.2, 1e-6);
    CHECK_NEAR(out.data[1], 0.4, 1e-6);
    CHECK_NEAR(out.data[2], 1.0, 1e-6);
    CHECK_NEAR(out.data[3], 0.15, 1e-6);
}

static void test_subsample_odd()
{
    // 5x3: chroma is 2x1, the last box covers columns 2..4 and rows 0..2
    float_plane p;
    p.w = 5;
    p.h = 3;
    p.data.resize(15);
    for (int i = 0; i < 15; ++i)
    {
        p.data[i] = (decimal)i / F(15.0);
    }

    float_plane out;
    CHECK(ycbcr::subsample_420(p, out) == OK);
    CHECK(out.w == 2);
    CHECK(out.h == 1);

    // Columns 0..1, rows 0..2: 0 1 5 6 10 11
    CHECK_NEAR(out.data[0], (0 + 1 + 5 + 6 + 10 + 11) / 6.0 / 15.0, 1e-6);
    // Columns 2..4, rows 0..2: 2 3 4 7 8 9 12 13 14
    CHECK_NEAR(out.data[1], (2 + 3 + 4 + 7 + 8 + 9 + 12 + 13 + 14) / 9.0 / 15.0, 1e-6);

    // Floor of the luma size in both axes
    for (int w = 2; w <= 9; ++w)
    {
        for (int h = 2; h <= 9; ++h)
        {
            float_plane q;
            q.w = w;
            q.h = h;
            q.data.assign(w * h, F(0.25));
            float_plane o;
            CHECK(ycbcr::subsample_420(q, o) == OK);
            CHECK(o.w == w / 2);
            CHECK(o.h == h / 2);
            for (decimal v : o.data)
            {
                CHECK_NEAR(v, 0.25, 1e-6);
            }
        }
    }
}

static void test_subsample_too_small()
{
    float_plane p;
    p.w = 1;
    p.h = 8;
    p.data.assign(8, F(0.5));

    float_plane out;
    CHECK(ycbcr::subsample_420(p, out) == ERR_IMAGE_SIZE);

    p.w = 8;
    p.h = 1;
    CHECK(ycbcr::subsample_420(p, out) == ERR_IMAGE_SIZE);

    p.w = 2;
    p.h = 2;
    p.data.assign(4, F(0.5));
    CHECK(ycbcr::subsample_420(p, out) == OK);
    CHECK(out.w == 1);
    CHECK(out.h == 1);
}

static void test_quantize()
{
    CHECK(quantize_u8(F(0.0)) == 0);
    CHECK(quantize_u8(F(1.0)) == 255);
    CHECK(quantize_u8(F(0.5)) == 128);
    CHECK(quantize_u8(-F(0.25)) == 0);
    CHECK(quantize_u8(F(2.0)) == 255);
    for (int i = 0; i <= 255; ++i)
    {
        CHECK(quantize_u8((decimal)i / F(255.0)) == i);
    }
}

static void test_split_planes()
{
    std::vector<uint8_t> rgb8;
    make_gradient_rgb8(7, 5, rgb8);
    source_image img;
    image_from_rgb8(rgb8.data(), 7, 5, img);

    float_plane y, cb, cr;
    ycbcr::split_planes(img, y, cb, cr);
    CHECK(y.w == 7 && y.h == 5);
    CHECK(cb.w == 7 && cb.h == 5);
    CHECK(cr.w == 7 && cr.h == 5);

    decimal ycc[3];
    ycbcr::rgb_to_ycbcr(img.pixels.data() + NCH_RGB * 12, ycc);
    CHECK_NEAR(y.data[12], ycc[0], 1e-6);
    CHECK_NEAR(cb.data[12], ycc[1], 1e-6);
    CHECK_NEAR(cr.data[12], ycc[2], 1e-6);
}

int main()
{
    RUN_TEST(test_known_colors);
    RUN_TEST(test_chroma_range);
    RUN_TEST(test_inverse);
    RUN_TEST(test_subsample_even);
    RUN_TEST(test_subsample_odd);
    RUN_TEST(test_subsample_too_small);
    RUN_TEST(test_quantize);
    RUN_TEST(test_split_planes);

    return test_summary();
}
