#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "texpack.hpp"
#include "test_utils.hpp"

namespace fs = std::filesystem;
using namespace texpack;

static fs::path temp_file(const char* name)
{
    return fs::temp_directory_path() / (std::string("texpack_test_") + name);
}

static void test_missing_file()
{
    source_image img;
    CHECK(load_image((temp_file("does_not_exist.png")).string(), img) == ERR_IMAGE_LOAD);
    CHECK(load_image("", img) == ERR_IMAGE_LOAD);
}

static void test_not_an_image()
{
    const fs::path path = temp_file("garbage.png");
    FILE* f = fopen(path.c_str(), "wb");
    CHECK(f != NULL);
    if (f == NULL)
    {
        return;
    }
    fputs("this is not a png file", f);
    fclose(f);

    source_image img;
    CHECK(load_image(path.string(), img) == ERR_IMAGE_LOAD);
    fs::remove(path);
}

static void test_grey_rejected()
{
    const int w = 6;
    const int h = 4;
    std::vector<uint8_t> grey(w * h);
    for (int i = 0; i < w * h; ++i)
    {
        grey[i] = (uint8_t)(10 * i);
    }

    const fs::path path = temp_file("grey.png");
    CHECK(stbi_write_png(path.c_str(), w, h, 1, grey.data(), w) != 0);

    source_image img;
    CHECK(load_image(path.string(), img) == ERR_IMAGE_LOAD);
    fs::remove(path);
}

static void test_rgb_round_trip()
{
    const int w = 9;
    const int h = 5;
    std::vector<uint8_t> rgb8;
    make_gradient_rgb8(w, h, rgb8);

    const fs::path path = temp_file("rgb.png");
    CHECK(stbi_write_png(path.c_str(), w, h, NCH_RGB, rgb8.data(), w * NCH_RGB) != 0);

    source_image img;
    CHECK(load_image(path.string(), img) == OK);
    CHECK(img.w == w);
    CHECK(img.h == h);
    CHECK(img.pixels.size() == rgb8.size());
    for (size_t i = 0; i < img.pixels.size() && i < rgb8.size(); ++i)
    {
        CHECK_NEAR(img.pixels[i], rgb8[i] / 255.0, 1e-6);
    }
    fs::remove(path);
}

static void test_alpha_dropped()
{
    const int w = 3;
    const int h = 2;
    std::vector<uint8_t> rgba(w * h * 4);
    for (int i = 0; i < w * h; ++i)
    {
        rgba[4 * i + 0] = (uint8_t)(40 * i);
        rgba[4 * i + 1] = 77;
        rgba[4 * i + 2] = (uint8_t)(255 - 40 * i);
        rgba[4 * i + 3] = 128;
    }

    const fs::path path = temp_file("rgba.png");
    CHECK(stbi_write_png(path.c_str(), w, h, 4, rgba.data(), w * 4) != 0);

    source_image img;
    CHECK(load_image(path.string(), img) == OK);
    CHECK(img.pixels.size() == (size_t)(w * h * NCH_RGB));
    for (int i = 0; i < w * h && img.pixels.size() == (size_t)(w * h * NCH_RGB); ++i)
    {
        for (int c = 0; c < NCH_RGB; ++c)
        {
            CHECK_NEAR(img.pixels[NCH_RGB * i + c], rgba[4 * i + c] / 255.0, 1e-6);
        }
    }
    fs::remove(path);
}

int main()
{
    RUN_TEST(test_missing_file);
    RUN_TEST(test_not_an_image);
    RUN_TEST(test_grey_rejected);
    RUN_TEST(test_rgb_round_trip);
    RUN_TEST(test_alpha_dropped);

    return test_summary();
}
