/** Small utility to inspect the texture layouts of an image
 *
 * Encodes the input with every layout, saves the packed textures as they would
 * be uploaded and a CPU reconstruction of what the fragment shader produces.
 */

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include "platform.hpp"
#include "texpack.hpp"

namespace fs = std::filesystem;
using namespace texpack;

/* Exit with error, optionally printing usage */
static void err_exit(const char* err_msg, bool print_usage=false)
{
    fprintf(stderr, "ERROR: %s\n", err_msg);
    if (print_usage)
    {
        fprintf(stderr,
            "Usage: texpack_packer <inp_img> <output_folder>\n"
        );
    }
    exit(1);
}

/* Peak signal-to-noise ratio of two RGB8 images, in dB */
static double psnr_rgb8(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b)
{
    double sqerr = 0.0;
    for (size_t i = 0; i < a.size(); ++i)
    {
        const double diff = (double)a[i] - (double)b[i];
        sqerr += diff * diff;
    }

    const double mse = sqerr / (double)a.size();
    if (mse == 0.0)
    {
        return INFINITY;
    }
    return 10.0 * std::log10(255.0 * 255.0 / mse);
}

static bool save_png(const fs::path& out_file, int w, int h, int nch, const uint8_t* data)
{
    LOGI("-- Saving '%s'\n", out_file.c_str());
    return stbi_write_png(out_file.c_str(), w, h, nch, data, w * nch) != 0;
}

int main(int argc, char **argv)
{
    if (argc != 3)
    {
        err_exit("Provide 2 arguments", true);
    }

    const fs::path inp_file = argv[1];
    const fs::path out_dir = argv[2];
    if ( !(fs::exists(out_dir) && fs::is_directory(out_dir)) )
    {
        err_exit("Can't open output directory", true);
    }

    source_image img;
    if (load_image(inp_file.string(), img) != OK)
    {
        err_exit("Can't open input file");
    }

    std::vector<uint8_t> ref(img.pixels.size());
    for (size_t i = 0; i < ref.size(); ++i)
    {
        ref[i] = quantize_u8(img.pixels[i]);
    }

    const std::string stem = inp_file.stem().string();
    double psnr[NUM_LAYOUTS];
    size_t nbytes[NUM_LAYOUTS];

    for (int l = 0; l < NUM_LAYOUTS; ++l)
    {
        const layout_t layout = (layout_t)l;
        LOGI("Layout %s\n", layout_name(layout));

        encoded_image enc;
        int ret = encode(img, layout, enc);
        if (ret != OK)
        {
            err_exit(err_str(ret));
        }

        nbytes[l] = 0;
        for (size_t t = 0; t < enc.textures.size(); ++t)
        {
            const texture_u8& tex = enc.textures[t];
            nbytes[l] += tex.data.size();

            const fs::path out_file = out_dir / (stem + "_" + layout_name(layout)
                + "_" + enc.layout.textures[t].sampler + ".png");
            if (!save_png(out_file, tex.w, tex.h, tex.nch, tex.data.data()))
            {
                err_exit("Can't save output image");
            }
        }

        std::vector<uint8_t> dec;
        sampler::reconstruct(enc, img.w, img.h, dec);
        psnr[l] = psnr_rgb8(ref, dec);

        const fs::path dec_file = out_dir / (stem + "_" + layout_name(layout) + "_decoded.png");
        if (!save_png(dec_file, img.w, img.h, NCH_RGB, dec.data()))
        {
            err_exit("Can't save output image");
        }
    }

    printf("\n%-8s  %12s  %9s  %10s\n", "layout", "bytes", "ratio", "PSNR (dB)");
    for (int l = 0; l < NUM_LAYOUTS; ++l)
    {
        printf("%-8s  %12zu  %9.4f  %10.4f\n",
            layout_name((layout_t)l),
            nbytes[l],
            (double)nbytes[l] / (double)ref.size(),
            psnr[l]);
    }

    return 0;
}
