#ifndef TEXPACK_HPP
#define TEXPACK_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace texpack {

/* Compile-time switch between float and double for the calculations
 *
 * EPSILON is used for comparing floating point numbers
 */
#if FLOAT_PRECISION == 64
#define F(x) (x)
typedef double decimal;
constexpr decimal EPSILON = 1e-12;
#else
#define F(x) (x##f)
typedef float decimal;
constexpr decimal EPSILON = 1e-6f;
#endif

/* Number of channels of a RGB pixel. Used for calculating data sizes */
constexpr int NCH_RGB = 3;

/* Possible texture layouts */
typedef enum layout_t {
    THREE_TEXTURE_YCBCR,
    DIRECT_RGB,
    CHANNEL_STRIP_RGB,
    PACKED_YCBCR,
    NUM_LAYOUTS,
} layout_t;

/* Error codes, zero means success */
typedef enum err_t {
    OK = 0,
    ERR_IMAGE_LOAD,
    ERR_IMAGE_SIZE,
    ERR_UNSUPPORTED_LAYOUT,
    ERR_SHADER_COMPILE,
    ERR_SHADER_LINK,
    ERR_GL_CONTEXT,
    ERR_BAD_ARGS,
} err_t;

/* Printable name of an error code */
const char* err_str(int err);

/* Short name of a layout as used on the command line ("packed", ...) */
const char* layout_name(layout_t layout);

/* Parse a short layout name
 *
 * Returns ERR_UNSUPPORTED_LAYOUT if the name is unknown.
 */
int parse_layout(const std::string& name, layout_t& layout);

/******************************************************************************
 * Data model
 *****************************************************************************/

/* Decoded RGB image, samples normalized to [0, 1], NCH_RGB interleaved */
struct source_image {
    int w = 0;
    int h = 0;
    std::vector<decimal> pixels;
};

/* Single-channel plane of unquantized samples */
struct float_plane {
    int w = 0;
    int h = 0;
    std::vector<decimal> data;
};

/* 8-bit texture as it gets uploaded (row 0 first, nch interleaved) */
struct texture_u8 {
    int w = 0;
    int h = 0;
    int nch = 1;
    std::vector<uint8_t> data;
};

/* Where a texture is bound and under which sampler uniform */
struct texture_desc {
    const char* sampler;
    int unit;
    int w;
    int h;
    int nch;
};

/* Axis-aligned texel rectangle of one plane inside a texture
 *
 * remap is the name of the vec4 uniform carrying the coordinate remap of this
 * region, or nullptr if the region is sampled with unmodified coordinates.
 */
struct plane_region {
    const char* name;
    const char* remap;
    int texture;
    int x;
    int y;
    int w;
    int h;
};

/* Everything the decoder needs to know about an encoded image
 *
 * Region order is fixed per layout:
 *   YCbCr layouts   -> Y, Cb, Cr
 *   CHANNEL_STRIP   -> R, G, B
 *   DIRECT_RGB      -> RGB
 */
struct sampling_layout {
    layout_t layout = DIRECT_RGB;
    std::vector<texture_desc> textures;
    std::vector<plane_region> regions;
};

/* Encoder output: textures and their sampling layout */
struct encoded_image {
    sampling_layout layout;
    std::vector<texture_u8> textures;
};

/* Normalized coordinate remap: uv' = uv * scale + offset */
struct uv_remap {
    decimal scale_u;
    decimal scale_v;
    decimal offset_u;
    decimal offset_v;
};

/******************************************************************************
 * Image input
 *****************************************************************************/

/* Load an image file and rescale it to [0, 1]
 *
 * Returns ERR_IMAGE_LOAD if the file can't be decoded or is not a color image.
 */
int load_image(const std::string& path, source_image& img);

/* Build a source image from raw 8-bit RGB pixels */
void image_from_rgb8(const uint8_t* pixels, int w, int h, source_image& img);

/******************************************************************************
 * YCbCr transform and chroma subsampling
 *****************************************************************************/

namespace ycbcr {

    /* Luma/chroma weights (BT.601 full range) */
    constexpr decimal KR = F(0.299);
    constexpr decimal KG = F(0.587);
    constexpr decimal KB = F(0.114);

    /* Offset used to store signed chroma in [0, 1] */
    constexpr decimal CHROMA_OFFSET = F(0.5);

    /* RGB -> YCbCr, chroma is offset by CHROMA_OFFSET */
    void rgb_to_ycbcr(const decimal rgb[3], decimal ycc[3]);

    /* YCbCr -> RGB, expects chroma offset by CHROMA_OFFSET. Not clamped. */
    void ycbcr_to_rgb(const decimal ycc[3], decimal rgb[3]);

    /* Size of a 4:2:0 chroma plane along one axis */
    inline int chroma_size(int luma_size) { return luma_size / 2; }

    /* Split an image into full resolution Y, Cb and Cr planes */
    void split_planes(
        const source_image& img,
        float_plane& y,
        float_plane& cb,
        float_plane& cr
    );

    /* 2x2 box-filter a plane down to chroma_size() in both axes
     *
     * For an odd dimension the trailing row/column is averaged into the last
     * output sample. Returns ERR_IMAGE_SIZE if the plane is smaller than 2x2.
     */
    int subsample_420(const float_plane& inp, float_plane& out);

}

/******************************************************************************
 * Encoder
 *****************************************************************************/

/* Scale a [0, 1] value to 8 bits with rounding */
uint8_t quantize_u8(decimal v);

/* Encode an image into the textures of the given layout
 *
 * Returns zero on success, ERR_IMAGE_SIZE or ERR_UNSUPPORTED_LAYOUT on failure.
 */
int encode(const source_image& img, layout_t layout, encoded_image& enc);

namespace pack {

    /* Write a plane into a rectangle of a single-channel texture */
    void blit_plane(const float_plane& plane, texture_u8& tex, int x, int y);

    /* Per-layout encoders, called by encode() */
    int encode_direct_rgb(const source_image& img, encoded_image& enc);
    int encode_channel_strip(const source_image& img, encoded_image& enc);
    int encode_three_texture(const source_image& img, encoded_image& enc);
    int encode_packed_ycbcr(const source_image& img, encoded_image& enc);

}

/******************************************************************************
 * Sampling layout geometry
 *****************************************************************************/

/* Coordinate remap that maps [0, 1]^2 onto a region of its texture */
uv_remap region_remap(const sampling_layout& layout, const plane_region& region);

/* Index of the region of a texture containing the normalized coordinate
 *
 * Interior edges are half-open, the right/bottom border of the texture is
 * inclusive. Returns -1 if no region contains the coordinate.
 */
int region_at(const sampling_layout& layout, int texture, decimal u, decimal v);

/* Check the geometry invariants of a layout
 *
 * Regions must lie inside their texture and not overlap, the remap of the
 * corners and the center must land inside the region and texture units must
 * be distinct. Returns zero if all hold, ERR_UNSUPPORTED_LAYOUT otherwise.
 */
int validate_layout(const sampling_layout& layout);

/******************************************************************************
 * CPU reference of the GPU decode
 *
 * Not used for rendering. It mirrors GL_LINEAR + GL_CLAMP_TO_EDGE sampling and
 * the fragment shader arithmetic so that encoder and decoder can be checked
 * against each other without a GPU.
 *****************************************************************************/

namespace sampler {

    /* Bilinear fetch of one channel of a texture at normalized (u, v) */
    decimal sample_bilinear(const texture_u8& tex, int channel, decimal u, decimal v);

    /* Decode the color at surface coordinate (u, v) */
    void decode(const encoded_image& enc, decimal u, decimal v, decimal rgb[3]);

    /* Reconstruct a whole w x h image by decoding at pixel centers */
    void reconstruct(const encoded_image& enc, int w, int h, std::vector<uint8_t>& out_rgb8);

}

/******************************************************************************
 * Shader sources
 *****************************************************************************/

namespace shaders {

    /* Vertex stage: per-instance offset, texcoord pass-through */
    const char* vertex_source();

    /* Fragment stage of a layout, nullptr for an unknown layout */
    const char* fragment_source(layout_t layout);

}

} // namespace texpack

#endif // TEXPACK_HPP
