// Sampling layout geometry shared by the encoder, the shaders and the tests

#include <string>

#include "platform.hpp"
#include "texpack.hpp"

namespace texpack {

/* Command line names, indexed by layout_t */
static const char* LAYOUT_NAMES[NUM_LAYOUTS] = {
    "ycbcr3",
    "rgb",
    "strip",
    "packed",
};

const char* layout_name(layout_t layout)
{
    if ( (layout < 0) || (layout >= NUM_LAYOUTS) )
    {
        return "unknown";
    }
    return LAYOUT_NAMES[layout];
}

int parse_layout(const std::string& name, layout_t& layout)
{
    for (int i = 0; i < NUM_LAYOUTS; ++i)
    {
        if (name == LAYOUT_NAMES[i])
        {
            layout = (layout_t)i;
            return OK;
        }
    }
    return ERR_UNSUPPORTED_LAYOUT;
}

uv_remap region_remap(const sampling_layout& layout, const plane_region& region)
{
    const texture_desc& tex = layout.textures.at(region.texture);

    return uv_remap {
        (decimal)region.w / (decimal)tex.w,
        (decimal)region.h / (decimal)tex.h,
        (decimal)region.x / (decimal)tex.w,
        (decimal)region.y / (decimal)tex.h,
    };
}

/* Half-open containment test in texel space
 *
 * With closed=true, the far edges are inclusive too (up to rounding).
 */
static bool region_contains(
    const texture_desc& tex,
    const plane_region& r,
    decimal u,
    decimal v,
    bool closed
){
    const decimal px = u * (decimal)tex.w;
    const decimal py = v * (decimal)tex.h;

    // Touching the border of the texture counts as inside
    const bool far_x = closed || (r.x + r.w == tex.w);
    const bool far_y = closed || (r.y + r.h == tex.h);

    const decimal slack_x = EPSILON * (decimal)tex.w;
    const decimal slack_y = EPSILON * (decimal)tex.h;

    const bool in_x = (px >= (decimal)r.x - slack_x) && ( far_x
        ? (px <= (decimal)(r.x + r.w) + slack_x)
        : (px < (decimal)(r.x + r.w)) );
    const bool in_y = (py >= (decimal)r.y - slack_y) && ( far_y
        ? (py <= (decimal)(r.y + r.h) + slack_y)
        : (py < (decimal)(r.y + r.h)) );

    return in_x && in_y;
}

int region_at(const sampling_layout& layout, int texture, decimal u, decimal v)
{
    if ( (texture < 0) || (texture >= (int)layout.textures.size()) )
    {
        return -1;
    }

    const texture_desc& tex = layout.textures[texture];
    for (size_t i = 0; i < layout.regions.size(); ++i)
    {
        const plane_region& r = layout.regions[i];
        if ( (r.texture == texture) && region_contains(tex, r, u, v, false) )
        {
            return (int)i;
        }
    }
    return -1;
}

static bool overlaps(const plane_region& a, const plane_region& b)
{
    return (a.texture == b.texture)
        && (a.x < b.x + b.w) && (b.x < a.x + a.w)
        && (a.y < b.y + b.h) && (b.y < a.y + a.h);
}

int validate_layout(const sampling_layout& layout)
{
    const int ntex = (int)layout.textures.size();

    for (int i = 0; i < ntex; ++i)
    {
        const texture_desc& t = layout.textures[i];
        if ( (t.w <= 0) || (t.h <= 0) )
        {
            LOGE("Texture '%s' has empty size %dx%d\n", t.sampler, t.w, t.h);
            return ERR_UNSUPPORTED_LAYOUT;
        }
        for (int j = i + 1; j < ntex; ++j)
        {
            if (layout.textures[j].unit == t.unit)
            {
                LOGE("Textures '%s' and '%s' share unit %d\n",
                    t.sampler, layout.textures[j].sampler, t.unit);
                return ERR_UNSUPPORTED_LAYOUT;
            }
        }
    }

    // Corners and the center of the surface
    static const decimal PROBES[5][2] = {
        { F(0.0), F(0.0) },
        { F(1.0), F(0.0) },
        { F(0.0), F(1.0) },
        { F(1.0), F(1.0) },
        { F(0.5), F(0.5) },
    };

    for (size_t i = 0; i < layout.regions.size(); ++i)
    {
        const plane_region& r = layout.regions[i];
        if ( (r.texture < 0) || (r.texture >= ntex) )
        {
            LOGE("Region '%s' refers to missing texture %d\n", r.name, r.texture);
            return ERR_UNSUPPORTED_LAYOUT;
        }

        const texture_desc& t = layout.textures[r.texture];
        if ( (r.w <= 0) || (r.h <= 0) || (r.x < 0) || (r.y < 0)
            || (r.x + r.w > t.w) || (r.y + r.h > t.h) )
        {
            LOGE("Region '%s' (%d,%d %dx%d) outside of '%s' (%dx%d)\n",
                r.name, r.x, r.y, r.w, r.h, t.sampler, t.w, t.h);
            return ERR_UNSUPPORTED_LAYOUT;
        }

        for (size_t j = i + 1; j < layout.regions.size(); ++j)
        {
            if (overlaps(r, layout.regions[j]))
            {
                LOGE("Regions '%s' and '%s' overlap\n", r.name, layout.regions[j].name);
                return ERR_UNSUPPORTED_LAYOUT;
            }
        }

        const uv_remap m = region_remap(layout, r);
        for (const auto& p : PROBES)
        {
            const decimal u = p[0] * m.scale_u + m.offset_u;
            const decimal v = p[1] * m.scale_v + m.offset_v;
            if (!region_contains(t, r, u, v, true))
            {
                LOGE("Region '%s': (%.3f, %.3f) maps outside to (%.6f, %.6f)\n",
                    r.name, (double)p[0], (double)p[1], (double)u, (double)v);
                return ERR_UNSUPPORTED_LAYOUT;
            }
        }
    }

    return OK;
}

} // namespace texpack
