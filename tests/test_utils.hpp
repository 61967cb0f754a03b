/* Shared helpers of the test programs
 *
 * Each test binary is a plain main() returning non-zero if any CHECK failed.
 */

#ifndef TEXPACK_TEST_UTILS_HPP
#define TEXPACK_TEST_UTILS_HPP

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <vector>

#include "texpack.hpp"

static int g_failures = 0;
static int g_checks = 0;

#define CHECK(expr) do { \
    ++g_checks; \
    if (!(expr)) { \
        printf("[FAIL] %s:%d: %s\n", __FILE__, __LINE__, #expr); \
        ++g_failures; \
    } } while (0)

#define CHECK_NEAR(a, b, tol) do { \
    ++g_checks; \
    const double a_ = (double)(a); \
    const double b_ = (double)(b); \
    if (!(std::fabs(a_ - b_) <= (double)(tol))) { \
        printf("[FAIL] %s:%d: %s = %.8f, %s = %.8f, tol %.8f\n", \
            __FILE__, __LINE__, #a, a_, #b, b_, (double)(tol)); \
        ++g_failures; \
    } } while (0)

#define RUN_TEST(fn) do { \
    const int before_ = g_failures; \
    fn(); \
    printf("%s %s\n", (g_failures == before_) ? "[ OK ]" : "[FAIL]", #fn); \
    } while (0)

static inline int test_summary()
{
    printf("\n%d checks, %d failed\n", g_checks, g_failures);
    return (g_failures == 0) ? 0 : 1;
}

/* Deterministic pseudo-random RGB8 pixels */
static inline void make_noise_rgb8(int w, int h, uint32_t seed, std::vector<uint8_t>& out)
{
    out.resize(w * h * texpack::NCH_RGB);
    uint32_t state = seed;
    for (size_t i = 0; i < out.size(); ++i)
    {
        state = state * 1664525u + 1013904223u;
        out[i] = (uint8_t)(state >> 24);
    }
}

/* Horizontal/vertical color ramps */
static inline void make_gradient_rgb8(int w, int h, std::vector<uint8_t>& out)
{
    out.resize(w * h * texpack::NCH_RGB);
    for (int y = 0; y < h; ++y)
    {
        for (int x = 0; x < w; ++x)
        {
            uint8_t* p = out.data() + texpack::NCH_RGB * (y * w + x);
            p[0] = (uint8_t)(255 * x / (w > 1 ? w - 1 : 1));
            p[1] = (uint8_t)(255 * y / (h > 1 ? h - 1 : 1));
            p[2] = (uint8_t)(255 - p[0] / 2);
        }
    }
}

static inline void make_solid_rgb8(int w, int h, uint8_t r, uint8_t g, uint8_t b,
                                   std::vector<uint8_t>& out)
{
    out.resize(w * h * texpack::NCH_RGB);
    for (int i = 0; i < w * h; ++i)
    {
        out[texpack::NCH_RGB * i + 0] = r;
        out[texpack::NCH_RGB * i + 1] = g;
        out[texpack::NCH_RGB * i + 2] = b;
    }
}

#endif // TEXPACK_TEST_UTILS_HPP
