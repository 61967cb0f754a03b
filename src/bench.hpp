#ifndef TEXPACK_BENCH_HPP
#define TEXPACK_BENCH_HPP

#include <string>

#include "texpack.hpp"

namespace texpack {

/* Define the default layout here */
#ifndef TEXPACK_LAYOUT_DEF
#define TEXPACK_LAYOUT_DEF PACKED_YCBCR
#endif
constexpr layout_t DEFAULT_LAYOUT = TEXPACK_LAYOUT_DEF;

/* Reference configuration */
constexpr int    DEFAULT_GRID_N     = 10;
constexpr int    MAX_GRID_N         = 1024;
constexpr float  DEFAULT_SPACING    = 2.5f;
constexpr double DEFAULT_DURATION_S = 600.0;
constexpr int    DEFAULT_WIN_W      = 1280;
constexpr int    DEFAULT_WIN_H      = 720;
constexpr int    SPHERE_STACKS      = 32;
constexpr int    SPHERE_SLICES      = 32;
constexpr float  SPHERE_RADIUS      = 1.0f;
constexpr double COOLDOWN_S         = 2.0;
constexpr const char* DEFAULT_IMAGE = "texture.jpg";

/* Everything the setup and the timed loop need, passed explicitly */
struct bench_config {
    std::string image  = DEFAULT_IMAGE;
    layout_t layout    = DEFAULT_LAYOUT;
    int grid_n         = DEFAULT_GRID_N;
    float spacing      = DEFAULT_SPACING;
    double duration_s  = DEFAULT_DURATION_S;
    int win_w          = DEFAULT_WIN_W;
    int win_h          = DEFAULT_WIN_H;
    int sphere_stacks  = SPHERE_STACKS;
    int sphere_slices  = SPHERE_SLICES;
    float sphere_radius = SPHERE_RADIUS;
    double cooldown_s  = COOLDOWN_S;
    // Print every n-th frame line
    int report_every   = 1;
};

/* Per-frame durations in seconds */
struct frame_stats {
    int frames     = 0;
    double total_s = 0.0;
    double min_s   = 0.0;
    double max_s   = 0.0;
};

void stats_add(frame_stats& stats, double frame_s);
double stats_average(const frame_stats& stats);
void print_summary(const bench_config& cfg, const frame_stats& stats);

/* GPU work of one frame
 *
 * submit issues the clear and a single instanced draw, sync blocks until the
 * GPU has finished everything submitted so far.
 */
struct frame_ops {
    void* ctx;
    int (*submit)(void* ctx);
    void (*sync)(void* ctx);
};

/* Run frames until cfg.duration_s of wall-clock time has elapsed
 *
 * Each frame is timed from just before submit until after sync. The budget is
 * checked after sync, a started frame is always completed.
 * Returns zero on success, the submit error otherwise.
 */
int run_timed_loop(const bench_config& cfg, const frame_ops& ops, frame_stats& stats);

/* Read a monotonic clock and return seconds */
double get_time();

/* Parse command line arguments into cfg
 *
 * Returns ERR_BAD_ARGS or ERR_UNSUPPORTED_LAYOUT on failure.
 */
int parse_args(int argc, char** argv, bench_config& cfg);

/* Command line help of texpack_bench */
void print_usage();

/* Benchmark entry point: load, encode, upload, run the timed loop.
 *
 * Returns exit code (non-zero => fail)
 */
int bench_entry(const bench_config& cfg);

} // namespace texpack

#endif // TEXPACK_BENCH_HPP
