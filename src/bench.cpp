#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <time.h>

#include "bench.hpp"
#include "platform.hpp"

#include <Tracy.hpp>

namespace texpack {

void stats_add(frame_stats& stats, double frame_s)
{
    if ( (stats.frames == 0) || (frame_s < stats.min_s) )
    {
        stats.min_s = frame_s;
    }
    if ( (stats.frames == 0) || (frame_s > stats.max_s) )
    {
        stats.max_s = frame_s;
    }
    stats.frames += 1;
    stats.total_s += frame_s;
}

double stats_average(const frame_stats& stats)
{
    if (stats.frames == 0)
    {
        return 0.0;
    }
    return stats.total_s / (double)stats.frames;
}

void print_summary(const bench_config& cfg, const frame_stats& stats)
{
    printf("\n");
    printf("Layout                        : %9s\n", layout_name(cfg.layout));
    printf("Instances                     : %9d\n", cfg.grid_n * cfg.grid_n);
    printf("Frames                        : %9d\n", stats.frames);
    printf("Total frame time (sec)        : %9.3f\n", stats.total_s);
    printf("Average frame time (ms)       : %9.5f\n", 1e3 * stats_average(stats));
    printf("Min frame time (ms)           : %9.5f\n", 1e3 * stats.min_s);
    printf("Max frame time (ms)           : %9.5f\n", 1e3 * stats.max_s);
}

double get_time()
{
    timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return (double)ts.tv_sec + (double)ts.tv_nsec * (double)1.0e-9;
}

int run_timed_loop(const bench_config& cfg, const frame_ops& ops, frame_stats& stats)
{
    const double loop_start = get_time();

    for (;;)
    {
        const double frame_start = get_time();

        int err = ops.submit(ops.ctx);
        if (err != OK)
        {
            return err;
        }
        ops.sync(ops.ctx);

        const double frame_end = get_time();
        const double frame_s = frame_end - frame_start;
        stats_add(stats, frame_s);
        FrameMark;

        if ( (cfg.report_every > 0) && (stats.frames % cfg.report_every == 0) )
        {
            printf("Frame %d: %.3f ms (total %.3f s)\n",
                stats.frames, 1e3 * frame_s, stats.total_s);
        }

        if (frame_end - loop_start >= cfg.duration_s)
        {
            break;
        }
    }

    return OK;
}

/* strtol/strtod wrappers that reject trailing garbage */
static bool parse_int(const char* s, int& out)
{
    char* end = nullptr;
    errno = 0;
    const long v = strtol(s, &end, 10);
    if ( (errno != 0) || (end == s) || (*end != '\0')
        || (v > INT_MAX) || (v < INT_MIN) )
    {
        return false;
    }
    out = (int)v;
    return true;
}

static bool parse_double(const char* s, double& out)
{
    char* end = nullptr;
    errno = 0;
    const double v = strtod(s, &end);
    if ( (errno != 0) || (end == s) || (*end != '\0') )
    {
        return false;
    }
    out = v;
    return true;
}

void print_usage()
{
    fprintf(stderr,
        "Usage: texpack_bench [options] [image]\n"
        "\n"
        "  -l <layout>   rgb | strip | ycbcr3 | packed (default %s)\n"
        "  -t <sec>      measurement duration (default %.0f)\n"
        "  -g <n>        n x n instance grid, n <= %d (default %d)\n"
        "  -s <dist>     grid spacing (default %.2f)\n"
        "  -w <px>       window width (default %d)\n"
        "  -h <px>       window height (default %d)\n"
        "  -q            report every 100th frame only\n"
        "\n"
        "  image         RGB image file (default %s)\n",
        layout_name(DEFAULT_LAYOUT), DEFAULT_DURATION_S, MAX_GRID_N, DEFAULT_GRID_N,
        (double)DEFAULT_SPACING, DEFAULT_WIN_W, DEFAULT_WIN_H, DEFAULT_IMAGE
    );
}

int parse_args(int argc, char** argv, bench_config& cfg)
{
    bool have_image = false;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        if (arg == "-q")
        {
            cfg.report_every = 100;
            continue;
        }

        if ( (arg.size() == 2) && (arg[0] == '-') )
        {
            if (i + 1 >= argc)
            {
                LOGE("Missing value for %s\n", arg.c_str());
                return ERR_BAD_ARGS;
            }
            const char* val = argv[++i];

            bool ok = true;
            double d = 0.0;
            switch (arg[1]) {
            case 'l':
                if (parse_layout(val, cfg.layout) != OK)
                {
                    LOGE("Unknown layout '%s'\n", val);
                    return ERR_UNSUPPORTED_LAYOUT;
                }
                break;
            case 't':
                ok = parse_double(val, cfg.duration_s) && (cfg.duration_s >= 0.0);
                break;
            case 'g':
                ok = parse_int(val, cfg.grid_n) && (cfg.grid_n > 0) && (cfg.grid_n <= MAX_GRID_N);
                break;
            case 's':
                ok = parse_double(val, d) && (d > 0.0);
                cfg.spacing = (float)d;
                break;
            case 'w':
                ok = parse_int(val, cfg.win_w) && (cfg.win_w > 0);
                break;
            case 'h':
                ok = parse_int(val, cfg.win_h) && (cfg.win_h > 0);
                break;
            default:
                LOGE("Unknown option %s\n", arg.c_str());
                return ERR_BAD_ARGS;
            };

            if (!ok)
            {
                LOGE("Invalid value '%s' for %s\n", val, arg.c_str());
                return ERR_BAD_ARGS;
            }
            continue;
        }

        if (have_image)
        {
            LOGE("Only one input image is supported\n");
            return ERR_BAD_ARGS;
        }
        cfg.image = arg;
        have_image = true;
    }

    return OK;
}

} // namespace texpack
