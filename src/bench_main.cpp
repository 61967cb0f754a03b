#include <cstdio>
#include <cstdlib>
#include <string>

#include "bench.hpp"

/* Exit with error, optionally printing usage */
static void err_exit(const std::string& err_msg, bool print_usage=false)
{
    fprintf(stderr, "ERROR: %s\n", err_msg.data());
    if (print_usage)
    {
        texpack::print_usage();
    }
    exit(1);
}

int main(int argc, char **argv)
{
    texpack::bench_config cfg;

    int ret = texpack::parse_args(argc, argv, cfg);
    if (ret != texpack::OK)
    {
        err_exit(texpack::err_str(ret), true);
    }

    ret = texpack::bench_entry(cfg);
    if (ret != texpack::OK)
    {
        err_exit(std::string("Benchmark failed: ") + texpack::err_str(ret));
    }

    return 0;
}
