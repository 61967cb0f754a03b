#ifndef TEXPACK_PLATFORM_H
#define TEXPACK_PLATFORM_H

/*
 * Logging macros
 *
 * Errors go to stderr so that the per-frame report on stdout stays parseable.
 */

#include <cstdio>

#ifndef TEXPACK_VERBOSE
#define TEXPACK_VERBOSE  0
#endif

#define LOGI(...) printf(__VA_ARGS__)
#define LOGW(...) printf("WARNING: " __VA_ARGS__)
#define LOGE(...) fprintf(stderr, "ERROR: " __VA_ARGS__)

#if TEXPACK_VERBOSE
#define LOGD(...) printf("DEBUG: " __VA_ARGS__)
#else
#define LOGD(...) ((void)0)
#endif

#endif // TEXPACK_PLATFORM_H
