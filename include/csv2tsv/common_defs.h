#ifndef CSV2TSV_COMMON_DEFS_H
#define CSV2TSV_COMMON_DEFS_H

#include <cstddef>

// Default size of the read buffer handed to ChunkReader.
#define CSV2TSV_DEFAULT_CHUNK_SIZE (128 * 1024)

// BufferedOutput defaults. The buffer is written out once it holds at least
// FLUSH_SIZE bytes and ends on a newline, or unconditionally at MAX_SIZE.
#define CSV2TSV_OUTPUT_FLUSH_SIZE (10 * 1024)
#define CSV2TSV_OUTPUT_RESERVE_SIZE (129 * 1024)
#define CSV2TSV_OUTPUT_MAX_SIZE (128 * 1024)

// Chunk buffers are cache-line aligned so the scanner's block loads start aligned.
#define CSV2TSV_CHUNK_ALIGNMENT 64

#ifdef _MSC_VER
#define really_inline inline
#else
#define really_inline inline __attribute__((always_inline, unused))
#endif

#endif // CSV2TSV_COMMON_DEFS_H
