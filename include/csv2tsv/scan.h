#ifndef CSV2TSV_SCAN_H
#define CSV2TSV_SCAN_H

// Search for the next byte the transcoder has to act on.
//
// Inside a field most bytes are copied through untouched; only a handful of
// byte values (delimiter, quote, CR, LF, TSV delimiter) change state or need
// a replacement. These helpers let the state machine jump straight to the
// next such byte instead of dispatching on every one.

#include <cstddef>
#include <cstdint>

#include "csv2tsv/common_defs.h"

namespace csv2tsv {

// The four byte values a field state stops on.
struct SpecialBytes {
  uint8_t a;
  uint8_t b;
  uint8_t c;
  uint8_t d;

  really_inline bool matches(uint8_t x) const {
    return x == a || x == b || x == c || x == d;
  }
};

// Index of the first byte in data[pos, len) matching one of `special`, or
// len if there is none. Vectorized 64 bytes at a time with Highway; the tail
// of the range is scanned with scalar code, so no padding is needed.
size_t find_special(const uint8_t* data, size_t pos, size_t len, SpecialBytes special);

// Byte-at-a-time reference version of find_special().
size_t find_special_scalar(const uint8_t* data, size_t pos, size_t len,
                           SpecialBytes special);

// Bitmask of the bytes in block[0, 64) matching one of `special`. Bit i is
// set when block[i] matches.
uint64_t special_byte_mask(const uint8_t* block, SpecialBytes special);

}  // namespace csv2tsv

#endif  // CSV2TSV_SCAN_H
