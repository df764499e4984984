#include "csv2tsv/scan.h"

// Include Highway for portable SIMD
#undef HWY_TARGET_INCLUDE
#include "hwy/highway.h"

namespace csv2tsv {

namespace hn = hwy::HWY_NAMESPACE;

namespace {

really_inline int trailing_zeroes(uint64_t input_num) {
  if (input_num == 0) return 64;
  return __builtin_ctzll(input_num);
}

HWY_ATTR uint64_t block_mask(const uint8_t* block, SpecialBytes special) {
  const hn::ScalableTag<uint8_t> d;
  const size_t N = hn::Lanes(d);

  const auto match_a = hn::Set(d, special.a);
  const auto match_b = hn::Set(d, special.b);
  const auto match_c = hn::Set(d, special.c);
  const auto match_d = hn::Set(d, special.d);

  uint64_t result = 0;

  size_t i = 0;
  for (; i + N <= 64; i += N) {
    auto vec = hn::LoadU(d, block + i);
    auto mask = hn::Or(hn::Or(hn::Eq(vec, match_a), hn::Eq(vec, match_b)),
                       hn::Or(hn::Eq(vec, match_c), hn::Eq(vec, match_d)));
    uint64_t bits = hn::BitsFromMask(d, mask);
    result |= (bits << i);
  }

  // Vectors wider than 64 bytes never enter the loop above
  for (; i < 64; ++i) {
    if (special.matches(block[i])) {
      result |= (1ULL << i);
    }
  }

  return result;
}

}  // namespace

uint64_t special_byte_mask(const uint8_t* block, SpecialBytes special) {
  return block_mask(block, special);
}

size_t find_special(const uint8_t* data, size_t pos, size_t len, SpecialBytes special) {
  while (pos + 64 <= len) {
    uint64_t mask = special_byte_mask(data + pos, special);
    if (mask != 0) {
      return pos + static_cast<size_t>(trailing_zeroes(mask));
    }
    pos += 64;
  }
  return find_special_scalar(data, pos, len, special);
}

size_t find_special_scalar(const uint8_t* data, size_t pos, size_t len,
                           SpecialBytes special) {
  for (; pos < len; ++pos) {
    if (special.matches(data[pos])) {
      return pos;
    }
  }
  return len;
}

}  // namespace csv2tsv
