#include "csv2tsv/scan.h"

#include <gtest/gtest.h>

#include <random>
#include <string>

using csv2tsv::SpecialBytes;
using csv2tsv::find_special;
using csv2tsv::find_special_scalar;
using csv2tsv::special_byte_mask;

namespace {

const SpecialBytes kUnquoted{',', '\t', '\n', '\r'};

const uint8_t* bytes(const std::string& s) {
  return reinterpret_cast<const uint8_t*>(s.data());
}

}  // namespace

TEST(ScanTest, BlockMaskMarksEveryMatch) {
  std::string block(64, 'x');
  block[0] = ',';
  block[17] = '\t';
  block[40] = '\n';
  block[63] = '\r';
  uint64_t expected = (1ULL << 0) | (1ULL << 17) | (1ULL << 40) | (1ULL << 63);
  EXPECT_EQ(special_byte_mask(bytes(block), kUnquoted), expected);
}

TEST(ScanTest, BlockMaskEmptyWhenNoMatch) {
  std::string block(64, 'x');
  EXPECT_EQ(special_byte_mask(bytes(block), kUnquoted), 0u);
}

TEST(ScanTest, HighBytesNeverMatch) {
  std::string block(64, '\xFF');
  EXPECT_EQ(special_byte_mask(bytes(block), kUnquoted), 0u);
}

TEST(ScanTest, FindsFirstMatchAfterPosition) {
  std::string data(200, 'a');
  data[5] = ',';
  data[130] = '\n';
  EXPECT_EQ(find_special(bytes(data), 0, data.size(), kUnquoted), 5u);
  EXPECT_EQ(find_special(bytes(data), 5, data.size(), kUnquoted), 5u);
  EXPECT_EQ(find_special(bytes(data), 6, data.size(), kUnquoted), 130u);
  EXPECT_EQ(find_special(bytes(data), 131, data.size(), kUnquoted), data.size());
}

TEST(ScanTest, RespectsEndOfRange) {
  std::string data(100, 'a');
  data[90] = ',';
  EXPECT_EQ(find_special(bytes(data), 0, 90, kUnquoted), 90u);
  EXPECT_EQ(find_special(bytes(data), 0, 91, kUnquoted), 90u);
}

TEST(ScanTest, EmptyRange) {
  std::string data = ",";
  EXPECT_EQ(find_special(bytes(data), 1, 1, kUnquoted), 1u);
  EXPECT_EQ(find_special_scalar(bytes(data), 1, 1, kUnquoted), 1u);
}

TEST(ScanTest, AgreesWithScalarSearch) {
  std::mt19937 rng(7);
  const std::string alphabet = "abcdefghijklmnopqrstuvwxyz,\t\n\r\"";
  std::string data;
  for (int i = 0; i < 5000; ++i) {
    // Mostly ordinary bytes, so runs longer than a block occur.
    data += (rng() % 40 == 0) ? alphabet[26 + rng() % 5] : alphabet[rng() % 26];
  }
  const SpecialBytes quoted{'"', '\t', '\n', '\r'};
  for (size_t pos = 0; pos < data.size(); pos += 1 + rng() % 37) {
    EXPECT_EQ(find_special(bytes(data), pos, data.size(), kUnquoted),
              find_special_scalar(bytes(data), pos, data.size(), kUnquoted))
        << "pos " << pos;
    EXPECT_EQ(find_special(bytes(data), pos, data.size(), quoted),
              find_special_scalar(bytes(data), pos, data.size(), quoted))
        << "pos " << pos;
  }
}

TEST(ScanTest, DuplicateSpecialBytes) {
  const SpecialBytes tabs{'\t', '\t', '\n', '\r'};
  std::string data(70, 'a');
  data[66] = '\t';
  EXPECT_EQ(find_special(bytes(data), 0, data.size(), tabs), 66u);
}
