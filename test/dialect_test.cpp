#include "csv2tsv/dialect.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using csv2tsv::Dialect;
using csv2tsv::TranscodeOptions;

namespace {

// Returns the validate() message, or "" when the options are valid.
std::string validationError(const TranscodeOptions& opts) {
  try {
    opts.validate();
  } catch (const std::invalid_argument& e) {
    return e.what();
  }
  return "";
}

}  // namespace

TEST(TranscodeOptionsTest, Defaults) {
  TranscodeOptions opts;
  EXPECT_EQ(opts.csv, (Dialect{',', '"'}));
  EXPECT_EQ(opts.tsv_delimiter, '\t');
  EXPECT_EQ(opts.delimiter_replacement, " ");
  EXPECT_EQ(opts.newline_replacement, " ");
  EXPECT_TRUE(opts.discard_bom);
  EXPECT_TRUE(opts.simd_scan);
  EXPECT_NO_THROW(opts.validate());
}

TEST(TranscodeOptionsTest, QuoteCannotBeNewline) {
  TranscodeOptions opts;
  opts.csv.quote_char = '\n';
  EXPECT_EQ(validationError(opts), "CSV quote character cannot be newline (--q|quote).");
  opts.csv.quote_char = '\r';
  EXPECT_EQ(validationError(opts), "CSV quote character cannot be newline (--q|quote).");
}

TEST(TranscodeOptionsTest, QuoteMustDifferFromDelimiters) {
  TranscodeOptions opts;
  opts.csv.quote_char = ',';
  EXPECT_EQ(validationError(opts),
            "CSV quote and CSV field delimiter characters must be different (--q|quote, --c|csv-delim).");

  opts = TranscodeOptions();
  opts.tsv_delimiter = '"';
  EXPECT_EQ(validationError(opts),
            "CSV quote and TSV field delimiter characters must be different (--q|quote, --t|tsv-delim).");
}

TEST(TranscodeOptionsTest, DelimitersCannotBeNewline) {
  TranscodeOptions opts;
  opts.csv.delimiter = '\r';
  EXPECT_EQ(validationError(opts), "CSV field delimiter cannot be newline (--c|csv-delim).");

  opts = TranscodeOptions();
  opts.tsv_delimiter = '\n';
  EXPECT_EQ(validationError(opts), "TSV field delimiter cannot be newline (--t|tsv-delim).");
}

TEST(TranscodeOptionsTest, ReplacementsCannotContainSpecialBytes) {
  TranscodeOptions opts;
  opts.delimiter_replacement = "a\tb";
  EXPECT_NE(validationError(opts).find("--r|tab-replacement"), std::string::npos);

  opts = TranscodeOptions();
  opts.newline_replacement = "\r\n";
  EXPECT_NE(validationError(opts).find("--n|newline-replacement"), std::string::npos);

  opts = TranscodeOptions();
  opts.tsv_delimiter = '|';
  opts.newline_replacement = "|";
  EXPECT_NE(validationError(opts).find("--n|newline-replacement"), std::string::npos);

  // A tab is fine once it is no longer the TSV delimiter.
  opts.delimiter_replacement = "\t";
  opts.newline_replacement = "\t";
  EXPECT_EQ(validationError(opts), "");
}

TEST(TranscodeOptionsTest, EmptyAndLongReplacementsAllowed) {
  TranscodeOptions opts;
  opts.delimiter_replacement = "";
  opts.newline_replacement = "<newline>";
  EXPECT_NO_THROW(opts.validate());
}

TEST(TranscodeOptionsTest, CsvAndTsvDelimitersMayMatch) {
  TranscodeOptions opts;
  opts.csv.delimiter = '\t';
  EXPECT_NO_THROW(opts.validate());
}

TEST(ParseDelimiterTest, NamedDelimiters) {
  EXPECT_EQ(csv2tsv::parse_delimiter("comma"), ',');
  EXPECT_EQ(csv2tsv::parse_delimiter("tab"), '\t');
  EXPECT_EQ(csv2tsv::parse_delimiter("\\t"), '\t');
  EXPECT_EQ(csv2tsv::parse_delimiter("semicolon"), ';');
  EXPECT_EQ(csv2tsv::parse_delimiter("pipe"), '|');
}

TEST(ParseDelimiterTest, SingleCharacter) {
  EXPECT_EQ(csv2tsv::parse_delimiter("^"), '^');
  EXPECT_EQ(csv2tsv::parse_delimiter("\t"), '\t');
}

TEST(ParseDelimiterTest, RejectsOthers) {
  EXPECT_THROW(csv2tsv::parse_delimiter(""), std::invalid_argument);
  EXPECT_THROW(csv2tsv::parse_delimiter("ab"), std::invalid_argument);
  EXPECT_THROW(csv2tsv::parse_delimiter("colon"), std::invalid_argument);
}
