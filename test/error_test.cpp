#include "csv2tsv/error.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using csv2tsv::ErrorCode;
using csv2tsv::ParseError;
using csv2tsv::ParseException;

TEST(ErrorTest, CodeNames) {
  EXPECT_STREQ(csv2tsv::error_code_to_string(ErrorCode::NONE), "NONE");
  EXPECT_STREQ(csv2tsv::error_code_to_string(ErrorCode::UNTERMINATED_QUOTED_FIELD),
               "UNTERMINATED_QUOTED_FIELD");
}

TEST(ErrorTest, UnterminatedQuoteError) {
  ParseError err = csv2tsv::unterminated_quote_error("data.csv", 12, 3, 456);
  EXPECT_EQ(err.code, ErrorCode::UNTERMINATED_QUOTED_FIELD);
  EXPECT_EQ(err.source, "data.csv");
  EXPECT_EQ(err.line, 12u);
  EXPECT_EQ(err.column, 3u);
  EXPECT_EQ(err.byte_offset, 456u);
  EXPECT_EQ(err.message, "invalid CSV: improperly terminated quoted field");
}

TEST(ErrorTest, ExceptionMessageNamesFileAndLine) {
  ParseException e(csv2tsv::unterminated_quote_error("stdin", 7, 1, 0));
  EXPECT_STREQ(e.what(), "invalid CSV: improperly terminated quoted field. File: stdin, Line: 7");
  EXPECT_EQ(e.error().line, 7u);
}

TEST(ErrorTest, ExceptionIsRuntimeError) {
  try {
    throw ParseException(csv2tsv::unterminated_quote_error("x.csv", 1, 1, 0));
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("x.csv"), std::string::npos);
    return;
  }
  FAIL() << "ParseException not caught as std::runtime_error";
}
