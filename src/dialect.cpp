#include "csv2tsv/dialect.h"

#include <stdexcept>

namespace csv2tsv {

namespace {

bool is_newline(char c) { return c == '\n' || c == '\r'; }

void check_replacement(const std::string& replacement, char tsv_delimiter,
                       const char* option) {
    for (char c : replacement) {
        if (is_newline(c) || c == tsv_delimiter) {
            throw std::invalid_argument(
                std::string("Replacement string cannot contain newlines or TSV field delimiters (") +
                option + ").");
        }
    }
}

} // namespace

void TranscodeOptions::validate() const {
    if (is_newline(csv.quote_char)) {
        throw std::invalid_argument("CSV quote character cannot be newline (--q|quote).");
    }
    if (csv.quote_char == csv.delimiter) {
        throw std::invalid_argument(
            "CSV quote and CSV field delimiter characters must be different (--q|quote, --c|csv-delim).");
    }
    if (csv.quote_char == tsv_delimiter) {
        throw std::invalid_argument(
            "CSV quote and TSV field delimiter characters must be different (--q|quote, --t|tsv-delim).");
    }
    if (is_newline(csv.delimiter)) {
        throw std::invalid_argument("CSV field delimiter cannot be newline (--c|csv-delim).");
    }
    if (is_newline(tsv_delimiter)) {
        throw std::invalid_argument("TSV field delimiter cannot be newline (--t|tsv-delim).");
    }
    check_replacement(delimiter_replacement, tsv_delimiter, "--r|tab-replacement");
    check_replacement(newline_replacement, tsv_delimiter, "--n|newline-replacement");
}

char parse_delimiter(const std::string& value) {
    if (value == "comma") {
        return ',';
    } else if (value == "tab" || value == "\\t") {
        return '\t';
    } else if (value == "semicolon") {
        return ';';
    } else if (value == "pipe") {
        return '|';
    } else if (value.length() == 1) {
        return value[0];
    }
    throw std::invalid_argument("Unknown delimiter '" + value +
                                "': use comma, tab, semicolon, pipe, or a single character");
}

} // namespace csv2tsv
