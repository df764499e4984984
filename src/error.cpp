#include "csv2tsv/error.h"
#include <sstream>

namespace csv2tsv {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::UNTERMINATED_QUOTED_FIELD: return "UNTERMINATED_QUOTED_FIELD";
        default: return "UNKNOWN";
    }
}

ParseError unterminated_quote_error(const std::string& source, size_t line,
                                    size_t column, size_t byte_offset) {
    return ParseError(ErrorCode::UNTERMINATED_QUOTED_FIELD, source, line, column,
                      byte_offset, "invalid CSV: improperly terminated quoted field");
}

std::string ParseException::format_error(const ParseError& error) {
    std::ostringstream ss;
    ss << error.message << ". File: " << error.source << ", Line: " << error.line;
    return ss.str();
}

} // namespace csv2tsv
