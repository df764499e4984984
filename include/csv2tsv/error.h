#ifndef CSV2TSV_ERROR_H
#define CSV2TSV_ERROR_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace csv2tsv {

// Error codes. Configuration and I/O failures are reported with
// std::invalid_argument and std::system_error instead.
enum class ErrorCode {
    NONE = 0,

    UNTERMINATED_QUOTED_FIELD    // Illegal byte after a closing quote, or EOF inside quotes
};

// Detailed error information
struct ParseError {
    ErrorCode code;

    std::string source;   // File name, or "stdin"
    size_t line;          // Record number (1-indexed)
    size_t column;        // Field number within the record (1-indexed)
    size_t byte_offset;   // Offset of the offending byte in the source

    std::string message;  // Human-readable error message

    ParseError(ErrorCode c, const std::string& src, size_t l, size_t col,
               size_t offset, const std::string& msg)
        : code(c), source(src), line(l), column(col),
          byte_offset(offset), message(msg) {}
};

// Thrown for the structural error. what() names the source and record.
class ParseException : public std::runtime_error {
public:
    explicit ParseException(const ParseError& error)
        : std::runtime_error(format_error(error)), error_(error) {}

    const ParseError& error() const { return error_; }

private:
    ParseError error_;

    static std::string format_error(const ParseError& error);
};

// Builds the structural error for an improperly terminated quoted field.
ParseError unterminated_quote_error(const std::string& source, size_t line,
                                    size_t column, size_t byte_offset);

const char* error_code_to_string(ErrorCode code);

} // namespace csv2tsv

#endif // CSV2TSV_ERROR_H
