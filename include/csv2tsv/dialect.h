/**
 * @file dialect.h
 * @brief CSV input dialect and CSV-to-TSV conversion options.
 *
 * A Dialect describes the CSV side (field delimiter and quote character).
 * TranscodeOptions adds the TSV side: the output field delimiter and the
 * strings substituted for TSV delimiters and newlines found inside field data.
 *
 * All special characters are single bytes. Every other byte, including the
 * bytes of multi-byte UTF-8 sequences, is copied through unchanged.
 */

#ifndef CSV2TSV_DIALECT_H
#define CSV2TSV_DIALECT_H

#include <string>

namespace csv2tsv {

/**
 * @brief CSV dialect configuration.
 *
 * Quotes are escaped by doubling (RFC 4180 style); there is no separate
 * escape character.
 */
struct Dialect {
    char delimiter = ',';
    char quote_char = '"';

    bool operator==(const Dialect& other) const {
        return delimiter == other.delimiter && quote_char == other.quote_char;
    }
};

/**
 * @brief Options controlling a CSV-to-TSV conversion.
 *
 * Single-byte replacements are written into the read buffer in place. Empty
 * or multi-byte replacements force the pending output region to be written
 * before the replacement is emitted.
 */
struct TranscodeOptions {
    Dialect csv;                              ///< Input dialect
    char tsv_delimiter = '\t';                ///< Output field delimiter
    std::string delimiter_replacement = " ";  ///< Replaces tsv_delimiter bytes in field data
    std::string newline_replacement = " ";    ///< Replaces CR, LF and CRLF inside quoted fields
    bool discard_bom = true;                  ///< Drop a UTF-8 BOM at the start of input
    bool simd_scan = true;                    ///< Skip runs of ordinary bytes with the SIMD scanner

    /**
     * @brief Check the option combination.
     *
     * @throws std::invalid_argument if the quote character collides with a
     *         delimiter, a delimiter or quote is CR/LF, or a replacement string
     *         contains CR, LF or the TSV delimiter.
     */
    void validate() const;
};

/**
 * @brief Parse a delimiter argument.
 *
 * Accepts "comma", "tab", "semicolon", "pipe", "\t", or any single character.
 *
 * @throws std::invalid_argument for anything else.
 */
char parse_delimiter(const std::string& value);

} // namespace csv2tsv

#endif // CSV2TSV_DIALECT_H
