/**
 * @file transcoder.h
 * @brief Streaming CSV to TSV conversion state machine.
 *
 * The Transcoder consumes input one chunk at a time and rewrites it into TSV
 * without building per-field strings. Within a chunk it tracks a pending
 * write region, a half-open byte range [region_start, i) that will be
 * written verbatim. Single-byte substitutions (CSV delimiter to TSV
 * delimiter, CR to LF, single-character replacements) are made by
 * overwriting the chunk byte in place. Dropped bytes (quotes, the LF of a
 * CRLF pair) and multi-byte or empty replacements end the region: the region
 * is appended to the output, the replacement (if any) follows, and a new
 * region starts after the current byte.
 *
 * Parser state and the record/field counters live in the Transcoder, so a
 * record or quoted field may span any number of chunks.
 *
 * Basic usage:
 * @code
 * csv2tsv::TranscodeOptions opts;
 * csv2tsv::Transcoder transcoder(opts);
 *
 * csv2tsv::FileSource source("data.csv");
 * csv2tsv::ChunkReader reader(source, 128 * 1024);
 * csv2tsv::FileSink sink(stdout, "stdout");
 * csv2tsv::BufferedOutput out(sink);
 *
 * transcoder.transcode(reader, out, source.name());
 * out.flush();
 * @endcode
 */

#ifndef CSV2TSV_TRANSCODER_H
#define CSV2TSV_TRANSCODER_H

#include "csv2tsv/chunk_reader.h"
#include "csv2tsv/common_defs.h"
#include "csv2tsv/dialect.h"
#include "csv2tsv/error.h"
#include "csv2tsv/output_sink.h"
#include "csv2tsv/scan.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace csv2tsv {

/**
 * @brief Parser states.
 *
 * CRAtFieldEnd and CRInQuotedField remember that the previous byte was a
 * CR, so a following LF can be absorbed without lookahead.
 */
enum class ParserState {
    FieldEnd,            ///< Start of input, or just after a delimiter or terminator
    NonQuotedField,      ///< Inside a field that did not start with a quote
    QuotedField,         ///< Inside a quoted field
    QuoteInQuotedField,  ///< Just read a quote inside a quoted field
    CRAtFieldEnd,        ///< Just read a CR terminating a record
    CRInQuotedField      ///< Just read a CR inside a quoted field
};

const char* parser_state_to_string(ParserState state);

class Transcoder {
public:
    /**
     * @throws std::invalid_argument if the options fail validate().
     */
    explicit Transcoder(const TranscodeOptions& options);

    /**
     * @brief Prepare for a new input.
     *
     * Resets the state to FieldEnd, the record number to 1 and the field
     * number to 0.
     *
     * @param source_name Name reported in errors ("stdin" for standard input).
     * @param skip_lines Number of leading records to drop from the output.
     */
    void reset(const std::string& source_name, size_t skip_lines = 0);

    /**
     * @brief Convert one chunk.
     *
     * The chunk bytes are modified in place. Nothing in the chunk is
     * referenced after the call returns.
     *
     * @throws ParseException on an improperly terminated quoted field.
     */
    void process_chunk(uint8_t* data, size_t size, BufferedOutput& out);

    /**
     * @brief Finish the current input.
     *
     * Appends the LF terminating a final record that had none.
     *
     * @throws ParseException if the input ended inside a quoted field.
     */
    void finish(BufferedOutput& out);

    /// reset(), then every chunk of reader, then finish().
    void transcode(ChunkReader& reader, BufferedOutput& out,
                   const std::string& source_name, size_t skip_lines = 0);

    ParserState state() const { return state_; }
    size_t record_number() const { return record_num_; }
    size_t field_number() const { return field_num_; }
    uint64_t bytes_processed() const { return bytes_processed_; }
    const std::string& source_name() const { return source_name_; }
    const TranscodeOptions& options() const { return options_; }

private:
    // Append [region_start_, end) plus `append`, unless the record is being
    // skipped, and start the next region after `end`.
    void flush_region(BufferedOutput& out, size_t end, std::string_view append = {});

    // A record terminator at index i; the byte has already been made an LF.
    void end_record(BufferedOutput& out, size_t i);

    // Apply a replacement string to the byte at index i.
    void replace(BufferedOutput& out, size_t i, const std::string& replacement);

    size_t next_special(size_t i, size_t len, SpecialBytes special) const;

    [[noreturn]] void throw_unterminated_quote(uint64_t byte_offset) const;

    TranscodeOptions options_;
    uint8_t quote_;
    uint8_t csv_delim_;
    uint8_t tsv_delim_;
    SpecialBytes unquoted_special_;
    SpecialBytes quoted_special_;

    std::string source_name_;
    size_t skip_lines_ = 0;

    ParserState state_ = ParserState::FieldEnd;
    size_t record_num_ = 1;
    size_t field_num_ = 0;
    size_t chunks_seen_ = 0;
    uint64_t bytes_processed_ = 0;

    // Current chunk
    uint8_t* data_ = nullptr;
    size_t region_start_ = 0;
};

/**
 * @brief Convert an in-memory CSV string.
 *
 * The input is read through chunks of chunk_size bytes, exactly as a file
 * would be.
 *
 * @throws ParseException on an improperly terminated quoted field.
 * @throws std::invalid_argument for invalid options or a zero chunk size.
 */
std::string csv_to_tsv(std::string_view csv, const TranscodeOptions& options = TranscodeOptions(),
                       size_t chunk_size = CSV2TSV_DEFAULT_CHUNK_SIZE, size_t skip_lines = 0);

} // namespace csv2tsv

#endif // CSV2TSV_TRANSCODER_H
