/**
 * @file transcoder.cpp
 * @brief CSV to TSV state machine.
 */

#include "csv2tsv/transcoder.h"

namespace csv2tsv {

namespace {

constexpr uint8_t LF = '\n';
constexpr uint8_t CR = '\r';

really_inline bool has_utf8_bom(const uint8_t* data, size_t size) {
    return size >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF;
}

} // namespace

const char* parser_state_to_string(ParserState state) {
    switch (state) {
        case ParserState::FieldEnd: return "FieldEnd";
        case ParserState::NonQuotedField: return "NonQuotedField";
        case ParserState::QuotedField: return "QuotedField";
        case ParserState::QuoteInQuotedField: return "QuoteInQuotedField";
        case ParserState::CRAtFieldEnd: return "CRAtFieldEnd";
        case ParserState::CRInQuotedField: return "CRInQuotedField";
        default: return "Unknown";
    }
}

Transcoder::Transcoder(const TranscodeOptions& options) : options_(options) {
    options_.validate();
    quote_ = static_cast<uint8_t>(options_.csv.quote_char);
    csv_delim_ = static_cast<uint8_t>(options_.csv.delimiter);
    tsv_delim_ = static_cast<uint8_t>(options_.tsv_delimiter);
    unquoted_special_ = SpecialBytes{csv_delim_, tsv_delim_, LF, CR};
    quoted_special_ = SpecialBytes{quote_, tsv_delim_, LF, CR};
}

void Transcoder::reset(const std::string& source_name, size_t skip_lines) {
    source_name_ = source_name;
    skip_lines_ = skip_lines;
    state_ = ParserState::FieldEnd;
    record_num_ = 1;
    field_num_ = 0;
    chunks_seen_ = 0;
    bytes_processed_ = 0;
    data_ = nullptr;
    region_start_ = 0;
}

void Transcoder::flush_region(BufferedOutput& out, size_t end, std::string_view append) {
    if (record_num_ > skip_lines_) {
        out.append(data_ + region_start_, data_ + end);
        out.append(append);
    }
    region_start_ = end + 1;
}

void Transcoder::end_record(BufferedOutput& out, size_t i) {
    // Last skipped record: discard everything up to and including its terminator.
    if (record_num_ == skip_lines_) {
        flush_region(out, i);
    }
    ++record_num_;
    field_num_ = 0;
}

void Transcoder::replace(BufferedOutput& out, size_t i, const std::string& replacement) {
    if (replacement.size() == 1) {
        data_[i] = static_cast<uint8_t>(replacement[0]);
    } else {
        flush_region(out, i, replacement);
    }
}

size_t Transcoder::next_special(size_t i, size_t len, SpecialBytes special) const {
    if (options_.simd_scan) {
        return find_special(data_, i, len, special);
    }
    return find_special_scalar(data_, i, len, special);
}

void Transcoder::throw_unterminated_quote(uint64_t byte_offset) const {
    throw ParseException(unterminated_quote_error(source_name_, record_num_, field_num_,
                                                  static_cast<size_t>(byte_offset)));
}

void Transcoder::process_chunk(uint8_t* data, size_t size, BufferedOutput& out) {
    size_t i = 0;
    if (chunks_seen_ == 0 && options_.discard_bom && has_utf8_bom(data, size)) {
        i = 3;
    }
    ++chunks_seen_;

    data_ = data;
    region_start_ = i;

    while (i < size) {
        switch (state_) {
            case ParserState::FieldEnd:
                ++field_num_;
                if (data[i] == quote_) {
                    // Opening quote is dropped
                    flush_region(out, i);
                    state_ = ParserState::QuotedField;
                    ++i;
                } else {
                    // Same byte goes through the NonQuotedField rules
                    state_ = ParserState::NonQuotedField;
                }
                break;

            case ParserState::NonQuotedField: {
                i = next_special(i, size, unquoted_special_);
                if (i == size) break;

                const uint8_t c = data[i];
                if (c == csv_delim_) {
                    data[i] = tsv_delim_;
                    state_ = ParserState::FieldEnd;
                } else if (c == LF) {
                    end_record(out, i);
                    state_ = ParserState::FieldEnd;
                } else if (c == CR) {
                    data[i] = LF;
                    end_record(out, i);
                    state_ = ParserState::CRAtFieldEnd;
                } else {
                    replace(out, i, options_.delimiter_replacement);
                }
                ++i;
                break;
            }

            case ParserState::QuotedField: {
                i = next_special(i, size, quoted_special_);
                if (i == size) break;

                const uint8_t c = data[i];
                if (c == quote_) {
                    // Closing quote or first half of an escaped pair; drop it
                    // and let the next byte decide.
                    flush_region(out, i);
                    state_ = ParserState::QuoteInQuotedField;
                } else if (c == tsv_delim_) {
                    replace(out, i, options_.delimiter_replacement);
                } else if (c == LF) {
                    replace(out, i, options_.newline_replacement);
                } else {
                    replace(out, i, options_.newline_replacement);
                    state_ = ParserState::CRInQuotedField;
                }
                ++i;
                break;
            }

            case ParserState::QuoteInQuotedField: {
                const uint8_t c = data[i];
                if (c == quote_) {
                    // Escaped quote; this byte starts the next region
                    state_ = ParserState::QuotedField;
                } else if (c == csv_delim_) {
                    data[i] = tsv_delim_;
                    state_ = ParserState::FieldEnd;
                } else if (c == LF) {
                    end_record(out, i);
                    state_ = ParserState::FieldEnd;
                } else if (c == CR) {
                    data[i] = LF;
                    end_record(out, i);
                    state_ = ParserState::CRAtFieldEnd;
                } else {
                    throw_unterminated_quote(bytes_processed_ + i);
                }
                ++i;
                break;
            }

            case ParserState::CRAtFieldEnd:
                if (data[i] == LF) {
                    flush_region(out, i);
                    ++i;
                }
                state_ = ParserState::FieldEnd;
                break;

            case ParserState::CRInQuotedField:
                if (data[i] == LF) {
                    flush_region(out, i);
                    ++i;
                }
                state_ = ParserState::QuotedField;
                break;
        }
    }

    if (region_start_ < size && record_num_ > skip_lines_) {
        out.append(data + region_start_, data + size);
    }

    bytes_processed_ += size;
    data_ = nullptr;
    region_start_ = 0;
}

void Transcoder::finish(BufferedOutput& out) {
    // CRInQuotedField is not an error here.
    if (state_ == ParserState::QuotedField) {
        throw_unterminated_quote(bytes_processed_);
    }
    if (field_num_ > 0 && record_num_ > skip_lines_) {
        out.put('\n');
    }
}

void Transcoder::transcode(ChunkReader& reader, BufferedOutput& out,
                           const std::string& source_name, size_t skip_lines) {
    reset(source_name, skip_lines);
    for (const Chunk& chunk : reader) {
        process_chunk(chunk.data, chunk.size, out);
    }
    finish(out);
}

std::string csv_to_tsv(std::string_view csv, const TranscodeOptions& options,
                       size_t chunk_size, size_t skip_lines) {
    Transcoder transcoder(options);
    MemorySource source(csv);
    ChunkReader reader(source, chunk_size);

    StringSink sink;
    {
        BufferedOutput out(sink);
        transcoder.transcode(reader, out, source.name(), skip_lines);
        out.flush();
    }
    return sink.str();
}

} // namespace csv2tsv
