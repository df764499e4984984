/**
 * @file output_sink.h
 * @brief Output destinations and the write-batching buffer in front of them.
 *
 * The transcoder never writes to a destination directly. It appends byte
 * ranges and replacement strings to a BufferedOutput, which accumulates them
 * and hands large blocks to an OutputSink. Output order is exactly append
 * order.
 *
 * Flushing policy: after an append the buffer is written out once it holds
 * at least flush_size bytes and either ends with a newline or has reached
 * max_size. Memory use is therefore bounded by max_size plus one append.
 */

#ifndef CSV2TSV_OUTPUT_SINK_H
#define CSV2TSV_OUTPUT_SINK_H

#include "csv2tsv/common_defs.h"
#include "csv2tsv/io_util.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace csv2tsv {

/**
 * @brief Abstract byte destination.
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;

    /// Write all n bytes. Throws std::system_error on failure.
    virtual void write(const char* data, size_t n) = 0;

    /// Push any lower-level buffering to the destination.
    virtual void flush() {}
};

/**
 * @brief Sink writing to a C stdio stream (stdout or an opened file).
 */
class FileSink : public OutputSink {
public:
    /// Writes to a stream owned by the caller (e.g. stdout).
    FileSink(std::FILE* fp, std::string name);

    /// Creates or truncates the named file.
    explicit FileSink(const std::string& filename);

    void write(const char* data, size_t n) override;
    void flush() override;

private:
    FilePtr owned_;
    std::FILE* fp_;
    std::string name_;
};

/**
 * @brief Sink collecting output in memory.
 */
class StringSink : public OutputSink {
public:
    void write(const char* data, size_t n) override { str_.append(data, n); }

    const std::string& str() const { return str_; }
    void clear() { str_.clear(); }

private:
    std::string str_;
};

/**
 * @brief Sink discarding everything written to it.
 */
class NullSink : public OutputSink {
public:
    void write(const char*, size_t n) override { bytes_discarded_ += n; }

    uint64_t bytes_discarded() const { return bytes_discarded_; }

private:
    uint64_t bytes_discarded_ = 0;
};

/**
 * @brief Append-only batching buffer in front of an OutputSink.
 *
 * Destruction flushes. A failure during that final flush is reported on
 * stderr since destructors can't throw; call flush() explicitly to have
 * sink errors propagate.
 */
class BufferedOutput {
public:
    explicit BufferedOutput(OutputSink& sink,
                            size_t flush_size = CSV2TSV_OUTPUT_FLUSH_SIZE,
                            size_t reserve_size = CSV2TSV_OUTPUT_RESERVE_SIZE,
                            size_t max_size = CSV2TSV_OUTPUT_MAX_SIZE);
    ~BufferedOutput();

    BufferedOutput(const BufferedOutput&) = delete;
    BufferedOutput& operator=(const BufferedOutput&) = delete;

    /// Append the bytes [first, last).
    void append(const uint8_t* first, const uint8_t* last);

    /// Append a literal string.
    void append(std::string_view literal);

    /// Append one byte. A newline flushes once flush_size is reached.
    void put(char c);

    /// Write everything buffered to the sink, then flush the sink.
    void flush();

    size_t buffered() const { return buffer_.size(); }
    size_t flush_size() const { return flush_size_; }
    size_t max_size() const { return max_size_; }
    OutputSink& sink() { return sink_; }

private:
    void maybe_flush();

    OutputSink& sink_;
    std::string buffer_;
    size_t flush_size_;
    size_t max_size_;
};

} // namespace csv2tsv

#endif // CSV2TSV_OUTPUT_SINK_H
