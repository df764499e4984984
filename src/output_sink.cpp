#include "csv2tsv/output_sink.h"

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace csv2tsv {

//-----------------------------------------------------------------------------
// FileSink implementation
//-----------------------------------------------------------------------------

FileSink::FileSink(std::FILE* fp, std::string name)
    : fp_(fp), name_(std::move(name)) {}

FileSink::FileSink(const std::string& filename)
    : owned_(open_for_write(filename)), fp_(owned_.get()), name_(filename) {}

void FileSink::write(const char* data, size_t n) {
    if (n == 0) return;
    errno = 0;
    if (std::fwrite(data, 1, n, fp_) != n) {
        throw_io_error("could not write to " + name_);
    }
}

void FileSink::flush() {
    errno = 0;
    if (std::fflush(fp_) != 0) {
        throw_io_error("could not write to " + name_);
    }
}

//-----------------------------------------------------------------------------
// BufferedOutput implementation
//-----------------------------------------------------------------------------

BufferedOutput::BufferedOutput(OutputSink& sink, size_t flush_size,
                               size_t reserve_size, size_t max_size)
    : sink_(sink),
      flush_size_(flush_size),
      max_size_(flush_size <= max_size ? max_size : flush_size) {
    buffer_.reserve(reserve_size);
}

BufferedOutput::~BufferedOutput() {
    if (buffer_.empty()) {
        return;
    }
    try {
        flush();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
}

void BufferedOutput::flush() {
    if (!buffer_.empty()) {
        // No partial-write recovery: a failed write discards the batch.
        try {
            sink_.write(buffer_.data(), buffer_.size());
        } catch (const std::exception&) {
            buffer_.clear();
            throw;
        }
        buffer_.clear();
    }
    sink_.flush();
}

void BufferedOutput::maybe_flush() {
    if (buffer_.size() >= flush_size_ &&
        (buffer_.back() == '\n' || buffer_.size() >= max_size_)) {
        flush();
    }
}

void BufferedOutput::append(const uint8_t* first, const uint8_t* last) {
    if (first == last) return;
    buffer_.append(reinterpret_cast<const char*>(first), static_cast<size_t>(last - first));
    maybe_flush();
}

void BufferedOutput::append(std::string_view literal) {
    if (literal.empty()) return;
    buffer_.append(literal.data(), literal.size());
    maybe_flush();
}

void BufferedOutput::put(char c) {
    buffer_.push_back(c);
    if (c == '\n' && buffer_.size() >= flush_size_) {
        flush();
    }
}

} // namespace csv2tsv
