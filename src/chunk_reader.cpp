/**
 * @file chunk_reader.cpp
 * @brief Implementation of the chunked byte sources.
 */

#include "csv2tsv/chunk_reader.h"
#include "csv2tsv/common_defs.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace csv2tsv {

//-----------------------------------------------------------------------------
// FileSource implementation
//-----------------------------------------------------------------------------

FileSource::FileSource(const std::string& filename)
    : fp_(nullptr), name_(display_name(filename)) {
    if (is_stdin_input(filename)) {
        fp_ = stdin;
    } else {
        owned_ = open_for_read(filename);
        fp_ = owned_.get();
    }
}

FileSource::FileSource(std::FILE* fp, std::string name)
    : fp_(fp), name_(std::move(name)) {}

size_t FileSource::read(uint8_t* dst, size_t n) {
    errno = 0;
    size_t bytes_read = std::fread(dst, 1, n, fp_);
    if (bytes_read < n && std::ferror(fp_)) {
        throw_io_error("could not read from " + name_);
    }
    return bytes_read;
}

//-----------------------------------------------------------------------------
// MemorySource implementation
//-----------------------------------------------------------------------------

MemorySource::MemorySource(const uint8_t* data, size_t size, std::string name)
    : data_(data), size_(size), name_(std::move(name)) {}

MemorySource::MemorySource(std::string_view data, std::string name)
    : data_(reinterpret_cast<const uint8_t*>(data.data())), size_(data.size()),
      name_(std::move(name)) {}

size_t MemorySource::read(uint8_t* dst, size_t n) {
    size_t len = std::min(n, size_ - pos_);
    if (len > 0) {
        std::memcpy(dst, data_ + pos_, len);
        pos_ += len;
    }
    return len;
}

//-----------------------------------------------------------------------------
// ChunkReader implementation
//-----------------------------------------------------------------------------

ChunkReader::ChunkReader(ByteSource& source, size_t capacity)
    : source_(source), buffer_(nullptr), capacity_(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("buffer size must be larger than 0");
    }
    owned_ = AlignedBuffer(capacity, CSV2TSV_CHUNK_ALIGNMENT);
    buffer_ = owned_.data();
}

ChunkReader::ChunkReader(ByteSource& source, uint8_t* buffer, size_t capacity)
    : source_(source), buffer_(buffer), capacity_(capacity) {
    if (buffer == nullptr || capacity == 0) {
        throw std::invalid_argument("buffer size must be larger than 0");
    }
}

bool ChunkReader::next() {
    if (eof_) {
        chunk_ = Chunk{};
        return false;
    }

    size_t n = source_.read(buffer_, capacity_);
    if (n == 0) {
        eof_ = true;
        chunk_ = Chunk{};
        return false;
    }

    // A short read means the source is exhausted; skip the extra zero-length read.
    if (n < capacity_) {
        eof_ = true;
    }

    chunk_ = Chunk{buffer_, n};
    ++chunks_read_;
    bytes_read_ += n;
    return true;
}

//-----------------------------------------------------------------------------
// ChunkIterator implementation
//-----------------------------------------------------------------------------

ChunkIterator::ChunkIterator() : reader_(nullptr), at_end_(true) {}

ChunkIterator::ChunkIterator(ChunkReader* reader) : reader_(reader), at_end_(false) {
    if (reader_ == nullptr || !reader_->next()) {
        at_end_ = true;
    }
}

ChunkIterator::reference ChunkIterator::operator*() const {
    return reader_->chunk();
}

ChunkIterator::pointer ChunkIterator::operator->() const {
    return &reader_->chunk();
}

ChunkIterator& ChunkIterator::operator++() {
    if (reader_ && !reader_->next()) {
        at_end_ = true;
    }
    return *this;
}

bool ChunkIterator::operator==(const ChunkIterator& other) const {
    if (at_end_ && other.at_end_) return true;
    if (at_end_ || other.at_end_) return false;
    return reader_ == other.reader_;
}

bool ChunkIterator::operator!=(const ChunkIterator& other) const {
    return !(*this == other);
}

} // namespace csv2tsv
