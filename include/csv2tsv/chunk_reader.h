/**
 * @file chunk_reader.h
 * @brief Chunk-at-a-time reading of files, standard input and in-memory data.
 *
 * A ChunkReader repeatedly fills one fixed-capacity buffer from a ByteSource
 * and hands it out as a mutable Chunk. Every chunk is full except possibly
 * the last. The same storage is reused for every chunk, so a Chunk is only
 * valid until the next call to next().
 *
 * @code
 * csv2tsv::FileSource source("data.csv");
 * csv2tsv::ChunkReader reader(source, 64 * 1024);
 * for (csv2tsv::Chunk chunk : reader) {
 *     // chunk.data[0 .. chunk.size) may be modified in place
 * }
 * @endcode
 */

#ifndef CSV2TSV_CHUNK_READER_H
#define CSV2TSV_CHUNK_READER_H

#include "csv2tsv/io_util.h"
#include "csv2tsv/mem_util.h"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>

namespace csv2tsv {

/**
 * @brief Abstract producer of bytes.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to n bytes into dst.
     *
     * Returns fewer than n bytes only when the source is exhausted; returns 0
     * once it is exhausted.
     *
     * @throws std::system_error on a read failure.
     */
    virtual size_t read(uint8_t* dst, size_t n) = 0;

    /// Name used in diagnostics.
    virtual std::string name() const = 0;
};

/**
 * @brief ByteSource over a C stdio stream. Consumed once.
 */
class FileSource : public ByteSource {
public:
    /// Opens the named file; "-" reads standard input.
    explicit FileSource(const std::string& filename);

    /// Reads a stream owned by the caller (e.g. stdin).
    FileSource(std::FILE* fp, std::string name);

    size_t read(uint8_t* dst, size_t n) override;
    std::string name() const override { return name_; }

private:
    FilePtr owned_;
    std::FILE* fp_;
    std::string name_;
};

/**
 * @brief ByteSource over bytes held in memory.
 *
 * The bytes are copied into the reader's chunk buffer, never modified in
 * place, so the same data can be read again after rewind() or by a new
 * MemorySource.
 */
class MemorySource : public ByteSource {
public:
    MemorySource(const uint8_t* data, size_t size, std::string name = "(memory)");
    explicit MemorySource(std::string_view data, std::string name = "(memory)");

    size_t read(uint8_t* dst, size_t n) override;
    std::string name() const override { return name_; }

    /// Restart from the first byte.
    void rewind() { pos_ = 0; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
    std::string name_;
};

/**
 * @brief One mutable slice of input.
 */
struct Chunk {
    uint8_t* data = nullptr;
    size_t size = 0;

    uint8_t* begin() const { return data; }
    uint8_t* end() const { return data + size; }
    bool empty() const { return size == 0; }
};

class ChunkReader;

/**
 * @brief Input iterator over the chunks of a ChunkReader.
 */
class ChunkIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Chunk;
    using difference_type = std::ptrdiff_t;
    using pointer = const Chunk*;
    using reference = const Chunk&;

    ChunkIterator();
    explicit ChunkIterator(ChunkReader* reader);

    reference operator*() const;
    pointer operator->() const;
    ChunkIterator& operator++();

    bool operator==(const ChunkIterator& other) const;
    bool operator!=(const ChunkIterator& other) const;

private:
    ChunkReader* reader_;
    bool at_end_;
};

/**
 * @brief Reads a ByteSource into a reusable fixed-capacity buffer.
 */
class ChunkReader {
public:
    /**
     * @brief Reader with internally allocated, cache-line aligned storage.
     * @throws std::invalid_argument if capacity is 0.
     */
    ChunkReader(ByteSource& source, size_t capacity);

    /**
     * @brief Reader using caller-supplied storage of at least capacity bytes.
     * @throws std::invalid_argument if buffer is null or capacity is 0.
     */
    ChunkReader(ByteSource& source, uint8_t* buffer, size_t capacity);

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    /// Fill the buffer with the next chunk. Returns false once the source is exhausted.
    bool next();

    /// The most recent chunk; empty before the first next() and after the end.
    const Chunk& chunk() const { return chunk_; }

    size_t capacity() const { return capacity_; }
    size_t chunks_read() const { return chunks_read_; }
    uint64_t bytes_read() const { return bytes_read_; }
    bool eof() const { return eof_; }

    ChunkIterator begin() { return ChunkIterator(this); }
    ChunkIterator end() { return ChunkIterator(); }

private:
    ByteSource& source_;
    AlignedBuffer owned_;
    uint8_t* buffer_;
    size_t capacity_;
    Chunk chunk_;
    size_t chunks_read_ = 0;
    uint64_t bytes_read_ = 0;
    bool eof_ = false;
};

} // namespace csv2tsv

#endif // CSV2TSV_CHUNK_READER_H
