/**
 * @file mem_util.h
 * @brief Portable aligned memory allocation utilities.
 *
 * Chunk buffers owned by ChunkReader are allocated here so that the Highway
 * scanner starts its block loads on a cache-line boundary. The platform
 * differences are:
 * - POSIX: posix_memalign()
 * - MSVC: _aligned_malloc() / _aligned_free()
 * - MinGW: __mingw_aligned_malloc() / __mingw_aligned_free()
 *
 * @note Memory from aligned_malloc() must be released with aligned_free(),
 *       or owned by an AlignedBuffer.
 */

#ifndef CSV2TSV_MEM_UTIL_H
#define CSV2TSV_MEM_UTIL_H

#include <stdlib.h>

#include <cstddef>
#include <cstdint>
#include <new>

namespace csv2tsv {

/**
 * @brief Allocate memory with specified alignment.
 *
 * @param alignment Required alignment in bytes (must be a power of 2).
 * @param size Number of bytes to allocate.
 * @return Pointer to the allocated memory, or nullptr if allocation fails.
 */
static inline void *aligned_malloc(size_t alignment, size_t size) {
  void *p;
#ifdef _MSC_VER
  p = _aligned_malloc(size, alignment);
#elif defined(__MINGW32__) || defined(__MINGW64__)
  p = __mingw_aligned_malloc(size, alignment);
#else
  if (posix_memalign(&p, alignment, size) != 0) { return nullptr; }
#endif
  return p;
}

/**
 * @brief Free memory allocated with aligned_malloc(). Null is a no-op.
 */
static inline void aligned_free(void *memblock) {
    if(memblock == nullptr) { return; }
#ifdef _MSC_VER
    _aligned_free(memblock);
#elif defined(__MINGW32__) || defined(__MINGW64__)
    __mingw_aligned_free(memblock);
#else
    free(memblock);
#endif
}

/**
 * @brief Move-only owner of an aligned byte buffer.
 *
 * Throws std::bad_alloc if the allocation fails.
 */
class AlignedBuffer {
public:
  AlignedBuffer() : data_(nullptr), size_(0) {}

  AlignedBuffer(size_t size, size_t alignment)
      : data_(static_cast<uint8_t*>(aligned_malloc(alignment, size == 0 ? 1 : size))),
        size_(size) {
    if (data_ == nullptr) {
      throw std::bad_alloc();
    }
  }

  AlignedBuffer(AlignedBuffer&& other) noexcept : data_(other.data_), size_(other.size_) {
    other.data_ = nullptr;
    other.size_ = 0;
  }

  AlignedBuffer& operator=(AlignedBuffer&& other) noexcept {
    if (this != &other) {
      aligned_free(data_);
      data_ = other.data_;
      size_ = other.size_;
      other.data_ = nullptr;
      other.size_ = 0;
    }
    return *this;
  }

  AlignedBuffer(const AlignedBuffer&) = delete;
  AlignedBuffer& operator=(const AlignedBuffer&) = delete;

  ~AlignedBuffer() { aligned_free(data_); }

  uint8_t* data() { return data_; }
  const uint8_t* data() const { return data_; }
  size_t size() const { return size_; }

private:
  uint8_t* data_;
  size_t size_;
};

} // namespace csv2tsv

#endif
