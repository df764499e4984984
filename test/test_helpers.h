/**
 * Test helpers for csv2tsv unit tests.
 *
 * Provides a scratch directory for file-based tests and sinks that fail on
 * demand for exercising error propagation.
 */

#ifndef CSV2TSV_TEST_HELPERS_H
#define CSV2TSV_TEST_HELPERS_H

#include "csv2tsv/output_sink.h"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <unistd.h>
#include <vector>

/**
 * RAII scratch directory under the system temp directory.
 *
 * Usage:
 *   TempDir dir("driver_test");
 *   std::string path = dir.createFile("a.csv", "x,y\n");
 *   // directory and files removed on scope exit
 */
class TempDir {
public:
  explicit TempDir(const std::string& prefix)
      : path_((std::filesystem::temp_directory_path() /
               (prefix + "_" + std::to_string(getpid())))
                  .string()) {
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }

  std::string createFile(const std::string& filename, const std::string& content) const {
    std::string file_path = path_ + "/" + filename;
    std::ofstream file(file_path, std::ios::binary);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file_path;
  }

  std::string readFile(const std::string& filename) const {
    std::ifstream file(path_ + "/" + filename, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }

private:
  std::string path_;
};

/**
 * Sink that accepts `writes_before_failure` writes, then throws ENOSPC.
 */
class FailingSink : public csv2tsv::OutputSink {
public:
  explicit FailingSink(size_t writes_before_failure = 0)
      : remaining_(writes_before_failure) {}

  void write(const char* data, size_t n) override {
    if (remaining_ == 0) {
      throw std::system_error(ENOSPC, std::generic_category(), "could not write to test sink");
    }
    --remaining_;
    received_.append(data, n);
  }

  const std::string& received() const { return received_; }

private:
  size_t remaining_;
  std::string received_;
};

/**
 * Sink that records the size of every write.
 */
class RecordingSink : public csv2tsv::OutputSink {
public:
  void write(const char* data, size_t n) override {
    writes_.push_back(n);
    str_.append(data, n);
  }
  void flush() override { ++flushes_; }

  const std::vector<size_t>& writes() const { return writes_; }
  const std::string& str() const { return str_; }
  size_t flushes() const { return flushes_; }

private:
  std::vector<size_t> writes_;
  std::string str_;
  size_t flushes_ = 0;
};

#endif // CSV2TSV_TEST_HELPERS_H
