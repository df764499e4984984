/**
 * @file io_util.h
 * @brief File handle utilities shared by the byte sources and output sinks.
 *
 * Input is never loaded whole: files are opened here and then read a chunk
 * at a time through ChunkReader. "-" names standard input throughout.
 */

#ifndef CSV2TSV_IO_UTIL_H
#define CSV2TSV_IO_UTIL_H

#include <cstdio>
#include <memory>
#include <string>

namespace csv2tsv {

/// Closes a FILE* on destruction. Never used for stdin/stdout.
struct FileCloser {
    void operator()(std::FILE* fp) const {
        if (fp != nullptr) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

/// True for "-", the conventional name for standard input.
bool is_stdin_input(const std::string& filename);

/// Name used in diagnostics: "stdin" for "-", otherwise the file name.
std::string display_name(const std::string& filename);

/**
 * @brief Open a file for binary reading.
 *
 * @throws std::system_error carrying errno and the file name if the file
 *         cannot be opened.
 */
FilePtr open_for_read(const std::string& filename);

/**
 * @brief Open a file for binary writing, truncating it.
 *
 * @throws std::system_error carrying errno and the file name on failure.
 */
FilePtr open_for_write(const std::string& filename);

/**
 * @brief Throw the std::system_error for a failed operation on a stream.
 *
 * @param what Operation description, e.g. "could not read from input.csv".
 */
[[noreturn]] void throw_io_error(const std::string& what);

} // namespace csv2tsv

#endif
