/**
 * @file driver.h
 * @brief Converts a list of files, or standard input, to one TSV stream.
 */

#ifndef CSV2TSV_DRIVER_H
#define CSV2TSV_DRIVER_H

#include "csv2tsv/common_defs.h"
#include "csv2tsv/dialect.h"
#include "csv2tsv/output_sink.h"

#include <cstddef>
#include <string>
#include <vector>

namespace csv2tsv {

struct DriverOptions {
    TranscodeOptions transcode;

    /// Treat the first record of each file as a header; only the first
    /// file's header is written.
    bool has_header = false;

    /// Read buffer size in bytes. Must be greater than 0.
    size_t chunk_size = CSV2TSV_DEFAULT_CHUNK_SIZE;
};

/**
 * @brief Convert each file in turn, appending the TSV to out.
 *
 * An empty list reads standard input, as does the name "-". Each file gets a
 * fresh record count, and errors name the file they occurred in. Output
 * already appended for earlier files or records is left in place when a
 * later one fails.
 *
 * @throws ParseException on an improperly terminated quoted field.
 * @throws std::system_error if a file cannot be opened or read.
 * @throws std::invalid_argument for invalid options.
 */
void convert_files(const std::vector<std::string>& files, const DriverOptions& options,
                   BufferedOutput& out);

/// Records to skip for the file at position index in the list.
size_t header_skip_lines(size_t index, bool has_header);

} // namespace csv2tsv

#endif // CSV2TSV_DRIVER_H
