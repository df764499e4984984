#include "csv2tsv/io_util.h"

#include <cerrno>
#include <system_error>

namespace csv2tsv {

bool is_stdin_input(const std::string& filename) {
    return filename == "-";
}

std::string display_name(const std::string& filename) {
    return is_stdin_input(filename) ? "stdin" : filename;
}

void throw_io_error(const std::string& what) {
    // Some libc paths leave errno at 0 on a short write; report EIO then.
    int err = errno != 0 ? errno : EIO;
    throw std::system_error(err, std::generic_category(), what);
}

FilePtr open_for_read(const std::string& filename) {
    errno = 0;
    FilePtr fp(std::fopen(filename.c_str(), "rb"));
    if (!fp) {
        throw_io_error("could not open " + filename);
    }
    return fp;
}

FilePtr open_for_write(const std::string& filename) {
    errno = 0;
    FilePtr fp(std::fopen(filename.c_str(), "wb"));
    if (!fp) {
        throw_io_error("could not open " + filename + " for writing");
    }
    return fp;
}

} // namespace csv2tsv
