#include "csv2tsv/driver.h"
#include "csv2tsv/chunk_reader.h"
#include "csv2tsv/mem_util.h"
#include "csv2tsv/transcoder.h"

#include <stdexcept>

namespace csv2tsv {

size_t header_skip_lines(size_t index, bool has_header) {
    return (index == 0 || !has_header) ? 0 : 1;
}

void convert_files(const std::vector<std::string>& files, const DriverOptions& options,
                   BufferedOutput& out) {
    if (options.chunk_size == 0) {
        throw std::invalid_argument("buffer size must be larger than 0");
    }

    Transcoder transcoder(options.transcode);

    // One read buffer serves every file.
    AlignedBuffer buffer(options.chunk_size, CSV2TSV_CHUNK_ALIGNMENT);

    const std::vector<std::string> stdin_only{"-"};
    const std::vector<std::string>& inputs = files.empty() ? stdin_only : files;

    for (size_t i = 0; i < inputs.size(); ++i) {
        FileSource source(inputs[i]);
        ChunkReader reader(source, buffer.data(), buffer.size());
        transcoder.transcode(reader, out, source.name(), header_skip_lines(i, options.has_header));
    }
}

} // namespace csv2tsv
