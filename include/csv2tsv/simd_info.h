#ifndef CSV2TSV_SIMD_INFO_H
#define CSV2TSV_SIMD_INFO_H

#include <string>
#include <vector>

namespace csv2tsv {

/// Name of the best SIMD target Highway selects on this CPU (e.g. "AVX2").
std::string simd_best_target();

/// All SIMD targets supported on this CPU, best first.
std::vector<std::string> simd_supported_targets();

/// One-line summary for version output, e.g. "SIMD: AVX2 (AVX2, SSE4, SSE2)".
std::string simd_summary();

} // namespace csv2tsv

#endif // CSV2TSV_SIMD_INFO_H
