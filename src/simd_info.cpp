#include "csv2tsv/simd_info.h"

#include "hwy/targets.h"

namespace csv2tsv {

std::string simd_best_target() {
  int64_t targets = hwy::SupportedTargets();
  // Highway orders targets best first by bit position, so take the lowest set bit.
  int64_t best = targets & -targets;
  return hwy::TargetName(best);
}

std::vector<std::string> simd_supported_targets() {
  std::vector<std::string> names;
  for (int64_t targets = hwy::SupportedTargets(); targets != 0; targets &= targets - 1) {
    names.push_back(hwy::TargetName(targets & -targets));
  }
  return names;
}

std::string simd_summary() {
  std::string summary = "SIMD: " + simd_best_target() + " (";
  const auto targets = simd_supported_targets();
  for (size_t i = 0; i < targets.size(); ++i) {
    if (i > 0) summary += ", ";
    summary += targets[i];
  }
  summary += ")";
  return summary;
}

} // namespace csv2tsv
