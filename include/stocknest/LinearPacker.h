#pragma once

#include "stocknest/NestingConfig.h"
#include "stocknest/NestingTypes.h"

#include <cstdint>
#include <random>
#include <vector>

namespace stocknest {

// One-dimensional cutting stock: fills bars one at a time from a
// first-fit-decreasing baseline, optionally improved by shuffled restarts.
class LinearPacker {
 public:
  struct BarSelection {
    std::vector<CutInstance> cuts;
    Length used_length {0.0};
    Length waste {0.0};
  };

  explicit LinearPacker(const LinearNestingConfig& config);
  LinearPacker(const LinearNestingConfig& config, std::mt19937 random);

  const LinearNestingConfig& config() const { return config_; }

  void Seed(std::uint32_t seed) { random_.seed(seed); }

  // Throws std::invalid_argument for malformed parts.
  LinearNestingResult Pack(const std::vector<LinearPart>& parts);

  // Greedy accumulation over |ordered|: every instance that still fits is
  // taken, the others are skipped.
  static BarSelection Accumulate(const std::vector<CutInstance>& ordered,
                                 Length usable_length);
  static BarSelection FirstFitDecreasing(std::vector<CutInstance> pool,
                                         Length usable_length);

  // Best bar for |pool| under the configured goal. Never worse than the
  // first-fit-decreasing baseline.
  BarSelection SelectBar(const std::vector<CutInstance>& pool,
                         Length usable_length);

 private:
  static std::mt19937 MakeEngine(std::uint32_t seed);
  static std::vector<CutInstance> ExpandInstances(const LinearPart& part,
                                                  int first_index);
  static std::vector<LinearPart> ConsolidateUnplaced(
      const std::vector<LinearPart>& parts);

  void UpdateMetrics(StockLayout* layout) const;

  LinearNestingConfig config_;
  std::mt19937 random_;
};

}  // namespace stocknest
