#pragma once

#include "stocknest/NestingConfig.h"
#include "stocknest/NestingTypes.h"
#include "stocknest/PositionFinder.h"

#include <utility>
#include <vector>

namespace stocknest {

class SheetPacker {
 public:
  explicit SheetPacker(const SheetNestingConfig& config);

  const SheetNestingConfig& config() const { return config_; }
  const PositionFinder& finder() const { return finder_; }

  void set_density_lookup(DensityLookup lookup) {
    density_lookup_ = std::move(lookup);
  }

  // Throws std::invalid_argument for malformed sheets or parts; otherwise
  // every part ends up either placed or in unplaced_parts.
  SheetNestingResult Pack(const std::vector<SheetCapacity>& sheets,
                          const std::vector<Part>& parts) const;

  // Places extra units of |fillers| into the free space of an existing
  // layout, largest first. Quantities in |fillers| are decremented for every
  // unit placed. Returns the number of units placed.
  int FillLayout(SheetLayout* layout, std::vector<Part>* fillers) const;

  void UpdateMetrics(SheetLayout* layout) const;
  double DensityFor(const QString& grade) const;

  static void UpdateTotals(SheetNestingResult* result);

 private:
  struct PartInstance {
    Part part;
    InstanceId instance;
  };

  static std::vector<PartInstance> ExpandInstances(
      const std::vector<Part>& rows);
  static void SortByAreaDescending(std::vector<PartInstance>* pool);
  static std::vector<Part> ConsolidateUnplaced(const std::vector<Part>& parts);

  SheetNestingConfig config_;
  PositionFinder finder_;
  DensityLookup density_lookup_;
};

}  // namespace stocknest
