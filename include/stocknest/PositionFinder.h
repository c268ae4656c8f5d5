#pragma once

#include "stocknest/NestingConfig.h"
#include "stocknest/NestingTypes.h"

#include <QPointF>
#include <QSizeF>

#include <optional>
#include <vector>

namespace stocknest {

struct Position {
  QPointF point;
  bool rotated {false};
};

// Bottom-left placement over corner candidates: the sheet origin plus the
// right and top corners spawned by every placed part.
class PositionFinder {
 public:
  explicit PositionFinder(const SheetNestingConfig& config);
  PositionFinder(double part_clearance, double edge_clearance,
                 bool allow_rotation);

  // Lowest y, then lowest x. The unrotated orientation is evaluated first,
  // so it wins exact ties with the rotated one.
  std::optional<Position> Find(const Part& part, const SheetCapacity& sheet,
                               const std::vector<PlacedPart>& placed) const;

  std::vector<QPointF> CandidatePoints(
      const std::vector<PlacedPart>& placed) const;

  bool CanPlace(const QSizeF& extent, const QPointF& point,
                const SheetCapacity& sheet,
                const std::vector<PlacedPart>& placed) const;

  static bool Overlaps(const QRectF& lhs, const QRectF& rhs, double gap);

  double part_clearance() const { return part_clearance_; }
  double edge_clearance() const { return edge_clearance_; }
  bool allow_rotation() const { return allow_rotation_; }

 private:
  double part_clearance_;
  double edge_clearance_;
  bool allow_rotation_;
};

}  // namespace stocknest
