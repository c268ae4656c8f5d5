#include "stocknest/PositionFinder.h"

#include <limits>

namespace stocknest {

PositionFinder::PositionFinder(const SheetNestingConfig& config)
    : PositionFinder(config.part_clearance(), config.edge_clearance(),
                     config.allow_rotation()) {}

PositionFinder::PositionFinder(double part_clearance, double edge_clearance,
                               bool allow_rotation)
    : part_clearance_(part_clearance),
      edge_clearance_(edge_clearance),
      allow_rotation_(allow_rotation) {}

bool PositionFinder::Overlaps(const QRectF& lhs, const QRectF& rhs,
                              double gap) {
  return lhs.x() < rhs.x() + rhs.width() + gap &&
         rhs.x() < lhs.x() + lhs.width() + gap &&
         lhs.y() < rhs.y() + rhs.height() + gap &&
         rhs.y() < lhs.y() + lhs.height() + gap;
}

std::vector<QPointF> PositionFinder::CandidatePoints(
    const std::vector<PlacedPart>& placed) const {
  std::vector<QPointF> points;
  points.reserve(1 + placed.size() * 2);
  points.emplace_back(edge_clearance_, edge_clearance_);
  for (const auto& other : placed) {
    const QPointF& origin = other.position;
    points.emplace_back(origin.x() + other.ExtentX() + part_clearance_,
                        origin.y());
    points.emplace_back(origin.x(),
                        origin.y() + other.ExtentY() + part_clearance_);
  }
  return points;
}

bool PositionFinder::CanPlace(const QSizeF& extent, const QPointF& point,
                              const SheetCapacity& sheet,
                              const std::vector<PlacedPart>& placed) const {
  if (point.x() < edge_clearance_ || point.y() < edge_clearance_) {
    return false;
  }
  if (point.x() + extent.width() > sheet.length - edge_clearance_) {
    return false;
  }
  if (point.y() + extent.height() > sheet.width - edge_clearance_) {
    return false;
  }

  const QRectF candidate(point, extent);
  for (const auto& other : placed) {
    if (Overlaps(candidate, other.Footprint(), part_clearance_)) {
      return false;
    }
  }
  return true;
}

std::optional<Position> PositionFinder::Find(
    const Part& part, const SheetCapacity& sheet,
    const std::vector<PlacedPart>& placed) const {
  std::optional<Position> best;
  double best_x = std::numeric_limits<double>::infinity();
  double best_y = std::numeric_limits<double>::infinity();

  const std::vector<QPointF> points = CandidatePoints(placed);
  const auto try_orientation = [&](const QSizeF& extent, bool rotated) {
    for (const auto& point : points) {
      if (!CanPlace(extent, point, sheet, placed)) {
        continue;
      }
      if (point.y() < best_y || (point.y() == best_y && point.x() < best_x)) {
        best_x = point.x();
        best_y = point.y();
        best = Position {point, rotated};
      }
    }
  };

  try_orientation(QSizeF(part.width, part.length), false);
  if (allow_rotation_) {
    try_orientation(QSizeF(part.length, part.width), true);
  }
  return best;
}

}  // namespace stocknest
