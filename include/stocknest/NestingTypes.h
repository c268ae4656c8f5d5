#pragma once

#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

#include <cmath>
#include <functional>
#include <optional>
#include <vector>

namespace stocknest {

using Length = double;

constexpr double kTolerance = 1e-9;
constexpr double kDefaultDensity = 7850.0;

inline bool AlmostEqual(double lhs, double rhs, double tolerance = kTolerance) {
  return std::abs(lhs - rhs) <= tolerance;
}

// Grade -> density (kg/m^3). An empty optional means "unknown grade".
using DensityLookup = std::function<std::optional<double>(const QString&)>;

// Sub-identifier of one unit expanded from a quantity > 1 row.
struct InstanceId {
  int part_id {0};
  int index {0};

  QString ToString() const {
    return QStringLiteral("%1-%2").arg(part_id).arg(index);
  }

  bool operator==(const InstanceId& other) const {
    return part_id == other.part_id && index == other.index;
  }
  bool operator!=(const InstanceId& other) const { return !(*this == other); }
  bool operator<(const InstanceId& other) const {
    if (part_id != other.part_id) {
      return part_id < other.part_id;
    }
    return index < other.index;
  }
};

// --- Sheet nesting ---

struct Part {
  int id {0};
  int original_id {0};
  QString name;
  Length length {0.0};
  Length width {0.0};
  Length thickness {0.0};
  QString grade;
  int quantity {0};

  double Area() const { return length * width; }
};

struct SheetCapacity {
  QString id;
  Length length {0.0};
  Length width {0.0};
  Length thickness {0.0};
  QString grade;
  std::optional<int> quantity;

  double Area() const { return length * width; }
  bool unlimited() const { return !quantity.has_value(); }
  QString UsageKey() const;
};

struct PlacedPart {
  Part part;
  InstanceId instance;
  QPointF position;
  bool rotated {false};

  Length ExtentX() const { return rotated ? part.length : part.width; }
  Length ExtentY() const { return rotated ? part.width : part.length; }
  QRectF Footprint() const {
    return QRectF(position, QSizeF(ExtentX(), ExtentY()));
  }
};

struct SheetLayout {
  SheetCapacity sheet;
  int sheet_index {0};
  std::vector<PlacedPart> placed_parts;
  double used_area {0.0};
  double waste_area {0.0};
  double waste_percentage {0.0};
  double used_weight {0.0};
  double waste_weight {0.0};
};

struct SheetUsage {
  QString key;
  int count {0};
};

struct SheetNestingResult {
  std::vector<SheetLayout> layouts;
  std::vector<Part> unplaced_parts;
  std::vector<SheetUsage> sheets_used;
  double total_used_area {0.0};
  double total_sheet_area {0.0};
  double total_used_weight {0.0};
  double total_waste_weight {0.0};
  double total_waste_percentage {0.0};

  int SheetsUsed(const QString& usage_key) const;
  int PlacedQuantity(int original_id) const;
  int UnplacedQuantity(int original_id) const;
};

// --- Linear nesting ---

struct LinearPart {
  int id {0};
  QString raw_material;
  Length length {0.0};
  int quantity {0};
  Length effective_length {0.0};
};

LinearPart MakeLinearPart(int id, const QString& raw_material, Length length,
                          int quantity, Length kerf);

struct CutInstance {
  int id {0};
  Length length {0.0};
  Length effective_length {0.0};
  InstanceId instance;
  QString raw_material;
};

struct StockLayout {
  int stock_index {0};
  Length stock_length {0.0};
  std::vector<CutInstance> cuts;
  Length used_length {0.0};
  Length waste_length {0.0};
  double waste_percentage {0.0};
  QString raw_material;
};

struct LinearNestingResult {
  std::vector<StockLayout> layouts;
  std::vector<LinearPart> unplaced_parts;
  int total_stock_used {0};
  Length total_waste {0.0};
  double total_waste_percentage {0.0};

  int PlacedQuantity(int part_id) const;
  int UnplacedQuantity(int part_id) const;
};

}  // namespace stocknest
