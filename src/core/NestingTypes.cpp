#include "stocknest/NestingTypes.h"

namespace stocknest {

namespace {

QString FormatLength(Length value) { return QString::number(value, 'g', 12); }

}  // namespace

QString SheetCapacity::UsageKey() const {
  return QStringLiteral("%1x%2x%3-%4")
      .arg(FormatLength(length), FormatLength(width), FormatLength(thickness),
           grade);
}

int SheetNestingResult::SheetsUsed(const QString& usage_key) const {
  for (const auto& usage : sheets_used) {
    if (usage.key == usage_key) {
      return usage.count;
    }
  }
  return 0;
}

int SheetNestingResult::PlacedQuantity(int original_id) const {
  int count = 0;
  for (const auto& layout : layouts) {
    for (const auto& placed : layout.placed_parts) {
      if (placed.part.original_id == original_id) {
        ++count;
      }
    }
  }
  return count;
}

int SheetNestingResult::UnplacedQuantity(int original_id) const {
  int count = 0;
  for (const auto& part : unplaced_parts) {
    if (part.original_id == original_id) {
      count += part.quantity;
    }
  }
  return count;
}

LinearPart MakeLinearPart(int id, const QString& raw_material, Length length,
                          int quantity, Length kerf) {
  LinearPart part;
  part.id = id;
  part.raw_material = raw_material;
  part.length = length;
  part.quantity = quantity;
  part.effective_length = length + kerf;
  return part;
}

int LinearNestingResult::PlacedQuantity(int part_id) const {
  int count = 0;
  for (const auto& layout : layouts) {
    for (const auto& cut : layout.cuts) {
      if (cut.id == part_id) {
        ++count;
      }
    }
  }
  return count;
}

int LinearNestingResult::UnplacedQuantity(int part_id) const {
  int count = 0;
  for (const auto& part : unplaced_parts) {
    if (part.id == part_id) {
      count += part.quantity;
    }
  }
  return count;
}

}  // namespace stocknest
