#include "stocknest/SheetPacker.h"

#include "stocknest/Logging.h"
#include "stocknest/OrderedGroups.h"
#include "stocknest/Validation.h"

#include <algorithm>
#include <cmath>
#include <map>

namespace stocknest {

namespace {

struct MaterialKey {
  QString grade;
  Length thickness {0.0};

  bool operator<(const MaterialKey& other) const {
    if (grade != other.grade) {
      return grade < other.grade;
    }
    return thickness < other.thickness;
  }
};

bool Matches(const SheetCapacity& sheet, const QString& grade,
             Length thickness) {
  return sheet.grade == grade && AlmostEqual(sheet.thickness, thickness);
}

// Thicknesses within tolerance of an earlier key share that key, so grouping
// and sheet matching agree.
MaterialKey CanonicalKey(std::vector<MaterialKey>* seen, const Part& part) {
  for (const auto& key : *seen) {
    if (key.grade == part.grade && AlmostEqual(key.thickness, part.thickness)) {
      return key;
    }
  }
  seen->push_back(MaterialKey {part.grade, part.thickness});
  return seen->back();
}

// mm^2 x mm x kg/m^3 -> kg
double AreaToWeight(double area, Length thickness, double density) {
  return (area / 1000000.0) * thickness * density / 1000.0;
}

void RecordUsage(std::vector<SheetUsage>* usage, const QString& key) {
  for (auto& entry : *usage) {
    if (entry.key == key) {
      ++entry.count;
      return;
    }
  }
  usage->push_back(SheetUsage {key, 1});
}

InstanceId NextInstance(const SheetLayout& layout, int part_id) {
  int next = 0;
  for (const auto& placed : layout.placed_parts) {
    if (placed.instance.part_id == part_id) {
      next = std::max(next, placed.instance.index + 1);
    }
  }
  return InstanceId {part_id, next};
}

}  // namespace

SheetPacker::SheetPacker(const SheetNestingConfig& config)
    : config_(config), finder_(config) {}

double SheetPacker::DensityFor(const QString& grade) const {
  if (density_lookup_) {
    const std::optional<double> density = density_lookup_(grade);
    if (density && std::isfinite(*density) && *density > 0.0) {
      return *density;
    }
  }
  return config_.default_density();
}

std::vector<SheetPacker::PartInstance> SheetPacker::ExpandInstances(
    const std::vector<Part>& rows) {
  std::vector<PartInstance> instances;
  std::map<int, int> next_index;
  for (const auto& row : rows) {
    int& index = next_index[row.id];
    for (int i = 0; i < row.quantity; ++i) {
      Part unit = row;
      unit.quantity = 1;
      instances.push_back(PartInstance {unit, InstanceId {row.id, index++}});
    }
  }
  return instances;
}

void SheetPacker::SortByAreaDescending(std::vector<PartInstance>* pool) {
  std::stable_sort(pool->begin(), pool->end(),
                   [](const PartInstance& lhs, const PartInstance& rhs) {
                     return lhs.part.Area() > rhs.part.Area();
                   });
}

std::vector<Part> SheetPacker::ConsolidateUnplaced(
    const std::vector<Part>& parts) {
  std::vector<Part> consolidated;
  for (const auto& part : parts) {
    if (part.quantity <= 0) {
      continue;
    }
    auto existing = std::find_if(consolidated.begin(), consolidated.end(),
                                 [&part](const Part& entry) {
                                   return entry.original_id == part.original_id;
                                 });
    if (existing != consolidated.end()) {
      existing->quantity += part.quantity;
    } else {
      consolidated.push_back(part);
    }
  }
  return consolidated;
}

void SheetPacker::UpdateMetrics(SheetLayout* layout) const {
  const double sheet_area = layout->sheet.Area();
  double used_area = 0.0;
  for (const auto& placed : layout->placed_parts) {
    used_area += placed.part.Area();
  }
  layout->used_area = used_area;
  layout->waste_area = sheet_area - used_area;
  layout->waste_percentage =
      sheet_area > 0.0 ? (layout->waste_area / sheet_area) * 100.0 : 0.0;

  const double density = DensityFor(layout->sheet.grade);
  layout->used_weight =
      AreaToWeight(layout->used_area, layout->sheet.thickness, density);
  layout->waste_weight =
      AreaToWeight(layout->waste_area, layout->sheet.thickness, density);
}

void SheetPacker::UpdateTotals(SheetNestingResult* result) {
  result->total_used_area = 0.0;
  result->total_sheet_area = 0.0;
  result->total_used_weight = 0.0;
  result->total_waste_weight = 0.0;
  for (const auto& layout : result->layouts) {
    result->total_used_area += layout.used_area;
    result->total_sheet_area += layout.sheet.Area();
    result->total_used_weight += layout.used_weight;
    result->total_waste_weight += layout.waste_weight;
  }
  result->total_waste_percentage =
      result->total_sheet_area > 0.0
          ? ((result->total_sheet_area - result->total_used_area) /
             result->total_sheet_area) * 100.0
          : 0.0;
}

SheetNestingResult SheetPacker::Pack(const std::vector<SheetCapacity>& sheets,
                                     const std::vector<Part>& parts) const {
  ValidateSheetInput(sheets, parts);

  SheetNestingResult result;
  std::vector<Part> unplaced;

  OrderedGroups<MaterialKey, Part> groups;
  std::vector<MaterialKey> seen_keys;
  for (const auto& part : parts) {
    groups.Add(CanonicalKey(&seen_keys, part), part);
  }

  // Supply is shared by every group a definition serves.
  std::map<const SheetCapacity*, int> used_by_definition;

  for (const auto& group : groups.groups()) {
    const MaterialKey& key = group.first;

    std::vector<const SheetCapacity*> definitions;
    for (const auto& sheet : sheets) {
      if (Matches(sheet, key.grade, key.thickness)) {
        definitions.push_back(&sheet);
      }
    }

    if (definitions.empty()) {
      qCWarning(lcSheetPacker) << "no sheet definition for grade" << key.grade
                               << "thickness" << key.thickness;
      unplaced.insert(unplaced.end(), group.second.begin(),
                      group.second.end());
      continue;
    }

    std::vector<PartInstance> pool = ExpandInstances(group.second);
    SortByAreaDescending(&pool);

    for (const SheetCapacity* definition : definitions) {
      if (pool.empty()) {
        break;
      }

      int& used = used_by_definition[definition];
      while (!pool.empty() &&
             (definition->unlimited() || used < *definition->quantity)) {
        SheetLayout layout;
        layout.sheet = *definition;

        std::vector<PartInstance> remaining;
        for (auto& entry : pool) {
          const std::optional<Position> position =
              finder_.Find(entry.part, layout.sheet, layout.placed_parts);
          if (position) {
            layout.placed_parts.push_back(PlacedPart {
                entry.part, entry.instance, position->point,
                position->rotated});
          } else {
            remaining.push_back(std::move(entry));
          }
        }

        if (layout.placed_parts.empty()) {
          // Nothing left fits on a fresh sheet of this type.
          pool = std::move(remaining);
          break;
        }

        pool = std::move(remaining);
        SortByAreaDescending(&pool);
        ++used;

        UpdateMetrics(&layout);
        layout.sheet_index = static_cast<int>(result.layouts.size()) + 1;
        qCDebug(lcSheetPacker)
            << "sheet" << layout.sheet_index << definition->UsageKey()
            << "placed" << layout.placed_parts.size() << "waste"
            << layout.waste_percentage << "%";
        RecordUsage(&result.sheets_used, definition->UsageKey());
        result.layouts.push_back(std::move(layout));
      }
    }

    if (!pool.empty()) {
      qCWarning(lcSheetPacker) << pool.size() << "instance(s) of grade"
                               << key.grade << "thickness" << key.thickness
                               << "could not be placed";
      for (const auto& entry : pool) {
        unplaced.push_back(entry.part);
      }
    }
  }

  result.unplaced_parts = ConsolidateUnplaced(unplaced);
  UpdateTotals(&result);
  return result;
}

int SheetPacker::FillLayout(SheetLayout* layout,
                            std::vector<Part>* fillers) const {
  if (!layout || !fillers) {
    return 0;
  }
  for (const auto& filler : *fillers) {
    ValidatePart(filler);
  }

  std::vector<Part*> compatible;
  for (auto& filler : *fillers) {
    if (Matches(layout->sheet, filler.grade, filler.thickness)) {
      compatible.push_back(&filler);
    }
  }
  std::stable_sort(compatible.begin(), compatible.end(),
                   [](const Part* lhs, const Part* rhs) {
                     return lhs->Area() > rhs->Area();
                   });

  int placed_count = 0;
  bool placed_in_pass = !compatible.empty();
  while (placed_in_pass) {
    placed_in_pass = false;
    for (Part* filler : compatible) {
      if (filler->quantity <= 0) {
        continue;
      }
      const std::optional<Position> position =
          finder_.Find(*filler, layout->sheet, layout->placed_parts);
      if (!position) {
        continue;
      }
      Part unit = *filler;
      unit.quantity = 1;
      layout->placed_parts.push_back(PlacedPart {
          unit, NextInstance(*layout, filler->id), position->point,
          position->rotated});
      --filler->quantity;
      ++placed_count;
      placed_in_pass = true;
      break;
    }
  }

  if (placed_count > 0) {
    UpdateMetrics(layout);
    qCDebug(lcSheetPacker) << "filled sheet" << layout->sheet_index << "with"
                           << placed_count << "extra part(s)";
  }
  return placed_count;
}

}  // namespace stocknest
