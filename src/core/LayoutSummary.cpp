#include "stocknest/LayoutSummary.h"

#include <QHash>
#include <QStringList>

#include <algorithm>
#include <tuple>

namespace stocknest {

namespace {

QString FormatLength(double value) { return QString::number(value, 'g', 12); }

template <typename Group, typename Layout, typename KeyFunction,
          typename IndexFunction>
std::vector<Group> GroupLayouts(const std::vector<Layout>& layouts,
                                KeyFunction key_of, IndexFunction index_of,
                                std::vector<int> Group::*indices) {
  std::vector<Group> groups;
  QHash<QString, std::size_t> positions;
  for (const auto& layout : layouts) {
    const QString key = key_of(layout);
    const auto it = positions.constFind(key);
    if (it != positions.constEnd()) {
      Group& group = groups[*it];
      ++group.quantity;
      (group.*indices).push_back(index_of(layout));
      continue;
    }
    positions.insert(key, groups.size());
    Group group;
    group.layout = layout;
    group.quantity = 1;
    (group.*indices).push_back(index_of(layout));
    groups.push_back(std::move(group));
  }
  for (auto& group : groups) {
    std::sort((group.*indices).begin(), (group.*indices).end());
  }
  return groups;
}

}  // namespace

QString SheetLayoutKey(const SheetLayout& layout) {
  std::vector<const PlacedPart*> placements;
  placements.reserve(layout.placed_parts.size());
  for (const auto& placed : layout.placed_parts) {
    placements.push_back(&placed);
  }
  std::sort(placements.begin(), placements.end(),
            [](const PlacedPart* lhs, const PlacedPart* rhs) {
              return std::make_tuple(lhs->part.original_id,
                                     lhs->position.x(), lhs->position.y()) <
                     std::make_tuple(rhs->part.original_id,
                                     rhs->position.x(), rhs->position.y());
            });

  QStringList parts;
  for (const PlacedPart* placed : placements) {
    parts << QStringLiteral("%1@%2,%3%4")
                 .arg(placed->part.original_id)
                 .arg(FormatLength(placed->position.x()),
                      FormatLength(placed->position.y()),
                      placed->rotated ? QStringLiteral("R") : QString());
  }

  const SheetCapacity& sheet = layout.sheet;
  return QStringLiteral("%1x%2x%3x%4|%5")
      .arg(FormatLength(sheet.length), FormatLength(sheet.width),
           FormatLength(sheet.thickness), sheet.grade,
           parts.join(QLatin1Char(';')));
}

QString StockLayoutKey(const StockLayout& layout) {
  std::vector<Length> lengths;
  lengths.reserve(layout.cuts.size());
  for (const auto& cut : layout.cuts) {
    lengths.push_back(cut.effective_length);
  }
  std::sort(lengths.begin(), lengths.end());

  QStringList parts;
  for (Length length : lengths) {
    parts << FormatLength(length);
  }
  return layout.raw_material + QLatin1Char('|') +
         parts.join(QLatin1Char(','));
}

std::vector<SheetLayoutGroup> GroupSheetLayouts(
    const SheetNestingResult& result) {
  return GroupLayouts<SheetLayoutGroup>(
      result.layouts, &SheetLayoutKey,
      [](const SheetLayout& layout) { return layout.sheet_index; },
      &SheetLayoutGroup::sheet_indices);
}

std::vector<StockLayoutGroup> GroupStockLayouts(
    const LinearNestingResult& result) {
  std::vector<StockLayoutGroup> groups = GroupLayouts<StockLayoutGroup>(
      result.layouts, &StockLayoutKey,
      [](const StockLayout& layout) { return layout.stock_index; },
      &StockLayoutGroup::stock_indices);

  std::stable_sort(groups.begin(), groups.end(),
                   [](const StockLayoutGroup& lhs, const StockLayoutGroup& rhs) {
                     const int order = QString::compare(
                         lhs.layout.raw_material, rhs.layout.raw_material,
                         Qt::CaseInsensitive);
                     if (order != 0) {
                       return order < 0;
                     }
                     return lhs.layout.waste_percentage <
                            rhs.layout.waste_percentage;
                   });
  return groups;
}

}  // namespace stocknest
