#pragma once

#include "stocknest/NestingTypes.h"

#include <QString>

#include <vector>

namespace stocknest {

struct SheetLayoutGroup {
  SheetLayout layout;
  int quantity {0};
  std::vector<int> sheet_indices;
};

struct StockLayoutGroup {
  StockLayout layout;
  int quantity {0};
  std::vector<int> stock_indices;
};

// Layouts cut from the same sheet definition with the same placements
// (original id, position, rotation) collapse into one group, first-seen order.
std::vector<SheetLayoutGroup> GroupSheetLayouts(
    const SheetNestingResult& result);

// Bars of the same raw material with the same effective cut lengths collapse
// into one group, ordered by raw material then waste percentage.
std::vector<StockLayoutGroup> GroupStockLayouts(
    const LinearNestingResult& result);

QString SheetLayoutKey(const SheetLayout& layout);
QString StockLayoutKey(const StockLayout& layout);

}  // namespace stocknest
