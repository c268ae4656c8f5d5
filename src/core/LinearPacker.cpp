#include "stocknest/LinearPacker.h"

#include "stocknest/Logging.h"
#include "stocknest/OrderedGroups.h"
#include "stocknest/Validation.h"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace stocknest {

LinearPacker::LinearPacker(const LinearNestingConfig& config)
    : LinearPacker(config, MakeEngine(config.random_seed())) {}

LinearPacker::LinearPacker(const LinearNestingConfig& config,
                           std::mt19937 random)
    : config_(config), random_(std::move(random)) {}

std::mt19937 LinearPacker::MakeEngine(std::uint32_t seed) {
  if (seed == 0) {
    return std::mt19937(std::random_device {}());
  }
  return std::mt19937(seed);
}

std::vector<CutInstance> LinearPacker::ExpandInstances(const LinearPart& part,
                                                       int first_index) {
  std::vector<CutInstance> instances;
  instances.reserve(static_cast<std::size_t>(std::max(0, part.quantity)));
  for (int i = 0; i < part.quantity; ++i) {
    instances.push_back(CutInstance {part.id, part.length,
                                     part.effective_length,
                                     InstanceId {part.id, first_index + i},
                                     part.raw_material});
  }
  return instances;
}

std::vector<LinearPart> LinearPacker::ConsolidateUnplaced(
    const std::vector<LinearPart>& parts) {
  std::vector<LinearPart> consolidated;
  for (const auto& part : parts) {
    if (part.quantity <= 0) {
      continue;
    }
    auto existing = std::find_if(consolidated.begin(), consolidated.end(),
                                 [&part](const LinearPart& entry) {
                                   return entry.id == part.id;
                                 });
    if (existing != consolidated.end()) {
      existing->quantity += part.quantity;
    } else {
      consolidated.push_back(part);
    }
  }
  return consolidated;
}

LinearPacker::BarSelection LinearPacker::Accumulate(
    const std::vector<CutInstance>& ordered, Length usable_length) {
  BarSelection selection;
  for (const auto& cut : ordered) {
    if (selection.used_length + cut.effective_length <= usable_length) {
      selection.cuts.push_back(cut);
      selection.used_length += cut.effective_length;
    }
  }
  selection.waste = usable_length - selection.used_length;
  return selection;
}

LinearPacker::BarSelection LinearPacker::FirstFitDecreasing(
    std::vector<CutInstance> pool, Length usable_length) {
  std::stable_sort(pool.begin(), pool.end(),
                   [](const CutInstance& lhs, const CutInstance& rhs) {
                     return lhs.effective_length > rhs.effective_length;
                   });
  return Accumulate(pool, usable_length);
}

LinearPacker::BarSelection LinearPacker::SelectBar(
    const std::vector<CutInstance>& pool, Length usable_length) {
  BarSelection best = FirstFitDecreasing(pool, usable_length);
  if (config_.optimization_goal() != OptimizationGoal::kMinimizeWaste ||
      pool.size() < 2) {
    return best;
  }

  // Each trial reshuffles the previous trial's order.
  std::vector<CutInstance> shuffled = pool;
  for (int i = 0; i < config_.search_iterations(); ++i) {
    std::shuffle(shuffled.begin(), shuffled.end(), random_);
    BarSelection trial = Accumulate(shuffled, usable_length);
    if (trial.waste < best.waste) {
      best = std::move(trial);
    }
  }
  return best;
}

void LinearPacker::UpdateMetrics(StockLayout* layout) const {
  Length used = 0.0;
  for (const auto& cut : layout->cuts) {
    used += cut.effective_length;
  }
  layout->used_length = used;
  layout->waste_length = layout->stock_length - used;
  layout->waste_percentage =
      layout->stock_length > 0.0
          ? (layout->waste_length / layout->stock_length) * 100.0
          : 0.0;
}

LinearNestingResult LinearPacker::Pack(const std::vector<LinearPart>& parts) {
  ValidateLinearInput(parts);

  const Length usable_length = config_.usable_length();
  LinearNestingResult result;
  std::vector<LinearPart> unplaced;

  OrderedGroups<QString, LinearPart> groups;
  for (const auto& part : parts) {
    groups.Add(part.raw_material, part);
  }

  for (const auto& group : groups.groups()) {
    const QString& raw_material = group.first;
    const std::vector<LinearPart>& rows = group.second;

    std::vector<CutInstance> pool;
    std::map<int, int> next_index;
    for (const auto& part : rows) {
      if (part.effective_length > usable_length) {
        qCWarning(lcLinearPacker)
            << "part" << part.id << "needs" << part.effective_length
            << "but only" << usable_length << "is usable";
        unplaced.push_back(part);
        continue;
      }
      int& first_index = next_index[part.id];
      const std::vector<CutInstance> instances =
          ExpandInstances(part, first_index);
      first_index += static_cast<int>(instances.size());
      pool.insert(pool.end(), instances.begin(), instances.end());
    }

    while (!pool.empty()) {
      BarSelection bar = SelectBar(pool, usable_length);

      if (bar.cuts.empty()) {
        qCWarning(lcLinearPacker) << pool.size() << "cut(s) of" << raw_material
                                  << "fit no bar";
        for (const auto& cut : pool) {
          const auto row = std::find_if(
              rows.begin(), rows.end(),
              [&cut](const LinearPart& part) { return part.id == cut.id; });
          LinearPart remainder = row != rows.end() ? *row : LinearPart();
          remainder.id = cut.id;
          remainder.quantity = 1;
          unplaced.push_back(remainder);
        }
        break;
      }

      StockLayout layout;
      layout.stock_index = static_cast<int>(result.layouts.size()) + 1;
      layout.stock_length = config_.stock_length();
      layout.raw_material = raw_material;
      layout.cuts = std::move(bar.cuts);
      UpdateMetrics(&layout);

      std::set<InstanceId> consumed;
      for (const auto& cut : layout.cuts) {
        consumed.insert(cut.instance);
      }
      pool.erase(std::remove_if(pool.begin(), pool.end(),
                                [&consumed](const CutInstance& cut) {
                                  return consumed.count(cut.instance) > 0;
                                }),
                 pool.end());

      qCDebug(lcLinearPacker) << "bar" << layout.stock_index << raw_material
                              << "cuts" << layout.cuts.size() << "waste"
                              << layout.waste_length;
      result.layouts.push_back(std::move(layout));
    }
  }

  result.unplaced_parts = ConsolidateUnplaced(unplaced);
  result.total_stock_used = static_cast<int>(result.layouts.size());
  result.total_waste = 0.0;
  for (const auto& layout : result.layouts) {
    result.total_waste += layout.waste_length;
  }
  const Length total_stock_length =
      result.total_stock_used * config_.stock_length();
  result.total_waste_percentage =
      total_stock_length > 0.0
          ? (result.total_waste / total_stock_length) * 100.0
          : 0.0;
  return result;
}

}  // namespace stocknest
