#include "stocknest/NestingConfig.h"

#include <algorithm>
#include <cmath>

namespace stocknest {

namespace {

double ClampPositive(double value, double fallback) {
  if (std::isnan(value) || std::isinf(value) || value <= 0.0) {
    return fallback;
  }
  return value;
}

double ClampNonNegative(double value, double fallback = 0.0) {
  if (std::isnan(value) || std::isinf(value) || value < 0.0) {
    return fallback;
  }
  return value;
}

template <typename Setter>
void ApplyIfPresent(const QVariantMap& map, const char* key, Setter setter) {
  const auto it = map.constFind(QString::fromUtf8(key));
  if (it != map.constEnd()) {
    setter(*it);
  }
}

}  // namespace

QString ToString(RotationOption option) {
  switch (option) {
    case RotationOption::kNone:
      return QStringLiteral("none");
    case RotationOption::kNinety:
      return QStringLiteral("ninety");
    case RotationOption::kFree:
      return QStringLiteral("free");
  }
  return QStringLiteral("none");
}

QString ToString(OptimizationGoal goal) {
  switch (goal) {
    case OptimizationGoal::kPrioritizeSpeed:
      return QStringLiteral("speed");
    case OptimizationGoal::kMinimizeWaste:
      return QStringLiteral("waste");
  }
  return QStringLiteral("speed");
}

std::optional<RotationOption> ParseRotationOption(const QString& value) {
  const QString normalized = value.trimmed().toLower();
  if (normalized == QStringLiteral("none") || normalized == QStringLiteral("0")) {
    return RotationOption::kNone;
  }
  if (normalized == QStringLiteral("ninety") ||
      normalized == QStringLiteral("90") ||
      normalized.startsWith(QStringLiteral("90"))) {
    return RotationOption::kNinety;
  }
  if (normalized == QStringLiteral("free")) {
    return RotationOption::kFree;
  }
  return std::nullopt;
}

std::optional<OptimizationGoal> ParseOptimizationGoal(const QString& value) {
  const QString normalized = value.trimmed().toLower();
  if (normalized == QStringLiteral("speed") ||
      normalized == QStringLiteral("prioritize speed")) {
    return OptimizationGoal::kPrioritizeSpeed;
  }
  if (normalized == QStringLiteral("waste") ||
      normalized == QStringLiteral("minimize waste")) {
    return OptimizationGoal::kMinimizeWaste;
  }
  return std::nullopt;
}

SheetNestingConfig::SheetNestingConfig()
    : part_clearance_(0.0),
      edge_clearance_(0.0),
      rotation_(RotationOption::kNinety),
      default_density_(kDefaultDensity) {}

void SheetNestingConfig::set_part_clearance(double value) {
  part_clearance_ = ClampNonNegative(value, part_clearance_);
}

void SheetNestingConfig::set_edge_clearance(double value) {
  edge_clearance_ = ClampNonNegative(value, edge_clearance_);
}

void SheetNestingConfig::set_default_density(double value) {
  default_density_ = ClampPositive(value, default_density_);
}

QVariantMap SheetNestingConfig::ToVariantMap() const {
  QVariantMap map;
  map.insert(QStringLiteral("partClearance"), part_clearance_);
  map.insert(QStringLiteral("edgeClearance"), edge_clearance_);
  map.insert(QStringLiteral("rotation"), ToString(rotation_));
  map.insert(QStringLiteral("defaultDensity"), default_density_);
  return map;
}

void SheetNestingConfig::FromVariantMap(const QVariantMap& values) {
  ApplyIfPresent(values, "partClearance", [this](const QVariant& value) {
    set_part_clearance(value.toDouble());
  });
  ApplyIfPresent(values, "edgeClearance", [this](const QVariant& value) {
    set_edge_clearance(value.toDouble());
  });
  ApplyIfPresent(values, "rotation", [this](const QVariant& value) {
    if (const auto option = ParseRotationOption(value.toString())) {
      set_rotation(*option);
    }
  });
  ApplyIfPresent(values, "defaultDensity", [this](const QVariant& value) {
    set_default_density(value.toDouble());
  });
}

bool SheetNestingConfig::operator==(const SheetNestingConfig& other) const {
  return AlmostEqual(part_clearance_, other.part_clearance_) &&
         AlmostEqual(edge_clearance_, other.edge_clearance_) &&
         rotation_ == other.rotation_ &&
         AlmostEqual(default_density_, other.default_density_);
}

LinearNestingConfig::LinearNestingConfig()
    : stock_length_(6000.0),
      left_allowance_(10.0),
      right_allowance_(10.0),
      kerf_(5.0),
      optimization_goal_(OptimizationGoal::kPrioritizeSpeed),
      search_iterations_(kDefaultSearchIterations),
      random_seed_(0) {}

void LinearNestingConfig::set_stock_length(Length value) {
  stock_length_ = ClampPositive(value, stock_length_);
}

void LinearNestingConfig::set_left_allowance(Length value) {
  left_allowance_ = ClampNonNegative(value, left_allowance_);
}

void LinearNestingConfig::set_right_allowance(Length value) {
  right_allowance_ = ClampNonNegative(value, right_allowance_);
}

void LinearNestingConfig::set_kerf(Length value) {
  kerf_ = ClampNonNegative(value, kerf_);
}

void LinearNestingConfig::set_search_iterations(int value) {
  search_iterations_ = std::max(0, value);
}

QVariantMap LinearNestingConfig::ToVariantMap() const {
  QVariantMap map;
  map.insert(QStringLiteral("stockLength"), stock_length_);
  map.insert(QStringLiteral("leftAllowance"), left_allowance_);
  map.insert(QStringLiteral("rightAllowance"), right_allowance_);
  map.insert(QStringLiteral("kerf"), kerf_);
  map.insert(QStringLiteral("optimizationGoal"), ToString(optimization_goal_));
  map.insert(QStringLiteral("searchIterations"), search_iterations_);
  map.insert(QStringLiteral("randomSeed"), static_cast<qulonglong>(random_seed_));
  return map;
}

void LinearNestingConfig::FromVariantMap(const QVariantMap& values) {
  ApplyIfPresent(values, "stockLength", [this](const QVariant& value) {
    set_stock_length(value.toDouble());
  });
  ApplyIfPresent(values, "leftAllowance", [this](const QVariant& value) {
    set_left_allowance(value.toDouble());
  });
  ApplyIfPresent(values, "rightAllowance", [this](const QVariant& value) {
    set_right_allowance(value.toDouble());
  });
  ApplyIfPresent(values, "kerf", [this](const QVariant& value) {
    set_kerf(value.toDouble());
  });
  ApplyIfPresent(values, "optimizationGoal", [this](const QVariant& value) {
    if (const auto goal = ParseOptimizationGoal(value.toString())) {
      set_optimization_goal(*goal);
    }
  });
  ApplyIfPresent(values, "searchIterations", [this](const QVariant& value) {
    set_search_iterations(value.toInt());
  });
  ApplyIfPresent(values, "randomSeed", [this](const QVariant& value) {
    set_random_seed(static_cast<std::uint32_t>(value.toULongLong()));
  });
}

bool LinearNestingConfig::operator==(const LinearNestingConfig& other) const {
  return AlmostEqual(stock_length_, other.stock_length_) &&
         AlmostEqual(left_allowance_, other.left_allowance_) &&
         AlmostEqual(right_allowance_, other.right_allowance_) &&
         AlmostEqual(kerf_, other.kerf_) &&
         optimization_goal_ == other.optimization_goal_ &&
         search_iterations_ == other.search_iterations_ &&
         random_seed_ == other.random_seed_;
}

}  // namespace stocknest
