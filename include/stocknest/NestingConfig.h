#pragma once

#include "stocknest/NestingTypes.h"

#include <QString>
#include <QVariantMap>

#include <cstdint>

namespace stocknest {

enum class RotationOption {
  kNone,
  kNinety,
  kFree,
};

enum class OptimizationGoal {
  kPrioritizeSpeed,
  kMinimizeWaste,
};

QString ToString(RotationOption option);
QString ToString(OptimizationGoal goal);
std::optional<RotationOption> ParseRotationOption(const QString& value);
std::optional<OptimizationGoal> ParseOptimizationGoal(const QString& value);

class SheetNestingConfig {
 public:
  SheetNestingConfig();

  double part_clearance() const { return part_clearance_; }
  void set_part_clearance(double value);

  double edge_clearance() const { return edge_clearance_; }
  void set_edge_clearance(double value);

  RotationOption rotation() const { return rotation_; }
  void set_rotation(RotationOption value) { rotation_ = value; }
  bool allow_rotation() const { return rotation_ != RotationOption::kNone; }

  double default_density() const { return default_density_; }
  void set_default_density(double value);

  QVariantMap ToVariantMap() const;
  void FromVariantMap(const QVariantMap& values);

  bool operator==(const SheetNestingConfig& other) const;
  bool operator!=(const SheetNestingConfig& other) const {
    return !(*this == other);
  }

 private:
  double part_clearance_;
  double edge_clearance_;
  RotationOption rotation_;
  double default_density_;
};

class LinearNestingConfig {
 public:
  static constexpr int kDefaultSearchIterations = 50;

  LinearNestingConfig();

  Length stock_length() const { return stock_length_; }
  void set_stock_length(Length value);

  Length left_allowance() const { return left_allowance_; }
  void set_left_allowance(Length value);

  Length right_allowance() const { return right_allowance_; }
  void set_right_allowance(Length value);

  Length usable_length() const {
    return stock_length_ - left_allowance_ - right_allowance_;
  }

  Length kerf() const { return kerf_; }
  void set_kerf(Length value);

  OptimizationGoal optimization_goal() const { return optimization_goal_; }
  void set_optimization_goal(OptimizationGoal value) {
    optimization_goal_ = value;
  }

  int search_iterations() const { return search_iterations_; }
  void set_search_iterations(int value);

  // 0 seeds the search from std::random_device.
  std::uint32_t random_seed() const { return random_seed_; }
  void set_random_seed(std::uint32_t value) { random_seed_ = value; }

  QVariantMap ToVariantMap() const;
  void FromVariantMap(const QVariantMap& values);

  bool operator==(const LinearNestingConfig& other) const;
  bool operator!=(const LinearNestingConfig& other) const {
    return !(*this == other);
  }

 private:
  Length stock_length_;
  Length left_allowance_;
  Length right_allowance_;
  Length kerf_;
  OptimizationGoal optimization_goal_;
  int search_iterations_;
  std::uint32_t random_seed_;
};

}  // namespace stocknest
