#include "stocknest/NestingConfig.h"

#include <QtTest>

#include <cmath>
#include <limits>

using namespace stocknest;

class NestingConfigTests : public QObject {
  Q_OBJECT

 private slots:
  void sheetDefaults();
  void linearDefaults();
  void settersClampInvalidValues();
  void parsesRotationLabels();
  void parsesGoalLabels();
  void sheetVariantMapRoundTrip();
  void linearVariantMapRoundTrip();
  void fromVariantMapKeepsUnknownValues();
};

void NestingConfigTests::sheetDefaults() {
  const SheetNestingConfig config;
  QCOMPARE(config.part_clearance(), 0.0);
  QCOMPARE(config.edge_clearance(), 0.0);
  QVERIFY(config.rotation() == RotationOption::kNinety);
  QVERIFY(config.allow_rotation());
  QCOMPARE(config.default_density(), 7850.0);
}

void NestingConfigTests::linearDefaults() {
  const LinearNestingConfig config;
  QCOMPARE(config.stock_length(), 6000.0);
  QCOMPARE(config.left_allowance(), 10.0);
  QCOMPARE(config.right_allowance(), 10.0);
  QCOMPARE(config.usable_length(), 5980.0);
  QCOMPARE(config.kerf(), 5.0);
  QVERIFY(config.optimization_goal() == OptimizationGoal::kPrioritizeSpeed);
  QCOMPARE(config.search_iterations(), 50);
  QCOMPARE(config.random_seed(), 0u);
}

void NestingConfigTests::settersClampInvalidValues() {
  SheetNestingConfig sheet;
  sheet.set_part_clearance(4.0);
  sheet.set_part_clearance(-1.0);
  QCOMPARE(sheet.part_clearance(), 4.0);
  sheet.set_edge_clearance(std::numeric_limits<double>::quiet_NaN());
  QCOMPARE(sheet.edge_clearance(), 0.0);
  sheet.set_default_density(0.0);
  QCOMPARE(sheet.default_density(), 7850.0);

  LinearNestingConfig linear;
  linear.set_stock_length(-100.0);
  QCOMPARE(linear.stock_length(), 6000.0);
  linear.set_kerf(std::numeric_limits<double>::infinity());
  QCOMPARE(linear.kerf(), 5.0);
  linear.set_kerf(0.0);
  QCOMPARE(linear.kerf(), 0.0);
  linear.set_search_iterations(-3);
  QCOMPARE(linear.search_iterations(), 0);
}

void NestingConfigTests::parsesRotationLabels() {
  QVERIFY(ParseRotationOption(QStringLiteral("none")) == RotationOption::kNone);
  QVERIFY(ParseRotationOption(QStringLiteral("0")) == RotationOption::kNone);
  QVERIFY(ParseRotationOption(QStringLiteral(" Ninety ")) ==
          RotationOption::kNinety);
  QVERIFY(ParseRotationOption(QStringLiteral("90 degrees")) ==
          RotationOption::kNinety);
  QVERIFY(ParseRotationOption(QStringLiteral("FREE")) == RotationOption::kFree);
  QVERIFY(!ParseRotationOption(QStringLiteral("sideways")).has_value());
  QCOMPARE(ToString(RotationOption::kFree), QStringLiteral("free"));
}

void NestingConfigTests::parsesGoalLabels() {
  QVERIFY(ParseOptimizationGoal(QStringLiteral("Prioritize Speed")) ==
          OptimizationGoal::kPrioritizeSpeed);
  QVERIFY(ParseOptimizationGoal(QStringLiteral("minimize waste")) ==
          OptimizationGoal::kMinimizeWaste);
  QVERIFY(ParseOptimizationGoal(QStringLiteral("waste")) ==
          OptimizationGoal::kMinimizeWaste);
  QVERIFY(!ParseOptimizationGoal(QString()).has_value());
  QCOMPARE(ToString(OptimizationGoal::kMinimizeWaste), QStringLiteral("waste"));
}

void NestingConfigTests::sheetVariantMapRoundTrip() {
  SheetNestingConfig config;
  config.set_part_clearance(2.5);
  config.set_edge_clearance(12.0);
  config.set_rotation(RotationOption::kNone);
  config.set_default_density(2700.0);

  SheetNestingConfig copy;
  QVERIFY(copy != config);
  copy.FromVariantMap(config.ToVariantMap());
  QVERIFY(copy == config);
  QCOMPARE(config.ToVariantMap().value(QStringLiteral("rotation")).toString(),
           QStringLiteral("none"));
}

void NestingConfigTests::linearVariantMapRoundTrip() {
  LinearNestingConfig config;
  config.set_stock_length(12000.0);
  config.set_left_allowance(0.0);
  config.set_right_allowance(25.0);
  config.set_kerf(3.0);
  config.set_optimization_goal(OptimizationGoal::kMinimizeWaste);
  config.set_search_iterations(200);
  config.set_random_seed(4242);

  LinearNestingConfig copy;
  copy.FromVariantMap(config.ToVariantMap());
  QVERIFY(copy == config);
  QCOMPARE(copy.usable_length(), 11975.0);
}

void NestingConfigTests::fromVariantMapKeepsUnknownValues() {
  LinearNestingConfig config;
  QVariantMap values;
  values.insert(QStringLiteral("kerf"), -4.0);
  values.insert(QStringLiteral("optimizationGoal"), QStringLiteral("fastest"));
  values.insert(QStringLiteral("stockLength"), 3000.0);
  config.FromVariantMap(values);

  QCOMPARE(config.kerf(), 5.0);
  QVERIFY(config.optimization_goal() == OptimizationGoal::kPrioritizeSpeed);
  QCOMPARE(config.stock_length(), 3000.0);
}

QTEST_GUILESS_MAIN(NestingConfigTests)
#include "NestingConfigTests.moc"
