#include "stocknest/PositionFinder.h"

#include <QtTest>

using namespace stocknest;

namespace {

Part MakePart(int id, Length length, Length width) {
  Part part;
  part.id = id;
  part.original_id = id;
  part.length = length;
  part.width = width;
  part.thickness = 5.0;
  part.grade = QStringLiteral("MS");
  part.quantity = 1;
  return part;
}

SheetCapacity MakeSheet(Length length, Length width) {
  SheetCapacity sheet;
  sheet.length = length;
  sheet.width = width;
  sheet.thickness = 5.0;
  sheet.grade = QStringLiteral("MS");
  return sheet;
}

}  // namespace

class PositionFinderTests : public QObject {
  Q_OBJECT

 private slots:
  void emptySheetUsesEdgeClearanceOrigin();
  void candidatePointsFollowPlacedCorners();
  void rejectsOutOfBounds();
  void rejectsClearanceViolation();
  void prefersLowestThenLeftmost();
  void unrotatedWinsTie();
  void rotatesOnlyWhenNeeded();
  void noRotationWhenDisabled();
  void partTooLargeHasNoPosition();
};

void PositionFinderTests::emptySheetUsesEdgeClearanceOrigin() {
  const PositionFinder finder(0.0, 15.0, true);
  const std::vector<QPointF> points = finder.CandidatePoints({});
  QCOMPARE(static_cast<int>(points.size()), 1);
  QCOMPARE(points.front(), QPointF(15.0, 15.0));

  const auto position =
      finder.Find(MakePart(1, 100.0, 50.0), MakeSheet(500.0, 500.0), {});
  QVERIFY(position.has_value());
  QCOMPARE(position->point, QPointF(15.0, 15.0));
  QVERIFY(!position->rotated);
}

void PositionFinderTests::candidatePointsFollowPlacedCorners() {
  const PositionFinder finder(4.0, 0.0, true);
  PlacedPart placed {MakePart(1, 100.0, 50.0), InstanceId {1, 0},
                     QPointF(10.0, 20.0), false};

  const std::vector<QPointF> points = finder.CandidatePoints({placed});
  QCOMPARE(static_cast<int>(points.size()), 3);
  QCOMPARE(points[1], QPointF(10.0 + 50.0 + 4.0, 20.0));
  QCOMPARE(points[2], QPointF(10.0, 20.0 + 100.0 + 4.0));

  placed.rotated = true;
  const std::vector<QPointF> rotated = finder.CandidatePoints({placed});
  QCOMPARE(rotated[1], QPointF(10.0 + 100.0 + 4.0, 20.0));
  QCOMPARE(rotated[2], QPointF(10.0, 20.0 + 50.0 + 4.0));
}

void PositionFinderTests::rejectsOutOfBounds() {
  const PositionFinder finder(0.0, 10.0, false);
  const SheetCapacity sheet = MakeSheet(200.0, 100.0);

  QVERIFY(finder.CanPlace(QSizeF(180.0, 80.0), QPointF(10.0, 10.0), sheet, {}));
  QVERIFY(!finder.CanPlace(QSizeF(181.0, 80.0), QPointF(10.0, 10.0), sheet, {}));
  QVERIFY(!finder.CanPlace(QSizeF(180.0, 81.0), QPointF(10.0, 10.0), sheet, {}));
  QVERIFY(!finder.CanPlace(QSizeF(10.0, 10.0), QPointF(5.0, 10.0), sheet, {}));
}

void PositionFinderTests::rejectsClearanceViolation() {
  const PositionFinder finder(5.0, 0.0, false);
  const SheetCapacity sheet = MakeSheet(1000.0, 1000.0);
  const PlacedPart placed {MakePart(1, 100.0, 100.0), InstanceId {1, 0},
                           QPointF(0.0, 0.0), false};

  QVERIFY(!finder.CanPlace(QSizeF(50.0, 50.0), QPointF(102.0, 0.0), sheet,
                           {placed}));
  QVERIFY(finder.CanPlace(QSizeF(50.0, 50.0), QPointF(105.0, 0.0), sheet,
                          {placed}));
  QVERIFY(PositionFinder::Overlaps(QRectF(0, 0, 10, 10), QRectF(12, 0, 10, 10),
                                   3.0));
  QVERIFY(!PositionFinder::Overlaps(QRectF(0, 0, 10, 10),
                                    QRectF(12, 0, 10, 10), 2.0));
}

void PositionFinderTests::prefersLowestThenLeftmost() {
  const PositionFinder finder(0.0, 0.0, false);
  const SheetCapacity sheet = MakeSheet(300.0, 300.0);
  const PlacedPart first {MakePart(1, 100.0, 100.0), InstanceId {1, 0},
                          QPointF(0.0, 0.0), false};

  // Right of the first part (y = 0) beats above it (x = 0).
  const auto position = finder.Find(MakePart(2, 100.0, 100.0), sheet, {first});
  QVERIFY(position.has_value());
  QCOMPARE(position->point, QPointF(100.0, 0.0));
}

void PositionFinderTests::unrotatedWinsTie() {
  const PositionFinder finder(0.0, 0.0, true);
  const auto position =
      finder.Find(MakePart(1, 100.0, 40.0), MakeSheet(500.0, 500.0), {});
  QVERIFY(position.has_value());
  QCOMPARE(position->point, QPointF(0.0, 0.0));
  QVERIFY(!position->rotated);
}

void PositionFinderTests::rotatesOnlyWhenNeeded() {
  const PositionFinder finder(0.0, 0.0, true);
  const auto position =
      finder.Find(MakePart(1, 450.0, 100.0), MakeSheet(500.0, 300.0), {});
  QVERIFY(position.has_value());
  QCOMPARE(position->point, QPointF(0.0, 0.0));
  QVERIFY(position->rotated);
}

void PositionFinderTests::noRotationWhenDisabled() {
  SheetNestingConfig config;
  config.set_rotation(RotationOption::kNone);
  const PositionFinder finder(config);
  QVERIFY(!finder.allow_rotation());
  QVERIFY(!finder.Find(MakePart(1, 450.0, 100.0), MakeSheet(500.0, 300.0), {})
               .has_value());
}

void PositionFinderTests::partTooLargeHasNoPosition() {
  const PositionFinder finder(0.0, 0.0, true);
  QVERIFY(!finder.Find(MakePart(1, 600.0, 600.0), MakeSheet(500.0, 500.0), {})
               .has_value());
}

QTEST_GUILESS_MAIN(PositionFinderTests)
#include "PositionFinderTests.moc"
