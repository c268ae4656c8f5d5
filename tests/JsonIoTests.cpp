#include "stocknest/JsonIo.h"
#include "stocknest/LinearPacker.h"
#include "stocknest/SheetPacker.h"

#include <QtTest>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include <stdexcept>

using namespace stocknest;

namespace {

const char kJob[] = R"({
  "sheetConfig": {"partClearance": 2, "edgeClearance": 5, "rotation": "none"},
  "linearConfig": {"stockLength": 6000, "kerf": 3, "optimizationGoal": "minimize waste",
                   "randomSeed": 17},
  "materials": {"cu": 8960},
  "sheets": [
    {"id": "A", "length": 2500, "width": 1250, "thickness": 6, "grade": "MS", "quantity": 2},
    {"length": 3000, "width": 1500, "thickness": 6, "grade": "SS"}
  ],
  "parts": [
    {"id": 1, "name": "bracket", "length": 300, "width": 200, "thickness": 6,
     "grade": "MS", "quantity": 4},
    {"id": 2, "originalId": 1, "length": 300, "width": 200, "thickness": 6,
     "grade": "MS", "quantity": 1}
  ],
  "linearParts": [
    {"id": 10, "rawMaterial": "RHS-40", "length": 1200, "quantity": 3},
    {"id": 11, "rawMaterial": "RHS-40", "length": 800, "quantity": 2,
     "effectiveLength": 810}
  ]
})";

QJsonObject Parse(const char* text) {
  return QJsonDocument::fromJson(QByteArray(text)).object();
}

}  // namespace

class JsonIoTests : public QObject {
  Q_OBJECT

 private slots:
  void readsConfigs();
  void readsSheetsAndParts();
  void readsLinearParts();
  void missingFieldThrows();
  void rejectsNonWholeCounts();
  void missingFileThrows();
  void malformedFileThrows();
  void serializesSheetResult();
  void serializesLinearResultAndGroups();
  void writesAndLoadsFiles();
};

void JsonIoTests::readsConfigs() {
  const NestingJob job = ReadJob(Parse(kJob));
  QCOMPARE(job.sheet_config.part_clearance(), 2.0);
  QCOMPARE(job.sheet_config.edge_clearance(), 5.0);
  QVERIFY(!job.sheet_config.allow_rotation());
  QCOMPARE(job.linear_config.kerf(), 3.0);
  QVERIFY(job.linear_config.optimization_goal() ==
          OptimizationGoal::kMinimizeWaste);
  QCOMPARE(job.linear_config.random_seed(), 17u);
  QCOMPARE(job.linear_config.left_allowance(), 10.0);
  QCOMPARE(*job.materials.Density(QStringLiteral("CU")), 8960.0);
  QVERIFY(job.materials.Contains(QStringLiteral("MS")));
}

void JsonIoTests::readsSheetsAndParts() {
  const NestingJob job = ReadJob(Parse(kJob));
  QCOMPARE(static_cast<int>(job.sheets.size()), 2);
  QCOMPARE(job.sheets[0].id, QStringLiteral("A"));
  QCOMPARE(*job.sheets[0].quantity, 2);
  QVERIFY(job.sheets[1].unlimited());

  QCOMPARE(static_cast<int>(job.parts.size()), 2);
  QCOMPARE(job.parts[0].original_id, 1);
  QCOMPARE(job.parts[0].name, QStringLiteral("bracket"));
  QCOMPARE(job.parts[1].id, 2);
  QCOMPARE(job.parts[1].original_id, 1);
}

void JsonIoTests::readsLinearParts() {
  const NestingJob job = ReadJob(Parse(kJob));
  QCOMPARE(static_cast<int>(job.linear_parts.size()), 2);
  QCOMPARE(job.linear_parts[0].raw_material, QStringLiteral("RHS-40"));
  QCOMPARE(job.linear_parts[0].effective_length, 1203.0);
  QCOMPARE(job.linear_parts[1].effective_length, 810.0);
}

void JsonIoTests::missingFieldThrows() {
  QVERIFY_EXCEPTION_THROWN(
      ReadJob(Parse(R"({"parts": [{"id": 1, "length": 10, "thickness": 2,
                                    "grade": "MS", "quantity": 1}]})")),
      std::runtime_error);
  QVERIFY_EXCEPTION_THROWN(
      ReadJob(Parse(R"({"linearParts": [{"id": 1, "length": 10, "quantity": 1}]})")),
      std::runtime_error);
  QVERIFY_EXCEPTION_THROWN(ReadJob(Parse(R"({"sheets": {"length": 1}})")),
                           std::runtime_error);

  const NestingJob empty = ReadJob(QJsonObject());
  QVERIFY(empty.parts.empty());
  QVERIFY(empty.linear_config == LinearNestingConfig());
}

void JsonIoTests::rejectsNonWholeCounts() {
  QVERIFY_EXCEPTION_THROWN(
      ReadJob(Parse(R"({"parts": [{"id": 1, "length": 10, "width": 10,
                                    "thickness": 2, "grade": "MS",
                                    "quantity": 1e10}]})")),
      std::runtime_error);
  QVERIFY_EXCEPTION_THROWN(
      ReadJob(Parse(R"({"parts": [{"id": 1, "length": 10, "width": 10,
                                    "thickness": 2, "grade": "MS",
                                    "quantity": 2.5}]})")),
      std::runtime_error);
  QVERIFY_EXCEPTION_THROWN(
      ReadJob(Parse(R"({"linearParts": [{"id": 3e9, "rawMaterial": "FLAT",
                                          "length": 10, "quantity": 1}]})")),
      std::runtime_error);
  QVERIFY_EXCEPTION_THROWN(
      ReadJob(Parse(R"({"sheets": [{"length": 100, "width": 100,
                                     "thickness": 2, "grade": "MS",
                                     "quantity": 2.5}]})")),
      std::runtime_error);
  QVERIFY_EXCEPTION_THROWN(
      ReadJob(Parse(R"({"sheets": [{"length": 100, "width": 100,
                                     "thickness": 2, "grade": "MS",
                                     "quantity": 1e10}]})")),
      std::runtime_error);

  const NestingJob job = ReadJob(Parse(
      R"({"sheets": [{"length": 100, "width": 100, "thickness": 2,
                      "grade": "MS", "quantity": null}],
          "parts": [{"id": 4, "length": 10, "width": 10, "thickness": 2,
                     "grade": "MS", "quantity": 3.0}]})"));
  QVERIFY(job.sheets.front().unlimited());
  QCOMPARE(job.parts.front().quantity, 3);
  QCOMPARE(job.parts.front().original_id, 4);
}

void JsonIoTests::missingFileThrows() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  QVERIFY_EXCEPTION_THROWN(LoadJobFile(dir.filePath(QStringLiteral("absent.json"))),
                           std::runtime_error);
}

void JsonIoTests::malformedFileThrows() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = dir.filePath(QStringLiteral("broken.json"));
  QFile file(path);
  QVERIFY(file.open(QIODevice::WriteOnly));
  file.write("{\"parts\": [");
  file.close();
  QVERIFY_EXCEPTION_THROWN(LoadJobFile(path), std::runtime_error);

  QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
  file.write("[1, 2, 3]");
  file.close();
  QVERIFY_EXCEPTION_THROWN(LoadJobFile(path), std::runtime_error);
}

void JsonIoTests::serializesSheetResult() {
  const NestingJob job = ReadJob(Parse(kJob));
  const SheetPacker packer(job.sheet_config);
  const SheetNestingResult result = packer.Pack(job.sheets, job.parts);

  const QJsonObject json = ToJson(result);
  const QJsonArray layouts = json.value(QStringLiteral("layouts")).toArray();
  QCOMPARE(static_cast<int>(layouts.size()), 1);
  const QJsonObject layout = layouts.at(0).toObject();
  QCOMPARE(layout.value(QStringLiteral("sheetIndex")).toInt(), 1);
  QCOMPARE(layout.value(QStringLiteral("placedParts")).toArray().size(),
           QJsonArray::size_type(5));
  QCOMPARE(layout.value(QStringLiteral("placedParts"))
               .toArray()
               .at(0)
               .toObject()
               .value(QStringLiteral("instanceId"))
               .toString(),
           QStringLiteral("1-0"));
  QCOMPARE(json.value(QStringLiteral("totalSheetsUsed"))
               .toObject()
               .value(QStringLiteral("2500x1250x6-MS"))
               .toInt(),
           1);
  QVERIFY(json.value(QStringLiteral("unplacedParts")).toArray().isEmpty());
}

void JsonIoTests::serializesLinearResultAndGroups() {
  LinearNestingConfig config;
  config.set_left_allowance(0.0);
  config.set_right_allowance(0.0);
  LinearPacker packer(config, std::mt19937(3));
  const LinearNestingResult result = packer.Pack(
      {MakeLinearPart(4, QStringLiteral("FLAT"), 2995.0, 4, config.kerf()),
       MakeLinearPart(5, QStringLiteral("FLAT"), 9000.0, 1, config.kerf())});

  const QJsonObject json = ToJson(result);
  QCOMPARE(json.value(QStringLiteral("totalStockUsed")).toInt(), 2);
  QCOMPARE(json.value(QStringLiteral("totalWaste")).toDouble(), 0.0);
  const QJsonArray unplaced = json.value(QStringLiteral("unplacedParts")).toArray();
  QCOMPARE(static_cast<int>(unplaced.size()), 1);
  QCOMPARE(unplaced.at(0).toObject().value(QStringLiteral("id")).toInt(), 5);

  const QJsonArray groups = ToJson(GroupStockLayouts(result));
  QCOMPARE(static_cast<int>(groups.size()), 1);
  QCOMPARE(groups.at(0).toObject().value(QStringLiteral("quantity")).toInt(), 2);
  QCOMPARE(groups.at(0)
               .toObject()
               .value(QStringLiteral("stockIndices"))
               .toArray()
               .size(),
           QJsonArray::size_type(2));
}

void JsonIoTests::writesAndLoadsFiles() {
  QTemporaryDir dir;
  QVERIFY(dir.isValid());
  const QString path = dir.filePath(QStringLiteral("job.json"));
  WriteJsonFile(path, Parse(kJob));

  const NestingJob job = LoadJobFile(path);
  QCOMPARE(static_cast<int>(job.parts.size()), 2);
  QCOMPARE(static_cast<int>(job.linear_parts.size()), 2);

  QVERIFY_EXCEPTION_THROWN(
      WriteJsonFile(dir.filePath(QStringLiteral("missing/dir/out.json")),
                    QJsonObject()),
      std::runtime_error);
}

QTEST_GUILESS_MAIN(JsonIoTests)
#include "JsonIoTests.moc"
