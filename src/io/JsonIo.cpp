#include "stocknest/JsonIo.h"

#include "stocknest/Logging.h"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace stocknest {

namespace {

[[noreturn]] void Fail(const QString& message) {
  throw std::runtime_error(message.toStdString());
}

double RequireNumber(const QJsonObject& object, const char* key,
                     const QString& context) {
  const QJsonValue value = object.value(QLatin1String(key));
  if (!value.isDouble()) {
    Fail(QStringLiteral("%1: missing numeric field '%2'")
             .arg(context, QLatin1String(key)));
  }
  return value.toDouble();
}

int ToWholeNumber(double value, const char* key, const QString& context) {
  if (!std::isfinite(value) || std::floor(value) != value ||
      value < static_cast<double>(std::numeric_limits<int>::min()) ||
      value > static_cast<double>(std::numeric_limits<int>::max())) {
    Fail(QStringLiteral("%1: field '%2' must be a whole number, got %3")
             .arg(context, QLatin1String(key))
             .arg(value));
  }
  return static_cast<int>(value);
}

int RequireInt(const QJsonObject& object, const char* key,
               const QString& context) {
  return ToWholeNumber(RequireNumber(object, key, context), key, context);
}

std::optional<int> OptionalInt(const QJsonObject& object, const char* key,
                               const QString& context) {
  const QJsonValue value = object.value(QLatin1String(key));
  if (value.isUndefined() || value.isNull()) {
    return std::nullopt;
  }
  if (!value.isDouble()) {
    Fail(QStringLiteral("%1: field '%2' must be numeric")
             .arg(context, QLatin1String(key)));
  }
  return ToWholeNumber(value.toDouble(), key, context);
}

QString RequireString(const QJsonObject& object, const char* key,
                      const QString& context) {
  const QJsonValue value = object.value(QLatin1String(key));
  if (!value.isString() || value.toString().trimmed().isEmpty()) {
    Fail(QStringLiteral("%1: missing text field '%2'")
             .arg(context, QLatin1String(key)));
  }
  return value.toString().trimmed();
}

QJsonArray ArrayField(const QJsonObject& root, const char* key) {
  const QJsonValue value = root.value(QLatin1String(key));
  if (value.isUndefined() || value.isNull()) {
    return QJsonArray();
  }
  if (!value.isArray()) {
    Fail(QStringLiteral("'%1' must be an array").arg(QLatin1String(key)));
  }
  return value.toArray();
}

Part ReadPart(const QJsonObject& object, int position) {
  const QString context = QStringLiteral("parts[%1]").arg(position);
  Part part;
  part.id = RequireInt(object, "id", context);
  part.original_id =
      OptionalInt(object, "originalId", context).value_or(part.id);
  part.name = object.value(QStringLiteral("name")).toString();
  part.length = RequireNumber(object, "length", context);
  part.width = RequireNumber(object, "width", context);
  part.thickness = RequireNumber(object, "thickness", context);
  part.grade = RequireString(object, "grade", context);
  part.quantity = RequireInt(object, "quantity", context);
  return part;
}

SheetCapacity ReadSheet(const QJsonObject& object, int position) {
  const QString context = QStringLiteral("sheets[%1]").arg(position);
  SheetCapacity sheet;
  sheet.id = object.value(QStringLiteral("id")).toString();
  sheet.length = RequireNumber(object, "length", context);
  sheet.width = RequireNumber(object, "width", context);
  sheet.thickness = RequireNumber(object, "thickness", context);
  sheet.grade = RequireString(object, "grade", context);
  sheet.quantity = OptionalInt(object, "quantity", context);
  return sheet;
}

LinearPart ReadLinearPart(const QJsonObject& object, int position,
                          Length kerf) {
  const QString context = QStringLiteral("linearParts[%1]").arg(position);
  LinearPart part = MakeLinearPart(
      RequireInt(object, "id", context),
      RequireString(object, "rawMaterial", context),
      RequireNumber(object, "length", context),
      RequireInt(object, "quantity", context), kerf);
  const QJsonValue effective = object.value(QStringLiteral("effectiveLength"));
  if (effective.isDouble()) {
    part.effective_length = effective.toDouble();
  }
  return part;
}

QJsonObject PartToJson(const Part& part) {
  QJsonObject object;
  object.insert(QStringLiteral("id"), part.id);
  object.insert(QStringLiteral("originalId"), part.original_id);
  object.insert(QStringLiteral("name"), part.name);
  object.insert(QStringLiteral("length"), part.length);
  object.insert(QStringLiteral("width"), part.width);
  object.insert(QStringLiteral("thickness"), part.thickness);
  object.insert(QStringLiteral("grade"), part.grade);
  object.insert(QStringLiteral("quantity"), part.quantity);
  return object;
}

QJsonObject SheetToJson(const SheetCapacity& sheet) {
  QJsonObject object;
  object.insert(QStringLiteral("id"), sheet.id);
  object.insert(QStringLiteral("length"), sheet.length);
  object.insert(QStringLiteral("width"), sheet.width);
  object.insert(QStringLiteral("thickness"), sheet.thickness);
  object.insert(QStringLiteral("grade"), sheet.grade);
  object.insert(QStringLiteral("quantity"),
                sheet.quantity ? QJsonValue(*sheet.quantity) : QJsonValue());
  return object;
}

QJsonObject SheetLayoutToJson(const SheetLayout& layout) {
  QJsonObject object;
  object.insert(QStringLiteral("sheetIndex"), layout.sheet_index);
  object.insert(QStringLiteral("sheet"), SheetToJson(layout.sheet));
  QJsonArray placements;
  for (const auto& placed : layout.placed_parts) {
    QJsonObject placement = PartToJson(placed.part);
    placement.insert(QStringLiteral("instanceId"), placed.instance.ToString());
    placement.insert(QStringLiteral("x"), placed.position.x());
    placement.insert(QStringLiteral("y"), placed.position.y());
    placement.insert(QStringLiteral("rotated"), placed.rotated);
    placements.push_back(placement);
  }
  object.insert(QStringLiteral("placedParts"), placements);
  object.insert(QStringLiteral("usedArea"), layout.used_area);
  object.insert(QStringLiteral("wasteArea"), layout.waste_area);
  object.insert(QStringLiteral("wastePercentage"), layout.waste_percentage);
  object.insert(QStringLiteral("usedWeight"), layout.used_weight);
  object.insert(QStringLiteral("wasteWeight"), layout.waste_weight);
  return object;
}

QJsonObject LinearPartToJson(const LinearPart& part) {
  QJsonObject object;
  object.insert(QStringLiteral("id"), part.id);
  object.insert(QStringLiteral("rawMaterial"), part.raw_material);
  object.insert(QStringLiteral("length"), part.length);
  object.insert(QStringLiteral("quantity"), part.quantity);
  object.insert(QStringLiteral("effectiveLength"), part.effective_length);
  return object;
}

QJsonObject StockLayoutToJson(const StockLayout& layout) {
  QJsonObject object;
  object.insert(QStringLiteral("stockIndex"), layout.stock_index);
  object.insert(QStringLiteral("stockLength"), layout.stock_length);
  object.insert(QStringLiteral("rawMaterial"), layout.raw_material);
  QJsonArray cuts;
  for (const auto& cut : layout.cuts) {
    QJsonObject entry;
    entry.insert(QStringLiteral("id"), cut.id);
    entry.insert(QStringLiteral("instanceId"), cut.instance.ToString());
    entry.insert(QStringLiteral("length"), cut.length);
    entry.insert(QStringLiteral("effectiveLength"), cut.effective_length);
    cuts.push_back(entry);
  }
  object.insert(QStringLiteral("cuts"), cuts);
  object.insert(QStringLiteral("usedLength"), layout.used_length);
  object.insert(QStringLiteral("wasteLength"), layout.waste_length);
  object.insert(QStringLiteral("wastePercentage"), layout.waste_percentage);
  return object;
}

QJsonArray IndicesToJson(const std::vector<int>& indices) {
  QJsonArray array;
  for (int index : indices) {
    array.push_back(index);
  }
  return array;
}

}  // namespace

NestingJob ReadJob(const QJsonObject& root) {
  NestingJob job;
  job.sheet_config.FromVariantMap(
      root.value(QStringLiteral("sheetConfig")).toObject().toVariantMap());
  job.linear_config.FromVariantMap(
      root.value(QStringLiteral("linearConfig")).toObject().toVariantMap());

  const QJsonValue materials = root.value(QStringLiteral("materials"));
  if (materials.isObject()) {
    job.materials.FromVariantMap(materials.toObject().toVariantMap());
  }

  const QJsonArray sheets = ArrayField(root, "sheets");
  for (int i = 0; i < sheets.size(); ++i) {
    job.sheets.push_back(ReadSheet(sheets.at(i).toObject(), i));
  }
  const QJsonArray parts = ArrayField(root, "parts");
  for (int i = 0; i < parts.size(); ++i) {
    job.parts.push_back(ReadPart(parts.at(i).toObject(), i));
  }
  const QJsonArray linear_parts = ArrayField(root, "linearParts");
  for (int i = 0; i < linear_parts.size(); ++i) {
    job.linear_parts.push_back(ReadLinearPart(
        linear_parts.at(i).toObject(), i, job.linear_config.kerf()));
  }

  qCDebug(lcJsonIo) << "job with" << job.sheets.size() << "sheet(s),"
                    << job.parts.size() << "part row(s),"
                    << job.linear_parts.size() << "linear row(s)";
  return job;
}

NestingJob LoadJobFile(const QString& path) {
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) {
    Fail(QStringLiteral("cannot open job file %1: %2")
             .arg(path, file.errorString()));
  }

  QJsonParseError error;
  const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &error);
  if (error.error != QJsonParseError::NoError) {
    Fail(QStringLiteral("%1: %2 at offset %3")
             .arg(path, error.errorString())
             .arg(error.offset));
  }
  if (!document.isObject()) {
    Fail(QStringLiteral("%1: job document must be a JSON object").arg(path));
  }
  return ReadJob(document.object());
}

QJsonObject ToJson(const SheetNestingResult& result) {
  QJsonObject root;
  QJsonArray layouts;
  for (const auto& layout : result.layouts) {
    layouts.push_back(SheetLayoutToJson(layout));
  }
  root.insert(QStringLiteral("layouts"), layouts);

  QJsonArray unplaced;
  for (const auto& part : result.unplaced_parts) {
    unplaced.push_back(PartToJson(part));
  }
  root.insert(QStringLiteral("unplacedParts"), unplaced);

  QJsonObject sheets_used;
  for (const auto& usage : result.sheets_used) {
    sheets_used.insert(usage.key, usage.count);
  }
  root.insert(QStringLiteral("totalSheetsUsed"), sheets_used);
  root.insert(QStringLiteral("totalUsedArea"), result.total_used_area);
  root.insert(QStringLiteral("totalSheetArea"), result.total_sheet_area);
  root.insert(QStringLiteral("totalUsedWeight"), result.total_used_weight);
  root.insert(QStringLiteral("totalWasteWeight"), result.total_waste_weight);
  root.insert(QStringLiteral("totalWastePercentage"),
              result.total_waste_percentage);
  return root;
}

QJsonObject ToJson(const LinearNestingResult& result) {
  QJsonObject root;
  QJsonArray layouts;
  for (const auto& layout : result.layouts) {
    layouts.push_back(StockLayoutToJson(layout));
  }
  root.insert(QStringLiteral("layouts"), layouts);

  QJsonArray unplaced;
  for (const auto& part : result.unplaced_parts) {
    unplaced.push_back(LinearPartToJson(part));
  }
  root.insert(QStringLiteral("unplacedParts"), unplaced);
  root.insert(QStringLiteral("totalStockUsed"), result.total_stock_used);
  root.insert(QStringLiteral("totalWaste"), result.total_waste);
  root.insert(QStringLiteral("totalWastePercentage"),
              result.total_waste_percentage);
  return root;
}

QJsonArray ToJson(const std::vector<SheetLayoutGroup>& groups) {
  QJsonArray array;
  for (const auto& group : groups) {
    QJsonObject entry;
    entry.insert(QStringLiteral("layout"), SheetLayoutToJson(group.layout));
    entry.insert(QStringLiteral("quantity"), group.quantity);
    entry.insert(QStringLiteral("sheetIndices"),
                 IndicesToJson(group.sheet_indices));
    array.push_back(entry);
  }
  return array;
}

QJsonArray ToJson(const std::vector<StockLayoutGroup>& groups) {
  QJsonArray array;
  for (const auto& group : groups) {
    QJsonObject entry;
    entry.insert(QStringLiteral("layout"), StockLayoutToJson(group.layout));
    entry.insert(QStringLiteral("quantity"), group.quantity);
    entry.insert(QStringLiteral("stockIndices"),
                 IndicesToJson(group.stock_indices));
    array.push_back(entry);
  }
  return array;
}

void WriteJsonFile(const QString& path, const QJsonObject& root) {
  QFile file(path);
  if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    Fail(QStringLiteral("cannot write %1: %2").arg(path, file.errorString()));
  }
  const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
  if (file.write(data) != data.size()) {
    Fail(QStringLiteral("short write to %1").arg(path));
  }
}

}  // namespace stocknest
