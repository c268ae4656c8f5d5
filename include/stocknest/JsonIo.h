#pragma once

#include "stocknest/LayoutSummary.h"
#include "stocknest/MaterialTable.h"
#include "stocknest/NestingConfig.h"
#include "stocknest/NestingTypes.h"

#include <QJsonArray>
#include <QJsonObject>
#include <QString>

#include <vector>

namespace stocknest {

struct NestingJob {
  SheetNestingConfig sheet_config;
  LinearNestingConfig linear_config;
  MaterialTable materials;
  std::vector<SheetCapacity> sheets;
  std::vector<Part> parts;
  std::vector<LinearPart> linear_parts;
};

// Missing originalId defaults to id, missing effectiveLength to
// length + linearConfig.kerf, missing sheet quantity to unbounded supply.
// Throws std::runtime_error when a required field is missing.
NestingJob ReadJob(const QJsonObject& root);
NestingJob LoadJobFile(const QString& path);

QJsonObject ToJson(const SheetNestingResult& result);
QJsonObject ToJson(const LinearNestingResult& result);
QJsonArray ToJson(const std::vector<SheetLayoutGroup>& groups);
QJsonArray ToJson(const std::vector<StockLayoutGroup>& groups);

void WriteJsonFile(const QString& path, const QJsonObject& root);

}  // namespace stocknest
