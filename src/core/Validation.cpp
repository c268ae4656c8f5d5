#include "stocknest/Validation.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace stocknest {

namespace {

bool IsPositive(double value) { return std::isfinite(value) && value > 0.0; }

[[noreturn]] void Reject(const QString& record, const char* reason) {
  throw std::invalid_argument(record.toStdString() + ": " + reason);
}

}  // namespace

void ValidatePart(const Part& part) {
  const QString record = QStringLiteral("part %1").arg(part.id);
  if (!IsPositive(part.length) || !IsPositive(part.width)) {
    Reject(record, "length and width must be positive");
  }
  if (!IsPositive(part.thickness)) {
    Reject(record, "thickness must be positive");
  }
  if (part.quantity < 0) {
    Reject(record, "quantity must not be negative");
  }
}

void ValidateSheet(const SheetCapacity& sheet) {
  const QString record = QStringLiteral("sheet %1").arg(
      sheet.id.isEmpty() ? sheet.UsageKey() : sheet.id);
  if (!IsPositive(sheet.length) || !IsPositive(sheet.width)) {
    Reject(record, "length and width must be positive");
  }
  if (!IsPositive(sheet.thickness)) {
    Reject(record, "thickness must be positive");
  }
  if (sheet.quantity && *sheet.quantity < 0) {
    Reject(record, "supply quantity must not be negative");
  }
}

void ValidateLinearPart(const LinearPart& part) {
  const QString record = QStringLiteral("linear part %1").arg(part.id);
  if (!IsPositive(part.length)) {
    Reject(record, "length must be positive");
  }
  if (!std::isfinite(part.effective_length) ||
      part.effective_length < part.length) {
    Reject(record, "effective length must not be shorter than length");
  }
  if (part.quantity < 0) {
    Reject(record, "quantity must not be negative");
  }
}

void ValidateSheetInput(const std::vector<SheetCapacity>& sheets,
                        const std::vector<Part>& parts) {
  for (const auto& sheet : sheets) {
    ValidateSheet(sheet);
  }
  for (const auto& part : parts) {
    ValidatePart(part);
  }
}

void ValidateLinearInput(const std::vector<LinearPart>& parts) {
  for (const auto& part : parts) {
    ValidateLinearPart(part);
  }
}

}  // namespace stocknest
