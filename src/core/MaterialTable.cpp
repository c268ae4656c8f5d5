#include "stocknest/MaterialTable.h"

#include <algorithm>
#include <cmath>

namespace stocknest {

MaterialTable::MaterialTable() {
  SetDensity(QStringLiteral("MS"), 7850.0);
  SetDensity(QStringLiteral("SS"), 8000.0);
  SetDensity(QStringLiteral("AL"), 2700.0);
  SetDensity(QStringLiteral("GI"), 7850.0);
}

MaterialTable MaterialTable::Empty() {
  MaterialTable table;
  table.Clear();
  return table;
}

QString MaterialTable::Normalize(const QString& grade) {
  return grade.trimmed().toUpper();
}

void MaterialTable::SetDensity(const QString& grade, double density) {
  const QString key = Normalize(grade);
  if (key.isEmpty() || std::isnan(density) || std::isinf(density) ||
      density <= 0.0) {
    return;
  }
  densities_.insert(key, density);
}

void MaterialTable::Remove(const QString& grade) {
  densities_.remove(Normalize(grade));
}

std::optional<double> MaterialTable::Density(const QString& grade) const {
  const auto it = densities_.constFind(Normalize(grade));
  if (it == densities_.constEnd()) {
    return std::nullopt;
  }
  return *it;
}

double MaterialTable::DensityOr(const QString& grade, double fallback) const {
  return Density(grade).value_or(fallback);
}

bool MaterialTable::Contains(const QString& grade) const {
  return densities_.contains(Normalize(grade));
}

QStringList MaterialTable::grades() const {
  QStringList keys = densities_.keys();
  std::sort(keys.begin(), keys.end());
  return keys;
}

DensityLookup MaterialTable::AsLookup() const {
  const QHash<QString, double> snapshot = densities_;
  return [snapshot](const QString& grade) -> std::optional<double> {
    const auto it = snapshot.constFind(Normalize(grade));
    if (it == snapshot.constEnd()) {
      return std::nullopt;
    }
    return *it;
  };
}

QVariantMap MaterialTable::ToVariantMap() const {
  QVariantMap map;
  for (auto it = densities_.constBegin(); it != densities_.constEnd(); ++it) {
    map.insert(it.key(), it.value());
  }
  return map;
}

void MaterialTable::FromVariantMap(const QVariantMap& values) {
  for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
    bool ok = false;
    const double density = it.value().toDouble(&ok);
    if (ok) {
      SetDensity(it.key(), density);
    }
  }
}

}  // namespace stocknest
