#pragma once

#include "stocknest/NestingTypes.h"

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVariantMap>

#include <optional>

namespace stocknest {

// Grade -> density (kg/m^3) table. Grades are matched case-insensitively.
class MaterialTable {
 public:
  // Pre-populated with MS, SS, AL and GI.
  MaterialTable();

  static MaterialTable Empty();

  void SetDensity(const QString& grade, double density);
  void Remove(const QString& grade);
  void Clear() { densities_.clear(); }

  std::optional<double> Density(const QString& grade) const;
  double DensityOr(const QString& grade, double fallback) const;
  bool Contains(const QString& grade) const;
  QStringList grades() const;

  DensityLookup AsLookup() const;

  QVariantMap ToVariantMap() const;
  void FromVariantMap(const QVariantMap& values);

 private:
  static QString Normalize(const QString& grade);

  QHash<QString, double> densities_;
};

}  // namespace stocknest
