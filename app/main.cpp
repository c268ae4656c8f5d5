#include "stocknest/JsonIo.h"
#include "stocknest/LayoutSummary.h"
#include "stocknest/NestingSolver.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QJsonObject>

#include <exception>
#include <iostream>

using namespace stocknest;

namespace {

enum class Mode { kSheet, kLinear, kBoth };

bool ParseMode(const QString& value, Mode* mode) {
  const QString normalized = value.trimmed().toLower();
  if (normalized == QStringLiteral("sheet")) {
    *mode = Mode::kSheet;
  } else if (normalized == QStringLiteral("linear")) {
    *mode = Mode::kLinear;
  } else if (normalized == QStringLiteral("both")) {
    *mode = Mode::kBoth;
  } else {
    return false;
  }
  return true;
}

void ReportUnplaced(const SheetNestingResult& result) {
  for (const auto& part : result.unplaced_parts) {
    std::cerr << "warning: part " << part.original_id << " ("
              << part.name.toStdString() << "): " << part.quantity
              << " unit(s) not placed\n";
  }
}

void ReportUnplaced(const LinearNestingResult& result) {
  for (const auto& part : result.unplaced_parts) {
    std::cerr << "warning: linear part " << part.id << " ("
              << part.raw_material.toStdString() << "): " << part.quantity
              << " unit(s) not cut\n";
  }
}

}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName(QStringLiteral("stocknest-cli"));
  QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

  QCommandLineParser parser;
  parser.setApplicationDescription(
      QStringLiteral("Sheet and bar cutting-stock nesting"));
  parser.addHelpOption();
  parser.addVersionOption();

  QCommandLineOption mode_option(QStringLiteral("mode"),
                                 QStringLiteral("sheet, linear or both"),
                                 QStringLiteral("mode"), QStringLiteral("both"));
  QCommandLineOption output_option({QStringLiteral("o"), QStringLiteral("output")},
                                   QStringLiteral("JSON output file"),
                                   QStringLiteral("output"));
  QCommandLineOption seed_option(QStringLiteral("seed"),
                                 QStringLiteral("Seed of the bar search"),
                                 QStringLiteral("seed"));
  QCommandLineOption waste_option(QStringLiteral("minimize-waste"),
                                  QStringLiteral("Search bar orders for less waste"));
  QCommandLineOption threads_option(QStringLiteral("threads"),
                                    QStringLiteral("Worker threads"),
                                    QStringLiteral("threads"), QStringLiteral("2"));

  parser.addOption(mode_option);
  parser.addOption(output_option);
  parser.addOption(seed_option);
  parser.addOption(waste_option);
  parser.addOption(threads_option);
  parser.addPositionalArgument(QStringLiteral("job"),
                               QStringLiteral("JSON job file"));

  parser.process(app);

  const QStringList positional = parser.positionalArguments();
  if (positional.size() != 1) {
    std::cerr << "expected exactly one job file\n";
    parser.showHelp(2);
  }

  Mode mode = Mode::kBoth;
  if (!ParseMode(parser.value(mode_option), &mode)) {
    std::cerr << "unknown mode: " << parser.value(mode_option).toStdString()
              << '\n';
    return 2;
  }

  try {
    NestingJob job = LoadJobFile(positional.front());
    if (parser.isSet(seed_option)) {
      job.linear_config.set_random_seed(parser.value(seed_option).toUInt());
    }
    if (parser.isSet(waste_option)) {
      job.linear_config.set_optimization_goal(OptimizationGoal::kMinimizeWaste);
    }

    NestingSolver solver(parser.value(threads_option).toInt());
    solver.SetSheetConfig(job.sheet_config);
    solver.SetLinearConfig(job.linear_config);
    solver.SetMaterials(job.materials);

    const bool run_sheets = mode != Mode::kLinear;
    const bool run_linear = mode != Mode::kSheet;

    boost::future<SheetNestingResult> sheet_future;
    boost::future<LinearNestingResult> linear_future;
    if (run_sheets) {
      sheet_future = solver.SubmitSheets(job.sheets, job.parts);
    }
    if (run_linear) {
      linear_future = solver.SubmitLinear(job.linear_parts);
    }

    QJsonObject root;
    if (run_sheets) {
      const SheetNestingResult result = sheet_future.get();
      ReportUnplaced(result);
      QJsonObject sheets = ToJson(result);
      sheets.insert(QStringLiteral("groups"), ToJson(GroupSheetLayouts(result)));
      root.insert(QStringLiteral("sheet"), sheets);
    }
    if (run_linear) {
      const LinearNestingResult result = linear_future.get();
      ReportUnplaced(result);
      QJsonObject linear = ToJson(result);
      linear.insert(QStringLiteral("groups"), ToJson(GroupStockLayouts(result)));
      root.insert(QStringLiteral("linear"), linear);
    }

    if (parser.isSet(output_option)) {
      WriteJsonFile(parser.value(output_option), root);
    } else {
      std::cout << QJsonDocument(root).toJson(QJsonDocument::Indented).constData();
    }
  } catch (const std::exception& error) {
    std::cerr << "stocknest-cli: " << error.what() << '\n';
    return 1;
  }
  return 0;
}
