#include "stocknest/NestingSolver.h"

#include "stocknest/LinearPacker.h"
#include "stocknest/Logging.h"
#include "stocknest/SheetPacker.h"

#include <utility>

namespace stocknest {

namespace {

SheetNestingResult RunSheetPacker(const SheetNestingConfig& config,
                                  const MaterialTable& materials,
                                  const std::vector<SheetCapacity>& sheets,
                                  const std::vector<Part>& parts) {
  SheetPacker packer(config);
  packer.set_density_lookup(materials.AsLookup());
  return packer.Pack(sheets, parts);
}

LinearNestingResult RunLinearPacker(const LinearNestingConfig& config,
                                    const std::vector<LinearPart>& parts) {
  LinearPacker packer(config);
  return packer.Pack(parts);
}

}  // namespace

NestingSolver::NestingSolver(int threads)
    : pool_(std::make_unique<JobPool>(threads)) {}

NestingSolver::~NestingSolver() = default;

void NestingSolver::SetSheetConfig(const SheetNestingConfig& config) {
  sheet_config_ = config;
}

void NestingSolver::SetLinearConfig(const LinearNestingConfig& config) {
  linear_config_ = config;
}

void NestingSolver::SetMaterials(const MaterialTable& materials) {
  materials_ = materials;
}

SheetNestingResult NestingSolver::SolveSheets(
    const std::vector<SheetCapacity>& sheets, const std::vector<Part>& parts) {
  last_sheet_result_ = RunSheetPacker(sheet_config_, materials_, sheets, parts);
  qCDebug(lcSolver) << "sheet nesting used" << last_sheet_result_.layouts.size()
                    << "sheet(s)," << last_sheet_result_.unplaced_parts.size()
                    << "part row(s) unplaced";
  return last_sheet_result_;
}

LinearNestingResult NestingSolver::SolveLinear(
    const std::vector<LinearPart>& parts) {
  last_linear_result_ = RunLinearPacker(linear_config_, parts);
  qCDebug(lcSolver) << "linear nesting used"
                    << last_linear_result_.total_stock_used << "bar(s),"
                    << last_linear_result_.unplaced_parts.size()
                    << "part row(s) unplaced";
  return last_linear_result_;
}

boost::future<SheetNestingResult> NestingSolver::SubmitSheets(
    std::vector<SheetCapacity> sheets, std::vector<Part> parts) {
  return pool_->Submit([config = sheet_config_, materials = materials_,
                        sheets = std::move(sheets),
                        parts = std::move(parts)]() {
    return RunSheetPacker(config, materials, sheets, parts);
  });
}

boost::future<LinearNestingResult> NestingSolver::SubmitLinear(
    std::vector<LinearPart> parts) {
  return pool_->Submit([config = linear_config_, parts = std::move(parts)]() {
    return RunLinearPacker(config, parts);
  });
}

void NestingSolver::Reset() {
  last_sheet_result_ = SheetNestingResult();
  last_linear_result_ = LinearNestingResult();
}

}  // namespace stocknest
