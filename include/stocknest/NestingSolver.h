#pragma once

#include "stocknest/JobPool.h"
#include "stocknest/MaterialTable.h"
#include "stocknest/NestingConfig.h"
#include "stocknest/NestingTypes.h"

#include <boost/thread/future.hpp>

#include <memory>
#include <vector>

namespace stocknest {

class NestingSolver {
 public:
  explicit NestingSolver(int threads = 1);
  ~NestingSolver();

  const SheetNestingConfig& sheet_config() const { return sheet_config_; }
  void SetSheetConfig(const SheetNestingConfig& config);

  const LinearNestingConfig& linear_config() const { return linear_config_; }
  void SetLinearConfig(const LinearNestingConfig& config);

  const MaterialTable& materials() const { return materials_; }
  void SetMaterials(const MaterialTable& materials);

  SheetNestingResult SolveSheets(const std::vector<SheetCapacity>& sheets,
                                 const std::vector<Part>& parts);
  LinearNestingResult SolveLinear(const std::vector<LinearPart>& parts);

  // Runs the packer on the worker pool. Inputs and settings are copied at
  // submission, so later setter calls do not affect a pending job.
  boost::future<SheetNestingResult> SubmitSheets(
      std::vector<SheetCapacity> sheets, std::vector<Part> parts);
  boost::future<LinearNestingResult> SubmitLinear(
      std::vector<LinearPart> parts);

  const SheetNestingResult& last_sheet_result() const {
    return last_sheet_result_;
  }
  const LinearNestingResult& last_linear_result() const {
    return last_linear_result_;
  }

  int threads() const { return pool_->thread_count(); }
  void Reset();

 private:
  SheetNestingConfig sheet_config_;
  LinearNestingConfig linear_config_;
  MaterialTable materials_;
  std::unique_ptr<JobPool> pool_;
  SheetNestingResult last_sheet_result_;
  LinearNestingResult last_linear_result_;
};

}  // namespace stocknest
