#pragma once

#include "stocknest/NestingTypes.h"

#include <vector>

namespace stocknest {

// Throw std::invalid_argument naming the offending record when an input
// invariant is broken. Packers call these before touching any state.
void ValidatePart(const Part& part);
void ValidateSheet(const SheetCapacity& sheet);
void ValidateLinearPart(const LinearPart& part);

void ValidateSheetInput(const std::vector<SheetCapacity>& sheets,
                        const std::vector<Part>& parts);
void ValidateLinearInput(const std::vector<LinearPart>& parts);

}  // namespace stocknest
