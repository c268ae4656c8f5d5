#include "stocknest/Logging.h"

Q_LOGGING_CATEGORY(lcSheetPacker, "stocknest.sheet")
Q_LOGGING_CATEGORY(lcLinearPacker, "stocknest.linear")
Q_LOGGING_CATEGORY(lcSolver, "stocknest.solver")
Q_LOGGING_CATEGORY(lcJsonIo, "stocknest.io")
