#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcSheetPacker)
Q_DECLARE_LOGGING_CATEGORY(lcLinearPacker)
Q_DECLARE_LOGGING_CATEGORY(lcSolver)
Q_DECLARE_LOGGING_CATEGORY(lcJsonIo)
