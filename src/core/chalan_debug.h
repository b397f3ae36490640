// chalan_debug.h - Logging categories shared by the core library, GUI and CLI

#ifndef CHALAN_DEBUG_H
#define CHALAN_DEBUG_H

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(CHALAN_STORE)
Q_DECLARE_LOGGING_CATEGORY(CHALAN_CSV)
Q_DECLARE_LOGGING_CATEGORY(CHALAN_PDF)
Q_DECLARE_LOGGING_CATEGORY(CHALAN_CONFIG)
Q_DECLARE_LOGGING_CATEGORY(CHALAN_GUI)
Q_DECLARE_LOGGING_CATEGORY(CHALAN_CLI)

#endif // CHALAN_DEBUG_H
