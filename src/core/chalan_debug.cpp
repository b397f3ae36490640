#include "chalan_debug.h"

Q_LOGGING_CATEGORY(CHALAN_STORE,  "chalan.store",  QtInfoMsg)
Q_LOGGING_CATEGORY(CHALAN_CSV,    "chalan.csv",    QtInfoMsg)
Q_LOGGING_CATEGORY(CHALAN_PDF,    "chalan.pdf",    QtInfoMsg)
Q_LOGGING_CATEGORY(CHALAN_CONFIG, "chalan.config", QtInfoMsg)
Q_LOGGING_CATEGORY(CHALAN_GUI,    "chalan.gui",    QtInfoMsg)
Q_LOGGING_CATEGORY(CHALAN_CLI,    "chalan.cli",    QtInfoMsg)
