// test_main.cpp - GoogleTest entry point for chalan-tests
//
// QtSql needs a QCoreApplication and QTextDocument layout needs a
// QGuiApplication, so one offscreen application wraps every test.

#include <gtest/gtest.h>

#include <QGuiApplication>
#include <QStandardPaths>

int main(int argc, char **argv)
{
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QStandardPaths::setTestModeEnabled(true);

    QGuiApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
