// ============================================================================
// TimScope - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QStringList>
#include <QDebug>

#include "MainWindow.h"

// Test includes (desktop only)
#ifndef Q_OS_ANDROID
#include <QtTest/QtTest>
#include "core/ResolutionPyramidTests.h"
#include "core/ViewportGeometryTests.h"
#include "viewport/TileCacheTests.h"
#include "viewport/PreviewLayerTests.h"
#include "viewport/ImageViewportTests.h"
#include "tim/TimFileTests.h"
#include "tim/FrameAnimatorTests.h"
#endif

#ifdef Q_OS_WIN
#include <windows.h>
#endif

// ============================================================================
// Test Runners (Desktop Only)
// ============================================================================

#ifndef Q_OS_ANDROID
static int runTests(const QString& testType, const QStringList& qtestArgs)
{
#ifdef Q_OS_WIN
    AllocConsole();
    freopen("CONOUT$", "w", stdout);
    freopen("CONOUT$", "w", stderr);
#endif

    bool success = false;

    if (testType == "pyramid") {
        success = ResolutionPyramidTests::runAllTests();
    } else if (testType == "geometry") {
        success = ViewportGeometryTests::runAllTests();
    } else if (testType == "tile") {
        success = TileCacheTests::runAllTests();
    } else if (testType == "preview") {
        success = PreviewLayerTests::runAllTests();
    } else if (testType == "tim") {
        success = TimFileTests::runAllTests();
    } else if (testType == "viewport") {
        ImageViewportTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else if (testType == "animator") {
        FrameAnimatorTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else {
        qWarning() << "Unknown test suite:" << testType;
    }

    return success ? 0 : 1;
}
#endif

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("TimScope");
    app.setApplicationName("App");

    // ========== Parse Command Line Arguments ==========
    QStringList inputFiles;

#ifndef Q_OS_ANDROID
    QString testToRun;
    QStringList qtestArgs{QString::fromLocal8Bit(argv[0])};
#endif

    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);

#ifndef Q_OS_ANDROID
        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
            continue;
        }
        if (!testToRun.isEmpty()) {
            // Remaining arguments go to QTest (e.g. a single test function)
            qtestArgs << arg;
            continue;
        }
#endif
        if (!arg.startsWith("--")) {
            inputFiles << arg;
        }
    }

#ifndef Q_OS_ANDROID
    if (!testToRun.isEmpty()) {
        return runTests(testToRun, qtestArgs);
    }
#endif

    // ========== Launch Application ==========
    MainWindow w;
    w.show();
    if (!inputFiles.isEmpty()) {
        w.loadTimFiles(inputFiles);
    }
    return app.exec();
}
