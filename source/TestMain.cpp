// ============================================================================
// SyncView - Test Runner
// ============================================================================
// Runs every QtTest suite, or a single one:
//   syncview_tests --test-eventbus
//   syncview_tests --test-pagestate
//   syncview_tests --test-locator
//   syncview_tests --test-visibility
//   syncview_tests --test-coordinator
//   syncview_tests --test-stackview
//   syncview_tests --test-thumbnails
// Remaining arguments are passed on to QTest.
// ============================================================================

#include <QApplication>
#include <QTest>
#include <QStringList>
#include <QDebug>

#include "core/NavigationEventBusTests.h"
#include "core/PageStateStoreTests.h"
#include "core/ElementLocatorTests.h"
#include "core/VisibilityTrackerTests.h"
#include "core/NavigationCoordinatorTests.h"
#include "viewport/DocumentStackViewTests.h"
#include "ui/sidebars/ThumbnailRailTests.h"

template <typename Suite>
static int runSuite(const QStringList& args)
{
    Suite suite;
    return QTest::qExec(&suite, args);
}

static int runTests(const QString& testType, const QStringList& args)
{
    if (testType == "eventbus") {
        return runSuite<NavigationEventBusTests>(args);
    } else if (testType == "pagestate") {
        return runSuite<PageStateStoreTests>(args);
    } else if (testType == "locator") {
        return runSuite<ElementLocatorTests>(args);
    } else if (testType == "visibility") {
        return runSuite<VisibilityTrackerTests>(args);
    } else if (testType == "coordinator") {
        return runSuite<NavigationCoordinatorTests>(args);
    } else if (testType == "stackview") {
        return runSuite<DocumentStackViewTests>(args);
    } else if (testType == "thumbnails") {
        return runSuite<ThumbnailRailTests>(args);
    }

    qWarning() << "TestMain: unknown test suite" << testType;
    return 1;
}

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("SyncView");
    app.setApplicationName("Tests");

    QString testToRun;
    QStringList qtestArgs;
    qtestArgs << QString::fromLocal8Bit(argv[0]);

    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
        } else {
            qtestArgs << arg;
        }
    }

    if (!testToRun.isEmpty()) {
        return runTests(testToRun, qtestArgs);
    }

    static const QStringList allSuites = {
        "eventbus", "pagestate", "locator", "visibility",
        "coordinator", "stackview", "thumbnails"
    };

    int failures = 0;
    for (const QString& suite : allSuites) {
        failures += runTests(suite, qtestArgs) != 0 ? 1 : 0;
    }
    return failures;
}
