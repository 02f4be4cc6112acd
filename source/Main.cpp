// ============================================================================
// SyncView - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QSettings>
#include <QDebug>

#include "MainWindow.h"
#include "core/NavigationConfig.h"
#include "core/NavigationTypes.h"

// ============================================================================
// Command Line Helpers
// ============================================================================

static void printUsage()
{
    qInfo().noquote()
        << "Usage: syncview [options]\n"
           "  --files N          Number of placeholder documents (default 3)\n"
           "  --pages M          Pages per document (default 12)\n"
           "  --threshold R      Visibility ratio a page must exceed to become active\n"
           "  --max-attempts K   Scroll attempts before navigation gives up\n"
           "  --save-settings    Persist the resulting navigation settings";
}

static bool parseIntArg(const QString& name, const char* value, int& out)
{
    bool ok = false;
    const int parsed = QString::fromLocal8Bit(value).toInt(&ok);
    if (!ok) {
        qWarning() << "Main: invalid value for" << name << ":" << value;
        return false;
    }
    out = parsed;
    return true;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("SyncView");
    app.setApplicationName("App");

    registerNavigationMetaTypes();

    // ========== Parse Command Line Arguments ==========
    NavigationConfig config = NavigationConfig::loadFromDefaultSettings();
    int fileCount = 3;
    int pageCount = 12;
    bool saveSettings = false;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--files" && i + 1 < argc) {
            if (!parseIntArg(arg, argv[++i], fileCount)) {
                return 1;
            }
        } else if (arg == "--pages" && i + 1 < argc) {
            if (!parseIntArg(arg, argv[++i], pageCount)) {
                return 1;
            }
        } else if (arg == "--max-attempts" && i + 1 < argc) {
            if (!parseIntArg(arg, argv[++i], config.maxAttempts)) {
                return 1;
            }
        } else if (arg == "--threshold" && i + 1 < argc) {
            bool ok = false;
            config.dominanceThreshold = QString::fromLocal8Bit(argv[++i]).toDouble(&ok);
            if (!ok) {
                qWarning() << "Main: invalid value for --threshold";
                return 1;
            }
        } else if (arg == "--save-settings") {
            saveSettings = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            qWarning() << "Main: ignoring unknown argument" << arg;
        }
    }

    config = config.sanitized();
    fileCount = qMax(1, fileCount);
    pageCount = qMax(1, pageCount);

    if (saveSettings) {
        QSettings settings("SyncView", "App");
        config.save(settings);
    }

    // ========== Launch Application ==========
    auto* w = new MainWindow(config);
    w->setAttribute(Qt::WA_DeleteOnClose);
    w->loadDemoFiles(fileCount, pageCount);
    w->show();

    return app.exec();
}
