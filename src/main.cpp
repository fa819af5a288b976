#include <QApplication>
#include <QMessageBox>
#include <QStyleFactory>
#include <QDir>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QStandardPaths>
#include <QLoggingCategory>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QSystemTrayIcon>
#include <memory>
#include <unistd.h>
#include <cstdlib>
#include <cstdio>
#include "ui/MainWindow.h"
#include "core/ConfigManager.h"
#include "core/SettingsStore.h"
#include "core/WallpaperEngine.h"
#include "core/WallpaperController.h"
#include "platform/QtDisplayProvider.h"
#include "platform/VideoWallpaperWindow.h"

// Logging categories
Q_LOGGING_CATEGORY(appMain, "app.main")

static void setupLogging()
{
    qSetMessagePattern("[%{time hh:mm:ss.zzz}] [%{category}] %{if-debug}D%{endif}%{if-info}I%{endif}%{if-warning}W%{endif}%{if-critical}C%{endif}: %{message}");

    // Enable debug logging for our app but filter out Qt noise
    QLoggingCategory::setFilterRules(
        "*.debug=false\n"
        "app.*.debug=true\n"
        "qt.*.debug=false"
    );
}

static bool checkSudoStatus()
{
    if (getuid() == 0) {
        return false;
    }

    if (std::getenv("SUDO_UID") != nullptr || std::getenv("SUDO_USER") != nullptr) {
        return false;
    }

    return true;
}

static void showSudoWarning()
{
    int argc = 0;
    QApplication app(argc, nullptr);

    QMessageBox msgBox;
    msgBox.setIcon(QMessageBox::Critical);
    msgBox.setWindowTitle("WallpaperFree - Permission Error");
    msgBox.setText("This application should not be run with sudo/root privileges!");
    msgBox.setInformativeText(
        "Video wallpapers run inside your desktop session.\n\n"
        "Please run this application as a normal user:\n"
        "$ wallpaperfree");
    msgBox.setStandardButtons(QMessageBox::Ok);
    msgBox.exec();
}

static void createConfigDirectory()
{
    QString configDir = ConfigManager::instance().configDir();

    QDir dir;
    if (!dir.exists(configDir)) {
        if (!dir.mkpath(configDir)) {
            qCCritical(appMain) << "Failed to create config directory:" << configDir;
        } else {
            qCInfo(appMain) << "Created config directory:" << configDir;
        }
    }
}

static void setupApplicationMetadata()
{
    QApplication::setApplicationName("WallpaperFree");
    QApplication::setApplicationDisplayName("WallpaperFree");
    QApplication::setApplicationVersion("1.0.0");
    QApplication::setOrganizationName("WallpaperFree");
    QApplication::setDesktopFileName("wallpaperfree");
}

static void setupApplicationStyle(QApplication &app)
{
    if (QStyleFactory::keys().contains("Fusion", Qt::CaseInsensitive)) {
        app.setStyle(QStyleFactory::create("Fusion"));
        qCInfo(appMain) << "Using style: Fusion";
    }
}

static void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    QString category = context.category ? QString(context.category) : QString();

    QString txt;
    switch (type) {
    case QtDebugMsg:
        txt = QString("Debug: %1").arg(msg);
        break;
    case QtWarningMsg:
        txt = QString("Warning: %1").arg(msg);
        break;
    case QtCriticalMsg:
        txt = QString("Critical: %1").arg(msg);
        break;
    case QtFatalMsg:
        txt = QString("Fatal: %1").arg(msg);
        break;
    case QtInfoMsg:
        txt = QString("Info: %1").arg(msg);
        break;
    }

    if (!category.isEmpty() && category != "default") {
        txt = QString("[%1] %2").arg(category, txt);
    }

    // Print to console for important messages
    if (type != QtDebugMsg || category.startsWith("app.")) {
        fprintf(stderr, "%s\n", qFormatLogMessage(type, context, msg).toLocal8Bit().constData());
        fflush(stderr);
    }

    // Write info and above to the log file
    if (type != QtDebugMsg) {
        static QFile logFile(ConfigManager::instance().configDir() + "/debug.log");
        if (!logFile.isOpen()) {
            logFile.open(QIODevice::WriteOnly | QIODevice::Append);
        }
        if (logFile.isOpen()) {
            QTextStream stream(&logFile);
            stream << QDateTime::currentDateTime().toString(Qt::ISODate) << " " << txt << Qt::endl;
            stream.flush();
        }
    }

    if (type == QtFatalMsg) {
        abort();
    }
}

int main(int argc, char *argv[])
{
    // Check sudo status before creating QApplication
    if (!checkSudoStatus()) {
        showSudoWarning();
        return 1;
    }

    QApplication app(argc, argv);

    setupLogging();
    setupApplicationMetadata();

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Looping video wallpapers for every connected screen");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption debugOption(QStringList() << "d" << "debug",
        "Enable debug output");
    parser.addOption(debugOption);

    QCommandLineOption configOption(QStringList() << "c" << "config",
        "Use custom config file", "config");
    parser.addOption(configOption);

    QCommandLineOption minimizedOption(QStringList() << "m" << "minimized",
        "Start minimized to system tray");
    parser.addOption(minimizedOption);

    parser.process(app);

    if (parser.isSet(debugOption)) {
        QLoggingCategory::setFilterRules("*.debug=true");
        qCInfo(appMain) << "All debug logging enabled via command line";
    }

    ConfigManager &config = ConfigManager::instance();

    // Use custom config file if specified
    if (parser.isSet(configOption)) {
        QString configFile = parser.value(configOption);
        qCInfo(appMain) << "Using custom config file:" << configFile;
        config.setConfigFile(configFile);
    }

    createConfigDirectory();
    qInstallMessageHandler(messageHandler);

    qCInfo(appMain) << "Starting" << QApplication::applicationDisplayName()
                    << "version" << QApplication::applicationVersion();
    qCInfo(appMain) << "Config file:" << config.configFilePath();
    qCInfo(appMain) << "Using Qt version:" << qVersion();

    setupApplicationStyle(app);

    QtDisplayProvider displays;
    WallpaperEngine engine(&displays, std::make_unique<VideoWallpaperWindowFactory>());

    SettingsStore store;
    store.load();

    WallpaperController controller(&store, &engine, &displays);

    // Wallpapers keep running while the window lives in the tray
    if (QSystemTrayIcon::isSystemTrayAvailable()) {
        app.setQuitOnLastWindowClosed(false);
    }

    MainWindow window(&controller);

    bool startMinimized = parser.isSet(minimizedOption);
    window.setStartMinimized(startMinimized);

    controller.applyAll();

    if (!startMinimized || !QSystemTrayIcon::isSystemTrayAvailable()) {
        window.show();
    } else {
        qCInfo(appMain) << "Starting minimized to system tray";
    }

    int result = app.exec();

    engine.stopAll();
    config.sync();

    qCInfo(appMain) << "Application exiting with code:" << result;
    return result;
}
