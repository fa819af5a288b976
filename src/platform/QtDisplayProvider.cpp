#include "QtDisplayProvider.h"
#include <QGuiApplication>
#include <QScreen>
#include <QDBusConnection>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(displayProvider, "app.displays")

QtDisplayProvider::QtDisplayProvider(QObject* parent)
    : DisplayProvider(parent)
{
    if (qGuiApp) {
        connect(qGuiApp, &QGuiApplication::screenAdded, this, &QtDisplayProvider::onScreenAdded);
        connect(qGuiApp, &QGuiApplication::screenRemoved, this, &QtDisplayProvider::onScreenRemoved);
        connect(qGuiApp, &QGuiApplication::primaryScreenChanged, this, &DisplayProvider::screensChanged);

        for (QScreen* screen : QGuiApplication::screens()) {
            watchScreen(screen);
        }
    } else {
        qCWarning(displayProvider) << "Created before QGuiApplication - screen signals not connected";
    }

    // logind announces both suspend and resume through PrepareForSleep
    bool connected = QDBusConnection::systemBus().connect(QStringLiteral("org.freedesktop.login1"),
                                                          QStringLiteral("/org/freedesktop/login1"),
                                                          QStringLiteral("org.freedesktop.login1.Manager"),
                                                          QStringLiteral("PrepareForSleep"),
                                                          this, SLOT(onPrepareForSleep(bool)));
    if (!connected) {
        qCWarning(displayProvider) << "Could not subscribe to logind sleep notifications,"
                                   << "wallpapers will not be rebuilt after resume";
    }
}

QtDisplayProvider::~QtDisplayProvider()
{
    if (qGuiApp) {
        disconnect(qGuiApp, nullptr, this, nullptr);
    }
}

QList<ScreenDescriptor> QtDisplayProvider::enumerateScreens() const
{
    return describeAll();
}

QList<ScreenDescriptor> QtDisplayProvider::describeAll()
{
    QList<ScreenDescriptor> result;
    for (const QScreen* screen : QGuiApplication::screens()) {
        result.append(describe(screen));
    }
    return result;
}

ScreenDescriptor QtDisplayProvider::describe(const QScreen* screen)
{
    ScreenDescriptor descriptor;
    if (!screen) {
        return descriptor;
    }

    // Prefer the EDID serial, the connector name survives when it is missing
    descriptor.hardwareId = screen->serialNumber().trimmed();
    if (descriptor.hardwareId.isEmpty()) {
        descriptor.hardwareId = screen->name().trimmed();
    }
    descriptor.connector = screen->name().trimmed();

    QString model = screen->model().trimmed();
    if (!model.isEmpty()) {
        descriptor.name = QString("%1 (%2)").arg(model, screen->name());
    } else {
        descriptor.name = screen->name();
    }

    descriptor.geometry = screen->geometry();
    descriptor.availableGeometry = screen->availableGeometry();
    descriptor.primary = (screen == QGuiApplication::primaryScreen());
    return descriptor;
}

void QtDisplayProvider::onScreenAdded(QScreen* screen)
{
    qCInfo(displayProvider) << "Screen added:" << screen->name();
    watchScreen(screen);
    emit screensChanged();
}

void QtDisplayProvider::onScreenRemoved(QScreen* screen)
{
    qCInfo(displayProvider) << "Screen removed:" << screen->name();
    disconnect(screen, nullptr, this, nullptr);
    emit screensChanged();
}

void QtDisplayProvider::onPrepareForSleep(bool goingToSleep)
{
    if (goingToSleep) {
        // System going to sleep - nothing to do
        return;
    }

    qCInfo(displayProvider) << "System resumed from sleep";
    emit systemResumed();
}

void QtDisplayProvider::watchScreen(QScreen* screen)
{
    connect(screen, &QScreen::geometryChanged, this, &DisplayProvider::screensChanged);
    connect(screen, &QScreen::availableGeometryChanged, this, &DisplayProvider::screensChanged);
}
