#include "WallpaperEngine.h"
#include "ConfigManager.h"
#include "DisplayProvider.h"
#include "OneShotScheduler.h"
#include <QLoggingCategory>
#include <QPair>
#include <QList>
#include <algorithm>

Q_LOGGING_CATEGORY(wallpaperEngine, "app.engine")

WallpaperEngine::WallpaperEngine(DisplayProvider* displays,
                                 std::unique_ptr<WallpaperSurfaceFactory> surfaceFactory,
                                 std::unique_ptr<OneShotScheduler> scheduler,
                                 QObject* parent)
    : QObject(parent)
    , m_displays(displays)
    , m_surfaceFactory(std::move(surfaceFactory))
    , m_scheduler(std::move(scheduler))
    , m_volume(1.0)
{
    if (!m_scheduler) {
        m_scheduler = std::make_unique<QtOneShotScheduler>(this);
    }

    ConfigManager& config = ConfigManager::instance();
    if (config.hasVideoVolume()) {
        m_volume = std::clamp(config.videoVolume(), 0.0, 1.0);
    }

    if (m_displays) {
        connect(m_displays, &DisplayProvider::screensChanged, this, &WallpaperEngine::onScreensChanged);
        connect(m_displays, &DisplayProvider::systemResumed, this, &WallpaperEngine::onSystemResumed);
    }

    qCDebug(wallpaperEngine) << "Engine created with volume" << m_volume;
}

WallpaperEngine::~WallpaperEngine()
{
    stopAll();
}

bool WallpaperEngine::start(const QUrl& source, const ScreenDescriptor& screen)
{
    QString screenKey = ScreenIdentity::keyFor(screen);

    // At most one wallpaper per screen
    stop(screenKey);

    if (!source.isLocalFile()) {
        qCWarning(wallpaperEngine) << "Refusing non-local video source" << source << "for" << screenKey;
        return false;
    }

    if (!m_surfaceFactory) {
        qCWarning(wallpaperEngine) << "No surface factory configured";
        return false;
    }

    qCInfo(wallpaperEngine) << "Setting video for screen:" << screenKey << source.toLocalFile();

    QRect frame = ScreenIdentity::wallpaperFrame(screen);
    std::unique_ptr<WallpaperSurface> surface = m_surfaceFactory->create(screen, frame, source, m_volume);
    if (!surface) {
        qCWarning(wallpaperEngine) << "Failed to create wallpaper window for" << screenKey;
        return false;
    }

    surface->setVolume(m_volume);
    surface->play();

    ActiveWallpaper active;
    active.screen = screen;
    active.source = source;
    active.surface = std::move(surface);
    m_active[screenKey] = std::move(active);

    emit wallpaperStarted(screenKey);
    return true;
}

void WallpaperEngine::stop(const ScreenDescriptor& screen)
{
    stop(ScreenIdentity::keyFor(screen));
}

void WallpaperEngine::stop(const QString& screenKey)
{
    auto it = m_active.find(screenKey);
    if (it == m_active.end()) {
        return;
    }

    // Move the record out before releasing so re-entrant calls see a clean map
    std::unique_ptr<WallpaperSurface> surface = std::move(it->second.surface);
    m_active.erase(it);

    if (surface) {
        surface->stop();
    }
    surface.reset();

    qCDebug(wallpaperEngine) << "Stopped wallpaper on" << screenKey;
    emit wallpaperStopped(screenKey);
}

void WallpaperEngine::stopAll()
{
    for (const QString& screenKey : activeScreenKeys()) {
        stop(screenKey);
    }
}

bool WallpaperEngine::isRunning(const ScreenDescriptor& screen) const
{
    return isRunning(ScreenIdentity::keyFor(screen));
}

bool WallpaperEngine::isRunning(const QString& screenKey) const
{
    return m_active.find(screenKey) != m_active.end();
}

QStringList WallpaperEngine::activeScreenKeys() const
{
    QStringList keys;
    for (const auto& entry : m_active) {
        keys.append(entry.first);
    }
    return keys;
}

QUrl WallpaperEngine::sourceFor(const QString& screenKey) const
{
    auto it = m_active.find(screenKey);
    if (it == m_active.end()) {
        return QUrl();
    }
    return it->second.source;
}

void WallpaperEngine::setVolume(double volume)
{
    double clamped = std::clamp(volume, 0.0, 1.0);
    bool changed = !qFuzzyCompare(clamped + 1.0, m_volume + 1.0);
    m_volume = clamped;

    for (auto& entry : m_active) {
        if (entry.second.surface) {
            entry.second.surface->setVolume(m_volume);
        }
    }

    ConfigManager& config = ConfigManager::instance();
    config.setVideoVolume(m_volume);
    config.sync();

    if (changed) {
        emit volumeChanged(m_volume);
    }
}

void WallpaperEngine::reapply()
{
    QList<QPair<QString, QUrl>> previous;
    for (const auto& entry : m_active) {
        previous.append(qMakePair(entry.first, entry.second.source));
    }

    qCInfo(wallpaperEngine) << "Reapplying" << previous.size() << "wallpapers";

    stopAll();

    QList<ScreenDescriptor> screens = m_displays ? m_displays->screens() : QList<ScreenDescriptor>();
    for (const auto& item : previous) {
        const ScreenDescriptor* screen = ScreenIdentity::findByKey(screens, item.first);
        if (!screen) {
            qCInfo(wallpaperEngine) << "Screen" << item.first << "is no longer connected, dropping wallpaper";
            continue;
        }
        start(item.second, *screen);
    }

    emit reapplied();
}

void WallpaperEngine::onScreensChanged()
{
    qCInfo(wallpaperEngine) << "Screen configuration changed";
    m_scheduler->schedule(ScreenChangeSettleMs, [this]() { reapply(); });
}

void WallpaperEngine::onSystemResumed()
{
    qCInfo(wallpaperEngine) << "System woke from sleep";
    m_scheduler->schedule(WakeSettleMs, [this]() { reapply(); });
}
