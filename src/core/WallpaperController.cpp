#include "WallpaperController.h"
#include "SettingsStore.h"
#include "WallpaperEngine.h"
#include "DisplayProvider.h"
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(wallpaperController, "app.controller")

WallpaperController::WallpaperController(SettingsStore* store, WallpaperEngine* engine,
                                         DisplayProvider* displays, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_engine(engine)
    , m_displays(displays)
{
}

void WallpaperController::applyAll()
{
    if (!m_displays) {
        return;
    }

    for (const ScreenDescriptor& screen : m_displays->screens()) {
        ScreenSettings settings = m_store->getSettings(ScreenIdentity::keyFor(screen));
        if (!settings.isEnabled) {
            continue;
        }
        if (startIfResolvable(screen)) {
            qCInfo(wallpaperController) << "Auto-starting wallpaper for" << screen.name;
        }
    }
}

void WallpaperController::setEnabled(const ScreenDescriptor& screen, bool enabled)
{
    QString screenKey = ScreenIdentity::keyFor(screen);
    ScreenSettings settings = m_store->getSettings(screenKey);
    settings.isEnabled = enabled;
    m_store->updateSettings(screenKey, settings);

    if (enabled) {
        if (!startIfResolvable(screen)) {
            qCDebug(wallpaperController) << "Nothing to play on" << screenKey;
            m_engine->stop(screenKey);
        }
    } else {
        m_engine->stop(screenKey);
    }
}

void WallpaperController::selectVideo(const ScreenDescriptor& screen, const std::optional<QString>& videoId)
{
    QString screenKey = ScreenIdentity::keyFor(screen);
    ScreenSettings settings = m_store->getSettings(screenKey);
    settings.videoFileId = videoId;
    m_store->updateSettings(screenKey, settings);

    if (!settings.isEnabled || !startIfResolvable(screen)) {
        m_engine->stop(screenKey);
    }
}

void WallpaperController::disableAll()
{
    for (const QString& screenKey : m_store->screenKeys()) {
        ScreenSettings settings = m_store->getSettings(screenKey);
        if (settings.isEnabled) {
            settings.isEnabled = false;
            m_store->updateSettings(screenKey, settings);
        }
    }

    m_engine->stopAll();
    qCInfo(wallpaperController) << "All wallpapers disabled";
}

int WallpaperController::addVideos(const QStringList& paths)
{
    int added = 0;
    for (const QString& path : paths) {
        if (m_store->addVideo(path)) {
            ++added;
        }
    }
    return added;
}

void WallpaperController::removeVideo(const QString& videoId)
{
    const QStringList clearedKeys = m_store->removeVideo(videoId);
    for (const QString& screenKey : clearedKeys) {
        m_engine->stop(screenKey);
    }
}

bool WallpaperController::isActive(const ScreenDescriptor& screen) const
{
    return m_store->getSettings(ScreenIdentity::keyFor(screen)).isEnabled && m_engine->isRunning(screen);
}

bool WallpaperController::startIfResolvable(const ScreenDescriptor& screen)
{
    ScreenSettings settings = m_store->getSettings(ScreenIdentity::keyFor(screen));
    if (!settings.videoFileId) {
        return false;
    }

    std::optional<VideoFile> video = m_store->videoById(*settings.videoFileId);
    if (!video) {
        qCWarning(wallpaperController) << "Screen" << screen.name << "references unknown video" << *settings.videoFileId;
        return false;
    }

    return m_engine->start(video->url(), screen);
}
