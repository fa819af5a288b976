#ifndef WALLPAPERCONTROLLER_H
#define WALLPAPERCONTROLLER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <optional>
#include "ScreenIdentity.h"

class SettingsStore;
class WallpaperEngine;
class DisplayProvider;

// Applies user actions from the UI to the settings store and the engine.
class WallpaperController : public QObject
{
    Q_OBJECT

public:
    WallpaperController(SettingsStore* store, WallpaperEngine* engine,
                        DisplayProvider* displays, QObject* parent = nullptr);

    // Start every enabled screen whose video is in the library
    void applyAll();

    void setEnabled(const ScreenDescriptor& screen, bool enabled);
    void selectVideo(const ScreenDescriptor& screen, const std::optional<QString>& videoId);

    // Turns every screen off and stops all playback
    void disableAll();

    int addVideos(const QStringList& paths);
    void removeVideo(const QString& videoId);

    // Enabled in settings and actually playing
    bool isActive(const ScreenDescriptor& screen) const;

    SettingsStore* store() const { return m_store; }
    WallpaperEngine* engine() const { return m_engine; }
    DisplayProvider* displays() const { return m_displays; }

private:
    bool startIfResolvable(const ScreenDescriptor& screen);

    SettingsStore* m_store;
    WallpaperEngine* m_engine;
    DisplayProvider* m_displays;
};

#endif // WALLPAPERCONTROLLER_H
