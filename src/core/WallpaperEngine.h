#ifndef WALLPAPERENGINE_H
#define WALLPAPERENGINE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <map>
#include <memory>
#include "ScreenIdentity.h"
#include "WallpaperSurface.h"

class DisplayProvider;
class OneShotScheduler;

class WallpaperEngine : public QObject
{
    Q_OBJECT

public:
    // Time given to the OS to settle display enumeration before reapplying
    static constexpr int ScreenChangeSettleMs = 500;
    static constexpr int WakeSettleMs = 1000;

    WallpaperEngine(DisplayProvider* displays,
                    std::unique_ptr<WallpaperSurfaceFactory> surfaceFactory,
                    std::unique_ptr<OneShotScheduler> scheduler = nullptr,
                    QObject* parent = nullptr);
    ~WallpaperEngine() override;

    bool start(const QUrl& source, const ScreenDescriptor& screen);
    void stop(const ScreenDescriptor& screen);
    void stop(const QString& screenKey);
    void stopAll();

    bool isRunning(const ScreenDescriptor& screen) const;
    bool isRunning(const QString& screenKey) const;
    QStringList activeScreenKeys() const;
    QUrl sourceFor(const QString& screenKey) const;

    double volume() const { return m_volume; }
    void setVolume(double volume);

    // Tears down every active wallpaper and restarts those whose screen is
    // still connected.
    void reapply();

signals:
    void volumeChanged(double volume);
    void wallpaperStarted(const QString& screenKey);
    void wallpaperStopped(const QString& screenKey);
    void reapplied();

private slots:
    void onScreensChanged();
    void onSystemResumed();

private:
    struct ActiveWallpaper {
        ScreenDescriptor screen;
        QUrl source;
        std::unique_ptr<WallpaperSurface> surface;
    };

    DisplayProvider* m_displays;
    std::unique_ptr<WallpaperSurfaceFactory> m_surfaceFactory;
    std::unique_ptr<OneShotScheduler> m_scheduler;
    std::map<QString, ActiveWallpaper> m_active;
    double m_volume;
};

#endif // WALLPAPERENGINE_H
