#ifndef VIDEOWALLPAPERWINDOW_H
#define VIDEOWALLPAPERWINDOW_H

#include <QWidget>
#include <QMediaPlayer>
#include <QUrl>
#include "../core/WallpaperSurface.h"

class QAudioOutput;
class QVideoWidget;
class QScreen;

// Borderless, input-transparent window stacked below everything else that
// plays one video in an endless loop.
class VideoWallpaperWindow : public QWidget, public WallpaperSurface
{
    Q_OBJECT

public:
    VideoWallpaperWindow(const QRect& frame, const QUrl& source, double volume,
                         QScreen* screen = nullptr, QWidget* parent = nullptr);
    ~VideoWallpaperWindow() override;

    void play() override;
    void stop() override;
    void setVolume(double volume) override;
    double volume() const override;
    QUrl source() const override;

private slots:
    void onMediaStatusChanged(QMediaPlayer::MediaStatus status);
    void onPlayerError(QMediaPlayer::Error error, const QString& errorString);

private:
    void setupWindow(const QRect& frame, QScreen* screen);

    QVideoWidget* m_videoWidget;
    QMediaPlayer* m_player;
    QAudioOutput* m_audioOutput;
    QUrl m_source;
};

class VideoWallpaperWindowFactory : public WallpaperSurfaceFactory
{
public:
    std::unique_ptr<WallpaperSurface> create(const ScreenDescriptor& screen,
                                             const QRect& frame,
                                             const QUrl& source,
                                             double volume) override;

private:
    static QScreen* findScreen(const ScreenDescriptor& screen);
};

#endif // VIDEOWALLPAPERWINDOW_H
