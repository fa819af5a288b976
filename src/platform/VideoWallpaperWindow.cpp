#include "VideoWallpaperWindow.h"
#include "QtDisplayProvider.h"
#include <QAudioOutput>
#include <QVideoWidget>
#include <QVBoxLayout>
#include <QGuiApplication>
#include <QScreen>
#include <QWindow>
#include <QFileInfo>
#include <QPalette>
#include <QLoggingCategory>
#include <algorithm>

Q_LOGGING_CATEGORY(wallpaperSurface, "app.surface")

VideoWallpaperWindow::VideoWallpaperWindow(const QRect& frame, const QUrl& source, double volume,
                                           QScreen* screen, QWidget* parent)
    : QWidget(parent, Qt::Window
                      | Qt::FramelessWindowHint
                      | Qt::WindowStaysOnBottomHint
                      | Qt::WindowDoesNotAcceptFocus
                      | Qt::WindowTransparentForInput)
    , m_videoWidget(new QVideoWidget(this))
    , m_player(new QMediaPlayer(this))
    , m_audioOutput(new QAudioOutput(this))
    , m_source(source)
{
    setupWindow(frame, screen);

    m_videoWidget->setAspectRatioMode(Qt::KeepAspectRatioByExpanding);
    m_videoWidget->setAttribute(Qt::WA_TransparentForMouseEvents, true);

    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);
    layout->addWidget(m_videoWidget);

    m_audioOutput->setVolume(static_cast<float>(std::clamp(volume, 0.0, 1.0)));
    m_player->setAudioOutput(m_audioOutput);
    m_player->setVideoOutput(m_videoWidget);

    // The player restarts the same source by itself, no end-of-media handling needed
    m_player->setLoops(QMediaPlayer::Infinite);

    connect(m_player, &QMediaPlayer::mediaStatusChanged, this, &VideoWallpaperWindow::onMediaStatusChanged);
    connect(m_player, &QMediaPlayer::errorOccurred, this, &VideoWallpaperWindow::onPlayerError);

    m_player->setSource(m_source);
}

VideoWallpaperWindow::~VideoWallpaperWindow()
{
    m_player->stop();
    m_player->setVideoOutput(nullptr);
    qCDebug(wallpaperSurface) << "Released wallpaper window for" << m_source.fileName();
}

void VideoWallpaperWindow::setupWindow(const QRect& frame, QScreen* screen)
{
    setAttribute(Qt::WA_X11NetWmWindowTypeDesktop, true);
    setAttribute(Qt::WA_ShowWithoutActivating, true);
    setAttribute(Qt::WA_TransparentForMouseEvents, true);
    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setFocusPolicy(Qt::NoFocus);

    QPalette pal = palette();
    pal.setColor(QPalette::Window, Qt::black);
    setPalette(pal);
    setAutoFillBackground(true);

    if (screen) {
        winId();
        if (QWindow* window = windowHandle()) {
            window->setScreen(screen);
        }
    }
    setGeometry(frame);
}

void VideoWallpaperWindow::play()
{
    if (!isVisible()) {
        show();
        lower();
    }
    m_player->play();
}

void VideoWallpaperWindow::stop()
{
    m_player->pause();
    hide();
}

void VideoWallpaperWindow::setVolume(double volume)
{
    m_audioOutput->setVolume(static_cast<float>(std::clamp(volume, 0.0, 1.0)));
}

double VideoWallpaperWindow::volume() const
{
    return m_audioOutput->volume();
}

QUrl VideoWallpaperWindow::source() const
{
    return m_source;
}

void VideoWallpaperWindow::onMediaStatusChanged(QMediaPlayer::MediaStatus status)
{
    if (status == QMediaPlayer::InvalidMedia) {
        qCWarning(wallpaperSurface) << "Invalid media, wallpaper stays black:" << m_source.toLocalFile();
    } else if (status == QMediaPlayer::LoadedMedia) {
        qCDebug(wallpaperSurface) << "Loaded" << m_source.fileName()
                                  << "has video:" << m_player->hasVideo();
    }
}

void VideoWallpaperWindow::onPlayerError(QMediaPlayer::Error error, const QString& errorString)
{
    if (error != QMediaPlayer::NoError) {
        qCWarning(wallpaperSurface) << "Player error" << int(error) << errorString
                                    << "for" << m_source.toLocalFile();
    }
}

std::unique_ptr<WallpaperSurface> VideoWallpaperWindowFactory::create(const ScreenDescriptor& screen,
                                                                      const QRect& frame,
                                                                      const QUrl& source,
                                                                      double volume)
{
    if (!source.isLocalFile() || !QFileInfo::exists(source.toLocalFile())) {
        qCWarning(wallpaperSurface) << "Video file not found:" << source;
        return nullptr;
    }

    if (!frame.isValid()) {
        qCWarning(wallpaperSurface) << "Screen" << screen.name << "has no usable geometry";
        return nullptr;
    }

    qCDebug(wallpaperSurface) << "Creating wallpaper window on" << screen.name << "at" << frame;
    return std::make_unique<VideoWallpaperWindow>(frame, source, volume, findScreen(screen));
}

QScreen* VideoWallpaperWindowFactory::findScreen(const ScreenDescriptor& screen)
{
    // Same key rules as QtDisplayProvider::screens(), matched by position
    QList<QScreen*> candidates = QGuiApplication::screens();
    QList<ScreenDescriptor> descriptors = QtDisplayProvider::describeAll();
    ScreenIdentity::disambiguate(descriptors);

    QString key = ScreenIdentity::keyFor(screen);
    for (int i = 0; i < descriptors.size() && i < candidates.size(); ++i) {
        if (ScreenIdentity::keyFor(descriptors.at(i)) == key) {
            return candidates.at(i);
        }
    }
    return nullptr;
}
