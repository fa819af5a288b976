#ifndef THUMBNAILGENERATOR_H
#define THUMBNAILGENERATOR_H

#include <QObject>
#include <QImage>
#include <QSize>
#include <QString>
#include <QUrl>
#include <QMap>
#include <QPointer>
#include <QMediaPlayer>

class QVideoSink;
class QVideoFrame;
class QTimer;

// Decodes a single poster frame for one video. Deletes itself when done.
class ThumbnailJob : public QObject
{
    Q_OBJECT

public:
    ThumbnailJob(const QString& videoId, const QUrl& source, QObject* parent = nullptr);

    void start();
    QString videoId() const { return m_videoId; }

    static constexpr qint64 PosterPositionMs = 1000;
    static constexpr qint64 PositionToleranceMs = 100;
    static constexpr int TimeoutMs = 10000;

signals:
    void finished(const QString& videoId, const QImage& image);
    void failed(const QString& videoId, const QString& reason);

private slots:
    void onMediaStatusChanged(QMediaPlayer::MediaStatus status);
    void onVideoFrameChanged(const QVideoFrame& frame);
    void onPlayerError(QMediaPlayer::Error error, const QString& errorString);
    void onTimeout();

private:
    void complete(const QImage& image);
    void fail(const QString& reason);
    void release();

    QString m_videoId;
    QUrl m_source;
    QMediaPlayer* m_player;
    QVideoSink* m_sink;
    QTimer* m_timeoutTimer;
    qint64 m_targetMs;
    bool m_done;
};

class ThumbnailGenerator : public QObject
{
    Q_OBJECT

public:
    explicit ThumbnailGenerator(QObject* parent = nullptr);

    static constexpr int ThumbnailWidth = 320;
    static constexpr int ThumbnailHeight = 180;

    // Fire and forget. Results arrive through thumbnailReady/thumbnailFailed.
    void request(const QString& videoId, const QUrl& source);
    bool hasThumbnail(const QString& videoId) const;
    QImage thumbnail(const QString& videoId) const;
    void forget(const QString& videoId);

signals:
    void thumbnailReady(const QString& videoId, const QImage& image);
    void thumbnailFailed(const QString& videoId);

private slots:
    void onJobFinished(const QString& videoId, const QImage& image);
    void onJobFailed(const QString& videoId, const QString& reason);

private:
    QMap<QString, QImage> m_cache;
    QMap<QString, QPointer<ThumbnailJob>> m_pending;
};

#endif // THUMBNAILGENERATOR_H
