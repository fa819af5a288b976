#include "ThumbnailGenerator.h"
#include <QVideoSink>
#include <QVideoFrame>
#include <QTimer>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(thumbnailGenerator, "app.thumbnails")

// ThumbnailJob implementation
ThumbnailJob::ThumbnailJob(const QString& videoId, const QUrl& source, QObject* parent)
    : QObject(parent)
    , m_videoId(videoId)
    , m_source(source)
    , m_player(new QMediaPlayer(this))
    , m_sink(new QVideoSink(this))
    , m_timeoutTimer(new QTimer(this))
    , m_targetMs(0)
    , m_done(false)
{
    // No audio output is attached, the job decodes silently
    m_player->setVideoSink(m_sink);

    connect(m_player, &QMediaPlayer::mediaStatusChanged, this, &ThumbnailJob::onMediaStatusChanged);
    connect(m_player, &QMediaPlayer::errorOccurred, this, &ThumbnailJob::onPlayerError);
    connect(m_sink, &QVideoSink::videoFrameChanged, this, &ThumbnailJob::onVideoFrameChanged);

    m_timeoutTimer->setSingleShot(true);
    connect(m_timeoutTimer, &QTimer::timeout, this, &ThumbnailJob::onTimeout);
}

void ThumbnailJob::start()
{
    m_timeoutTimer->start(TimeoutMs);
    m_player->setSource(m_source);
}

void ThumbnailJob::onMediaStatusChanged(QMediaPlayer::MediaStatus status)
{
    if (m_done) {
        return;
    }

    switch (status) {
    case QMediaPlayer::LoadedMedia:
        if (!m_player->hasVideo()) {
            fail("no video track");
            return;
        }
        // Short clips use their first frame
        m_targetMs = m_player->duration() > PosterPositionMs ? PosterPositionMs : 0;
        if (m_targetMs > 0) {
            m_player->setPosition(m_targetMs);
        }
        m_player->play();
        break;
    case QMediaPlayer::InvalidMedia:
        fail("invalid media");
        break;
    default:
        break;
    }
}

void ThumbnailJob::onVideoFrameChanged(const QVideoFrame& frame)
{
    if (m_done || !frame.isValid()) {
        return;
    }

    qint64 frameMs = frame.startTime() >= 0 ? frame.startTime() / 1000 : m_player->position();
    if (frameMs + PositionToleranceMs < m_targetMs) {
        return;
    }

    QImage image = frame.toImage();
    if (image.isNull()) {
        fail("frame could not be converted");
        return;
    }
    complete(image);
}

void ThumbnailJob::onPlayerError(QMediaPlayer::Error error, const QString& errorString)
{
    if (error != QMediaPlayer::NoError) {
        fail(errorString);
    }
}

void ThumbnailJob::onTimeout()
{
    fail("timed out");
}

void ThumbnailJob::complete(const QImage& image)
{
    m_done = true;
    release();
    emit finished(m_videoId, image);
    deleteLater();
}

void ThumbnailJob::fail(const QString& reason)
{
    if (m_done) {
        return;
    }
    m_done = true;
    release();
    emit failed(m_videoId, reason);
    deleteLater();
}

void ThumbnailJob::release()
{
    m_timeoutTimer->stop();
    m_player->stop();
    m_player->setVideoSink(nullptr);
}

// ThumbnailGenerator implementation
ThumbnailGenerator::ThumbnailGenerator(QObject* parent)
    : QObject(parent)
{
}

void ThumbnailGenerator::request(const QString& videoId, const QUrl& source)
{
    if (m_cache.contains(videoId)) {
        emit thumbnailReady(videoId, m_cache.value(videoId));
        return;
    }
    if (m_pending.contains(videoId) && m_pending.value(videoId)) {
        return;
    }

    auto* job = new ThumbnailJob(videoId, source, this);
    connect(job, &ThumbnailJob::finished, this, &ThumbnailGenerator::onJobFinished);
    connect(job, &ThumbnailJob::failed, this, &ThumbnailGenerator::onJobFailed);
    m_pending.insert(videoId, job);

    qCDebug(thumbnailGenerator) << "Generating thumbnail for" << source.fileName();
    job->start();
}

bool ThumbnailGenerator::hasThumbnail(const QString& videoId) const
{
    return m_cache.contains(videoId);
}

QImage ThumbnailGenerator::thumbnail(const QString& videoId) const
{
    return m_cache.value(videoId);
}

void ThumbnailGenerator::forget(const QString& videoId)
{
    m_cache.remove(videoId);
}

void ThumbnailGenerator::onJobFinished(const QString& videoId, const QImage& image)
{
    m_pending.remove(videoId);

    QImage scaled = image.scaled(ThumbnailWidth, ThumbnailHeight,
                                 Qt::KeepAspectRatioByExpanding, Qt::SmoothTransformation);
    m_cache.insert(videoId, scaled);
    emit thumbnailReady(videoId, scaled);
}

void ThumbnailGenerator::onJobFailed(const QString& videoId, const QString& reason)
{
    m_pending.remove(videoId);
    qCWarning(thumbnailGenerator) << "Thumbnail generation failed for" << videoId << ":" << reason;
    emit thumbnailFailed(videoId);
}
