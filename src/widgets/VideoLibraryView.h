#ifndef VIDEOLIBRARYVIEW_H
#define VIDEOLIBRARYVIEW_H

#include <QWidget>
#include <QPixmap>
#include <QImage>
#include <QList>
#include <QMap>
#include <QLoggingCategory>
#include "../core/SettingsStore.h"

Q_DECLARE_LOGGING_CATEGORY(videoLibraryView)

class QGridLayout;
class QScrollArea;
class QStackedWidget;
class QToolButton;
class QPushButton;
class ThumbnailGenerator;

class VideoCard : public QWidget
{
    Q_OBJECT

public:
    explicit VideoCard(const VideoFile& file, QWidget* parent = nullptr);

    const VideoFile& videoFile() const { return m_file; }
    void setThumbnail(const QImage& image);
    void setThumbnailFailed();

    static constexpr int CARD_WIDTH = 160;
    static constexpr int CARD_HEIGHT = 100;
    static constexpr int CORNER_RADIUS = 8;

signals:
    void removeRequested(const QString& videoId);

protected:
    void paintEvent(QPaintEvent* event) override;
    void enterEvent(QEnterEvent* event) override;
    void leaveEvent(QEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

private:
    VideoFile m_file;
    QPixmap m_thumbnail;
    bool m_thumbnailFailed;
    bool m_hovering;
    QToolButton* m_removeButton;
};

class VideoLibraryView : public QWidget
{
    Q_OBJECT

public:
    explicit VideoLibraryView(ThumbnailGenerator* thumbnails, QWidget* parent = nullptr);

    void setLibrary(const QList<VideoFile>& library);

    static constexpr int ITEM_SPACING = 12;

signals:
    void addRequested();
    void removeRequested(const QString& videoId);

protected:
    void resizeEvent(QResizeEvent* event) override;

private slots:
    void onThumbnailReady(const QString& videoId, const QImage& image);
    void onThumbnailFailed(const QString& videoId);

private:
    void setupUI();
    void clearCards();
    void layoutCards();
    int calculateItemsPerRow() const;

    ThumbnailGenerator* m_thumbnails;
    QStackedWidget* m_stack;
    QScrollArea* m_scrollArea;
    QWidget* m_gridWidget;
    QGridLayout* m_gridLayout;
    QPushButton* m_addButton;
    QList<VideoCard*> m_cards;
    int m_currentItemsPerRow;
};

#endif // VIDEOLIBRARYVIEW_H
