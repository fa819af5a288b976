#include "VideoLibraryView.h"
#include "../media/ThumbnailGenerator.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGridLayout>
#include <QScrollArea>
#include <QStackedWidget>
#include <QToolButton>
#include <QPushButton>
#include <QLabel>
#include <QFrame>
#include <QPainter>
#include <QPainterPath>
#include <QLinearGradient>
#include <QPaintEvent>
#include <QResizeEvent>
#include <QEnterEvent>
#include <QStyle>

Q_LOGGING_CATEGORY(videoLibraryView, "app.libraryView")

// VideoCard implementation
VideoCard::VideoCard(const VideoFile& file, QWidget* parent)
    : QWidget(parent)
    , m_file(file)
    , m_thumbnailFailed(false)
    , m_hovering(false)
    , m_removeButton(new QToolButton(this))
{
    setFixedSize(CARD_WIDTH, CARD_HEIGHT);
    setToolTip(file.path);
    setAttribute(Qt::WA_Hover, true);

    m_removeButton->setIcon(style()->standardIcon(QStyle::SP_TitleBarCloseButton));
    m_removeButton->setToolTip("Remove from collection");
    m_removeButton->setAutoRaise(true);
    m_removeButton->setCursor(Qt::PointingHandCursor);
    m_removeButton->hide();
    connect(m_removeButton, &QToolButton::clicked, this, [this]() {
        emit removeRequested(m_file.id);
    });
}

void VideoCard::setThumbnail(const QImage& image)
{
    m_thumbnail = QPixmap::fromImage(image.scaled(size(), Qt::KeepAspectRatioByExpanding, Qt::SmoothTransformation));
    m_thumbnailFailed = false;
    update();
}

void VideoCard::setThumbnailFailed()
{
    m_thumbnailFailed = true;
    update();
}

void VideoCard::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::SmoothPixmapTransform);

    QPainterPath clip;
    clip.addRoundedRect(rect(), CORNER_RADIUS, CORNER_RADIUS);
    painter.setClipPath(clip);

    painter.fillRect(rect(), Qt::black);

    if (!m_thumbnail.isNull()) {
        // Fill the card, cropping the overflow
        int offsetX = (m_thumbnail.width() - width()) / 2;
        int offsetY = (m_thumbnail.height() - height()) / 2;
        painter.drawPixmap(rect(), m_thumbnail, QRect(offsetX, offsetY, width(), height()));
    } else {
        painter.fillRect(rect(), QColor(60, 60, 60));
        painter.setPen(QColor(120, 120, 120));
        painter.drawText(rect().adjusted(0, 0, 0, -30), Qt::AlignCenter,
                         m_thumbnailFailed ? "No preview" : "Loading...");
    }

    // Name over a bottom gradient
    QRect gradientRect(0, height() - 40, width(), 40);
    QLinearGradient gradient(gradientRect.bottomLeft(), gradientRect.topLeft());
    gradient.setColorAt(0.0, QColor(0, 0, 0, 204));
    gradient.setColorAt(1.0, QColor(0, 0, 0, 0));
    painter.fillRect(gradientRect, gradient);

    QFont nameFont = font();
    nameFont.setPointSize(qMax(7, font().pointSize() - 1));
    nameFont.setWeight(QFont::Medium);
    painter.setFont(nameFont);
    painter.setPen(Qt::white);

    QRect nameRect(6, height() - 22, width() - 12, 18);
    QFontMetrics fm(nameFont);
    painter.drawText(nameRect, Qt::AlignLeft | Qt::AlignVCenter,
                     fm.elidedText(m_file.name, Qt::ElideRight, nameRect.width()));

    painter.setClipping(false);
    if (m_hovering) {
        painter.setPen(QPen(palette().color(QPalette::Highlight), 2));
        painter.setBrush(Qt::NoBrush);
        painter.drawRoundedRect(rect().adjusted(1, 1, -1, -1), CORNER_RADIUS, CORNER_RADIUS);
    }
}

void VideoCard::enterEvent(QEnterEvent* event)
{
    m_hovering = true;
    m_removeButton->show();
    update();
    QWidget::enterEvent(event);
}

void VideoCard::leaveEvent(QEvent* event)
{
    m_hovering = false;
    m_removeButton->hide();
    update();
    QWidget::leaveEvent(event);
}

void VideoCard::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    QSize buttonSize = m_removeButton->sizeHint();
    m_removeButton->move(width() - buttonSize.width() - 6, 6);
}

// VideoLibraryView implementation
VideoLibraryView::VideoLibraryView(ThumbnailGenerator* thumbnails, QWidget* parent)
    : QWidget(parent)
    , m_thumbnails(thumbnails)
    , m_stack(nullptr)
    , m_scrollArea(nullptr)
    , m_gridWidget(nullptr)
    , m_gridLayout(nullptr)
    , m_addButton(nullptr)
    , m_currentItemsPerRow(2)
{
    setupUI();

    if (m_thumbnails) {
        connect(m_thumbnails, &ThumbnailGenerator::thumbnailReady, this, &VideoLibraryView::onThumbnailReady);
        connect(m_thumbnails, &ThumbnailGenerator::thumbnailFailed, this, &VideoLibraryView::onThumbnailFailed);
    }
}

void VideoLibraryView::setupUI()
{
    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(0, 0, 0, 0);
    mainLayout->setSpacing(10);

    // Header
    auto* headerLayout = new QHBoxLayout;
    auto* titleLabel = new QLabel("My Collection");
    QFont titleFont = titleLabel->font();
    titleFont.setPointSize(titleFont.pointSize() + 3);
    titleFont.setBold(true);
    titleLabel->setFont(titleFont);

    m_addButton = new QPushButton(style()->standardIcon(QStyle::SP_FileDialogNewFolder), "Add");
    connect(m_addButton, &QPushButton::clicked, this, &VideoLibraryView::addRequested);

    headerLayout->addWidget(titleLabel);
    headerLayout->addStretch();
    headerLayout->addWidget(m_addButton);
    mainLayout->addLayout(headerLayout);

    auto* divider = new QFrame;
    divider->setFrameShape(QFrame::HLine);
    divider->setFrameShadow(QFrame::Sunken);
    mainLayout->addWidget(divider);

    m_stack = new QStackedWidget;

    // Empty state
    auto* emptyWidget = new QWidget;
    auto* emptyLayout = new QVBoxLayout(emptyWidget);
    emptyLayout->addStretch();
    auto* emptyIcon = new QLabel;
    emptyIcon->setPixmap(style()->standardIcon(QStyle::SP_MediaPlay).pixmap(40, 40));
    emptyIcon->setAlignment(Qt::AlignCenter);
    auto* emptyLabel = new QLabel("Empty...");
    emptyLabel->setAlignment(Qt::AlignCenter);
    emptyLabel->setEnabled(false);
    auto* emptyAddButton = new QPushButton("Let's add first one!");
    emptyAddButton->setFlat(true);
    emptyAddButton->setCursor(Qt::PointingHandCursor);
    connect(emptyAddButton, &QPushButton::clicked, this, &VideoLibraryView::addRequested);
    emptyLayout->addWidget(emptyIcon);
    emptyLayout->addWidget(emptyLabel);
    emptyLayout->addWidget(emptyAddButton, 0, Qt::AlignHCenter);
    emptyLayout->addStretch();
    m_stack->addWidget(emptyWidget);

    // Grid of cards
    m_scrollArea = new QScrollArea;
    m_scrollArea->setWidgetResizable(true);
    m_scrollArea->setFrameShape(QFrame::NoFrame);
    m_scrollArea->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);

    m_gridWidget = new QWidget;
    m_gridLayout = new QGridLayout(m_gridWidget);
    m_gridLayout->setSpacing(ITEM_SPACING);
    m_gridLayout->setContentsMargins(ITEM_SPACING, ITEM_SPACING, ITEM_SPACING, ITEM_SPACING);
    m_gridLayout->setAlignment(Qt::AlignTop | Qt::AlignLeft);

    m_scrollArea->setWidget(m_gridWidget);
    m_stack->addWidget(m_scrollArea);

    mainLayout->addWidget(m_stack, 1);
}

void VideoLibraryView::setLibrary(const QList<VideoFile>& library)
{
    clearCards();

    for (const VideoFile& file : library) {
        auto* card = new VideoCard(file, m_gridWidget);
        connect(card, &VideoCard::removeRequested, this, &VideoLibraryView::removeRequested);
        m_cards.append(card);

        if (m_thumbnails) {
            if (m_thumbnails->hasThumbnail(file.id)) {
                card->setThumbnail(m_thumbnails->thumbnail(file.id));
            } else {
                m_thumbnails->request(file.id, file.url());
            }
        }
    }

    layoutCards();
    m_stack->setCurrentIndex(m_cards.isEmpty() ? 0 : 1);

    qCDebug(videoLibraryView) << "Showing" << m_cards.size() << "videos";
}

void VideoLibraryView::clearCards()
{
    for (VideoCard* card : m_cards) {
        m_gridLayout->removeWidget(card);
        card->setParent(nullptr);
        card->deleteLater();
    }
    m_cards.clear();
}

void VideoLibraryView::layoutCards()
{
    for (VideoCard* card : m_cards) {
        m_gridLayout->removeWidget(card);
    }

    m_currentItemsPerRow = calculateItemsPerRow();
    int row = 0, col = 0;
    for (VideoCard* card : m_cards) {
        m_gridLayout->addWidget(card, row, col);
        col++;
        if (col >= m_currentItemsPerRow) {
            col = 0;
            row++;
        }
    }
}

int VideoLibraryView::calculateItemsPerRow() const
{
    if (!m_scrollArea) {
        return 2;
    }

    int availableWidth = m_scrollArea->viewport()->width() - 2 * ITEM_SPACING;
    int itemWidthWithSpacing = VideoCard::CARD_WIDTH + ITEM_SPACING;
    return qMax(1, availableWidth / itemWidthWithSpacing);
}

void VideoLibraryView::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);

    if (calculateItemsPerRow() != m_currentItemsPerRow) {
        layoutCards();
    }
}

void VideoLibraryView::onThumbnailReady(const QString& videoId, const QImage& image)
{
    for (VideoCard* card : m_cards) {
        if (card->videoFile().id == videoId) {
            card->setThumbnail(image);
        }
    }
}

void VideoLibraryView::onThumbnailFailed(const QString& videoId)
{
    for (VideoCard* card : m_cards) {
        if (card->videoFile().id == videoId) {
            card->setThumbnailFailed();
        }
    }
}
