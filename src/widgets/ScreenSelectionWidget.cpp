#include "ScreenSelectionWidget.h"
#include "../core/WallpaperController.h"
#include "../core/WallpaperEngine.h"
#include "../core/DisplayProvider.h"
#include <QPainter>
#include <QCheckBox>
#include <QComboBox>
#include <QSignalBlocker>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(screenSelection, "app.screenSelection")

// ScreenPictogram implementation
ScreenPictogram::ScreenPictogram(int screenNumber, QSize resolution, QWidget* parent)
    : QWidget(parent)
    , m_screenNumber(screenNumber)
    , m_resolution(resolution)
    , m_active(false)
{
    setFixedSize(64, 44);
    setToolTip(QString("Screen %1\n%2x%3")
        .arg(screenNumber)
        .arg(resolution.width())
        .arg(resolution.height()));
}

void ScreenPictogram::setActive(bool active)
{
    if (m_active != active) {
        m_active = active;
        update();
    }
}

void ScreenPictogram::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    // Calculate aspect ratio rectangle
    float aspectRatio = m_resolution.height() > 0
        ? (float)m_resolution.width() / m_resolution.height()
        : 16.0f / 9.0f;
    int rectWidth = width() - 4;
    int rectHeight = rectWidth / aspectRatio;

    if (rectHeight > height() - 4) {
        rectHeight = height() - 4;
        rectWidth = rectHeight * aspectRatio;
    }

    QRect screenRect((width() - rectWidth) / 2, (height() - rectHeight) / 2, rectWidth, rectHeight);

    if (m_active) {
        painter.setPen(QPen(QColor(46, 204, 113), 2));
        painter.setBrush(QColor(46, 204, 113, 40));
    } else {
        painter.setPen(QPen(QColor(127, 140, 141), 2));
        painter.setBrush(palette().color(QPalette::Base));
    }
    painter.drawRoundedRect(screenRect, 4, 4);

    painter.setPen(palette().color(QPalette::Text));
    painter.setFont(QFont(font().family(), 9, QFont::Bold));
    painter.drawText(screenRect, Qt::AlignCenter, QString::number(m_screenNumber));
}

// ScreenRow implementation
ScreenRow::ScreenRow(int screenNumber, const ScreenDescriptor& screen, QWidget* parent)
    : QFrame(parent)
    , m_screen(screen)
    , m_screenKey(ScreenIdentity::keyFor(screen))
    , m_pictogram(new ScreenPictogram(screenNumber, screen.geometry.size(), this))
    , m_nameLabel(new QLabel(this))
    , m_detailsLabel(new QLabel(this))
    , m_toggle(new QCheckBox("Enabled", this))
    , m_videoCombo(new QComboBox(this))
    , m_libraryEmpty(true)
{
    setFrameShape(QFrame::StyledPanel);
    setAutoFillBackground(true);

    QFont nameFont = m_nameLabel->font();
    nameFont.setBold(true);
    m_nameLabel->setFont(nameFont);
    m_nameLabel->setText(screen.name.isEmpty() ? QString("Screen %1").arg(screenNumber) : screen.name);

    m_detailsLabel->setText(QString("%1x%2%3")
        .arg(screen.geometry.width())
        .arg(screen.geometry.height())
        .arg(screen.primary ? " • Primary" : ""));
    m_detailsLabel->setEnabled(false);

    auto* mainLayout = new QHBoxLayout(this);
    mainLayout->setContentsMargins(8, 8, 8, 8);
    mainLayout->addWidget(m_pictogram, 0, Qt::AlignTop);

    auto* contentLayout = new QVBoxLayout;
    contentLayout->setSpacing(6);

    auto* headerLayout = new QHBoxLayout;
    auto* titleLayout = new QVBoxLayout;
    titleLayout->setSpacing(0);
    titleLayout->addWidget(m_nameLabel);
    titleLayout->addWidget(m_detailsLabel);
    headerLayout->addLayout(titleLayout);
    headerLayout->addStretch();
    headerLayout->addWidget(m_toggle);
    contentLayout->addLayout(headerLayout);

    auto* pickerLayout = new QHBoxLayout;
    pickerLayout->addWidget(new QLabel("Video", this));
    pickerLayout->addWidget(m_videoCombo, 1);
    contentLayout->addLayout(pickerLayout);

    mainLayout->addLayout(contentLayout, 1);

    connect(m_toggle, &QCheckBox::clicked, this, &ScreenRow::onToggleClicked);
    connect(m_videoCombo, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &ScreenRow::onVideoIndexChanged);
}

void ScreenRow::setLibrary(const QList<VideoFile>& library)
{
    QSignalBlocker blocker(m_videoCombo);

    QVariant current = m_videoCombo->currentData();
    m_videoCombo->clear();
    m_videoCombo->addItem("Select video...", QVariant());
    for (const VideoFile& file : library) {
        m_videoCombo->addItem(file.name, file.id);
    }

    int index = current.isValid() ? m_videoCombo->findData(current) : 0;
    m_videoCombo->setCurrentIndex(qMax(0, index));

    m_libraryEmpty = library.isEmpty();
    updateToggleAvailability();
}

void ScreenRow::setState(const ScreenSettings& settings, bool running)
{
    {
        QSignalBlocker blocker(m_videoCombo);
        int index = settings.videoFileId ? m_videoCombo->findData(*settings.videoFileId) : 0;
        m_videoCombo->setCurrentIndex(qMax(0, index));
    }

    QSignalBlocker blocker(m_toggle);
    bool active = settings.isEnabled && running;
    m_toggle->setChecked(active);
    m_pictogram->setActive(active);
    updateToggleAvailability();
}

void ScreenRow::onToggleClicked(bool checked)
{
    qCDebug(screenSelection) << "Toggle" << m_screenKey << checked;
    emit toggled(m_screen, checked);
}

void ScreenRow::onVideoIndexChanged(int index)
{
    std::optional<QString> videoId;
    QVariant data = m_videoCombo->itemData(index);
    if (index > 0 && data.isValid()) {
        videoId = data.toString();
    }

    updateToggleAvailability();
    qCDebug(screenSelection) << "Video for" << m_screenKey << "changed to" << videoId.value_or("<none>");
    emit videoChanged(m_screen, videoId);
}

void ScreenRow::updateToggleAvailability()
{
    m_toggle->setEnabled(!m_libraryEmpty && m_videoCombo->currentIndex() > 0);
}

// ScreenSelectionWidget implementation
ScreenSelectionWidget::ScreenSelectionWidget(WallpaperController* controller, QWidget* parent)
    : QWidget(parent)
    , m_controller(controller)
{
    m_layout = new QVBoxLayout(this);
    m_layout->setSpacing(12);
    m_layout->setContentsMargins(4, 0, 4, 0);
    m_layout->addStretch();

    SettingsStore* store = m_controller->store();
    WallpaperEngine* engine = m_controller->engine();

    connect(store, &SettingsStore::libraryChanged, this, &ScreenSelectionWidget::onLibraryChanged);
    connect(store, &SettingsStore::screenSettingsChanged, this, &ScreenSelectionWidget::refreshState);
    connect(engine, &WallpaperEngine::wallpaperStarted, this, &ScreenSelectionWidget::refreshState);
    connect(engine, &WallpaperEngine::wallpaperStopped, this, &ScreenSelectionWidget::refreshState);
    connect(engine, &WallpaperEngine::reapplied, this, &ScreenSelectionWidget::updateScreens);

    updateScreens();
}

void ScreenSelectionWidget::updateScreens()
{
    // Clear existing rows
    for (auto* row : m_rows) {
        m_layout->removeWidget(row);
        row->deleteLater();
    }
    m_rows.clear();

    QList<ScreenDescriptor> screens = m_controller->displays()->screens();
    QList<VideoFile> library = m_controller->store()->library();

    int screenNumber = 1;
    for (const ScreenDescriptor& screen : screens) {
        auto* row = new ScreenRow(screenNumber++, screen, this);
        row->setLibrary(library);

        connect(row, &ScreenRow::toggled, m_controller, &WallpaperController::setEnabled);
        connect(row, &ScreenRow::videoChanged, m_controller, &WallpaperController::selectVideo);

        // Insert before the trailing stretch
        m_layout->insertWidget(m_layout->count() - 1, row);
        m_rows.append(row);
    }

    qCDebug(screenSelection) << "Showing" << m_rows.size() << "screens";
    refreshState();
}

void ScreenSelectionWidget::refreshState()
{
    SettingsStore* store = m_controller->store();
    WallpaperEngine* engine = m_controller->engine();

    for (ScreenRow* row : m_rows) {
        row->setState(store->getSettings(row->screenKey()), engine->isRunning(row->screenKey()));
    }
}

void ScreenSelectionWidget::onLibraryChanged()
{
    QList<VideoFile> library = m_controller->store()->library();
    for (auto* row : m_rows) {
        row->setLibrary(library);
    }
    refreshState();
}
