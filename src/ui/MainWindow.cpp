#include "MainWindow.h"
#include "../widgets/VideoLibraryView.h"
#include "../widgets/ScreenSelectionWidget.h"
#include "../media/ThumbnailGenerator.h"
#include "../core/ConfigManager.h"
#include "../core/SettingsStore.h"
#include "../core/WallpaperEngine.h"
#include "../core/WallpaperController.h"
#include <QApplication>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QScrollArea>
#include <QFrame>
#include <QLabel>
#include <QSlider>
#include <QMessageBox>
#include <QCheckBox>
#include <QCloseEvent>
#include <QTimer>
#include <QFileDialog>
#include <QStandardPaths>
#include <QSignalBlocker>
#include <QPainter>
#include <QPixmap>
#include <QStyle>
#include <QLoggingCategory>
#include <cmath>

Q_LOGGING_CATEGORY(mainWindow, "app.mainwindow")

MainWindow::MainWindow(WallpaperController* controller, QWidget *parent)
    : QMainWindow(parent)
    , m_libraryView(nullptr)
    , m_screenSelection(nullptr)
    , m_volumeSlider(nullptr)
    , m_volumeLabel(nullptr)
    , m_config(ConfigManager::instance())
    , m_controller(controller)
    , m_store(controller->store())
    , m_engine(controller->engine())
    , m_thumbnails(new ThumbnailGenerator(this))
    , m_isClosing(false)
    , m_startMinimized(false)
    , m_systemTrayIcon(nullptr)
    , m_trayMenu(nullptr)
    , m_showAction(nullptr)
    , m_hideAction(nullptr)
    , m_quitAction(nullptr)
{
    setWindowTitle("WallpaperFree");
    setWindowIcon(QIcon::fromTheme("video-display", style()->standardIcon(QStyle::SP_DesktopIcon)));

    setupUI();
    setupSystemTray();
    loadSettings();

    connect(m_store, &SettingsStore::libraryChanged, this, &MainWindow::onLibraryChanged);
    connect(m_engine, &WallpaperEngine::volumeChanged, this, &MainWindow::onEngineVolumeChanged);

    onLibraryChanged();
}

MainWindow::~MainWindow()
{
    qCDebug(mainWindow) << "MainWindow destructor starting";

    m_isClosing = true;

    // Hide and cleanup system tray icon
    if (m_systemTrayIcon) {
        m_systemTrayIcon->hide();
        m_systemTrayIcon = nullptr;  // Will be deleted by Qt parent-child relationship
    }

    saveSettings();

    qCDebug(mainWindow) << "MainWindow destructor completed";
}

void MainWindow::setupUI()
{
    auto* central = new QWidget(this);
    auto* mainLayout = new QVBoxLayout(central);
    mainLayout->setContentsMargins(16, 16, 16, 16);
    mainLayout->setSpacing(16);

    auto* titleLabel = new QLabel("Monitor Manager");
    QFont titleFont = titleLabel->font();
    titleFont.setPointSize(titleFont.pointSize() + 5);
    titleFont.setBold(true);
    titleLabel->setFont(titleFont);
    titleLabel->setAlignment(Qt::AlignCenter);
    mainLayout->addWidget(titleLabel);

    m_libraryView = new VideoLibraryView(m_thumbnails);
    connect(m_libraryView, &VideoLibraryView::addRequested, this, &MainWindow::addVideos);
    connect(m_libraryView, &VideoLibraryView::removeRequested, this, &MainWindow::onRemoveVideoRequested);
    mainLayout->addWidget(m_libraryView, 1);

    auto* divider = new QFrame;
    divider->setFrameShape(QFrame::HLine);
    divider->setFrameShadow(QFrame::Sunken);
    mainLayout->addWidget(divider);

    auto* screensLabel = new QLabel("Screens");
    QFont screensFont = screensLabel->font();
    screensFont.setBold(true);
    screensLabel->setFont(screensFont);
    mainLayout->addWidget(screensLabel);

    m_screenSelection = new ScreenSelectionWidget(m_controller);
    auto* screensScroll = new QScrollArea;
    screensScroll->setWidgetResizable(true);
    screensScroll->setFrameShape(QFrame::NoFrame);
    screensScroll->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    screensScroll->setWidget(m_screenSelection);
    screensScroll->setFixedHeight(250);
    mainLayout->addWidget(screensScroll);

    auto* bottomDivider = new QFrame;
    bottomDivider->setFrameShape(QFrame::HLine);
    bottomDivider->setFrameShadow(QFrame::Sunken);
    mainLayout->addWidget(bottomDivider);

    mainLayout->addWidget(createVolumeBar());

    setCentralWidget(central);
    resize(432, 832);
    setMinimumSize(380, 600);
}

QWidget* MainWindow::createVolumeBar()
{
    auto* volumeWidget = new QWidget;
    auto* volumeLayout = new QHBoxLayout(volumeWidget);
    volumeLayout->setContentsMargins(0, 0, 0, 0);

    auto* speakerIcon = new QLabel;
    speakerIcon->setPixmap(style()->standardIcon(QStyle::SP_MediaVolume).pixmap(16, 16));

    m_volumeSlider = new QSlider(Qt::Horizontal);
    m_volumeSlider->setRange(0, 100);
    m_volumeSlider->setValue(static_cast<int>(std::lround(m_engine->volume() * 100.0)));
    connect(m_volumeSlider, &QSlider::valueChanged, this, &MainWindow::onVolumeSliderChanged);

    m_volumeLabel = new QLabel;
    m_volumeLabel->setFixedWidth(45);
    m_volumeLabel->setAlignment(Qt::AlignRight | Qt::AlignVCenter);
    updateVolumeLabel(m_volumeSlider->value());

    volumeLayout->addWidget(speakerIcon);
    volumeLayout->addWidget(m_volumeSlider, 1);
    volumeLayout->addWidget(m_volumeLabel);
    return volumeWidget;
}

void MainWindow::loadSettings()
{
    QByteArray geometry = m_config.windowGeometry();
    if (!geometry.isEmpty()) {
        restoreGeometry(geometry);
    }
}

void MainWindow::saveSettings()
{
    m_config.setWindowGeometry(saveGeometry());
    m_config.sync();
}

void MainWindow::addVideos()
{
    QFileDialog dialog(this, "Add videos");
    dialog.setFileMode(QFileDialog::ExistingFiles);
    dialog.setAcceptMode(QFileDialog::AcceptOpen);
    dialog.setMimeTypeFilters({
        "video/mp4",
        "video/quicktime",
        "video/x-matroska",
        "video/webm",
        "video/x-msvideo",
        "video/mpeg",
        "video/ogg"
    });
    dialog.setDirectory(QStandardPaths::writableLocation(QStandardPaths::MoviesLocation));

    if (dialog.exec() != QDialog::Accepted) {
        return;
    }

    int added = m_controller->addVideos(dialog.selectedFiles());
    qCInfo(mainWindow) << "Added" << added << "of" << dialog.selectedFiles().size() << "selected videos";
}

void MainWindow::onRemoveVideoRequested(const QString& videoId)
{
    m_controller->removeVideo(videoId);
    m_thumbnails->forget(videoId);
}

void MainWindow::onLibraryChanged()
{
    m_libraryView->setLibrary(m_store->library());
}

void MainWindow::onVolumeSliderChanged(int value)
{
    updateVolumeLabel(value);
    m_engine->setVolume(value / 100.0);
}

void MainWindow::onEngineVolumeChanged(double volume)
{
    int percent = static_cast<int>(std::lround(volume * 100.0));
    if (m_volumeSlider->value() != percent) {
        QSignalBlocker blocker(m_volumeSlider);
        m_volumeSlider->setValue(percent);
    }
    updateVolumeLabel(percent);
}

void MainWindow::updateVolumeLabel(int percent)
{
    m_volumeLabel->setText(QString("%1%").arg(percent));
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    // If system tray is available, keep the wallpapers running and hide instead of closing
    if (m_systemTrayIcon && m_systemTrayIcon->isVisible() && !m_isClosing) {
        if (isVisible()) {
            if (m_config.showTrayWarning()) {
                QMessageBox msgBox(this);
                msgBox.setWindowTitle("WallpaperFree");
                msgBox.setIcon(QMessageBox::Information);
                msgBox.setText("WallpaperFree keeps running in the system tray.");
                msgBox.setInformativeText("Wallpapers stay active. Use the tray icon to reopen the window or quit.");

                // Add "Don't warn me again" checkbox
                QCheckBox *dontWarnCheckBox = new QCheckBox("Don't warn me again");
                msgBox.setCheckBox(dontWarnCheckBox);

                msgBox.setStandardButtons(QMessageBox::Ok);
                msgBox.exec();

                if (dontWarnCheckBox->isChecked()) {
                    m_config.setShowTrayWarning(false);
                    m_config.sync();
                    qCInfo(mainWindow) << "User disabled tray warning notifications";
                }
            }

            hideToTray();
            event->ignore();
            return;
        }
    }

    // Normal application exit
    m_isClosing = true;
    saveSettings();
    m_engine->stopAll();
    event->accept();
}

void MainWindow::changeEvent(QEvent *event)
{
    if (event->type() == QEvent::WindowStateChange) {
        if (isMinimized() && m_systemTrayIcon && m_systemTrayIcon->isVisible()) {
            QTimer::singleShot(0, this, &MainWindow::hideToTray);
        }
    }
    QMainWindow::changeEvent(event);
}

void MainWindow::setStartMinimized(bool minimized)
{
    m_startMinimized = minimized;
    if (minimized && !(m_systemTrayIcon && m_systemTrayIcon->isVisible())) {
        qCWarning(mainWindow) << "No system tray available, showing the window instead of starting minimized";
        m_startMinimized = false;
    }
}

void MainWindow::setupSystemTray()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qCWarning(mainWindow) << "System tray is not available on this system";
        return;
    }

    m_systemTrayIcon = new QSystemTrayIcon(this);

    QIcon trayIcon = windowIcon();
    if (trayIcon.isNull() || trayIcon.availableSizes().isEmpty()) {
        qCWarning(mainWindow) << "Window icon not available, creating fallback icon";
        // Fallback to a simple colored circle if no icon is available
        QPixmap pixmap(22, 22);
        pixmap.fill(Qt::transparent);
        QPainter painter(&pixmap);
        painter.setRenderHint(QPainter::Antialiasing);
        painter.setBrush(QColor(52, 152, 219));
        painter.setPen(Qt::NoPen);
        painter.drawEllipse(3, 3, 16, 16);
        trayIcon = QIcon(pixmap);
    }
    m_systemTrayIcon->setIcon(trayIcon);

    createTrayMenu();

    m_systemTrayIcon->setToolTip("WallpaperFree");

    connect(m_systemTrayIcon, &QSystemTrayIcon::activated,
            this, &MainWindow::onTrayIconActivated);

    m_systemTrayIcon->show();

    qCInfo(mainWindow) << "System tray icon initialized successfully";
}

void MainWindow::createTrayMenu()
{
    m_trayMenu = new QMenu(this);

    m_showAction = new QAction("Show Window", this);
    connect(m_showAction, &QAction::triggered, this, &MainWindow::showWindow);
    m_trayMenu->addAction(m_showAction);

    m_hideAction = new QAction("Hide Window", this);
    connect(m_hideAction, &QAction::triggered, this, &MainWindow::hideToTray);
    m_trayMenu->addAction(m_hideAction);

    m_trayMenu->addSeparator();

    QAction *stopAllAction = new QAction("Stop All Wallpapers", this);
    connect(stopAllAction, &QAction::triggered, m_controller, &WallpaperController::disableAll);
    m_trayMenu->addAction(stopAllAction);

    m_trayMenu->addSeparator();

    m_quitAction = new QAction("Quit", this);
    connect(m_quitAction, &QAction::triggered, this, &MainWindow::quitApplication);
    m_trayMenu->addAction(m_quitAction);

    m_systemTrayIcon->setContextMenu(m_trayMenu);
}

void MainWindow::onTrayIconActivated(QSystemTrayIcon::ActivationReason reason)
{
    switch (reason) {
    case QSystemTrayIcon::Trigger:
    case QSystemTrayIcon::DoubleClick:
        if (isVisible() && !isMinimized()) {
            hideToTray();
        } else {
            showWindow();
        }
        break;
    case QSystemTrayIcon::MiddleClick:
        showWindow();
        break;
    default:
        break;
    }
}

void MainWindow::showWindow()
{
    show();
    raise();
    activateWindow();
    setWindowState((windowState() & ~Qt::WindowMinimized) | Qt::WindowActive);

    if (m_showAction && m_hideAction) {
        m_showAction->setEnabled(false);
        m_hideAction->setEnabled(true);
    }

    qCDebug(mainWindow) << "Window restored from system tray";
}

void MainWindow::hideToTray()
{
    hide();

    if (m_showAction && m_hideAction) {
        m_showAction->setEnabled(true);
        m_hideAction->setEnabled(false);
    }

    qCDebug(mainWindow) << "Window hidden to system tray";
}

void MainWindow::quitApplication()
{
    qCDebug(mainWindow) << "quitApplication() called";
    m_isClosing = true;

    m_engine->stopAll();
    saveSettings();

    if (m_systemTrayIcon) {
        m_systemTrayIcon->hide();
    }

    QApplication::quit();
}
