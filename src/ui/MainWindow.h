#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QLabel>
#include <QSlider>
#include <QSystemTrayIcon>
#include <QMenu>
#include <QAction>
#include <QEvent>

class ConfigManager;
class SettingsStore;
class WallpaperEngine;
class WallpaperController;
class ThumbnailGenerator;
class VideoLibraryView;
class ScreenSelectionWidget;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(WallpaperController* controller, QWidget *parent = nullptr);
    ~MainWindow();

    // Methods for system tray
    void setStartMinimized(bool minimized);

protected:
    void closeEvent(QCloseEvent *event) override;
    void changeEvent(QEvent *event) override;

private slots:
    void addVideos();
    void onRemoveVideoRequested(const QString& videoId);
    void onLibraryChanged();
    void onVolumeSliderChanged(int value);
    void onEngineVolumeChanged(double volume);

    // System tray slots
    void onTrayIconActivated(QSystemTrayIcon::ActivationReason reason);
    void showWindow();
    void hideToTray();
    void quitApplication();

private:
    void setupUI();
    QWidget* createVolumeBar();
    void loadSettings();
    void saveSettings();
    void updateVolumeLabel(int percent);

    // System tray methods
    void setupSystemTray();
    void createTrayMenu();

    // UI Components
    VideoLibraryView* m_libraryView;
    ScreenSelectionWidget* m_screenSelection;
    QSlider* m_volumeSlider;
    QLabel* m_volumeLabel;

    // Managers
    ConfigManager& m_config;
    WallpaperController* m_controller;
    SettingsStore* m_store;
    WallpaperEngine* m_engine;
    ThumbnailGenerator* m_thumbnails;

    // State
    bool m_isClosing;
    bool m_startMinimized;

    // System tray
    QSystemTrayIcon *m_systemTrayIcon;
    QMenu *m_trayMenu;
    QAction *m_showAction;
    QAction *m_hideAction;
    QAction *m_quitAction;
};

#endif // MAINWINDOW_H
