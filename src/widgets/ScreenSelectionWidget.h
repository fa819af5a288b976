#ifndef SCREENSELECTIONWIDGET_H
#define SCREENSELECTIONWIDGET_H

#include <QWidget>
#include <QLabel>
#include <QFrame>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QList>
#include <QString>
#include <QSize>
#include <optional>
#include "../core/ScreenIdentity.h"
#include "../core/SettingsStore.h"

class QCheckBox;
class QComboBox;
class WallpaperController;

// Widget for displaying a single screen pictogram
class ScreenPictogram : public QWidget
{
    Q_OBJECT

public:
    explicit ScreenPictogram(int screenNumber, QSize resolution, QWidget* parent = nullptr);

    void setActive(bool active);
    bool isActive() const { return m_active; }

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    int m_screenNumber;
    QSize m_resolution;
    bool m_active;
};

// One connected screen: enable switch and video picker
class ScreenRow : public QFrame
{
    Q_OBJECT

public:
    ScreenRow(int screenNumber, const ScreenDescriptor& screen, QWidget* parent = nullptr);

    const ScreenDescriptor& screen() const { return m_screen; }
    QString screenKey() const { return m_screenKey; }

    void setLibrary(const QList<VideoFile>& library);
    void setState(const ScreenSettings& settings, bool running);

signals:
    void toggled(const ScreenDescriptor& screen, bool enabled);
    void videoChanged(const ScreenDescriptor& screen, const std::optional<QString>& videoId);

private slots:
    void onToggleClicked(bool checked);
    void onVideoIndexChanged(int index);

private:
    void updateToggleAvailability();

    ScreenDescriptor m_screen;
    QString m_screenKey;
    ScreenPictogram* m_pictogram;
    QLabel* m_nameLabel;
    QLabel* m_detailsLabel;
    QCheckBox* m_toggle;
    QComboBox* m_videoCombo;
    bool m_libraryEmpty;
};

// List of all connected screens
class ScreenSelectionWidget : public QWidget
{
    Q_OBJECT

public:
    explicit ScreenSelectionWidget(WallpaperController* controller, QWidget* parent = nullptr);

    void updateScreens();
    void refreshState();
    int getScreenCount() const { return m_rows.size(); }

private slots:
    void onLibraryChanged();

private:
    WallpaperController* m_controller;
    QVBoxLayout* m_layout;
    QList<ScreenRow*> m_rows;
};

#endif // SCREENSELECTIONWIDGET_H
