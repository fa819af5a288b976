#include "ConfigManager.h"
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(configManager, "app.config")

namespace {
const char* const VideoLibraryKey = "videoLibrary";
const char* const ScreenSettingsKey = "screenSettings";
const char* const VideoVolumeKey = "videoVolume";
const char* const WindowGeometryKey = "window/geometry";
const char* const ShowTrayWarningKey = "ui/showTrayWarning";
}

ConfigManager& ConfigManager::instance()
{
    static ConfigManager instance;
    return instance;
}

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , m_settings(nullptr)
{
    QString configPath = QStandardPaths::writableLocation(QStandardPaths::ConfigLocation) + "/wallpaperfree";
    QDir().mkpath(configPath);
    m_settings = new QSettings(configPath + "/config.ini", QSettings::IniFormat, this);
    qCDebug(configManager) << "Using config file:" << m_settings->fileName();
}

QString ConfigManager::configDir() const
{
    return QFileInfo(m_settings->fileName()).absolutePath();
}

QString ConfigManager::configFilePath() const
{
    return m_settings->fileName();
}

void ConfigManager::setConfigFile(const QString& filePath)
{
    if (filePath.isEmpty() || filePath == m_settings->fileName()) {
        return;
    }

    // Flush pending writes to the previous file before switching
    m_settings->sync();

    QDir().mkpath(QFileInfo(filePath).absolutePath());
    delete m_settings;
    m_settings = new QSettings(filePath, QSettings::IniFormat, this);

    qCInfo(configManager) << "Switched config file to:" << filePath;
    emit configFileChanged(filePath);
}

bool ConfigManager::sync()
{
    // QSettings::status() keeps reporting the first error for the lifetime of
    // the object, so a later write is attempted on a fresh one
    if (m_settings->status() != QSettings::NoError) {
        reopenSettings();
    }

    m_settings->sync();
    if (m_settings->status() != QSettings::NoError) {
        qCWarning(configManager) << "Failed to write config file:" << m_settings->fileName()
                                 << "status:" << m_settings->status();
        return false;
    }
    return true;
}

void ConfigManager::reopenSettings()
{
    QSettings* fresh = new QSettings(m_settings->fileName(), QSettings::IniFormat, this);

    // Carry over values that never reached the disk
    const QStringList keys = m_settings->allKeys();
    for (const QString& key : keys) {
        fresh->setValue(key, m_settings->value(key));
    }

    delete m_settings;
    m_settings = fresh;
    qCDebug(configManager) << "Reopened config file after a write error:" << m_settings->fileName();
}

void ConfigManager::resetToDefaults()
{
    m_settings->clear();
    sync();
}

QByteArray ConfigManager::videoLibraryData() const
{
    return m_settings->value(VideoLibraryKey, QByteArray()).toByteArray();
}

void ConfigManager::setVideoLibraryData(const QByteArray& data)
{
    m_settings->setValue(VideoLibraryKey, data);
}

QByteArray ConfigManager::screenSettingsData() const
{
    return m_settings->value(ScreenSettingsKey, QByteArray()).toByteArray();
}

void ConfigManager::setScreenSettingsData(const QByteArray& data)
{
    m_settings->setValue(ScreenSettingsKey, data);
}

bool ConfigManager::hasVideoVolume() const
{
    return m_settings->contains(VideoVolumeKey);
}

double ConfigManager::videoVolume() const
{
    return m_settings->value(VideoVolumeKey, 1.0).toDouble();
}

void ConfigManager::setVideoVolume(double volume)
{
    m_settings->setValue(VideoVolumeKey, volume);
}

QByteArray ConfigManager::windowGeometry() const
{
    return m_settings->value(WindowGeometryKey).toByteArray();
}

void ConfigManager::setWindowGeometry(const QByteArray& geometry)
{
    m_settings->setValue(WindowGeometryKey, geometry);
}

bool ConfigManager::showTrayWarning() const
{
    return m_settings->value(ShowTrayWarningKey, true).toBool();
}

void ConfigManager::setShowTrayWarning(bool show)
{
    m_settings->setValue(ShowTrayWarningKey, show);
}

QVariant ConfigManager::value(const QString& key, const QVariant& defaultValue) const
{
    return m_settings->value(key, defaultValue);
}

void ConfigManager::setValue(const QString& key, const QVariant& value)
{
    m_settings->setValue(key, value);
}
