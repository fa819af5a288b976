#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QByteArray>
#include <QVariant>

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    static ConfigManager& instance();

    // Configuration file management
    QString configDir() const;
    QString configFilePath() const;
    void setConfigFile(const QString& filePath);
    bool sync();
    void resetToDefaults();

    // Video library and per-screen settings (compact JSON blobs)
    QByteArray videoLibraryData() const;
    void setVideoLibraryData(const QByteArray& data);
    QByteArray screenSettingsData() const;
    void setScreenSettingsData(const QByteArray& data);

    // Audio settings
    bool hasVideoVolume() const;
    double videoVolume() const;
    void setVideoVolume(double volume);

    // Window state
    QByteArray windowGeometry() const;
    void setWindowGeometry(const QByteArray& geometry);

    // System tray settings
    bool showTrayWarning() const;
    void setShowTrayWarning(bool show);

    // Generic settings access for custom configuration values
    QVariant value(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

signals:
    void configFileChanged(const QString& filePath);

private:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager() = default;

    void reopenSettings();

    // Prevent copying
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    QSettings* m_settings;
};

#endif // CONFIGMANAGER_H
