#ifndef SETTINGSSTORE_H
#define SETTINGSSTORE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include <QUrl>
#include <QJsonObject>
#include <QJsonArray>
#include <optional>

struct VideoFile {
    QString id;
    QString name;
    QString path;

    QUrl url() const { return QUrl::fromLocalFile(path); }

    bool operator==(const VideoFile& other) const {
        return id == other.id;
    }
};

struct ScreenSettings {
    std::optional<QString> videoFileId;
    bool isEnabled = false;

    bool operator==(const ScreenSettings& other) const {
        return videoFileId == other.videoFileId && isEnabled == other.isEnabled;
    }
};

class SettingsStore : public QObject
{
    Q_OBJECT

public:
    explicit SettingsStore(QObject* parent = nullptr);

    // Persistence
    void load();
    bool save();

    // Video library
    QList<VideoFile> library() const;
    std::optional<VideoFile> videoById(const QString& id) const;
    bool containsPath(const QString& path) const;
    bool addVideo(const QString& path);
    bool addVideo(const QUrl& url);
    QStringList removeVideo(const QString& id);

    // Per-screen settings
    ScreenSettings getSettings(const QString& screenKey) const;
    void updateSettings(const QString& screenKey, const ScreenSettings& settings);
    QStringList screenKeys() const;

    // Serialization helpers, also used by tests
    static QJsonArray libraryToJson(const QList<VideoFile>& library);
    static QList<VideoFile> libraryFromJson(const QJsonArray& array);
    static QJsonObject screenSettingsToJson(const QMap<QString, ScreenSettings>& settings);
    static QMap<QString, ScreenSettings> screenSettingsFromJson(const QJsonObject& object);

signals:
    void libraryChanged();
    void screenSettingsChanged(const QString& screenKey);

private:
    QList<VideoFile> m_library;
    QMap<QString, ScreenSettings> m_screenSettings;
};

#endif // SETTINGSSTORE_H
