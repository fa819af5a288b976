#include "SettingsStore.h"
#include "ConfigManager.h"
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonValue>
#include <QUuid>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(settingsStore, "app.settings")

SettingsStore::SettingsStore(QObject* parent)
    : QObject(parent)
{
}

void SettingsStore::load()
{
    ConfigManager& config = ConfigManager::instance();

    m_library.clear();
    m_screenSettings.clear();

    QByteArray libraryData = config.videoLibraryData();
    if (!libraryData.isEmpty()) {
        QJsonParseError error;
        QJsonDocument doc = QJsonDocument::fromJson(libraryData, &error);
        if (error.error == QJsonParseError::NoError && doc.isArray()) {
            for (const VideoFile& file : libraryFromJson(doc.array())) {
                if (QFileInfo::exists(file.path)) {
                    m_library.append(file);
                } else {
                    qCDebug(settingsStore) << "Dropping missing library file:" << file.path;
                }
            }
        } else {
            qCWarning(settingsStore) << "Ignoring unreadable video library:" << error.errorString();
        }
    }

    QByteArray settingsData = config.screenSettingsData();
    if (!settingsData.isEmpty()) {
        QJsonParseError error;
        QJsonDocument doc = QJsonDocument::fromJson(settingsData, &error);
        if (error.error == QJsonParseError::NoError && doc.isObject()) {
            m_screenSettings = screenSettingsFromJson(doc.object());
        } else {
            qCWarning(settingsStore) << "Ignoring unreadable screen settings:" << error.errorString();
        }
    }

    qCInfo(settingsStore) << "Loaded" << m_library.size() << "videos and"
                          << m_screenSettings.size() << "screen settings";

    emit libraryChanged();
}

bool SettingsStore::save()
{
    ConfigManager& config = ConfigManager::instance();

    config.setVideoLibraryData(QJsonDocument(libraryToJson(m_library)).toJson(QJsonDocument::Compact));
    config.setScreenSettingsData(QJsonDocument(screenSettingsToJson(m_screenSettings)).toJson(QJsonDocument::Compact));

    if (!config.sync()) {
        qCWarning(settingsStore) << "Settings could not be persisted, keeping in-memory state";
        return false;
    }
    return true;
}

QList<VideoFile> SettingsStore::library() const
{
    return m_library;
}

std::optional<VideoFile> SettingsStore::videoById(const QString& id) const
{
    for (const VideoFile& file : m_library) {
        if (file.id == id) {
            return file;
        }
    }
    return std::nullopt;
}

bool SettingsStore::containsPath(const QString& path) const
{
    for (const VideoFile& file : m_library) {
        if (file.path == path) {
            return true;
        }
    }
    return false;
}

bool SettingsStore::addVideo(const QString& path)
{
    if (path.isEmpty() || containsPath(path)) {
        return false;
    }

    VideoFile file;
    file.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    file.name = QFileInfo(path).fileName();
    file.path = path;

    m_library.append(file);
    qCInfo(settingsStore) << "Added video" << file.name << "as" << file.id;

    save();
    emit libraryChanged();
    return true;
}

bool SettingsStore::addVideo(const QUrl& url)
{
    if (!url.isLocalFile()) {
        qCWarning(settingsStore) << "Rejecting non-local video source:" << url;
        return false;
    }
    return addVideo(url.toLocalFile());
}

QStringList SettingsStore::removeVideo(const QString& id)
{
    QStringList clearedKeys;

    bool removed = false;
    for (int i = 0; i < m_library.size(); ++i) {
        if (m_library[i].id == id) {
            qCInfo(settingsStore) << "Removing video" << m_library[i].name;
            m_library.removeAt(i);
            removed = true;
            break;
        }
    }

    for (auto it = m_screenSettings.begin(); it != m_screenSettings.end(); ++it) {
        if (it.value().videoFileId == id) {
            it.value().videoFileId.reset();
            it.value().isEnabled = false;
            clearedKeys.append(it.key());
        }
    }

    save();

    if (removed) {
        emit libraryChanged();
    }
    for (const QString& key : clearedKeys) {
        emit screenSettingsChanged(key);
    }

    return clearedKeys;
}

ScreenSettings SettingsStore::getSettings(const QString& screenKey) const
{
    return m_screenSettings.value(screenKey, ScreenSettings());
}

void SettingsStore::updateSettings(const QString& screenKey, const ScreenSettings& settings)
{
    m_screenSettings[screenKey] = settings;
    save();
    emit screenSettingsChanged(screenKey);
}

QStringList SettingsStore::screenKeys() const
{
    return m_screenSettings.keys();
}

QJsonArray SettingsStore::libraryToJson(const QList<VideoFile>& library)
{
    QJsonArray array;
    for (const VideoFile& file : library) {
        QJsonObject obj;
        obj["id"] = file.id;
        obj["name"] = file.name;
        obj["path"] = file.path;
        array.append(obj);
    }
    return array;
}

QList<VideoFile> SettingsStore::libraryFromJson(const QJsonArray& array)
{
    QList<VideoFile> library;
    for (const QJsonValue& value : array) {
        QJsonObject obj = value.toObject();
        VideoFile file;
        file.id = obj["id"].toString();
        file.name = obj["name"].toString();
        file.path = obj["path"].toString();
        if (file.id.isEmpty() || file.path.isEmpty()) {
            continue;
        }
        if (file.name.isEmpty()) {
            file.name = QFileInfo(file.path).fileName();
        }
        library.append(file);
    }
    return library;
}

QJsonObject SettingsStore::screenSettingsToJson(const QMap<QString, ScreenSettings>& settings)
{
    QJsonObject object;
    for (auto it = settings.constBegin(); it != settings.constEnd(); ++it) {
        QJsonObject entry;
        entry["videoFileID"] = it.value().videoFileId ? QJsonValue(*it.value().videoFileId) : QJsonValue(QJsonValue::Null);
        entry["isEnabled"] = it.value().isEnabled;
        object[it.key()] = entry;
    }
    return object;
}

QMap<QString, ScreenSettings> SettingsStore::screenSettingsFromJson(const QJsonObject& object)
{
    QMap<QString, ScreenSettings> settings;
    for (auto it = object.constBegin(); it != object.constEnd(); ++it) {
        QJsonObject entry = it.value().toObject();
        ScreenSettings screen;
        QJsonValue id = entry["videoFileID"];
        if (id.isString() && !id.toString().isEmpty()) {
            screen.videoFileId = id.toString();
        }
        screen.isEnabled = entry["isEnabled"].toBool(false);
        settings[it.key()] = screen;
    }
    return settings;
}
