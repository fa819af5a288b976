#include "ScreenIdentity.h"
#include <QHash>

QString ScreenIdentity::keyFor(const ScreenDescriptor& screen)
{
    if (!screen.hardwareId.isEmpty()) {
        return QString(KeyPrefix) + screen.hardwareId;
    }
    return geometryKey(screen.geometry);
}

QString ScreenIdentity::geometryKey(const QRect& geometry)
{
    return QString("%1x%2_%3_%4")
        .arg(geometry.width())
        .arg(geometry.height())
        .arg(geometry.x())
        .arg(geometry.y());
}

QRect ScreenIdentity::wallpaperFrame(const ScreenDescriptor& screen)
{
    QRect frame = screen.geometry;

    if (screen.primary && screen.availableGeometry.isValid()) {
        int topPanelHeight = screen.availableGeometry.top() - screen.geometry.top();
        if (topPanelHeight > 0 && topPanelHeight < frame.height()) {
            frame.setTop(frame.top() + topPanelHeight);
        }
    }

    return frame;
}

void ScreenIdentity::disambiguate(QList<ScreenDescriptor>& screens)
{
    QHash<QString, int> counts;
    for (const ScreenDescriptor& screen : screens) {
        if (!screen.hardwareId.isEmpty()) {
            ++counts[screen.hardwareId];
        }
    }

    for (ScreenDescriptor& screen : screens) {
        if (screen.hardwareId.isEmpty() || counts.value(screen.hardwareId) < 2) {
            continue;
        }
        if (!screen.connector.isEmpty() && screen.connector != screen.hardwareId) {
            screen.hardwareId += "_" + screen.connector;
        } else {
            screen.hardwareId.clear();
        }
    }
}

const ScreenDescriptor* ScreenIdentity::findByKey(const QList<ScreenDescriptor>& screens, const QString& key)
{
    for (const ScreenDescriptor& screen : screens) {
        if (keyFor(screen) == key) {
            return &screen;
        }
    }
    return nullptr;
}
