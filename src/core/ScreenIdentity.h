#ifndef SCREENIDENTITY_H
#define SCREENIDENTITY_H

#include <QString>
#include <QRect>
#include <QList>

// Snapshot of a connected display. Handles from the windowing system are not
// stable across reconfiguration, so everything outside the platform layer
// works with these values instead.
struct ScreenDescriptor {
    QString hardwareId;      // Monitor serial or connector name, empty if unknown
    QString connector;       // Output name such as "DP-1", empty if unknown
    QString name;            // Human readable name for the UI
    QRect geometry;          // Full frame in virtual desktop coordinates
    QRect availableGeometry; // Frame minus panels reserved by the desktop
    bool primary = false;
};

class ScreenIdentity
{
public:
    static constexpr const char* KeyPrefix = "screen_";

    // Stable key used to correlate settings, windows and players.
    static QString keyFor(const ScreenDescriptor& screen);

    // Key derived only from the geometry, used when no hardware id is known.
    static QString geometryKey(const QRect& geometry);

    // Frame the wallpaper window should cover. On the primary screen the top
    // panel strip is left uncovered.
    static QRect wallpaperFrame(const ScreenDescriptor& screen);

    // Screens sharing a hardware id (identical or placeholder EDID serials)
    // get the connector appended, or fall back to the geometry key when no
    // connector is known. Unique ids are left untouched.
    static void disambiguate(QList<ScreenDescriptor>& screens);

    static const ScreenDescriptor* findByKey(const QList<ScreenDescriptor>& screens, const QString& key);
};

#endif // SCREENIDENTITY_H
