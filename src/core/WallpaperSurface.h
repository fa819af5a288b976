#ifndef WALLPAPERSURFACE_H
#define WALLPAPERSURFACE_H

#include <QRect>
#include <QUrl>
#include <memory>
#include "ScreenIdentity.h"

// One live wallpaper: a bottom-most window, the player feeding it and the
// looping behaviour. Destroying the surface releases all three.
class WallpaperSurface
{
public:
    virtual ~WallpaperSurface() = default;

    virtual void play() = 0;
    virtual void stop() = 0;
    virtual void setVolume(double volume) = 0;
    virtual double volume() const = 0;
    virtual QUrl source() const = 0;
};

class WallpaperSurfaceFactory
{
public:
    virtual ~WallpaperSurfaceFactory() = default;

    // Returns nullptr when the window or player cannot be built.
    virtual std::unique_ptr<WallpaperSurface> create(const ScreenDescriptor& screen,
                                                     const QRect& frame,
                                                     const QUrl& source,
                                                     double volume) = 0;
};

#endif // WALLPAPERSURFACE_H
