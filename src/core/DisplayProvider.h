#ifndef DISPLAYPROVIDER_H
#define DISPLAYPROVIDER_H

#include <QObject>
#include <QList>
#include "ScreenIdentity.h"

// Source of the connected screens and of the OS notifications that can
// invalidate wallpaper windows.
class DisplayProvider : public QObject
{
    Q_OBJECT

public:
    explicit DisplayProvider(QObject* parent = nullptr) : QObject(parent) {}
    ~DisplayProvider() override = default;

    // Connected screens with unique keys
    QList<ScreenDescriptor> screens() const
    {
        QList<ScreenDescriptor> result = enumerateScreens();
        ScreenIdentity::disambiguate(result);
        return result;
    }

signals:
    void screensChanged();
    void systemResumed();

protected:
    // Raw descriptors as reported by the windowing system
    virtual QList<ScreenDescriptor> enumerateScreens() const = 0;
};

#endif // DISPLAYPROVIDER_H
