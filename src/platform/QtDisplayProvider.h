#ifndef QTDISPLAYPROVIDER_H
#define QTDISPLAYPROVIDER_H

#include "../core/DisplayProvider.h"

class QScreen;

// Screens from QGuiApplication, resume notifications from logind.
class QtDisplayProvider : public DisplayProvider
{
    Q_OBJECT

public:
    explicit QtDisplayProvider(QObject* parent = nullptr);
    ~QtDisplayProvider() override;

    static ScreenDescriptor describe(const QScreen* screen);

    // Descriptors for every screen, in QGuiApplication::screens() order
    static QList<ScreenDescriptor> describeAll();

protected:
    QList<ScreenDescriptor> enumerateScreens() const override;

private slots:
    void onScreenAdded(QScreen* screen);
    void onScreenRemoved(QScreen* screen);
    void onPrepareForSleep(bool goingToSleep);

private:
    void watchScreen(QScreen* screen);
};

#endif // QTDISPLAYPROVIDER_H
