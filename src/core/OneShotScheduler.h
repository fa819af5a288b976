#ifndef ONESHOTSCHEDULER_H
#define ONESHOTSCHEDULER_H

#include <QObject>
#include <QPointer>
#include <QTimer>
#include <functional>

// Runs a task once on the main event loop after a delay.
class OneShotScheduler
{
public:
    virtual ~OneShotScheduler() = default;
    virtual void schedule(int delayMs, std::function<void()> task) = 0;
};

// Pending tasks are dropped when the context object is destroyed.
class QtOneShotScheduler : public OneShotScheduler
{
public:
    explicit QtOneShotScheduler(QObject* context) : m_context(context) {}

    void schedule(int delayMs, std::function<void()> task) override
    {
        if (!m_context) {
            return;
        }
        QTimer::singleShot(delayMs, m_context.data(), std::move(task));
    }

private:
    QPointer<QObject> m_context;
};

#endif // ONESHOTSCHEDULER_H
