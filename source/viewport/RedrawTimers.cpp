// ============================================================================
// RedrawTimers - Implementation
// ============================================================================

#include "RedrawTimers.h"

#include <QDebug>

RedrawTimers::RedrawTimers(QObject* parent)
    : QObject(parent)
{
    for (int i = 0; i < SlotCount; ++i) {
        QTimer* t = new QTimer(this);
        t->setSingleShot(true);
        connect(t, &QTimer::timeout, this, [this, i]() {
            if (m_handlers[i]) {
                m_handlers[i]();
            }
        });
        m_timers[i] = t;
    }
}

void RedrawTimers::setHandler(TimerSlot slot, std::function<void()> handler)
{
    m_handlers[static_cast<int>(slot)] = std::move(handler);
}

void RedrawTimers::schedule(TimerSlot slot, int delayMs)
{
    // QTimer::start() on an active timer restarts it.
    timer(slot)->start(qMax(0, delayMs));

#ifdef TIMSCOPE_DEBUG
    qDebug() << "RedrawTimers::schedule: slot" << static_cast<int>(slot) << "in" << delayMs << "ms";
#endif
}

bool RedrawTimers::scheduleIfIdle(TimerSlot slot, int delayMs)
{
    if (isPending(slot)) {
        return false;
    }
    schedule(slot, delayMs);
    return true;
}

void RedrawTimers::cancel(TimerSlot slot)
{
    timer(slot)->stop();
}

void RedrawTimers::cancelAll()
{
    for (QTimer* t : m_timers) {
        t->stop();
    }
}

bool RedrawTimers::isPending(TimerSlot slot) const
{
    return timer(slot)->isActive();
}
