#pragma once

// ============================================================================
// RedrawTimers - Named single-shot timer slots for ImageViewport
// ============================================================================
// The viewport defers four kinds of work. Each kind owns exactly one
// single-shot QTimer, so there is never more than one outstanding callback
// per purpose:
//
//   SharpRedraw        - the (possibly forced) sharp tile redraw
//   PreviewRedraw      - a throttled preview rebuild during a drag
//   EscapeRedraw       - a sharp redraw that breaks the drag freeze
//   HighQualityRedraw  - the settle redraw after a drag ends
//
// schedule() cancels and replaces. cancel() on an idle slot is a no-op.
// ============================================================================

#include <QObject>
#include <QTimer>

#include <array>
#include <functional>

enum class TimerSlot {
    SharpRedraw = 0,
    PreviewRedraw,
    EscapeRedraw,
    HighQualityRedraw
};

class RedrawTimers : public QObject
{
    Q_OBJECT

public:
    static constexpr int SlotCount = 4;

    explicit RedrawTimers(QObject* parent = nullptr);

    /**
     * @brief Set the callback invoked when @p slot fires.
     */
    void setHandler(TimerSlot slot, std::function<void()> handler);

    /**
     * @brief Start @p slot after @p delayMs, replacing any pending run.
     */
    void schedule(TimerSlot slot, int delayMs);

    /**
     * @brief Start @p slot only if it is not already pending.
     * @return True when a new run was scheduled.
     */
    bool scheduleIfIdle(TimerSlot slot, int delayMs);

    void cancel(TimerSlot slot);
    void cancelAll();

    bool isPending(TimerSlot slot) const;

private:
    QTimer* timer(TimerSlot slot) const { return m_timers[static_cast<int>(slot)]; }

    std::array<QTimer*, SlotCount> m_timers {};
    std::array<std::function<void()>, SlotCount> m_handlers;
};
