#pragma once

// ============================================================================
// DragFreezeScheduler - Decides what a pan step may redraw
// ============================================================================
// During a drag the sharp tile is frozen: pointer moves only update the
// preview layer. The freeze is broken ("escape") once the view overflows
// the cached tile by at least the escape threshold. With freeze disabled
// the scheduler falls back to redrawing whenever the view leaves the tile
// or nears its edge, rate limited by a zoom-scaled interval.
//
// This class holds the drag session and makes decisions. It owns no timers;
// ImageViewport turns its answers into RedrawTimers calls.
// ============================================================================

#include "../core/ViewportGeometry.h"
#include "../core/ViewportTuning.h"

#include <QPointF>

class TileCache;

/**
 * @brief Transient state of one pan gesture.
 */
struct DragSession {
    bool active = false;
    QPointF lastPos;             ///< Last pointer position, canvas coordinates
    bool escapePending = false;  ///< A sharp redraw is permitted despite the freeze
    qint64 lastPreviewMs = -1;   ///< -1 = never
    qint64 lastEscapeMs = -1;
    qint64 lastFallbackMs = -1;
};

class DragFreezeScheduler {
public:
    enum class State {
        Idle,
        DraggingFrozen,
        DraggingEscaped
    };

    enum class MoveAction {
        None,               ///< Stay frozen
        Escape,             ///< Break the freeze with an escape redraw
        FallbackOutside,    ///< Freeze disabled: view left the tile
        FallbackNearEdge    ///< Freeze disabled: view is close to a tile edge
    };

    DragFreezeScheduler() = default;

    void setTuning(const ViewportTuning& tuning) { m_tuning = tuning; }

    // ===== Session =====

    void begin(QPointF pos);

    /**
     * @brief Record a new pointer position.
     * @return Pointer movement since the previous position.
     */
    QPointF advance(QPointF pos);

    void end();

    bool isActive() const { return m_session.active; }
    const DragSession& session() const { return m_session; }
    State state() const;

    // ===== Decisions =====

    /**
     * @brief Decide what the sharp layer should do after a pan step.
     */
    MoveAction evaluateMove(const TileCache& tile, const ViewportGeometry& geom) const;

    /**
     * @brief Sharp redraw gate: frozen drags only redraw when forced or
     *        when an escape is pending.
     */
    bool allowsSharpRedraw(bool force) const;

    void markEscapePending() { m_session.escapePending = true; }
    void clearEscapePending() { m_session.escapePending = false; }

    // ===== Throttles =====

    /**
     * @brief Remaining wait before an action last run at @p lastMs may run again.
     * @return 0 when @p minIntervalMs has elapsed or the action never ran.
     */
    static int throttleDelay(qint64 nowMs, qint64 lastMs, qreal minIntervalMs);

    int previewDelay(qint64 nowMs) const;
    int escapeDelay(qint64 nowMs, qreal zoom) const;
    int fallbackDelay(qint64 nowMs, qreal zoom, bool outsideTile) const;

    /**
     * @brief Quiet period a near-edge fallback redraw waits for, so a steady
     * drag along the tile border triggers one redraw instead of one per move.
     */
    int edgeDebounceDelay(qreal zoom) const { return m_tuning.dragParams(zoom).debounceMs; }

    void notePreviewDrawn(qint64 nowMs) { m_session.lastPreviewMs = nowMs; }
    void noteEscapeFired(qint64 nowMs) { m_session.lastEscapeMs = nowMs; }
    void noteFallbackScheduled(qint64 nowMs) { m_session.lastFallbackMs = nowMs; }

private:
    ViewportTuning m_tuning;
    DragSession m_session;
};
