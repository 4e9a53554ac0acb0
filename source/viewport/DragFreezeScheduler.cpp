// ============================================================================
// DragFreezeScheduler - Implementation
// ============================================================================

#include "DragFreezeScheduler.h"
#include "TileCache.h"

#include <QtMath>

void DragFreezeScheduler::begin(QPointF pos)
{
    m_session = DragSession();
    m_session.active = true;
    m_session.lastPos = pos;
}

QPointF DragFreezeScheduler::advance(QPointF pos)
{
    const QPointF delta = pos - m_session.lastPos;
    m_session.lastPos = pos;
    return delta;
}

void DragFreezeScheduler::end()
{
    m_session.active = false;
    m_session.escapePending = false;
}

DragFreezeScheduler::State DragFreezeScheduler::state() const
{
    if (!m_session.active) {
        return State::Idle;
    }
    return m_session.escapePending ? State::DraggingEscaped : State::DraggingFrozen;
}

DragFreezeScheduler::MoveAction DragFreezeScheduler::evaluateMove(const TileCache& tile,
                                                                  const ViewportGeometry& geom) const
{
    // First paint during a drag
    if (!tile.hasTile()) {
        return MoveAction::Escape;
    }

    const bool outside = tile.isOutside(geom);

    if (m_tuning.freezeEnabled) {
        if (outside && tile.overflowScreenPx(geom) >= m_tuning.escapeThresholdScreenPx) {
            return MoveAction::Escape;
        }
        return MoveAction::None;
    }

    if (outside) {
        return MoveAction::FallbackOutside;
    }
    if (tile.nearEdge(geom, m_tuning.edgeTriggerScreenPx)) {
        return MoveAction::FallbackNearEdge;
    }
    return MoveAction::None;
}

bool DragFreezeScheduler::allowsSharpRedraw(bool force) const
{
    if (!m_session.active || !m_tuning.freezeEnabled) {
        return true;
    }
    return force || m_session.escapePending;
}

int DragFreezeScheduler::throttleDelay(qint64 nowMs, qint64 lastMs, qreal minIntervalMs)
{
    if (lastMs < 0) {
        return 0;
    }
    const qreal elapsed = nowMs - lastMs;
    if (elapsed >= minIntervalMs) {
        return 0;
    }
    return qMax(1, qCeil(minIntervalMs - elapsed));
}

int DragFreezeScheduler::previewDelay(qint64 nowMs) const
{
    return throttleDelay(nowMs, m_session.lastPreviewMs, m_tuning.previewMinIntervalMs);
}

int DragFreezeScheduler::escapeDelay(qint64 nowMs, qreal zoom) const
{
    return throttleDelay(nowMs, m_session.lastEscapeMs, m_tuning.escapeMinIntervalMs(zoom));
}

int DragFreezeScheduler::fallbackDelay(qint64 nowMs, qreal zoom, bool outsideTile) const
{
    return throttleDelay(nowMs, m_session.lastFallbackMs,
                         m_tuning.fallbackMinIntervalMs(zoom, outsideTile));
}
