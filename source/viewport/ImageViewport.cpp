// ============================================================================
// ImageViewport - Implementation
// ============================================================================

#include "ImageViewport.h"

#include <QPainter>
#include <QPaintEvent>
#include <QResizeEvent>
#include <QtMath>
#include <QDebug>

ImageViewport::ImageViewport(QWidget* parent)
    : QWidget(parent)
{
    setAttribute(Qt::WA_OpaquePaintEvent);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(64, 64);

    m_timers = new RedrawTimers(this);
    m_timers->setHandler(TimerSlot::SharpRedraw, [this]() { onSharpTimer(); });
    m_timers->setHandler(TimerSlot::PreviewRedraw, [this]() { onPreviewTimer(); });
    m_timers->setHandler(TimerSlot::EscapeRedraw, [this]() { onEscapeTimer(); });
    m_timers->setHandler(TimerSlot::HighQualityRedraw, [this]() { onHighQualityTimer(); });

    m_clock.start();

    m_tile.setTuning(m_tuning);
    m_preview.setTuning(m_tuning);
    m_drag.setTuning(m_tuning);
    m_zoom = m_tuning.clampZoom(m_tuning.initialZoom);
}

void ImageViewport::setTuning(const ViewportTuning& tuning)
{
    m_tuning = tuning;
    m_tile.setTuning(m_tuning);
    m_preview.setTuning(m_tuning);
    m_drag.setTuning(m_tuning);

    // Before the first image the configured start zoom wins
    const qreal z = m_tuning.clampZoom(hasImage() ? m_zoom : m_tuning.initialZoom);
    if (!qFuzzyCompare(z, m_zoom)) {
        m_zoom = z;
        emit zoomChanged(m_zoom);
    }

    // Pyramid shape and filters may have changed
    if (hasImage()) {
        m_pyramid.build(m_source, m_tuning.pyramidMinDim, m_tuning.pyramidMaxLevels);
    }
    invalidateCache();
    scheduleRedraw(0, true);
}

// ===== Host control surface =====

void ImageViewport::setImage(const QImage& image, bool recenter, bool force)
{
    m_source = image;

    if (m_source.isNull()) {
        m_pyramid.clear();
        m_timers->cancelAll();
        m_preview.hide();
        invalidateCache();
        update();
        emit scrollStateChanged();
        return;
    }

    m_pyramid.build(m_source, m_tuning.pyramidMinDim, m_tuning.pyramidMaxLevels);
    if (recenter) {
        m_userPanned = false;
    }
    invalidateCache();
    scheduleRedraw(0, force);
}

void ImageViewport::setZoom(qreal zoom, bool recenter, bool force)
{
    const qreal z = m_tuning.clampZoom(zoom > 0.0 ? zoom : 1.0);
    if (qAbs(z - m_zoom) < 1e-9 && !force) {
        return;
    }
    if (recenter) {
        m_userPanned = false;
    }
    applyZoom(z, QPointF(width() / 2.0, height() / 2.0), !recenter);
}

void ImageViewport::zoomFit()
{
    if (!hasImage()) {
        return;
    }
    const qreal cw = qMax(1, width());
    const qreal ch = qMax(1, height());
    const qreal z = m_tuning.clampZoom(qMin(cw / m_source.width(), ch / m_source.height()));

    m_userPanned = false;
    applyZoom(z, QPointF(), false);
}

void ImageViewport::wheelZoom(QPointF pos, qreal delta)
{
    if (qAbs(delta) < 1e-9) {
        return;
    }
    // Some X11 setups report single units instead of 120 per notch
    if (qAbs(delta) == 1.0) {
        delta = delta > 0 ? 120.0 : -120.0;
    }

    const qreal newZoom = m_tuning.clampZoom(m_zoom * qPow(m_tuning.wheelNotchRatio, delta / 120.0));
    if (qAbs(newZoom - m_zoom) < 1e-9) {
        return;
    }

    if (hasImage()) {
        m_userPanned = true;
    }
    applyZoom(newZoom, pos, true);
}

void ImageViewport::applyZoom(qreal newZoom, QPointF anchor, bool keepAnchor)
{
    const QPointF imagePt = viewGeometry().canvasToImage(anchor);
    const qreal oldZoom = m_zoom;

    m_zoom = newZoom;
    invalidateCache();

    // Solve for the scroll offset that maps imagePt back under the anchor
    if (keepAnchor && hasImage()) {
        setScrollInternal(viewGeometry().imageToWorld(imagePt) - anchor);
    }

    if (!qFuzzyCompare(oldZoom, m_zoom)) {
        emit zoomChanged(m_zoom);
    }
    scheduleRedraw(0, true);
}

// ===== Pan gesture =====

void ImageViewport::panBegin(QPointF pos)
{
    if (!hasImage()) {
        return;
    }

    m_timers->cancel(TimerSlot::HighQualityRedraw);
    m_timers->cancel(TimerSlot::PreviewRedraw);

    m_drag.begin(pos);
    m_userPanned = true;

    if (m_tuning.previewEnabled) {
        m_preview.show();
    }

#ifdef TIMSCOPE_DEBUG
    qDebug() << "ImageViewport::panBegin:" << pos;
#endif
}

void ImageViewport::panMove(QPointF pos)
{
    if (!hasImage() || !m_drag.isActive()) {
        return;
    }

    const QPointF delta = m_drag.advance(pos);
    setScrollInternal(m_scroll - delta);
    m_userPanned = true;
    update();

    if (m_tuning.previewEnabled) {
        schedulePreview();
    }

    switch (m_drag.evaluateMove(m_tile, viewGeometry())) {
    case DragFreezeScheduler::MoveAction::Escape:
        m_drag.markEscapePending();
        scheduleEscape();
        break;
    case DragFreezeScheduler::MoveAction::FallbackOutside:
        scheduleFallback(true);
        break;
    case DragFreezeScheduler::MoveAction::FallbackNearEdge:
        scheduleFallback(false);
        break;
    case DragFreezeScheduler::MoveAction::None:
        break;
    }
}

void ImageViewport::panEnd()
{
    if (!m_drag.isActive()) {
        return;
    }
    m_drag.end();

    m_timers->cancel(TimerSlot::SharpRedraw);
    m_timers->cancel(TimerSlot::PreviewRedraw);
    m_timers->cancel(TimerSlot::EscapeRedraw);
    m_timers->cancel(TimerSlot::HighQualityRedraw);
    m_forceNextDraw = false;

    // The preview is about to disappear; the tile must cover the view now.
    runSharpRedraw(true);

    if (m_tuning.previewEnabled) {
        m_preview.hide();
    }

    if (m_tile.lastWasDragQuality()) {
        m_timers->schedule(TimerSlot::HighQualityRedraw, m_tuning.highQualityDelayMs);
    }

    update();

#ifdef TIMSCOPE_DEBUG
    qDebug() << "ImageViewport::panEnd: sharp renders" << m_tile.renderCount()
             << "previews" << m_preview.renderCount() << "escapes" << m_escapeRedrawCount;
#endif
}

// ===== Redraw scheduling =====

void ImageViewport::scheduleRedraw(int delayMs, bool force)
{
    if (m_timers->isPending(TimerSlot::SharpRedraw)) {
        m_forceNextDraw = m_forceNextDraw || force;
    } else {
        m_forceNextDraw = force;
    }
    m_timers->schedule(TimerSlot::SharpRedraw, delayMs);
}

void ImageViewport::invalidateCache()
{
    m_tile.invalidate();
}

bool ImageViewport::runSharpRedraw(bool force)
{
    if (!m_drag.allowsSharpRedraw(force)) {
        return false;
    }
    if (!hasImage()) {
        update();
        return true;
    }

    // Re-clamp against the current scroll region; recenter until the user pans
    setScrollInternal(m_userPanned ? m_scroll : viewGeometry().centeredScroll());

    const TileCache::Outcome outcome = m_tile.redraw(m_pyramid, viewGeometry(), m_drag.isActive(), force);
    m_drag.clearEscapePending();

    if (outcome == TileCache::Outcome::Redrawn) {
        update();
    }
    return true;
}

void ImageViewport::onSharpTimer()
{
    const bool force = m_forceNextDraw;
    m_forceNextDraw = false;
    runSharpRedraw(force);
}

void ImageViewport::onEscapeTimer()
{
    if (!m_drag.isActive()) {
        return;
    }
    // A forced redraw may already have served this escape
    const qint64 now = m_clock.elapsed();
    if (runSharpRedraw(false)) {
        ++m_escapeRedrawCount;
        m_drag.noteEscapeFired(now);
    }
}

void ImageViewport::onHighQualityTimer()
{
    if (m_drag.isActive() || !m_tile.lastWasDragQuality()) {
        return;
    }
    scheduleRedraw(0, true);
}

void ImageViewport::scheduleEscape()
{
    m_timers->schedule(TimerSlot::EscapeRedraw, m_drag.escapeDelay(m_clock.elapsed(), m_zoom));
}

void ImageViewport::scheduleFallback(bool outsideTile)
{
    const qint64 now = m_clock.elapsed();
    int delay = m_drag.fallbackDelay(now, m_zoom, outsideTile);
    if (delay == 0) {
        m_drag.noteFallbackScheduled(now);
    }
    if (!outsideTile) {
        delay = qMax(delay, m_drag.edgeDebounceDelay(m_zoom));
    }
    scheduleRedraw(delay, false);
}

// ===== Preview =====

void ImageViewport::schedulePreview()
{
    const qint64 now = m_clock.elapsed();
    const int delay = m_drag.previewDelay(now);
    if (delay == 0) {
        m_timers->cancel(TimerSlot::PreviewRedraw);
        m_drag.notePreviewDrawn(now);
        drawPreviewNow();
    } else {
        m_timers->scheduleIfIdle(TimerSlot::PreviewRedraw, delay);
    }
}

void ImageViewport::onPreviewTimer()
{
    m_drag.notePreviewDrawn(m_clock.elapsed());
    drawPreviewNow();
}

void ImageViewport::drawPreviewNow()
{
    if (!m_tuning.previewEnabled || !hasImage() || !m_drag.isActive()) {
        return;
    }
    if (m_preview.render(m_pyramid, viewGeometry())) {
        update();
    }
}

// ===== Scrolling =====

void ImageViewport::setScrollOffset(QPointF offset)
{
    if (!hasImage()) {
        return;
    }
    setScrollInternal(offset);
    m_userPanned = true;
    update();

    if (!m_drag.isActive()) {
        scheduleRedraw(m_tuning.scrollRedrawDelayMs, false);
    }
}

void ImageViewport::setScrollInternal(QPointF scroll)
{
    m_scroll = viewGeometry().clampScroll(scroll);
    emit scrollStateChanged();
}

ViewportGeometry ImageViewport::viewGeometry() const
{
    return ViewportGeometry(m_source.size(), m_zoom, size(), m_scroll, m_tuning.padPixels);
}

// ===== Events =====

void ImageViewport::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), m_tuning.backgroundColor);

    if (!hasImage()) {
        painter.setPen(QColor(160, 160, 160));
        painter.drawText(rect(), Qt::AlignCenter, tr("No image loaded"));
        return;
    }

    // Preview below, pinned to the canvas origin
    if (m_preview.isVisible() && !m_preview.bitmap().isNull()) {
        painter.drawImage(QPoint(0, 0), m_preview.bitmap());
    }

    // Sharp tile above, anchored in world coordinates
    if (m_tile.hasTile() && !m_tile.bitmap().isNull()) {
        const QPoint pos = m_tile.worldPosition() - m_scroll.toPoint();
        painter.drawImage(pos, m_tile.bitmap());
    }
}

void ImageViewport::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);

    // Padding follows the canvas size, so the tile's world position is stale
    setScrollInternal(m_scroll);
    scheduleRedraw(0, true);

    if (m_drag.isActive() && m_tuning.previewEnabled) {
        drawPreviewNow();
    }
}
