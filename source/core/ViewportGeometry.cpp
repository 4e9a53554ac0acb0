// ============================================================================
// ViewportGeometry - Implementation
// ============================================================================

#include "ViewportGeometry.h"

#include <QtGlobal>

ViewportGeometry::ViewportGeometry(QSize imageSize, qreal zoom, QSize canvasSize, QPointF scroll, int fixedPad)
    : m_imageSize(imageSize)
    , m_zoom(zoom > 0.0 ? zoom : 1.0)
    , m_canvasW(qMax(1, canvasSize.width()))
    , m_canvasH(qMax(1, canvasSize.height()))
    , m_scroll(scroll)
{
    m_pad = computePad(m_canvasW, m_canvasH, fixedPad);
}

int ViewportGeometry::computePad(int canvasW, int canvasH, int fixedPad)
{
    if (fixedPad > 0) {
        return fixedPad;
    }
    return qMax(qMax(1, canvasW), qMax(1, canvasH));
}

// ===== Scroll region =====

QSize ViewportGeometry::scrollRegionSize() const
{
    int zw = 1;
    int zh = 1;
    if (hasImage()) {
        zw = qMax(1, static_cast<int>(m_imageSize.width() * m_zoom));
        zh = qMax(1, static_cast<int>(m_imageSize.height() * m_zoom));
    }
    return QSize(zw + 2 * m_pad, zh + 2 * m_pad);
}

QPointF ViewportGeometry::maxScroll() const
{
    const QSize region = scrollRegionSize();
    return QPointF(qMax(0, region.width() - m_canvasW),
                   qMax(0, region.height() - m_canvasH));
}

QPointF ViewportGeometry::clampScroll(QPointF scroll) const
{
    const QPointF maxS = maxScroll();
    return QPointF(qBound(0.0, scroll.x(), maxS.x()),
                   qBound(0.0, scroll.y(), maxS.y()));
}

QPointF ViewportGeometry::centeredScroll() const
{
    if (!hasImage()) {
        return QPointF(0, 0);
    }
    const int zw = qMax(1, static_cast<int>(m_imageSize.width() * m_zoom));
    const int zh = qMax(1, static_cast<int>(m_imageSize.height() * m_zoom));
    const qreal cx = m_pad + zw / 2.0;
    const qreal cy = m_pad + zh / 2.0;
    return clampScroll(QPointF(cx - m_canvasW / 2.0, cy - m_canvasH / 2.0));
}

// ===== Point mapping =====

QPointF ViewportGeometry::worldToImage(QPointF pt) const
{
    return QPointF((pt.x() - m_pad) / m_zoom, (pt.y() - m_pad) / m_zoom);
}

QPointF ViewportGeometry::imageToWorld(QPointF pt) const
{
    return QPointF(m_pad + pt.x() * m_zoom, m_pad + pt.y() * m_zoom);
}

// ===== Visible area =====

QRectF ViewportGeometry::visibleWorldRect() const
{
    return QRectF(m_scroll.x(), m_scroll.y(), m_canvasW, m_canvasH);
}

QRectF ViewportGeometry::idealVisibleRect() const
{
    const QPointF tl = worldToImage(m_scroll);
    return QRectF(tl.x(), tl.y(), m_canvasW / m_zoom, m_canvasH / m_zoom);
}

QRectF ViewportGeometry::visibleRectInImageSpace() const
{
    if (!hasImage()) {
        return QRectF();
    }
    return clipToImage(idealVisibleRect());
}

QRectF ViewportGeometry::clipToImage(const QRectF& r) const
{
    const qreal w = m_imageSize.width();
    const qreal h = m_imageSize.height();

    const qreal l = qBound(0.0, r.left(), w);
    const qreal t = qBound(0.0, r.top(), h);
    const qreal rr = qBound(0.0, r.right(), w);
    const qreal b = qBound(0.0, r.bottom(), h);

    // Kept as explicit edges so an empty result still sits inside the image.
    return QRectF(QPointF(l, t), QPointF(qMax(l, rr), qMax(t, b)));
}

int ViewportGeometry::screenToImagePx(int screenPx) const
{
    return qMax(1, static_cast<int>(screenPx / qMax(1e-9, m_zoom)));
}
