// ============================================================================
// TileCache - Implementation
// ============================================================================

#include "TileCache.h"
#include "../core/LevelSelector.h"

#include <QtMath>
#include <QDebug>
#include <limits>

TileCache::Outcome TileCache::redraw(const ResolutionPyramid& pyramid, const ViewportGeometry& geom,
                                     bool dragging, bool force)
{
    if (pyramid.isEmpty() || !geom.hasImage()) {
        return Outcome::Idle;
    }

    if (!force && m_hasTile && coversWithTolerance(geom, m_tuning.innerToleranceScreenPx)) {
        return Outcome::Covered;
    }

    const qreal z = geom.zoom();
    const int imgW = geom.imageSize().width();
    const int imgH = geom.imageSize().height();

    int marginScreen = m_tuning.idleMarginScreenPx;
    int quantScreen = 1;
    if (dragging) {
        const DragParams p = m_tuning.dragParams(z);
        marginScreen = p.marginScreenPx;
        quantScreen = p.quantScreenPx;
    }

    // Visible world rect grown by the margin, then mapped into the image
    const QRectF world = geom.visibleWorldRect().adjusted(-marginScreen, -marginScreen,
                                                          marginScreen, marginScreen);
    const QRectF img = geom.clipToImage(QRectF(geom.worldToImage(world.topLeft()),
                                               geom.worldToImage(world.bottomRight())));
    if (img.width() <= 0.0 || img.height() <= 0.0) {
#ifdef TIMSCOPE_DEBUG
        qDebug() << "TileCache::redraw: degenerate tile rect" << img;
#endif
        return Outcome::Aborted;
    }

    TileBox box;
    box.left = qFloor(img.left());
    box.top = qFloor(img.top());
    box.right = qCeil(img.right());
    box.bottom = qCeil(img.bottom());

    // Snap both sides so small pans map to the same tile
    const int quantImg = geom.screenToImagePx(quantScreen);
    if (quantImg > 1) {
        box.left = quantizeFloor(box.left, quantImg);
        box.top = quantizeFloor(box.top, quantImg);
        box.right = quantizeCeil(box.right, quantImg);
        box.bottom = quantizeCeil(box.bottom, quantImg);
    }
    box.right = qMax(box.left + 1, qMin(imgW, box.right));
    box.bottom = qMax(box.top + 1, qMin(imgH, box.bottom));

    const LevelChoice choice = LevelSelector::select(pyramid, z, m_tuning.sharpBias);
    if (!choice.isValid()) {
        return Outcome::Aborted;
    }

    const int levelW = choice.image.width();
    const int levelH = choice.image.height();

    int l2 = static_cast<int>(box.left * choice.scale);
    int t2 = static_cast<int>(box.top * choice.scale);
    int r2 = qCeil(box.right * choice.scale);
    int b2 = qCeil(box.bottom * choice.scale);
    l2 = qBound(0, l2, levelW - 1);
    t2 = qBound(0, t2, levelH - 1);
    r2 = qBound(l2 + 1, r2, levelW);
    b2 = qBound(t2 + 1, b2, levelH);
    const QRect levelCrop(QPoint(l2, t2), QPoint(r2 - 1, b2 - 1));

    const QSize target(qMax(1, static_cast<int>(box.width() * z)),
                       qMax(1, static_cast<int>(box.height() * z)));

    RenderKey key;
    key.imageKey = pyramid.level(0).image.cacheKey();
    key.zoom = z;
    key.box = box;
    key.levelScale = choice.scale;
    key.levelCrop = levelCrop;
    key.target = target;
    key.dragging = dragging;
    key.margin = marginScreen;
    key.quant = quantScreen;

    if (!force && m_hasKey && key == m_lastKey && !m_bitmap.isNull()) {
        return Outcome::Reused;
    }

    Qt::TransformationMode mode = Qt::FastTransformation;
    if (!dragging) {
        mode = choice.rel < 1.0 ? m_tuning.downscaleMode : m_tuning.upscaleMode;
    }

    const QImage scaled = choice.image.copy(levelCrop).scaled(target, Qt::IgnoreAspectRatio, mode);
    if (scaled.isNull()) {
        qWarning() << "TileCache::redraw: resample to" << target << "failed";
        return Outcome::Aborted;
    }

    m_box = box;
    m_hasTile = true;
    m_bitmap = scaled;
    m_worldPos = QPoint(qRound(geom.pad() + box.left * z), qRound(geom.pad() + box.top * z));
    m_lastWasDragQuality = dragging;
    m_lastKey = key;
    m_hasKey = true;
    ++m_renderCount;

#ifdef TIMSCOPE_DEBUG
    qDebug() << "TileCache::redraw: tile" << box.left << box.top << box.right << box.bottom
             << "level" << choice.index << "target" << target << (dragging ? "(drag)" : "");
#endif

    return Outcome::Redrawn;
}

void TileCache::invalidate()
{
    m_hasTile = false;
    m_box = TileBox();
    m_hasKey = false;
}

// ===== Coverage queries =====

bool TileCache::isOutside(const ViewportGeometry& geom) const
{
    if (!m_hasTile || !geom.hasImage()) {
        return true;
    }
    const QRectF vis = geom.visibleRectInImageSpace();
    return vis.left() < m_box.left || vis.top() < m_box.top
           || vis.right() > m_box.right || vis.bottom() > m_box.bottom;
}

qreal TileCache::overflowScreenPx(const ViewportGeometry& geom) const
{
    if (!m_hasTile || !geom.hasImage()) {
        return std::numeric_limits<qreal>::infinity();
    }
    const QRectF vis = geom.visibleRectInImageSpace();

    const qreal overL = qMax(0.0, m_box.left - vis.left());
    const qreal overT = qMax(0.0, m_box.top - vis.top());
    const qreal overR = qMax(0.0, vis.right() - m_box.right);
    const qreal overB = qMax(0.0, vis.bottom() - m_box.bottom);

    return qMax(qMax(overL, overT), qMax(overR, overB)) * geom.zoom();
}

bool TileCache::nearEdge(const ViewportGeometry& geom, int edgeScreenPx) const
{
    if (!m_hasTile || !geom.hasImage()) {
        return true;
    }
    const QRectF vis = geom.visibleRectInImageSpace();
    const int edge = geom.screenToImagePx(edgeScreenPx);
    return vis.left() < m_box.left + edge || vis.top() < m_box.top + edge
           || vis.right() > m_box.right - edge || vis.bottom() > m_box.bottom - edge;
}

bool TileCache::coversWithTolerance(const ViewportGeometry& geom, int innerScreenPx) const
{
    if (!m_hasTile || !geom.hasImage()) {
        return false;
    }
    const QRectF vis = geom.visibleRectInImageSpace();
    const int inner = geom.screenToImagePx(innerScreenPx);
    const int imgW = geom.imageSize().width();
    const int imgH = geom.imageSize().height();

    // A tile edge on the image boundary cannot be exceeded by the clipped view.
    const bool okL = m_box.left == 0 || vis.left() >= m_box.left + inner;
    const bool okT = m_box.top == 0 || vis.top() >= m_box.top + inner;
    const bool okR = m_box.right == imgW || vis.right() <= m_box.right - inner;
    const bool okB = m_box.bottom == imgH || vis.bottom() <= m_box.bottom - inner;
    return okL && okT && okR && okB;
}
