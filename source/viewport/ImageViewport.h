#pragma once

// ============================================================================
// ImageViewport - Smooth pan/zoom canvas for a single raster
// ============================================================================
// ImageViewport is a QWidget that:
// - Owns the displayed source image and its resolution pyramid
// - Keeps a sharp tile (TileCache) anchored in world coordinates
// - Fills the screen with a cheap preview (PreviewLayer) while dragging
// - Freezes sharp redraws during a drag until the view escapes the tile
// - Defers all redraws through a table of named single-shot timers
//
// Paint order is fixed: background, preview (screen pinned), sharp tile.
//
// Input arrives through panBegin/panMove/panEnd and wheelZoom, normally
// from ViewportInputController. Scrollbars are external and talk to the
// viewport through scrollOffset()/setScrollOffset()/maxScroll().
// ============================================================================

#include "DragFreezeScheduler.h"
#include "PreviewLayer.h"
#include "RedrawTimers.h"
#include "TileCache.h"
#include "../core/ResolutionPyramid.h"
#include "../core/ViewportGeometry.h"
#include "../core/ViewportTuning.h"

#include <QElapsedTimer>
#include <QImage>
#include <QWidget>

class ImageViewport : public QWidget
{
    Q_OBJECT

public:
    explicit ImageViewport(QWidget* parent = nullptr);
    ~ImageViewport() override = default;

    // ===== Configuration =====

    void setTuning(const ViewportTuning& tuning);
    const ViewportTuning& tuning() const { return m_tuning; }

    // ===== Host control surface =====

    /**
     * @brief Replace the displayed raster.
     * @param image Decoded raster. A null image clears the view.
     * @param recenter Center the image on the next redraw.
     * @param force Force the redraw even when the tile would still cover the view.
     *
     * The pyramid is rebuilt before this returns.
     */
    void setImage(const QImage& image, bool recenter = true, bool force = true);
    const QImage& image() const { return m_source; }
    bool hasImage() const { return !m_source.isNull(); }

    /**
     * @brief Set the zoom level, clamped to the tuning's zoom range.
     *
     * Without @p recenter the image point at the canvas centre stays fixed.
     * Setting the current zoom again is ignored unless @p force is set.
     */
    void setZoom(qreal zoom, bool recenter = false, bool force = false);
    qreal zoom() const { return m_zoom; }

    /**
     * @brief Zoom so the whole image fits the canvas, then center it.
     */
    void zoomFit();

    /**
     * @brief Zoom by wheel units around a canvas point.
     * @param pos Cursor position in canvas coordinates.
     * @param delta Wheel delta in 1/8 degree units (120 per notch). +-1 counts as a notch.
     */
    void wheelZoom(QPointF pos, qreal delta);

    // ===== Pan gesture =====

    void panBegin(QPointF pos);
    void panMove(QPointF pos);
    void panEnd();

    // ===== Redraw scheduling =====

    /**
     * @brief Schedule a sharp redraw, replacing any pending one.
     *
     * A pending forced redraw stays forced.
     */
    void scheduleRedraw(int delayMs = 0, bool force = false);

    /**
     * @brief Drop the cached tile so the next redraw renders from scratch.
     */
    void invalidateCache();

    // ===== Scrolling =====

    QPointF scrollOffset() const { return m_scroll; }
    QPointF maxScroll() const { return viewGeometry().maxScroll(); }
    QSize scrollRegionSize() const { return viewGeometry().scrollRegionSize(); }

    /**
     * @brief Scroll from an external control (scrollbars).
     *
     * Outside a drag this schedules a non-forced redraw after the scroll delay.
     */
    void setScrollOffset(QPointF offset);

    /**
     * @brief Snapshot of the current view geometry.
     */
    ViewportGeometry viewGeometry() const;

    // ===== Diagnostics =====

    bool isDragging() const { return m_drag.isActive(); }
    DragFreezeScheduler::State dragState() const { return m_drag.state(); }
    bool isPreviewVisible() const { return m_preview.isVisible(); }
    bool hasTile() const { return m_tile.hasTile(); }
    TileBox tileBox() const { return m_tile.tileBox(); }
    bool lastTileWasDragQuality() const { return m_tile.lastWasDragQuality(); }
    bool isTimerPending(TimerSlot slot) const { return m_timers->isPending(slot); }
    const ResolutionPyramid& pyramid() const { return m_pyramid; }

    int sharpRenderCount() const { return m_tile.renderCount(); }
    int previewRenderCount() const { return m_preview.renderCount(); }
    int escapeRedrawCount() const { return m_escapeRedrawCount; }

signals:
    void zoomChanged(qreal zoom);

    /**
     * @brief Scroll offset or scroll region changed.
     */
    void scrollStateChanged();

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

private:
    // ===== Timer handlers =====
    void onSharpTimer();
    void onPreviewTimer();
    void onEscapeTimer();
    void onHighQualityTimer();

    /**
     * @brief Run the sharp redraw now, subject to the drag freeze gate.
     * @return false when the gate held the redraw back.
     */
    bool runSharpRedraw(bool force);

    void schedulePreview();
    void drawPreviewNow();
    void scheduleEscape();
    void scheduleFallback(bool outsideTile);

    void applyZoom(qreal newZoom, QPointF anchor, bool keepAnchor);
    void setScrollInternal(QPointF scroll);

    ViewportTuning m_tuning;

    QImage m_source;
    ResolutionPyramid m_pyramid;
    qreal m_zoom = 4.0;
    QPointF m_scroll;
    bool m_userPanned = false;
    bool m_forceNextDraw = false;

    TileCache m_tile;
    PreviewLayer m_preview;
    DragFreezeScheduler m_drag;
    RedrawTimers* m_timers = nullptr;
    QElapsedTimer m_clock;

    int m_escapeRedrawCount = 0;
};
