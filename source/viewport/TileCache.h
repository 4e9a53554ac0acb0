#pragma once

// ============================================================================
// TileCache - The sharp layer of ImageViewport
// ============================================================================
// Holds one rendered region ("tile") of the source image at the current zoom.
// The tile covers the visible area plus a margin and is snapped to a
// quantization grid so that small pans keep hitting the same tile.
//
// redraw() is the only mutator. It walks this decision chain:
//
//   no image                          -> Idle
//   tile still covers view (+inner)   -> Covered   (nothing rendered)
//   degenerate geometry / bad alloc   -> Aborted   (state unchanged)
//   identical parameters as last time -> Reused    (bitmap kept)
//   otherwise                         -> Redrawn   (new bitmap + TileBox)
//
// TileBox is either absent or a valid, non-empty rectangle inside the image.
// ============================================================================

#include "../core/ResolutionPyramid.h"
#include "../core/ViewportGeometry.h"
#include "../core/ViewportTuning.h"

#include <QImage>
#include <QPoint>

/**
 * @brief Image-space rectangle rendered into the sharp layer.
 *
 * Edges are integer image pixels, right/bottom exclusive.
 */
struct TileBox {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    bool isEmpty() const { return right <= left || bottom <= top; }

    bool operator==(const TileBox& o) const {
        return left == o.left && top == o.top && right == o.right && bottom == o.bottom;
    }
    bool operator!=(const TileBox& o) const { return !(*this == o); }
};

class TileCache {
public:
    enum class Outcome {
        Idle,       ///< No image loaded
        Covered,    ///< Existing tile still covers the view
        Reused,     ///< Same parameters as the last render; bitmap kept
        Redrawn,    ///< A new bitmap was rendered
        Aborted     ///< Degenerate geometry or failed resample; nothing changed
    };

    TileCache() = default;

    void setTuning(const ViewportTuning& tuning) { m_tuning = tuning; }

    /**
     * @brief Bring the tile up to date with the current view.
     * @param pyramid Pyramid of the current source image.
     * @param geom Snapshot of the viewport geometry.
     * @param dragging True while a pan gesture is active (drag margins, nearest filter).
     * @param force Skip the coverage and dedupe shortcuts.
     */
    Outcome redraw(const ResolutionPyramid& pyramid, const ViewportGeometry& geom,
                   bool dragging, bool force);

    /**
     * @brief Drop the tile. Called on image or zoom change.
     */
    void invalidate();

    // ===== Tile state =====

    bool hasTile() const { return m_hasTile; }
    TileBox tileBox() const { return m_box; }
    const QImage& bitmap() const { return m_bitmap; }

    /**
     * @brief World position of the bitmap's top-left corner.
     */
    QPoint worldPosition() const { return m_worldPos; }

    /**
     * @brief True when the last rendered bitmap used the drag-time filter.
     */
    bool lastWasDragQuality() const { return m_lastWasDragQuality; }

    /**
     * @brief Number of resamples performed (Redrawn outcomes).
     */
    int renderCount() const { return m_renderCount; }

    // ===== Coverage queries =====

    /**
     * @brief True when the clipped visible rect is not inside the tile
     *        (or no tile exists).
     */
    bool isOutside(const ViewportGeometry& geom) const;

    /**
     * @brief Largest overflow of the visible rect past any tile edge, in screen px.
     * @return 0 when fully inside, +inf when there is no tile.
     */
    qreal overflowScreenPx(const ViewportGeometry& geom) const;

    /**
     * @brief True when the visible rect is within @p edgeScreenPx of a tile edge.
     */
    bool nearEdge(const ViewportGeometry& geom, int edgeScreenPx) const;

    /**
     * @brief Coverage test used by redraw(): the tile covers the view with
     *        an inner buffer of @p innerScreenPx on every side that does not
     *        sit on the image boundary.
     */
    bool coversWithTolerance(const ViewportGeometry& geom, int innerScreenPx) const;

private:
    struct RenderKey {
        qint64 imageKey = 0;
        qreal zoom = 0.0;
        TileBox box;
        qreal levelScale = 0.0;
        QRect levelCrop;
        QSize target;
        bool dragging = false;
        int margin = 0;
        int quant = 0;

        bool operator==(const RenderKey& o) const {
            return imageKey == o.imageKey && zoom == o.zoom && box == o.box
                   && levelScale == o.levelScale && levelCrop == o.levelCrop
                   && target == o.target && dragging == o.dragging
                   && margin == o.margin && quant == o.quant;
        }
    };

    static int quantizeFloor(int v, int q) { return (v / q) * q; }
    static int quantizeCeil(int v, int q) { return ((v + q - 1) / q) * q; }

    ViewportTuning m_tuning;

    bool m_hasTile = false;
    TileBox m_box;
    QImage m_bitmap;
    QPoint m_worldPos;
    bool m_lastWasDragQuality = false;
    int m_renderCount = 0;

    bool m_hasKey = false;
    RenderKey m_lastKey;
};
