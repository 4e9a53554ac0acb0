#pragma once

// ============================================================================
// ViewportGeometry - Coordinate mapping for the pan/zoom viewport
// ============================================================================
// Three coordinate spaces are involved:
//
//   canvas  - widget pixels, (0,0) at the widget's top-left
//   world   - the scrollable region: image placed at (pad, pad), scaled by zoom
//   image   - source image pixels
//
//   world  = canvas + scroll
//   image  = (world - pad) / zoom
//
// ViewportGeometry is a snapshot value: build one from the current zoom,
// scroll offset, canvas size and image size, then query it. It never
// mutates viewport state.
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QSize>
#include <QSizeF>

class ViewportGeometry {
public:
    ViewportGeometry() = default;

    /**
     * @param imageSize Source image size (empty = no image loaded).
     * @param zoom Current zoom level.
     * @param canvasSize Widget size; each side is treated as at least 1.
     * @param scroll World coordinate of the canvas top-left.
     * @param fixedPad Padding in world pixels, or 0 for automatic padding.
     */
    ViewportGeometry(QSize imageSize, qreal zoom, QSize canvasSize, QPointF scroll, int fixedPad = 0);

    // ===== Inputs =====

    bool hasImage() const { return m_imageSize.width() > 0 && m_imageSize.height() > 0; }
    QSize imageSize() const { return m_imageSize; }
    qreal zoom() const { return m_zoom; }
    int canvasWidth() const { return m_canvasW; }
    int canvasHeight() const { return m_canvasH; }
    QPointF scroll() const { return m_scroll; }
    int pad() const { return m_pad; }

    /**
     * @brief Symmetric padding around the image in the scroll region.
     * @return max(canvasW, canvasH) when fixedPad <= 0, otherwise fixedPad.
     */
    static int computePad(int canvasW, int canvasH, int fixedPad = 0);

    // ===== Scroll region =====

    /**
     * @brief (imageW * zoom + 2 * pad, imageH * zoom + 2 * pad).
     */
    QSize scrollRegionSize() const;

    /**
     * @brief Largest valid scroll offset (scroll region minus canvas, >= 0).
     */
    QPointF maxScroll() const;

    QPointF clampScroll(QPointF scroll) const;

    /**
     * @brief Scroll offset that puts the image centre at the canvas centre.
     */
    QPointF centeredScroll() const;

    // ===== Point mapping =====

    QPointF canvasToWorld(QPointF pt) const { return pt + m_scroll; }
    QPointF worldToCanvas(QPointF pt) const { return pt - m_scroll; }
    QPointF worldToImage(QPointF pt) const;
    QPointF imageToWorld(QPointF pt) const;
    QPointF canvasToImage(QPointF pt) const { return worldToImage(canvasToWorld(pt)); }
    QPointF imageToCanvas(QPointF pt) const { return worldToCanvas(imageToWorld(pt)); }

    // ===== Visible area =====

    /**
     * @brief The canvas rectangle in world coordinates.
     */
    QRectF visibleWorldRect() const;

    /**
     * @brief Unclipped visible rectangle in image coordinates.
     *
     * May extend beyond the image on any side.
     */
    QRectF idealVisibleRect() const;

    /**
     * @brief Visible rectangle in image coordinates, clipped to [0,w] x [0,h].
     * @return A null QRectF when no image is loaded.
     *
     * The result may be empty (zero width or height) when the view lies
     * entirely in the padding.
     */
    QRectF visibleRectInImageSpace() const;

    /**
     * @brief Clip an image-space rectangle to the image bounds.
     */
    QRectF clipToImage(const QRectF& r) const;

    /**
     * @brief Convert a screen-pixel distance to image pixels (at least 1).
     */
    int screenToImagePx(int screenPx) const;

private:
    QSize m_imageSize;
    qreal m_zoom = 1.0;
    int m_canvasW = 1;
    int m_canvasH = 1;
    QPointF m_scroll;
    int m_pad = 1;
};
