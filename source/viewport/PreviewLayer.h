#pragma once

// ============================================================================
// PreviewLayer - Screen-pinned proxy image shown while dragging
// ============================================================================
// While the sharp tile is frozen during a pan, the preview layer fills the
// whole canvas from a smaller pyramid level so the user never sees blank
// padding where the tile does not reach. It is rebuilt from scratch on every
// update and painted at the canvas origin, below the sharp tile.
// ============================================================================

#include "../core/ResolutionPyramid.h"
#include "../core/ViewportGeometry.h"
#include "../core/ViewportTuning.h"

#include <QImage>
#include <QPoint>
#include <QRectF>

/**
 * @brief Where the clipped visible region lands inside the preview canvas.
 */
struct PreviewPlacement {
    QRectF ideal;        ///< Unclipped visible rect in image coordinates
    QRectF crop;         ///< Ideal rect clipped to the image
    QPoint offset;       ///< Paste position of the crop inside the canvas (screen px)
    QSize canvasSize;    ///< Size of the preview canvas

    bool intersectsImage() const { return crop.width() > 0.0 && crop.height() > 0.0; }
};

class PreviewLayer {
public:
    PreviewLayer() = default;

    void setTuning(const ViewportTuning& tuning) { m_tuning = tuning; }

    /**
     * @brief Compute the ideal/crop rectangles and paste offset for @p geom.
     */
    static PreviewPlacement placement(const ViewportGeometry& geom);

    /**
     * @brief Rebuild the preview bitmap for the current view.
     * @return False when nothing was rendered (no image, failed resample).
     *
     * A view that lies entirely in the padding renders a plain background.
     */
    bool render(const ResolutionPyramid& pyramid, const ViewportGeometry& geom);

    void show() { m_visible = true; }

    /**
     * @brief Hide the layer and drop its bitmap.
     */
    void hide();

    bool isVisible() const { return m_visible; }
    const QImage& bitmap() const { return m_bitmap; }
    int renderCount() const { return m_renderCount; }

private:
    ViewportTuning m_tuning;
    QImage m_bitmap;
    bool m_visible = false;
    int m_renderCount = 0;
};
