#pragma once

// ============================================================================
// ViewportTuning - Tunable constants for the smooth pan/zoom viewport
// ============================================================================
// Every knob used by the pyramid, tile cache, preview layer and drag
// scheduler lives here so that a viewport can be configured from one value.
//
// The numbers are empirically tuned. Only the mechanism they drive
// (freeze / escape / throttle) is load-bearing, not the exact values.
// ============================================================================

#include <QColor>
#include <Qt>

class QSettings;

/**
 * @brief Zoom-dependent parameters derived from the easing curve.
 */
struct DragParams {
    int marginScreenPx = 0;   ///< Tile margin in screen pixels
    int quantScreenPx = 0;    ///< Tile quantization grid in screen pixels
    int debounceMs = 0;       ///< Edge debounce delay
};

/**
 * @brief Configuration for ImageViewport and its layers.
 *
 * Defaults match the tuned behaviour of the viewer. Use load() to apply
 * user overrides from the "Viewport" settings group.
 */
struct ViewportTuning {
    // ----- Zoom -----
    qreal minZoom = 0.5;
    qreal maxZoom = 16.0;
    qreal initialZoom = 4.0;
    qreal wheelNotchRatio = 1.125;   ///< Zoom factor per 120 wheel units

    // ----- Scroll region -----
    int padPixels = 0;               ///< 0 = auto (max of canvas width/height)

    // ----- Idle tile (screen px) -----
    int idleMarginScreenPx = 160;
    int innerToleranceScreenPx = 140;
    int edgeTriggerScreenPx = 140;   ///< Only used when freeze is disabled
    int baseEdgeDebounceMs = 18;

    // ----- Zoom easing range -----
    qreal zoomLow = 2.5;
    qreal zoomHigh = 10.0;

    // ----- Drag tile size control -----
    int dragMarginLowZoom = 260;
    int dragMarginHighZoom = 420;
    int dragQuantLowZoom = 32;
    int dragQuantHighZoom = 64;

    // ----- Freeze + escape hatch -----
    bool freezeEnabled = true;
    int escapeThresholdScreenPx = 130;
    int escapeMinIntervalLowZoomMs = 0;
    int escapeMinIntervalHighZoomMs = 75;

    // ----- Preview (proxy) layer -----
    bool previewEnabled = true;
    int previewMinIntervalMs = 18;
    qreal previewExtraBias = 0.95;

    // ----- Fallback drag throttle (freeze disabled) -----
    int fallbackMinIntervalLowZoomMs = 0;
    int fallbackMinIntervalHighZoomMs = 55;
    int fallbackOutsideTileMinIntervalMs = 70;

    // ----- Pyramid -----
    int pyramidMinDim = 256;
    int pyramidMaxLevels = 5;
    qreal sharpBias = 0.55;

    // ----- Resampling filters -----
    Qt::TransformationMode downscaleMode = Qt::SmoothTransformation;
    Qt::TransformationMode upscaleMode = Qt::FastTransformation;   ///< Nearest keeps pixel art crisp
    Qt::TransformationMode previewMode = Qt::SmoothTransformation;

    // ----- Deferred redraws -----
    int highQualityDelayMs = 120;
    int scrollRedrawDelayMs = 16;

    QColor backgroundColor = QColor(0x20, 0x20, 0x20);

    /**
     * @brief Smoothstep position of a zoom value inside [zoomLow, zoomHigh].
     * @return 0 below zoomLow, 1 above zoomHigh, 3t^2 - 2t^3 in between.
     */
    qreal zoomT(qreal zoom) const;

    /**
     * @brief Margin, quantization and debounce for a drag at the given zoom.
     */
    DragParams dragParams(qreal zoom) const;

    /**
     * @brief Minimum interval between escape redraws at the given zoom.
     */
    qreal escapeMinIntervalMs(qreal zoom) const;

    /**
     * @brief Minimum interval between fallback drag redraws (freeze disabled).
     * @param outsideTile True when the view already left the cached tile.
     */
    qreal fallbackMinIntervalMs(qreal zoom, bool outsideTile) const;

    qreal clampZoom(qreal zoom) const;

    /**
     * @brief Read overrides from the "Viewport" group of @p settings.
     *
     * Missing keys keep their current value. Out-of-range values are clamped.
     */
    void load(QSettings& settings);

    /**
     * @brief Write all values to the "Viewport" group of @p settings.
     */
    void save(QSettings& settings) const;
};
