// ============================================================================
// ViewportTuning - Implementation
// ============================================================================

#include "ViewportTuning.h"

#include <QSettings>
#include <QtMath>
#include <QDebug>

qreal ViewportTuning::zoomT(qreal zoom) const
{
    if (zoom <= zoomLow) {
        return 0.0;
    }
    if (zoom >= zoomHigh) {
        return 1.0;
    }
    const qreal t = (zoom - zoomLow) / (zoomHigh - zoomLow);
    return t * t * (3.0 - 2.0 * t);
}

DragParams ViewportTuning::dragParams(qreal zoom) const
{
    const qreal t = zoomT(zoom);

    DragParams p;
    p.marginScreenPx = qRound(dragMarginLowZoom + (dragMarginHighZoom - dragMarginLowZoom) * t);
    p.quantScreenPx = qRound(dragQuantLowZoom + (dragQuantHighZoom - dragQuantLowZoom) * t);
    p.debounceMs = qRound(baseEdgeDebounceMs * (1.0 + 1.2 * t));

    p.marginScreenPx = qBound(80, p.marginScreenPx, 900);
    p.quantScreenPx = qBound(8, p.quantScreenPx, 256);
    p.debounceMs = qBound(8, p.debounceMs, 200);
    return p;
}

qreal ViewportTuning::escapeMinIntervalMs(qreal zoom) const
{
    const qreal t = zoomT(zoom);
    return escapeMinIntervalLowZoomMs
           + (escapeMinIntervalHighZoomMs - escapeMinIntervalLowZoomMs) * t;
}

qreal ViewportTuning::fallbackMinIntervalMs(qreal zoom, bool outsideTile) const
{
    const qreal t = zoomT(zoom);
    qreal interval = fallbackMinIntervalLowZoomMs
                     + (fallbackMinIntervalHighZoomMs - fallbackMinIntervalLowZoomMs) * t;
    if (outsideTile) {
        interval = qMax(interval, fallbackOutsideTileMinIntervalMs * t);
    }
    return interval;
}

qreal ViewportTuning::clampZoom(qreal zoom) const
{
    return qBound(minZoom, zoom, maxZoom);
}

// ===== Persistence =====

void ViewportTuning::load(QSettings& settings)
{
    settings.beginGroup("Viewport");

    initialZoom = clampZoom(settings.value("initialZoom", initialZoom).toDouble());
    wheelNotchRatio = qBound(1.01, settings.value("wheelNotchRatio", wheelNotchRatio).toDouble(), 2.0);
    padPixels = qBound(0, settings.value("padPixels", padPixels).toInt(), 10000);

    idleMarginScreenPx = qBound(0, settings.value("idleMargin", idleMarginScreenPx).toInt(), 2000);
    innerToleranceScreenPx = qBound(0, settings.value("innerTolerance", innerToleranceScreenPx).toInt(), 2000);
    edgeTriggerScreenPx = qBound(0, settings.value("edgeTrigger", edgeTriggerScreenPx).toInt(), 2000);
    baseEdgeDebounceMs = qBound(0, settings.value("baseEdgeDebounce", baseEdgeDebounceMs).toInt(), 200);

    // zoomT() divides by the width of this range
    zoomLow = qBound(minZoom, settings.value("zoomLow", zoomLow).toDouble(), maxZoom);
    zoomHigh = qBound(zoomLow + 0.1, settings.value("zoomHigh", zoomHigh).toDouble(), maxZoom + 0.1);

    dragMarginLowZoom = qBound(80, settings.value("dragMarginLowZoom", dragMarginLowZoom).toInt(), 900);
    dragMarginHighZoom = qBound(80, settings.value("dragMarginHighZoom", dragMarginHighZoom).toInt(), 900);
    dragQuantLowZoom = qBound(8, settings.value("dragQuantLowZoom", dragQuantLowZoom).toInt(), 256);
    dragQuantHighZoom = qBound(8, settings.value("dragQuantHighZoom", dragQuantHighZoom).toInt(), 256);

    freezeEnabled = settings.value("freezeEnabled", freezeEnabled).toBool();
    escapeThresholdScreenPx = qBound(1, settings.value("escapeThreshold", escapeThresholdScreenPx).toInt(), 4000);
    escapeMinIntervalLowZoomMs = qBound(0, settings.value("escapeMinIntervalLowZoom", escapeMinIntervalLowZoomMs).toInt(), 1000);
    escapeMinIntervalHighZoomMs = qBound(0, settings.value("escapeMinIntervalHighZoom", escapeMinIntervalHighZoomMs).toInt(), 1000);

    previewEnabled = settings.value("previewEnabled", previewEnabled).toBool();
    previewMinIntervalMs = qBound(0, settings.value("previewMinInterval", previewMinIntervalMs).toInt(), 1000);
    previewExtraBias = qBound(0.0, settings.value("previewExtraBias", previewExtraBias).toDouble(), 4.0);

    fallbackMinIntervalLowZoomMs = qBound(0, settings.value("fallbackMinIntervalLowZoom", fallbackMinIntervalLowZoomMs).toInt(), 1000);
    fallbackMinIntervalHighZoomMs = qBound(0, settings.value("fallbackMinIntervalHighZoom", fallbackMinIntervalHighZoomMs).toInt(), 1000);
    fallbackOutsideTileMinIntervalMs = qBound(0, settings.value("fallbackOutsideTileMinInterval", fallbackOutsideTileMinIntervalMs).toInt(), 1000);

    pyramidMinDim = qBound(1, settings.value("pyramidMinDim", pyramidMinDim).toInt(), 8192);
    pyramidMaxLevels = qBound(1, settings.value("pyramidMaxLevels", pyramidMaxLevels).toInt(), 12);
    sharpBias = qBound(0.0, settings.value("sharpBias", sharpBias).toDouble(), 4.0);

    highQualityDelayMs = qBound(0, settings.value("highQualityDelay", highQualityDelayMs).toInt(), 5000);
    scrollRedrawDelayMs = qBound(0, settings.value("scrollRedrawDelay", scrollRedrawDelayMs).toInt(), 1000);

    // Nearest upscaling is the default; smooth magnification is opt-in.
    upscaleMode = settings.value("smoothUpscale", upscaleMode == Qt::SmoothTransformation).toBool()
                      ? Qt::SmoothTransformation : Qt::FastTransformation;

    const QColor bg(settings.value("backgroundColor", backgroundColor.name()).toString());
    if (bg.isValid()) {
        backgroundColor = bg;
    } else {
        qWarning() << "ViewportTuning::load: ignoring invalid background color";
    }

    settings.endGroup();
}

void ViewportTuning::save(QSettings& settings) const
{
    settings.beginGroup("Viewport");
    settings.setValue("initialZoom", initialZoom);
    settings.setValue("wheelNotchRatio", wheelNotchRatio);
    settings.setValue("padPixels", padPixels);
    settings.setValue("idleMargin", idleMarginScreenPx);
    settings.setValue("innerTolerance", innerToleranceScreenPx);
    settings.setValue("edgeTrigger", edgeTriggerScreenPx);
    settings.setValue("baseEdgeDebounce", baseEdgeDebounceMs);
    settings.setValue("zoomLow", zoomLow);
    settings.setValue("zoomHigh", zoomHigh);
    settings.setValue("dragMarginLowZoom", dragMarginLowZoom);
    settings.setValue("dragMarginHighZoom", dragMarginHighZoom);
    settings.setValue("dragQuantLowZoom", dragQuantLowZoom);
    settings.setValue("dragQuantHighZoom", dragQuantHighZoom);
    settings.setValue("freezeEnabled", freezeEnabled);
    settings.setValue("escapeThreshold", escapeThresholdScreenPx);
    settings.setValue("escapeMinIntervalLowZoom", escapeMinIntervalLowZoomMs);
    settings.setValue("escapeMinIntervalHighZoom", escapeMinIntervalHighZoomMs);
    settings.setValue("previewEnabled", previewEnabled);
    settings.setValue("previewMinInterval", previewMinIntervalMs);
    settings.setValue("previewExtraBias", previewExtraBias);
    settings.setValue("fallbackMinIntervalLowZoom", fallbackMinIntervalLowZoomMs);
    settings.setValue("fallbackMinIntervalHighZoom", fallbackMinIntervalHighZoomMs);
    settings.setValue("fallbackOutsideTileMinInterval", fallbackOutsideTileMinIntervalMs);
    settings.setValue("pyramidMinDim", pyramidMinDim);
    settings.setValue("pyramidMaxLevels", pyramidMaxLevels);
    settings.setValue("sharpBias", sharpBias);
    settings.setValue("highQualityDelay", highQualityDelayMs);
    settings.setValue("scrollRedrawDelay", scrollRedrawDelayMs);
    settings.setValue("smoothUpscale", upscaleMode == Qt::SmoothTransformation);
    settings.setValue("backgroundColor", backgroundColor.name());
    settings.endGroup();
}
