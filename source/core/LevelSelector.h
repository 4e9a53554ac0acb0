#pragma once

// ============================================================================
// LevelSelector - Picks the pyramid level that best matches a zoom
// ============================================================================
// score = |log2(zoom / scale)| - bias * (-log2(scale))
//
// The first term is the residual resampling mismatch. The second rewards
// smaller levels in proportion to the bias, so a larger bias trades detail
// for cheaper resampling. The sharp layer uses the base bias; the preview
// layer adds an extra bias on top and therefore lands on smaller levels.
// ============================================================================

#include "ResolutionPyramid.h"

/**
 * @brief Result of a level selection.
 */
struct LevelChoice {
    int index = -1;       ///< Chosen level index (-1 when the pyramid is empty)
    qreal scale = 1.0;    ///< Scale of the chosen level
    QImage image;         ///< The chosen level's raster (shared, not copied)
    qreal rel = 1.0;      ///< Residual factor zoom / scale still to apply

    bool isValid() const { return index >= 0 && !image.isNull(); }
};

namespace LevelSelector {

/**
 * @brief Score of one level for the given zoom and bias (lower is better).
 */
qreal score(qreal zoom, qreal scale, qreal bias);

/**
 * @brief Choose the minimum-score level of @p pyramid.
 *
 * Ties keep the earlier (higher-resolution) level.
 */
LevelChoice select(const ResolutionPyramid& pyramid, qreal zoom, qreal bias);

} // namespace LevelSelector
