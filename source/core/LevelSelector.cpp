// ============================================================================
// LevelSelector - Implementation
// ============================================================================

#include "LevelSelector.h"

#include <QtMath>
#include <cmath>
#include <limits>

namespace LevelSelector {

qreal score(qreal zoom, qreal scale, qreal bias)
{
    const qreal rel = zoom / scale;
    if (rel <= 0.0 || scale <= 0.0) {
        return std::numeric_limits<qreal>::max();
    }
    return qAbs(std::log2(rel)) - bias * (-std::log2(scale));
}

LevelChoice select(const ResolutionPyramid& pyramid, qreal zoom, qreal bias)
{
    LevelChoice best;
    qreal bestScore = std::numeric_limits<qreal>::max();

    for (int i = 0; i < pyramid.levelCount(); ++i) {
        const PyramidLevel& lvl = pyramid.level(i);
        const qreal s = score(zoom, lvl.scale, bias);
        if (best.index < 0 || s < bestScore) {
            bestScore = s;
            best.index = i;
            best.scale = lvl.scale;
            best.image = lvl.image;
            best.rel = zoom / lvl.scale;
        }
    }

    return best;
}

} // namespace LevelSelector
