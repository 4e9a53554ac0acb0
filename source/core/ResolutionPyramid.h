#pragma once

// ============================================================================
// ResolutionPyramid - Progressively half-scaled copies of a source image
// ============================================================================
// Level 0 is the source itself (scale 1.0). Each following level halves
// width and height until the configured level count is reached or the
// image's smaller side no longer exceeds the minimum dimension.
//
// The pyramid is rebuilt wholesale whenever the viewport's source image is
// replaced. Readers never observe a partially built pyramid: build() fills
// a local list and swaps it in at the end.
// ============================================================================

#include <QImage>
#include <QVector>

/**
 * @brief One pre-downscaled copy of the source image.
 */
struct PyramidLevel {
    qreal scale = 1.0;    ///< Scale relative to the source (1.0, 0.5, 0.25, ...)
    QImage image;         ///< The downscaled raster
};

/**
 * @brief Ordered list of pyramid levels with strictly decreasing scale.
 */
class ResolutionPyramid {
public:
    ResolutionPyramid() = default;

    /**
     * @brief Rebuild the pyramid from a new source image.
     * @param source The source raster (level 0). A null image clears the pyramid.
     * @param minDim Stop halving once the smaller side is <= minDim.
     * @param maxLevels Upper bound on the number of levels (including level 0).
     */
    void build(const QImage& source, int minDim, int maxLevels);

    void clear();

    bool isEmpty() const { return m_levels.isEmpty(); }
    int levelCount() const { return m_levels.size(); }
    const PyramidLevel& level(int index) const { return m_levels.at(index); }
    const QVector<PyramidLevel>& levels() const { return m_levels; }

    /**
     * @brief Size of the level-0 image (null size when empty).
     */
    QSize sourceSize() const;

private:
    QVector<PyramidLevel> m_levels;
};
