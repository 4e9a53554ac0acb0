// ============================================================================
// ResolutionPyramid - Implementation
// ============================================================================

#include "ResolutionPyramid.h"

#include <QDebug>

void ResolutionPyramid::build(const QImage& source, int minDim, int maxLevels)
{
    QVector<PyramidLevel> levels;

    if (source.isNull()) {
        m_levels.swap(levels);
        return;
    }

    levels.append({1.0, source});

    int w = source.width();
    int h = source.height();
    qreal scale = 1.0;
    QImage current = source;

    for (int i = 1; i < maxLevels; ++i) {
        if (qMin(w, h) <= minDim) {
            break;
        }
        w = qMax(1, w / 2);
        h = qMax(1, h / 2);
        scale *= 0.5;

        // Halve from the previous level (not from the source) so each step
        // is a cheap 2:1 smooth reduction.
        current = current.scaled(w, h, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
        if (current.isNull()) {
            qWarning() << "ResolutionPyramid::build: failed to allocate level" << i
                       << "at" << w << "x" << h;
            break;
        }
        levels.append({scale, current});
    }

#ifdef TIMSCOPE_DEBUG
    qDebug() << "ResolutionPyramid::build:" << source.size() << "->" << levels.size() << "levels";
#endif

    m_levels.swap(levels);
}

void ResolutionPyramid::clear()
{
    m_levels.clear();
}

QSize ResolutionPyramid::sourceSize() const
{
    if (m_levels.isEmpty()) {
        return QSize();
    }
    return m_levels.first().image.size();
}
