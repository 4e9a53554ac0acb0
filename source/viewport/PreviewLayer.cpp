// ============================================================================
// PreviewLayer - Implementation
// ============================================================================

#include "PreviewLayer.h"
#include "../core/LevelSelector.h"

#include <QPainter>
#include <QtMath>
#include <QDebug>

PreviewPlacement PreviewLayer::placement(const ViewportGeometry& geom)
{
    PreviewPlacement p;
    p.canvasSize = QSize(geom.canvasWidth(), geom.canvasHeight());
    p.ideal = geom.idealVisibleRect();
    p.crop = geom.clipToImage(p.ideal);

    if (p.intersectsImage()) {
        const qreal z = geom.zoom();
        p.offset = QPoint(qRound((p.crop.left() - p.ideal.left()) * z),
                          qRound((p.crop.top() - p.ideal.top()) * z));
    }
    return p;
}

bool PreviewLayer::render(const ResolutionPyramid& pyramid, const ViewportGeometry& geom)
{
    if (pyramid.isEmpty() || !geom.hasImage()) {
        return false;
    }

    const PreviewPlacement p = placement(geom);

    QImage canvas(p.canvasSize, QImage::Format_ARGB32_Premultiplied);
    if (canvas.isNull()) {
        qWarning() << "PreviewLayer::render: cannot allocate" << p.canvasSize;
        return false;
    }
    canvas.fill(m_tuning.backgroundColor);

    if (p.intersectsImage()) {
        const qreal z = geom.zoom();
        const LevelChoice choice = LevelSelector::select(
            pyramid, z, m_tuning.sharpBias + m_tuning.previewExtraBias);
        if (!choice.isValid()) {
            return false;
        }

        const int levelW = choice.image.width();
        const int levelH = choice.image.height();

        int l2 = qRound(p.crop.left() * choice.scale);
        int t2 = qRound(p.crop.top() * choice.scale);
        int r2 = qRound(p.crop.right() * choice.scale);
        int b2 = qRound(p.crop.bottom() * choice.scale);
        l2 = qBound(0, l2, levelW - 1);
        t2 = qBound(0, t2, levelH - 1);
        r2 = qBound(l2 + 1, r2, levelW);
        b2 = qBound(t2 + 1, b2, levelH);

        const QSize target(qMax(1, qRound(p.crop.width() * z)),
                           qMax(1, qRound(p.crop.height() * z)));

        const QImage scaled = choice.image.copy(QRect(l2, t2, r2 - l2, b2 - t2))
                                  .scaled(target, Qt::IgnoreAspectRatio, m_tuning.previewMode);
        if (scaled.isNull()) {
            qWarning() << "PreviewLayer::render: resample to" << target << "failed";
            return false;
        }

        QPainter painter(&canvas);
        painter.drawImage(p.offset, scaled);
    }

    m_bitmap = canvas;
    ++m_renderCount;

#ifdef TIMSCOPE_DEBUG
    qDebug() << "PreviewLayer::render: crop" << p.crop << "offset" << p.offset;
#endif

    return true;
}

void PreviewLayer::hide()
{
    m_visible = false;
    m_bitmap = QImage();
}
