// ============================================================================
// FrameStrip - Implementation
// ============================================================================

#include "FrameStrip.h"

#include <QString>

namespace FrameStrip {

Layout autoDetect(int sheetWidth, int sheetHeight)
{
    Layout layout;
    layout.frameWidth = sheetWidth;
    layout.frameHeight = sheetHeight;

    if (sheetWidth > 0 && sheetHeight > 0) {
        if (sheetHeight >= sheetWidth && sheetHeight % sheetWidth == 0) {
            layout.frameWidth = sheetWidth;
            layout.frameHeight = sheetWidth;
            layout.direction = Direction::Vertical;
            layout.frameCount = qMax(1, sheetHeight / sheetWidth);
        } else if (sheetWidth >= sheetHeight && sheetWidth % sheetHeight == 0) {
            layout.frameWidth = sheetHeight;
            layout.frameHeight = sheetHeight;
            layout.direction = Direction::Horizontal;
            layout.frameCount = qMax(1, sheetWidth / sheetHeight);
        }
    }
    return layout;
}

QVector<QImage> slice(const QImage& sheet, int frameWidth, int frameHeight, Direction direction)
{
    if (frameWidth <= 0 || frameHeight <= 0 || sheet.isNull()) {
        return { sheet };
    }

    // copy() fills the part of the rect outside the sheet with 0 (transparent)
    const QImage src = sheet.convertToFormat(QImage::Format_ARGB32);
    auto cropPadded = [&](int x0, int y0) {
        return src.copy(QRect(x0, y0, frameWidth, frameHeight));
    };

    QVector<QImage> frames;
    if (direction == Direction::Vertical) {
        const int count = qMax(1, sheet.height() / frameHeight);
        for (int i = 0; i < count; ++i) {
            frames.append(cropPadded(0, i * frameHeight));
        }
    } else {
        const int count = qMax(1, sheet.width() / frameWidth);
        for (int i = 0; i < count; ++i) {
            frames.append(cropPadded(i * frameWidth, 0));
        }
    }
    return frames;
}

QString directionName(Direction direction)
{
    return direction == Direction::Vertical ? QStringLiteral("vertical") : QStringLiteral("horizontal");
}

Direction directionFromName(const QString& name)
{
    return name == QLatin1String("vertical") ? Direction::Vertical : Direction::Horizontal;
}

} // namespace FrameStrip
