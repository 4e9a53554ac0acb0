#pragma once

// ============================================================================
// FrameStrip - Slicing a sprite sheet into animation frames
// ============================================================================

#include <QImage>
#include <QString>
#include <QVector>

namespace FrameStrip {

enum class Direction {
    Horizontal,
    Vertical
};

struct Layout {
    int frameWidth = 0;
    int frameHeight = 0;
    Direction direction = Direction::Horizontal;
    int frameCount = 1;
};

/**
 * @brief Guess the frame layout of a sheet.
 *
 * Tall sheets whose height is a multiple of the width become a vertical
 * strip of square frames; wide sheets whose width is a multiple of the
 * height become a horizontal strip. Anything else is a single frame.
 */
Layout autoDetect(int sheetWidth, int sheetHeight);

/**
 * @brief Cut @p sheet into frames of @p frameWidth x @p frameHeight.
 *
 * A non-positive frame size returns the sheet unchanged. Frames that run
 * past the sheet edge are padded with transparency.
 */
QVector<QImage> slice(const QImage& sheet, int frameWidth, int frameHeight, Direction direction);

QString directionName(Direction direction);
Direction directionFromName(const QString& name);

} // namespace FrameStrip
