#pragma once

// ============================================================================
// ResolutionPyramidTests - Unit tests for the pyramid builder and level selector
// ============================================================================
// - Level count, scales and sizes for a large source
// - Small sources stay a single level
// - Replacing the source rebuilds the pyramid from scratch
// - Level choice for the sharp and preview biases
// ============================================================================

#include "ResolutionPyramid.h"
#include "LevelSelector.h"
#include <QDebug>
#include <QtMath>

namespace ResolutionPyramidTests {

inline QImage makeSource(int w, int h)
{
    QImage img(w, h, QImage::Format_ARGB32);
    img.fill(QColor(40, 120, 200));
    return img;
}

/**
 * @brief A 2048x2048 source halves down to the 256 floor.
 */
inline bool testLevelsShrinkToFloor()
{
    qDebug() << "=== Test: Pyramid Levels Shrink To Floor ===";

    ResolutionPyramid pyramid;
    pyramid.build(makeSource(2048, 2048), 256, 5);

    bool success = true;

    if (pyramid.levelCount() != 4) {
        qDebug() << "FAIL: expected 4 levels, got" << pyramid.levelCount();
        return false;
    }

    const qreal expectedScales[] = {1.0, 0.5, 0.25, 0.125};
    const int expectedSides[] = {2048, 1024, 512, 256};
    for (int i = 0; i < 4; ++i) {
        const PyramidLevel& lvl = pyramid.level(i);
        if (!qFuzzyCompare(lvl.scale, expectedScales[i])) {
            qDebug() << "FAIL: level" << i << "scale" << lvl.scale;
            success = false;
        }
        if (lvl.image.size() != QSize(expectedSides[i], expectedSides[i])) {
            qDebug() << "FAIL: level" << i << "size" << lvl.image.size();
            success = false;
        }
        if (i > 0 && !(lvl.scale < pyramid.level(i - 1).scale)) {
            qDebug() << "FAIL: scales not strictly decreasing at level" << i;
            success = false;
        }
    }

    const QImage& last = pyramid.levels().last().image;
    if (qMin(last.width(), last.height()) > 256) {
        qDebug() << "FAIL: last level above floor:" << last.size();
        success = false;
    }

    if (pyramid.sourceSize() != QSize(2048, 2048)) {
        qDebug() << "FAIL: sourceSize" << pyramid.sourceSize();
        success = false;
    }

    if (success) {
        qDebug() << "PASS: 2048x2048 -> 4 levels ending at 256";
    }
    return success;
}

/**
 * @brief Non-square sources stop on the smaller side and respect the level cap.
 */
inline bool testSmallSideAndLevelCap()
{
    qDebug() << "=== Test: Pyramid Smaller Side And Level Cap ===";

    bool success = true;

    ResolutionPyramid wide;
    wide.build(makeSource(1024, 300), 256, 5);
    // 1024x300 -> 512x150; 150 <= 256 stops the halving
    if (wide.levelCount() != 2 || wide.level(1).image.size() != QSize(512, 150)) {
        qDebug() << "FAIL: wide sheet levels" << wide.levelCount();
        success = false;
    }

    ResolutionPyramid capped;
    capped.build(makeSource(1024, 1024), 16, 3);
    if (capped.levelCount() != 3) {
        qDebug() << "FAIL: level cap ignored, got" << capped.levelCount();
        success = false;
    }

    if (success) {
        qDebug() << "PASS: smaller side and level cap honored";
    }
    return success;
}

/**
 * @brief Replacing a large source with a 64x64 one leaves exactly one level.
 */
inline bool testRebuildWithSmallImage()
{
    qDebug() << "=== Test: Pyramid Rebuild With Small Image ===";

    ResolutionPyramid pyramid;
    pyramid.build(makeSource(2048, 2048), 256, 5);
    const int before = pyramid.levelCount();

    pyramid.build(makeSource(64, 64), 256, 5);

    bool success = true;
    if (before != 4) {
        qDebug() << "FAIL: initial level count" << before;
        success = false;
    }
    if (pyramid.levelCount() != 1) {
        qDebug() << "FAIL: expected 1 level after rebuild, got" << pyramid.levelCount();
        success = false;
    } else if (pyramid.level(0).image.size() != QSize(64, 64) || !qFuzzyCompare(pyramid.level(0).scale, 1.0)) {
        qDebug() << "FAIL: level 0 is not the new source";
        success = false;
    }

    pyramid.build(QImage(), 256, 5);
    if (!pyramid.isEmpty() || pyramid.sourceSize().isValid()) {
        qDebug() << "FAIL: null source did not clear the pyramid";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: rebuild replaced all levels";
    }
    return success;
}

/**
 * @brief Level choice for the sharp bias and the larger preview bias.
 */
inline bool testLevelSelection()
{
    qDebug() << "=== Test: Level Selection ===";

    ResolutionPyramid pyramid;
    pyramid.build(makeSource(2048, 2048), 256, 5);

    bool success = true;

    // zoom 1: the mismatch term dominates, full resolution wins
    LevelChoice c = LevelSelector::select(pyramid, 1.0, 0.55);
    if (c.index != 0 || !qFuzzyCompare(c.rel, 1.0)) {
        qDebug() << "FAIL: zoom 1.0 chose level" << c.index;
        success = false;
    }

    // zoom 0.25 matches level 2 exactly
    c = LevelSelector::select(pyramid, 0.25, 0.55);
    if (c.index != 2 || !qFuzzyCompare(c.rel, 1.0)) {
        qDebug() << "FAIL: zoom 0.25 chose level" << c.index << "rel" << c.rel;
        success = false;
    }

    // Magnification always uses level 0
    c = LevelSelector::select(pyramid, 4.0, 0.55);
    if (c.index != 0 || !qFuzzyCompare(c.rel, 4.0)) {
        qDebug() << "FAIL: zoom 4.0 chose level" << c.index;
        success = false;
    }

    // The preview bias pushes the same zoom onto the smallest level
    c = LevelSelector::select(pyramid, 1.0, 0.55 + 0.95);
    if (c.index != 3 || !c.isValid()) {
        qDebug() << "FAIL: preview bias chose level" << c.index;
        success = false;
    }

    ResolutionPyramid empty;
    c = LevelSelector::select(empty, 1.0, 0.55);
    if (c.isValid() || c.index != -1) {
        qDebug() << "FAIL: empty pyramid produced a level";
        success = false;
    }

    // score = |log2(zoom/scale)| - bias * -log2(scale)
    if (!qFuzzyCompare(LevelSelector::score(1.0, 0.5, 0.55) + 1.0, 0.45 + 1.0)) {
        qDebug() << "FAIL: score(1, 0.5, 0.55) =" << LevelSelector::score(1.0, 0.5, 0.55);
        success = false;
    }

    if (success) {
        qDebug() << "PASS: level selection";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running Resolution Pyramid Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testLevelsShrinkToFloor();
    qDebug() << "";

    allPass &= testSmallSideAndLevelCap();
    qDebug() << "";

    allPass &= testRebuildWithSmallImage();
    qDebug() << "";

    allPass &= testLevelSelection();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace ResolutionPyramidTests
