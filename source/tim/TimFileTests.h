#pragma once

// ============================================================================
// TimFileTests - Unit tests for TIM parsing, rendering and the index editor
// ============================================================================
// - Header and block validation
// - 4bpp / 8bpp / 16bpp rendering, with and without a CLUT
// - CLUT extraction and byte-exact rebuilding
// - Sprite sheet slicing
// - Index PNG export/import through a temporary directory
// ============================================================================

#include "TimFile.h"
#include "FrameStrip.h"
#include "TimIndexEditor.h"

#include <QDataStream>
#include <QDebug>
#include <QFile>
#include <QTemporaryDir>

namespace TimFileTests {

/**
 * @brief Assemble a TIM in memory. An empty @p clut omits the CLUT block.
 */
inline QByteArray makeTimBytes(int bppMode, const QVector<quint16>& clut, int clutW, int clutH,
                               quint16 widthWords, quint16 height, const QByteArray& pixels)
{
    QByteArray out;
    QDataStream s(&out, QIODevice::WriteOnly);
    s.setByteOrder(QDataStream::LittleEndian);

    s << quint32(TimFile::Magic) << quint32(bppMode | (clut.isEmpty() ? 0 : 0x8));
    if (!clut.isEmpty()) {
        s << quint32(12 + clut.size() * 2) << quint16(0) << quint16(480) << quint16(clutW) << quint16(clutH);
        for (quint16 c : clut) {
            s << c;
        }
    }
    s << quint32(12 + pixels.size()) << quint16(320) << quint16(0) << widthWords << height;
    s.writeRawData(pixels.constData(), pixels.size());
    return out;
}

/**
 * @brief 16 colors: 0 transparent, 1 red, 2 green, 3 blue, the rest white.
 */
inline QVector<quint16> basicClut()
{
    QVector<quint16> c(16, 0x7FFF);
    c[0] = 0x0000;
    c[1] = 0x001F;
    c[2] = 0x03E0;
    c[3] = 0x7C00;
    return c;
}

/**
 * @brief 4x2 pixels, indices 0..7 row-major.
 */
inline QByteArray fourBppPixels()
{
    return QByteArray::fromHex("10325476");
}

inline bool testParseErrors()
{
    qDebug() << "=== Test: TIM Parse Errors ===";

    bool success = true;

    TimFile::ParseResult r = TimFile::parse(QByteArray(4, '\0'));
    if (r.success || !r.errorMessage.contains("too small")) {
        qDebug() << "FAIL: short file" << r.errorMessage;
        success = false;
    }

    QByteArray bad = makeTimBytes(TimImage::Bpp4, {}, 0, 0, 1, 2, fourBppPixels());
    bad[0] = 0x11;
    r = TimFile::parse(bad);
    if (r.success || !r.errorMessage.contains("magic")) {
        qDebug() << "FAIL: bad magic" << r.errorMessage;
        success = false;
    }

    // CLUT flag set but the block header is cut off
    const QByteArray clutCut = makeTimBytes(TimImage::Bpp4, basicClut(), 16, 1, 1, 2, fourBppPixels()).left(14);
    r = TimFile::parse(clutCut);
    if (r.success || !r.errorMessage.contains("CLUT block truncated")) {
        qDebug() << "FAIL: truncated CLUT" << r.errorMessage;
        success = false;
    }

    // Image block declares more bytes than the file holds
    const QByteArray full = makeTimBytes(TimImage::Bpp8, {}, 0, 0, 4, 4, QByteArray(32, '\x01'));
    r = TimFile::parse(full.left(full.size() - 5));
    if (r.success || !r.errorMessage.contains("image block truncated")) {
        qDebug() << "FAIL: truncated image" << r.errorMessage;
        success = false;
    }

    r = TimFile::parse(full, "/tmp/FULL.TIM");
    if (!r.success || r.tim.pixelWidth() != 8 || r.tim.imgHeight != 4 || r.tim.imgX != 320
        || r.tim.path != "/tmp/FULL.TIM" || r.tim.bppName() != "8bpp" || r.tim.hasClut) {
        qDebug() << "FAIL: valid 8bpp header" << r.errorMessage;
        success = false;
    }

    if (success) {
        qDebug() << "PASS: parse errors";
    }
    return success;
}

inline bool testRenderIndexed()
{
    qDebug() << "=== Test: Render Indexed ===";

    const TimFile::ParseResult parsed = TimFile::parse(
        makeTimBytes(TimImage::Bpp4, basicClut(), 16, 1, 1, 2, fourBppPixels()), "BODY.TIM");
    if (!parsed.success) {
        qDebug() << "FAIL: parse" << parsed.errorMessage;
        return false;
    }
    const TimImage& tim = parsed.tim;
    const QVector<TimClut> cluts = TimFile::extractCluts(tim);

    bool success = true;

    const QVector<quint8> indices = TimFile::decodeIndices(tim);
    if (indices != QVector<quint8>({0, 1, 2, 3, 4, 5, 6, 7})) {
        qDebug() << "FAIL: 4bpp indices low nibble first" << indices;
        success = false;
    }

    const TimFile::RenderResult colored = TimFile::render(tim, &cluts.first());
    if (!colored.success || colored.image.size() != QSize(4, 2)) {
        qDebug() << "FAIL: render with CLUT" << colored.errorMessage;
        return false;
    }
    if (qAlpha(colored.image.pixel(0, 0)) != 0 || colored.image.pixel(1, 0) != qRgba(255, 0, 0, 255)
        || colored.image.pixel(3, 0) != qRgba(0, 0, 255, 255) || colored.image.pixel(0, 1) != qRgba(255, 255, 255, 255)) {
        qDebug() << "FAIL: CLUT colors";
        success = false;
    }

    // No CLUT: indices shown as gray levels
    const TimFile::RenderResult gray = TimFile::render(tim, nullptr);
    if (!gray.success || gray.image.pixel(3, 1) != qRgba(7, 7, 7, 255)) {
        qDebug() << "FAIL: gray render";
        success = false;
    }

    // Indices past a short CLUT are magenta
    TimClut small = cluts.first();
    small.colors.resize(4);
    const TimFile::RenderResult partial = TimFile::render(tim, &small);
    if (partial.image.pixel(2, 1) != qRgba(255, 0, 255, 255) || partial.image.pixel(2, 0) != qRgba(0, 255, 0, 255)) {
        qDebug() << "FAIL: out-of-range index color";
        success = false;
    }

    // 8bpp with a short payload renders missing pixels as index 0
    const TimFile::ParseResult eight = TimFile::parse(
        makeTimBytes(TimImage::Bpp8, basicClut(), 16, 1, 2, 2, QByteArray::fromHex("0102")));
    const TimClut clut8 = TimFile::extractCluts(eight.tim).first();
    const TimFile::RenderResult r8 = TimFile::render(eight.tim, &clut8);
    if (!r8.success || r8.image.size() != QSize(4, 2) || r8.image.pixel(1, 0) != qRgba(0, 255, 0, 255)
        || qAlpha(r8.image.pixel(3, 1)) != 0) {
        qDebug() << "FAIL: 8bpp render";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: indexed render";
    }
    return success;
}

inline bool testRenderDirect()
{
    qDebug() << "=== Test: Render 16bpp and 24bpp ===";

    bool success = true;

    QByteArray words;
    QDataStream s(&words, QIODevice::WriteOnly);
    s.setByteOrder(QDataStream::LittleEndian);
    s << quint16(0x7C00) << quint16(0x0000) << quint16(0x8000) << quint16(0x03E0);

    const TimFile::ParseResult parsed = TimFile::parse(makeTimBytes(TimImage::Bpp16, {}, 0, 0, 4, 1, words));
    const TimFile::RenderResult r = TimFile::render(parsed.tim, nullptr);
    if (!r.success || r.image.size() != QSize(4, 1)) {
        qDebug() << "FAIL: 16bpp render" << r.errorMessage;
        return false;
    }
    if (r.image.pixel(0, 0) != qRgba(0, 0, 255, 255) || qAlpha(r.image.pixel(1, 0)) != 0
        || qAlpha(r.image.pixel(2, 0)) != 0 || r.image.pixel(3, 0) != qRgba(0, 255, 0, 255)) {
        qDebug() << "FAIL: 16bpp colors";
        success = false;
    }
    if (parsed.tim.isIndexed() || !TimFile::decodeIndices(parsed.tim).isEmpty()) {
        qDebug() << "FAIL: 16bpp reported as indexed";
        success = false;
    }

    const TimFile::ParseResult p24 = TimFile::parse(makeTimBytes(TimImage::Bpp24, {}, 0, 0, 3, 1, QByteArray(6, '\0')));
    const TimFile::RenderResult r24 = TimFile::render(p24.tim, nullptr);
    if (!p24.success || r24.success || !r24.errorMessage.contains("not supported")) {
        qDebug() << "FAIL: 24bpp should be rejected" << r24.errorMessage;
        success = false;
    }

    if (TimFile::colorFrom15Bit(0x7FFF) != qRgba(255, 255, 255, 255) || TimFile::colorFrom15Bit(0x0010) != qRgba(132, 0, 0, 255)) {
        qDebug() << "FAIL: 5-bit expansion";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: direct color render";
    }
    return success;
}

inline bool testExtractCluts()
{
    qDebug() << "=== Test: CLUT Extraction ===";

    bool success = true;

    QVector<quint16> twoRows = basicClut() + basicClut();
    twoRows[17] = 0x001F;
    const TimFile::ParseResult parsed = TimFile::parse(
        makeTimBytes(TimImage::Bpp4, twoRows, 16, 2, 1, 2, fourBppPixels()), "/data/BODY.TIM");
    const QVector<TimClut> cluts = TimFile::extractCluts(parsed.tim);
    if (cluts.size() != 2 || cluts[1].row != 1 || cluts[1].colors.size() != 16 || cluts[1].raw[17 - 16] != 0x001F) {
        qDebug() << "FAIL: two-row CLUT" << cluts.size();
        success = false;
    } else if (cluts[1].label() != "BODY.TIM | CLUT #1 (row 1, 16 cols)") {
        qDebug() << "FAIL: label" << cluts[1].label();
        success = false;
    }

    // Header claims 2 rows but holds only 24 colors: one complete row survives
    const QVector<quint16> partialRows = basicClut() + QVector<quint16>(8, 0x1234);
    const TimFile::ParseResult partial = TimFile::parse(
        makeTimBytes(TimImage::Bpp4, partialRows, 16, 2, 1, 2, fourBppPixels()));
    const QVector<TimClut> shrunk = TimFile::extractCluts(partial.tim);
    if (shrunk.size() != 1 || shrunk.first().height != 1) {
        qDebug() << "FAIL: truncated CLUT rows" << shrunk.size();
        success = false;
    }

    const TimFile::ParseResult none = TimFile::parse(makeTimBytes(TimImage::Bpp4, {}, 0, 0, 1, 2, fourBppPixels()));
    if (!TimFile::extractCluts(none.tim).isEmpty()) {
        qDebug() << "FAIL: CLUTs from a TIM without a CLUT block";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: CLUT extraction";
    }
    return success;
}

inline bool testRebuildBytes()
{
    qDebug() << "=== Test: Rebuild Bytes ===";

    bool success = true;

    const QByteArray original = makeTimBytes(TimImage::Bpp4, basicClut(), 16, 1, 1, 2, fourBppPixels());
    TimFile::ParseResult parsed = TimFile::parse(original);
    const TimFile::EncodeResult rebuilt = TimFile::buildBytes(parsed.tim);
    if (!rebuilt.success || rebuilt.bytes != original) {
        qDebug() << "FAIL: unmodified TIM not byte-identical";
        success = false;
    }

    TimImage broken = parsed.tim;
    broken.clutBlockRaw.clear();
    const TimFile::EncodeResult missing = TimFile::buildBytes(broken);
    if (missing.success || !missing.errorMessage.contains("CLUT block is missing")) {
        qDebug() << "FAIL: missing CLUT block accepted";
        success = false;
    }

    QTemporaryDir dir;
    const QString path = dir.filePath("OUT.TIM");
    const TimFile::EncodeResult saved = TimFile::save(parsed.tim, path);
    const TimFile::ParseResult loaded = TimFile::load(path);
    if (!saved.success || !loaded.success || loaded.tim.originalBytes != original) {
        qDebug() << "FAIL: save/load" << saved.errorMessage << loaded.errorMessage;
        success = false;
    }

    if (TimFile::load(dir.filePath("MISSING.TIM")).success) {
        qDebug() << "FAIL: loading a missing file succeeded";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: rebuild";
    }
    return success;
}

inline bool testFrameStrip()
{
    qDebug() << "=== Test: Frame Strip ===";

    bool success = true;

    const FrameStrip::Layout tall = FrameStrip::autoDetect(16, 64);
    if (tall.direction != FrameStrip::Direction::Vertical || tall.frameCount != 4 || tall.frameWidth != 16
        || tall.frameHeight != 16) {
        qDebug() << "FAIL: vertical detection";
        success = false;
    }
    const FrameStrip::Layout wide = FrameStrip::autoDetect(64, 16);
    if (wide.direction != FrameStrip::Direction::Horizontal || wide.frameCount != 4) {
        qDebug() << "FAIL: horizontal detection";
        success = false;
    }
    const FrameStrip::Layout odd = FrameStrip::autoDetect(20, 30);
    if (odd.frameCount != 1 || odd.frameWidth != 20 || odd.frameHeight != 30) {
        qDebug() << "FAIL: single frame fallback";
        success = false;
    }

    QImage sheet(40, 16, QImage::Format_ARGB32);
    sheet.fill(qRgba(10, 20, 30, 255));

    // Frames taller than the sheet are padded with transparency
    const QVector<QImage> frames = FrameStrip::slice(sheet, 16, 20, FrameStrip::Direction::Horizontal);
    if (frames.size() != 2 || frames[1].size() != QSize(16, 20) || qAlpha(frames[1].pixel(0, 18)) != 0
        || frames[1].pixel(0, 0) != qRgba(10, 20, 30, 255)) {
        qDebug() << "FAIL: horizontal slice" << frames.size();
        success = false;
    }

    const QVector<QImage> whole = FrameStrip::slice(sheet, 0, 16, FrameStrip::Direction::Vertical);
    if (whole.size() != 1 || whole.first().size() != sheet.size()) {
        qDebug() << "FAIL: zero frame size should keep the sheet";
        success = false;
    }

    if (FrameStrip::directionFromName(FrameStrip::directionName(FrameStrip::Direction::Vertical))
            != FrameStrip::Direction::Vertical
        || FrameStrip::directionFromName("diagonal") != FrameStrip::Direction::Horizontal) {
        qDebug() << "FAIL: direction names";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: frame strip";
    }
    return success;
}

inline bool testIndexRoundTrip()
{
    qDebug() << "=== Test: Index Export/Import ===";

    QTemporaryDir dir;
    if (!dir.isValid()) {
        qDebug() << "FAIL: no temporary directory";
        return false;
    }

    bool success = true;

    // 8bpp: export and import unchanged
    QByteArray pixels8;
    for (int i = 0; i < 8; ++i) {
        pixels8.append(static_cast<char>(i * 30));
    }
    TimImage tim8 = TimFile::parse(makeTimBytes(TimImage::Bpp8, basicClut(), 16, 1, 2, 2, pixels8), "SPR.TIM").tim;
    const TimIndexEditor::ExportResult ex8 = TimIndexEditor::exportIndices(tim8, dir.filePath("spr.png"));
    if (!ex8.success || ex8.metaPath != dir.filePath("spr.json") || !QFile::exists(ex8.metaPath)) {
        qDebug() << "FAIL: 8bpp export" << ex8.errorMessage;
        return false;
    }
    const TimIndexEditor::ImportResult im8 = TimIndexEditor::importIndices(tim8, ex8.pngPath, ex8.metaPath);
    if (!im8.success || tim8.imgData != pixels8 || tim8.imgWidthWords != 2) {
        qDebug() << "FAIL: 8bpp import" << im8.errorMessage;
        success = false;
    }

    // 4bpp: export, then import a resized edit
    TimImage tim4 = TimFile::parse(makeTimBytes(TimImage::Bpp4, basicClut(), 16, 1, 1, 2, fourBppPixels()), "BODY.TIM").tim;
    const TimIndexEditor::ExportResult ex4 = TimIndexEditor::exportIndices(tim4, dir.filePath("sub/body.png"));
    if (!ex4.success) {
        qDebug() << "FAIL: 4bpp export" << ex4.errorMessage;
        return false;
    }
    TimImage copy4 = tim4;
    if (!TimIndexEditor::importIndices(copy4, ex4.pngPath, ex4.metaPath).success || copy4.imgData != tim4.imgData) {
        qDebug() << "FAIL: 4bpp unchanged import";
        success = false;
    }

    QImage edited(8, 2, QImage::Format_Indexed8);
    edited.setColorTable(TimIndexEditor::grayscalePalette(16));
    edited.fill(5);
    edited.save(dir.filePath("wide.png"), "PNG");
    const TimIndexEditor::ImportResult resized = TimIndexEditor::importIndices(copy4, dir.filePath("wide.png"), QString());
    if (!resized.success || resized.width != 8 || copy4.imgWidthWords != 2 || copy4.pixelWidth() != 8
        || copy4.imgData != QByteArray(4, '\x55')) {
        qDebug() << "FAIL: resized import" << resized.errorMessage;
        success = false;
    }

    // Index 20 does not fit 4bpp
    edited.setPixel(3, 1, 20);
    edited.save(dir.filePath("high.png"), "PNG");
    TimImage untouched = tim4;
    const TimIndexEditor::ImportResult high = TimIndexEditor::importIndices(untouched, dir.filePath("high.png"), QString());
    if (high.success || !high.errorMessage.contains("> 15") || untouched.imgData != tim4.imgData) {
        qDebug() << "FAIL: 4bpp overflow" << high.errorMessage;
        success = false;
    }

    QImage narrow(6, 2, QImage::Format_Indexed8);
    narrow.setColorTable(TimIndexEditor::grayscalePalette(16));
    narrow.fill(1);
    narrow.save(dir.filePath("narrow.png"), "PNG");
    const TimIndexEditor::ImportResult odd = TimIndexEditor::importIndices(untouched, dir.filePath("narrow.png"), QString());
    if (odd.success || !odd.errorMessage.contains("multiple of 4")) {
        qDebug() << "FAIL: width multiple" << odd.errorMessage;
        success = false;
    }

    // Sidecar written for an 8bpp TIM does not apply to a 4bpp one
    const TimIndexEditor::ImportResult mismatch = TimIndexEditor::importIndices(untouched, ex4.pngPath, ex8.metaPath);
    if (mismatch.success || !mismatch.errorMessage.contains("bpp_mode")) {
        qDebug() << "FAIL: meta mismatch" << mismatch.errorMessage;
        success = false;
    }

    QImage rgb(4, 2, QImage::Format_RGB32);
    rgb.fill(Qt::red);
    rgb.save(dir.filePath("rgb.png"), "PNG");
    if (TimIndexEditor::importIndices(untouched, dir.filePath("rgb.png"), QString()).success) {
        qDebug() << "FAIL: RGB PNG accepted";
        success = false;
    }

    TimImage direct = TimFile::parse(makeTimBytes(TimImage::Bpp16, {}, 0, 0, 2, 1, QByteArray(4, '\x01'))).tim;
    if (TimIndexEditor::exportIndices(direct, dir.filePath("direct.png")).success) {
        qDebug() << "FAIL: 16bpp index export";
        success = false;
    }

    if (TimIndexEditor::packIndices({1, 2, 3}, TimImage::Bpp4) != QByteArray::fromHex("2103")) {
        qDebug() << "FAIL: packIndices";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: index round trip";
    }
    return success;
}

inline bool testExportImage()
{
    qDebug() << "=== Test: Image Export ===";

    QTemporaryDir dir;
    bool success = true;

    QImage img(2, 1, QImage::Format_ARGB32);
    img.setPixel(0, 0, qRgba(0, 0, 0, 0));
    img.setPixel(1, 0, qRgba(200, 100, 50, 255));

    const TimIndexEditor::ImageExportResult png = TimIndexEditor::exportImage(img, dir.filePath("a.png"));
    const QImage pngBack(dir.filePath("a.png"));
    if (!png.success || qAlpha(pngBack.pixel(0, 0)) != 0) {
        qDebug() << "FAIL: PNG keeps alpha";
        success = false;
    }

    const TimIndexEditor::ImageExportResult bmp = TimIndexEditor::exportImage(img, dir.filePath("a.BMP"));
    const QImage bmpBack(dir.filePath("a.BMP"));
    if (!bmp.success || bmpBack.pixel(0, 0) != qRgb(0, 0, 0) || bmpBack.pixel(1, 0) != qRgb(200, 100, 50)) {
        qDebug() << "FAIL: BMP flattened on black";
        success = false;
    }

    if (TimIndexEditor::exportImage(QImage(), dir.filePath("none.png")).success) {
        qDebug() << "FAIL: null image exported";
        success = false;
    }

    if (TimIndexEditor::suggestedImageName("/x/BODY.TIM", 3) != "BODY_frame03.png"
        || TimIndexEditor::suggestedImageName("/x/BODY.TIM", -1) != "BODY.png") {
        qDebug() << "FAIL: suggested names";
        success = false;
    }

    if (success) {
        qDebug() << "PASS: image export";
    }
    return success;
}

inline bool runAllTests()
{
    qDebug() << "\n========================================";
    qDebug() << "Running TIM File Tests";
    qDebug() << "========================================\n";

    bool allPass = true;

    allPass &= testParseErrors();
    qDebug() << "";
    allPass &= testRenderIndexed();
    qDebug() << "";
    allPass &= testRenderDirect();
    qDebug() << "";
    allPass &= testExtractCluts();
    qDebug() << "";
    allPass &= testRebuildBytes();
    qDebug() << "";
    allPass &= testFrameStrip();
    qDebug() << "";
    allPass &= testIndexRoundTrip();
    qDebug() << "";
    allPass &= testExportImage();

    qDebug() << "\n========================================";
    if (allPass) {
        qDebug() << "ALL TESTS PASSED!";
    } else {
        qDebug() << "SOME TESTS FAILED!";
    }
    qDebug() << "========================================\n";

    return allPass;
}

} // namespace TimFileTests
