// ============================================================================
// TimFile - Implementation
// ============================================================================

#include "TimFile.h"

#include <QFile>
#include <QFileInfo>
#include <QtEndian>
#include <QDebug>

namespace {

quint32 readU32(const QByteArray& data, int off)
{
    return qFromLittleEndian<quint32>(reinterpret_cast<const uchar*>(data.constData()) + off);
}

quint16 readU16(const QByteArray& data, int off)
{
    return qFromLittleEndian<quint16>(reinterpret_cast<const uchar*>(data.constData()) + off);
}

void appendU32(QByteArray& out, quint32 v)
{
    uchar buf[4];
    qToLittleEndian<quint32>(v, buf);
    out.append(reinterpret_cast<const char*>(buf), 4);
}

void appendU16(QByteArray& out, quint16 v)
{
    uchar buf[2];
    qToLittleEndian<quint16>(v, buf);
    out.append(reinterpret_cast<const char*>(buf), 2);
}

} // namespace

// ===== TimClut / TimImage =====

QString TimClut::label() const
{
    return QStringLiteral("%1 | CLUT #%2 (row %3, %4 cols)")
        .arg(QFileInfo(sourcePath).fileName())
        .arg(row)
        .arg(row)
        .arg(width);
}

int TimImage::pixelWidth() const
{
    switch (bppMode) {
    case Bpp4:  return imgWidthWords * 4;
    case Bpp8:  return imgWidthWords * 2;
    case Bpp16: return imgWidthWords;
    case Bpp24: return imgWidthWords * 2;   // Not decoded
    default:    return imgWidthWords;
    }
}

QString TimImage::bppName() const
{
    switch (bppMode) {
    case Bpp4:  return QStringLiteral("4bpp");
    case Bpp8:  return QStringLiteral("8bpp");
    case Bpp16: return QStringLiteral("16bpp");
    case Bpp24: return QStringLiteral("24bpp");
    default:    return QStringLiteral("mode%1").arg(bppMode);
    }
}

// ===== Parsing =====

TimFile::ParseResult TimFile::parse(const QByteArray& data, const QString& path)
{
    ParseResult result;

    if (data.size() < 8) {
        result.errorMessage = QObject::tr("File too small to be a TIM");
        return result;
    }
    if (readU32(data, 0) != Magic) {
        result.errorMessage = QObject::tr("Not a TIM (magic != 0x10)");
        return result;
    }

    TimImage& tim = result.tim;
    tim.path = path;
    tim.originalBytes = data;
    tim.flags = readU32(data, 4);
    tim.bppMode = static_cast<int>(tim.flags & 0x7);
    tim.hasClut = (tim.flags & 0x8) != 0;

    qint64 off = 8;

    if (tim.hasClut) {
        if (data.size() < off + 12) {
            result.errorMessage = QObject::tr("TIM CLUT block truncated");
            return result;
        }
        const quint32 clutLen = readU32(data, static_cast<int>(off));
        if (data.size() < off + clutLen) {
            result.errorMessage = QObject::tr("TIM CLUT block truncated (declared length too large)");
            return result;
        }
        tim.clutBlockRaw = data.mid(static_cast<int>(off), static_cast<int>(clutLen));
        off += clutLen;
    }

    if (data.size() < off + 12) {
        result.errorMessage = QObject::tr("TIM image block truncated");
        return result;
    }
    const quint32 imgLen = readU32(data, static_cast<int>(off));
    if (data.size() < off + imgLen) {
        result.errorMessage = QObject::tr("TIM image block truncated (declared length too large)");
        return result;
    }

    tim.imgX = readU16(data, static_cast<int>(off + 4));
    tim.imgY = readU16(data, static_cast<int>(off + 6));
    tim.imgWidthWords = readU16(data, static_cast<int>(off + 8));
    tim.imgHeight = readU16(data, static_cast<int>(off + 10));

    const int payloadLen = qMax(0, static_cast<int>(imgLen) - 12);
    tim.imgData = data.mid(static_cast<int>(off + 12), payloadLen);

    result.success = true;
    return result;
}

TimFile::ParseResult TimFile::load(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        ParseResult result;
        result.errorMessage = QObject::tr("Cannot open file: %1").arg(file.errorString());
        return result;
    }
    return parse(file.readAll(), path);
}

QVector<TimClut> TimFile::extractCluts(const TimImage& tim)
{
    QVector<TimClut> cluts;
    if (!tim.hasClut || tim.clutBlockRaw.size() < 12) {
        return cluts;
    }

    const QByteArray& blk = tim.clutBlockRaw;
    const int blockLen = qMin(static_cast<int>(readU32(blk, 0)), blk.size());
    const int w = readU16(blk, 8);
    int h = readU16(blk, 10);

    const int wordCount = qMax(0, blockLen - 12) / 2;
    if (wordCount < 1 || w <= 0) {
        return cluts;
    }
    if (wordCount < w * h) {
        h = qMax(1, wordCount / w);
    }

    int idx = 0;
    for (int row = 0; row < h; ++row) {
        TimClut clut;
        clut.sourcePath = tim.path;
        clut.row = row;
        clut.width = w;
        clut.height = h;
        for (int i = 0; i < w && idx < wordCount; ++i, ++idx) {
            const quint16 c = readU16(blk, 12 + idx * 2);
            clut.raw.append(c);
            clut.colors.append(colorFrom15Bit(c));
        }
        cluts.append(clut);
    }
    return cluts;
}

// ===== Decode / render =====

QVector<quint8> TimFile::decodeIndices(const TimImage& tim)
{
    if (!tim.isIndexed()) {
        return QVector<quint8>();
    }

    const int count = tim.pixelWidth() * tim.imgHeight;
    QVector<quint8> out(count, 0);
    const uchar* src = reinterpret_cast<const uchar*>(tim.imgData.constData());

    if (tim.bppMode == TimImage::Bpp4) {
        int o = 0;
        for (int i = 0; i < tim.imgData.size() && o < count; ++i) {
            out[o++] = src[i] & 0x0F;
            if (o >= count) {
                break;
            }
            out[o++] = (src[i] >> 4) & 0x0F;
        }
    } else {
        const int n = qMin(count, static_cast<int>(tim.imgData.size()));
        for (int i = 0; i < n; ++i) {
            out[i] = src[i];
        }
    }
    return out;
}

TimFile::RenderResult TimFile::render(const TimImage& tim, const TimClut* clut)
{
    RenderResult result;

    if (!tim.isIndexed() && tim.bppMode != TimImage::Bpp16) {
        result.errorMessage = QObject::tr("TIM bpp mode %1 not supported in this tool.").arg(tim.bppMode);
        return result;
    }

    const int w = tim.pixelWidth();
    const int h = tim.imgHeight;
    if (w <= 0 || h <= 0) {
        result.errorMessage = QObject::tr("TIM image has no pixels (%1x%2)").arg(w).arg(h);
        return result;
    }

    QImage out(w, h, QImage::Format_ARGB32);
    if (out.isNull()) {
        result.errorMessage = QObject::tr("Cannot allocate a %1x%2 image").arg(w).arg(h);
        return result;
    }

    if (tim.bppMode == TimImage::Bpp16) {
        const int wordCount = tim.imgData.size() / 2;
        int i = 0;
        for (int y = 0; y < h; ++y) {
            QRgb* line = reinterpret_cast<QRgb*>(out.scanLine(y));
            for (int x = 0; x < w; ++x, ++i) {
                line[x] = i < wordCount ? colorFrom15Bit(readU16(tim.imgData, i * 2)) : qRgba(0, 0, 0, 0);
            }
        }
    } else {
        const QVector<quint8> indices = decodeIndices(tim);
        for (int y = 0; y < h; ++y) {
            QRgb* line = reinterpret_cast<QRgb*>(out.scanLine(y));
            const int base = y * w;
            for (int x = 0; x < w; ++x) {
                const int idx = indices[base + x];
                if (!clut) {
                    line[x] = qRgba(idx, idx, idx, 255);
                } else if (idx < clut->colors.size()) {
                    line[x] = clut->colors[idx];
                } else {
                    line[x] = qRgba(255, 0, 255, 255);
                }
            }
        }
    }

    result.image = out;
    result.success = true;
    return result;
}

// ===== Encode =====

TimFile::EncodeResult TimFile::buildBytes(const TimImage& tim)
{
    EncodeResult result;

    if (tim.hasClut && tim.clutBlockRaw.isEmpty()) {
        result.errorMessage = QObject::tr("TIM claims to have CLUT but the CLUT block is missing.");
        return result;
    }

    QByteArray out;
    appendU32(out, Magic);
    appendU32(out, tim.flags);
    if (tim.hasClut) {
        out.append(tim.clutBlockRaw);
    }
    appendU32(out, static_cast<quint32>(12 + tim.imgData.size()));
    appendU16(out, tim.imgX);
    appendU16(out, tim.imgY);
    appendU16(out, tim.imgWidthWords);
    appendU16(out, tim.imgHeight);
    out.append(tim.imgData);

    result.bytes = out;
    result.success = true;
    return result;
}

TimFile::EncodeResult TimFile::save(const TimImage& tim, const QString& path)
{
    EncodeResult result = buildBytes(tim);
    if (!result.success) {
        return result;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        result.success = false;
        result.errorMessage = QObject::tr("Cannot write %1: %2").arg(path, file.errorString());
        return result;
    }
    if (file.write(result.bytes) != result.bytes.size()) {
        result.success = false;
        result.errorMessage = QObject::tr("Short write to %1: %2").arg(path, file.errorString());
        return result;
    }
    return result;
}

QRgb TimFile::colorFrom15Bit(quint16 c)
{
    const int r5 = c & 0x1F;
    const int g5 = (c >> 5) & 0x1F;
    const int b5 = (c >> 10) & 0x1F;

    const int r = (r5 << 3) | (r5 >> 2);
    const int g = (g5 << 3) | (g5 >> 2);
    const int b = (b5 << 3) | (b5 >> 2);
    const int a = (c & 0x7FFF) == 0 ? 0 : 255;
    return qRgba(r, g, b, a);
}
