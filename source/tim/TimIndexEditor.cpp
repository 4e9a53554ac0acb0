// ============================================================================
// TimIndexEditor - Implementation
// ============================================================================

#include "TimIndexEditor.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QPainter>
#include <QtMath>
#include <QDebug>

// ===== Export =====

TimIndexEditor::ExportResult TimIndexEditor::exportIndices(const TimImage& tim, const QString& pngPath)
{
    ExportResult result;

    if (!tim.isIndexed()) {
        result.errorMessage = QObject::tr("Index export only applies to 4bpp/8bpp TIMs.");
        return result;
    }

    const int w = tim.pixelWidth();
    const int h = tim.imgHeight;
    if (w <= 0 || h <= 0) {
        result.errorMessage = QObject::tr("TIM image has no pixels.");
        return result;
    }

    const QVector<quint8> indices = TimFile::decodeIndices(tim);

    QImage img(w, h, QImage::Format_Indexed8);
    img.setColorTable(grayscalePalette(tim.bppMode == TimImage::Bpp4 ? 16 : 256));
    for (int y = 0; y < h; ++y) {
        uchar* line = img.scanLine(y);
        for (int x = 0; x < w; ++x) {
            line[x] = indices[y * w + x];
        }
    }

    const QFileInfo info(pngPath);
    if (!QDir().mkpath(info.absolutePath())) {
        result.errorMessage = QObject::tr("Cannot create folder %1").arg(info.absolutePath());
        return result;
    }
    if (!img.save(pngPath, "PNG")) {
        result.errorMessage = QObject::tr("Cannot write %1").arg(pngPath);
        return result;
    }

    QJsonObject meta;
    meta["format"] = QString::fromLatin1(MetaFormat);
    meta["source_tim"] = tim.path;
    meta["bpp_mode"] = tim.bppMode;
    meta["width"] = w;
    meta["height"] = h;
    meta["note"] = QStringLiteral(
        "PNG is indexed. Pixel values are the indices. "
        "You may upscale the PNG; on import the TIM is resized to match the PNG.");

    const QString metaPath = metaPathFor(pngPath);
    QFile file(metaPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        result.errorMessage = QObject::tr("Cannot write %1: %2").arg(metaPath, file.errorString());
        return result;
    }
    const QByteArray json = QJsonDocument(meta).toJson(QJsonDocument::Indented);
    if (file.write(json) != json.size()) {
        result.errorMessage = QObject::tr("Short write to %1: %2").arg(metaPath, file.errorString());
        return result;
    }
    file.close();

    result.success = true;
    result.pngPath = pngPath;
    result.metaPath = metaPath;
    return result;
}

// ===== Import =====

TimIndexEditor::ImportResult TimIndexEditor::importIndices(TimImage& tim, const QString& pngPath,
                                                           const QString& metaPath)
{
    ImportResult result;

    if (!tim.isIndexed()) {
        result.errorMessage = QObject::tr("This import mode is only for 4bpp/8bpp TIMs.");
        return result;
    }

    if (!metaPath.isEmpty()) {
        QFile file(metaPath);
        if (!file.open(QIODevice::ReadOnly)) {
            result.errorMessage = QObject::tr("Cannot read %1: %2").arg(metaPath, file.errorString());
            return result;
        }
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            result.errorMessage = QObject::tr("Meta JSON is invalid: %1").arg(parseError.errorString());
            return result;
        }
        const QJsonObject meta = doc.object();
        const QString format = meta.value("format").toString();
        if (format != QLatin1String("tim_index_edit_v1") && format != QLatin1String(MetaFormat)) {
            result.errorMessage = QObject::tr("Meta JSON format not recognized.");
            return result;
        }
        if (meta.value("bpp_mode").toInt(-1) != tim.bppMode) {
            result.errorMessage = QObject::tr("Meta bpp_mode does not match currently selected TIM.");
            return result;
        }
    }

    QImage img(pngPath);
    if (img.isNull()) {
        result.errorMessage = QObject::tr("Cannot read image %1").arg(pngPath);
        return result;
    }
    // Low bit depth palettes load as Mono; converting keeps the indices.
    if (img.format() == QImage::Format_Mono || img.format() == QImage::Format_MonoLSB) {
        img = img.convertToFormat(QImage::Format_Indexed8);
    }
    // A full 256-step gray ramp is written as a grayscale PNG whose levels
    // are the indices themselves.
    if (img.format() != QImage::Format_Indexed8 && img.format() != QImage::Format_Grayscale8) {
        result.errorMessage = QObject::tr(
            "Edited PNG is not indexed.\n\n"
            "For reliable import, keep the PNG in indexed mode and avoid anti-aliasing.");
        return result;
    }

    const int newW = img.width();
    const int newH = img.height();

    QVector<quint8> indices;
    indices.reserve(newW * newH);
    for (int y = 0; y < newH; ++y) {
        const uchar* line = img.constScanLine(y);
        for (int x = 0; x < newW; ++x) {
            indices.append(line[x]);
        }
    }

    if (tim.bppMode == TimImage::Bpp4) {
        for (quint8 v : indices) {
            if (v > 15) {
                result.errorMessage = QObject::tr("4bpp import: found indices > 15. Keep indices in 0..15.");
                return result;
            }
        }
    }

    QString widthError;
    const int words = wordsForWidth(tim.bppMode, newW, &widthError);
    if (words < 0) {
        result.errorMessage = widthError;
        return result;
    }
    if (words > 0xFFFF || newH > 0xFFFF) {
        result.errorMessage = QObject::tr("Image is too large for a TIM (%1x%2).").arg(newW).arg(newH);
        return result;
    }

    tim.imgWidthWords = static_cast<quint16>(words);
    tim.imgHeight = static_cast<quint16>(newH);
    tim.imgData = packIndices(indices, tim.bppMode);

    result.success = true;
    result.width = newW;
    result.height = newH;
    return result;
}

// ===== Helpers =====

QString TimIndexEditor::metaPathFor(const QString& pngPath)
{
    const QFileInfo info(pngPath);
    return info.dir().filePath(info.completeBaseName() + ".json");
}

QVector<QRgb> TimIndexEditor::grayscalePalette(int entries)
{
    QVector<QRgb> pal(256, qRgb(255, 0, 255));
    for (int i = 0; i < entries && i < 256; ++i) {
        const int v = entries > 1 ? qRound(i * 255.0 / (entries - 1)) : 0;
        pal[i] = qRgb(v, v, v);
    }
    return pal;
}

int TimIndexEditor::wordsForWidth(int bppMode, int widthPx, QString* error)
{
    switch (bppMode) {
    case TimImage::Bpp4:
        if (widthPx % 4 != 0) {
            if (error) *error = QObject::tr("4bpp TIM width must be a multiple of 4 pixels.");
            return -1;
        }
        return widthPx / 4;
    case TimImage::Bpp8:
        if (widthPx % 2 != 0) {
            if (error) *error = QObject::tr("8bpp TIM width must be a multiple of 2 pixels.");
            return -1;
        }
        return widthPx / 2;
    case TimImage::Bpp16:
        return widthPx;
    default:
        if (error) *error = QObject::tr("Unsupported bpp for resizing");
        return -1;
    }
}

QByteArray TimIndexEditor::packIndices(const QVector<quint8>& indices, int bppMode)
{
    QByteArray out;
    if (bppMode == TimImage::Bpp8) {
        out.reserve(indices.size());
        for (quint8 v : indices) {
            out.append(static_cast<char>(v));
        }
    } else if (bppMode == TimImage::Bpp4) {
        out.reserve((indices.size() + 1) / 2);
        for (int i = 0; i < indices.size(); i += 2) {
            const int a = indices[i] & 0x0F;
            const int b = (i + 1 < indices.size()) ? (indices[i + 1] & 0x0F) : 0;
            out.append(static_cast<char>(a | (b << 4)));
        }
    }
    return out;
}

// ===== Image export =====

TimIndexEditor::ImageExportResult TimIndexEditor::exportImage(const QImage& image, const QString& path)
{
    ImageExportResult result;
    result.path = path;

    if (image.isNull()) {
        result.errorMessage = QObject::tr("Nothing to export.");
        return result;
    }

    bool ok = false;
    if (QFileInfo(path).suffix().compare("bmp", Qt::CaseInsensitive) == 0) {
        QImage flat(image.size(), QImage::Format_RGB32);
        flat.fill(Qt::black);
        QPainter painter(&flat);
        painter.drawImage(QPoint(0, 0), image);
        painter.end();
        ok = flat.save(path, "BMP");
    } else {
        ok = image.save(path, "PNG");
    }

    if (!ok) {
        result.errorMessage = QObject::tr("Cannot write %1").arg(path);
        return result;
    }
    result.success = true;
    return result;
}

QString TimIndexEditor::suggestedImageName(const QString& timPath, int frameIndex)
{
    QString name = QFileInfo(timPath).completeBaseName();
    if (frameIndex >= 0) {
        name += QStringLiteral("_frame%1").arg(frameIndex, 2, 10, QLatin1Char('0'));
    }
    return name + ".png";
}
