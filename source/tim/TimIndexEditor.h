#pragma once

// ============================================================================
// TimIndexEditor - Round-trip pixel indices through an external editor
// ============================================================================
// Export writes the indices of a 4bpp/8bpp TIM as an indexed PNG with a
// grayscale palette plus a sidecar JSON. The user edits (and may resize)
// the PNG in any raster editor that keeps it indexed. Import reads it back
// and replaces the TIM's width, height and packed pixel data in memory.
//
// Also hosts image export (PNG/BMP) for the rendered sheet or frame.
// ============================================================================

#include "TimFile.h"

#include <QImage>
#include <QString>

class TimIndexEditor {
public:
    static constexpr const char* MetaFormat = "tim_index_edit_v2";

    struct ExportResult {
        bool success = false;
        QString errorMessage;
        QString pngPath;
        QString metaPath;        ///< Sidecar JSON next to the PNG
    };

    struct ImportResult {
        bool success = false;
        QString errorMessage;
        int width = 0;           ///< New pixel width of the TIM
        int height = 0;
    };

    struct ImageExportResult {
        bool success = false;
        QString errorMessage;
        QString path;
    };

    /**
     * @brief Write the indices of @p tim to @p pngPath and a .json sidecar.
     */
    static ExportResult exportIndices(const TimImage& tim, const QString& pngPath);

    /**
     * @brief Replace the pixels of @p tim with the indices in @p pngPath.
     * @param metaPath Optional sidecar JSON; empty skips the metadata checks.
     *
     * @p tim is left untouched when the import fails.
     */
    static ImportResult importIndices(TimImage& tim, const QString& pngPath, const QString& metaPath);

    /**
     * @brief Sidecar path for an index PNG (same base name, .json).
     */
    static QString metaPathFor(const QString& pngPath);

    /**
     * @brief 256-entry palette: a gray ramp over the first @p entries.
     *
     * Unused entries are magenta so stray indices stand out in an editor.
     */
    static QVector<QRgb> grayscalePalette(int entries);

    /**
     * @brief Width in 16-bit words for a pixel width.
     * @return -1 with @p error set when the width does not pack evenly.
     */
    static int wordsForWidth(int bppMode, int widthPx, QString* error);

    /**
     * @brief Pack row-major indices into TIM pixel data (low nibble first for 4bpp).
     */
    static QByteArray packIndices(const QVector<quint8>& indices, int bppMode);

    /**
     * @brief Save a rendered image. PNG keeps alpha; BMP is flattened on black.
     *
     * The format follows the file suffix; anything but .bmp saves as PNG.
     */
    static ImageExportResult exportImage(const QImage& image, const QString& path);

    /**
     * @brief Suggested file name: "<base><_frameNN>.png".
     * @param frameIndex Frame to tag, or -1 for the whole sheet.
     */
    static QString suggestedImageName(const QString& timPath, int frameIndex);
};
