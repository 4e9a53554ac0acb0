#pragma once

// ============================================================================
// TimFile - PlayStation TIM parsing, rendering and encoding
// ============================================================================
// Layout (little-endian):
//
//   u32 magic (0x10)
//   u32 flags           bits 0-2 = bpp mode, bit 3 = CLUT present
//   [CLUT block]        u32 length, u16 x, u16 y, u16 w, u16 h, w*h colors
//   image block         u32 length, u16 x, u16 y, u16 widthWords, u16 h, data
//
// Colors are 15-bit 0bBBBBBGGGGGRRRRR. A color whose low 15 bits are zero
// is transparent.
//
// Image data is kept packed as read so files can be rebuilt byte for byte.
// ============================================================================

#include <QByteArray>
#include <QImage>
#include <QString>
#include <QVector>

/**
 * @brief One palette row of a CLUT block.
 */
struct TimClut {
    QString sourcePath;          ///< File the CLUT was read from
    int row = 0;                 ///< Row inside the CLUT block
    int width = 0;               ///< Colors in this row
    int height = 0;              ///< Rows in the block
    QVector<QRgb> colors;        ///< Decoded RGBA colors
    QVector<quint16> raw;        ///< Original 15-bit words

    /**
     * @brief Display label, e.g. "BODY.TIM | CLUT #0 (row 0, 16 cols)".
     */
    QString label() const;
};

/**
 * @brief A parsed TIM file.
 */
struct TimImage {
    enum BppMode {
        Bpp4 = 0,
        Bpp8 = 1,
        Bpp16 = 2,
        Bpp24 = 3
    };

    QString path;
    QByteArray originalBytes;
    quint32 flags = 0;
    int bppMode = Bpp4;
    bool hasClut = false;

    quint16 imgX = 0;
    quint16 imgY = 0;
    quint16 imgWidthWords = 0;   ///< Width in 16-bit words
    quint16 imgHeight = 0;       ///< Height in pixels
    QByteArray imgData;          ///< Packed pixel payload

    QByteArray clutBlockRaw;     ///< Whole CLUT block including its length field

    bool hasAppliedClut = false;
    TimClut appliedClut;

    /**
     * @brief Width in pixels derived from the word width and bpp mode.
     */
    int pixelWidth() const;

    bool isIndexed() const { return bppMode == Bpp4 || bppMode == Bpp8; }

    /**
     * @brief "4bpp", "8bpp", "16bpp", "24bpp" or "modeN".
     */
    QString bppName() const;
};

class TimFile {
public:
    static constexpr quint32 Magic = 0x10;

    struct ParseResult {
        bool success = false;
        QString errorMessage;
        TimImage tim;
    };

    struct RenderResult {
        bool success = false;
        QString errorMessage;
        QImage image;            ///< ARGB32
    };

    struct EncodeResult {
        bool success = false;
        QString errorMessage;
        QByteArray bytes;
    };

    /**
     * @brief Parse TIM bytes.
     * @param data File contents.
     * @param path Recorded in the result and in extracted CLUTs.
     */
    static ParseResult parse(const QByteArray& data, const QString& path = QString());

    /**
     * @brief Read and parse a TIM file from disk.
     */
    static ParseResult load(const QString& path);

    /**
     * @brief Split the CLUT block into one palette per row.
     *
     * The row count shrinks to the number of complete rows present.
     */
    static QVector<TimClut> extractCluts(const TimImage& tim);

    /**
     * @brief Unpack 4bpp/8bpp pixel indices, row-major.
     * @return width*height indices (missing data is 0), or empty for other modes.
     */
    static QVector<quint8> decodeIndices(const TimImage& tim);

    /**
     * @brief Render to ARGB32.
     * @param clut Palette for indexed modes; nullptr renders indices as gray.
     */
    static RenderResult render(const TimImage& tim, const TimClut* clut);

    /**
     * @brief Rebuild the file from the header, raw CLUT block and image block.
     */
    static EncodeResult buildBytes(const TimImage& tim);

    /**
     * @brief Encode and write to @p path.
     */
    static EncodeResult save(const TimImage& tim, const QString& path);

    static QRgb colorFrom15Bit(quint16 c);
};
