#pragma once

// ============================================================================
// FrameAnimator - Timed playback over a list of frames
// ============================================================================
// Owns the frame list and the current index. While playing, a single-shot
// timer advances one frame per tick; reaching the end either wraps (loop)
// or pauses. Every index change emits frameChanged(), which the host
// forwards to the viewport.
// ============================================================================

#include <QImage>
#include <QObject>
#include <QTimer>
#include <QVector>

class FrameAnimator : public QObject
{
    Q_OBJECT

public:
    static constexpr qreal MinFps = 0.5;
    static constexpr qreal MaxFps = 60.0;

    explicit FrameAnimator(QObject* parent = nullptr);

    /**
     * @brief Replace the frames. Pauses playback and keeps the index in range.
     */
    void setFrames(const QVector<QImage>& frames);
    const QVector<QImage>& frames() const { return m_frames; }
    int frameCount() const { return m_frames.size(); }

    int currentIndex() const { return m_index; }
    QImage currentFrame() const;

    /**
     * @brief Frames per second, clamped to [0.5, 60].
     */
    void setFps(qreal fps);
    qreal fps() const { return m_fps; }

    /**
     * @brief Tick interval derived from the fps.
     */
    int intervalMs() const;

    void setLoop(bool loop) { m_loop = loop; }
    bool loops() const { return m_loop; }

    bool isPlaying() const { return m_playing; }

public slots:
    void play();
    void pause();

    /**
     * @brief Jump to @p index (clamped). Emits frameChanged.
     */
    void scrub(int index);

signals:
    void frameChanged(int index, const QImage& frame);
    void playingChanged(bool playing);

private:
    void tick();

    QVector<QImage> m_frames;
    int m_index = 0;
    qreal m_fps = 8.0;
    bool m_loop = true;
    bool m_playing = false;
    QTimer m_timer;
};
