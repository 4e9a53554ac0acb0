// ============================================================================
// FrameAnimator - Implementation
// ============================================================================

#include "FrameAnimator.h"

#include <QtMath>

FrameAnimator::FrameAnimator(QObject* parent)
    : QObject(parent)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &FrameAnimator::tick);
}

void FrameAnimator::setFrames(const QVector<QImage>& frames)
{
    pause();
    m_frames = frames;
    m_index = m_frames.isEmpty() ? 0 : qBound(0, m_index, m_frames.size() - 1);
}

QImage FrameAnimator::currentFrame() const
{
    if (m_frames.isEmpty()) {
        return QImage();
    }
    return m_frames.at(m_index);
}

void FrameAnimator::setFps(qreal fps)
{
    m_fps = qBound(MinFps, fps, MaxFps);
    if (m_playing) {
        m_timer.start(intervalMs());
    }
}

int FrameAnimator::intervalMs() const
{
    return qRound(1000.0 / m_fps);
}

void FrameAnimator::play()
{
    if (m_frames.isEmpty() || m_playing) {
        return;
    }
    // A finished one-shot run starts over
    if (!m_loop && m_index >= m_frames.size() - 1 && m_frames.size() > 1) {
        scrub(0);
    }
    m_playing = true;
    m_timer.start(intervalMs());
    emit playingChanged(true);
}

void FrameAnimator::pause()
{
    m_timer.stop();
    if (!m_playing) {
        return;
    }
    m_playing = false;
    emit playingChanged(false);
}

void FrameAnimator::scrub(int index)
{
    if (m_frames.isEmpty()) {
        return;
    }
    m_index = qBound(0, index, m_frames.size() - 1);
    emit frameChanged(m_index, m_frames.at(m_index));
}

void FrameAnimator::tick()
{
    if (!m_playing || m_frames.isEmpty()) {
        pause();
        return;
    }

    int next = m_index + 1;
    if (next >= m_frames.size()) {
        if (!m_loop) {
            pause();
            return;
        }
        next = 0;
    }

    m_index = next;
    m_timer.start(intervalMs());
    emit frameChanged(m_index, m_frames.at(m_index));
}
