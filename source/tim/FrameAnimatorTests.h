#ifndef FRAMEANIMATORTESTS_H
#define FRAMEANIMATORTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>

#include "FrameAnimator.h"

/**
 * Playback tests for FrameAnimator.
 * Run with: timscope --test-animator
 */
class FrameAnimatorTests : public QObject {
    Q_OBJECT

private:
    static QVector<QImage> makeFrames(int count)
    {
        QVector<QImage> frames;
        for (int i = 0; i < count; ++i) {
            QImage img(8, 8, QImage::Format_ARGB32);
            img.fill(qRgba(i * 40, 0, 0, 255));
            frames.append(img);
        }
        return frames;
    }

private slots:
    void testFpsClampAndInterval() {
        FrameAnimator anim;
        QCOMPARE(anim.intervalMs(), 125);

        anim.setFps(1000.0);
        QCOMPARE(anim.fps(), FrameAnimator::MaxFps);
        QCOMPARE(anim.intervalMs(), 17);

        anim.setFps(0.0);
        QCOMPARE(anim.fps(), FrameAnimator::MinFps);
        QCOMPARE(anim.intervalMs(), 2000);
    }

    void testPlayAdvancesAndWraps() {
        FrameAnimator anim;
        anim.setFrames(makeFrames(3));
        anim.setFps(60.0);

        QSignalSpy frames(&anim, &FrameAnimator::frameChanged);
        QSignalSpy playing(&anim, &FrameAnimator::playingChanged);

        anim.play();
        QVERIFY(anim.isPlaying());
        QCOMPARE(playing.count(), 1);
        QCOMPARE(playing.at(0).at(0).toBool(), true);

        // Looping: index 0 -> 1 -> 2 -> 0
        QTRY_VERIFY(frames.count() >= 3);
        QCOMPARE(frames.at(0).at(0).toInt(), 1);
        QCOMPARE(frames.at(1).at(0).toInt(), 2);
        QCOMPARE(frames.at(2).at(0).toInt(), 0);
        QVERIFY(anim.isPlaying());

        anim.pause();
        QVERIFY(!anim.isPlaying());
        QCOMPARE(playing.count(), 2);

        const int emitted = frames.count();
        QTest::qWait(60);
        QCOMPARE(frames.count(), emitted);
    }

    void testOneShotStopsAtEnd() {
        FrameAnimator anim;
        anim.setFrames(makeFrames(3));
        anim.setFps(60.0);
        anim.setLoop(false);

        QSignalSpy playing(&anim, &FrameAnimator::playingChanged);
        anim.play();
        QTRY_VERIFY(!anim.isPlaying());
        QCOMPARE(anim.currentIndex(), 2);
        QCOMPARE(playing.count(), 2);

        // Playing again from the last frame starts over
        QSignalSpy frames(&anim, &FrameAnimator::frameChanged);
        anim.play();
        QVERIFY(anim.isPlaying());
        QCOMPARE(frames.count(), 1);
        QCOMPARE(frames.at(0).at(0).toInt(), 0);
        anim.pause();
    }

    void testScrubClamps() {
        FrameAnimator anim;
        QSignalSpy frames(&anim, &FrameAnimator::frameChanged);

        // Nothing to show yet
        anim.scrub(2);
        anim.play();
        QCOMPARE(frames.count(), 0);
        QVERIFY(!anim.isPlaying());
        QVERIFY(anim.currentFrame().isNull());

        anim.setFrames(makeFrames(4));
        anim.scrub(10);
        QCOMPARE(anim.currentIndex(), 3);
        anim.scrub(-5);
        QCOMPARE(anim.currentIndex(), 0);
        QCOMPARE(frames.count(), 2);
        QCOMPARE(anim.currentFrame().pixel(0, 0), qRgba(0, 0, 0, 255));
    }

    void testSetFramesPausesAndClamps() {
        FrameAnimator anim;
        anim.setFrames(makeFrames(5));
        anim.scrub(4);
        anim.play();
        QVERIFY(anim.isPlaying());

        anim.setFrames(makeFrames(2));
        QVERIFY(!anim.isPlaying());
        QCOMPARE(anim.currentIndex(), 1);
        QCOMPARE(anim.frameCount(), 2);

        anim.setFrames(QVector<QImage>());
        QCOMPARE(anim.currentIndex(), 0);
        QVERIFY(anim.currentFrame().isNull());
    }
};

#endif // FRAMEANIMATORTESTS_H
