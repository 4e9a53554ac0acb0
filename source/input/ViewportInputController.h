/**
 * @file ViewportInputController.h
 * @brief Translates mouse, wheel and key events into ImageViewport gestures
 *
 * Installed as an event filter on the viewport widget.
 */

#ifndef VIEWPORTINPUTCONTROLLER_H
#define VIEWPORTINPUTCONTROLLER_H

#include <QObject>
#include <QKeyEvent>
#include <QMouseEvent>
#include <QWheelEvent>

class ImageViewport;

/**
 * @brief Pan and zoom bindings for ImageViewport
 *
 * Bindings:
 * - Space held + left drag = pan
 * - Middle drag = pan (no Space needed)
 * - Releasing Space ends an active pan
 * - Wheel = zoom at the cursor
 */
class ViewportInputController : public QObject
{
    Q_OBJECT

public:
    explicit ViewportInputController(ImageViewport *viewport, QObject *parent = nullptr);
    ~ViewportInputController() override;

    bool isEnabled() const { return m_enabled; }
    void setEnabled(bool enabled);

    bool isSpaceHeld() const { return m_spaceHeld; }
    bool isPanning() const { return m_panButton != Qt::NoButton; }

    // Event handling (called from eventFilter, public for tests)
    bool handleMousePress(QMouseEvent *event);
    bool handleMouseMove(QMouseEvent *event);
    bool handleMouseRelease(QMouseEvent *event);
    bool handleWheel(QWheelEvent *event);
    bool handleKeyPress(QKeyEvent *event);
    bool handleKeyRelease(QKeyEvent *event);

signals:
    void panStarted();
    void panFinished();

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    void finishPan();

    ImageViewport *m_viewport = nullptr;
    bool m_enabled = true;
    bool m_spaceHeld = false;
    Qt::MouseButton m_panButton = Qt::NoButton;   // Button that started the active pan
};

#endif // VIEWPORTINPUTCONTROLLER_H
