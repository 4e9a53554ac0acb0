/**
 * @file ViewportInputController.cpp
 * @brief Implementation of the viewport pan/zoom bindings
 */

#include "ViewportInputController.h"
#include "../viewport/ImageViewport.h"
#include "../compat/qt_compat.h"

#include <QDebug>

ViewportInputController::ViewportInputController(ImageViewport *viewport, QObject *parent)
    : QObject(parent)
    , m_viewport(viewport)
{
    if (m_viewport) {
        m_viewport->installEventFilter(this);
    }
}

ViewportInputController::~ViewportInputController()
{
    if (m_viewport) {
        m_viewport->removeEventFilter(this);
    }
}

void ViewportInputController::setEnabled(bool enabled)
{
    if (m_enabled != enabled) {
        m_enabled = enabled;
        if (!enabled) {
            finishPan();
            m_spaceHeld = false;
        }
    }
}

bool ViewportInputController::eventFilter(QObject *watched, QEvent *event)
{
    if (watched != m_viewport) {
        return QObject::eventFilter(watched, event);
    }

    switch (event->type()) {
    case QEvent::MouseButtonPress:
        return handleMousePress(static_cast<QMouseEvent*>(event));
    case QEvent::MouseMove:
        return handleMouseMove(static_cast<QMouseEvent*>(event));
    case QEvent::MouseButtonRelease:
        return handleMouseRelease(static_cast<QMouseEvent*>(event));
    case QEvent::Wheel:
        return handleWheel(static_cast<QWheelEvent*>(event));
    case QEvent::KeyPress:
        return handleKeyPress(static_cast<QKeyEvent*>(event));
    case QEvent::KeyRelease:
        return handleKeyRelease(static_cast<QKeyEvent*>(event));
    case QEvent::FocusOut:
        // A lost key release would leave the Space gate stuck open
        m_spaceHeld = false;
        finishPan();
        break;
    default:
        break;
    }
    return QObject::eventFilter(watched, event);
}

bool ViewportInputController::handleMousePress(QMouseEvent *event)
{
    if (!m_enabled || !m_viewport || isPanning()) return false;

    const bool leftPan = event->button() == Qt::LeftButton && m_spaceHeld;
    const bool middlePan = event->button() == Qt::MiddleButton;
    if (!leftPan && !middlePan) {
        return false;
    }

    m_panButton = event->button();
    m_viewport->setFocus(Qt::MouseFocusReason);
    m_viewport->panBegin(TS_MOUSE_POS(event));
    emit panStarted();
    return true;
}

bool ViewportInputController::handleMouseMove(QMouseEvent *event)
{
    if (!m_enabled || !m_viewport || !isPanning()) return false;

    m_viewport->panMove(TS_MOUSE_POS(event));
    return true;
}

bool ViewportInputController::handleMouseRelease(QMouseEvent *event)
{
    if (!m_enabled || !isPanning()) return false;

    if (event->button() != m_panButton) {
        return false;
    }
    finishPan();
    return true;
}

bool ViewportInputController::handleWheel(QWheelEvent *event)
{
    if (!m_enabled || !m_viewport) return false;

    const int delta = event->angleDelta().y();
    if (delta == 0) {
        return false;
    }
    m_viewport->wheelZoom(TS_WHEEL_POS(event), delta);
    event->accept();
    return true;
}

bool ViewportInputController::handleKeyPress(QKeyEvent *event)
{
    if (!m_enabled) return false;

    if (event->key() == Qt::Key_Space) {
        if (!event->isAutoRepeat()) {
            m_spaceHeld = true;
        }
        return true;
    }
    return false;
}

bool ViewportInputController::handleKeyRelease(QKeyEvent *event)
{
    if (!m_enabled) return false;

    if (event->key() == Qt::Key_Space) {
        if (event->isAutoRepeat()) {
            return true;
        }
        m_spaceHeld = false;
        if (m_panButton == Qt::LeftButton) {
            finishPan();
        }
        return true;
    }
    return false;
}

void ViewportInputController::finishPan()
{
    if (!isPanning()) {
        return;
    }
    m_panButton = Qt::NoButton;
    if (m_viewport) {
        m_viewport->panEnd();
    }
    emit panFinished();
}
