// ============================================================================
// qt_compat.h - Qt5 / Qt6 compatibility shims for TimScope
// ============================================================================
// Include this header in .cpp files that read pointer positions from input
// events. Other one-line differences are handled with inline
// #if QT_VERSION_CHECK guards directly in each source file.
// ============================================================================
#pragma once

#include <QtCore/qglobal.h>

// ============================================================================
// Pointer event position (QPointF)
// ============================================================================
// Qt6 unified all events under QSinglePointEvent::position().
// Qt5: QMouseEvent → localPos()  (QPointF)
// ============================================================================
#if QT_VERSION >= QT_VERSION_CHECK(6, 0, 0)
#  define TS_MOUSE_POS(event)    (event)->position()   // QMouseEvent
#else
#  define TS_MOUSE_POS(event)    (event)->localPos()   // QMouseEvent::localPos() → QPointF
#endif
// QWheelEvent::position() exists since Qt 5.14, so works in both Qt5.15 and Qt6.
#define TS_WHEEL_POS(event)      (event)->position()
