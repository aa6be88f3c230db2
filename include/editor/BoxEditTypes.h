#ifndef BOXEDITTYPES_H
#define BOXEDITTYPES_H

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <Qt>

#include "annotations/AnnotationError.h"

namespace BoxEdit {
Q_NAMESPACE

enum class State {
    Idle,
    Drawing,   // Dragging out a new box
    Dragging,  // Moving the selected box
    Resizing   // Resizing the selected box
};
Q_ENUM_NS(State)

enum class Handle {
    None,
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
    Edge       // Symmetric resize about the box center
};
Q_ENUM_NS(Handle)

inline constexpr double kHandleRadius = 8.0;
inline constexpr double kEdgeMargin = 5.0;

struct PointerEvent
{
    enum class Type {
        Down,
        Move,
        Up,
        Hover
    };

    Type type = Type::Move;
    QPointF pos;  // Image space

    static PointerEvent down(const QPointF& pos) { return {Type::Down, pos}; }
    static PointerEvent move(const QPointF& pos) { return {Type::Move, pos}; }
    static PointerEvent up(const QPointF& pos) { return {Type::Up, pos}; }
    static PointerEvent hover(const QPointF& pos) { return {Type::Hover, pos}; }
};

/**
 * @brief What the caller needs after each pointer event: state,
 *        live geometry, selection, and whether a store commit happened.
 */
struct EditOutcome
{
    State state = State::Idle;
    QRectF liveRect;          // Drawing preview or live geometry of the selected box
    int selectedIndex = -1;
    Handle handle = Handle::None;  // Active handle, or hovered handle for Hover
    Qt::CursorShape cursor = Qt::ArrowCursor;
    bool committed = false;
    AnnotationError error;
};

} // namespace BoxEdit

#endif // BOXEDITTYPES_H
