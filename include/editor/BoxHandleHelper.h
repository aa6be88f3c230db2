#ifndef BOXHANDLEHELPER_H
#define BOXHANDLEHELPER_H

#include <QPointF>
#include <QRectF>
#include <Qt>

#include "annotations/BoxAnnotation.h"
#include "editor/BoxEditTypes.h"

/**
 * @brief Static helpers for box hit-testing and handle geometry.
 *
 * Pure functions with no state, shared by the edit state machine and
 * the overlay renderer.
 */
class BoxHandleHelper
{
public:
    using Handle = BoxEdit::Handle;

    /**
     * @brief Classify a point against a box.
     *
     * Corners win over edges: a point closer than kHandleRadius to a
     * corner yields that corner, a point closer than kEdgeMargin to an
     * edge yields Handle::Edge. Anything else yields Handle::None.
     */
    static Handle hitTestHandle(const QRectF& rect, const QPointF& pos);

    // True when pos is inside the box or on one of its handles
    static bool hitTestBox(const QRectF& rect, const QPointF& pos);

    /**
     * @brief Index of the box under pos, or -1.
     *
     * The selected box is tested first so its handles stay reachable when
     * boxes overlap; the rest are tested top-most (last drawn) first.
     */
    static int boxAt(const AnnotationSet& annotations, const QPointF& pos, int selectedIndex = -1);

    /**
     * @brief Geometry after moving a handle by delta from the original rect.
     *
     * Corner handles move that corner only; Handle::Edge grows or shrinks
     * both sides by half the delta, keeping the center fixed. The result
     * is not normalized.
     */
    static QRectF resizedRect(const QRectF& original, Handle handle, const QPointF& delta);

    // Rectangle spanned by two points (normalized)
    static QRectF spanRect(const QPointF& a, const QPointF& b);

    static QPointF cornerPosition(const QRectF& rect, Handle handle);
    static Qt::CursorShape cursorForHandle(Handle handle);

private:
    BoxHandleHelper() = delete;
};

#endif // BOXHANDLEHELPER_H
