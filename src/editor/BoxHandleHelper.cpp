#include "editor/BoxHandleHelper.h"

#include <QLineF>
#include <QtMath>

#include <algorithm>

namespace {

double distanceToSegment(const QPointF& p, const QPointF& a, const QPointF& b)
{
    const QPointF ab = b - a;
    const double lengthSquared = ab.x() * ab.x() + ab.y() * ab.y();
    if (lengthSquared <= 0.0) {
        return QLineF(p, a).length();
    }

    const QPointF ap = p - a;
    const double t = std::clamp((ap.x() * ab.x() + ap.y() * ab.y()) / lengthSquared, 0.0, 1.0);
    return QLineF(p, a + ab * t).length();
}

} // namespace

BoxHandleHelper::Handle BoxHandleHelper::hitTestHandle(const QRectF& rect, const QPointF& pos)
{
    const QRectF r = rect.normalized();
    if (r.isNull()) {
        return Handle::None;
    }

    // Check corners first (higher priority)
    static constexpr Handle kCorners[] = {
        Handle::TopLeft, Handle::TopRight, Handle::BottomLeft, Handle::BottomRight
    };
    for (Handle corner : kCorners) {
        if (QLineF(pos, cornerPosition(r, corner)).length() < BoxEdit::kHandleRadius) {
            return corner;
        }
    }

    // Then the four edges
    const QPointF tl = r.topLeft();
    const QPointF tr = r.topRight();
    const QPointF bl = r.bottomLeft();
    const QPointF br = r.bottomRight();
    if (distanceToSegment(pos, tl, tr) < BoxEdit::kEdgeMargin
        || distanceToSegment(pos, bl, br) < BoxEdit::kEdgeMargin
        || distanceToSegment(pos, tl, bl) < BoxEdit::kEdgeMargin
        || distanceToSegment(pos, tr, br) < BoxEdit::kEdgeMargin) {
        return Handle::Edge;
    }

    return Handle::None;
}

bool BoxHandleHelper::hitTestBox(const QRectF& rect, const QPointF& pos)
{
    const QRectF r = rect.normalized();
    if (r.isNull()) {
        return false;
    }
    return r.contains(pos) || hitTestHandle(r, pos) != Handle::None;
}

int BoxHandleHelper::boxAt(const AnnotationSet& annotations, const QPointF& pos, int selectedIndex)
{
    if (selectedIndex >= 0 && selectedIndex < annotations.size()
        && hitTestBox(annotations[selectedIndex].rect(), pos)) {
        return selectedIndex;
    }

    // Iterate in reverse order (top-most items first)
    for (int i = static_cast<int>(annotations.size()) - 1; i >= 0; --i) {
        if (i != selectedIndex && hitTestBox(annotations[i].rect(), pos)) {
            return i;
        }
    }
    return -1;
}

QRectF BoxHandleHelper::resizedRect(const QRectF& original, Handle handle, const QPointF& delta)
{
    QRectF newRect = original;

    switch (handle) {
    case Handle::TopLeft:
        newRect.setTopLeft(original.topLeft() + delta);
        break;
    case Handle::TopRight:
        newRect.setTopRight(original.topRight() + delta);
        break;
    case Handle::BottomLeft:
        newRect.setBottomLeft(original.bottomLeft() + delta);
        break;
    case Handle::BottomRight:
        newRect.setBottomRight(original.bottomRight() + delta);
        break;
    case Handle::Edge:
        newRect = original.adjusted(-delta.x() / 2.0, -delta.y() / 2.0,
                                    delta.x() / 2.0, delta.y() / 2.0);
        break;
    default:
        break;
    }

    return newRect;
}

QRectF BoxHandleHelper::spanRect(const QPointF& a, const QPointF& b)
{
    return QRectF(qMin(a.x(), b.x()), qMin(a.y(), b.y()),
                  qAbs(a.x() - b.x()), qAbs(a.y() - b.y()));
}

QPointF BoxHandleHelper::cornerPosition(const QRectF& rect, Handle handle)
{
    switch (handle) {
    case Handle::TopLeft:
        return rect.topLeft();
    case Handle::TopRight:
        return rect.topRight();
    case Handle::BottomLeft:
        return rect.bottomLeft();
    case Handle::BottomRight:
        return rect.bottomRight();
    default:
        return rect.center();
    }
}

Qt::CursorShape BoxHandleHelper::cursorForHandle(Handle handle)
{
    switch (handle) {
    case Handle::TopLeft:
    case Handle::BottomRight:
        return Qt::SizeFDiagCursor;
    case Handle::TopRight:
    case Handle::BottomLeft:
        return Qt::SizeBDiagCursor;
    case Handle::Edge:
        return Qt::SizeAllCursor;
    default:
        return Qt::ArrowCursor;
    }
}
