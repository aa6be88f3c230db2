#include "editor/BoxEditStateMachine.h"
#include "editor/BoxHandleHelper.h"

using BoxEdit::EditOutcome;
using BoxEdit::PointerEvent;

BoxEditStateMachine::BoxEditStateMachine(QObject* parent)
    : QObject(parent)
{
}

void BoxEditStateMachine::setState(State state)
{
    if (m_state != state) {
        m_state = state;
        emit stateChanged(m_state);
    }
}

void BoxEditStateMachine::setSelectedIndex(int index)
{
    const int newIndex = index >= 0 ? index : -1;
    if (m_selectedIndex != newIndex) {
        m_selectedIndex = newIndex;
        emit selectionChanged(m_selectedIndex);
    }
}

void BoxEditStateMachine::clearSelection()
{
    setSelectedIndex(-1);
}

EditOutcome BoxEditStateMachine::outcome() const
{
    EditOutcome result;
    result.state = m_state;
    result.liveRect = m_liveRect;
    result.selectedIndex = m_selectedIndex;
    result.handle = m_activeHandle;
    result.cursor = BoxHandleHelper::cursorForHandle(m_activeHandle);
    return result;
}

BoxEditStep BoxEditStateMachine::handleEvent(const PointerEvent& event,
                                             const AnnotationSet& annotations)
{
    // Selection may be stale after an undo/redo shrank the set
    if (m_selectedIndex >= annotations.size()) {
        if (m_state == State::Dragging || m_state == State::Resizing) {
            reset();
        } else {
            clearSelection();
        }
    }

    switch (event.type) {
    case PointerEvent::Type::Down:
        return onPointerDown(event.pos, annotations);
    case PointerEvent::Type::Move:
        return onPointerMove(event.pos);
    case PointerEvent::Type::Up:
        return onPointerUp(event.pos, annotations);
    case PointerEvent::Type::Hover:
        return onHover(event.pos, annotations);
    }
    return {outcome(), std::nullopt};
}

// ============================================================================
// Pointer Down
// ============================================================================

BoxEditStep BoxEditStateMachine::onPointerDown(const QPointF& pos, const AnnotationSet& annotations)
{
    if (m_state != State::Idle) {
        return {outcome(), std::nullopt};
    }

    m_anchor = pos;
    const int hitIndex = BoxHandleHelper::boxAt(annotations, pos, m_selectedIndex);

    if (hitIndex < 0) {
        // Empty canvas: start drawing a new box
        clearSelection();
        m_activeHandle = Handle::None;
        m_originalRect = QRectF();
        m_liveRect = QRectF(pos, QSizeF(0.0, 0.0));
        setState(State::Drawing);
        return {outcome(), std::nullopt};
    }

    // Selecting this box deselects any other in the same transition
    setSelectedIndex(hitIndex);

    m_originalRect = annotations[hitIndex].rect();
    m_liveRect = m_originalRect;
    m_activeHandle = BoxHandleHelper::hitTestHandle(m_originalRect, pos);
    setState(m_activeHandle == Handle::None ? State::Dragging : State::Resizing);
    return {outcome(), std::nullopt};
}

// ============================================================================
// Pointer Move
// ============================================================================

BoxEditStep BoxEditStateMachine::onPointerMove(const QPointF& pos)
{
    const QPointF delta = pos - m_anchor;

    switch (m_state) {
    case State::Drawing:
        m_liveRect = BoxHandleHelper::spanRect(m_anchor, pos);
        break;
    case State::Dragging:
        m_liveRect = clampToBounds(m_originalRect.translated(delta));
        break;
    case State::Resizing: {
        const QRectF candidate = BoxHandleHelper::resizedRect(m_originalRect, m_activeHandle, delta);
        // Keep the last valid geometry instead of collapsing
        if (meetsMinimumSize(candidate)) {
            m_liveRect = candidate;
        }
        break;
    }
    default:
        break;
    }

    return {outcome(), std::nullopt};
}

// ============================================================================
// Pointer Up
// ============================================================================

BoxEditStep BoxEditStateMachine::onPointerUp(const QPointF& pos, const AnnotationSet& annotations)
{
    if (m_state == State::Idle) {
        return {outcome(), std::nullopt};
    }

    onPointerMove(pos);

    std::optional<BoxEditCommit> commit;

    if (m_state == State::Drawing) {
        if (meetsMinimumSize(m_liveRect)) {
            commit = BoxEditCommit{BoxEditCommit::Kind::Add, -1, m_liveRect};
        }
        // Preview is discarded regardless of size
        m_liveRect = QRectF();
    } else if (m_selectedIndex >= 0 && m_selectedIndex < annotations.size()) {
        const QRectF finalRect = m_liveRect.normalized();
        // A plain click leaves the geometry untouched
        if (finalRect != m_originalRect && meetsMinimumSize(finalRect)) {
            commit = BoxEditCommit{BoxEditCommit::Kind::Update, m_selectedIndex, finalRect,
                                   m_state == State::Resizing};
        }
        m_liveRect = finalRect;
    }

    m_activeHandle = Handle::None;
    m_originalRect = QRectF();
    setState(State::Idle);

    BoxEditStep step{outcome(), commit};
    return step;
}

// ============================================================================
// Hover
// ============================================================================

BoxEditStep BoxEditStateMachine::onHover(const QPointF& pos, const AnnotationSet& annotations) const
{
    EditOutcome result = outcome();
    result.handle = Handle::None;

    if (m_state == State::Idle && m_selectedIndex >= 0 && m_selectedIndex < annotations.size()) {
        result.handle = BoxHandleHelper::hitTestHandle(annotations[m_selectedIndex].rect(), pos);
    }

    result.cursor = BoxHandleHelper::cursorForHandle(result.handle);
    return {result, std::nullopt};
}

// ============================================================================
// Cancel/Reset
// ============================================================================

void BoxEditStateMachine::cancel()
{
    if (m_state == State::Dragging || m_state == State::Resizing) {
        m_liveRect = m_originalRect;
    } else if (m_state == State::Drawing) {
        m_liveRect = QRectF();
    }
    m_activeHandle = Handle::None;
    m_originalRect = QRectF();
    setState(State::Idle);
}

void BoxEditStateMachine::reset()
{
    m_activeHandle = Handle::None;
    m_originalRect = QRectF();
    m_liveRect = QRectF();
    setState(State::Idle);
    clearSelection();
}

QRectF BoxEditStateMachine::clampToBounds(const QRectF& rect) const
{
    if (m_bounds.isEmpty()) {
        return rect;
    }

    QRectF clamped = rect;
    if (clamped.left() < m_bounds.left())
        clamped.moveLeft(m_bounds.left());
    if (clamped.top() < m_bounds.top())
        clamped.moveTop(m_bounds.top());
    if (clamped.right() > m_bounds.right())
        clamped.moveRight(m_bounds.right());
    if (clamped.bottom() > m_bounds.bottom())
        clamped.moveBottom(m_bounds.bottom());
    return clamped;
}
