#ifndef BOXEDITSTATEMACHINE_H
#define BOXEDITSTATEMACHINE_H

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <optional>

#include "annotations/BoxAnnotation.h"
#include "editor/BoxEditTypes.h"

/**
 * @brief Store change requested by a pointer-up transition.
 */
struct BoxEditCommit
{
    enum class Kind {
        Add,    // New box drawn on empty canvas
        Update  // Final geometry of a moved or resized box
    };

    Kind kind = Kind::Add;
    int index = -1;  // Box being updated (Update only)
    QRectF rect;
    bool resized = false;  // Update came from a handle, not a drag
};

struct BoxEditStep
{
    BoxEdit::EditOutcome outcome;
    std::optional<BoxEditCommit> commit;
};

/**
 * @brief Pointer-driven box editing: draw, select, move and resize.
 *
 * Responsible for:
 * - State transitions (Idle, Drawing, Dragging, Resizing)
 * - Single selection (selecting a box deselects the previous one)
 * - Live geometry during a gesture, with minimum-size enforcement
 * - Reporting what to commit on release
 *
 * The machine never writes annotations itself; the caller turns the
 * returned BoxEditCommit into a history command.
 */
class BoxEditStateMachine : public QObject
{
    Q_OBJECT

public:
    using State = BoxEdit::State;
    using Handle = BoxEdit::Handle;

    explicit BoxEditStateMachine(QObject* parent = nullptr);

    // State queries
    State state() const { return m_state; }
    bool isIdle() const { return m_state == State::Idle; }
    bool isDrawing() const { return m_state == State::Drawing; }
    bool isDragging() const { return m_state == State::Dragging; }
    bool isResizing() const { return m_state == State::Resizing; }

    // Selection
    int selectedIndex() const { return m_selectedIndex; }
    bool hasSelection() const { return m_selectedIndex >= 0; }
    bool isSelected(int index) const { return index >= 0 && index == m_selectedIndex; }
    void setSelectedIndex(int index);
    void clearSelection();

    // Gesture geometry
    QRectF liveRect() const { return m_liveRect; }
    QRectF originalRect() const { return m_originalRect; }
    QPointF anchor() const { return m_anchor; }
    Handle activeHandle() const { return m_activeHandle; }

    // Optional clamp area for moves (image rect); empty disables clamping
    void setBounds(const QRectF& bounds) { m_bounds = bounds; }
    QRectF bounds() const { return m_bounds; }

    BoxEditStep handleEvent(const BoxEdit::PointerEvent& event, const AnnotationSet& annotations);

    // Abort a drag/resize/draw and restore the original geometry
    void cancel();

    // Back to Idle with nothing selected
    void reset();

    BoxEdit::EditOutcome outcome() const;

signals:
    void stateChanged(BoxEdit::State newState);
    void selectionChanged(int index);

private:
    BoxEditStep onPointerDown(const QPointF& pos, const AnnotationSet& annotations);
    BoxEditStep onPointerMove(const QPointF& pos);
    BoxEditStep onPointerUp(const QPointF& pos, const AnnotationSet& annotations);
    BoxEditStep onHover(const QPointF& pos, const AnnotationSet& annotations) const;

    void setState(State state);
    QRectF clampToBounds(const QRectF& rect) const;

    State m_state = State::Idle;
    int m_selectedIndex = -1;
    QRectF m_bounds;

    // Gesture temporaries
    QPointF m_anchor;
    QRectF m_originalRect;
    QRectF m_liveRect;
    Handle m_activeHandle = Handle::None;
};

#endif // BOXEDITSTATEMACHINE_H
