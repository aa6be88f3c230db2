#ifndef BOXEDITCONTROLLER_H
#define BOXEDITCONTROLLER_H

#include <QObject>
#include <QRectF>
#include <QSize>
#include <QString>

#include "annotations/AnnotationError.h"
#include "annotations/BoxAnnotation.h"
#include "editor/BoxEditStateMachine.h"
#include "editor/BoxEditTypes.h"

class AnnotationHistory;
class AnnotationStore;

/**
 * @brief Connects pointer input for the current image to the store and
 *        history.
 *
 * Reads the current annotation set from the store, feeds events to the
 * state machine, and turns released gestures into history commands.
 */
class BoxEditController : public QObject
{
    Q_OBJECT

public:
    BoxEditController(AnnotationStore& store, AnnotationHistory& history,
                      QObject* parent = nullptr);
    ~BoxEditController() override;

    void setImageKey(const QString& key);
    QString imageKey() const { return m_imageKey; }

    // Optional: clamps moves to the image rectangle
    void setImageSize(const QSize& size);
    QSize imageSize() const { return m_imageSize; }

    // Class assigned to newly drawn boxes, initially the configured default
    void setCurrentClassId(qint64 classId) { m_currentClassId = classId; }
    qint64 currentClassId() const { return m_currentClassId; }

    BoxEdit::EditOutcome dispatchPointerEvent(const BoxEdit::PointerEvent& event);

    // Selection
    int selectedIndex() const { return m_stateMachine.selectedIndex(); }
    bool isSelected(int index) const { return m_stateMachine.isSelected(index); }
    void clearSelection() { m_stateMachine.clearSelection(); }

    // Edits on the selected box
    bool deleteSelected(AnnotationError* error = nullptr);
    bool changeSelectedClass(qint64 classId, AnnotationError* error = nullptr);
    bool clearAll(AnnotationError* error = nullptr);

    bool undo(AnnotationError* error = nullptr);
    bool redo(AnnotationError* error = nullptr);

    // Escape: abandon the current gesture
    void cancelGesture() { m_stateMachine.cancel(); }

    // Current set for drawing, with the live gesture geometry applied
    AnnotationSet displayedAnnotations();
    QRectF drawingPreview() const;

    const BoxEditStateMachine& stateMachine() const { return m_stateMachine; }

signals:
    void annotationsCommitted(const QString& key);
    void selectionChanged(int index);
    void stateChanged(BoxEdit::State state);

private:
    bool commit(const BoxEditCommit& request, AnnotationError* error);
    void revalidateSelection();

    AnnotationStore& m_store;
    AnnotationHistory& m_history;
    BoxEditStateMachine m_stateMachine;

    QString m_imageKey;
    QSize m_imageSize;
    qint64 m_currentClassId = 0;
};

#endif // BOXEDITCONTROLLER_H
