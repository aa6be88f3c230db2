#include "editor/BoxEditController.h"

#include "annotations/AnnotationHistory.h"
#include "annotations/AnnotationStore.h"
#include "annotations/BoxCommands.h"
#include "settings/EditorSettingsManager.h"

#include <QDebug>
#include <memory>

using BoxEdit::EditOutcome;
using BoxEdit::PointerEvent;

BoxEditController::BoxEditController(AnnotationStore& store, AnnotationHistory& history,
                                     QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_history(history)
    , m_currentClassId(EditorSettingsManager::instance().loadDefaultClassId())
{
    connect(&m_stateMachine, &BoxEditStateMachine::selectionChanged,
            this, &BoxEditController::selectionChanged);
    connect(&m_stateMachine, &BoxEditStateMachine::stateChanged,
            this, &BoxEditController::stateChanged);
}

BoxEditController::~BoxEditController() = default;

void BoxEditController::setImageKey(const QString& key)
{
    if (m_imageKey == key) {
        return;
    }
    m_imageKey = key;
    m_stateMachine.reset();
}

void BoxEditController::setImageSize(const QSize& size)
{
    m_imageSize = size;
    m_stateMachine.setBounds(size.isEmpty() ? QRectF() : QRectF(QPointF(0, 0), QSizeF(size)));
}

EditOutcome BoxEditController::dispatchPointerEvent(const PointerEvent& event)
{
    if (m_imageKey.isEmpty()) {
        return m_stateMachine.outcome();
    }

    AnnotationError readError;
    const AnnotationSet current = m_store.annotations(m_imageKey, &readError);
    BoxEditStep step = m_stateMachine.handleEvent(event, current);

    if (step.commit) {
        AnnotationError commitError;
        step.outcome.committed = commit(*step.commit, &commitError);
        step.outcome.error = commitError;
    } else if (readError.isError() && event.type == PointerEvent::Type::Down) {
        step.outcome.error = readError;
    }

    return step.outcome;
}

bool BoxEditController::commit(const BoxEditCommit& request, AnnotationError* error)
{
    BoxCommandPtr command;

    if (request.kind == BoxEditCommit::Kind::Add) {
        command = std::make_unique<AddBoxCommand>(
            m_imageKey, BoxAnnotation::fromRect(request.rect, m_currentClassId));
    } else {
        AnnotationSet updated = m_store.annotations(m_imageKey, error);
        if (error && error->isError()) {
            return false;
        }
        if (request.index < 0 || request.index >= updated.size()) {
            AnnotationError::set(error, AnnotationError::Code::IndexOutOfRange,
                                 QStringLiteral("Box %1 no longer exists").arg(request.index));
            return false;
        }
        const qint64 classId = updated[request.index].classId;
        updated[request.index] = BoxAnnotation::fromRect(request.rect, classId);
        command = std::make_unique<ReplaceBoxesCommand>(
            m_imageKey, updated, request.resized ? tr("Resize box") : tr("Move box"));
    }

    if (!m_history.execute(std::move(command), error)) {
        return false;
    }

    emit annotationsCommitted(m_imageKey);
    return true;
}

bool BoxEditController::deleteSelected(AnnotationError* error)
{
    const int index = m_stateMachine.selectedIndex();
    if (m_imageKey.isEmpty() || index < 0) {
        return false;
    }

    m_stateMachine.cancel();
    if (!m_history.execute(std::make_unique<DeleteBoxCommand>(m_imageKey, index), error)) {
        return false;
    }

    m_stateMachine.clearSelection();
    emit annotationsCommitted(m_imageKey);
    return true;
}

bool BoxEditController::changeSelectedClass(qint64 classId, AnnotationError* error)
{
    const int index = m_stateMachine.selectedIndex();
    if (m_imageKey.isEmpty() || index < 0) {
        return false;
    }

    if (!m_history.execute(std::make_unique<ChangeBoxClassCommand>(m_imageKey, index, classId),
                           error)) {
        return false;
    }

    emit annotationsCommitted(m_imageKey);
    return true;
}

bool BoxEditController::clearAll(AnnotationError* error)
{
    if (m_imageKey.isEmpty()) {
        return false;
    }

    m_stateMachine.reset();
    if (!m_history.execute(std::make_unique<ReplaceBoxesCommand>(
                               m_imageKey, AnnotationSet(), tr("Clear boxes")),
                           error)) {
        return false;
    }

    emit annotationsCommitted(m_imageKey);
    return true;
}

bool BoxEditController::undo(AnnotationError* error)
{
    m_stateMachine.cancel();
    const bool ok = m_history.undo(error);
    revalidateSelection();
    return ok;
}

bool BoxEditController::redo(AnnotationError* error)
{
    m_stateMachine.cancel();
    const bool ok = m_history.redo(error);
    revalidateSelection();
    return ok;
}

void BoxEditController::revalidateSelection()
{
    if (!m_stateMachine.hasSelection()) {
        return;
    }

    const AnnotationSet current = m_store.annotations(m_imageKey);
    if (m_stateMachine.selectedIndex() >= current.size()) {
        qDebug() << "BoxEditController: Dropping stale selection" << m_stateMachine.selectedIndex();
        m_stateMachine.clearSelection();
    }
}

AnnotationSet BoxEditController::displayedAnnotations()
{
    if (m_imageKey.isEmpty()) {
        return AnnotationSet();
    }

    AnnotationSet displayed = m_store.annotations(m_imageKey);
    const int index = m_stateMachine.selectedIndex();
    if ((m_stateMachine.isDragging() || m_stateMachine.isResizing())
        && index >= 0 && index < displayed.size()) {
        displayed[index] = BoxAnnotation::fromRect(m_stateMachine.liveRect().normalized(),
                                                   displayed[index].classId);
    }
    return displayed;
}

QRectF BoxEditController::drawingPreview() const
{
    return m_stateMachine.isDrawing() ? m_stateMachine.liveRect() : QRectF();
}
