#include "annotations/AnnotationHistory.h"
#include "annotations/AnnotationStore.h"
#include "settings/EditorSettingsManager.h"

#include <QDebug>

AnnotationHistory::AnnotationHistory(AnnotationStore& store, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_maxHistorySize(static_cast<size_t>(EditorSettingsManager::instance().loadMaxHistorySize()))
{
}

AnnotationHistory::~AnnotationHistory() = default;

bool AnnotationHistory::execute(BoxCommandPtr command, AnnotationError* error)
{
    if (!command) {
        return false;
    }

    if (!command->execute(m_store, error)) {
        qWarning() << "AnnotationHistory: Failed to execute" << command->description()
                   << "for" << command->imageKey();
        return false;
    }

    m_undoStack.push_back(std::move(command));
    m_redoStack.clear();  // New command invalidates redo
    trimHistory();
    emit changed();
    return true;
}

bool AnnotationHistory::undo(AnnotationError* error)
{
    if (m_undoStack.empty()) {
        return false;
    }

    BoxCommandPtr command = std::move(m_undoStack.back());
    m_undoStack.pop_back();

    if (!command->undo(m_store, error)) {
        qWarning() << "AnnotationHistory: Undo failed, dropping" << command->description()
                   << "for" << command->imageKey();
        emit changed();
        return false;
    }

    m_redoStack.push_back(std::move(command));
    emit changed();
    return true;
}

bool AnnotationHistory::redo(AnnotationError* error)
{
    if (m_redoStack.empty()) {
        return false;
    }

    BoxCommandPtr command = std::move(m_redoStack.back());
    m_redoStack.pop_back();

    if (!command->redo(m_store, error)) {
        qWarning() << "AnnotationHistory: Redo failed, dropping" << command->description()
                   << "for" << command->imageKey();
        emit changed();
        return false;
    }

    m_undoStack.push_back(std::move(command));
    emit changed();
    return true;
}

bool AnnotationHistory::canUndo() const
{
    return !m_undoStack.empty();
}

bool AnnotationHistory::canRedo() const
{
    return !m_redoStack.empty();
}

void AnnotationHistory::clear()
{
    m_undoStack.clear();
    m_redoStack.clear();
    emit changed();
}

const BoxCommand* AnnotationHistory::peekUndo() const
{
    return m_undoStack.empty() ? nullptr : m_undoStack.back().get();
}

const BoxCommand* AnnotationHistory::peekRedo() const
{
    return m_redoStack.empty() ? nullptr : m_redoStack.back().get();
}

void AnnotationHistory::setMaxHistorySize(size_t maxSize)
{
    m_maxHistorySize = maxSize;
    trimHistory();
}

void AnnotationHistory::trimHistory()
{
    if (m_maxHistorySize == 0 || m_undoStack.size() <= m_maxHistorySize) {
        return;
    }

    const auto excess = static_cast<std::ptrdiff_t>(m_undoStack.size() - m_maxHistorySize);
    m_undoStack.erase(m_undoStack.begin(), m_undoStack.begin() + excess);
}
