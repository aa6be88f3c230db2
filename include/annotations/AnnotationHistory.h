#ifndef ANNOTATIONHISTORY_H
#define ANNOTATIONHISTORY_H

#include <QObject>
#include <cstddef>
#include <vector>

#include "annotations/AnnotationError.h"
#include "annotations/BoxCommands.h"

class AnnotationStore;

/**
 * @brief Undo/redo stacks of box commands, shared across all image keys.
 *
 * Executing a new command clears the redo stack. A command whose store
 * write fails during undo/redo is dropped rather than pushed back.
 * The size limit starts from EditorSettingsManager::loadMaxHistorySize().
 */
class AnnotationHistory : public QObject
{
    Q_OBJECT

public:
    explicit AnnotationHistory(AnnotationStore& store, QObject* parent = nullptr);
    ~AnnotationHistory() override;

    bool execute(BoxCommandPtr command, AnnotationError* error = nullptr);
    bool undo(AnnotationError* error = nullptr);
    bool redo(AnnotationError* error = nullptr);

    bool canUndo() const;
    bool canRedo() const;
    void clear();

    size_t undoCount() const { return m_undoStack.size(); }
    size_t redoCount() const { return m_redoStack.size(); }

    // Topmost commands, nullptr when the stack is empty
    const BoxCommand* peekUndo() const;
    const BoxCommand* peekRedo() const;

    // 0 keeps every entry
    void setMaxHistorySize(size_t maxSize);
    size_t maxHistorySize() const { return m_maxHistorySize; }

signals:
    void changed();

private:
    void trimHistory();

    AnnotationStore& m_store;
    std::vector<BoxCommandPtr> m_undoStack;
    std::vector<BoxCommandPtr> m_redoStack;
    size_t m_maxHistorySize = 0;
};

#endif // ANNOTATIONHISTORY_H
