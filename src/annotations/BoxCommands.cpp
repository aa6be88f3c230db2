#include "annotations/BoxCommands.h"
#include "annotations/AnnotationStore.h"

#include <QDebug>

BoxCommand::BoxCommand(const QString& imageKey)
    : m_imageKey(imageKey)
{
}

BoxCommand::~BoxCommand() = default;

bool BoxCommand::execute(AnnotationStore& store, AnnotationError* error)
{
    AnnotationError readError;
    const AnnotationSet current = store.annotations(m_imageKey, &readError);
    if (readError.isError()) {
        // Never overwrite a file we could not read
        if (error) {
            *error = readError;
        }
        return false;
    }

    m_status = AnnotationError::Code::None;
    AnnotationSet next = apply(current);

    if (next != current && !store.replace(m_imageKey, next, error)) {
        return false;
    }

    m_before = current;
    m_after = std::move(next);
    return true;
}

bool BoxCommand::undo(AnnotationStore& store, AnnotationError* error) const
{
    if (!m_before) {
        return false;
    }
    return store.replace(m_imageKey, *m_before, error);
}

bool BoxCommand::redo(AnnotationStore& store, AnnotationError* error) const
{
    if (!m_after) {
        return false;
    }
    return store.replace(m_imageKey, *m_after, error);
}

// ============================================================================
// AddBoxCommand
// ============================================================================

AddBoxCommand::AddBoxCommand(const QString& imageKey, const BoxAnnotation& box)
    : BoxCommand(imageKey)
    , m_box(box)
{
}

QString AddBoxCommand::description() const
{
    return QStringLiteral("Add box");
}

AnnotationSet AddBoxCommand::apply(const AnnotationSet& current)
{
    AnnotationSet next = current;
    next.append(m_box);
    return next;
}

// ============================================================================
// DeleteBoxCommand
// ============================================================================

DeleteBoxCommand::DeleteBoxCommand(const QString& imageKey, int index)
    : BoxCommand(imageKey)
    , m_index(index)
{
}

QString DeleteBoxCommand::description() const
{
    return QStringLiteral("Delete box");
}

AnnotationSet DeleteBoxCommand::apply(const AnnotationSet& current)
{
    if (m_index < 0 || m_index >= current.size()) {
        qDebug() << "DeleteBoxCommand: Index" << m_index << "out of range for"
                 << imageKey() << "size" << current.size();
        setStatus(AnnotationError::Code::IndexOutOfRange);
        return current;
    }

    AnnotationSet next = current;
    next.removeAt(m_index);
    return next;
}

// ============================================================================
// ReplaceBoxesCommand
// ============================================================================

ReplaceBoxesCommand::ReplaceBoxesCommand(const QString& imageKey,
                                         const AnnotationSet& annotations,
                                         const QString& description)
    : BoxCommand(imageKey)
    , m_annotations(annotations)
    , m_description(description)
{
}

QString ReplaceBoxesCommand::description() const
{
    return m_description.isEmpty() ? QStringLiteral("Replace boxes") : m_description;
}

AnnotationSet ReplaceBoxesCommand::apply(const AnnotationSet& /*current*/)
{
    return m_annotations;
}

// ============================================================================
// ChangeBoxClassCommand
// ============================================================================

ChangeBoxClassCommand::ChangeBoxClassCommand(const QString& imageKey, int index, qint64 classId)
    : BoxCommand(imageKey)
    , m_index(index)
    , m_classId(classId)
{
}

QString ChangeBoxClassCommand::description() const
{
    return QStringLiteral("Change box class");
}

AnnotationSet ChangeBoxClassCommand::apply(const AnnotationSet& current)
{
    if (m_index < 0 || m_index >= current.size()) {
        setStatus(AnnotationError::Code::IndexOutOfRange);
        return current;
    }

    AnnotationSet next = current;
    next[m_index].classId = m_classId;
    return next;
}
