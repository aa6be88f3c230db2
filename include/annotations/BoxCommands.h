#ifndef BOXCOMMANDS_H
#define BOXCOMMANDS_H

#include <QString>
#include <memory>
#include <optional>

#include "annotations/AnnotationError.h"
#include "annotations/BoxAnnotation.h"

class AnnotationStore;

/**
 * @brief Undoable edit of one image's annotation set.
 *
 * A command carries no reference to the store. execute() reads the
 * current set immediately before mutating it and records both the
 * before and after snapshots; undo/redo only re-apply those snapshots.
 */
class BoxCommand
{
public:
    explicit BoxCommand(const QString& imageKey);
    virtual ~BoxCommand();

    QString imageKey() const { return m_imageKey; }
    virtual QString description() const = 0;

    const std::optional<AnnotationSet>& before() const { return m_before; }
    const std::optional<AnnotationSet>& after() const { return m_after; }
    bool hasExecuted() const { return m_before.has_value(); }

    // IndexOutOfRange when the command degenerated to a no-op
    AnnotationError::Code status() const { return m_status; }

    bool execute(AnnotationStore& store, AnnotationError* error = nullptr);
    bool undo(AnnotationStore& store, AnnotationError* error = nullptr) const;
    bool redo(AnnotationStore& store, AnnotationError* error = nullptr) const;

protected:
    // Derive the new set from the current one
    virtual AnnotationSet apply(const AnnotationSet& current) = 0;
    void setStatus(AnnotationError::Code status) { m_status = status; }

private:
    QString m_imageKey;
    std::optional<AnnotationSet> m_before;
    std::optional<AnnotationSet> m_after;
    AnnotationError::Code m_status = AnnotationError::Code::None;
};

using BoxCommandPtr = std::unique_ptr<BoxCommand>;

class AddBoxCommand : public BoxCommand
{
public:
    AddBoxCommand(const QString& imageKey, const BoxAnnotation& box);
    QString description() const override;

protected:
    AnnotationSet apply(const AnnotationSet& current) override;

private:
    BoxAnnotation m_box;
};

class DeleteBoxCommand : public BoxCommand
{
public:
    DeleteBoxCommand(const QString& imageKey, int index);
    QString description() const override;
    int index() const { return m_index; }

protected:
    AnnotationSet apply(const AnnotationSet& current) override;

private:
    int m_index;
};

class ReplaceBoxesCommand : public BoxCommand
{
public:
    ReplaceBoxesCommand(const QString& imageKey, const AnnotationSet& annotations,
                        const QString& description = QString());
    QString description() const override;

protected:
    AnnotationSet apply(const AnnotationSet& current) override;

private:
    AnnotationSet m_annotations;
    QString m_description;
};

class ChangeBoxClassCommand : public BoxCommand
{
public:
    ChangeBoxClassCommand(const QString& imageKey, int index, qint64 classId);
    QString description() const override;

protected:
    AnnotationSet apply(const AnnotationSet& current) override;

private:
    int m_index;
    qint64 m_classId;
};

#endif // BOXCOMMANDS_H
