#ifndef CLASSREGISTRY_H
#define CLASSREGISTRY_H

#include <QColor>
#include <QHash>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QtGlobal>
#include <optional>

#include "annotations/AnnotationError.h"

struct ClassInfo
{
    qint64 id = 0;
    QString name;
    QColor color;
};

/**
 * @brief Label classes referenced by BoxAnnotation::classId.
 *
 * Ids are assigned in increasing order. Names are unique: adding a name
 * that already exists returns the existing id.
 */
class ClassRegistry
{
public:
    ClassRegistry() = default;

    qint64 addClass(const QString& name, const QColor& color = QColor());
    bool updateClass(qint64 id, const QString& name, const QColor& color);
    bool removeClass(qint64 id);

    // Inserts under the given id, or overwrites an existing entry
    qint64 addOrUpdateClass(qint64 id, const QString& name, const QColor& color);

    std::optional<ClassInfo> classInfo(qint64 id) const;
    bool contains(qint64 id) const { return m_classes.contains(id); }

    // "Unknown(<id>)" for ids with no entry
    QString className(qint64 id) const;
    // Grey for ids with no entry
    QColor classColor(qint64 id) const;

    // Ordered by id
    QList<ClassInfo> classes() const;
    QStringList classNames() const;

    int count() const { return static_cast<int>(m_classes.size()); }
    std::optional<qint64> findByName(const QString& name) const;
    qint64 nextClassId() const { return m_nextClassId; }
    void clear();

    /**
     * @brief Add the classes of another registry.
     *
     * Classes whose name already exists here are reused. Returns the
     * mapping from the other registry's ids to ids in this one.
     */
    QHash<qint64, qint64> merge(const ClassRegistry& other);

    // JSON array of {"id", "name", "color": [r, g, b]}
    bool saveToJson(const QString& path, AnnotationError* error = nullptr) const;
    bool loadFromJson(const QString& path, AnnotationError* error = nullptr);

    // Dataset description (path, train/val/test, nc, names) for training tools
    bool exportDataYaml(const QString& path, const QString& datasetPath = QStringLiteral("./dataset"),
                        AnnotationError* error = nullptr) const;

    static QColor unknownClassColor() { return QColor(128, 128, 128); }
    static QColor generateColor();

private:
    void updateNextClassId();

    QMap<qint64, ClassInfo> m_classes;
    qint64 m_nextClassId = 0;
};

#endif // CLASSREGISTRY_H
