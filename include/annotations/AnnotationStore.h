#ifndef ANNOTATIONSTORE_H
#define ANNOTATIONSTORE_H

#include <QHash>
#include <QMap>
#include <QObject>
#include <QString>
#include <QStringList>

#include "annotations/AnnotationError.h"
#include "annotations/BoxAnnotation.h"

struct AnnotationStatistics
{
    int imageCount = 0;
    int annotationCount = 0;
    QMap<qint64, int> classCounts;
};

/**
 * @brief Per-image annotation sets with write-through JSON persistence.
 *
 * Each image key maps to "<storageDir>/<key>.json". Sets are cached after
 * the first successful read or write.
 */
class AnnotationStore : public QObject
{
    Q_OBJECT

public:
    struct ImportResult {
        int imported = 0;
        int skipped = 0;
    };

    explicit AnnotationStore(const QString& storageDir, QObject* parent = nullptr);
    ~AnnotationStore() override;

    QString storageDir() const { return m_storageDir; }
    QString annotationPath(const QString& key) const;

    // Key for an image file: its name without the last suffix
    static QString keyForImagePath(const QString& imagePath);

    AnnotationSet annotations(const QString& key, AnnotationError* error = nullptr);

    // Saving an empty set is a no-op; use clear() to remove annotations
    bool save(const QString& key, const AnnotationSet& annotations,
              AnnotationError* error = nullptr);
    bool clear(const QString& key, AnnotationError* error = nullptr);

    // Applies a snapshot: save() when non-empty, clear() when empty
    bool replace(const QString& key, const AnnotationSet& annotations,
                 AnnotationError* error = nullptr);

    bool hasAnnotations(const QString& key) const;

    QStringList exportLines(const QString& key, int imageWidth, int imageHeight,
                            AnnotationError* error = nullptr);
    bool importLines(const QString& key, const QStringList& lines,
                     int imageWidth, int imageHeight,
                     ImportResult* result = nullptr, AnnotationError* error = nullptr);

    QStringList storedKeys() const;
    QStringList cachedKeys() const;
    void invalidate(const QString& key);
    // Over loaded sets only; images with no boxes are not counted
    AnnotationStatistics statistics() const;

signals:
    void annotationsChanged(const QString& key);

private:
    bool load(const QString& key, AnnotationSet* annotations, AnnotationError* error);
    bool ensureStorageDir(AnnotationError* error) const;

    QString m_storageDir;
    QHash<QString, AnnotationSet> m_cache;
};

#endif // ANNOTATIONSTORE_H
