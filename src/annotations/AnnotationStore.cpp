#include "annotations/AnnotationStore.h"
#include "annotations/NormalizedFormat.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

#include <algorithm>
#include <optional>

namespace {
constexpr auto kAnnotationSuffix = ".json";
}

AnnotationStore::AnnotationStore(const QString& storageDir, QObject* parent)
    : QObject(parent)
    , m_storageDir(storageDir)
{
}

AnnotationStore::~AnnotationStore() = default;

QString AnnotationStore::annotationPath(const QString& key) const
{
    return QDir(m_storageDir).filePath(key + QLatin1String(kAnnotationSuffix));
}

QString AnnotationStore::keyForImagePath(const QString& imagePath)
{
    return QFileInfo(imagePath).completeBaseName();
}

AnnotationSet AnnotationStore::annotations(const QString& key, AnnotationError* error)
{
    auto it = m_cache.constFind(key);
    if (it != m_cache.constEnd()) {
        return it.value();
    }

    AnnotationSet loaded;
    if (!load(key, &loaded, error)) {
        return {};
    }
    return loaded;
}

bool AnnotationStore::load(const QString& key, AnnotationSet* annotations, AnnotationError* error)
{
    const QString path = annotationPath(key);
    if (!QFile::exists(path)) {
        // Nothing annotated yet
        return true;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "AnnotationStore: Failed to open" << path << file.errorString();
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to open %1: %2").arg(path, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isArray()) {
        const QString reason = doc.isNull() ? parseError.errorString()
                                            : QStringLiteral("top-level value is not an array");
        qWarning() << "AnnotationStore: Failed to parse" << path << reason;
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to parse %1: %2").arg(path, reason));
        return false;
    }

    AnnotationSet result;
    const QJsonArray array = doc.array();
    result.reserve(array.size());
    for (const QJsonValue& value : array) {
        result.append(BoxAnnotation::fromJson(value.toObject()));
    }

    m_cache.insert(key, result);
    *annotations = result;
    return true;
}

bool AnnotationStore::ensureStorageDir(AnnotationError* error) const
{
    QDir dir(m_storageDir);
    if (dir.exists() || dir.mkpath(QStringLiteral("."))) {
        return true;
    }
    qWarning() << "AnnotationStore: Failed to create storage folder:" << m_storageDir;
    AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                         QStringLiteral("Failed to create folder %1").arg(m_storageDir));
    return false;
}

bool AnnotationStore::save(const QString& key, const AnnotationSet& annotations,
                           AnnotationError* error)
{
    if (annotations.isEmpty()) {
        return true;
    }

    if (!ensureStorageDir(error)) {
        return false;
    }

    QJsonArray array;
    for (const BoxAnnotation& box : annotations) {
        array.append(box.toJson());
    }

    const QString path = annotationPath(key);
    QSaveFile saveFile(path);
    saveFile.setDirectWriteFallback(true);
    if (!saveFile.open(QIODevice::WriteOnly)) {
        qWarning() << "AnnotationStore: Failed to open" << path << saveFile.errorString();
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to open %1: %2")
                                 .arg(path, saveFile.errorString()));
        return false;
    }

    const QByteArray data = QJsonDocument(array).toJson(QJsonDocument::Indented);
    if (saveFile.write(data) != data.size()) {
        saveFile.cancelWriting();
        qWarning() << "AnnotationStore: Failed to write" << path;
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to write %1").arg(path));
        return false;
    }

    if (!saveFile.commit()) {
        qWarning() << "AnnotationStore: Failed to commit" << path << saveFile.errorString();
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to commit %1: %2")
                                 .arg(path, saveFile.errorString()));
        return false;
    }

    m_cache.insert(key, annotations);
    emit annotationsChanged(key);
    return true;
}

bool AnnotationStore::clear(const QString& key, AnnotationError* error)
{
    const QString path = annotationPath(key);
    if (QFile::exists(path) && !QFile::remove(path)) {
        qWarning() << "AnnotationStore: Failed to remove" << path;
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to remove %1").arg(path));
        return false;
    }

    m_cache.insert(key, AnnotationSet());
    emit annotationsChanged(key);
    return true;
}

bool AnnotationStore::replace(const QString& key, const AnnotationSet& annotations,
                              AnnotationError* error)
{
    if (annotations.isEmpty()) {
        return clear(key, error);
    }
    return save(key, annotations, error);
}

bool AnnotationStore::hasAnnotations(const QString& key) const
{
    return QFile::exists(annotationPath(key));
}

QStringList AnnotationStore::exportLines(const QString& key, int imageWidth, int imageHeight,
                                         AnnotationError* error)
{
    if (imageWidth <= 0 || imageHeight <= 0) {
        AnnotationError::set(error, AnnotationError::Code::InvalidImageDimensions,
                             QStringLiteral("Invalid image dimensions %1x%2")
                                 .arg(imageWidth)
                                 .arg(imageHeight));
        return {};
    }

    QStringList lines;
    const AnnotationSet boxes = annotations(key, error);
    lines.reserve(boxes.size());

    for (const BoxAnnotation& box : boxes) {
        const auto record = NormalizedFormat::toNormalized(box, imageWidth, imageHeight, error);
        if (!record) {
            return {};
        }
        lines.append(NormalizedFormat::formatLine(*record));
    }
    return lines;
}

bool AnnotationStore::importLines(const QString& key, const QStringList& lines,
                                  int imageWidth, int imageHeight,
                                  ImportResult* result, AnnotationError* error)
{
    if (imageWidth <= 0 || imageHeight <= 0) {
        AnnotationError::set(error, AnnotationError::Code::InvalidImageDimensions,
                             QStringLiteral("Invalid image dimensions %1x%2")
                                 .arg(imageWidth)
                                 .arg(imageHeight));
        return false;
    }

    ImportResult counts;
    AnnotationSet parsed;

    for (const QString& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty()) {
            continue;
        }

        AnnotationError lineError;
        const auto fields = NormalizedFormat::parseLine(line, &lineError);
        std::optional<BoxAnnotation> box;
        if (fields) {
            box = NormalizedFormat::fromNormalized(*fields, imageWidth, imageHeight, &lineError);
        }
        if (!box) {
            qWarning() << "AnnotationStore: Skipping malformed line" << line << lineError.message;
            ++counts.skipped;
            continue;
        }

        parsed.append(*box);
        ++counts.imported;
    }

    if (result) {
        *result = counts;
    }
    return save(key, parsed, error);
}

QStringList AnnotationStore::storedKeys() const
{
    QDir dir(m_storageDir);
    if (!dir.exists()) {
        return {};
    }

    const QFileInfoList files = dir.entryInfoList(
        QStringList() << QStringLiteral("*") + QLatin1String(kAnnotationSuffix),
        QDir::Files | QDir::Readable,
        QDir::Name);

    QStringList keys;
    keys.reserve(files.size());
    for (const QFileInfo& fileInfo : files) {
        keys.append(fileInfo.completeBaseName());
    }
    return keys;
}

QStringList AnnotationStore::cachedKeys() const
{
    QStringList keys = m_cache.keys();
    std::sort(keys.begin(), keys.end());
    return keys;
}

void AnnotationStore::invalidate(const QString& key)
{
    m_cache.remove(key);
}

AnnotationStatistics AnnotationStore::statistics() const
{
    AnnotationStatistics stats;

    for (auto it = m_cache.constBegin(); it != m_cache.constEnd(); ++it) {
        if (it.value().isEmpty()) {
            continue;
        }
        ++stats.imageCount;
        stats.annotationCount += it.value().size();
        for (const BoxAnnotation& box : it.value()) {
            stats.classCounts[box.classId] += 1;
        }
    }
    return stats;
}
