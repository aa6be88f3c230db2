#include "annotations/ClassRegistry.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QRandomGenerator>
#include <QSaveFile>

#include <yaml-cpp/yaml.h>

namespace {

constexpr int kColorMin = 50;
constexpr int kColorMax = 200;

QJsonArray colorToJson(const QColor& color)
{
    return QJsonArray{color.red(), color.green(), color.blue()};
}

QColor colorFromJson(const QJsonValue& value)
{
    const QJsonArray rgb = value.toArray();
    if (rgb.size() != 3) {
        return QColor();
    }
    const QColor color(rgb.at(0).toInt(), rgb.at(1).toInt(), rgb.at(2).toInt());
    return color.isValid() ? color : QColor();
}

bool writeFile(const QString& path, const QByteArray& data, AnnotationError* error)
{
    const QString dirPath = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(dirPath)) {
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to create directory: %1").arg(dirPath));
        return false;
    }

    QSaveFile file(path);
    file.setDirectWriteFallback(true);
    if (!file.open(QIODevice::WriteOnly)) {
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to open %1: %2").arg(path, file.errorString()));
        return false;
    }
    if (file.write(data) != data.size() || !file.commit()) {
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to write %1: %2").arg(path, file.errorString()));
        return false;
    }
    return true;
}

} // namespace

QColor ClassRegistry::generateColor()
{
    auto* rng = QRandomGenerator::global();
    return QColor(rng->bounded(kColorMin, kColorMax + 1),
                  rng->bounded(kColorMin, kColorMax + 1),
                  rng->bounded(kColorMin, kColorMax + 1));
}

qint64 ClassRegistry::addClass(const QString& name, const QColor& color)
{
    if (const auto existing = findByName(name)) {
        return *existing;
    }

    const qint64 id = m_nextClassId;
    m_classes.insert(id, ClassInfo{id, name, color.isValid() ? color : generateColor()});
    ++m_nextClassId;
    return id;
}

bool ClassRegistry::updateClass(qint64 id, const QString& name, const QColor& color)
{
    auto it = m_classes.find(id);
    if (it == m_classes.end()) {
        return false;
    }
    it->name = name;
    if (color.isValid()) {
        it->color = color;
    }
    return true;
}

bool ClassRegistry::removeClass(qint64 id)
{
    if (m_classes.remove(id) == 0) {
        return false;
    }

    // Only the highest id is handed out again
    if (id == m_nextClassId - 1) {
        updateNextClassId();
    }
    return true;
}

qint64 ClassRegistry::addOrUpdateClass(qint64 id, const QString& name, const QColor& color)
{
    m_classes.insert(id, ClassInfo{id, name, color.isValid() ? color : generateColor()});
    if (id >= m_nextClassId) {
        m_nextClassId = id + 1;
    }
    return id;
}

std::optional<ClassInfo> ClassRegistry::classInfo(qint64 id) const
{
    auto it = m_classes.constFind(id);
    if (it == m_classes.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

QString ClassRegistry::className(qint64 id) const
{
    auto it = m_classes.constFind(id);
    if (it == m_classes.constEnd()) {
        return QStringLiteral("Unknown(%1)").arg(id);
    }
    return it->name;
}

QColor ClassRegistry::classColor(qint64 id) const
{
    auto it = m_classes.constFind(id);
    if (it == m_classes.constEnd()) {
        return unknownClassColor();
    }
    return it->color;
}

QList<ClassInfo> ClassRegistry::classes() const
{
    return m_classes.values();
}

QStringList ClassRegistry::classNames() const
{
    QStringList names;
    names.reserve(m_classes.size());
    for (const ClassInfo& info : m_classes) {
        names.append(info.name);
    }
    return names;
}

std::optional<qint64> ClassRegistry::findByName(const QString& name) const
{
    for (const ClassInfo& info : m_classes) {
        if (info.name == name) {
            return info.id;
        }
    }
    return std::nullopt;
}

void ClassRegistry::clear()
{
    m_classes.clear();
    m_nextClassId = 0;
}

QHash<qint64, qint64> ClassRegistry::merge(const ClassRegistry& other)
{
    QHash<qint64, qint64> mapping;
    for (const ClassInfo& info : other.m_classes) {
        mapping.insert(info.id, addClass(info.name, info.color));
    }
    return mapping;
}

void ClassRegistry::updateNextClassId()
{
    m_nextClassId = m_classes.isEmpty() ? 0 : m_classes.lastKey() + 1;
}

// ============================================================================
// Persistence
// ============================================================================

bool ClassRegistry::saveToJson(const QString& path, AnnotationError* error) const
{
    AnnotationError::reset(error);

    QJsonArray array;
    for (const ClassInfo& info : m_classes) {
        QJsonObject obj;
        obj["id"] = info.id;
        obj["name"] = info.name;
        obj["color"] = colorToJson(info.color);
        array.append(obj);
    }

    return writeFile(path, QJsonDocument(array).toJson(QJsonDocument::Indented), error);
}

bool ClassRegistry::loadFromJson(const QString& path, AnnotationError* error)
{
    AnnotationError::reset(error);

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "ClassRegistry: Failed to open" << path << file.errorString();
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to open %1: %2").arg(path, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "ClassRegistry: Invalid class file" << path << parseError.errorString();
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Invalid class file %1").arg(path));
        return false;
    }

    m_classes.clear();
    const QJsonArray array = doc.array();
    for (const QJsonValue& value : array) {
        const QJsonObject obj = value.toObject();
        const qint64 id = obj.contains("id")
            ? obj.value("id").toVariant().toLongLong()
            : static_cast<qint64>(m_classes.size());
        QString name = obj.value("name").toString();
        if (name.isEmpty()) {
            name = QStringLiteral("class_%1").arg(id);
        }
        QColor color = colorFromJson(obj.value("color"));
        if (!color.isValid()) {
            color = generateColor();
        }
        m_classes.insert(id, ClassInfo{id, name, color});
    }

    updateNextClassId();
    return true;
}

bool ClassRegistry::exportDataYaml(const QString& path, const QString& datasetPath,
                                   AnnotationError* error) const
{
    AnnotationError::reset(error);

    // Keys in sorted order, as training tools write them
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "names" << YAML::Value << YAML::BeginMap;
    for (const ClassInfo& info : m_classes) {
        out << YAML::Key << info.id << YAML::Value << info.name.toStdString();
    }
    out << YAML::EndMap;
    out << YAML::Key << "nc" << YAML::Value << count();
    out << YAML::Key << "path" << YAML::Value << datasetPath.toStdString();
    out << YAML::Key << "test" << YAML::Value << "images/test";
    out << YAML::Key << "train" << YAML::Value << "images/train";
    out << YAML::Key << "val" << YAML::Value << "images/val";
    out << YAML::EndMap;

    if (!out.good()) {
        qWarning() << "ClassRegistry: Failed to emit dataset YAML" << out.GetLastError().c_str();
        AnnotationError::set(error, AnnotationError::Code::PersistenceError,
                             QStringLiteral("Failed to write %1: %2")
                                 .arg(path, QString::fromStdString(out.GetLastError())));
        return false;
    }

    QByteArray data(out.c_str(), static_cast<int>(out.size()));
    data.append('\n');
    return writeFile(path, data, error);
}
