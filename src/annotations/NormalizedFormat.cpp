#include "annotations/NormalizedFormat.h"

#include <QStringList>
#include <QtMath>

QVector<double> NormalizedRecord::toFields() const
{
    return {static_cast<double>(classId), xCenter, yCenter, width, height};
}

bool NormalizedFormat::validateDimensions(int imageWidth, int imageHeight, AnnotationError* error)
{
    if (imageWidth <= 0 || imageHeight <= 0) {
        AnnotationError::set(error, AnnotationError::Code::InvalidImageDimensions,
                             QStringLiteral("Invalid image dimensions %1x%2")
                                 .arg(imageWidth)
                                 .arg(imageHeight));
        return false;
    }
    return true;
}

std::optional<NormalizedRecord> NormalizedFormat::toNormalized(const BoxAnnotation& annotation,
                                                               int imageWidth, int imageHeight,
                                                               AnnotationError* error)
{
    if (!validateDimensions(imageWidth, imageHeight, error)) {
        return std::nullopt;
    }

    const double w = static_cast<double>(imageWidth);
    const double h = static_cast<double>(imageHeight);

    NormalizedRecord record;
    record.classId = annotation.classId;
    record.xCenter = (annotation.x + annotation.width / 2.0) / w;
    record.yCenter = (annotation.y + annotation.height / 2.0) / h;
    record.width = annotation.width / w;
    record.height = annotation.height / h;
    return record;
}

std::optional<BoxAnnotation> NormalizedFormat::fromNormalized(const QVector<double>& fields,
                                                              int imageWidth, int imageHeight,
                                                              AnnotationError* error)
{
    if (fields.size() != kFieldCount) {
        AnnotationError::set(error, AnnotationError::Code::MalformedRecord,
                             QStringLiteral("Expected %1 fields, got %2")
                                 .arg(kFieldCount)
                                 .arg(fields.size()));
        return std::nullopt;
    }
    for (double value : fields) {
        if (!qIsFinite(value)) {
            AnnotationError::set(error, AnnotationError::Code::MalformedRecord,
                                 QStringLiteral("Non-finite field in record"));
            return std::nullopt;
        }
    }
    // 2^63, the first value that does not fit a qint64
    constexpr double kClassIdLimit = 9223372036854775808.0;
    if (fields[0] < 0.0 || fields[0] >= kClassIdLimit) {
        AnnotationError::set(error, AnnotationError::Code::MalformedRecord,
                             QStringLiteral("Class id %1 out of range").arg(fields[0]));
        return std::nullopt;
    }
    if (fields[3] < 0.0 || fields[4] < 0.0) {
        AnnotationError::set(error, AnnotationError::Code::MalformedRecord,
                             QStringLiteral("Negative box size %1x%2").arg(fields[3]).arg(fields[4]));
        return std::nullopt;
    }
    if (!validateDimensions(imageWidth, imageHeight, error)) {
        return std::nullopt;
    }

    const double w = static_cast<double>(imageWidth);
    const double h = static_cast<double>(imageHeight);

    BoxAnnotation box;
    box.classId = static_cast<qint64>(fields[0]);
    box.width = fields[3] * w;
    box.height = fields[4] * h;
    box.x = fields[1] * w - box.width / 2.0;
    box.y = fields[2] * h - box.height / 2.0;
    return box;
}

QString NormalizedFormat::formatLine(const NormalizedRecord& record)
{
    return QStringLiteral("%1 %2 %3 %4 %5")
        .arg(record.classId)
        .arg(record.xCenter, 0, 'f', kDecimals)
        .arg(record.yCenter, 0, 'f', kDecimals)
        .arg(record.width, 0, 'f', kDecimals)
        .arg(record.height, 0, 'f', kDecimals);
}

std::optional<QVector<double>> NormalizedFormat::parseLine(const QString& line,
                                                           AnnotationError* error)
{
    const QStringList parts = line.simplified().split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.size() != kFieldCount) {
        AnnotationError::set(error, AnnotationError::Code::MalformedRecord,
                             QStringLiteral("Expected %1 fields, got %2: \"%3\"")
                                 .arg(kFieldCount)
                                 .arg(parts.size())
                                 .arg(line.trimmed()));
        return std::nullopt;
    }

    QVector<double> fields;
    fields.reserve(kFieldCount);
    for (const QString& part : parts) {
        bool ok = false;
        const double value = part.toDouble(&ok);
        if (!ok || !qIsFinite(value)) {
            AnnotationError::set(error, AnnotationError::Code::MalformedRecord,
                                 QStringLiteral("Invalid number \"%1\"").arg(part));
            return std::nullopt;
        }
        fields.append(value);
    }
    return fields;
}
