#ifndef BOXANNOTATION_H
#define BOXANNOTATION_H

#include <QJsonObject>
#include <QRectF>
#include <QVector>
#include <QtGlobal>

// Boxes at or below this size (pixels) are never committed or persisted
inline constexpr double kMinBoxSize = 10.0;

/**
 * @brief Axis-aligned bounding box in image pixel space.
 *
 * (x, y) is the top-left corner. classId is an opaque key into the
 * class registry and is not validated here.
 */
struct BoxAnnotation
{
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    qint64 classId = 0;

    QRectF rect() const { return QRectF(x, y, width, height); }
    static BoxAnnotation fromRect(const QRectF& rect, qint64 classId);

    bool operator==(const BoxAnnotation& other) const
    {
        return x == other.x && y == other.y && width == other.width
            && height == other.height && classId == other.classId;
    }
    bool operator!=(const BoxAnnotation& other) const { return !(*this == other); }

    // Persisted form: {"x", "y", "width", "height", "class_id"}
    QJsonObject toJson() const;
    static BoxAnnotation fromJson(const QJsonObject& json);
};

using AnnotationSet = QVector<BoxAnnotation>;

bool meetsMinimumSize(const QRectF& rect);

#endif // BOXANNOTATION_H
