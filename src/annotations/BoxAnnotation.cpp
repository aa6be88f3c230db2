#include "annotations/BoxAnnotation.h"

#include <QJsonValue>
#include <QVariant>

BoxAnnotation BoxAnnotation::fromRect(const QRectF& rect, qint64 classId)
{
    BoxAnnotation box;
    box.x = rect.x();
    box.y = rect.y();
    box.width = rect.width();
    box.height = rect.height();
    box.classId = classId;
    return box;
}

QJsonObject BoxAnnotation::toJson() const
{
    QJsonObject obj;
    obj["x"] = x;
    obj["y"] = y;
    obj["width"] = width;
    obj["height"] = height;
    obj["class_id"] = classId;
    return obj;
}

BoxAnnotation BoxAnnotation::fromJson(const QJsonObject& json)
{
    // Missing keys fall back to 0
    BoxAnnotation box;
    box.x = json["x"].toDouble(0.0);
    box.y = json["y"].toDouble(0.0);
    box.width = json["width"].toDouble(0.0);
    box.height = json["height"].toDouble(0.0);
    box.classId = json["class_id"].toVariant().toLongLong();
    return box;
}

bool meetsMinimumSize(const QRectF& rect)
{
    return rect.width() > kMinBoxSize && rect.height() > kMinBoxSize;
}
