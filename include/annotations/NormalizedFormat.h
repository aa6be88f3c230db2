#ifndef NORMALIZEDFORMAT_H
#define NORMALIZEDFORMAT_H

#include <QString>
#include <QVector>
#include <optional>

#include "annotations/AnnotationError.h"
#include "annotations/BoxAnnotation.h"

/**
 * @brief One detection-training label: class id plus center/size
 *        relative to the image dimensions.
 */
struct NormalizedRecord
{
    qint64 classId = 0;
    double xCenter = 0.0;
    double yCenter = 0.0;
    double width = 0.0;
    double height = 0.0;

    QVector<double> toFields() const;
};

/**
 * @brief Conversion between pixel-space boxes and the normalized
 *        "class cx cy w h" interchange format.
 *
 * Pure functions. Output is not clipped to [0, 1]: a box partially
 * outside the image yields out-of-range values.
 */
class NormalizedFormat
{
public:
    static constexpr int kFieldCount = 5;
    static constexpr int kDecimals = 6;

    static std::optional<NormalizedRecord> toNormalized(const BoxAnnotation& annotation,
                                                        int imageWidth, int imageHeight,
                                                        AnnotationError* error = nullptr);

    /**
     * @brief Convert exactly five fields [class, cx, cy, w, h] back to pixels.
     *
     * The class field is truncated toward zero.
     */
    static std::optional<BoxAnnotation> fromNormalized(const QVector<double>& fields,
                                                       int imageWidth, int imageHeight,
                                                       AnnotationError* error = nullptr);

    // "2 0.250000 0.250000 0.500000 0.500000"
    static QString formatLine(const NormalizedRecord& record);

    static std::optional<QVector<double>> parseLine(const QString& line,
                                                    AnnotationError* error = nullptr);

private:
    NormalizedFormat() = delete;

    static bool validateDimensions(int imageWidth, int imageHeight, AnnotationError* error);
};

#endif // NORMALIZEDFORMAT_H
