#ifndef ANNOTATIONERROR_H
#define ANNOTATIONERROR_H

#include <QString>

/**
 * @brief Error report filled in by store, transform and history operations.
 *
 * Operations return bool (or std::optional) and take an optional
 * AnnotationError* that receives the failure kind and a readable message.
 */
struct AnnotationError
{
    enum class Code {
        None,
        InvalidImageDimensions,
        MalformedRecord,
        PersistenceError,
        IndexOutOfRange
    };

    Code code = Code::None;
    QString message;

    bool isError() const { return code != Code::None; }

    static void set(AnnotationError* error, Code code, const QString& message)
    {
        if (!error) {
            return;
        }
        error->code = code;
        error->message = message;
    }

    static void reset(AnnotationError* error)
    {
        if (!error) {
            return;
        }
        error->code = Code::None;
        error->message.clear();
    }
};

#endif // ANNOTATIONERROR_H
