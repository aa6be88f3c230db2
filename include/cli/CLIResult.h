#ifndef CLI_RESULT_H
#define CLI_RESULT_H

#include <QByteArray>
#include <QString>

#include "annotations/AnnotationError.h"

namespace BoxLabel {
namespace CLI {

/**
 * @brief Outcome of one command; the code doubles as the process exit status.
 *
 * message goes to stdout on success and stderr on failure. data is
 * written to stdout untouched (label lines for piping).
 */
struct CLIResult
{
    enum class Code {
        Success = 0,
        GeneralError = 1,
        InvalidArguments = 2,
        FileError = 3,
        DataError = 4,
    };

    Code code = Code::Success;
    QString message;
    QByteArray data;

    bool isSuccess() const { return code == Code::Success; }
    int exitCode() const { return static_cast<int>(code); }

    static CLIResult success(const QString& msg = QString())
    {
        return {Code::Success, msg, {}};
    }

    static CLIResult error(Code code, const QString& msg) { return {code, msg, {}}; }

    static CLIResult withData(const QByteArray& data) { return {Code::Success, {}, data}; }

    // Maps store and transform failures onto exit codes
    static CLIResult fromAnnotationError(const AnnotationError& error)
    {
        switch (error.code) {
        case AnnotationError::Code::PersistenceError:
            return CLIResult::error(Code::FileError, error.message);
        case AnnotationError::Code::InvalidImageDimensions:
            return CLIResult::error(Code::InvalidArguments, error.message);
        case AnnotationError::Code::MalformedRecord:
        case AnnotationError::Code::IndexOutOfRange:
            return CLIResult::error(Code::DataError, error.message);
        case AnnotationError::Code::None:
            break;
        }
        return CLIResult::error(Code::GeneralError, error.message);
    }
};

} // namespace CLI
} // namespace BoxLabel

#endif // CLI_RESULT_H
