#include "cli/commands/ClearCommand.h"

#include "annotations/AnnotationStore.h"
#include "cli/StoreOptionsHelper.h"

namespace BoxLabel {
namespace CLI {

QString ClearCommand::name() const { return "clear"; }

QString ClearCommand::description() const { return "Remove all annotations of an image"; }

void ClearCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addPositionalArgument("image", "Image file or image key");
}

CLIResult ClearCommand::execute(const QCommandLineParser& parser)
{
    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "Exactly one image is required");
    }

    AnnotationStore store(resolveStorageDir(parser));
    const QString key = resolveImageKey(args.first());
    if (!store.hasAnnotations(key)) {
        return CLIResult::success(QString("No annotations for %1").arg(key));
    }

    AnnotationError error;
    if (!store.clear(key, &error)) {
        return CLIResult::fromAnnotationError(error);
    }
    return CLIResult::success(QString("Cleared annotations for %1").arg(key));
}

} // namespace CLI
} // namespace BoxLabel
