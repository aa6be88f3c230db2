#include "cli/commands/ExportCommand.h"

#include "annotations/AnnotationStore.h"
#include "cli/StoreOptionsHelper.h"

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>

namespace BoxLabel {
namespace CLI {

QString ExportCommand::name() const { return "export"; }

QString ExportCommand::description() const { return "Export normalized labels for an image"; }

void ExportCommand::setupOptions(QCommandLineParser& parser)
{
    addImageSizeOptions(parser);
    parser.addOption({{"o", "output"}, "Output label file (default: stdout)", "file"});
    parser.addPositionalArgument("image", "Image file or image key");
}

CLIResult ExportCommand::execute(const QCommandLineParser& parser)
{
    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "Exactly one image is required");
    }

    CLIResult failure;
    const auto size = resolveImageSize(parser, args.first(), &failure);
    if (!size) {
        return failure;
    }

    AnnotationStore store(resolveStorageDir(parser));
    AnnotationError error;
    const QString key = resolveImageKey(args.first());
    const QStringList lines = store.exportLines(key, size->width(), size->height(), &error);
    if (error.isError()) {
        return CLIResult::fromAnnotationError(error);
    }

    QByteArray data;
    for (const QString& line : lines) {
        data.append(line.toUtf8());
        data.append('\n');
    }

    QString outputFile = parser.value("output");
    if (outputFile.isEmpty()) {
        return CLIResult::withData(data);
    }

    QDir().mkpath(QFileInfo(outputFile).absolutePath());
    QSaveFile file(outputFile);
    if (!file.open(QIODevice::WriteOnly) || file.write(data) != data.size() || !file.commit()) {
        return CLIResult::error(CLIResult::Code::FileError,
                                QString("Failed to write %1: %2").arg(outputFile, file.errorString()));
    }

    return CLIResult::success(QString("Exported %1 boxes to %2").arg(lines.size()).arg(outputFile));
}

} // namespace CLI
} // namespace BoxLabel
