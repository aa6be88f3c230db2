#include "cli/commands/ImportCommand.h"

#include "annotations/AnnotationStore.h"
#include "cli/StoreOptionsHelper.h"

#include <QFile>
#include <QFileInfo>
#include <QTextStream>

namespace BoxLabel {
namespace CLI {

QString ImportCommand::name() const { return "import"; }

QString ImportCommand::description() const { return "Import normalized labels for an image"; }

void ImportCommand::setupOptions(QCommandLineParser& parser)
{
    addImageSizeOptions(parser);
    parser.addOption({{"i", "image"}, "Image file the labels belong to", "file"});
    parser.addOption({{"k", "key"}, "Image key (default: label file name)", "key"});
    parser.addPositionalArgument("labels", "Label file with one box per line");
}

CLIResult ImportCommand::execute(const QCommandLineParser& parser)
{
    const QStringList args = parser.positionalArguments();
    if (args.size() != 1) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "Exactly one label file is required");
    }

    const QString labelPath = args.first();
    const QString imagePath = parser.value("image");

    CLIResult failure;
    const auto size = resolveImageSize(parser, imagePath, &failure);
    if (!size) {
        return failure;
    }

    QFile file(labelPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return CLIResult::error(CLIResult::Code::FileError,
                                QString("Cannot open %1: %2").arg(labelPath, file.errorString()));
    }

    QStringList lines;
    QTextStream in(&file);
    while (!in.atEnd()) {
        lines.append(in.readLine());
    }

    QString key = parser.value("key");
    if (key.isEmpty()) {
        key = imagePath.isEmpty() ? AnnotationStore::keyForImagePath(labelPath)
                                  : AnnotationStore::keyForImagePath(imagePath);
    }

    AnnotationStore store(resolveStorageDir(parser));
    AnnotationStore::ImportResult result;
    AnnotationError error;
    if (!store.importLines(key, lines, size->width(), size->height(), &result, &error)) {
        return CLIResult::fromAnnotationError(error);
    }

    return CLIResult::success(QString("Imported %1 boxes into %2 (%3 skipped)")
                                  .arg(result.imported)
                                  .arg(key)
                                  .arg(result.skipped));
}

} // namespace CLI
} // namespace BoxLabel
