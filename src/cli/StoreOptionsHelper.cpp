#include "cli/StoreOptionsHelper.h"

#include "annotations/AnnotationStore.h"
#include "settings/EditorSettingsManager.h"

#include <QFileInfo>
#include <QImageReader>

namespace BoxLabel {
namespace CLI {
namespace {

std::optional<int> parsePositive(const QString& text)
{
    bool ok = false;
    const int value = text.toInt(&ok);
    if (!ok || value <= 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace

void addStorageDirOption(QCommandLineParser& parser)
{
    parser.addOption({{"d", "dir"}, "Annotation directory (default from settings)", "dir"});
}

QString resolveStorageDir(const QCommandLineParser& parser)
{
    if (parser.isSet("dir")) {
        return parser.value("dir");
    }
    return EditorSettingsManager::instance().loadAnnotationDirectory();
}

void addImageSizeOptions(QCommandLineParser& parser)
{
    parser.addOption({{"W", "width"}, "Image width in pixels", "px"});
    parser.addOption({{"H", "height"}, "Image height in pixels", "px"});
}

std::optional<QSize> resolveImageSize(const QCommandLineParser& parser,
                                      const QString& imagePath, CLIResult* failure)
{
    if (parser.isSet("width") || parser.isSet("height")) {
        const auto width = parsePositive(parser.value("width"));
        const auto height = parsePositive(parser.value("height"));
        if (!width || !height) {
            if (failure) {
                *failure = CLIResult::error(CLIResult::Code::InvalidArguments,
                                            "--width and --height must both be positive integers");
            }
            return std::nullopt;
        }
        return QSize(*width, *height);
    }

    if (!imagePath.isEmpty() && QFileInfo(imagePath).isFile()) {
        QImageReader reader(imagePath);
        const QSize size = reader.size();
        if (size.isValid() && !size.isEmpty()) {
            return size;
        }
        if (failure) {
            *failure = CLIResult::error(CLIResult::Code::FileError,
                                        QString("Cannot read image size from %1: %2")
                                            .arg(imagePath, reader.errorString()));
        }
        return std::nullopt;
    }

    if (failure) {
        *failure = CLIResult::error(CLIResult::Code::InvalidArguments,
                                    "Image size required: pass --width and --height or an image file");
    }
    return std::nullopt;
}

QString resolveImageKey(const QString& argument)
{
    if (QFileInfo(argument).isFile()) {
        return AnnotationStore::keyForImagePath(argument);
    }
    return argument;
}

} // namespace CLI
} // namespace BoxLabel
