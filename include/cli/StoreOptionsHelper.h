#ifndef STORE_OPTIONS_HELPER_H
#define STORE_OPTIONS_HELPER_H

#include "cli/CLIResult.h"

#include <QCommandLineParser>
#include <QSize>
#include <QString>
#include <optional>

namespace BoxLabel {
namespace CLI {

// --dir, added by CLIHandler for commands that use the annotation store
void addStorageDirOption(QCommandLineParser& parser);
QString resolveStorageDir(const QCommandLineParser& parser);

// --width/--height, falling back to the size of imagePath when it is readable
void addImageSizeOptions(QCommandLineParser& parser);
std::optional<QSize> resolveImageSize(const QCommandLineParser& parser,
                                      const QString& imagePath, CLIResult* failure);

// Image key for a positional argument that may be a key or an image path
QString resolveImageKey(const QString& argument);

} // namespace CLI
} // namespace BoxLabel

#endif // STORE_OPTIONS_HELPER_H
