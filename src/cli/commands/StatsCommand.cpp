#include "cli/commands/StatsCommand.h"

#include "annotations/AnnotationStore.h"
#include "annotations/ClassRegistry.h"
#include "cli/StoreOptionsHelper.h"

#include <QTextStream>

namespace BoxLabel {
namespace CLI {

QString StatsCommand::name() const { return "stats"; }

QString StatsCommand::description() const { return "Show annotation statistics"; }

void StatsCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({{"c", "classes"}, "Class file used to name class ids", "file"});
}

CLIResult StatsCommand::execute(const QCommandLineParser& parser)
{
    ClassRegistry registry;
    if (parser.isSet("classes")) {
        AnnotationError error;
        if (!registry.loadFromJson(parser.value("classes"), &error)) {
            return CLIResult::fromAnnotationError(error);
        }
    }

    AnnotationStore store(resolveStorageDir(parser));
    QStringList unreadable;
    const QStringList keys = store.storedKeys();
    for (const QString& key : keys) {
        AnnotationError error;
        store.annotations(key, &error);
        if (error.isError()) {
            unreadable.append(key);
        }
    }

    const AnnotationStatistics stats = store.statistics();

    QString output;
    QTextStream out(&output);
    out << "Annotation directory: " << store.storageDir() << "\n";
    out << "Images: " << stats.imageCount << "\n";
    out << "Boxes: " << stats.annotationCount << "\n";
    if (!stats.classCounts.isEmpty()) {
        out << "Classes:\n";
        for (auto it = stats.classCounts.constBegin(); it != stats.classCounts.constEnd(); ++it) {
            out << QString("  %1 %2  %3\n")
                       .arg(it.key(), 4)
                       .arg(registry.className(it.key()), -20)
                       .arg(it.value());
        }
    }
    if (!unreadable.isEmpty()) {
        out << "Unreadable: " << unreadable.join(", ") << "\n";
    }

    // Trailing newline is added when printing
    out.flush();
    output.chop(1);
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace BoxLabel
