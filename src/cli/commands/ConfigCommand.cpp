#include "cli/commands/ConfigCommand.h"

#include "settings/EditorSettingsManager.h"
#include "settings/Settings.h"

#include <QSettings>
#include <QTextStream>

namespace BoxLabel {
namespace CLI {

QString ConfigCommand::name() const { return "config"; }

QString ConfigCommand::description() const { return "Show or change configuration"; }

void ConfigCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"get", "Get setting value", "key"});
    parser.addOption({"set", "Set setting value (use with positional arg)", "key"});
    parser.addOption({"list", "List all settings"});
    parser.addOption({"reset", "Reset to default values"});
    parser.addPositionalArgument("value", "Value to set (when using --set)");
}

CLIResult ConfigCommand::execute(const QCommandLineParser& parser)
{
    QSettings settings = BoxLabel::getSettings();
    auto& editorSettings = EditorSettingsManager::instance();

    // --get: Get setting value
    if (parser.isSet("get")) {
        QString key = parser.value("get");
        if (key == EditorSettingsManager::kSettingsKeyAnnotationDirectory) {
            return CLIResult::success(editorSettings.loadAnnotationDirectory());
        }
        if (key == EditorSettingsManager::kSettingsKeyDefaultClassId) {
            return CLIResult::success(QString::number(editorSettings.loadDefaultClassId()));
        }
        if (key == EditorSettingsManager::kSettingsKeyMaxHistorySize) {
            return CLIResult::success(QString::number(editorSettings.loadMaxHistorySize()));
        }
        if (!settings.contains(key)) {
            return CLIResult::error(
                CLIResult::Code::InvalidArguments, QString("Setting not found: %1").arg(key));
        }
        return CLIResult::success(settings.value(key).toString());
    }

    // --set: Set setting value
    if (parser.isSet("set")) {
        QString key = parser.value("set");
        QStringList positionalArgs = parser.positionalArguments();
        if (positionalArgs.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, "Value required for --set");
        }
        QString value = positionalArgs.first();

        if (key == EditorSettingsManager::kSettingsKeyAnnotationDirectory) {
            if (value.isEmpty()) {
                return CLIResult::error(CLIResult::Code::InvalidArguments,
                                        "Annotation directory cannot be empty");
            }
            editorSettings.saveAnnotationDirectory(value);
        } else if (key == EditorSettingsManager::kSettingsKeyDefaultClassId) {
            bool ok = false;
            const qint64 classId = value.toLongLong(&ok);
            if (!ok) {
                return CLIResult::error(CLIResult::Code::InvalidArguments,
                                        QString("Invalid class id: %1").arg(value));
            }
            editorSettings.saveDefaultClassId(classId);
        } else if (key == EditorSettingsManager::kSettingsKeyMaxHistorySize) {
            bool ok = false;
            const int size = value.toInt(&ok);
            if (!ok || size < 0) {
                return CLIResult::error(CLIResult::Code::InvalidArguments,
                                        QString("Invalid history size: %1").arg(value));
            }
            editorSettings.saveMaxHistorySize(size);
        } else {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    QString("Unknown setting: %1").arg(key));
        }
        return CLIResult::success(QString("Set %1 = %2").arg(key, value));
    }

    // --reset: Reset to defaults
    if (parser.isSet("reset")) {
        settings.clear();
        settings.sync();
        return CLIResult::success("Settings reset to defaults");
    }

    // --list, or no options
    QString output;
    QTextStream out(&output);
    out << "Current settings:\n";
    out << QString("  %1 = %2\n")
               .arg(EditorSettingsManager::kSettingsKeyAnnotationDirectory)
               .arg(editorSettings.loadAnnotationDirectory());
    out << QString("  %1 = %2\n")
               .arg(EditorSettingsManager::kSettingsKeyDefaultClassId)
               .arg(editorSettings.loadDefaultClassId());
    out << QString("  %1 = %2")
               .arg(EditorSettingsManager::kSettingsKeyMaxHistorySize)
               .arg(editorSettings.loadMaxHistorySize());
    out.flush();
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace BoxLabel
