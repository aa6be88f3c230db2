#include "cli/CLIHandler.h"

#include "cli/StoreOptionsHelper.h"
#include "cli/commands/ClearCommand.h"
#include "cli/commands/ConfigCommand.h"
#include "cli/commands/ExportCommand.h"
#include "cli/commands/ImportCommand.h"
#include "cli/commands/StatsCommand.h"
#include "version.h"

#include <QCommandLineParser>
#include <QTextStream>

namespace BoxLabel {
namespace CLI {

CLIHandler::CLIHandler()
{
    registerCommand(std::make_unique<ExportCommand>());
    registerCommand(std::make_unique<ImportCommand>());
    registerCommand(std::make_unique<StatsCommand>());
    registerCommand(std::make_unique<ClearCommand>());
    registerCommand(std::make_unique<ConfigCommand>());
}

CLIHandler::~CLIHandler() = default;

void CLIHandler::registerCommand(CLICommandPtr command)
{
    const QString key = command->name();
    m_commands[key] = std::move(command);
}

CLIResult CLIHandler::process(const QStringList& arguments)
{
    if (arguments.size() < 2) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, getHelpText());
    }

    const QString& first = arguments.at(1);
    if (first == "--help" || first == "-h") {
        return CLIResult::success(getHelpText());
    }
    if (first == "--version" || first == "-v") {
        return CLIResult::success(getVersionText());
    }

    CLICommand* command = findCommand(first);
    if (!command) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Unknown command: %1\n\n%2").arg(first, getHelpText()));
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(command->description());
    parser.addHelpOption();
    if (command->usesAnnotationStore()) {
        addStorageDirOption(parser);
    }
    command->setupOptions(parser);

    // Parser expects "<program> [options]"
    QStringList commandArgs = arguments;
    commandArgs.removeAt(1);

    if (!parser.parse(commandArgs)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, parser.errorText());
    }
    if (parser.isSet("help")) {
        return CLIResult::success(parser.helpText());
    }

    return command->execute(parser);
}

CLICommand* CLIHandler::findCommand(const QString& name) const
{
    auto it = m_commands.find(name.toLower());
    return it != m_commands.end() ? it->second.get() : nullptr;
}

QStringList CLIHandler::commandNames() const
{
    QStringList names;
    for (const auto& entry : m_commands) {
        names.append(entry.first);
    }
    return names;
}

QString CLIHandler::getHelpText() const
{
    QString help;
    QTextStream out(&help);

    out << "BoxLabel - bounding box annotation tool\n\n";
    out << "Usage: boxlabel <command> [options]\n\n";
    out << "Commands:\n";
    for (const auto& [name, command] : m_commands) {
        out << QString("  %1  %2\n").arg(name, -10).arg(command->description());
    }
    out << "\nOptions:\n";
    out << "  -h, --help     Show this help\n";
    out << "  -v, --version  Show the version\n";
    out << "\nRun 'boxlabel <command> --help' for the options of a command.\n";
    out.flush();

    return help;
}

QString CLIHandler::getVersionText() { return QString("BoxLabel version %1").arg(BOXLABEL_VERSION); }

} // namespace CLI
} // namespace BoxLabel
