#ifndef CLI_COMMAND_H
#define CLI_COMMAND_H

#include "CLIResult.h"

#include <QCommandLineParser>
#include <QString>
#include <memory>

namespace BoxLabel {
namespace CLI {

/**
 * @brief One "boxlabel <name>" subcommand.
 *
 * The handler creates a fresh parser per invocation, adds --help (and
 * --dir when usesAnnotationStore() is true), then calls setupOptions()
 * and execute().
 */
class CLICommand
{
public:
    virtual ~CLICommand() = default;

    virtual QString name() const = 0;

    // One line, shown in the command list
    virtual QString description() const = 0;

    virtual void setupOptions(QCommandLineParser& parser) = 0;
    virtual CLIResult execute(const QCommandLineParser& parser) = 0;

    // Commands that read or write annotation files get the shared --dir option
    virtual bool usesAnnotationStore() const { return true; }
};

using CLICommandPtr = std::unique_ptr<CLICommand>;

} // namespace CLI
} // namespace BoxLabel

#endif // CLI_COMMAND_H
