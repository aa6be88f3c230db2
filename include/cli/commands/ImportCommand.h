#ifndef IMPORT_COMMAND_H
#define IMPORT_COMMAND_H

#include "cli/CLICommand.h"

namespace BoxLabel {
namespace CLI {

/**
 * @brief Load normalized label lines into the annotation store
 */
class ImportCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace BoxLabel

#endif // IMPORT_COMMAND_H
