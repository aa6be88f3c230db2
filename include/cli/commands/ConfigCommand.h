#ifndef CONFIG_COMMAND_H
#define CONFIG_COMMAND_H

#include "cli/CLICommand.h"

namespace BoxLabel {
namespace CLI {

// Reads and writes the editor keys in the BoxLabel settings store

class ConfigCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
    bool usesAnnotationStore() const override { return false; }
};

} // namespace CLI
} // namespace BoxLabel

#endif // CONFIG_COMMAND_H
