#ifndef EXPORT_COMMAND_H
#define EXPORT_COMMAND_H

#include "cli/CLICommand.h"

namespace BoxLabel {
namespace CLI {

/**
 * @brief Write the normalized label lines of one image
 */
class ExportCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace BoxLabel

#endif // EXPORT_COMMAND_H
