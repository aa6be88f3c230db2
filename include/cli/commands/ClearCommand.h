#ifndef CLEAR_COMMAND_H
#define CLEAR_COMMAND_H

#include "cli/CLICommand.h"

namespace BoxLabel {
namespace CLI {

/**
 * @brief Remove the annotations of one image
 */
class ClearCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace BoxLabel

#endif // CLEAR_COMMAND_H
