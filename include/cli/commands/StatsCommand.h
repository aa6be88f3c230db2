#ifndef STATS_COMMAND_H
#define STATS_COMMAND_H

#include "cli/CLICommand.h"

namespace BoxLabel {
namespace CLI {

/**
 * @brief Summarize stored annotations per class
 */
class StatsCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;
};

} // namespace CLI
} // namespace BoxLabel

#endif // STATS_COMMAND_H
