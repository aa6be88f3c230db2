#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "CLICommand.h"
#include "CLIResult.h"

#include <QString>
#include <QStringList>
#include <map>
#include <memory>

namespace BoxLabel {
namespace CLI {

/**
 * @brief Dispatches "boxlabel <command> [options]" to registered commands.
 *
 * Commands run in-process against the annotation directory; there is no
 * long-running instance to talk to.
 */
class CLIHandler
{
public:
    CLIHandler();
    ~CLIHandler();

    // arguments includes the program name, as QCoreApplication::arguments() does
    CLIResult process(const QStringList& arguments);

    QStringList commandNames() const;
    QString getHelpText() const;
    static QString getVersionText();

private:
    void registerCommand(CLICommandPtr command);
    CLICommand* findCommand(const QString& name) const;

    std::map<QString, CLICommandPtr> m_commands;
};

} // namespace CLI
} // namespace BoxLabel

#endif // CLI_HANDLER_H
