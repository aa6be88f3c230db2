#include <QCoreApplication>
#include <QTextStream>
#include <cstdio>

#include "cli/CLIHandler.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName(BOXLABEL_APP_NAME);
    app.setOrganizationName("BoxLabel");
    app.setApplicationVersion(BOXLABEL_VERSION);

    BoxLabel::CLI::CLIHandler handler;
    const BoxLabel::CLI::CLIResult result = handler.process(app.arguments());

    if (!result.data.isEmpty()) {
        fwrite(result.data.constData(), 1, static_cast<size_t>(result.data.size()), stdout);
        fflush(stdout);
    }

    if (!result.message.isEmpty()) {
        QTextStream stream(result.isSuccess() ? stdout : stderr);
        stream << result.message << Qt::endl;
    }

    return static_cast<int>(result.code);
}
