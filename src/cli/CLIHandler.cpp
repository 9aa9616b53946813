#include "cli/CLIHandler.h"

#include "version.h"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace Waysnip {
namespace CLI {

CLIResult CLIHandler::process(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Select a screen region and copy or save it.\n"
                       "Predefined regions (\"x1,y1 x2,y2\" per line) are read from stdin when piped."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    const QCommandLineOption noStdinOption(
        QStringLiteral("no-stdin-regions"),
        QStringLiteral("Do not read predefined regions from stdin."));
    parser.addOption(noStdinOption);

    if (!parser.parse(arguments)) {
        return CLIResult::error(CLIResult::Code::InvalidArguments,
                                parser.errorText() + QStringLiteral("\n\n") + parser.helpText());
    }

    if (parser.isSet(helpOption)) {
        return CLIResult::exitWith(parser.helpText());
    }
    if (parser.isSet(versionOption)) {
        return CLIResult::exitWith(getVersionText());
    }
    if (!parser.positionalArguments().isEmpty()) {
        return CLIResult::error(
            CLIResult::Code::InvalidArguments,
            QString("Unexpected argument: %1\n\n%2").arg(parser.positionalArguments().first(),
                                                         parser.helpText()));
    }

    CLIOptions options;
    options.readStdinRegions = !parser.isSet(noStdinOption);
    return CLIResult::run(options);
}

QString CLIHandler::getVersionText() { return QString("Waysnip version %1").arg(WAYSNIP_VERSION); }

} // namespace CLI
} // namespace Waysnip
