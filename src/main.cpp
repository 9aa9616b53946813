#include <QApplication>
#include <QTextStream>

#include "MainApplication.h"
#include "cli/CLIHandler.h"
#include "cli/PredefinedRegionReader.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName(WAYSNIP_APP_NAME);
    app.setOrganizationName("Waysnip");
    app.setApplicationVersion(WAYSNIP_VERSION);

    const auto cli = Waysnip::CLI::CLIHandler::process(app.arguments());
    if (cli.exitRequested) {
        QTextStream out(cli.isSuccess() ? stdout : stderr);
        out << cli.message << Qt::endl;
        return cli.exitCode();
    }

    MainApplication mainApp;
    if (cli.options.readStdinRegions) {
        mainApp.setPredefinedRegions(
            Waysnip::CLI::PredefinedRegionReader::readFromStdinIfPiped().regions);
    }

    if (!mainApp.initialize()) {
        return 1;
    }

    return app.exec();
}
