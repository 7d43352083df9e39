#include <QCoreApplication>

#include "common/logging.hpp"
#include "report/SnapshotCli.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("treesnap"));

    bool trace = qEnvironmentVariableIntValue("TREESNAP_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    treesnap::logging::LogSettings settings;
    settings.trace = trace;
    treesnap::logging::initLogging(QStringLiteral("treesnap"), settings);
    TSLOG_INFO("main", "cli_start",
               (nlohmann::json{{"args", argc - 1}, {"trace", trace}}));

    // SnapshotCli handles argument parsing, collection and output.
    treesnap::SnapshotCli cli;
    return cli.run(argc, argv);
}
