#include <QCoreApplication>

#include "cli/RegdeltaCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    regdelta::AppConfig config = regdelta::AppConfig::fromEnvironment();
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            config.traceEnabled = true;
        }
    }

    regdelta::logging::initLogging(QStringLiteral("regdelta"),
                                   config.logDir,
                                   config.traceEnabled);
    RLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("cli_start"),
              (nlohmann::json{{"args", argc - 1},
                              {"data_dir", config.dataDir.toStdString()}}));

    regdelta::RegdeltaCli cli(config);
    return cli.run(argc, argv);
}
