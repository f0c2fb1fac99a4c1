#include <QCoreApplication>

#include <vector>

#include "cli/BasmCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("basmgr"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    basmgr::ToolConfig config = basmgr::ToolConfig::fromEnvironment();

    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            config.traceEnabled = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    basmgr::logging::initLogging(QStringLiteral("basmgr"), config.traceEnabled);
    BLOG_DEBUG(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("config_resolved"),
               QStringLiteral("startup"),
               QStringLiteral("environment"),
               basmgr::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"rcFile", config.rcFile.toStdString()},
                               {"sudoersPath", config.sudoersPath.toStdString()},
                               {"backupDir", config.backupDir.toStdString()},
                               {"validator", config.validatorProgram.toStdString()},
                               {"backupRcOnWrite", config.backupRcOnWrite}}));

    basmgr::BasmCli cli(config);
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
