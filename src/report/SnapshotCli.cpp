#include "report/SnapshotCli.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <QDateTime>
#include <QDir>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "collector/snapshot_assembler.hpp"
#include "common/collector_config.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "report/SnapshotWriter.hpp"

namespace treesnap {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  treesnap [ROOT] [--mode full|diff|minimal] [--config PATH] [--out DIR] [--trace]\n"
        "\n"
        "Without --mode an interactive menu asks for the mode.\n"
        "Reports are written to ROOT/snapshots unless --out is given.\n");
}

struct CliOptions {
    QString root;
    QString mode;
    QString configPath;
    QString outDir;
    bool help = false;
};

// Returns false on a usage error.
bool parseOptions(const QStringList &args, CliOptions &options)
{
    for (int i = 1; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QStringLiteral("--help") || arg == QStringLiteral("-h")) {
            options.help = true;
            continue;
        }
        if (arg == QStringLiteral("--trace")) {
            continue;
        }
        if (arg == QStringLiteral("--mode") || arg == QStringLiteral("--config")
            || arg == QStringLiteral("--out")) {
            if (i + 1 >= args.size()) {
                return false;
            }
            const QString value = args.at(++i);
            if (arg == QStringLiteral("--mode")) {
                options.mode = value.toLower();
            } else if (arg == QStringLiteral("--config")) {
                options.configPath = value;
            } else {
                options.outDir = value;
            }
            continue;
        }
        if (arg.startsWith(QStringLiteral("--")) || !options.root.isEmpty()) {
            return false;
        }
        options.root = arg;
    }
    return true;
}

} // namespace

SnapshotCli::SnapshotCli(std::shared_ptr<VcsCommandRunner> vcsRunner,
                         SelfPathProvider selfPath)
    : m_vcsRunner(std::move(vcsRunner))
    , m_selfPath(std::move(selfPath))
    , m_in(&std::cin)
{
}

SnapshotMode SnapshotCli::promptForMode()
{
    std::cout << "\nProject Snapshot Menu\n";
    std::cout << "1. All (full project contents: folders, files, code)\n";
    std::cout << "2. VCS diff (only changes, with full contents)\n";
    std::cout << "3. Minimal (structure + metadata only)\n";
    std::cout << "Choose mode [1/2/3]: " << std::flush;

    std::string line;
    std::getline(*m_in, line);
    const auto mode = parseModeString(
        QString::fromStdString(line).trimmed().toLower().toStdString());
    if (!mode.has_value()) {
        std::cout << "Invalid choice, defaulting to minimal." << std::endl;
        return SnapshotMode::Minimal;
    }
    return *mode;
}

int SnapshotCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    CliOptions options;
    if (!parseOptions(args, options)) {
        std::cerr << usageText().toStdString();
        return 1;
    }
    if (options.help) {
        std::cout << usageText().toStdString();
        return 0;
    }

    const QString runId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    const logging::RunScope configScope(logging::RunContext{runId, {}, {}});

    QString configPath = options.configPath;
    if (configPath.isEmpty()) {
        configPath = qEnvironmentVariable("TREESNAP_CONFIG");
    }

    CollectorConfig config = CollectorConfig::defaults();
    if (!configPath.isEmpty()) {
        try {
            config = loadCollectorConfig(configPath.toStdString());
        } catch (const std::runtime_error &ex) {
            std::cerr << "Error: " << ex.what() << std::endl;
            TSLOG_ERROR("SnapshotCli", "config_rejected",
                        (nlohmann::json{{"path", configPath.toStdString()},
                                        {"error", ex.what()}}));
            return 1;
        }
    }

    logging::LogSettings logSettings = logging::currentLogSettings();
    logSettings.directory = QString::fromStdString(config.logDirectory);
    logSettings.maxFileBytes = static_cast<qint64>(config.maxLogBytes);
    logging::applyLogSettings(logSettings);

    SnapshotMode mode = SnapshotMode::Minimal;
    if (!options.mode.isEmpty()) {
        const auto parsed = parseModeString(options.mode.toStdString());
        if (!parsed.has_value()) {
            std::cerr << "Invalid mode. Use full, diff or minimal." << std::endl;
            return 1;
        }
        mode = *parsed;
    } else {
        mode = promptForMode();
    }

    const QString root = options.root.isEmpty() ? QDir::currentPath() : options.root;
    const logging::RunScope runScope(
        logging::RunContext{runId, root.toStdString(), toModeString(mode)});
    TSLOG_INFO("SnapshotCli", "snapshot_requested",
               (nlohmann::json{{"configPath", configPath.toStdString()},
                               {"interactive", options.mode.isEmpty()}}));

    std::shared_ptr<VcsCommandRunner> runner = m_vcsRunner;
    if (!runner) {
        runner = std::make_shared<GitStatusRunner>(config.vcsProgram, config.vcsTimeoutMs);
    }

    const std::size_t maxTextBytes = config.maxTextReportBytesPerFile;
    SnapshotAssembler assembler(std::move(config), runner, m_selfPath);

    Snapshot snapshot;
    try {
        snapshot = assembler.collect(root.toStdString(), mode);
    } catch (const std::runtime_error &ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        TSLOG_ERROR("SnapshotCli", "snapshot_failed",
                    (nlohmann::json{{"error", ex.what()}}));
        return 1;
    }

    for (const auto &warning : assembler.warnings()) {
        std::cerr << "Warning: " << warning << std::endl;
    }

    std::cout << renderSnapshotIndex(snapshot) << std::flush;

    const QString outDir = options.outDir.isEmpty()
        ? QDir(QString::fromStdString(snapshot.rootPath)).filePath(QStringLiteral("snapshots"))
        : options.outDir;
    if (!QDir().mkpath(outDir)) {
        std::cerr << "Error: cannot create output directory " << outDir.toStdString()
                  << std::endl;
        return 1;
    }

    const QString timestamp =
        QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd-HHmmss"));
    const QString jsonOut =
        QDir(outDir).filePath(QStringLiteral("snapshot-") + timestamp + QStringLiteral(".json"));
    const QString txtOut =
        QDir(outDir).filePath(QStringLiteral("snapshot-") + timestamp + QStringLiteral(".txt"));

    // Bodies go into the text report only for full snapshots; diff snapshots
    // keep them in JSON.
    const bool includeBodies = mode == SnapshotMode::Full;
    if (!writeSnapshotJson(jsonOut, snapshot)
        || !writeSnapshotText(txtOut, snapshot, includeBodies, maxTextBytes)) {
        std::cerr << "Error: failed to write snapshot to " << outDir.toStdString()
                  << std::endl;
        TSLOG_ERROR("SnapshotCli", "snapshot_write_failed",
                    (nlohmann::json{{"outDir", outDir.toStdString()}}));
        return 1;
    }

    TSLOG_INFO("SnapshotCli", "snapshot_saved",
               (nlohmann::json{{"json", jsonOut.toStdString()},
                               {"text", txtOut.toStdString()},
                               {"files", snapshot.files.size()}}));

    std::cout << "Snapshot saved to " << jsonOut.toStdString() << "\n";
    std::cout << "Snapshot saved to " << txtOut.toStdString() << std::endl;
    return 0;
}

} // namespace treesnap
