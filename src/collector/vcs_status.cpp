#include "collector/vcs_status.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <QProcess>
#include <QProcessEnvironment>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace treesnap {

namespace {

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string normalizeStatusPath(std::string path)
{
    // Renames are reported as "old -> new"; the new path is the one on disk.
    const std::string arrow = " -> ";
    const auto arrowPos = path.find(arrow);
    if (arrowPos != std::string::npos) {
        path = trim(path.substr(arrowPos + arrow.size()));
    }

    if (path.size() >= 2 && path.front() == '"' && path.back() == '"') {
        path = path.substr(1, path.size() - 2);
    }

    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

} // namespace

GitStatusRunner::GitStatusRunner(std::string program, int timeoutMs)
    : m_program(std::move(program))
    , m_timeoutMs(timeoutMs)
{
}

std::optional<std::vector<std::string>> GitStatusRunner::statusLines(
    const std::filesystem::path &root)
{
    QProcess process;
    process.setWorkingDirectory(QString::fromStdString(root.string()));

    // Status is read-only; keep git from refreshing the index lock.
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("GIT_OPTIONAL_LOCKS"), QStringLiteral("0"));
    process.setProcessEnvironment(env);

    // Without --untracked-files=all a new directory is one "?? dir/" line and
    // the files inside it would be reported clean.
    process.start(QString::fromStdString(m_program),
                  {QStringLiteral("status"), QStringLiteral("--porcelain"),
                   QStringLiteral("--untracked-files=all")});
    if (!process.waitForStarted(m_timeoutMs)) {
        return std::nullopt;
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(m_timeoutMs)) {
        process.kill();
        process.waitForFinished();
        return std::nullopt;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        return std::nullopt;
    }

    const QString output = QString::fromUtf8(process.readAllStandardOutput());
    std::vector<std::string> lines;
    for (const QString &line : output.split(QChar('\n'), Qt::SkipEmptyParts)) {
        lines.push_back(line.toStdString());
    }
    return lines;
}

VcsStatus decodeVcsStatusCode(const std::string &code)
{
    if (code == "M") {
        return VcsStatus::Modified;
    }
    if (code == "A") {
        return VcsStatus::Added;
    }
    if (code == "D") {
        return VcsStatus::Deleted;
    }
    if (code == "R") {
        return VcsStatus::Renamed;
    }
    if (code == "??") {
        return VcsStatus::Untracked;
    }
    return VcsStatus::Changed;
}

VcsStatusMap parseVcsStatusLines(const std::vector<std::string> &lines)
{
    VcsStatusMap statuses;
    for (const auto &rawLine : lines) {
        std::string line = rawLine;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() <= 3) {
            continue;
        }

        const std::string code = trim(line.substr(0, 2));
        if (code.empty()) {
            continue;
        }
        const std::string path = normalizeStatusPath(trim(line.substr(3)));
        if (path.empty()) {
            continue;
        }
        statuses[path] = decodeVcsStatusCode(code);
    }
    return statuses;
}

VcsStatusResult resolveVcsStatus(VcsCommandRunner &runner,
                                 const std::filesystem::path &root)
{
    VcsStatusResult result;

    const auto lines = runner.statusLines(root);
    if (!lines.has_value()) {
        result.warning = "Version control not available or not a repository; "
                         "all files reported as clean.";
        TSLOG_WARN("VcsStatus", "vcs_unavailable",
               (nlohmann::json{{"root", root.string()}}));
        return result;
    }

    result.statuses = parseVcsStatusLines(*lines);
    TSLOG_DEBUG("VcsStatus", "vcs_status_parsed",
                (nlohmann::json{{"lines", lines->size()},
                                {"entries", result.statuses.size()}}));
    return result;
}

} // namespace treesnap
