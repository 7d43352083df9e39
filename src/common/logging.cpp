#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <cstdio>
#include <mutex>
#include <utility>

namespace treesnap::logging {

namespace {

std::mutex g_logMutex;
QString g_processName;
LogSettings g_settings;

thread_local RunContext t_run;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

QString processName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("treesnap");
}

QString logDirectory()
{
    if (!g_settings.directory.isEmpty()) {
        return g_settings.directory;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/treesnap/logs");
    }
    return home + QStringLiteral("/.local/share/treesnap/logs");
}

// Caller holds g_logMutex.
void appendLine(const QString &path, const QByteArray &line)
{
    const QFileInfo info(path);
    if (g_settings.maxFileBytes > 0 && info.exists()
        && info.size() + line.size() > g_settings.maxFileBytes) {
        const QString rotated = path + QStringLiteral(".1");
        QFile::remove(rotated);
        QFile::rename(path, rotated);
    }

    QDir().mkpath(info.absolutePath());
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

} // namespace

void initLogging(const QString &name, const LogSettings &settings)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = name;
    g_settings = settings;
}

void applyLogSettings(const LogSettings &settings)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_settings = settings;
}

LogSettings currentLogSettings()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_settings;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_settings.trace;
}

QString logFilePath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return QDir(logDirectory()).filePath(processName() + QStringLiteral(".log"));
}

QString traceFilePath()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return QDir(logDirectory()).filePath(processName() + QStringLiteral("-trace.log"));
}

RunContext currentRun()
{
    return t_run;
}

RunScope::RunScope(RunContext run)
    : m_prev(std::move(t_run))
{
    t_run = std::move(run);
}

RunScope::~RunScope()
{
    t_run = std::move(m_prev);
}

void logEvent(LogLevel level,
              const char *component,
              const char *event,
              const nlohmann::json &fields)
{
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"pid", QCoreApplication::applicationPid()},
        {"component", component},
        {"event", event},
    };
    if (!t_run.runId.isEmpty()) {
        payload["run"] = t_run.runId.toStdString();
    }
    if (!t_run.root.empty()) {
        payload["root"] = t_run.root;
    }
    if (!t_run.mode.empty()) {
        payload["mode"] = t_run.mode;
    }
    payload["fields"] = fields;

    std::lock_guard<std::mutex> lock(g_logMutex);
    payload["process"] = processName().toStdString();

    // Paths from the walked tree may carry bytes that are not valid UTF-8.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QDir dir(logDirectory());
    if (level != LogLevel::Debug || g_settings.trace) {
        appendLine(dir.filePath(processName() + QStringLiteral(".log")), line);
    }
    if (g_settings.trace) {
        appendLine(dir.filePath(processName() + QStringLiteral("-trace.log")), line);
    }
}

} // namespace treesnap::logging
