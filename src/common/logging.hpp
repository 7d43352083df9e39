#pragma once

#include <string>

#include <QString>
#include <QtGlobal>

#include <nlohmann/json.hpp>

namespace treesnap::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

/**
 * Where and how event lines are written.
 *
 * An empty directory means $HOME/.local/share/treesnap/logs. A log file that
 * reaches maxFileBytes is moved aside to "<name>.1" before the next write;
 * zero disables rotation.
 */
struct LogSettings {
    QString directory;
    qint64 maxFileBytes = 5 * 1024 * 1024;
    bool trace = false;
};

// Call once early in main(); the settings can be refined later through
// applyLogSettings() once the collector config is known.
void initLogging(const QString &processName, const LogSettings &settings);
void applyLogSettings(const LogSettings &settings);
LogSettings currentLogSettings();

bool isTraceEnabled();

QString logFilePath();
QString traceFilePath();

// The snapshot run that events on this thread belong to.
struct RunContext {
    QString runId;
    std::string root;
    std::string mode;
};

RunContext currentRun();

class RunScope
{
public:
    explicit RunScope(RunContext run);
    ~RunScope();

    RunScope(const RunScope &) = delete;
    RunScope &operator=(const RunScope &) = delete;

private:
    RunContext m_prev;
};

// Writes one JSON line: timestamp, level, process, pid, the current run
// (when one is open), component, event name and the event fields.
void logEvent(LogLevel level,
              const char *component,
              const char *event,
              const nlohmann::json &fields = nlohmann::json::object());

} // namespace treesnap::logging

#define TSLOG_DEBUG(component, event, fields) \
    ::treesnap::logging::logEvent(::treesnap::logging::LogLevel::Debug, (component), (event), (fields))

#define TSLOG_INFO(component, event, fields) \
    ::treesnap::logging::logEvent(::treesnap::logging::LogLevel::Info, (component), (event), (fields))

#define TSLOG_WARN(component, event, fields) \
    ::treesnap::logging::logEvent(::treesnap::logging::LogLevel::Warn, (component), (event), (fields))

#define TSLOG_ERROR(component, event, fields) \
    ::treesnap::logging::logEvent(::treesnap::logging::LogLevel::Error, (component), (event), (fields))
