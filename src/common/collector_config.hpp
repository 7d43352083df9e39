#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace treesnap {

/**
 * Classification lists and limits used by a collection run.
 *
 * The defaults cover the common build, VCS and IDE layouts. Every field can
 * be overridden from a JSON file; see loadCollectorConfig().
 */
struct CollectorConfig {
    std::vector<std::string> ignoredDirectories;
    std::vector<std::string> ignoredFiles;
    std::vector<std::string> secretNamePatterns;
    std::vector<std::string> binaryExtensions;
    std::vector<std::string> textExtensions;

    // Content caps are exclusive: a file of exactly this size gets no content.
    std::uintmax_t maxContentBytesFull = 200 * 1024;
    std::uintmax_t maxContentBytesDiff = 200 * 1024;
    std::size_t maxTextReportBytesPerFile = 500 * 1024;

    std::string snapshotArtifactPrefix = "snapshot-";
    std::vector<std::string> snapshotArtifactExtensions;

    std::string vcsProgram = "git";
    int vcsTimeoutMs = 30000;

    // Empty: $HOME/.local/share/treesnap/logs.
    std::string logDirectory;
    std::uintmax_t maxLogBytes = 5 * 1024 * 1024;

    static CollectorConfig defaults();
};

// Overlays the recognized keys of `json` onto `config`.
// Throws std::runtime_error when a recognized key has the wrong type.
void applyConfigJson(CollectorConfig &config, const nlohmann::json &json);

// Reads a JSON config file on top of CollectorConfig::defaults().
// Throws std::runtime_error if the file is missing or malformed.
CollectorConfig loadCollectorConfig(const std::filesystem::path &path);

} // namespace treesnap
