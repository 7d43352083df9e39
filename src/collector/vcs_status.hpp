#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/enums.hpp"

namespace treesnap {

// Relative, forward-slash path -> change kind. Paths not present are clean.
using VcsStatusMap = std::unordered_map<std::string, VcsStatus>;

/**
 * Runs the version-control status query for a root directory.
 *
 * Returns the raw output lines, or std::nullopt when the tool is missing,
 * the root is not under version control, or the command did not finish.
 */
class VcsCommandRunner
{
public:
    virtual ~VcsCommandRunner() = default;

    virtual std::optional<std::vector<std::string>> statusLines(
        const std::filesystem::path &root) = 0;
};

// Runs `<program> status --porcelain --untracked-files=all` in the root
// through QProcess. A run longer than timeoutMs is killed and reported as
// unavailable.
class GitStatusRunner : public VcsCommandRunner
{
public:
    explicit GitStatusRunner(std::string program = "git", int timeoutMs = 30000);

    std::optional<std::vector<std::string>> statusLines(
        const std::filesystem::path &root) override;

private:
    std::string m_program;
    int m_timeoutMs;
};

struct VcsStatusResult {
    VcsStatusMap statuses;
    // Set when the status could not be determined; every file then reports clean.
    std::optional<std::string> warning;
};

// Maps a porcelain status code ("M", "??", "R", ...) to a change kind.
VcsStatus decodeVcsStatusCode(const std::string &code);

VcsStatusMap parseVcsStatusLines(const std::vector<std::string> &lines);

VcsStatusResult resolveVcsStatus(VcsCommandRunner &runner,
                                 const std::filesystem::path &root);

} // namespace treesnap
