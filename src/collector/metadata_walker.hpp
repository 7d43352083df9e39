#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "collector/path_classifier.hpp"
#include "collector/vcs_status.hpp"
#include "common/models.hpp"

namespace treesnap {

// Returns the location of the running collector, or an empty path if unknown.
using SelfPathProvider = std::function<std::filesystem::path()>;

SelfPathProvider defaultSelfPath();

// 512 -> "512 B", 1536 -> "1.5 KB", 1048576 -> "1 MB".
std::string humanReadableByteCount(std::uintmax_t bytes);

/**
 * Builds the metadata record for one file below root. Content is left empty
 * and the status is clean. If the file attributes cannot be read, size and
 * modification time are "?" and the language is unknown.
 */
FileRecord makeFileRecord(const std::filesystem::path &root,
                          const std::filesystem::path &path,
                          const PathClassifier &classifier);

struct WalkResult {
    std::vector<FileRecord> files;
    std::vector<std::string> warnings;
};

class MetadataWalker
{
public:
    MetadataWalker(const PathClassifier &classifier, SelfPathProvider selfPath);

    /**
     * Enumerates the regular files below root in a single pass.
     *
     * Ignored directories and the running collector are pruned without being
     * entered. Records carry the status from `statuses` and are sorted by
     * relative path. Throws std::runtime_error if root cannot be listed.
     */
    WalkResult walk(const std::filesystem::path &root,
                    const VcsStatusMap &statuses) const;

private:
    bool isSelf(const std::filesystem::path &candidate,
                const std::filesystem::path &self) const;

    const PathClassifier &m_classifier;
    SelfPathProvider m_selfPath;
};

} // namespace treesnap
