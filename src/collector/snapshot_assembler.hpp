#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "collector/content_loader.hpp"
#include "collector/metadata_walker.hpp"
#include "collector/path_classifier.hpp"
#include "collector/vcs_status.hpp"
#include "common/collector_config.hpp"
#include "common/models.hpp"

namespace treesnap {

/**
 * Produces a Snapshot of a source tree in one of three modes:
 * - Full: content for every eligible file
 * - Diff: content only for files the VCS reports as changed
 * - Minimal: metadata only
 *
 * Every mode runs one VCS status query and one traversal; the mode only
 * decides which records get content attached.
 */
class SnapshotAssembler
{
public:
    SnapshotAssembler(CollectorConfig config,
                      std::shared_ptr<VcsCommandRunner> vcsRunner,
                      SelfPathProvider selfPath = defaultSelfPath());

    SnapshotAssembler(const SnapshotAssembler &) = delete;
    SnapshotAssembler &operator=(const SnapshotAssembler &) = delete;

    // Throws std::runtime_error if root is missing, not a directory or unreadable.
    Snapshot collect(const std::filesystem::path &root, SnapshotMode mode);

    Snapshot collectFull(const std::filesystem::path &root);
    Snapshot collectDiff(const std::filesystem::path &root);
    Snapshot collectMinimal(const std::filesystem::path &root);

    // Non-fatal notices from the last collect() call.
    const std::vector<std::string> &warnings() const { return m_warnings; }

    const PathClassifier &classifier() const { return m_classifier; }

private:
    bool wantsContent(SnapshotMode mode, const FileRecord &record) const;
    std::uintmax_t contentCap(SnapshotMode mode) const;

    PathClassifier m_classifier;
    std::shared_ptr<VcsCommandRunner> m_vcsRunner;
    MetadataWalker m_walker;
    ContentLoader m_loader;
    std::vector<std::string> m_warnings;
};

} // namespace treesnap
