#include "collector/snapshot_assembler.hpp"

#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace treesnap {

namespace {

std::filesystem::path normalizeRoot(const std::filesystem::path &root)
{
    std::error_code error;
    std::filesystem::path absolute = std::filesystem::absolute(root, error);
    if (error) {
        absolute = root;
    }
    absolute = absolute.lexically_normal();
    // "/a/b/" normalizes with an empty trailing component.
    if (!absolute.has_filename() && absolute.has_parent_path()
        && absolute != absolute.root_path()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

void validateRoot(const std::filesystem::path &root)
{
    std::error_code error;
    if (!std::filesystem::exists(root, error)) {
        throw std::runtime_error("root does not exist: " + root.string());
    }
    if (!std::filesystem::is_directory(root, error)) {
        throw std::runtime_error("root is not a directory: " + root.string());
    }

    std::filesystem::directory_iterator probe(root, error);
    if (error) {
        throw std::runtime_error("cannot read root directory " + root.string()
                                 + ": " + error.message());
    }
}

} // namespace

SnapshotAssembler::SnapshotAssembler(CollectorConfig config,
                                     std::shared_ptr<VcsCommandRunner> vcsRunner,
                                     SelfPathProvider selfPath)
    : m_classifier(std::move(config))
    , m_vcsRunner(std::move(vcsRunner))
    , m_walker(m_classifier, std::move(selfPath))
    , m_loader(m_classifier)
{
}

Snapshot SnapshotAssembler::collect(const std::filesystem::path &root, SnapshotMode mode)
{
    m_warnings.clear();

    const std::filesystem::path normalizedRoot = normalizeRoot(root);
    validateRoot(normalizedRoot);

    VcsStatusMap statuses;
    if (m_vcsRunner) {
        VcsStatusResult vcs = resolveVcsStatus(*m_vcsRunner, normalizedRoot);
        statuses = std::move(vcs.statuses);
        if (vcs.warning.has_value()) {
            m_warnings.push_back(*vcs.warning);
        }
    }

    WalkResult walked = m_walker.walk(normalizedRoot, statuses);
    for (auto &warning : walked.warnings) {
        m_warnings.push_back(std::move(warning));
    }

    Snapshot snapshot;
    snapshot.rootPath = normalizedRoot.string();
    snapshot.files.reserve(walked.files.size());

    const std::uintmax_t cap = contentCap(mode);
    size_t withContentCount = 0;
    for (const FileRecord &record : walked.files) {
        if (!wantsContent(mode, record)) {
            snapshot.files.push_back(record);
            continue;
        }
        auto content = m_loader.load(normalizedRoot / record.relativePath, cap);
        if (content.has_value()) {
            ++withContentCount;
        }
        snapshot.files.push_back(withContent(record, std::move(content)));
    }

    TSLOG_INFO("SnapshotAssembler", "snapshot_collected",
               (nlohmann::json{{"root", snapshot.rootPath},
                               {"mode", toModeString(mode)},
                               {"files", snapshot.files.size()},
                               {"withContent", withContentCount},
                               {"warnings", m_warnings.size()}}));
    return snapshot;
}

Snapshot SnapshotAssembler::collectFull(const std::filesystem::path &root)
{
    return collect(root, SnapshotMode::Full);
}

Snapshot SnapshotAssembler::collectDiff(const std::filesystem::path &root)
{
    return collect(root, SnapshotMode::Diff);
}

Snapshot SnapshotAssembler::collectMinimal(const std::filesystem::path &root)
{
    return collect(root, SnapshotMode::Minimal);
}

bool SnapshotAssembler::wantsContent(SnapshotMode mode, const FileRecord &record) const
{
    switch (mode) {
    case SnapshotMode::Full:
        return true;
    case SnapshotMode::Diff:
        return record.vcsStatus != VcsStatus::Clean
            && record.vcsStatus != VcsStatus::Deleted;
    case SnapshotMode::Minimal:
        return false;
    }
    return false;
}

std::uintmax_t SnapshotAssembler::contentCap(SnapshotMode mode) const
{
    if (mode == SnapshotMode::Diff) {
        return m_classifier.config().maxContentBytesDiff;
    }
    return m_classifier.config().maxContentBytesFull;
}

} // namespace treesnap
