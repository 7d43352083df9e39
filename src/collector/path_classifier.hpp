#pragma once

#include <string>

#include "common/collector_config.hpp"
#include "common/enums.hpp"

namespace treesnap {

// Lowercased extension from the last '.', including the dot; empty when none.
std::string extensionOf(const std::string &filename);

Language languageForExtension(const std::string &extension);

/**
 * Decides which entries of a tree are visible in a snapshot and which of
 * them may carry content. All name checks are case-insensitive.
 */
class PathClassifier
{
public:
    explicit PathClassifier(CollectorConfig config);

    const CollectorConfig &config() const { return m_config; }

    // Exact match of a single directory name against ignoredDirectories.
    bool isIgnoredDirectory(const std::string &segment) const;

    // Denylisted name, secret-like name or binary extension.
    bool isIgnoredFile(const std::string &filename,
                       const std::string &relativePath) const;

    bool isSecretName(const std::string &filename) const;
    bool isBinaryName(const std::string &filename) const;

    // Textual allow-list. A file can be visible and still not be eligible.
    bool isEligibleForContent(const std::string &filename) const;

    // Output of an earlier run, e.g. snapshots/snapshot-20240101-120000.json.
    bool isSnapshotArtifact(const std::string &filename) const;

    Language languageFor(const std::string &filename) const;

private:
    CollectorConfig m_config;
};

} // namespace treesnap
