#pragma once

#include <cstddef>
#include <string>

#include <QString>

#include "common/models.hpp"

namespace treesnap {

// One line per file: " - path | language | size | modified ... | vcs: ...".
std::string renderSnapshotIndex(const Snapshot &snapshot);

// Plain-text report. Bodies are written only when includeContents is set,
// each truncated to maxBytesPerFile.
std::string renderSnapshotText(const Snapshot &snapshot,
                               bool includeContents,
                               std::size_t maxBytesPerFile);

bool writeSnapshotJson(const QString &path, const Snapshot &snapshot);
bool writeSnapshotText(const QString &path, const Snapshot &snapshot,
                       bool includeContents, std::size_t maxBytesPerFile);

} // namespace treesnap
