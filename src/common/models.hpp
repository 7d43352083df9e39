#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/enums.hpp"

namespace treesnap {

struct FileRecord {
    std::string relativePath;
    std::string size;
    std::string modifiedAt;
    Language language = Language::Other;
    std::optional<std::string> content;
    VcsStatus vcsStatus = VcsStatus::Clean;
};

struct Snapshot {
    std::string rootPath;
    // Sorted by relativePath.
    std::vector<FileRecord> files;
};

// Records are never modified in place; these return an updated copy.
inline FileRecord withContent(const FileRecord &record,
                              std::optional<std::string> content)
{
    FileRecord updated = record;
    updated.content = std::move(content);
    return updated;
}

inline FileRecord withStatus(const FileRecord &record, VcsStatus status)
{
    FileRecord updated = record;
    updated.vcsStatus = status;
    return updated;
}

} // namespace treesnap
