#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace treesnap {

inline std::string toVcsStatusString(VcsStatus status)
{
    switch (status) {
    case VcsStatus::Clean:
        return "clean";
    case VcsStatus::Modified:
        return "modified";
    case VcsStatus::Added:
        return "added";
    case VcsStatus::Deleted:
        return "deleted";
    case VcsStatus::Renamed:
        return "renamed";
    case VcsStatus::Untracked:
        return "untracked";
    case VcsStatus::Changed:
        return "changed";
    }
    return "clean";
}

inline VcsStatus parseVcsStatusString(const std::string &value)
{
    if (value == "modified") {
        return VcsStatus::Modified;
    }
    if (value == "added") {
        return VcsStatus::Added;
    }
    if (value == "deleted") {
        return VcsStatus::Deleted;
    }
    if (value == "renamed") {
        return VcsStatus::Renamed;
    }
    if (value == "untracked") {
        return VcsStatus::Untracked;
    }
    if (value == "changed") {
        return VcsStatus::Changed;
    }
    return VcsStatus::Clean;
}

inline std::string toLanguageString(Language language)
{
    switch (language) {
    case Language::Java:
        return "Java";
    case Language::Kotlin:
        return "Kotlin";
    case Language::Scala:
        return "Scala";
    case Language::Groovy:
        return "Groovy";
    case Language::Python:
        return "Python";
    case Language::TypeScript:
        return "TypeScript";
    case Language::Tsx:
        return "TSX";
    case Language::JavaScript:
        return "JavaScript";
    case Language::Jsx:
        return "JSX";
    case Language::Markdown:
        return "Markdown";
    case Language::Json:
        return "JSON";
    case Language::Yaml:
        return "YAML";
    case Language::Xml:
        return "XML";
    case Language::Html:
        return "HTML";
    case Language::Css:
        return "CSS";
    case Language::Properties:
        return "Properties";
    case Language::Toml:
        return "TOML";
    case Language::Ini:
        return "INI";
    case Language::Go:
        return "Go";
    case Language::Rust:
        return "Rust";
    case Language::Ruby:
        return "Ruby";
    case Language::C:
        return "C";
    case Language::Cpp:
        return "C++";
    case Language::CMake:
        return "CMake";
    case Language::Shell:
        return "Shell";
    case Language::Text:
        return "Text";
    case Language::Other:
        return "Other";
    case Language::Unknown:
        return "unknown";
    }
    return "Other";
}

inline Language parseLanguageString(const std::string &value)
{
    static const Language all[] = {
        Language::Java, Language::Kotlin, Language::Scala, Language::Groovy,
        Language::Python, Language::TypeScript, Language::Tsx,
        Language::JavaScript, Language::Jsx, Language::Markdown, Language::Json,
        Language::Yaml, Language::Xml, Language::Html, Language::Css,
        Language::Properties, Language::Toml, Language::Ini, Language::Go,
        Language::Rust, Language::Ruby, Language::C, Language::Cpp,
        Language::CMake, Language::Shell, Language::Text, Language::Unknown,
    };
    for (Language language : all) {
        if (toLanguageString(language) == value) {
            return language;
        }
    }
    return Language::Other;
}

inline std::string toModeString(SnapshotMode mode)
{
    switch (mode) {
    case SnapshotMode::Full:
        return "full";
    case SnapshotMode::Diff:
        return "diff";
    case SnapshotMode::Minimal:
        return "minimal";
    }
    return "minimal";
}

// Accepts the mode names as well as the menu numbers 1, 2 and 3.
inline std::optional<SnapshotMode> parseModeString(const std::string &value)
{
    if (value == "full" || value == "all" || value == "1") {
        return SnapshotMode::Full;
    }
    if (value == "diff" || value == "2") {
        return SnapshotMode::Diff;
    }
    if (value == "minimal" || value == "3") {
        return SnapshotMode::Minimal;
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const VcsStatus &status)
{
    j = toVcsStatusString(status);
}

inline void from_json(const nlohmann::json &j, VcsStatus &status)
{
    if (j.is_string()) {
        status = parseVcsStatusString(j.get<std::string>());
    } else {
        status = VcsStatus::Clean;
    }
}

inline void to_json(nlohmann::json &j, const Language &language)
{
    j = toLanguageString(language);
}

inline void from_json(const nlohmann::json &j, Language &language)
{
    if (j.is_string()) {
        language = parseLanguageString(j.get<std::string>());
    } else {
        language = Language::Other;
    }
}

inline void to_json(nlohmann::json &j, const FileRecord &record)
{
    j = nlohmann::json{
        {"relativePath", record.relativePath},
        {"size", record.size},
        {"modified", record.modifiedAt},
        {"language", record.language},
        {"content", record.content.has_value() ? nlohmann::json(*record.content)
                                               : nlohmann::json(nullptr)},
        {"vcsStatus", record.vcsStatus}
    };
}

inline void from_json(const nlohmann::json &j, FileRecord &record)
{
    record.relativePath = j.value("relativePath", "");
    record.size = j.value("size", "?");
    record.modifiedAt = j.value("modified", "?");
    if (j.contains("language")) {
        record.language = j.at("language").get<Language>();
    } else {
        record.language = Language::Other;
    }
    if (j.contains("content") && j.at("content").is_string()) {
        record.content = j.at("content").get<std::string>();
    } else {
        record.content.reset();
    }
    if (j.contains("vcsStatus")) {
        record.vcsStatus = j.at("vcsStatus").get<VcsStatus>();
    } else {
        record.vcsStatus = VcsStatus::Clean;
    }
}

inline void to_json(nlohmann::json &j, const Snapshot &snapshot)
{
    j = nlohmann::json{
        {"rootPath", snapshot.rootPath},
        {"files", snapshot.files}
    };
}

inline void from_json(const nlohmann::json &j, Snapshot &snapshot)
{
    snapshot.rootPath = j.value("rootPath", "");
    if (j.contains("files") && j.at("files").is_array()) {
        snapshot.files = j.at("files").get<std::vector<FileRecord>>();
    } else {
        snapshot.files.clear();
    }
}

} // namespace treesnap
