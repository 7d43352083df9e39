#pragma once

namespace treesnap {

enum class VcsStatus {
    Clean,
    Modified,
    Added,
    Deleted,
    Renamed,
    Untracked,
    Changed
};

enum class Language {
    Java,
    Kotlin,
    Scala,
    Groovy,
    Python,
    TypeScript,
    Tsx,
    JavaScript,
    Jsx,
    Markdown,
    Json,
    Yaml,
    Xml,
    Html,
    Css,
    Properties,
    Toml,
    Ini,
    Go,
    Rust,
    Ruby,
    C,
    Cpp,
    CMake,
    Shell,
    Text,
    Other,
    Unknown
};

enum class SnapshotMode {
    Full,
    Diff,
    Minimal
};

} // namespace treesnap
