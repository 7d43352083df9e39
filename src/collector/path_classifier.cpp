#include "collector/path_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace treesnap {

namespace {

std::string toLower(std::string value)
{
    for (auto &ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

bool endsWith(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool startsWith(const std::string &value, const std::string &prefix)
{
    return value.rfind(prefix, 0) == 0;
}

bool contains(const std::vector<std::string> &values, const std::string &value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

std::string extensionOf(const std::string &filename)
{
    const auto dot = filename.find_last_of('.');
    if (dot == std::string::npos) {
        return {};
    }
    return toLower(filename.substr(dot));
}

Language languageForExtension(const std::string &extension)
{
    static const std::unordered_map<std::string, Language> table = {
        {".java", Language::Java},
        {".kt", Language::Kotlin},
        {".kts", Language::Kotlin},
        {".scala", Language::Scala},
        {".groovy", Language::Groovy},
        {".py", Language::Python},
        {".ts", Language::TypeScript},
        {".tsx", Language::Tsx},
        {".js", Language::JavaScript},
        {".jsx", Language::Jsx},
        {".md", Language::Markdown},
        {".json", Language::Json},
        {".yml", Language::Yaml},
        {".yaml", Language::Yaml},
        {".xml", Language::Xml},
        {".html", Language::Html},
        {".htm", Language::Html},
        {".css", Language::Css},
        {".properties", Language::Properties},
        {".toml", Language::Toml},
        {".ini", Language::Ini},
        {".go", Language::Go},
        {".rs", Language::Rust},
        {".rb", Language::Ruby},
        {".c", Language::C},
        {".h", Language::C},
        {".cc", Language::Cpp},
        {".cpp", Language::Cpp},
        {".cxx", Language::Cpp},
        {".hpp", Language::Cpp},
        {".hh", Language::Cpp},
        {".cmake", Language::CMake},
        {".sh", Language::Shell},
        {".txt", Language::Text},
    };

    const auto it = table.find(toLower(extension));
    if (it == table.end()) {
        return Language::Other;
    }
    return it->second;
}

PathClassifier::PathClassifier(CollectorConfig config)
    : m_config(std::move(config))
{
}

bool PathClassifier::isIgnoredDirectory(const std::string &segment) const
{
    return contains(m_config.ignoredDirectories, toLower(segment));
}

bool PathClassifier::isIgnoredFile(const std::string &filename,
                                   const std::string &relativePath) const
{
    const std::string name = toLower(filename);
    if (contains(m_config.ignoredFiles, name)) {
        return true;
    }

    // Entries with a separator name a file by its position in the tree.
    const std::string lowerPath = toLower(relativePath);
    for (const auto &entry : m_config.ignoredFiles) {
        if (entry.find('/') == std::string::npos) {
            continue;
        }
        if (lowerPath == entry || endsWith(lowerPath, "/" + entry)) {
            return true;
        }
    }

    return isBinaryName(filename) || isSecretName(filename);
}

bool PathClassifier::isSecretName(const std::string &filename) const
{
    const std::string name = toLower(filename);
    for (const auto &pattern : m_config.secretNamePatterns) {
        if (!pattern.empty() && name.find(pattern) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool PathClassifier::isBinaryName(const std::string &filename) const
{
    const std::string name = toLower(filename);
    for (const auto &ext : m_config.binaryExtensions) {
        if (!ext.empty() && endsWith(name, ext)) {
            return true;
        }
    }
    return false;
}

bool PathClassifier::isEligibleForContent(const std::string &filename) const
{
    const std::string ext = extensionOf(filename);
    return !ext.empty() && contains(m_config.textExtensions, ext);
}

bool PathClassifier::isSnapshotArtifact(const std::string &filename) const
{
    if (m_config.snapshotArtifactPrefix.empty()) {
        return false;
    }

    const std::string name = toLower(filename);
    if (!startsWith(name, m_config.snapshotArtifactPrefix)) {
        return false;
    }
    for (const auto &ext : m_config.snapshotArtifactExtensions) {
        if (endsWith(name, ext)) {
            return true;
        }
    }
    return false;
}

Language PathClassifier::languageFor(const std::string &filename) const
{
    return languageForExtension(extensionOf(filename));
}

} // namespace treesnap
