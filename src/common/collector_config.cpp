#include "common/collector_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>

#include <QtGlobal>

#include "common/logging.hpp"

namespace treesnap {

namespace {

std::string toLower(std::string value)
{
    for (auto &ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

std::vector<std::string> readStringList(const nlohmann::json &json,
                                        const std::string &key)
{
    const auto &value = json.at(key);
    if (!value.is_array()) {
        throw std::runtime_error("config key '" + key + "' must be an array of strings");
    }

    std::vector<std::string> result;
    result.reserve(value.size());
    for (const auto &item : value) {
        if (!item.is_string()) {
            throw std::runtime_error("config key '" + key + "' must be an array of strings");
        }
        result.push_back(toLower(item.get<std::string>()));
    }
    return result;
}

std::uintmax_t readByteCount(const nlohmann::json &value, const std::string &key)
{
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<long long>() >= 0)) {
        throw std::runtime_error("config key '" + key + "' must be a non-negative integer");
    }
    return value.get<std::uintmax_t>();
}

const std::vector<std::string> &recognizedKeys()
{
    static const std::vector<std::string> keys = {
        "ignoredDirectories",
        "ignoredFiles",
        "secretNamePatterns",
        "binaryExtensions",
        "textExtensions",
        "maxContentBytes",
        "maxTextReportBytesPerFile",
        "snapshotArtifactPrefix",
        "snapshotArtifactExtensions",
        "vcsProgram",
        "vcsTimeoutMs",
        "logDirectory",
        "maxLogBytes",
    };
    return keys;
}

} // namespace

CollectorConfig CollectorConfig::defaults()
{
    CollectorConfig config;
    config.ignoredDirectories = {
        ".git", ".svn", ".hg", ".idea", ".vscode", ".gradle", ".mvn",
        "snapshots", "target", "build", "out", "node_modules", "nbproject",
        "nbbuild", "dist", "__pycache__", "cmake-build-debug",
        "cmake-build-release",
    };
    config.ignoredFiles = {
        "mvnw", "mvnw.cmd", "gradlew", "gradlew.bat", "snapshot.json",
        "treesnap", "treesnap.exe",
    };
    config.secretNamePatterns = {
        ".env", "secrets", "secret", "credentials", "keystore", "key", "pem",
        "p12", "pfx",
    };
    config.binaryExtensions = {
        ".jar", ".class", ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".ico",
        ".pdf", ".zip", ".tar", ".gz", ".rar", ".7z", ".mp4", ".mp3", ".wav",
        ".mov", ".exe", ".dll", ".so", ".dylib", ".o", ".obj", ".a", ".lib",
        ".bin",
    };
    config.textExtensions = {
        ".java", ".kt", ".kts", ".scala", ".groovy",
        ".py", ".rb", ".go", ".rs",
        ".js", ".jsx", ".ts", ".tsx",
        ".json", ".yml", ".yaml", ".xml", ".properties", ".toml", ".ini",
        ".gradle", ".md", ".txt", ".html", ".htm", ".css",
        ".c", ".h", ".cc", ".cpp", ".cxx", ".hpp", ".hh", ".cmake", ".sh",
    };
    config.snapshotArtifactExtensions = {".json", ".txt"};
    return config;
}

void applyConfigJson(CollectorConfig &config, const nlohmann::json &json)
{
    if (!json.is_object()) {
        throw std::runtime_error("config root must be a JSON object");
    }

    if (json.contains("ignoredDirectories")) {
        config.ignoredDirectories = readStringList(json, "ignoredDirectories");
    }
    if (json.contains("ignoredFiles")) {
        config.ignoredFiles = readStringList(json, "ignoredFiles");
    }
    if (json.contains("secretNamePatterns")) {
        config.secretNamePatterns = readStringList(json, "secretNamePatterns");
    }
    if (json.contains("binaryExtensions")) {
        config.binaryExtensions = readStringList(json, "binaryExtensions");
    }
    if (json.contains("textExtensions")) {
        config.textExtensions = readStringList(json, "textExtensions");
    }
    if (json.contains("snapshotArtifactExtensions")) {
        config.snapshotArtifactExtensions =
            readStringList(json, "snapshotArtifactExtensions");
    }

    if (json.contains("maxContentBytes")) {
        const auto &caps = json.at("maxContentBytes");
        if (caps.is_object()) {
            if (caps.contains("full")) {
                config.maxContentBytesFull =
                    readByteCount(caps.at("full"), "maxContentBytes.full");
            }
            if (caps.contains("diff")) {
                config.maxContentBytesDiff =
                    readByteCount(caps.at("diff"), "maxContentBytes.diff");
            }
        } else {
            // A single number applies to both content modes.
            const std::uintmax_t cap = readByteCount(caps, "maxContentBytes");
            config.maxContentBytesFull = cap;
            config.maxContentBytesDiff = cap;
        }
    }
    if (json.contains("maxTextReportBytesPerFile")) {
        config.maxTextReportBytesPerFile = static_cast<std::size_t>(
            readByteCount(json.at("maxTextReportBytesPerFile"),
                          "maxTextReportBytesPerFile"));
    }

    if (json.contains("snapshotArtifactPrefix")) {
        const auto &value = json.at("snapshotArtifactPrefix");
        if (!value.is_string()) {
            throw std::runtime_error("config key 'snapshotArtifactPrefix' must be a string");
        }
        config.snapshotArtifactPrefix = toLower(value.get<std::string>());
    }
    if (json.contains("vcsProgram")) {
        const auto &value = json.at("vcsProgram");
        if (!value.is_string() || value.get<std::string>().empty()) {
            throw std::runtime_error("config key 'vcsProgram' must be a non-empty string");
        }
        config.vcsProgram = value.get<std::string>();
    }
    if (json.contains("vcsTimeoutMs")) {
        const auto &value = json.at("vcsTimeoutMs");
        // QProcess waits forever on a negative timeout.
        if (!value.is_number_integer() || value.get<long long>() <= 0
            || value.get<long long>() > std::numeric_limits<int>::max()) {
            throw std::runtime_error("config key 'vcsTimeoutMs' must be a positive integer "
                                     "that fits in an int");
        }
        config.vcsTimeoutMs = value.get<int>();
    }
    if (json.contains("logDirectory")) {
        const auto &value = json.at("logDirectory");
        if (!value.is_string()) {
            throw std::runtime_error("config key 'logDirectory' must be a string");
        }
        config.logDirectory = value.get<std::string>();
    }
    if (json.contains("maxLogBytes")) {
        const std::uintmax_t bytes = readByteCount(json.at("maxLogBytes"), "maxLogBytes");
        if (bytes > static_cast<std::uintmax_t>(std::numeric_limits<qint64>::max())) {
            throw std::runtime_error("config key 'maxLogBytes' is out of range");
        }
        config.maxLogBytes = bytes;
    }

    const auto &known = recognizedKeys();
    for (auto it = json.begin(); it != json.end(); ++it) {
        if (std::find(known.begin(), known.end(), it.key()) != known.end()) {
            continue;
        }
        TSLOG_WARN("CollectorConfig", "config_unknown_key",
                   (nlohmann::json{{"key", it.key()}}));
    }
}

CollectorConfig loadCollectorConfig(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open config file: " + path.string());
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error &ex) {
        throw std::runtime_error("malformed config file " + path.string() + ": " + ex.what());
    }

    CollectorConfig config = CollectorConfig::defaults();
    applyConfigJson(config, json);

    TSLOG_INFO("CollectorConfig", "config_loaded",
               (nlohmann::json{{"path", path.string()}}));
    return config;
}

} // namespace treesnap
