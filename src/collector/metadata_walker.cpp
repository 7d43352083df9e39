#include "collector/metadata_walker.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <QCoreApplication>
#include <QDateTime>
#include <QFileInfo>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace treesnap {

namespace {

constexpr const char *kUnknownAttribute = "?";

std::filesystem::path canonicalOrEmpty(const std::filesystem::path &path)
{
    std::error_code error;
    auto canonical = std::filesystem::weakly_canonical(path, error);
    if (error) {
        return {};
    }
    return canonical;
}

} // namespace

SelfPathProvider defaultSelfPath()
{
    return []() -> std::filesystem::path {
        if (QCoreApplication::instance()) {
            const QString appPath = QCoreApplication::applicationFilePath();
            if (!appPath.isEmpty()) {
                return std::filesystem::path(appPath.toStdString());
            }
        }
        std::error_code error;
        auto exe = std::filesystem::read_symlink("/proc/self/exe", error);
        if (error) {
            return {};
        }
        return exe;
    };
}

std::string humanReadableByteCount(std::uintmax_t bytes)
{
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    static const char prefixes[] = "KMGTPE";
    double value = static_cast<double>(bytes);
    int exp = 0;
    while (value >= 1024.0 && exp < 6) {
        value /= 1024.0;
        ++exp;
    }

    QString number = QString::number(value, 'f', 2);
    while (number.endsWith(QChar('0'))) {
        number.chop(1);
    }
    if (number.endsWith(QChar('.'))) {
        number.chop(1);
    }
    return number.toStdString() + " " + prefixes[exp - 1] + "B";
}

FileRecord makeFileRecord(const std::filesystem::path &root,
                          const std::filesystem::path &path,
                          const PathClassifier &classifier)
{
    FileRecord record;
    record.relativePath = path.lexically_relative(root).generic_string();
    if (record.relativePath.empty()) {
        record.relativePath = path.generic_string();
    }

    const QFileInfo info(QString::fromStdString(path.string()));
    const QDateTime modified = info.exists() ? info.lastModified() : QDateTime();
    if (!info.exists() || !modified.isValid()) {
        record.size = kUnknownAttribute;
        record.modifiedAt = kUnknownAttribute;
        record.language = Language::Unknown;
        return record;
    }

    record.size = humanReadableByteCount(static_cast<std::uintmax_t>(info.size()));
    record.modifiedAt = modified.toLocalTime()
                            .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"))
                            .toStdString();
    record.language = classifier.languageFor(path.filename().string());
    return record;
}

MetadataWalker::MetadataWalker(const PathClassifier &classifier, SelfPathProvider selfPath)
    : m_classifier(classifier)
    , m_selfPath(std::move(selfPath))
{
}

bool MetadataWalker::isSelf(const std::filesystem::path &candidate,
                            const std::filesystem::path &self) const
{
    if (self.empty() || candidate.filename() != self.filename()) {
        return false;
    }
    return canonicalOrEmpty(candidate) == self;
}

WalkResult MetadataWalker::walk(const std::filesystem::path &root,
                                const VcsStatusMap &statuses) const
{
    WalkResult result;

    std::filesystem::path self;
    if (m_selfPath) {
        const std::filesystem::path raw = m_selfPath();
        if (!raw.empty()) {
            self = canonicalOrEmpty(raw);
        }
    }

    std::error_code error;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, error);
    if (error) {
        throw std::runtime_error("cannot list directory " + root.string() + ": "
                                 + error.message());
    }

    size_t prunedDirectories = 0;
    size_t skippedFiles = 0;
    const std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        const std::filesystem::directory_entry &entry = *it;
        const std::filesystem::path &path = entry.path();
        const std::string name = path.filename().string();

        std::error_code typeError;
        if (entry.is_directory(typeError)) {
            if (m_classifier.isIgnoredDirectory(name) || isSelf(path, self)) {
                it.disable_recursion_pending();
                ++prunedDirectories;
            }
        } else if (entry.is_regular_file(typeError)) {
            const std::string relativePath = path.lexically_relative(root).generic_string();
            if (isSelf(path, self)
                || m_classifier.isSnapshotArtifact(name)
                || m_classifier.isIgnoredFile(name, relativePath)) {
                ++skippedFiles;
            } else {
                FileRecord record = makeFileRecord(root, path, m_classifier);
                const auto status = statuses.find(record.relativePath);
                if (status != statuses.end()) {
                    record = withStatus(record, status->second);
                }
                result.files.push_back(std::move(record));
            }
        }

        it.increment(error);
        if (error) {
            result.warnings.push_back("Traversal stopped early below " + root.string()
                                      + ": " + error.message());
            TSLOG_WARN("MetadataWalker", "walk_interrupted",
                       (nlohmann::json{{"root", root.string()},
                                       {"error", error.message()}}));
            break;
        }
    }

    std::sort(result.files.begin(), result.files.end(),
              [](const FileRecord &a, const FileRecord &b) {
                  return a.relativePath < b.relativePath;
              });

    TSLOG_DEBUG("MetadataWalker", "walk_complete",
                (nlohmann::json{{"files", result.files.size()},
                                {"prunedDirectories", prunedDirectories},
                                {"skippedFiles", skippedFiles}}));
    return result;
}

} // namespace treesnap
