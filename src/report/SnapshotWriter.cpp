#include "report/SnapshotWriter.hpp"

#include <sstream>

#include <QByteArray>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace treesnap {

namespace {

constexpr const char *kSeparator =
    "==============================================================\n";

// Largest prefix of `text` not longer than maxBytes that does not split a
// UTF-8 sequence.
size_t utf8Boundary(const std::string &text, size_t maxBytes)
{
    if (text.size() <= maxBytes) {
        return text.size();
    }
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return cut;
}

bool writeFile(const QString &path, const std::string &data)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray bytes = QByteArray::fromStdString(data);
    if (file.write(bytes) != bytes.size()) {
        return false;
    }
    return true;
}

} // namespace

std::string renderSnapshotIndex(const Snapshot &snapshot)
{
    std::ostringstream out;
    out << "Project Snapshot at: " << snapshot.rootPath << "\n";
    for (const auto &file : snapshot.files) {
        out << " - " << file.relativePath
            << " | " << toLanguageString(file.language)
            << " | " << file.size
            << " | modified " << file.modifiedAt
            << " | vcs: " << toVcsStatusString(file.vcsStatus)
            << "\n";
    }
    return out.str();
}

std::string renderSnapshotText(const Snapshot &snapshot,
                               bool includeContents,
                               std::size_t maxBytesPerFile)
{
    std::ostringstream out;
    out << "Project Snapshot at: " << snapshot.rootPath << "\n\n";
    for (const auto &file : snapshot.files) {
        out << kSeparator;
        out << file.relativePath << " (" << toLanguageString(file.language)
            << ", " << file.size << ", modified " << file.modifiedAt
            << ", vcs: " << toVcsStatusString(file.vcsStatus) << ")\n";

        if (includeContents && file.content.has_value()) {
            out << "---------------- FILE CONTENT ----------------\n";
            const std::string &content = *file.content;
            if (content.size() > maxBytesPerFile) {
                out.write(content.data(),
                          static_cast<std::streamsize>(utf8Boundary(content, maxBytesPerFile)));
                out << "\n...(truncated in TXT)\n";
            } else {
                out << content << "\n";
            }
        }
        out << "\n";
    }
    return out.str();
}

bool writeSnapshotJson(const QString &path, const Snapshot &snapshot)
{
    const nlohmann::json payload = snapshot;
    return writeFile(path, payload.dump(2, ' ', false,
                                        nlohmann::json::error_handler_t::replace));
}

bool writeSnapshotText(const QString &path, const Snapshot &snapshot,
                       bool includeContents, std::size_t maxBytesPerFile)
{
    return writeFile(path, renderSnapshotText(snapshot, includeContents, maxBytesPerFile));
}

} // namespace treesnap
