#include "collector/content_loader.hpp"

#include <system_error>

#include <QByteArray>
#include <QFile>
#include <QString>
#include <QStringDecoder>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace treesnap {

ContentLoader::ContentLoader(const PathClassifier &classifier)
    : m_classifier(classifier)
{
}

std::optional<std::string> ContentLoader::load(const std::filesystem::path &path,
                                               std::uintmax_t maxBytes) const
{
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        return std::nullopt;
    }

    const std::string name = path.filename().string();
    if (m_classifier.isBinaryName(name) || m_classifier.isSecretName(name)) {
        return std::nullopt;
    }

    const std::uintmax_t size = std::filesystem::file_size(path, error);
    if (error || size >= maxBytes) {
        return std::nullopt;
    }

    if (!m_classifier.isEligibleForContent(name)) {
        return std::nullopt;
    }

    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        TSLOG_DEBUG("ContentLoader", "content_unreadable",
                    (nlohmann::json{{"path", path.string()},
                                    {"error", file.errorString().toStdString()}}));
        return std::nullopt;
    }

    const QByteArray data = file.readAll();
    if (static_cast<std::uintmax_t>(data.size()) >= maxBytes) {
        return std::nullopt;
    }

    QStringDecoder decoder(QStringDecoder::Utf8);
    const QString decoded = decoder.decode(data);
    Q_UNUSED(decoded);
    if (decoder.hasError()) {
        TSLOG_DEBUG("ContentLoader", "content_not_utf8",
                    (nlohmann::json{{"path", path.string()}}));
        return std::nullopt;
    }

    return std::string(data.constData(), static_cast<size_t>(data.size()));
}

} // namespace treesnap
