#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "collector/path_classifier.hpp"

namespace treesnap {

class ContentLoader
{
public:
    explicit ContentLoader(const PathClassifier &classifier);

    /**
     * Returns the UTF-8 text of `path`, or std::nullopt when the file is gone,
     * binary, secret-like, outside the textual allow-list, at least
     * `maxBytes` long, unreadable or not valid UTF-8. Never throws.
     */
    std::optional<std::string> load(const std::filesystem::path &path,
                                    std::uintmax_t maxBytes) const;

private:
    const PathClassifier &m_classifier;
};

} // namespace treesnap
