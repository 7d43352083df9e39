#pragma once

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "collector/metadata_walker.hpp"
#include "collector/vcs_status.hpp"

namespace treesnap::test {

// Returns canned porcelain output instead of spawning a process.
class FakeVcsRunner : public VcsCommandRunner
{
public:
    explicit FakeVcsRunner(std::optional<std::vector<std::string>> lines)
        : m_lines(std::move(lines))
    {
    }

    std::optional<std::vector<std::string>> statusLines(
        const std::filesystem::path &) override
    {
        ++calls;
        return m_lines;
    }

    int calls = 0;

private:
    std::optional<std::vector<std::string>> m_lines;
};

inline void writeFile(const std::filesystem::path &path, const std::string &data)
{
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << data;
}

inline SelfPathProvider noSelfPath()
{
    return []() { return std::filesystem::path(); };
}

} // namespace treesnap::test
