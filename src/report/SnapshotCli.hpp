#pragma once

#include <iosfwd>
#include <memory>

#include "collector/metadata_walker.hpp"
#include "collector/vcs_status.hpp"
#include "common/enums.hpp"

namespace treesnap {

class SnapshotCli
{
public:
    // A null runner means git is invoked as configured.
    explicit SnapshotCli(std::shared_ptr<VcsCommandRunner> vcsRunner = nullptr,
                         SelfPathProvider selfPath = defaultSelfPath());

    // Parses arguments, collects the snapshot, prints the index and writes
    // the JSON and text reports.
    // returns exit code
    int run(int argc, char *argv[]);

    // Stream the interactive mode menu reads from; std::cin by default.
    void setInput(std::istream &in) { m_in = &in; }

private:
    SnapshotMode promptForMode();

    std::shared_ptr<VcsCommandRunner> m_vcsRunner;
    SelfPathProvider m_selfPath;
    std::istream *m_in;
};

} // namespace treesnap
