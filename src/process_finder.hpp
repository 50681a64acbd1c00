#pragma once

#include "interfaces/i_process_data_provider.hpp"
#include <set>
#include <string>
#include <vector>

namespace reap {

// Selects running processes whose command line contains a pattern (pgrep -f).
// The finder never selects the process it runs in, nor any of its ancestors
// ("sudo kill-ollama", "bash -c kill-ollama" match the pattern too).
class ProcessFinder {
public:
    explicit ProcessFinder(IProcessDataProvider* provider);
    ProcessFinder(IProcessDataProvider* provider, int self_pid, int parent_pid);

    // Empty result when nothing matches; processes exiting mid-scan are skipped
    ProcessSet find(const std::string& pattern);

    [[nodiscard]] static bool matches(const ProcessInfo& info, const std::string& pattern);

    // self_pid plus every ancestor reachable through parent_pid in the snapshot
    [[nodiscard]] static std::set<int> lineage(const std::vector<ProcessInfo>& snapshot,
                                               int self_pid, int parent_pid);

    [[nodiscard]] int self_pid() const { return self_pid_; }

private:
    IProcessDataProvider* provider_;
    int self_pid_;
    int parent_pid_;
};

} // namespace reap
