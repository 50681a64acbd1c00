#include "process_finder.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <unistd.h>

namespace reap {

ProcessFinder::ProcessFinder(IProcessDataProvider* provider)
    : ProcessFinder(provider, static_cast<int>(getpid()), static_cast<int>(getppid())) {
}

ProcessFinder::ProcessFinder(IProcessDataProvider* provider, int self_pid, int parent_pid)
    : provider_(provider), self_pid_(self_pid), parent_pid_(parent_pid) {
    if (!provider_) {
        throw std::invalid_argument("ProcessFinder requires a process data provider");
    }
}

bool ProcessFinder::matches(const ProcessInfo& info, const std::string& pattern) {
    // Kernel threads have no cmdline; pgrep -f falls back to the short name
    const std::string& haystack = info.command_line.empty() ? info.name : info.command_line;
    return haystack.find(pattern) != std::string::npos;
}

std::set<int> ProcessFinder::lineage(const std::vector<ProcessInfo>& snapshot, int self_pid, int parent_pid) {
    std::map<int, int> parent_of;
    for (const auto& proc : snapshot) {
        parent_of[proc.pid] = proc.parent_pid;
    }

    std::set<int> result{self_pid};

    // Walk up until the chain leaves the snapshot; the visited check stops
    // on a reused PID forming a cycle
    int pid = parent_pid;
    while (pid > 0 && !result.contains(pid)) {
        result.insert(pid);
        const auto it = parent_of.find(pid);
        if (it == parent_of.end()) break;
        pid = it->second;
    }
    return result;
}

ProcessSet ProcessFinder::find(const std::string& pattern) {
    if (pattern.empty()) {
        throw std::invalid_argument("Process pattern must not be empty");
    }

    const auto snapshot = provider_->get_all_processes();
    const auto excluded = lineage(snapshot, self_pid_, parent_pid_);

    ProcessSet result;
    for (const auto& proc : snapshot) {
        if (proc.pid <= 0 || excluded.contains(proc.pid)) continue;
        if (matches(proc, pattern)) {
            result.push_back(proc.pid);
        }
    }

    std::ranges::sort(result);
    const auto [first, last] = std::ranges::unique(result);
    result.erase(first, last);
    return result;
}

} // namespace reap
