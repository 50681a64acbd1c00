#pragma once

#include "interfaces/i_process_data_provider.hpp"
#include "interfaces/i_process_killer.hpp"
#include <deque>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace reap::testing {

inline ProcessInfo make_process(int pid, std::string command_line, std::string name = "proc") {
    ProcessInfo info;
    info.pid = pid;
    info.parent_pid = 1;
    info.name = std::move(name);
    info.command_line = std::move(command_line);
    info.state_char = 'S';
    info.user_name = "tester";
    info.tty = "?";
    return info;
}

// Serves scripted snapshots: each get_all_processes() call consumes one,
// the last snapshot stays current once the script runs out.
class FakeProcessDataProvider : public IProcessDataProvider {
public:
    FakeProcessDataProvider() = default;
    explicit FakeProcessDataProvider(std::vector<std::vector<ProcessInfo>> snapshots)
        : snapshots_(snapshots.begin(), snapshots.end()) {}

    void push_snapshot(std::vector<ProcessInfo> snapshot) {
        snapshots_.push_back(std::move(snapshot));
    }

    void add_error(std::string message) {
        errors_.push_back({std::chrono::steady_clock::now(), std::move(message)});
    }

    std::vector<ProcessInfo> get_all_processes() override {
        ++scan_count;
        if (snapshots_.empty()) return {};
        current_ = snapshots_.front();
        if (snapshots_.size() > 1) {
            snapshots_.pop_front();
        }
        return current_;
    }

    std::optional<ProcessInfo> get_process_info(int pid) override {
        for (const auto& p : current_) {
            if (p.pid == pid) return p;
        }
        return std::nullopt;
    }

    std::vector<ParseError> get_recent_errors() override { return errors_; }
    void clear_errors() override { errors_.clear(); }

    int scan_count = 0;

private:
    std::deque<std::vector<ProcessInfo>> snapshots_;
    std::vector<ProcessInfo> current_;
    std::vector<ParseError> errors_;
};

struct SignalCall {
    int pid = 0;
    bool force = false;

    bool operator==(const SignalCall&) const = default;
};

class RecordingProcessKiller : public IProcessKiller {
public:
    KillResult kill_process(int pid, bool force) override {
        calls.push_back({pid, force});

        KillResult result;
        if (denied.contains(pid)) {
            result.error_message = "Permission denied.";
            return result;
        }
        if (exited.contains(pid)) {
            result.process_not_found = true;
            result.error_message = "Process not found.";
            return result;
        }
        result.success = true;
        return result;
    }

    [[nodiscard]] std::vector<int> pids_signalled(bool force) const {
        std::vector<int> result;
        for (const auto& call : calls) {
            if (call.force == force) result.push_back(call.pid);
        }
        return result;
    }

    std::vector<SignalCall> calls;
    std::set<int> denied;   // EPERM
    std::set<int> exited;   // ESRCH
};

} // namespace reap::testing
