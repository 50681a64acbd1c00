#pragma once

#include "../interfaces/i_process_data_provider.hpp"
#include "../interfaces/i_process_killer.hpp"

namespace reap {

// Stub implementations for platforms without /proc.
// Discovery always comes back empty, so the tool reports nothing to kill.

class StubProcessDataProvider : public IProcessDataProvider {
public:
    std::vector<ProcessInfo> get_all_processes() override;
    std::optional<ProcessInfo> get_process_info(int pid) override;
    std::vector<ParseError> get_recent_errors() override;
    void clear_errors() override;
};

class StubProcessKiller : public IProcessKiller {
public:
    KillResult kill_process(int pid, bool force) override;
};

} // namespace reap
