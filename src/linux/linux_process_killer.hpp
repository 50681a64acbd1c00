#pragma once

#include "../interfaces/i_process_killer.hpp"

namespace reap {

class LinuxProcessKiller : public IProcessKiller {
public:
    LinuxProcessKiller() = default;
    ~LinuxProcessKiller() override = default;

    KillResult kill_process(int pid, bool force) override;

    static std::string get_kill_error_message(int err);
};

} // namespace reap
