#pragma once

#include <string>

namespace reap {

struct KillResult {
    bool success = false;
    bool process_not_found = false;  // ESRCH: exited before the signal arrived
    std::string error_message;
};

class IProcessKiller {
public:
    virtual ~IProcessKiller() = default;

    // force = false sends SIGTERM, force = true sends SIGKILL
    virtual KillResult kill_process(int pid, bool force) = 0;
};

} // namespace reap
