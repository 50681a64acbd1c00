#include "linux_process_killer.hpp"
#include <format>
#include <csignal>
#include <cerrno>
#include <cstring>

namespace reap {

std::string LinuxProcessKiller::get_kill_error_message(int err) {
    switch (err) {
        case EPERM:
            return "Permission denied. You may need root privileges or CAP_KILL capability to signal this process.";
        case ESRCH:
            return "Process not found. It may have already terminated.";
        case EINVAL:
            return "Invalid signal.";
        default:
            return std::format("Failed to send signal: {} (errno {})", strerror(err), err);
    }
}

KillResult LinuxProcessKiller::kill_process(int pid, bool force) {
    KillResult result;

    // kill(2) treats 0 and negative values as process groups
    if (pid <= 0) {
        result.success = false;
        result.error_message = "Invalid PID";
        return result;
    }

    const int signal = force ? SIGKILL : SIGTERM;
    if (kill(pid, signal) == -1) {
        const int err = errno;
        result.success = false;
        result.process_not_found = (err == ESRCH);
        result.error_message = get_kill_error_message(err);
        return result;
    }

    result.success = true;
    return result;
}

} // namespace reap
