#include "procfs_reader.hpp"
#include "system_info.hpp"
#include <algorithm>
#include <charconv>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>
#include <utility>
#include <pwd.h>

namespace fs = std::filesystem;

namespace reap {

// Error tracking methods
void ProcfsReader::add_error(const std::string& message) {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.push_back({std::chrono::steady_clock::now(), message});
    if (recent_errors_.size() > kMaxErrors) {
        recent_errors_.erase(recent_errors_.begin());
    }
}

std::vector<ParseError> ProcfsReader::get_recent_errors() {
    std::lock_guard lock(errors_mutex_);
    // Return errors from the last 10 seconds
    auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(10);
    std::vector<ParseError> result;
    for (const auto& err : recent_errors_) {
        if (err.timestamp > cutoff) {
            result.push_back(err);
        }
    }
    return result;
}

void ProcfsReader::clear_errors() {
    std::lock_guard lock(errors_mutex_);
    recent_errors_.clear();
}

std::string ProcfsReader::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string ProcfsReader::get_username(const int uid) {
    if (const auto it = uid_cache_.find(uid); it != uid_cache_.end()) {
        return it->second;
    }

    const passwd* pw = getpwuid(uid);
    std::string name = pw ? pw->pw_name : std::to_string(uid);
    uid_cache_[uid] = name;
    return name;
}

std::string ProcfsReader::tty_name(const int tty_nr) {
    if (tty_nr == 0) return "?";

    const auto nr = static_cast<unsigned int>(tty_nr);
    const unsigned int major = (nr >> 8) & 0xfff;
    const unsigned int minor = (nr & 0xff) | ((nr >> 12) & 0xfff00);

    // Unix98 pty slaves occupy majors 136-143
    if (major >= 136 && major <= 143) {
        return std::format("pts/{}", minor + (major - 136) * 256);
    }
    if (major == 4) {
        return minor < 64 ? std::format("tty{}", minor) : std::format("ttyS{}", minor - 64);
    }
    return "?";
}

std::string ProcfsReader::parse_stat(const std::string& content, ProcessInfo& info) {
    // Format: pid (comm) state ppid ...
    // comm can contain spaces and parentheses, so find the last ')'
    const size_t comm_start = content.find('(');
    const size_t comm_end = content.rfind(')');
    if (comm_start == std::string::npos || comm_end == std::string::npos || comm_end <= comm_start) {
        return "malformed stat (missing comm)";
    }

    info.name = content.substr(comm_start + 1, comm_end - comm_start - 1);

    if (comm_end + 2 >= content.size()) {
        return "truncated stat (no fields after comm)";
    }

    std::istringstream iss(content.substr(comm_end + 2));
    std::string state;
    int ppid = 0, pgrp = 0, session = 0, tty_nr = 0, tpgid = 0;
    unsigned int flags = 0;
    uint64_t minflt = 0, cminflt = 0, majflt = 0, cmajflt = 0, utime = 0, stime = 0;
    int64_t cutime = 0, cstime = 0, priority = 0, nice = 0;
    int64_t num_threads = 1, itrealvalue = 0;
    uint64_t starttime = 0;

    iss >> state >> ppid >> pgrp >> session >> tty_nr >> tpgid >> flags
        >> minflt >> cminflt >> majflt >> cmajflt >> utime >> stime
        >> cutime >> cstime >> priority >> nice >> num_threads >> itrealvalue >> starttime;

    if (iss.fail()) {
        return "failed to parse stat fields";
    }

    info.state_char = state.empty() ? '?' : state[0];
    info.parent_pid = ppid;
    info.tty = tty_name(tty_nr);
    info.user_time = utime;
    info.kernel_time = stime;
    info.start_ticks = starttime;
    return {};
}

std::vector<ProcessInfo> ProcfsReader::get_all_processes() {
    std::vector<ProcessInfo> processes;

    try {
        for (const auto& entry : fs::directory_iterator("/proc")) {
            try {
                if (!entry.is_directory()) continue;

                const auto& name = entry.path().filename().string();
                int pid = 0;
                if (auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid); ec != std::errc{} || ptr != name.data() + name.size()) continue;

                if (auto info = get_process_info(pid)) {
                    processes.push_back(std::move(*info));
                }
            } catch (const fs::filesystem_error&) {
                // Process disappeared mid-read, skip it
                continue;
            }
        }
    } catch (const std::exception& e) {
        add_error(std::format("Failed to iterate /proc: {}", e.what()));
    }

    return processes;
}

std::optional<ProcessInfo> ProcfsReader::get_process_info(int pid) {
    const std::string proc_path = "/proc/" + std::to_string(pid);

    // An empty read means the process is gone (or was never there)
    const std::string stat_content = read_file(proc_path + "/stat");
    if (stat_content.empty()) return std::nullopt;

    ProcessInfo info;
    info.pid = pid;

    if (const auto defect = parse_stat(stat_content, info); !defect.empty()) {
        add_error(std::format("PID {}: {}", pid, defect));
        return std::nullopt;
    }

    // Start time and age
    auto& sys = SystemInfo::instance();
    const long ticks = sys.get_clock_ticks_per_second();
    if (ticks > 0) {
        const uint64_t start_seconds = sys.get_boot_time_seconds() + (info.start_ticks / ticks);
        info.start_time = std::chrono::system_clock::from_time_t(static_cast<time_t>(start_seconds));

        const auto uptime_ticks = static_cast<uint64_t>(SystemInfo::get_uptime().uptime_seconds * static_cast<double>(ticks));
        info.age_ticks = uptime_ticks > info.start_ticks ? uptime_ticks - info.start_ticks : 0;
    }

    // Read cmdline
    std::string cmdline = read_file(proc_path + "/cmdline");
    std::ranges::replace(cmdline, '\0', ' ');
    while (!cmdline.empty() && cmdline.back() == ' ') {
        cmdline.pop_back();
    }
    info.command_line = cmdline;

    // Left empty when unknown; the reporter prints "?"
    if (const auto uid = parse_uid(read_file(proc_path + "/status"))) {
        info.user_name = get_username(*uid);
    }

    return info;
}

std::optional<int> ProcfsReader::parse_uid(const std::string& status) {
    std::istringstream status_iss(status);
    std::string line;
    while (std::getline(status_iss, line)) {
        if (line.starts_with("Uid:")) {
            std::istringstream uid_iss(line);
            std::string key;
            int uid = 0;
            if (uid_iss >> key >> uid) {
                return uid;
            }
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace reap
