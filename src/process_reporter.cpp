#include "process_reporter.hpp"
#include "system_info.hpp"
#include <ctime>
#include <format>
#include <stdexcept>

namespace reap {

namespace {

constexpr const char* kRowFormat = "{:<8} {:>7} {:>7} {:>2} {:<5} {:<8} {:>8} {}";

std::tm to_local_tm(std::chrono::system_clock::time_point tp) {
    const time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

} // namespace

ProcessReporter::ProcessReporter(IProcessDataProvider* provider, std::ostream& out)
    : ProcessReporter(provider, out, SystemInfo::instance().get_clock_ticks_per_second()) {
}

ProcessReporter::ProcessReporter(IProcessDataProvider* provider, std::ostream& out, long clock_ticks_per_second)
    : provider_(provider), out_(out), clock_ticks_(clock_ticks_per_second > 0 ? clock_ticks_per_second : 100) {
    if (!provider_) {
        throw std::invalid_argument("ProcessReporter requires a process data provider");
    }
}

std::string ProcessReporter::format_header() const {
    return std::format(kRowFormat, "UID", "PID", "PPID", "C", "STIME", "TTY", "TIME", "CMD");
}

std::string ProcessReporter::format_start_time(std::chrono::system_clock::time_point start,
                                               std::chrono::system_clock::time_point now) {
    const std::tm start_tm = to_local_tm(start);
    const std::tm now_tm = to_local_tm(now);

    char buf[16];
    if (start_tm.tm_year == now_tm.tm_year && start_tm.tm_yday == now_tm.tm_yday) {
        std::strftime(buf, sizeof(buf), "%H:%M", &start_tm);
    } else {
        std::strftime(buf, sizeof(buf), "%b%d", &start_tm);
    }
    return buf;
}

std::string ProcessReporter::format_cpu_time(uint64_t ticks) const {
    const uint64_t total_seconds = ticks / static_cast<uint64_t>(clock_ticks_);
    const uint64_t hours = total_seconds / 3600;
    const uint64_t minutes = (total_seconds / 60) % 60;
    const uint64_t seconds = total_seconds % 60;
    return std::format("{:02}:{:02}:{:02}", hours, minutes, seconds);
}

int ProcessReporter::cpu_percent(const ProcessInfo& info) {
    if (info.age_ticks == 0) return 0;
    const uint64_t pct = info.cpu_ticks() * 100 / info.age_ticks;
    return pct > 99 ? 99 : static_cast<int>(pct);
}

std::string ProcessReporter::format_row(const ProcessInfo& info, std::chrono::system_clock::time_point now) const {
    const std::string user = info.user_name.empty() ? "?" : info.user_name;
    const std::string tty = info.tty.empty() ? "?" : info.tty;
    // Zombies have lost their cmdline; ps shows them as "[comm] <defunct>"
    std::string cmd = info.command_line.empty() ? "[" + info.name + "]" : info.command_line;
    if (info.state_char == 'Z') {
        cmd = "[" + info.name + "] <defunct>";
    }

    return std::format(kRowFormat, user, info.pid, info.parent_pid, cpu_percent(info),
                       format_start_time(info.start_time, now), tty,
                       format_cpu_time(info.cpu_ticks()), cmd);
}

std::string ProcessReporter::format_missing_row(int pid) {
    return std::format(kRowFormat, "-", pid, "-", "-", "-", "-", "-", "<exited>");
}

void ProcessReporter::report(const ProcessSet& pids) {
    const auto now = std::chrono::system_clock::now();

    out_ << format_header() << '\n';
    for (const int pid : pids) {
        if (auto info = provider_->get_process_info(pid)) {
            out_ << format_row(*info, now) << '\n';
        } else {
            out_ << format_missing_row(pid) << '\n';
        }
    }
    out_.flush();
}

} // namespace reap
