#include "system_info.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace reap {

SystemInfo& SystemInfo::instance() {
    static SystemInfo instance;
    return instance;
}

SystemInfo::SystemInfo() {
    clock_ticks_ = sysconf(_SC_CLK_TCK);
    if (clock_ticks_ <= 0) clock_ticks_ = 100;

    // Read boot time from /proc/stat
    std::ifstream stat("/proc/stat");
    std::string line;
    while (std::getline(stat, line)) {
        if (line.starts_with("btime ")) {
            std::istringstream iss(line);
            std::string key;
            iss >> key >> boot_time_seconds_;
            break;
        }
    }
}

UptimeInfo SystemInfo::get_uptime() {
    UptimeInfo info;
    std::ifstream uptime("/proc/uptime");

    if (uptime) {
        double uptime_sec = 0.0, idle_sec = 0.0;
        uptime >> uptime_sec >> idle_sec;
        info.uptime_seconds = uptime_sec;
        info.idle_seconds = idle_sec;
    }

    return info;
}

long SystemInfo::get_clock_ticks_per_second() const {
    return clock_ticks_;
}

uint64_t SystemInfo::get_boot_time_seconds() const {
    return boot_time_seconds_;
}

} // namespace reap
