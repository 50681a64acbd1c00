#pragma once

#include <cstdint>

namespace reap {

struct UptimeInfo {
    double uptime_seconds = 0.0;
    double idle_seconds = 0.0;
};

class SystemInfo {
public:
    static SystemInfo& instance();

    static UptimeInfo get_uptime();

    [[nodiscard]] long get_clock_ticks_per_second() const;
    [[nodiscard]] uint64_t get_boot_time_seconds() const;

private:
    SystemInfo();
    long clock_ticks_ = 100;
    uint64_t boot_time_seconds_ = 0;
};

} // namespace reap
