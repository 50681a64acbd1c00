#pragma once

#include "interfaces/i_process_data_provider.hpp"
#include <chrono>
#include <ostream>
#include <string>

namespace reap {

// Prints a "ps -f" style table for a set of PIDs.
class ProcessReporter {
public:
    ProcessReporter(IProcessDataProvider* provider, std::ostream& out);
    ProcessReporter(IProcessDataProvider* provider, std::ostream& out, long clock_ticks_per_second);

    // One row per PID, in the order given. PIDs that can no longer be read
    // still get a placeholder row.
    void report(const ProcessSet& pids);

    [[nodiscard]] std::string format_header() const;
    [[nodiscard]] std::string format_row(const ProcessInfo& info, std::chrono::system_clock::time_point now) const;
    [[nodiscard]] static std::string format_missing_row(int pid);

    // "HH:MM" for processes started on the same local day as now, "MonDD" otherwise
    [[nodiscard]] static std::string format_start_time(std::chrono::system_clock::time_point start,
                                                       std::chrono::system_clock::time_point now);
    // Cumulative CPU time as "HH:MM:SS"
    [[nodiscard]] std::string format_cpu_time(uint64_t ticks) const;
    // Lifetime CPU utilisation, integer percent
    [[nodiscard]] static int cpu_percent(const ProcessInfo& info);

private:
    IProcessDataProvider* provider_;
    std::ostream& out_;
    long clock_ticks_;
};

} // namespace reap
