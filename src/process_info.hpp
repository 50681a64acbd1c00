#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <vector>

namespace reap {

struct ProcessInfo {
    int pid = 0;
    int parent_pid = 0;
    std::string name;               // Short name (comm), max 15 chars on Linux
    std::string command_line;       // argv joined by spaces, empty for kernel threads
    char state_char = '?';          // /proc/<pid>/stat state, 'Z' for zombies
    std::string user_name;
    std::string tty;                // "pts/3", "tty1" or "?" when detached
    std::chrono::system_clock::time_point start_time;

    // Clock ticks (sysconf(_SC_CLK_TCK))
    uint64_t user_time = 0;
    uint64_t kernel_time = 0;
    uint64_t start_ticks = 0;       // Start time relative to boot
    uint64_t age_ticks = 0;         // Time since process start

    [[nodiscard]] uint64_t cpu_ticks() const { return user_time + kernel_time; }
};

// Ascending, duplicate-free list of PIDs matching a pattern at one point in time
using ProcessSet = std::vector<int>;

} // namespace reap
