#pragma once

#include "process_info.hpp"
#include "errors.hpp"
#include <vector>
#include <map>
#include <optional>
#include <string>
#include <mutex>

namespace reap {

class ProcfsReader {
public:
    std::vector<ProcessInfo> get_all_processes();
    std::optional<ProcessInfo> get_process_info(int pid);

    // Parses the fields of a /proc/<pid>/stat line into info.
    // Returns an empty string on success, otherwise a description of the defect.
    static std::string parse_stat(const std::string& content, ProcessInfo& info);

    // Decodes the tty_nr field of /proc/<pid>/stat ("pts/0", "tty1", "?")
    static std::string tty_name(int tty_nr);

    // Real uid from the "Uid:" line of /proc/<pid>/status
    static std::optional<int> parse_uid(const std::string& status);

    // Error reporting
    std::vector<ParseError> get_recent_errors();
    void clear_errors();

private:
    static std::string read_file(const std::string& path);

    std::string get_username(int uid);
    std::map<int, std::string> uid_cache_;

    // Error tracking
    void add_error(const std::string& message);
    mutable std::mutex errors_mutex_;
    std::vector<ParseError> recent_errors_;
    static constexpr size_t kMaxErrors = 10;
};

} // namespace reap
