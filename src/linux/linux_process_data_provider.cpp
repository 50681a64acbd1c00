#include "linux_process_data_provider.hpp"

namespace reap {

LinuxProcessDataProvider::LinuxProcessDataProvider() = default;

std::vector<ProcessInfo> LinuxProcessDataProvider::get_all_processes() {
    return reader_.get_all_processes();
}

std::optional<ProcessInfo> LinuxProcessDataProvider::get_process_info(int pid) {
    return reader_.get_process_info(pid);
}

std::vector<ParseError> LinuxProcessDataProvider::get_recent_errors() {
    return reader_.get_recent_errors();
}

void LinuxProcessDataProvider::clear_errors() {
    reader_.clear_errors();
}

} // namespace reap
