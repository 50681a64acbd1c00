#include "stub_providers.hpp"

namespace reap {

std::vector<ProcessInfo> StubProcessDataProvider::get_all_processes() {
    return {};
}

std::optional<ProcessInfo> StubProcessDataProvider::get_process_info(int /*pid*/) {
    return std::nullopt;
}

std::vector<ParseError> StubProcessDataProvider::get_recent_errors() {
    return {};
}

void StubProcessDataProvider::clear_errors() {
}

KillResult StubProcessKiller::kill_process(int /*pid*/, bool /*force*/) {
    KillResult result;
    result.success = false;
    result.error_message = "Process termination is not supported on this platform";
    return result;
}

} // namespace reap
