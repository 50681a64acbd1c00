#pragma once

#include "../process_info.hpp"
#include "../errors.hpp"
#include <vector>
#include <optional>

namespace reap {

class IProcessDataProvider {
public:
    virtual ~IProcessDataProvider() = default;

    virtual std::vector<ProcessInfo> get_all_processes() = 0;
    virtual std::optional<ProcessInfo> get_process_info(int pid) = 0;

    virtual std::vector<ParseError> get_recent_errors() = 0;
    virtual void clear_errors() = 0;
};

} // namespace reap
