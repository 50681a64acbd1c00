#pragma once

#include "../interfaces/i_process_data_provider.hpp"
#include "../procfs_reader.hpp"

namespace reap {

class LinuxProcessDataProvider : public IProcessDataProvider {
public:
    LinuxProcessDataProvider();
    ~LinuxProcessDataProvider() override = default;

    std::vector<ProcessInfo> get_all_processes() override;
    std::optional<ProcessInfo> get_process_info(int pid) override;

    std::vector<ParseError> get_recent_errors() override;
    void clear_errors() override;

private:
    ProcfsReader reader_;
};

} // namespace reap
