#pragma once

#include "interfaces/i_process_data_provider.hpp"
#include "interfaces/i_process_killer.hpp"
#include "reap_config.hpp"
#include "terminator.hpp"
#include <istream>
#include <ostream>

namespace reap {

// Discover, display, confirm, terminate.
// App does not own the providers; they are managed by the caller.
class App {
public:
    App(IProcessDataProvider* process_provider, IProcessKiller* killer,
        std::istream& in, std::ostream& out, std::ostream& err,
        ReapConfig config = {}, Terminator::SleepFunction sleep = {});

    // Returns the process exit code: 0 on completion or cancellation
    int run();

private:
    void report_parse_errors();
    void report_signal_failures(const TerminationReport& report);

    IProcessDataProvider* process_provider_;
    IProcessKiller* killer_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
    ReapConfig config_;
    Terminator::SleepFunction sleep_;
};

} // namespace reap
