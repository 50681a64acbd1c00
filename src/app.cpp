#include "app.hpp"
#include "confirmation_gate.hpp"
#include "process_finder.hpp"
#include "process_reporter.hpp"
#include <format>
#include <stdexcept>
#include <utility>

namespace reap {

App::App(IProcessDataProvider* process_provider, IProcessKiller* killer,
         std::istream& in, std::ostream& out, std::ostream& err,
         ReapConfig config, Terminator::SleepFunction sleep)
    : process_provider_(process_provider)
    , killer_(killer)
    , in_(in)
    , out_(out)
    , err_(err)
    , config_(std::move(config))
    , sleep_(std::move(sleep)) {
    if (!process_provider_ || !killer_) {
        throw std::invalid_argument("App requires a process data provider and a process killer");
    }
}

void App::report_parse_errors() {
    for (const auto& error : process_provider_->get_recent_errors()) {
        err_ << "Warning: " << error.message << '\n';
    }
    process_provider_->clear_errors();
}

void App::report_signal_failures(const TerminationReport& report) {
    for (const auto& failure : report.failures) {
        err_ << std::format("Failed to {} PID {}: {}\n",
                            failure.forced ? "force kill" : "signal",
                            failure.pid, failure.error_message);
    }
}

int App::run() {
    const std::string& name = config_.display_name;
    ProcessFinder finder(process_provider_);

    out_ << std::format("Finding all {} processes...\n", name);
    const ProcessSet targets = finder.find(config_.pattern);
    report_parse_errors();

    if (targets.empty()) {
        out_ << std::format("No {} processes found.\n", name);
        return 0;
    }

    out_ << std::format("Found the following {} processes:\n", name);
    ProcessReporter reporter(process_provider_, out_);
    reporter.report(targets);

    ConfirmationGate gate(in_, out_);
    if (!gate.confirm("Do you want to kill these processes? (y/n): ")) {
        out_ << "Operation cancelled.\n";
        return 0;
    }

    out_ << std::format("Killing all {} processes...\n", name);
    out_.flush();

    Terminator terminator(killer_, &finder, config_.grace_delay, sleep_);
    terminator.set_on_state_change([this](TerminatorState state) {
        if (state == TerminatorState::RequestedForced) {
            out_ << "Some processes are still running. Attempting to force kill...\n";
            out_.flush();
        }
    });

    const TerminationReport report = terminator.run(targets, config_.pattern);
    report_parse_errors();
    report_signal_failures(report);

    if (report.escalated()) {
        // Survivors of SIGKILL are not re-checked
        out_ << "Force kill completed.\n";
    } else {
        out_ << std::format("All {} processes have been terminated successfully.\n", name);
    }
    return 0;
}

} // namespace reap
