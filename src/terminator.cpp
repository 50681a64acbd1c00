#include "terminator.hpp"
#include <stdexcept>
#include <thread>
#include <utility>

namespace reap {

const char* to_string(TerminatorState state) {
    switch (state) {
        case TerminatorState::Idle: return "Idle";
        case TerminatorState::RequestedGraceful: return "RequestedGraceful";
        case TerminatorState::Verifying: return "Verifying";
        case TerminatorState::RequestedForced: return "RequestedForced";
        case TerminatorState::Done: return "Done";
    }
    return "Unknown";
}

TerminatorState next_state(TerminatorState current, bool survivors_found) {
    switch (current) {
        case TerminatorState::Idle:
            return TerminatorState::RequestedGraceful;
        case TerminatorState::RequestedGraceful:
            return TerminatorState::Verifying;
        case TerminatorState::Verifying:
            return survivors_found ? TerminatorState::RequestedForced : TerminatorState::Done;
        case TerminatorState::RequestedForced:
        case TerminatorState::Done:
            return TerminatorState::Done;
    }
    return TerminatorState::Done;
}

Terminator::Terminator(IProcessKiller* killer, ProcessFinder* finder,
                       std::chrono::milliseconds grace_delay, SleepFunction sleep)
    : killer_(killer), finder_(finder), grace_delay_(grace_delay), sleep_(std::move(sleep)) {
    if (!killer_ || !finder_) {
        throw std::invalid_argument("Terminator requires a process killer and a process finder");
    }
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

void Terminator::set_on_state_change(StateCallback callback) {
    on_state_change_ = std::move(callback);
}

void Terminator::enter(TerminatorState next) {
    state_ = next;
    if (on_state_change_) {
        on_state_change_(state_);
    }
}

void Terminator::deliver(const ProcessSet& pids, bool force, TerminationReport& report) {
    // Keep going after a failure so one protected PID does not shield the rest
    for (const int pid : pids) {
        KillResult result = killer_->kill_process(pid, force);
        if (result.success || result.process_not_found) continue;
        report.failures.push_back({pid, force, std::move(result.error_message)});
    }
}

TerminationReport Terminator::run(const ProcessSet& targets, const std::string& pattern) {
    if (state_ != TerminatorState::Idle) {
        throw std::logic_error("Terminator has already run");
    }

    TerminationReport report;
    report.graceful_targets = targets;

    while (state_ != TerminatorState::Done) {
        switch (state_) {
            case TerminatorState::Idle:
                enter(next_state(state_, false));
                break;

            case TerminatorState::RequestedGraceful:
                deliver(report.graceful_targets, false, report);
                enter(next_state(state_, false));
                break;

            case TerminatorState::Verifying:
                sleep_(grace_delay_);
                report.survivors = finder_->find(pattern);
                enter(next_state(state_, !report.survivors.empty()));
                break;

            case TerminatorState::RequestedForced:
                deliver(report.survivors, true, report);
                enter(next_state(state_, true));
                break;

            case TerminatorState::Done:
                break;
        }
    }

    report.final_state = state_;
    return report;
}

} // namespace reap
