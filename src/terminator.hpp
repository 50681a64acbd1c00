#pragma once

#include "interfaces/i_process_killer.hpp"
#include "process_finder.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace reap {

// Idle -> RequestedGraceful -> Verifying -> [Done | RequestedForced -> Done]
enum class TerminatorState {
    Idle,
    RequestedGraceful,
    Verifying,
    RequestedForced,
    Done
};

const char* to_string(TerminatorState state);

// Pure transition function. survivors_found only matters when leaving Verifying.
// Done is terminal and nothing ever leads back to RequestedGraceful.
TerminatorState next_state(TerminatorState current, bool survivors_found);

struct SignalFailure {
    int pid = 0;
    bool forced = false;
    std::string error_message;
};

struct TerminationReport {
    ProcessSet graceful_targets;
    ProcessSet survivors;                 // Liveness re-check result, SIGKILL targets
    std::vector<SignalFailure> failures;  // ESRCH is not a failure
    TerminatorState final_state = TerminatorState::Idle;

    [[nodiscard]] bool escalated() const { return !survivors.empty(); }
};

// Two-phase escalation: SIGTERM everything, wait, re-scan, SIGKILL whatever
// is still there. Runs once; there is no retry loop.
class Terminator {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;
    using StateCallback = std::function<void(TerminatorState)>;

    // An empty sleep function means std::this_thread::sleep_for
    Terminator(IProcessKiller* killer, ProcessFinder* finder,
               std::chrono::milliseconds grace_delay, SleepFunction sleep = {});

    // Throws std::logic_error when called a second time
    TerminationReport run(const ProcessSet& targets, const std::string& pattern);

    // Invoked on every state entry, before that state's action runs
    void set_on_state_change(StateCallback callback);

    [[nodiscard]] TerminatorState state() const { return state_; }

private:
    void enter(TerminatorState next);
    void deliver(const ProcessSet& pids, bool force, TerminationReport& report);

    IProcessKiller* killer_;
    ProcessFinder* finder_;
    std::chrono::milliseconds grace_delay_;
    SleepFunction sleep_;
    StateCallback on_state_change_;
    TerminatorState state_ = TerminatorState::Idle;
};

} // namespace reap
