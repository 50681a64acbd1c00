#pragma once

#include <chrono>
#include <string>

namespace reap {

// Fixed parameters of a run. The tool takes no flags, environment or config
// file; tests construct other values.
struct ReapConfig {
    std::string pattern = "ollama";        // Matched against full command lines
    std::string display_name = "Ollama";   // Used in user-facing messages
    std::chrono::milliseconds grace_delay{2000};
};

} // namespace reap
