#pragma once

#include <chrono>
#include <string>

namespace reap {

// Generic parse/error info surfaced from data providers
struct ParseError {
    std::chrono::steady_clock::time_point timestamp;
    std::string message;
};

} // namespace reap
