#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <string_view>

namespace reap {

// Blocking y/n prompt. Only "y" or "Y" counts as consent; anything else,
// including an empty line or end of input, is a decline.
class ConfirmationGate {
public:
    ConfirmationGate(std::istream& in, std::ostream& out);

    bool confirm(const std::string& prompt);

    [[nodiscard]] static bool is_affirmative(std::string_view answer);

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace reap
