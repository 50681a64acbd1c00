#include "confirmation_gate.hpp"

namespace reap {

ConfirmationGate::ConfirmationGate(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
}

bool ConfirmationGate::is_affirmative(std::string_view answer) {
    // Surrounding blanks are dropped, as the shell's read builtin does
    constexpr std::string_view kBlanks = " \t\r\n";
    const size_t begin = answer.find_first_not_of(kBlanks);
    if (begin == std::string_view::npos) return false;
    const size_t end = answer.find_last_not_of(kBlanks);
    answer = answer.substr(begin, end - begin + 1);

    return answer == "y" || answer == "Y";
}

bool ConfirmationGate::confirm(const std::string& prompt) {
    out_ << prompt;
    out_.flush();

    std::string line;
    if (!std::getline(in_, line)) {
        // EOF without an answer; finish the prompt line
        out_ << '\n';
        return false;
    }
    return is_affirmative(line);
}

} // namespace reap
