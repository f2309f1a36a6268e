#include "clikit/prompt.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#ifndef _WIN32
#include <termios.h>
#include <unistd.h>
#endif

namespace clikit {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

#ifndef _WIN32
// Restores the terminal mode on scope exit
class EchoGuard {
public:
    EchoGuard() {
        if (tcgetattr(STDIN_FILENO, &saved_) == 0) {
            termios silent = saved_;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            active_ = tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
        }
    }
    ~EchoGuard() {
        if (active_) tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

private:
    termios saved_{};
    bool active_ = false;
};
#endif

} // namespace

std::optional<std::string> Prompter::read_line() const {
    std::string line;
    if (!std::getline(ctx_.in(), line)) return std::nullopt;
    return trim(line);
}

std::optional<std::string> Prompter::ask(const std::string& question,
                                         const std::string& default_value) const {
    ctx_.err() << question;
    if (!default_value.empty()) ctx_.err() << " [" << default_value << "]";
    ctx_.err() << ": " << std::flush;

    auto answer = read_line();
    if (!answer) return std::nullopt;
    return answer->empty() ? default_value : *answer;
}

std::optional<std::string> Prompter::ask_secret(const std::string& question) const {
    ctx_.err() << question << ": " << std::flush;

#ifndef _WIN32
    if (&ctx_.in() == &std::cin && isatty(STDIN_FILENO)) {
        std::optional<std::string> answer;
        {
            EchoGuard guard;
            answer = read_line();
        }
        ctx_.err() << "\n";
        return answer;
    }
#endif
    return read_line();
}

std::optional<size_t> Prompter::choose(const std::string& question,
                                       const std::vector<std::string>& options,
                                       size_t default_index) const {
    ctx_.err() << question << "\n";
    for (size_t i = 0; i < options.size(); ++i) {
        ctx_.err() << "  " << (i + 1) << ") " << options[i] << "\n";
    }

    while (true) {
        ctx_.err() << "Choice [" << (default_index + 1) << "]: " << std::flush;
        auto answer = read_line();
        if (!answer) return std::nullopt;
        if (answer->empty()) return default_index;

        bool numeric = std::all_of(answer->begin(), answer->end(),
                                   [](unsigned char c) { return std::isdigit(c); });
        if (numeric && answer->size() < 6) {
            size_t pick = std::stoul(*answer);
            if (pick >= 1 && pick <= options.size()) return pick - 1;
        }
        ctx_.err() << "Please enter a number between 1 and " << options.size() << ".\n";
    }
}

std::optional<bool> Prompter::confirm(const std::string& question, bool default_value) const {
    while (true) {
        ctx_.err() << question << (default_value ? " [Y/n]: " : " [y/N]: ") << std::flush;
        auto answer = read_line();
        if (!answer) return std::nullopt;
        if (answer->empty()) return default_value;

        std::string lower = *answer;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == "y" || lower == "yes") return true;
        if (lower == "n" || lower == "no") return false;
        ctx_.err() << "Please answer y or n.\n";
    }
}

} // namespace clikit
