#include "clikit/platform.hpp"

#include <cstdlib>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace clikit {

ShellResult run_shell_command(const std::string& command) {
    ShellResult result;

    int status = std::system(command.c_str());
    if (status == -1) {
        result.error = "could not start shell for: " + command;
        return result;
    }

#ifdef _WIN32
    result.exit_code = status;
    result.ok = true;
#else
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }
#endif

    return result;
}

std::string shell_quote(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace clikit
