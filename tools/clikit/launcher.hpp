/**
 * clikit CLI - process entry flow
 */

#pragma once

#include <clikit/secrets.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace clikit::cli {

struct LauncherIO {
    std::ostream& out;
    std::ostream& err;
    std::istream& in;
};

struct LauncherOptions {
    SecretBackend* secrets = nullptr;   // default: the secrets.backend config key
    bool install_signal_handlers = true;
};

/**
 * Run one invocation: global flags, logging, command tree construction,
 * dispatch and telemetry. `args` excludes the program name.
 *
 * @return process exit status
 */
int run_launcher(const std::vector<std::string>& args, LauncherIO io,
                 const LauncherOptions& options = {});

} // namespace clikit::cli
