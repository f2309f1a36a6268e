#pragma once

/**
 * @file doctor.hpp
 * @brief Project environment health checks
 *
 * Each check inspects one aspect of the project (toolchain, config, .env,
 * git hooks, ...) and reports pass / warn / fail. Some failures can be fixed
 * automatically; attempt_fixes() runs those fixers and re-checks.
 */

#include "clikit/config.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace clikit {

enum class CheckStatus {
    Pass,
    Warn,
    Fail
};

const char* check_status_to_string(CheckStatus status);

struct CheckResult {
    std::string name;
    CheckStatus status = CheckStatus::Fail;
    std::string message;
    std::string detail;
    bool fixable = false;
};

/// Everything the checks look at
struct DoctorEnvironment {
    std::string project_root;
    ConfigPaths config_paths;
    std::string commands_dir;
    std::vector<std::string> hook_markers{"pre-commit", "prek"};
    std::string hook_installer = "pre-commit install";
};

/// Build the environment from the merged config
DoctorEnvironment make_doctor_environment(const std::string& project_root,
                                          const std::string& commands_dir,
                                          const nlohmann::json& config);

// ============================================================================
// Checks
// ============================================================================

CheckResult check_cxx_compiler(const DoctorEnvironment& env);
CheckResult check_cmake_installed(const DoctorEnvironment& env);
CheckResult check_config_parseable(const DoctorEnvironment& env);
CheckResult check_env_exists(const DoctorEnvironment& env);
CheckResult check_api_keys(const DoctorEnvironment& env);
CheckResult check_git_hooks(const DoctorEnvironment& env);
CheckResult check_git_repo(const DoctorEnvironment& env);
CheckResult check_commands_dir(const DoctorEnvironment& env);

/// Every check, in report order
std::vector<CheckResult> run_all_checks(const DoctorEnvironment& env);

bool has_failures(const std::vector<CheckResult>& results);

// ============================================================================
// Fixers
// ============================================================================

using FixerFn = std::function<bool(const DoctorEnvironment&)>;

/// Copy .env.example to .env, or create an empty .env when there is no example
bool fix_env_file(const DoctorEnvironment& env);

/// Run the configured hook installer in the project root
bool fix_git_hooks(const DoctorEnvironment& env);

struct HookInstallResult {
    bool ok = false;
    std::string error;
};

/**
 * @brief Run a hook installer command line from inside `project_root`.
 *
 * Fails without running anything when `installer` is empty or its program
 * (the first word) is not on PATH. A non-zero exit status is a failure.
 */
HookInstallResult install_git_hooks(const std::string& project_root, const std::string& installer);

/// Fixer registered for a check name; empty function when none
FixerFn find_fixer(const std::string& check_name);

/**
 * @brief Run fixers for fixable non-passing results.
 *
 * Progress lines ("  Fixing: <name>...") go to `progress` when non-null.
 * When any fixer succeeds every check is re-run and the fresh results are
 * returned; otherwise `results` is returned unchanged.
 */
std::vector<CheckResult> attempt_fixes(const std::vector<CheckResult>& results,
                                       const DoctorEnvironment& env,
                                       std::ostream* progress);

/// Table rows (Check/Status/Message, plus Detail/Fixable when verbose)
nlohmann::json results_to_rows(const std::vector<CheckResult>& results, bool verbose);

} // namespace clikit
