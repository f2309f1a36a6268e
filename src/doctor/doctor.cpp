#include "clikit/doctor.hpp"
#include "clikit/discovery.hpp"
#include "clikit/platform.hpp"
#include "clikit/secrets.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <map>

namespace clikit {

namespace fs = std::filesystem;

const char* check_status_to_string(CheckStatus status) {
    switch (status) {
        case CheckStatus::Pass: return "pass";
        case CheckStatus::Warn: return "warn";
        case CheckStatus::Fail: return "fail";
    }
    return "fail";
}

DoctorEnvironment make_doctor_environment(const std::string& project_root,
                                          const std::string& commands_dir,
                                          const nlohmann::json& config) {
    DoctorEnvironment env;
    env.project_root = project_root;
    env.config_paths = default_config_paths(project_root);
    env.commands_dir = commands_dir;

    if (auto markers = lookup_key(config, "doctor.hook_markers"); markers && markers->is_array()) {
        env.hook_markers.clear();
        for (const auto& m : *markers) {
            if (m.is_string()) env.hook_markers.push_back(m.get<std::string>());
        }
    }
    env.hook_installer = config_string(config, "doctor.hook_installer", env.hook_installer);
    return env;
}

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string env_file(const DoctorEnvironment& env) {
    return (fs::path(env.project_root) / ".env").string();
}

std::string env_example_file(const DoctorEnvironment& env) {
    return (fs::path(env.project_root) / ".env.example").string();
}

std::string hook_file(const DoctorEnvironment& env) {
    return (fs::path(env.project_root) / ".git" / "hooks" / "pre-commit").string();
}

std::map<std::string, std::string> load_dotenv_map(const std::string& path) {
    std::map<std::string, std::string> values;
    if (auto content = read_file(path)) {
        for (auto& entry : parse_dotenv(*content)) {
            values[entry.key] = entry.value;
        }
    }
    return values;
}

} // namespace

// ============================================================================
// Checks
// ============================================================================

CheckResult check_cxx_compiler(const DoctorEnvironment&) {
    CheckResult r;
    r.name = "C++ compiler";
    for (const char* candidate : {"c++", "g++", "clang++"}) {
        if (auto path = find_executable(candidate)) {
            r.status = CheckStatus::Pass;
            r.message = std::string(candidate) + " found at " + *path;
            r.detail = "searched PATH for c++, g++, clang++";
            return r;
        }
    }
    r.status = CheckStatus::Fail;
    r.message = "no C++ compiler found on PATH";
    r.detail = "searched PATH for c++, g++, clang++";
    return r;
}

CheckResult check_cmake_installed(const DoctorEnvironment&) {
    CheckResult r;
    r.name = "CMake installed";
    auto path = find_executable("cmake");
    r.status = path ? CheckStatus::Pass : CheckStatus::Fail;
    r.message = path ? "found at " + *path : "cmake not found on PATH";
    r.detail = "find_executable(\"cmake\") = " + (path ? *path : std::string("none"));
    return r;
}

CheckResult check_config_parseable(const DoctorEnvironment& env) {
    CheckResult r;
    r.name = "Config parseable";
    auto loaded = load_config(env.config_paths);
    if (loaded.ok) {
        r.status = CheckStatus::Pass;
        r.message = "configuration loaded successfully";
        r.detail = loaded.sources.empty() ? "defaults only" : join(loaded.sources, ", ");
    } else {
        r.status = CheckStatus::Fail;
        r.message = "failed to load configuration";
        r.detail = loaded.error;
    }
    return r;
}

CheckResult check_env_exists(const DoctorEnvironment& env) {
    CheckResult r;
    r.name = ".env exists";
    std::string path = env_file(env);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        r.status = CheckStatus::Fail;
        r.message = ".env file not found";
        r.detail = "expected at " + path;
        r.fixable = true;
        return r;
    }

    auto size = fs::file_size(path, ec);
    if (ec || size == 0) {
        r.status = CheckStatus::Warn;
        r.message = ".env file is empty";
        r.detail = "file at " + path + " has 0 bytes";
        r.fixable = true;
        return r;
    }

    r.status = CheckStatus::Pass;
    r.message = ".env file found";
    r.detail = path + " (" + std::to_string(size) + " bytes)";
    return r;
}

CheckResult check_api_keys(const DoctorEnvironment& env) {
    CheckResult r;
    r.name = "API keys";

    if (!path_exists(env_example_file(env))) {
        r.status = CheckStatus::Warn;
        r.message = "no .env.example to compare against";
        r.detail = "create .env.example to enable this check";
        return r;
    }
    if (!path_exists(env_file(env))) {
        r.status = CheckStatus::Fail;
        r.message = ".env missing - cannot check keys";
        return r;
    }

    auto actual = load_dotenv_map(env_file(env));
    auto example = load_dotenv_map(env_example_file(env));

    std::vector<std::string> missing;
    std::vector<std::string> placeholder;
    for (const auto& [key, example_value] : example) {
        auto it = actual.find(key);
        if (it == actual.end() || it->second.empty()) {
            missing.push_back(key);
        } else if (!example_value.empty() && it->second == example_value) {
            placeholder.push_back(key);
        }
    }

    if (!missing.empty()) {
        r.status = CheckStatus::Fail;
        r.message = std::to_string(missing.size()) + " key(s) missing: " + join(missing, ", ");
        r.detail = "missing: [" + join(missing, ", ") + "], placeholder: [" +
                   join(placeholder, ", ") + "]";
        return r;
    }
    if (!placeholder.empty()) {
        r.status = CheckStatus::Warn;
        r.message = std::to_string(placeholder.size()) + " key(s) still have placeholder values";
        r.detail = "placeholder: [" + join(placeholder, ", ") + "]";
        return r;
    }

    r.status = CheckStatus::Pass;
    r.message = "all keys set";
    r.detail = "checked " + std::to_string(example.size()) + " key(s)";
    return r;
}

CheckResult check_git_hooks(const DoctorEnvironment& env) {
    CheckResult r;
    r.name = "Pre-commit hooks";
    std::string path = hook_file(env);

    auto content = read_file(path);
    if (!content) {
        r.status = CheckStatus::Fail;
        r.message = "pre-commit hook not installed";
        r.detail = "expected at " + path;
        r.fixable = true;
        return r;
    }

    for (const auto& marker : env.hook_markers) {
        if (content->find(marker) != std::string::npos) {
            r.status = CheckStatus::Pass;
            r.message = marker + " hook installed";
            return r;
        }
    }

    r.status = CheckStatus::Warn;
    r.message = "pre-commit hook exists but is not managed by a hook framework";
    r.detail = "hook content mentions none of: " + join(env.hook_markers, ", ");
    return r;
}

CheckResult check_git_repo(const DoctorEnvironment& env) {
    CheckResult r;
    r.name = "Git repo";
    auto git_dir = fs::path(env.project_root) / ".git";
    std::error_code ec;
    bool found = fs::is_directory(git_dir, ec);
    r.status = found ? CheckStatus::Pass : CheckStatus::Fail;
    r.message = found ? "git repository found" : ".git/ directory not found";
    r.detail = "checked " + git_dir.string();
    return r;
}

CheckResult check_commands_dir(const DoctorEnvironment& env) {
    CheckResult r;
    r.name = "Commands directory";

    std::error_code ec;
    if (env.commands_dir.empty() || !fs::is_directory(env.commands_dir, ec)) {
        r.status = CheckStatus::Warn;
        r.message = "commands directory not found; no extensions will load";
        r.detail = "expected at " + (env.commands_dir.empty() ? std::string("(unset)") : env.commands_dir);
        return r;
    }

    auto modules = enumerate_modules(env.commands_dir);
    r.status = CheckStatus::Pass;
    r.message = std::to_string(modules.size()) + " extension module(s) found";
    r.detail = env.commands_dir;
    return r;
}

std::vector<CheckResult> run_all_checks(const DoctorEnvironment& env) {
    return {
        check_cxx_compiler(env),
        check_cmake_installed(env),
        check_config_parseable(env),
        check_env_exists(env),
        check_api_keys(env),
        check_git_hooks(env),
        check_git_repo(env),
        check_commands_dir(env),
    };
}

bool has_failures(const std::vector<CheckResult>& results) {
    for (const auto& r : results) {
        if (r.status == CheckStatus::Fail) return true;
    }
    return false;
}

// ============================================================================
// Fixers
// ============================================================================

bool fix_env_file(const DoctorEnvironment& env) {
    std::string target = env_file(env);
    std::string example = env_example_file(env);

    std::error_code ec;
    if (fs::exists(target, ec)) {
        // An empty .env is refilled from the example when there is one
        if (fs::file_size(target, ec) != 0 || !fs::exists(example, ec)) return false;
    }

    std::string content;
    if (auto example_content = read_file(example)) {
        content = *example_content;
    }

    auto write = atomic_write_file(target, content, 0600);
    if (!write.ok) {
        spdlog::warn("could not write {}: {}", target, write.error);
        return false;
    }
    return true;
}

HookInstallResult install_git_hooks(const std::string& project_root, const std::string& installer) {
    HookInstallResult result;
    if (installer.empty()) {
        result.error = "no hook installer configured (doctor.hook_installer)";
        return result;
    }

    std::string program = installer.substr(0, installer.find(' '));
    if (!find_executable(program)) {
        result.error = program + " not found on PATH";
        return result;
    }

    auto run = run_shell_command("cd " + shell_quote(project_root) + " && " + installer);
    if (!run.ok) {
        result.error = run.error;
        return result;
    }
    if (run.exit_code != 0) {
        result.error = installer + " exited with status " + std::to_string(run.exit_code);
        return result;
    }

    result.ok = true;
    return result;
}

bool fix_git_hooks(const DoctorEnvironment& env) {
    auto result = install_git_hooks(env.project_root, env.hook_installer);
    if (!result.ok) {
        spdlog::warn("cannot install hooks: {}", result.error);
        return false;
    }
    return true;
}

FixerFn find_fixer(const std::string& check_name) {
    if (check_name == ".env exists") return fix_env_file;
    if (check_name == "Pre-commit hooks") return fix_git_hooks;
    return {};
}

std::vector<CheckResult> attempt_fixes(const std::vector<CheckResult>& results,
                                       const DoctorEnvironment& env,
                                       std::ostream* progress) {
    bool fixed_any = false;
    for (const auto& r : results) {
        if (r.status == CheckStatus::Pass || !r.fixable) continue;
        auto fixer = find_fixer(r.name);
        if (!fixer) continue;

        if (progress) *progress << "  Fixing: " << r.name << "...\n";
        if (fixer(env)) fixed_any = true;
    }

    if (fixed_any) return run_all_checks(env);
    return results;
}

nlohmann::json results_to_rows(const std::vector<CheckResult>& results, bool verbose) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& r : results) {
        nlohmann::json row;
        row["Check"] = r.name;
        row["Status"] = check_status_to_string(r.status);
        row["Message"] = r.message;
        if (verbose) {
            row["Detail"] = r.detail;
            row["Fixable"] = r.fixable ? "yes" : "";
        }
        rows.push_back(row);
    }
    return rows;
}

} // namespace clikit
