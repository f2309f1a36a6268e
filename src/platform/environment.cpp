#include "clikit/platform.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <sstream>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace clikit {

namespace fs = std::filesystem;

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

bool env_flag_enabled(const std::string& name) {
    auto value = get_env(name);
    if (!value) return false;

    std::string v = *value;
    v.erase(std::remove_if(v.begin(), v.end(),
                           [](unsigned char c) { return std::isspace(c); }),
            v.end());
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "1" || v == "true" || v == "yes";
}

std::string get_home_dir() {
    if (auto home = get_env("HOME")) return *home;
#ifdef _WIN32
    if (auto userprofile = get_env("USERPROFILE")) return *userprofile;
#endif
    return "";
}

std::string get_state_dir() {
    // 1. Explicit override
    if (auto dir = get_env("CLIKIT_STATE_DIR"); dir && !dir->empty()) {
        return *dir;
    }

    // 2. XDG config home
    if (auto xdg = get_env("XDG_CONFIG_HOME"); xdg && !xdg->empty()) {
        return (fs::path(*xdg) / "clikit").string();
    }

    // 3. Default: ~/.config/clikit
    std::string home = get_home_dir();
    if (!home.empty()) {
        return (fs::path(home) / ".config" / "clikit").string();
    }

    return ".clikit";
}

std::string get_project_root() {
    if (auto root = get_env("CLIKIT_PROJECT_ROOT"); root && !root->empty()) {
        return *root;
    }
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    return ec ? std::string(".") : cwd.string();
}

std::optional<std::string> find_executable(const std::string& name) {
    auto path_var = get_env("PATH");
    if (!path_var) return std::nullopt;

#ifdef _WIN32
    const char separator = ';';
    const std::vector<std::string> suffixes = {".exe", ".cmd", ".bat", ""};
#else
    const char separator = ':';
    const std::vector<std::string> suffixes = {""};
#endif

    std::istringstream ss(*path_var);
    std::string dir;
    while (std::getline(ss, dir, separator)) {
        if (dir.empty()) continue;
        for (const auto& suffix : suffixes) {
            fs::path candidate = fs::path(dir) / (name + suffix);
            std::error_code ec;
            if (!fs::is_regular_file(candidate, ec)) continue;
#ifndef _WIN32
            if (access(candidate.c_str(), X_OK) != 0) continue;
#endif
            return candidate.string();
        }
    }
    return std::nullopt;
}

std::string get_hostname() {
#ifdef _WIN32
    char buf[MAX_COMPUTERNAME_LENGTH + 1];
    DWORD size = sizeof(buf);
    if (GetComputerNameA(buf, &size)) {
        return std::string(buf, size);
    }
    return "";
#else
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "";
    }
    return buf;
#endif
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

} // namespace clikit
