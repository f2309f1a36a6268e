#pragma once

#include <clikit/execution_context.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <random>
#include <sstream>
#include <string>

#ifndef CLIKIT_TEST_EXTENSIONS_DIR
#define CLIKIT_TEST_EXTENSIONS_DIR "test_extensions"
#endif

namespace clikit_test {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::uniform_int_distribution<unsigned long> dist;
        path_ = fs::temp_directory_path() / ("clikit_test_" + std::to_string(dist(rd)));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

    void write(const std::string& name, const std::string& content) const {
        fs::path target = path_ / name;
        fs::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary);
        out << content;
    }

private:
    fs::path path_;
};

// Sets (or unsets) an environment variable for the lifetime of the object
class ScopedEnv {
public:
    ScopedEnv(const std::string& name, const std::optional<std::string>& value) : name_(name) {
        if (const char* old = std::getenv(name.c_str())) previous_ = old;
        apply(value);
    }

    ~ScopedEnv() { apply(previous_); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
#ifdef _WIN32
        _putenv_s(name_.c_str(), value ? value->c_str() : "");
#else
        if (value) {
            setenv(name_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
#endif
    }

    std::string name_;
    std::optional<std::string> previous_;
};

// Execution context writing to string streams
struct CapturedContext {
    std::ostringstream out;
    std::ostringstream err;
    std::istringstream in;
    clikit::ExecutionContext ctx;

    explicit CapturedContext(clikit::Verbosity verbosity = clikit::Verbosity::Normal,
                             clikit::OutputFormat format = clikit::OutputFormat::Table,
                             bool dry_run = false, const std::string& input = "")
        : in(input), ctx(verbosity, format, dry_run) {
        ctx.with_streams(out, err, in);
    }
};

inline std::string extensions_dir() {
    return CLIKIT_TEST_EXTENSIONS_DIR;
}

inline std::string module_file(const std::string& identifier) {
#if defined(_WIN32)
    return identifier + ".dll";
#elif defined(__APPLE__)
    return identifier + ".dylib";
#else
    return identifier + ".so";
#endif
}

// Copy selected fixture modules into `dir`
inline void stage_modules(const TempDir& dir, std::initializer_list<const char*> identifiers) {
    for (const char* id : identifiers) {
        fs::copy_file(fs::path(extensions_dir()) / module_file(id), fs::path(dir.path()) / module_file(id),
                      fs::copy_options::overwrite_existing);
    }
}

} // namespace clikit_test
