#include "clikit/discovery.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace clikit {

namespace fs = std::filesystem;

// ============================================================================
// Naming
// ============================================================================

bool is_private_identifier(const std::string& identifier) {
    return !identifier.empty() && identifier[0] == '_';
}

bool is_valid_identifier(const std::string& identifier) {
    if (identifier.empty()) return false;
    if (identifier[0] < 'a' || identifier[0] > 'z') return false;
    return std::all_of(identifier.begin(), identifier.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    });
}

std::string derive_command_token(const std::string& identifier) {
    std::string token = identifier;
    std::replace(token.begin(), token.end(), '_', '-');
    return token;
}

// ============================================================================
// Module Loading
// ============================================================================

const char* module_suffix() {
#if defined(_WIN32)
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

namespace {

std::string last_load_error() {
#ifdef _WIN32
    DWORD code = GetLastError();
    return "error code " + std::to_string(code);
#else
    const char* msg = dlerror();
    return msg ? msg : "unknown error";
#endif
}

} // namespace

ModuleHandle::ModuleHandle(std::string identifier, std::string path, void* native)
    : identifier_(std::move(identifier)), path_(std::move(path)), native_(native) {}

ModuleHandle::~ModuleHandle() {
    if (!native_) return;
#ifdef _WIN32
    FreeLibrary(static_cast<HMODULE>(native_));
#else
    dlclose(native_);
#endif
}

void* ModuleHandle::symbol(const char* name) const {
#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(static_cast<HMODULE>(native_), name));
#else
    return dlsym(native_, name);
#endif
}

std::vector<ModuleCandidate> enumerate_modules(const std::string& directory) {
    std::vector<ModuleCandidate> candidates;

    std::error_code ec;
    if (directory.empty() || !fs::is_directory(directory, ec)) {
        spdlog::debug("commands directory {} not found; nothing to discover", directory);
        return candidates;
    }

    const std::string suffix = module_suffix();
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().extension().string() != suffix) continue;

        std::string identifier = entry.path().stem().string();
        if (identifier.empty() || is_private_identifier(identifier)) continue;

        candidates.push_back({identifier, entry.path().string()});
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const ModuleCandidate& a, const ModuleCandidate& b) {
                  return a.identifier < b.identifier;
              });
    return candidates;
}

std::shared_ptr<ModuleHandle> load_module(const ModuleCandidate& candidate) {
#ifdef _WIN32
    void* native = reinterpret_cast<void*>(LoadLibraryA(candidate.path.c_str()));
#else
    void* native = dlopen(candidate.path.c_str(), RTLD_NOW | RTLD_LOCAL);
#endif
    if (!native) {
        throw ModuleLoadError(candidate.path, last_load_error());
    }
    return std::make_shared<ModuleHandle>(candidate.identifier, candidate.path, native);
}

UnitKind classify_module(const ModuleHandle& module) {
    if (module.symbol(kGroupSymbol)) return UnitKind::ActionGroup;
    if (module.symbol(kActionSymbol)) return UnitKind::SingleAction;
    return UnitKind::Invalid;
}

// ============================================================================
// Discovery
// ============================================================================

namespace {

void warn_invalid(const ModuleCandidate& candidate) {
    spdlog::warn("{} has no '{}' (group) or '{}' (action) entry point - skipped",
                 candidate.path, kGroupSymbol, kActionSymbol);
}

// Register one loaded module; returns false when it has no usable shape
bool register_module(CommandTree& tree, const std::shared_ptr<ModuleHandle>& module,
                     const std::string& token) {
    switch (classify_module(*module)) {
        case UnitKind::ActionGroup: {
            auto factory = reinterpret_cast<GroupFactoryFn>(module->symbol(kGroupSymbol));
            std::unique_ptr<CommandGroup> group(factory());
            if (!group) return false;

            std::string help;
            if (auto doc = reinterpret_cast<DocFn>(module->symbol(kDocSymbol))) {
                if (const char* text = doc()) help = text;
            }
            tree.adopt_module(module);
            tree.register_group(token, std::move(group), help);
            return true;
        }
        case UnitKind::SingleAction: {
            auto factory = reinterpret_cast<ActionFactoryFn>(module->symbol(kActionSymbol));
            std::unique_ptr<Action> action(factory());
            if (!action) return false;

            tree.adopt_module(module);
            tree.register_action(token, std::move(action));
            return true;
        }
        case UnitKind::Invalid:
            break;
    }
    return false;
}

} // namespace

DiscoveryReport discover_commands(CommandTree& tree, const std::string& directory) {
    DiscoveryReport report;

    if (tree.phase_complete(RegistrationPhase::Discovered)) {
        report.skipped_scan = true;
        return report;
    }
    tree.complete_phase(RegistrationPhase::Discovered);

    for (const auto& candidate : enumerate_modules(directory)) {
        if (!is_valid_identifier(candidate.identifier)) {
            spdlog::warn("{} is not a valid command name (use [a-z][a-z0-9_]*) - skipped",
                         candidate.path);
            report.rejected.push_back(candidate.identifier);
            continue;
        }

        auto module = load_module(candidate);
        std::string token = derive_command_token(candidate.identifier);

        if (register_module(tree, module, token)) {
            spdlog::debug("registered {} '{}' from {}",
                          unit_kind_to_string(classify_module(*module)), token, candidate.path);
            report.registered.push_back(token);
        } else {
            warn_invalid(candidate);
            report.invalid.push_back(candidate.identifier);
        }
    }

    return report;
}

} // namespace clikit
