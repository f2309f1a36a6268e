#pragma once

/**
 * @file secrets.hpp
 * @brief Secret storage behind a pluggable backend
 *
 * The store keeps a sorted list of tracked key names next to the secrets
 * themselves (under the meta key `__secret_keys__`) so `secrets list` can
 * enumerate what was set through the CLI.
 */

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clikit {

/// Service name secrets are stored under
constexpr const char* kSecretService = "clikit";

/// Meta entry holding the JSON array of tracked key names
constexpr const char* kSecretIndexKey = "__secret_keys__";

// ============================================================================
// Backends
// ============================================================================

struct SecretResult {
    bool ok = false;
    std::string error;
};

class SecretBackend {
public:
    virtual ~SecretBackend() = default;

    virtual std::optional<std::string> get(const std::string& service, const std::string& key) = 0;
    virtual SecretResult set(const std::string& service, const std::string& key,
                             const std::string& value) = 0;
    virtual SecretResult remove(const std::string& service, const std::string& key) = 0;
};

/**
 * @brief Per-user JSON file, readable by the owner only (0600)
 *
 * Layout: { "<service>": { "<key>": "<value>", ... } }. Every mutation
 * rewrites the file atomically.
 */
class FileSecretBackend : public SecretBackend {
public:
    explicit FileSecretBackend(std::string path) : path_(std::move(path)) {}

    const std::string& path() const { return path_; }

    std::optional<std::string> get(const std::string& service, const std::string& key) override;
    SecretResult set(const std::string& service, const std::string& key,
                     const std::string& value) override;
    SecretResult remove(const std::string& service, const std::string& key) override;

private:
    std::string path_;
};

/**
 * @brief The desktop keyring (Secret Service API via libsecret)
 *
 * Each secret is an item with the attributes service=<service> and
 * key=<key> in the default collection. Lookups that fail because no
 * keyring daemon is reachable are logged and read as absent; mutations
 * report the keyring's error message.
 */
class KeyringSecretBackend : public SecretBackend {
public:
    std::optional<std::string> get(const std::string& service, const std::string& key) override;
    SecretResult set(const std::string& service, const std::string& key,
                     const std::string& value) override;
    SecretResult remove(const std::string& service, const std::string& key) override;
};

/// Process-local backend for tests
class MemorySecretBackend : public SecretBackend {
public:
    std::optional<std::string> get(const std::string& service, const std::string& key) override;
    SecretResult set(const std::string& service, const std::string& key,
                     const std::string& value) override;
    SecretResult remove(const std::string& service, const std::string& key) override;

private:
    std::map<std::string, std::map<std::string, std::string>> entries_;
};

/// Backend names accepted by `secrets.backend`
constexpr const char* kKeyringBackend = "keyring";
constexpr const char* kFileBackend = "file";

/**
 * @brief Create the backend selected by name.
 *
 * "keyring" (the default) uses the OS keyring; "file" stores secrets in
 * <state dir>/secrets.json. Returns nullptr for any other name.
 */
std::unique_ptr<SecretBackend> make_secret_backend(const std::string& name,
                                                   const std::string& state_dir);

// ============================================================================
// Secret Store
// ============================================================================

class SecretStore {
public:
    explicit SecretStore(SecretBackend& backend, std::string service = kSecretService)
        : backend_(backend), service_(std::move(service)) {}

    std::optional<std::string> get(const std::string& key);

    /// Store a value and add the key to the tracked list
    SecretResult set(const std::string& key, const std::string& value);

    /// Remove a value; ok=false with "Not found: <key>" when absent
    SecretResult remove(const std::string& key);

    /// Tracked key names, sorted
    std::vector<std::string> tracked_keys();

private:
    SecretResult write_index(const std::vector<std::string>& keys);

    SecretBackend& backend_;
    std::string service_;
};

// ============================================================================
// Helpers
// ============================================================================

/// Values of 8 characters or fewer become all '*'; longer keep 3 chars each side
std::string mask_value(const std::string& value);

struct DotenvEntry {
    std::string key;
    std::string value;
};

/**
 * @brief Parse .env text: KEY=VALUE lines, '#' comments, optional
 *        `export ` prefix, single or double quoted values.
 */
std::vector<DotenvEntry> parse_dotenv(const std::string& content);

/// True for values `secrets import` skips: empty or a "..." placeholder
bool is_placeholder_value(const std::string& value);

/// Quote a value for a .env line when it contains spaces, '#' or quotes
std::string format_dotenv_line(const std::string& key, const std::string& value);

} // namespace clikit
