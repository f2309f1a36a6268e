#include "clikit/secrets.hpp"
#include "clikit/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace clikit {

// ============================================================================
// File Backend
// ============================================================================

namespace {

// A corrupt store is reported and treated as empty so `set` can repair it
nlohmann::json load_store(const std::string& path) {
    auto content = read_file(path);
    if (!content) return nlohmann::json::object();
    try {
        auto store = nlohmann::json::parse(*content);
        if (store.is_object()) return store;
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("secret store {} is unreadable: {}", path, e.what());
    }
    return nlohmann::json::object();
}

SecretResult save_store(const std::string& path, const nlohmann::json& store) {
    SecretResult result;
    auto write = atomic_write_file(path, store.dump(2) + "\n", 0600);
    if (!write.ok) {
        result.error = write.error;
        return result;
    }
    result.ok = true;
    return result;
}

} // namespace

std::optional<std::string> FileSecretBackend::get(const std::string& service, const std::string& key) {
    auto store = load_store(path_);
    if (!store.contains(service) || !store[service].is_object()) return std::nullopt;
    const auto& entries = store[service];
    if (!entries.contains(key) || !entries[key].is_string()) return std::nullopt;
    return entries[key].get<std::string>();
}

SecretResult FileSecretBackend::set(const std::string& service, const std::string& key,
                                    const std::string& value) {
    auto store = load_store(path_);
    if (!store[service].is_object()) {
        store[service] = nlohmann::json::object();
    }
    store[service][key] = value;
    return save_store(path_, store);
}

SecretResult FileSecretBackend::remove(const std::string& service, const std::string& key) {
    auto store = load_store(path_);
    if (!store.contains(service) || !store[service].is_object() || !store[service].contains(key)) {
        return {false, "Not found: " + key};
    }
    store[service].erase(key);
    return save_store(path_, store);
}

// ============================================================================
// Memory Backend
// ============================================================================

std::optional<std::string> MemorySecretBackend::get(const std::string& service, const std::string& key) {
    auto svc = entries_.find(service);
    if (svc == entries_.end()) return std::nullopt;
    auto it = svc->second.find(key);
    if (it == svc->second.end()) return std::nullopt;
    return it->second;
}

SecretResult MemorySecretBackend::set(const std::string& service, const std::string& key,
                                      const std::string& value) {
    entries_[service][key] = value;
    return {true, ""};
}

SecretResult MemorySecretBackend::remove(const std::string& service, const std::string& key) {
    auto svc = entries_.find(service);
    if (svc == entries_.end() || svc->second.erase(key) == 0) {
        return {false, "Not found: " + key};
    }
    return {true, ""};
}

std::unique_ptr<SecretBackend> make_secret_backend(const std::string& name,
                                                   const std::string& state_dir) {
    if (name == kKeyringBackend) {
        return std::make_unique<KeyringSecretBackend>();
    }
    if (name == kFileBackend) {
        return std::make_unique<FileSecretBackend>(
            (std::filesystem::path(state_dir) / "secrets.json").string());
    }
    return nullptr;
}

// ============================================================================
// Secret Store
// ============================================================================

std::optional<std::string> SecretStore::get(const std::string& key) {
    return backend_.get(service_, key);
}

std::vector<std::string> SecretStore::tracked_keys() {
    std::vector<std::string> keys;
    auto raw = backend_.get(service_, kSecretIndexKey);
    if (!raw) return keys;

    try {
        auto index = nlohmann::json::parse(*raw);
        if (index.is_array()) {
            for (const auto& k : index) {
                if (k.is_string()) keys.push_back(k.get<std::string>());
            }
        }
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("tracked secret list is unreadable: {}", e.what());
    }

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

SecretResult SecretStore::write_index(const std::vector<std::string>& keys) {
    return backend_.set(service_, kSecretIndexKey, nlohmann::json(keys).dump());
}

SecretResult SecretStore::set(const std::string& key, const std::string& value) {
    if (key.empty() || key == kSecretIndexKey) {
        return {false, "invalid secret key: " + key};
    }

    auto result = backend_.set(service_, key, value);
    if (!result.ok) return result;

    auto keys = tracked_keys();
    if (!std::binary_search(keys.begin(), keys.end(), key)) {
        keys.push_back(key);
        std::sort(keys.begin(), keys.end());
        return write_index(keys);
    }
    return result;
}

SecretResult SecretStore::remove(const std::string& key) {
    auto result = backend_.remove(service_, key);
    if (!result.ok) return result;

    auto keys = tracked_keys();
    auto it = std::find(keys.begin(), keys.end(), key);
    if (it != keys.end()) {
        keys.erase(it);
        return write_index(keys);
    }
    return result;
}

// ============================================================================
// Helpers
// ============================================================================

std::string mask_value(const std::string& value) {
    if (value.size() <= 8) {
        return std::string(value.size(), '*');
    }
    return value.substr(0, 3) + std::string(value.size() - 6, '*') + value.substr(value.size() - 3);
}

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

} // namespace

std::vector<DotenvEntry> parse_dotenv(const std::string& content) {
    std::vector<DotenvEntry> entries;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        if (s.rfind("export ", 0) == 0) s = trim(s.substr(7));

        auto eq = s.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(s.substr(0, eq));
        std::string value = trim(s.substr(eq + 1));
        if (key.empty()) continue;

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            char quote = value.front();
            value = value.substr(1, value.size() - 2);
            if (quote == '"') {
                std::string unescaped;
                for (size_t i = 0; i < value.size(); ++i) {
                    if (value[i] == '\\' && i + 1 < value.size()) ++i;
                    unescaped += value[i];
                }
                value = unescaped;
            }
        } else {
            // Unquoted values end at an inline comment
            auto hash = value.find(" #");
            if (hash != std::string::npos) value = trim(value.substr(0, hash));
        }

        entries.push_back({key, value});
    }

    return entries;
}

bool is_placeholder_value(const std::string& value) {
    if (value.empty()) return true;
    return value.size() >= 3 && value.compare(value.size() - 3, 3, "...") == 0;
}

std::string format_dotenv_line(const std::string& key, const std::string& value) {
    bool needs_quotes = value.find_first_of(" #\"'") != std::string::npos;
    if (!needs_quotes) return key + "=" + value;

    std::string escaped;
    for (char c : value) {
        if (c == '"' || c == '\\') escaped += '\\';
        escaped += c;
    }
    return key + "=\"" + escaped + "\"";
}

} // namespace clikit
