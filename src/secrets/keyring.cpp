#include "clikit/secrets.hpp"

#include <libsecret/secret.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace clikit {

namespace {

const SecretSchema* keyring_schema() {
    static const SecretSchema schema = {
        "org.clikit.Secret",
        SECRET_SCHEMA_NONE,
        {
            {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {"key", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING},
        },
    };
    return &schema;
}

struct ErrorDeleter {
    void operator()(GError* error) const { g_error_free(error); }
};
using ErrorPtr = std::unique_ptr<GError, ErrorDeleter>;

struct PasswordDeleter {
    void operator()(gchar* password) const { secret_password_free(password); }
};
using PasswordPtr = std::unique_ptr<gchar, PasswordDeleter>;

} // namespace

std::optional<std::string> KeyringSecretBackend::get(const std::string& service,
                                                     const std::string& key) {
    GError* raw_error = nullptr;
    PasswordPtr password(secret_password_lookup_sync(keyring_schema(), nullptr, &raw_error,
                                                     "service", service.c_str(),
                                                     "key", key.c_str(),
                                                     nullptr));
    ErrorPtr error(raw_error);
    if (error) {
        spdlog::warn("keyring lookup of {} failed: {}", key, error->message);
        return std::nullopt;
    }
    if (!password) return std::nullopt;
    return std::string(password.get());
}

SecretResult KeyringSecretBackend::set(const std::string& service, const std::string& key,
                                       const std::string& value) {
    std::string label = service + ": " + key;

    GError* raw_error = nullptr;
    gboolean stored = secret_password_store_sync(keyring_schema(), SECRET_COLLECTION_DEFAULT,
                                                 label.c_str(), value.c_str(), nullptr, &raw_error,
                                                 "service", service.c_str(),
                                                 "key", key.c_str(),
                                                 nullptr);
    ErrorPtr error(raw_error);
    if (error) {
        return {false, std::string("keyring: ") + error->message};
    }
    if (!stored) {
        return {false, "keyring refused to store " + key};
    }
    return {true, ""};
}

SecretResult KeyringSecretBackend::remove(const std::string& service, const std::string& key) {
    GError* raw_error = nullptr;
    gboolean removed = secret_password_clear_sync(keyring_schema(), nullptr, &raw_error,
                                                  "service", service.c_str(),
                                                  "key", key.c_str(),
                                                  nullptr);
    ErrorPtr error(raw_error);
    if (error) {
        return {false, std::string("keyring: ") + error->message};
    }
    if (!removed) {
        return {false, "Not found: " + key};
    }
    return {true, ""};
}

} // namespace clikit
