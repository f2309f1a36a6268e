#include <doctest/doctest.h>
#include <clikit/config.hpp>
#include <clikit/platform.hpp>
#include <clikit/secrets.hpp>

#include "../test_helpers.hpp"

#ifndef _WIN32
#include <sys/stat.h>
#endif

using namespace clikit;
using clikit_test::TempDir;

// ============================================================================
// Secret Store
// ============================================================================

TEST_CASE("SecretStore tracks keys it stores") {
    MemorySecretBackend backend;
    SecretStore store(backend);

    CHECK(store.set("OPENAI_API_KEY", "sk-1234567890").ok);
    CHECK(store.set("ANTHROPIC_API_KEY", "sk-ant-0987654321").ok);
    CHECK(store.set("OPENAI_API_KEY", "sk-updated-value").ok);

    CHECK(store.tracked_keys() == std::vector<std::string>{"ANTHROPIC_API_KEY", "OPENAI_API_KEY"});
    CHECK(store.get("OPENAI_API_KEY") == std::optional<std::string>("sk-updated-value"));

    // The index is stored as a sorted JSON array
    auto index = backend.get(kSecretService, kSecretIndexKey);
    REQUIRE(index);
    CHECK(*index == R"(["ANTHROPIC_API_KEY","OPENAI_API_KEY"])");
}

TEST_CASE("SecretStore remove drops the key from the index") {
    MemorySecretBackend backend;
    SecretStore store(backend);
    store.set("A", "1");
    store.set("B", "2");

    CHECK(store.remove("A").ok);
    CHECK_FALSE(store.get("A"));
    CHECK(store.tracked_keys() == std::vector<std::string>{"B"});

    auto missing = store.remove("A");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error == "Not found: A");
}

TEST_CASE("SecretStore refuses the index key and empty keys") {
    MemorySecretBackend backend;
    SecretStore store(backend);
    CHECK_FALSE(store.set(kSecretIndexKey, "[]").ok);
    CHECK_FALSE(store.set("", "x").ok);
    CHECK(store.tracked_keys().empty());
}

TEST_CASE("SecretStore services are isolated") {
    MemorySecretBackend backend;
    SecretStore a(backend, "one");
    SecretStore b(backend, "two");
    a.set("K", "v");
    CHECK_FALSE(b.get("K"));
    CHECK(b.tracked_keys().empty());
}

// ============================================================================
// File Backend
// ============================================================================

TEST_CASE("FileSecretBackend persists values in an owner-only file") {
    TempDir dir;
    auto backend = make_secret_backend(kFileBackend, dir.path());
    REQUIRE(backend);
    SecretStore store(*backend);

    REQUIRE(store.set("TOKEN", "abc").ok);

    std::string path = dir.file("secrets.json");
    REQUIRE(path_exists(path));
    auto content = nlohmann::json::parse(*read_file(path));
    CHECK(content["clikit"]["TOKEN"] == "abc");

#ifndef _WIN32
    struct stat st;
    REQUIRE(stat(path.c_str(), &st) == 0);
    CHECK((st.st_mode & 0777) == 0600);
#endif

    // A fresh backend over the same file sees the value
    FileSecretBackend reopened(path);
    CHECK(reopened.get("clikit", "TOKEN") == std::optional<std::string>("abc"));
    CHECK(SecretStore(reopened).tracked_keys() == std::vector<std::string>{"TOKEN"});
}

TEST_CASE("FileSecretBackend treats a corrupt file as empty and repairs it") {
    TempDir dir;
    dir.write("secrets.json", "{{{");
    FileSecretBackend backend(dir.file("secrets.json"));

    CHECK_FALSE(backend.get("clikit", "X"));
    CHECK(backend.set("clikit", "X", "1").ok);
    CHECK(backend.get("clikit", "X") == std::optional<std::string>("1"));
}

// ============================================================================
// Backend Selection
// ============================================================================

TEST_CASE("make_secret_backend selects the backend by name") {
    TempDir dir;

    auto keyring = make_secret_backend(kKeyringBackend, dir.path());
    CHECK(dynamic_cast<KeyringSecretBackend*>(keyring.get()) != nullptr);

    auto file = make_secret_backend(kFileBackend, dir.path());
    auto* file_backend = dynamic_cast<FileSecretBackend*>(file.get());
    REQUIRE(file_backend != nullptr);
    CHECK(file_backend->path() == dir.file("secrets.json"));

    CHECK_FALSE(make_secret_backend("vault", dir.path()));
    CHECK_FALSE(make_secret_backend("", dir.path()));
}

TEST_CASE("the keyring is the configured default backend") {
    CHECK(config_string(builtin_config_defaults(), "secrets.backend") == kKeyringBackend);
}

// ============================================================================
// Helpers
// ============================================================================

TEST_CASE("mask_value") {
    CHECK(mask_value("") == "");
    CHECK(mask_value("short") == "*****");
    CHECK(mask_value("12345678") == "********");
    CHECK(mask_value("123456789") == "123***789");
    CHECK(mask_value("sk-abcdefghijkl") == "sk-*********jkl");
}

TEST_CASE("parse_dotenv handles comments, export and quoting") {
    auto entries = parse_dotenv(
        "# comment\n"
        "\n"
        "PLAIN=value\n"
        "export EXPORTED=yes\n"
        "SPACED = padded \n"
        "DOUBLE=\"a \\\"quoted\\\" value\"\n"
        "SINGLE='keep \\n raw'\n"
        "INLINE=val # trailing comment\n"
        "EMPTY=\n"
        "NOEQUALS\n");

    REQUIRE(entries.size() == 7);
    CHECK(entries[0].key == "PLAIN");
    CHECK(entries[0].value == "value");
    CHECK(entries[1].key == "EXPORTED");
    CHECK(entries[2].key == "SPACED");
    CHECK(entries[2].value == "padded");
    CHECK(entries[3].value == "a \"quoted\" value");
    CHECK(entries[4].value == "keep \\n raw");
    CHECK(entries[5].value == "val");
    CHECK(entries[6].key == "EMPTY");
    CHECK(entries[6].value.empty());
}

TEST_CASE("is_placeholder_value") {
    CHECK(is_placeholder_value(""));
    CHECK(is_placeholder_value("sk-..."));
    CHECK_FALSE(is_placeholder_value("sk-real"));
}

TEST_CASE("format_dotenv_line quotes only when needed") {
    CHECK(format_dotenv_line("K", "simple") == "K=simple");
    CHECK(format_dotenv_line("K", "has space") == "K=\"has space\"");
    CHECK(format_dotenv_line("K", "say \"hi\"") == "K=\"say \\\"hi\\\"\"");

    // Round trip through the parser
    auto parsed = parse_dotenv(format_dotenv_line("K", "a # b"));
    REQUIRE(parsed.size() == 1);
    CHECK(parsed[0].value == "a # b");
}
