#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace redactor;

namespace {

// RAII temporary directory
struct TmpDir {
    std::filesystem::path path;
    TmpDir() : path(std::filesystem::temp_directory_path() / "redactor_test_config") {
        std::filesystem::create_directories(path);
    }
    ~TmpDir() { std::filesystem::remove_all(path); }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p);
        f << content;
        return p.string();
    }
};

bool error_mentions(const ConfigLoader::LoadResult& result, const std::string& needle) {
    return !result.success && result.error_message.find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("Config: full example loads", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "debug"

[[policies]]
name = "order_ref"
kind = "keep"
prefix = 0
suffix = 4
mask_char = "#"

[[policies]]
name = "internal_note"
kind = "full"
placeholder = "<hidden>"

[[document_rules]]
path = "customer.email"
classification = "email"

[[document_rules]]
path = "orders.reference"
classification = "Order_Ref"
)");

    REQUIRE(result.success);
    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "debug");

    REQUIRE(cfg.policies.size() == 2);
    CHECK(cfg.policies[0].name == "order_ref");
    CHECK(cfg.policies[0].kind == "keep");
    CHECK(cfg.policies[0].suffix == 4);
    CHECK(cfg.policies[0].mask_char == "#");
    CHECK(cfg.policies[1].placeholder == "<hidden>");

    REQUIRE(cfg.document_rules.size() == 2);
    CHECK(cfg.document_rules[0].path == "customer.email");
    CHECK(cfg.document_rules[1].classification == "order_ref");
}

TEST_CASE("Config: defaults when sections are missing", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.policies.empty());
    CHECK(result.config.document_rules.empty());
}

TEST_CASE("Config: malformed TOML is a load error", "[config]") {
    const auto result = ConfigLoader::load_from_string("[logging\nlevel = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config"));
}

// ============================================================================
// Policy construction
// ============================================================================

TEST_CASE("Config: build_policy maps kinds", "[config][policy]") {
    PolicyConfig keep{.name = "k", .kind = "keep", .prefix = 1, .suffix = 2, .mask_char = "#"};
    const auto kept = ConfigLoader::build_policy(keep);
    REQUIRE(kept.is_ok());
    CHECK(kept.value().apply_to("abcdef") == "a###ef");

    PolicyConfig mask{.name = "m", .kind = "mask", .prefix = 2, .suffix = 0};
    const auto masked = ConfigLoader::build_policy(mask);
    REQUIRE(masked.is_ok());
    CHECK(masked.value().apply_to("abcdef") == "**cdef");

    PolicyConfig full{.name = "f", .kind = "full"};
    REQUIRE(ConfigLoader::build_policy(full).is_ok());
    CHECK(ConfigLoader::build_policy(full).value() == TextRedactionPolicy::default_full());
}

TEST_CASE("Config: multi-byte mask_char is one scalar", "[config][policy]") {
    PolicyConfig keep{.name = "bullet", .kind = "keep", .suffix = 1, .mask_char = "\xE2\x80\xA2"};
    const auto built = ConfigLoader::build_policy(keep);
    REQUIRE(built.is_ok());
    CHECK(built.value().apply_to("abc") == "\xE2\x80\xA2\xE2\x80\xA2" "c");
}

TEST_CASE("Config: invalid policies are rejected", "[config][validation]") {
    SECTION("unknown kind") {
        const auto result = ConfigLoader::load_from_string(R"(
[[policies]]
name = "p"
kind = "scramble"
)");
        CHECK(error_mentions(result, "unknown kind \"scramble\""));
    }
    SECTION("multi-character mask_char") {
        const auto result = ConfigLoader::load_from_string(R"(
[[policies]]
name = "p"
kind = "mask"
mask_char = "ab"
)");
        CHECK(error_mentions(result, "mask_char must be exactly one character"));
    }
    SECTION("empty mask_char") {
        const auto result = ConfigLoader::load_from_string(R"(
[[policies]]
name = "p"
kind = "keep"
mask_char = ""
)");
        CHECK(error_mentions(result, "mask_char"));
    }
    SECTION("negative counts") {
        const auto result = ConfigLoader::load_from_string(R"(
[[policies]]
name = "p"
kind = "keep"
suffix = -1
)");
        CHECK(error_mentions(result, "must be >= 0"));
    }
    SECTION("empty name") {
        const auto result = ConfigLoader::load_from_string(R"(
[[policies]]
kind = "full"
)");
        CHECK(error_mentions(result, "policies[0].name must not be empty"));
    }
    SECTION("duplicate names") {
        const auto result = ConfigLoader::load_from_string(R"(
[[policies]]
name = "dup"

[[policies]]
name = "DUP"
)");
        CHECK(error_mentions(result, "defined twice"));
    }
    SECTION("placeholder on a non-full policy") {
        const auto result = ConfigLoader::load_from_string(R"(
[[policies]]
name = "p"
kind = "keep"
placeholder = "x"
)");
        CHECK(error_mentions(result, "placeholder is only valid"));
    }
}

TEST_CASE("Config: invalid rules and logging are rejected", "[config][validation]") {
    SECTION("rule without path") {
        const auto result = ConfigLoader::load_from_string(R"(
[[document_rules]]
classification = "email"
)");
        CHECK(error_mentions(result, "document_rules[0].path must not be empty"));
    }
    SECTION("rule without classification") {
        const auto result = ConfigLoader::load_from_string(R"(
[[document_rules]]
path = "a.b"
)");
        CHECK(error_mentions(result, "document_rules[0].classification must not be empty"));
    }
    SECTION("unknown log level") {
        const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "chatty"
)");
        CHECK(error_mentions(result, "logging.level"));
    }
}

TEST_CASE("Config: validation reports every error at once", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[[policies]]
name = ""

[[document_rules]]
path = ""
classification = ""
)");
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Config validation failed:"));
    CHECK(result.error_message.find("policies[0].name") != std::string::npos);
    CHECK(result.error_message.find("document_rules[0].path") != std::string::npos);
    CHECK(result.error_message.find("document_rules[0].classification") != std::string::npos);
}

// ============================================================================
// Includes and environment expansion
// ============================================================================

TEST_CASE("Config: include merges arrays, main file wins for scalars", "[config][include]") {
    TmpDir tmp;
    tmp.file("rules.toml", R"(
[logging]
level = "error"

[[document_rules]]
path = "user.ssn"
classification = "national_id"
)");
    const auto main_path = tmp.file("main.toml", R"(
include = "rules.toml"

[logging]
level = "warn"

[[document_rules]]
path = "user.email"
classification = "email"
)");

    const auto result = ConfigLoader::load_from_file(main_path);
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "warn");
    REQUIRE(result.config.document_rules.size() == 2);
    CHECK(result.config.document_rules[0].path == "user.ssn");
    CHECK(result.config.document_rules[1].path == "user.email");
}

TEST_CASE("Config: circular includes are rejected", "[config][include]") {
    TmpDir tmp;
    tmp.file("a.toml", "include = \"b.toml\"\n");
    tmp.file("b.toml", "include = \"a.toml\"\n");
    const auto result = ConfigLoader::load_from_file((tmp.path / "a.toml").string());
    CHECK(error_mentions(result, "Circular config include"));
}

TEST_CASE("Config: missing file is a load error", "[config]") {
    const auto result = ConfigLoader::load_from_file("/nonexistent/redactor.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config"));
}

TEST_CASE("Config: ${VAR} expansion in string values", "[config][env]") {
    ::setenv("REDACTOR_TEST_PLACEHOLDER", "<masked>", 1);
    ::unsetenv("REDACTOR_TEST_UNSET");

    const auto result = ConfigLoader::load_from_string(R"(
[[policies]]
name = "env_policy${REDACTOR_TEST_UNSET}"
kind = "full"
placeholder = "${REDACTOR_TEST_PLACEHOLDER}"
)");
    REQUIRE(result.success);
    REQUIRE(result.config.policies.size() == 1);
    CHECK(result.config.policies[0].name == "env_policy");
    CHECK(result.config.policies[0].placeholder == "<masked>");

    ::unsetenv("REDACTOR_TEST_PLACEHOLDER");
}
