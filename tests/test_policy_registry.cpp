#include <catch2/catch_test_macros.hpp>
#include "policy/policy_registry.hpp"

#include <algorithm>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

using namespace redactor;

TEST_CASE("PolicyRegistry: built-ins are registered by name", "[registry]") {
    const auto registry = PolicyRegistry::with_builtins();

    CHECK(registry.size() == 12);
    CHECK(registry.contains("secret"));
    CHECK(registry.contains("credit_card"));
    CHECK(registry.contains("email"));
    CHECK_FALSE(registry.contains("order_ref"));

    const auto email = registry.find("email");
    REQUIRE(email.has_value());
    CHECK(*email == policy_for<Email>());
}

TEST_CASE("PolicyRegistry: names are case-insensitive and sorted", "[registry]") {
    auto registry = PolicyRegistry::with_builtins();
    CHECK(registry.contains("SECRET"));
    CHECK(registry.contains("  Phone_Number "));

    const auto names = registry.names();
    REQUIRE(names.size() == 12);
    CHECK(names.front() == "account_id");
    CHECK(names.back() == "token");
    CHECK(std::is_sorted(names.begin(), names.end()));
}

TEST_CASE("PolicyRegistry: custom policies", "[registry]") {
    PolicyRegistry registry;
    const auto result = registry.register_policy("Order_Ref", TextRedactionPolicy::keep_last(3));
    REQUIRE(result.is_ok());
    CHECK(result.value());

    const auto found = registry.find("order_ref");
    REQUIRE(found.has_value());
    CHECK(found->apply_to("ORD-0042") == "*****042");
}

TEST_CASE("PolicyRegistry: empty and duplicate names are rejected", "[registry]") {
    auto registry = PolicyRegistry::with_builtins();

    const auto empty = registry.register_policy("   ", TextRedactionPolicy::default_full());
    REQUIRE(empty.is_error());
    CHECK(empty.error_category() == ErrorCategory::POLICY_ERROR);

    const auto duplicate = registry.register_policy("Secret", TextRedactionPolicy::keep_last(1));
    REQUIRE(duplicate.is_error());
    CHECK(duplicate.error_category() == ErrorCategory::POLICY_ERROR);
    CHECK(duplicate.error_message() == "Classification 'secret' is already registered");
    CHECK(std::string(error_category_to_string(duplicate.error_category())) == "policy_error");

    // The original binding survives
    CHECK(*registry.find("secret") == TextRedactionPolicy::default_full());
}

TEST_CASE("PolicyRegistry: compile-time classifications register under their name", "[registry]") {
    PolicyRegistry registry;
    REQUIRE(registry.register_classification<BlockchainAddress>().is_ok());
    CHECK(*registry.find("blockchain_address") == TextRedactionPolicy::keep_last(6));
    CHECK(registry.register_classification<BlockchainAddress>().is_error());
}

TEST_CASE("PolicyRegistry: copies are independent", "[registry]") {
    auto original = PolicyRegistry::with_builtins();
    PolicyRegistry copy = original;
    REQUIRE(copy.register_policy("extra", TextRedactionPolicy::mask_first(1)).is_ok());

    CHECK(copy.contains("extra"));
    CHECK_FALSE(original.contains("extra"));
}

TEST_CASE("PolicyRegistry: moves carry the bindings", "[registry]") {
    STATIC_REQUIRE(std::is_move_constructible_v<PolicyRegistry>);
    STATIC_REQUIRE_FALSE(std::is_nothrow_move_constructible_v<PolicyRegistry>);
    STATIC_REQUIRE_FALSE(std::is_nothrow_move_assignable_v<PolicyRegistry>);

    auto source = PolicyRegistry::with_builtins();
    REQUIRE(source.register_policy("order_ref", TextRedactionPolicy::keep_last(3)).is_ok());

    PolicyRegistry moved(std::move(source));
    CHECK(moved.size() == 13);
    CHECK(moved.contains("order_ref"));

    PolicyRegistry assigned;
    assigned = std::move(moved);
    CHECK(assigned.size() == 13);
    CHECK(*assigned.find("order_ref") == TextRedactionPolicy::keep_last(3));
}

TEST_CASE("PolicyRegistry: concurrent lookups", "[registry]") {
    const auto registry = PolicyRegistry::with_builtins();
    std::vector<std::thread> readers;
    std::vector<int> hits(8, 0);

    for (size_t t = 0; t < hits.size(); ++t) {
        readers.emplace_back([&registry, &hits, t] {
            for (int i = 0; i < 1000; ++i) {
                if (registry.find("token").has_value()) {
                    ++hits[t];
                }
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }

    for (const int count : hits) {
        CHECK(count == 1000);
    }
}
