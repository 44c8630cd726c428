#include <catch2/catch_test_macros.hpp>
#include "redact/classifiable.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using namespace redactor;

namespace {

// Records every leaf it sees; proves only the leaf reaches the mapper
struct RecordingMapper {
    std::vector<std::string>* seen;

    template<ScalarRedaction T>
    T map_scalar(T value) const { return redact_scalar(value); }

    template<HasRedactionPolicy C, SensitiveValue T>
    T map_sensitive(T value) const {
        seen->emplace_back(SensitiveValueTraits<T>::as_text(value));
        return kDefaultMapper.map_sensitive<C>(std::move(value));
    }
};

} // namespace

TEST_CASE("Classifiable: bare leaf", "[classifiable]") {
    CHECK(apply_classification<Secret>(std::string("hunter2")) == "[REDACTED]");
    CHECK(apply_classification<AccountId>(std::string("acct_99887766")) == "*********7766");
}

TEST_CASE("Classifiable: optional sequence keeps presence", "[classifiable]") {
    using Codes = std::optional<std::vector<std::string>>;

    const Codes present = apply_classification<AccountId>(Codes{std::vector<std::string>{"abcdef"}});
    REQUIRE(present.has_value());
    CHECK(*present == std::vector<std::string>{"**cdef"});

    const Codes absent = apply_classification<AccountId>(Codes{});
    CHECK_FALSE(absent.has_value());
}

TEST_CASE("Classifiable: sequences keep order and count", "[classifiable]") {
    const std::vector<std::string> input{"first-1111", "second-2222", "", "x"};
    const auto out = apply_classification<Token>(input);
    REQUIRE(out.size() == 4);
    CHECK(out[0] == "******1111");
    CHECK(out[1] == "*******2222");
    CHECK(out[2].empty());
    CHECK(out[3] == "x");
}

TEST_CASE("Classifiable: map values only, keys untouched", "[classifiable]") {
    std::map<std::string, std::vector<std::string>> emails{
        {"emails", {"a@b.com", "c@d.com"}},
    };
    const auto out = apply_classification<Secret>(std::move(emails));

    REQUIRE(out.size() == 1);
    REQUIRE(out.count("emails") == 1);
    CHECK(out.at("emails") == std::vector<std::string>{"[REDACTED]", "[REDACTED]"});
}

TEST_CASE("Classifiable: classifiable keys are still never redacted", "[classifiable]") {
    // Key type is itself a sensitive leaf type
    std::unordered_map<std::string, std::string> phone_book{
        {"alice@example.com", "+15551234567"},
        {"bob@example.com", "+15557654321"},
    };
    const auto out = apply_classification<PhoneNumber>(std::move(phone_book));

    REQUIRE(out.size() == 2);
    CHECK(out.at("alice@example.com") == "**********67");
    CHECK(out.at("bob@example.com") == "**********21");
}

TEST_CASE("Classifiable: owned box", "[classifiable]") {
    auto boxed = std::make_unique<std::string>("4111111111111111");
    const auto out = apply_classification<CreditCard>(std::move(boxed));
    REQUIRE(out != nullptr);
    CHECK(*out == "************1111");

    const auto null_out = apply_classification<CreditCard>(std::unique_ptr<std::string>{});
    CHECK(null_out == nullptr);
}

TEST_CASE("Classifiable: deep nesting composes", "[classifiable]") {
    using Deep = std::optional<std::map<std::string, std::vector<std::optional<MaybeOwnedText>>>>;

    const std::string source = "0xabcdef0123456789";
    Deep deep = std::map<std::string, std::vector<std::optional<MaybeOwnedText>>>{
        {"wallets", {MaybeOwnedText::borrowed(source), std::nullopt}},
    };
    const Deep out = apply_classification<BlockchainAddress>(std::move(deep));

    REQUIRE(out.has_value());
    const auto& wallets = out->at("wallets");
    REQUIRE(wallets.size() == 2);
    REQUIRE(wallets[0].has_value());
    CHECK(wallets[0]->view() == "************456789");
    CHECK_FALSE(wallets[1].has_value());
}

TEST_CASE("Classifiable: only leaves reach the mapper", "[classifiable]") {
    std::vector<std::string> seen;
    const RecordingMapper mapper{&seen};

    std::map<std::string, std::optional<std::string>> input{
        {"k1", "v1"},
        {"k2", std::nullopt},
        {"k3", "v3"},
    };
    const auto out = apply_classification<Secret>(std::move(input), mapper);

    CHECK(seen == std::vector<std::string>{"v1", "v3"});
    CHECK(out.at("k1") == "[REDACTED]");
    CHECK_FALSE(out.at("k2").has_value());
}

TEST_CASE("Classifiable: shape detection", "[classifiable]") {
    STATIC_REQUIRE(ClassifiableType<std::string>);
    STATIC_REQUIRE(ClassifiableType<std::vector<std::optional<std::string>>>);
    STATIC_REQUIRE(ClassifiableType<std::unique_ptr<MaybeOwnedText>>);
    STATIC_REQUIRE_FALSE(ClassifiableType<int>);
    STATIC_REQUIRE_FALSE(ClassifiableType<std::vector<int>>);
    STATIC_REQUIRE_FALSE(ClassifiableType<std::optional<double>>);
}
