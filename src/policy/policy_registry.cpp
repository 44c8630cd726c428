#include "policy/policy_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>

namespace redactor {

PolicyRegistry::PolicyRegistry(const PolicyRegistry& other) {
    std::shared_lock lock(other.mutex_);
    policies_ = other.policies_;
}

PolicyRegistry& PolicyRegistry::operator=(const PolicyRegistry& other) {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        policies_ = other.policies_;
    }
    return *this;
}

PolicyRegistry::PolicyRegistry(PolicyRegistry&& other) {
    std::unique_lock lock(other.mutex_);
    policies_ = std::move(other.policies_);
}

PolicyRegistry& PolicyRegistry::operator=(PolicyRegistry&& other) {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        policies_ = std::move(other.policies_);
    }
    return *this;
}

PolicyRegistry PolicyRegistry::with_builtins() {
    PolicyRegistry registry;
    // Built-in names are distinct, so none of these can fail
    (void)registry.register_classification<AccountId>();
    (void)registry.register_classification<BlockchainAddress>();
    (void)registry.register_classification<CreditCard>();
    (void)registry.register_classification<DateOfBirth>();
    (void)registry.register_classification<Email>();
    (void)registry.register_classification<IpAddress>();
    (void)registry.register_classification<NationalId>();
    (void)registry.register_classification<PhoneNumber>();
    (void)registry.register_classification<Pii>();
    (void)registry.register_classification<Secret>();
    (void)registry.register_classification<SessionId>();
    (void)registry.register_classification<Token>();
    return registry;
}

Result<bool> PolicyRegistry::register_policy(std::string_view name, TextRedactionPolicy policy) {
    std::string key = utils::to_lower(utils::trim(name));
    if (key.empty()) {
        return Result<bool>::error(ErrorCategory::POLICY_ERROR,
                                   "Classification name must not be empty");
    }

    const std::string description = policy.describe();
    {
        std::unique_lock lock(mutex_);
        const auto [it, inserted] = policies_.try_emplace(key, std::move(policy));
        if (!inserted) {
            return Result<bool>::error(ErrorCategory::POLICY_ERROR,
                std::format("Classification '{}' is already registered", key));
        }
    }

    utils::log::debug(std::format("Registered classification '{}': {}", key, description));
    return Result<bool>::ok(true);
}

std::optional<TextRedactionPolicy> PolicyRegistry::find(std::string_view name) const {
    const std::string key = utils::to_lower(utils::trim(name));
    std::shared_lock lock(mutex_);
    const auto it = policies_.find(key);
    if (it == policies_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PolicyRegistry::contains(std::string_view name) const {
    const std::string key = utils::to_lower(utils::trim(name));
    std::shared_lock lock(mutex_);
    return policies_.contains(key);
}

size_t PolicyRegistry::size() const {
    std::shared_lock lock(mutex_);
    return policies_.size();
}

std::vector<std::string> PolicyRegistry::names() const {
    std::vector<std::string> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(policies_.size());
        for (const auto& [name, policy] : policies_) {
            result.push_back(name);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace redactor
