#pragma once

#include "core/utils.hpp"
#include "redact/redact.hpp"

#include <glaze/glaze.hpp>

#include <exception>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace redactor {

/// JSON string emitted in place of a value that could not be serialized.
inline constexpr std::string_view kSerializationFailedJson = "\"Failed to serialize redacted value\"";

/**
 * @brief JSON text of a value that has already been redacted
 *
 * Only into_redacted_json() produces these from typed values, so holding a
 * RedactedJson means the redaction entry point ran first. A serialization
 * failure yields a placeholder, never the original value.
 */
class RedactedJson {
public:
    [[nodiscard]] static RedactedJson from_serialized(std::string json);

    /**
     * @brief Placeholder for a failed serialization; logs @p reason at WARN
     */
    [[nodiscard]] static RedactedJson serialization_failed(std::string_view reason);

    [[nodiscard]] const std::string& json() const { return json_; }
    [[nodiscard]] bool is_placeholder() const { return placeholder_; }

private:
    RedactedJson(std::string json, bool placeholder)
        : json_(std::move(json)), placeholder_(placeholder) {}

    std::string json_;
    bool placeholder_ = false;
};

/**
 * @brief Redact @p value, then serialize it to JSON with glaze
 */
template<Redactable T>
[[nodiscard]] RedactedJson into_redacted_json(T value) {
    const T redacted = redact(std::move(value));
    try {
        auto written = glz::write_json(redacted);
        if (!written) {
            return RedactedJson::serialization_failed(
                std::format("glaze error code {}", static_cast<int>(written.error().ec)));
        }
        return RedactedJson::from_serialized(std::move(*written));
    } catch (const std::exception& e) {
        return RedactedJson::serialization_failed(e.what());
    }
}

/**
 * @brief Log `message key=<redacted json>` at @p level
 */
template<Redactable T>
void log_redacted(utils::log::Level level, std::string_view message, std::string_view key, T value) {
    if (level < utils::log::level()) {
        return;
    }
    const auto json = into_redacted_json(std::move(value));
    utils::log::write(level, std::format("{} {}={}", message, key, json.json()));
}

} // namespace redactor
