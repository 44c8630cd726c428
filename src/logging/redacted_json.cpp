#include "logging/redacted_json.hpp"

namespace redactor {

RedactedJson RedactedJson::from_serialized(std::string json) {
    return RedactedJson(std::move(json), false);
}

RedactedJson RedactedJson::serialization_failed(std::string_view reason) {
    // The reason comes from the serializer, never from the value itself
    utils::log::warn(std::format("Redacted value could not be serialized: {}", reason));
    return RedactedJson(std::string(kSerializationFailedJson), true);
}

} // namespace redactor
