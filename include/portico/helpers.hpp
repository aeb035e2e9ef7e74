#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>
#include <google/protobuf/struct.pb.h>
#include <nlohmann/json.hpp>
#include "portico/bridge.pb.h"

namespace portico {

/**
 * Helper functions for working with bridge types.
 */
namespace helpers {

/**
 * Upper-case ASCII copy of a string, for case-insensitive symbol matching.
 */
inline std::string to_upper(const std::string& text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

/**
 * Match text case-insensitively against a generated protobuf enum.
 *
 * Only enum names are accepted; numeric strings never match.
 *
 * @param text Symbol as it appeared in the record
 * @param parse Generated parser, e.g. EntityType_Parse
 * @return The enum value, or nullopt if the symbol is not in the table
 */
template<typename Enum, typename Parser>
std::optional<Enum> parse_symbol(const std::string& text, Parser parse) {
    Enum value{};
    if (!text.empty() && parse(to_upper(text), &value)) {
        return value;
    }
    return std::nullopt;
}

/**
 * Generate a random UUIDv4 string (used to mint correlation IDs).
 */
std::string generate_uuid();

/**
 * Convert a JSON object into a protobuf Struct.
 *
 * @throws DecodeError if the value is not an object
 */
google::protobuf::Struct to_struct(const nlohmann::json& object);

/**
 * Convert a protobuf Struct back into a JSON object.
 */
nlohmann::json from_struct(const google::protobuf::Struct& value);

/**
 * Parse a JSON-encoded string into a value.
 *
 * @throws DecodeError if the text is not valid JSON
 */
nlohmann::json parse_json(const std::string& text);

/**
 * Get the correlation ID of a request.
 */
inline const std::string& correlation_id(const SignalRequest& request) {
    return request.correlation_id();
}

/**
 * Name of the populated payload case, for logging.
 */
inline std::string kind_name(const SignalRequest& request) {
    switch (request.payload_case()) {
        case SignalRequest::kCommand: return "command";
        case SignalRequest::kSync: return "sync";
        case SignalRequest::kFyiData: return "fyi";
        case SignalRequest::PAYLOAD_NOT_SET: break;
    }
    return "unset";
}

/**
 * Sort and de-duplicate a list of strings in place, giving it set semantics.
 */
inline void make_set(std::vector<std::string>& values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

} // namespace helpers
} // namespace portico
