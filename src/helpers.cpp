#include "portico/helpers.hpp"

#include <random>
#include <google/protobuf/util/json_util.h>
#include "portico/errors.hpp"

namespace portico {
namespace helpers {

std::string generate_uuid() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);

    std::string uuid(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        uuid[i] = hex[nibble(rng)];
    }
    // Set version (4) and variant (8, 9, a, or b)
    uuid[14] = '4';
    uuid[19] = hex[(nibble(rng) & 0x3) + 8];
    return uuid;
}

google::protobuf::Struct to_struct(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw DecodeError(std::string("expected object, got ") + object.type_name());
    }
    google::protobuf::Struct result;
    auto text = object.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto status = google::protobuf::util::JsonStringToMessage(text, &result);
    if (!status.ok()) {
        throw DecodeError("cannot convert object to Struct: " + status.ToString());
    }
    return result;
}

nlohmann::json from_struct(const google::protobuf::Struct& value) {
    std::string text;
    auto status = google::protobuf::util::MessageToJsonString(value, &text);
    if (!status.ok()) {
        throw DecodeError("cannot render Struct: " + status.ToString());
    }
    return parse_json(text);
}

nlohmann::json parse_json(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(e.what());
    }
}

} // namespace helpers
} // namespace portico
