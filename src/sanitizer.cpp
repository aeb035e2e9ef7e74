#include "portico/sanitizer.hpp"

#include <algorithm>
#include <iterator>

namespace portico {
namespace sanitizer {

std::string sanitize(const std::string& text) {
    if (text.find('\0') == std::string::npos) {
        return text;
    }
    std::string clean;
    clean.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(clean),
                 [](char c) { return c != '\0'; });
    return clean;
}

nlohmann::json sanitize(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::string:
            return sanitize(value.get_ref<const std::string&>());

        case nlohmann::json::value_t::array: {
            auto clean = nlohmann::json::array();
            for (const auto& element : value) {
                clean.push_back(sanitize(element));
            }
            return clean;
        }

        case nlohmann::json::value_t::object: {
            auto clean = nlohmann::json::object();
            for (auto it = value.begin(); it != value.end(); ++it) {
                clean[it.key()] = sanitize(it.value());
            }
            return clean;
        }

        default:
            return value;
    }
}

ChangeEvent sanitize(const ChangeEvent& event) {
    ChangeEvent clean;
    clean.table = sanitize(event.table);
    clean.operation = event.operation;
    clean.record = sanitize(event.record);
    if (event.old_record) {
        clean.old_record = sanitize(*event.old_record);
    }
    return clean;
}

} // namespace sanitizer
} // namespace portico
