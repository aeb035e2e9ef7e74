#include "portico/change_event.hpp"

#include "portico/errors.hpp"
#include "portico/helpers.hpp"

namespace portico {

namespace {

const nlohmann::json* find_first(const nlohmann::json& object,
                                 std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = object.find(key);
        if (it != object.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

} // namespace

std::optional<Operation> parse_operation(const std::string& text) {
    auto upper = helpers::to_upper(text);
    if (upper == "INSERT") return Operation::Insert;
    if (upper == "UPDATE") return Operation::Update;
    if (upper == "DELETE") return Operation::Delete;
    if (upper == "*" || upper == "ANY") return Operation::Any;
    return std::nullopt;
}

const char* operation_name(Operation op) {
    switch (op) {
        case Operation::Insert: return "INSERT";
        case Operation::Update: return "UPDATE";
        case Operation::Delete: return "DELETE";
        case Operation::Any: return "*";
    }
    return "*";
}

ChangeEvent ChangeEvent::from_payload(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw ValidationError::invalid_value("payload", "expected object");
    }
    auto data_it = payload.find("data");
    const nlohmann::json& body =
        (data_it != payload.end() && data_it->is_object()) ? *data_it : payload;

    ChangeEvent event;

    const auto* table = find_first(body, {"table"});
    if (!table) {
        throw ValidationError::missing_field("table");
    }
    if (!table->is_string() || table->get<std::string>().empty()) {
        throw ValidationError::invalid_value("table", "expected non-empty string");
    }
    event.table = table->get<std::string>();

    const auto* type = find_first(body, {"type", "eventType"});
    if (!type) {
        throw ValidationError::missing_field("type");
    }
    std::string type_text = type->is_string() ? type->get<std::string>() : type->dump();
    auto op = parse_operation(type_text);
    if (!op) {
        throw ValidationError::invalid_enum("type", type_text);
    }
    event.operation = *op;

    if (const auto* record = find_first(body, {"record", "new"})) {
        if (!record->is_object()) {
            throw ValidationError::invalid_value("record", "expected object");
        }
        event.record = *record;
    }

    if (const auto* old_record = find_first(body, {"old_record", "old"})) {
        if (!old_record->is_object()) {
            throw ValidationError::invalid_value("old_record", "expected object");
        }
        event.old_record = *old_record;
    }

    return event;
}

} // namespace portico
