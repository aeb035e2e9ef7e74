#include "portico/translator.hpp"

#include <set>
#include <vector>
#include "portico/helpers.hpp"
#include "portico/logging.hpp"
#include "portico/sanitizer.hpp"

namespace portico {

namespace {

constexpr const char* COMPONENT = "translator";

bool has_value(const nlohmann::json& object, const char* field) {
    auto it = object.find(field);
    return it != object.end() && !it->is_null();
}

/// Read a required, non-empty string field.
std::string require_string(const nlohmann::json& object, const char* field) {
    if (!has_value(object, field)) {
        throw ValidationError::missing_field(field);
    }
    const auto& value = object.at(field);
    if (!value.is_string()) {
        throw ValidationError::invalid_value(field, "expected string");
    }
    auto text = value.get<std::string>();
    if (text.empty()) {
        throw ValidationError::missing_field(field);
    }
    return text;
}

/// First non-empty string among the given aliases.
std::optional<std::string> optional_string(const nlohmann::json& object,
                                           std::initializer_list<const char*> fields) {
    for (const char* field : fields) {
        if (!has_value(object, field)) continue;
        const auto& value = object.at(field);
        if (!value.is_string()) {
            throw ValidationError::invalid_value(field, "expected string");
        }
        auto text = value.get<std::string>();
        if (!text.empty()) {
            return text;
        }
    }
    return std::nullopt;
}

/// Text of an enum field that must be a string when present.
std::string enum_text(const nlohmann::json& object, const char* field) {
    const auto& value = object.at(field);
    if (!value.is_string()) {
        throw ValidationError::invalid_enum(field, value.dump());
    }
    return value.get<std::string>();
}

/**
 * Resolve a field that should hold a structured object, parsing it when it
 * was stored as an embedded JSON string. Anything undecodable degrades to an
 * empty object with a warning.
 *
 * Decoding can turn escapes such as \u0000 into raw control characters, so
 * the parsed value goes through the sanitizer again.
 */
nlohmann::json decode_embedded(const nlohmann::json& object, const char* field,
                               const std::string& correlation) {
    if (!has_value(object, field)) {
        return nlohmann::json::object();
    }
    const auto& value = object.at(field);
    if (value.is_object()) {
        return value;
    }
    if (value.is_string()) {
        try {
            auto parsed = helpers::parse_json(value.get<std::string>());
            if (parsed.is_object()) {
                return sanitizer::sanitize(parsed);
            }
            log_warn(COMPONENT, "embedded_value_not_object",
                     {{"field", field}, {"correlation_id", correlation},
                      {"type", parsed.type_name()}});
        } catch (const DecodeError& e) {
            log_warn(COMPONENT, "embedded_json_decode_failed",
                     {{"field", field}, {"correlation_id", correlation}, {"error", e.what()}});
        }
        return nlohmann::json::object();
    }
    log_warn(COMPONENT, "embedded_value_not_object",
             {{"field", field}, {"correlation_id", correlation}, {"type", value.type_name()}});
    return nlohmann::json::object();
}

/// Read an array of non-empty strings as a sorted set.
std::vector<std::string> string_set(const nlohmann::json& object,
                                    std::initializer_list<const char*> fields) {
    std::vector<std::string> result;
    for (const char* field : fields) {
        if (!has_value(object, field)) continue;
        const auto& value = object.at(field);
        if (!value.is_array()) {
            throw ValidationError::invalid_value(field, "expected array of strings");
        }
        for (const auto& element : value) {
            if (!element.is_string() || element.get<std::string>().empty()) {
                throw ValidationError::invalid_value(field, "expected array of strings");
            }
            result.push_back(element.get<std::string>());
        }
        break;
    }
    helpers::make_set(result);
    return result;
}

void set_update_mask(CommandPayload& command, std::vector<std::string> keys) {
    helpers::make_set(keys);
    for (auto& key : keys) {
        command.add_update_mask(std::move(key));
    }
}

std::vector<std::string> object_keys(const nlohmann::json& object) {
    std::vector<std::string> keys;
    for (auto it = object.begin(); it != object.end(); ++it) {
        keys.push_back(it.key());
    }
    return keys;
}

/// Keys whose value differs between two rows, including keys only one row has.
std::vector<std::string> changed_keys(const nlohmann::json& current, const nlohmann::json& previous) {
    std::vector<std::string> keys;
    for (auto it = current.begin(); it != current.end(); ++it) {
        auto prev = previous.find(it.key());
        if (prev == previous.end() || *prev != it.value()) {
            keys.push_back(it.key());
        }
    }
    for (auto it = previous.begin(); it != previous.end(); ++it) {
        if (!current.contains(it.key())) {
            keys.push_back(it.key());
        }
    }
    return keys;
}

CommandPayload build_command(const nlohmann::json& initial, const std::string& correlation) {
    CommandPayload command;

    auto operation = RUN;
    if (has_value(initial, "operation")) {
        auto text = enum_text(initial, "operation");
        auto parsed = helpers::parse_symbol<CommandOperation>(text, CommandOperation_Parse);
        if (!parsed) {
            throw ValidationError::invalid_enum("operation", text);
        }
        operation = *parsed;
    }
    command.set_operation(operation);

    if (has_value(initial, "entity_type")) {
        auto text = enum_text(initial, "entity_type");
        auto parsed = helpers::parse_symbol<EntityType>(text, EntityType_Parse);
        if (!parsed) {
            throw ValidationError::invalid_enum("entity_type", text);
        }
        command.set_entity_type(*parsed);
    } else if (operation == RUN) {
        command.set_entity_type(AGENT);
    } else {
        throw ValidationError::missing_field("entity_type");
    }

    auto entity_id = optional_string(initial, {"entity_uuid", "entity_id"});
    if (entity_id) {
        command.set_entity_id(*entity_id);
    } else if (operation != RUN) {
        throw ValidationError::missing_field("entity_uuid");
    }

    auto fields = decode_embedded(initial, "data", correlation);
    *command.mutable_fields() = helpers::to_struct(fields);

    if (has_value(initial, "update_mask")) {
        set_update_mask(command, string_set(initial, {"update_mask"}));
    } else if (operation == UPDATE) {
        set_update_mask(command, object_keys(fields));
    }
    return command;
}

SyncPayload build_sync(const nlohmann::json& initial, const std::string& correlation) {
    SyncPayload sync;

    // Scope is optional: ALL only when absent, never when present but wrong.
    auto scope = ALL;
    if (has_value(initial, "scope")) {
        auto text = enum_text(initial, "scope");
        auto parsed = helpers::parse_symbol<SyncScope>(text, SyncScope_Parse);
        if (!parsed) {
            throw ValidationError::invalid_enum("scope", text);
        }
        scope = *parsed;
    }
    sync.set_scope(scope);

    for (auto& id : string_set(initial, {"entity_uuids", "entity_ids"})) {
        sync.add_entity_ids(std::move(id));
    }
    if (scope == SPECIFIC && sync.entity_ids_size() == 0) {
        throw ValidationError::missing_field("entity_ids");
    }

    if (has_value(initial, "entity_types")) {
        const auto& types = initial.at("entity_types");
        if (!types.is_array()) {
            throw ValidationError::invalid_value("entity_types", "expected array");
        }
        std::set<int> seen;
        for (const auto& element : types) {
            std::optional<EntityType> parsed;
            if (element.is_string()) {
                parsed = helpers::parse_symbol<EntityType>(element.get<std::string>(),
                                                          EntityType_Parse);
            }
            if (!parsed) {
                log_warn(COMPONENT, "entity_type_dropped",
                         {{"value", element}, {"correlation_id", correlation}});
                continue;
            }
            if (seen.insert(*parsed).second) {
                sync.add_entity_types(*parsed);
            }
        }
    }
    return sync;
}

} // namespace

std::optional<SignalType> parse_signal_kind(const std::string& text) {
    auto upper = helpers::to_upper(text);
    if (upper == "RUN") return COMMAND;
    if (upper == "SYNC") return SYNC;
    if (upper == "FYI") return FYI;
    return std::nullopt;
}

Translator::Translator(TranslatorOptions options)
    : options_(std::move(options)) {}

std::optional<EntityType> Translator::entity_type_for(const std::string& table) const {
    auto it = options_.entity_tables.find(table);
    if (it == options_.entity_tables.end()) {
        return std::nullopt;
    }
    return it->second;
}

SignalRequest Translator::translate(const ChangeEvent& event) const {
    if (is_signal_table(event.table)) {
        return translate_signal(event);
    }
    if (auto type = entity_type_for(event.table)) {
        return translate_entity_change(event, *type);
    }
    throw ValidationError::invalid_value("table", "no translation for table '" + event.table + "'");
}

SignalRequest Translator::translate_signal(const ChangeEvent& event) const {
    const auto& record = event.record;

    if (!has_value(record, "signal_type")) {
        throw ValidationError::missing_field("signal_type");
    }
    auto kind_text = enum_text(record, "signal_type");
    auto kind = parse_signal_kind(kind_text);
    if (!kind) {
        throw ValidationError::invalid_enum("signal_type", kind_text);
    }

    auto correlation = require_string(record, "global_uuid");
    auto user_correlation = require_string(record, "user_requested_uuid");
    auto initial = decode_embedded(record, "initial_data", correlation);

    // Build into a local and hand it out only once every field is valid.
    SignalRequest request;
    switch (*kind) {
        case COMMAND:
            *request.mutable_command() = build_command(initial, correlation);
            break;
        case SYNC:
            *request.mutable_sync() = build_sync(initial, correlation);
            break;
        case FYI:
            *request.mutable_fyi_data() = helpers::to_struct(initial);
            break;
        default:
            throw ValidationError::invalid_enum("signal_type", kind_text);
    }
    request.set_signal_type(*kind);
    request.set_source(SIGNAL_ROW);
    request.set_correlation_id(correlation);
    request.set_user_correlation_id(user_correlation);
    return request;
}

SignalRequest Translator::translate_entity_change(const ChangeEvent& event, EntityType type) const {
    CommandPayload command;
    switch (event.operation) {
        case Operation::Insert: command.set_operation(CREATE); break;
        case Operation::Update: command.set_operation(UPDATE); break;
        case Operation::Delete: command.set_operation(DELETE); break;
        case Operation::Any:
            throw ValidationError::invalid_enum("operation", operation_name(event.operation));
    }
    command.set_entity_type(type);

    // Deletes carry the row in old_record; the new record is empty.
    bool has_old = event.old_record && event.old_record->is_object() && !event.old_record->empty();
    const nlohmann::json& row =
        (event.operation == Operation::Delete && has_old) ? *event.old_record : event.record;

    auto entity_id = optional_string(row, {"global_uuid"});
    if (!entity_id && has_old) {
        entity_id = optional_string(*event.old_record, {"global_uuid"});
    }
    if (!entity_id) {
        throw ValidationError::missing_field("global_uuid");
    }
    command.set_entity_id(*entity_id);
    *command.mutable_fields() = helpers::to_struct(row);

    if (event.operation == Operation::Update) {
        set_update_mask(command, has_old ? changed_keys(event.record, *event.old_record)
                                         : object_keys(event.record));
    }

    // A row change carries no correlation of its own; mint one.
    auto correlation = helpers::generate_uuid();
    auto user_correlation = optional_string(row, {"user_requested_uuid"}).value_or(correlation);

    SignalRequest request;
    *request.mutable_command() = std::move(command);
    request.set_signal_type(COMMAND);
    request.set_source(ENTITY_ROW);
    request.set_correlation_id(correlation);
    request.set_user_correlation_id(user_correlation);
    return request;
}

} // namespace portico
