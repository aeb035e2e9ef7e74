#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace portico {

/**
 * Row operation reported by the upstream record store.
 *
 * Any is a subscription wildcard; a concrete event never legitimately
 * carries it.
 */
enum class Operation {
    Insert,
    Update,
    Delete,
    Any
};

/**
 * Parse an operation name ("INSERT", "update", "*", ...).
 *
 * @return The operation, or nullopt for unknown text
 */
std::optional<Operation> parse_operation(const std::string& text);

const char* operation_name(Operation op);

/**
 * Notification that a row in an upstream table was inserted, updated or
 * deleted. Created by the subscription collaborator and consumed once.
 */
struct ChangeEvent {
    std::string table;
    Operation operation = Operation::Insert;
    nlohmann::json record = nlohmann::json::object();
    std::optional<nlohmann::json> old_record;

    /**
     * Decode a realtime payload.
     *
     * Accepts the wrapped form {"data": {...}} or the bare form, with
     * "type"/"eventType" for the operation, "record"/"new" for the row and
     * "old_record"/"old" for the previous row.
     *
     * @throws ValidationError if the table or operation is missing or invalid
     */
    static ChangeEvent from_payload(const nlohmann::json& payload);
};

} // namespace portico
