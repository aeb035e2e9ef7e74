#pragma once

#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "portico/bridge.pb.h"
#include "portico/change_event.hpp"
#include "portico/errors.hpp"

namespace portico {

/**
 * Which tables the translator understands.
 */
struct TranslatorOptions {
    /// Table whose rows are user-facing signals.
    std::string signals_table = "signals";

    /// Secondary-entity tables and the entity type each one holds.
    std::map<std::string, EntityType> entity_tables = {
        {"agents", AGENT},
        {"steps", STEP},
    };
};

/**
 * Converts sanitized change events into typed engine requests.
 *
 * The translator either returns one fully valid SignalRequest or throws a
 * ValidationError; a partially built request never escapes. Translation is
 * stateless and safe to call from many threads at once.
 *
 * Signal rows pick their request kind from the record's signal_type
 * (RUN, SYNC or FYI, case-insensitive) and their payload from initial_data.
 * Secondary-entity rows become entity lifecycle commands whose operation
 * follows the row operation (INSERT -> CREATE, UPDATE -> UPDATE,
 * DELETE -> DELETE).
 *
 * Enum handling:
 * - A required enum that is present but not in its symbol table fails with
 *   ValidationError::Kind::InvalidEnum.
 * - An optional enum falls back to its default only when it is absent.
 * - Sync entity_types are checked one by one; unknown entries are dropped
 *   with a warning and the rest are kept.
 *
 * Example:
 *   Translator translator;
 *   auto event = sanitizer::sanitize(ChangeEvent::from_payload(payload));
 *   SignalRequest request = translator.translate(event);
 */
class Translator {
public:
    explicit Translator(TranslatorOptions options = {});

    /**
     * Translate one event.
     *
     * @param event Event that has already passed the sanitizer
     * @return A complete request with correlation_id populated
     * @throws ValidationError if the event cannot produce a valid request
     */
    SignalRequest translate(const ChangeEvent& event) const;

    /**
     * Returns true if events for this table are user-facing signals.
     */
    bool is_signal_table(const std::string& table) const {
        return table == options_.signals_table;
    }

    /**
     * Entity type held by a secondary-entity table, if the table is known.
     */
    std::optional<EntityType> entity_type_for(const std::string& table) const;

    const TranslatorOptions& options() const { return options_; }

private:
    SignalRequest translate_signal(const ChangeEvent& event) const;
    SignalRequest translate_entity_change(const ChangeEvent& event, EntityType type) const;

    TranslatorOptions options_;
};

/**
 * Map signal_type text (RUN, SYNC, FYI; any case) to a request kind.
 */
std::optional<SignalType> parse_signal_kind(const std::string& text);

} // namespace portico
