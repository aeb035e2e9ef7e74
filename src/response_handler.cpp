#include "portico/response_handler.hpp"

#include "portico/helpers.hpp"
#include "portico/logging.hpp"

namespace portico {

namespace {

constexpr const char* COMPONENT = "response_handler";
constexpr const char* DEFAULT_REJECTION = "rejected by engine";

} // namespace

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::SessionAttached: return "session_attached";
        case Outcome::Completed: return "completed";
        case Outcome::Rejected: return "rejected";
        case Outcome::TransportFailed: return "transport_failed";
    }
    return "unknown";
}

Origin Origin::of(const SignalRequest& request, const std::string& table, bool user_facing) {
    Origin origin;
    origin.table = table;
    origin.user_facing = user_facing;
    origin.correlation_id = request.correlation_id();
    if (!user_facing && request.has_command() && !request.command().entity_id().empty()) {
        origin.event_id = request.command().entity_id();
    } else {
        origin.event_id = request.correlation_id();
    }
    return origin;
}

std::optional<SecondaryFailurePolicy> parse_secondary_failure_policy(const std::string& text) {
    auto upper = helpers::to_upper(text);
    if (upper == "LOG" || upper == "LOG_ONLY") return SecondaryFailurePolicy::LogOnly;
    if (upper == "REPORT") return SecondaryFailurePolicy::Report;
    return std::nullopt;
}

ResponseHandler::ResponseHandler(RecordUpdater& updater, SecondaryFailurePolicy policy)
    : updater_(updater), policy_(policy) {}

Outcome ResponseHandler::handle(const Origin& origin, const EngineResponse& response) {
    if (!response.success()) {
        auto reason = response.message().empty() ? std::string(DEFAULT_REJECTION)
                                                  : response.message();
        return fail(origin, reason, Outcome::Rejected);
    }

    bool has_session = response.has_session_id() && !response.session_id().empty();

    // Only signal rows have a session column to write.
    if (!has_session || !origin.user_facing) {
        nlohmann::json fields = {{"event_id", origin.event_id},
                                 {"table", origin.table},
                                 {"correlation_id", origin.correlation_id}};
        if (has_session) {
            fields["session_id"] = response.session_id();
        }
        log_info(COMPONENT, "request_completed", fields);
        return Outcome::Completed;
    }

    try {
        updater_.attach_session(origin.event_id, response.session_id());
        log_info(COMPONENT, "session_attached",
                 {{"event_id", origin.event_id},
                  {"session_id", response.session_id()},
                  {"correlation_id", origin.correlation_id}});
    } catch (const std::exception& e) {
        log_error(COMPONENT, "write_back_failed",
                  {{"event_id", origin.event_id},
                   {"operation", "attach_session"},
                   {"error", e.what()}});
    }
    return Outcome::SessionAttached;
}

Outcome ResponseHandler::handle_failure(const Origin& origin, const BridgeError& error) {
    log_warn(COMPONENT, "transport_failed",
             {{"event_id", origin.event_id},
              {"correlation_id", origin.correlation_id},
              {"timeout", error.is_timeout()},
              {"error", error.what()}});
    return fail(origin, error.what(), Outcome::TransportFailed);
}

Outcome ResponseHandler::fail(const Origin& origin, const std::string& reason, Outcome outcome) {
    if (origin.user_facing) {
        try {
            updater_.mark_failed(origin.event_id, reason);
            log_warn(COMPONENT, "signal_failed",
                     {{"event_id", origin.event_id},
                      {"outcome", outcome_name(outcome)},
                      {"reason", reason}});
        } catch (const std::exception& e) {
            log_error(COMPONENT, "write_back_failed",
                      {{"event_id", origin.event_id},
                       {"operation", "mark_failed"},
                       {"error", e.what()}});
        }
        return outcome;
    }

    log_warn(COMPONENT, "entity_change_failed",
             {{"table", origin.table},
              {"entity_id", origin.event_id},
              {"outcome", outcome_name(outcome)},
              {"reason", reason}});
    if (policy_ == SecondaryFailurePolicy::Report) {
        try {
            updater_.report_entity_failure(origin.table, origin.event_id, reason);
        } catch (const std::exception& e) {
            log_error(COMPONENT, "write_back_failed",
                      {{"event_id", origin.event_id},
                       {"operation", "report_entity_failure"},
                       {"error", e.what()}});
        }
    }
    return outcome;
}

} // namespace portico
