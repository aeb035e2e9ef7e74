#pragma once

#include <optional>
#include <string>
#include "portico/bridge.pb.h"
#include "portico/errors.hpp"

namespace portico {

/**
 * What happened to one unit of work once the engine was involved.
 */
enum class Outcome {
    SessionAttached,
    Completed,
    Rejected,
    TransportFailed
};

const char* outcome_name(Outcome outcome);

/**
 * The event a response belongs to.
 */
struct Origin {
    /// Signal row id (its correlation id) or secondary entity id.
    std::string event_id;
    std::string table;
    /// True for signal inserts, which have a user-facing record to update.
    bool user_facing = false;
    std::string correlation_id;

    /**
     * Build the origin of a translated request.
     */
    static Origin of(const SignalRequest& request, const std::string& table, bool user_facing);
};

/**
 * Writes outcomes back to the upstream record store.
 *
 * Implementations are called from worker threads and must be thread-safe.
 */
class RecordUpdater {
public:
    virtual ~RecordUpdater() = default;

    virtual void attach_session(const std::string& event_id, const std::string& session_id) = 0;

    virtual void mark_failed(const std::string& event_id, const std::string& reason) = 0;

    /**
     * Surface a failed secondary-entity change. Only called under
     * SecondaryFailurePolicy::Report.
     */
    virtual void report_entity_failure(const std::string& table, const std::string& entity_id,
                                       const std::string& reason) = 0;
};

/**
 * What to do when a secondary-entity change fails. Those rows have no
 * user-facing record, so there is nothing to mark failed.
 */
enum class SecondaryFailurePolicy {
    LogOnly,
    Report
};

/**
 * Parse "log" or "report" (any case).
 */
std::optional<SecondaryFailurePolicy> parse_secondary_failure_policy(const std::string& text);

/**
 * Maps engine responses and transport failures to outcomes and write-backs.
 *
 * - success with session_id: attach_session(event_id, session_id)
 * - success without session_id: logged only
 * - rejection or transport failure on a signal: mark_failed(event_id, reason)
 * - rejection or transport failure on a secondary entity: logged, and
 *   reported when the policy is Report
 *
 * A write-back that throws is logged and never propagates.
 */
class ResponseHandler {
public:
    explicit ResponseHandler(RecordUpdater& updater,
                             SecondaryFailurePolicy policy = SecondaryFailurePolicy::LogOnly);

    Outcome handle(const Origin& origin, const EngineResponse& response);

    /**
     * Record that no response could be obtained.
     */
    Outcome handle_failure(const Origin& origin, const BridgeError& error);

    SecondaryFailurePolicy policy() const { return policy_; }

private:
    Outcome fail(const Origin& origin, const std::string& reason, Outcome outcome);

    RecordUpdater& updater_;
    SecondaryFailurePolicy policy_;
};

} // namespace portico
