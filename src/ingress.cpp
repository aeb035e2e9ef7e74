#include "portico/ingress.hpp"

#include "portico/helpers.hpp"
#include "portico/logging.hpp"
#include "portico/sanitizer.hpp"

namespace portico {

namespace {

constexpr const char* COMPONENT = "ingress";

const char* kind_label(ValidationError::Kind kind) {
    switch (kind) {
        case ValidationError::Kind::MissingField: return "missing_field";
        case ValidationError::Kind::InvalidEnum: return "invalid_enum";
        case ValidationError::Kind::InvalidValue: return "invalid_value";
    }
    return "unknown";
}

} // namespace

Ingress::Ingress(SubscriptionClient& subscriptions, Translator translator,
                 ConnectionManager& connections, ResponseHandler& responses,
                 IngressOptions options)
    : subscriptions_(subscriptions),
      translator_(std::move(translator)),
      connections_(connections),
      responses_(responses),
      options_(options),
      pool_(std::make_unique<WorkerPool>(options.workers, options.queue_capacity)) {}

Ingress::~Ingress() {
    if (started_ && !stopped_) {
        stop(std::chrono::milliseconds(0));
    }
}

void Ingress::start() {
    if (started_.exchange(true)) {
        return;
    }

    try {
        connections_.connect_with_backoff(options_.backoff);
        auto response = connections_.init_server();
        if (!response.success()) {
            log_warn(COMPONENT, "server_init_rejected", {{"message", response.message()}});
        }
    } catch (const BridgeError& e) {
        log_warn(COMPONENT, "server_init_failed", {{"error", e.what()}});
    }

    auto deliver = [this](ChangeEvent event) { submit(std::move(event)); };

    const auto& options = translator_.options();
    subscriptions_.subscribe({options.signals_table, Operation::Insert}, deliver);
    for (const auto& entry : options.entity_tables) {
        subscriptions_.subscribe({entry.first, Operation::Any}, deliver);
    }
    log_info(COMPONENT, "subscribed",
             {{"signals_table", options.signals_table},
              {"entity_tables", options.entity_tables.size()},
              {"workers", options_.workers}});
}

bool Ingress::accepts(const ChangeEvent& event) const {
    if (translator_.is_signal_table(event.table)) {
        return event.operation == Operation::Insert;
    }
    return translator_.entity_type_for(event.table).has_value();
}

bool Ingress::submit(ChangeEvent event) {
    if (stopped_) {
        return false;
    }
    ++received_;

    if (!accepts(event)) {
        ++ignored_;
        log_debug(COMPONENT, "event_ignored",
                  {{"table", event.table}, {"operation", operation_name(event.operation)}});
        return true;
    }

    return pool_->submit([this, event = std::move(event)] { process(event); });
}

std::optional<Outcome> Ingress::process(const ChangeEvent& event) {
    auto clean = sanitizer::sanitize(event);

    SignalRequest request;
    try {
        request = translator_.translate(clean);
    } catch (const ValidationError& e) {
        ++dropped_;
        log_warn(COMPONENT, "event_dropped",
                 {{"table", clean.table},
                  {"operation", operation_name(clean.operation)},
                  {"field", e.field()},
                  {"kind", kind_label(e.kind())},
                  {"error", e.what()}});
        return std::nullopt;
    } catch (const DecodeError& e) {
        ++dropped_;
        log_warn(COMPONENT, "event_dropped",
                 {{"table", clean.table},
                  {"operation", operation_name(clean.operation)},
                  {"error", e.what()}});
        return std::nullopt;
    }

    auto origin = Origin::of(request, clean.table, translator_.is_signal_table(clean.table));
    log_debug(COMPONENT, "request_translated",
              {{"correlation_id", request.correlation_id()},
               {"kind", helpers::kind_name(request)},
               {"table", clean.table}});

    Outcome outcome;
    try {
        if (!connections_.connected()) {
            connections_.connect_with_backoff(options_.backoff);
        }
        auto response = connections_.exchange(request);
        outcome = responses_.handle(origin, response);
    } catch (const BridgeError& e) {
        outcome = responses_.handle_failure(origin, e);
    }
    record(outcome);
    return outcome;
}

void Ingress::record(Outcome outcome) {
    switch (outcome) {
        case Outcome::SessionAttached: ++attached_; break;
        case Outcome::Completed: ++completed_; break;
        case Outcome::Rejected: ++rejected_; break;
        case Outcome::TransportFailed: ++transport_failed_; break;
    }
}

bool Ingress::stop(std::chrono::milliseconds grace) {
    if (stopped_.exchange(true)) {
        return true;
    }

    try {
        subscriptions_.unsubscribe_all();
    } catch (const std::exception& e) {
        log_error(COMPONENT, "unsubscribe_failed", {{"error", e.what()}});
    }

    bool drained = pool_->shutdown(grace);
    connections_.close();

    auto snapshot = stats();
    log_info(COMPONENT, "stopped",
             {{"drained", drained},
              {"received", snapshot.received},
              {"ignored", snapshot.ignored},
              {"dropped", snapshot.dropped},
              {"attached", snapshot.attached},
              {"completed", snapshot.completed},
              {"rejected", snapshot.rejected},
              {"transport_failed", snapshot.transport_failed}});
    return drained;
}

IngressStats Ingress::stats() const {
    IngressStats snapshot;
    snapshot.received = received_.load();
    snapshot.ignored = ignored_.load();
    snapshot.dropped = dropped_.load();
    snapshot.attached = attached_.load();
    snapshot.completed = completed_.load();
    snapshot.rejected = rejected_.load();
    snapshot.transport_failed = transport_failed_.load();
    return snapshot;
}

} // namespace portico
