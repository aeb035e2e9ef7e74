#include "portico/connection_manager.hpp"

#include <algorithm>
#include <thread>
#include "portico/helpers.hpp"
#include "portico/logging.hpp"

namespace portico {

namespace {

constexpr const char* COMPONENT = "connection_manager";

std::unique_ptr<Transport> make_transport(TransportKind kind, TransportOptions options) {
    switch (kind) {
        case TransportKind::Rpc:
            return std::make_unique<RpcTransport>(std::move(options));
        case TransportKind::Stream:
            break;
    }
    return std::make_unique<StreamTransport>(std::move(options));
}

} // namespace

std::optional<TransportKind> parse_transport_kind(const std::string& text) {
    auto upper = helpers::to_upper(text);
    if (upper == "STREAM") return TransportKind::Stream;
    if (upper == "RPC") return TransportKind::Rpc;
    return std::nullopt;
}

ConnectionManager::ConnectionManager(TransportKind kind, TransportOptions options)
    : transport_(make_transport(kind, std::move(options))) {}

ConnectionManager::ConnectionManager(std::unique_ptr<Transport> transport)
    : transport_(std::move(transport)) {
    if (!transport_) {
        throw ConfigError("ConnectionManager requires a transport");
    }
}

void ConnectionManager::connect() {
    transport_->connect();
}

void ConnectionManager::connect_with_backoff(const BackoffPolicy& policy) {
    auto delay = policy.initial_delay;
    int attempts = std::max(policy.max_attempts, 1);
    for (int attempt = 1;; ++attempt) {
        try {
            transport_->connect();
            return;
        } catch (const ConnectError& e) {
            if (attempt >= attempts) {
                log_error(COMPONENT, "connect_failed",
                          {{"transport", transport_->name()},
                           {"attempts", attempt},
                           {"error", e.what()}});
                throw;
            }
            log_warn(COMPONENT, "connect_retry",
                     {{"transport", transport_->name()},
                      {"attempt", attempt},
                      {"delay_ms", delay.count()},
                      {"error", e.what()}});
        }
        std::this_thread::sleep_for(delay);
        delay = std::min(delay * 2, policy.max_delay);
    }
}

EngineResponse ConnectionManager::init_server() {
    auto response = transport_->init_server();
    log_info(COMPONENT, "server_initialized",
             {{"success", response.success()}, {"message", response.message()}});
    return response;
}

EngineResponse ConnectionManager::exchange(const SignalRequest& request) {
    if (request.correlation_id().empty()) {
        throw ValidationError::missing_field("correlation_id");
    }

    auto response = transport_->exchange(request);

    if (response.has_correlation_id() && !response.correlation_id().empty() &&
        response.correlation_id() != request.correlation_id()) {
        log_error(COMPONENT, "response_misattributed",
                  {{"correlation_id", request.correlation_id()},
                   {"response_correlation_id", response.correlation_id()}});
        transport_->close();
        throw TransportError("response for " + response.correlation_id() +
                             " received while waiting for " + request.correlation_id());
    }
    return response;
}

void ConnectionManager::close() {
    transport_->close();
}

} // namespace portico
