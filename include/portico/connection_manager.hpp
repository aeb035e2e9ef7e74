#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "portico/bridge.pb.h"
#include "portico/errors.hpp"
#include "portico/transport.hpp"

namespace portico {

/**
 * Which transport carries requests to the engine.
 */
enum class TransportKind {
    Stream,
    Rpc
};

/**
 * Parse "stream" or "rpc" (any case).
 */
std::optional<TransportKind> parse_transport_kind(const std::string& text);

/**
 * Bounded exponential backoff for connection establishment.
 */
struct BackoffPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds initial_delay{100};
    std::chrono::milliseconds max_delay{5000};
};

/**
 * Owns the one logical connection to the engine.
 *
 * The transport strategy is chosen at construction; everything above this
 * class sees only connect / exchange / close.
 *
 * Example:
 *   ConnectionManager connections(TransportKind::Stream, options);
 *   connections.connect_with_backoff({});
 *   EngineResponse response = connections.exchange(request);
 */
class ConnectionManager {
public:
    ConnectionManager(TransportKind kind, TransportOptions options);

    /**
     * Wrap an existing transport.
     */
    explicit ConnectionManager(std::unique_ptr<Transport> transport);

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * Connect with a single attempt.
     *
     * @throws ConnectError if the engine cannot be reached
     */
    void connect();

    /**
     * Connect, retrying with exponential backoff.
     *
     * @throws ConnectError from the last attempt when all attempts fail
     */
    void connect_with_backoff(const BackoffPolicy& policy);

    /**
     * Send the server-initialization handshake.
     *
     * @throws TransportError if the exchange fails
     */
    EngineResponse init_server();

    /**
     * Send one request and return the engine's response to it.
     *
     * A response that names a different correlation id than the request is
     * misattributed: the connection is dropped and TransportError raised.
     *
     * @throws ValidationError if the request has no correlation id
     * @throws ConnectError if the connection cannot be re-established
     * @throws TransportError if the exchange fails
     */
    EngineResponse exchange(const SignalRequest& request);

    /**
     * Drop the connection. Idempotent.
     */
    void close();

    bool connected() const { return transport_->connected(); }

    const Transport& transport() const { return *transport_; }

private:
    std::unique_ptr<Transport> transport_;
};

} // namespace portico
