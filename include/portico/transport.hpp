#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <grpcpp/grpcpp.h>
#include "portico/bridge.pb.h"
#include "portico/bridge.grpc.pb.h"
#include "portico/errors.hpp"
#include "portico/framing.hpp"

namespace portico {

/**
 * Where the engine lives and how long to wait for it.
 */
struct TransportOptions {
    std::string host;
    std::uint16_t port = 0;
    std::chrono::milliseconds connect_timeout{3000};
    std::chrono::milliseconds request_timeout{5000};
    std::uint32_t max_frame_bytes = framing::DEFAULT_MAX_FRAME_BYTES;

    std::string endpoint() const { return host + ":" + std::to_string(port); }
};

/**
 * One way of talking to the engine.
 *
 * Implementations own at most one logical connection. connect() is a single
 * attempt; retry policy belongs to the caller. Every exchange is bounded by
 * TransportOptions::request_timeout.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Establish the connection (single attempt). No-op if already connected.
     *
     * @throws ConnectError if the engine cannot be reached
     */
    virtual void connect() = 0;

    virtual bool connected() const = 0;

    /**
     * Send the server-initialization handshake.
     *
     * @throws TransportError if the exchange fails
     */
    virtual EngineResponse init_server() = 0;

    /**
     * Send one request and wait for its response.
     *
     * @throws ConnectError if a dropped connection cannot be re-established
     * @throws TransportError if sending or receiving fails or times out
     */
    virtual EngineResponse exchange(const SignalRequest& request) = 0;

    /**
     * Drop the connection. Safe to call repeatedly.
     */
    virtual void close() = 0;

    virtual const char* name() const = 0;
};

/**
 * Length-prefixed JSON frames over one shared TCP connection.
 *
 * Each send-then-receive pair runs under a single lock, so only one request
 * is ever in flight on the socket and a response frame always belongs to the
 * request that preceded it. Any transport failure closes the socket; the next
 * exchange reconnects with a single attempt.
 *
 * Bodies are the protobuf JSON mapping with original field names, e.g.
 *   {"correlation_id":"g1","signal_type":"COMMAND","command":{...}}
 */
class StreamTransport : public Transport {
public:
    explicit StreamTransport(TransportOptions options);
    ~StreamTransport() override;

    StreamTransport(const StreamTransport&) = delete;
    StreamTransport& operator=(const StreamTransport&) = delete;

    void connect() override;
    bool connected() const override;
    EngineResponse init_server() override;
    EngineResponse exchange(const SignalRequest& request) override;
    void close() override;
    const char* name() const override { return "stream"; }

private:
    void connect_locked();
    void close_locked();
    EngineResponse round_trip_locked(const std::string& body);

    TransportOptions options_;
    mutable std::mutex mutex_;
    int fd_ = -1;
};

/**
 * Typed gRPC calls on BridgeService.
 *
 * exchange() picks the RPC from the request: entity-row commands
 * (source ENTITY_ROW) go to CreateEntity/UpdateEntity/DeleteEntity by
 * operation, every signal-row request to ProcessSignal. gRPC multiplexes calls on the channel, so concurrent
 * exchanges cannot receive each other's responses.
 *
 * A status of INVALID_ARGUMENT, FAILED_PRECONDITION or NOT_FOUND means the
 * engine rejected the request and becomes a response with success=false.
 * Any other failure raises GrpcError.
 */
class RpcTransport : public Transport {
public:
    explicit RpcTransport(TransportOptions options);

    void connect() override;
    bool connected() const override;
    EngineResponse init_server() override;
    EngineResponse exchange(const SignalRequest& request) override;
    void close() override;
    const char* name() const override { return "rpc"; }

private:
    std::shared_ptr<BridgeService::Stub> stub();
    void configure(grpc::ClientContext& context) const;
    EngineResponse finish(const grpc::Status& status, EngineResponse response,
                          const std::string& method);

    TransportOptions options_;
    mutable std::mutex mutex_;
    std::shared_ptr<grpc::Channel> channel_;
    std::shared_ptr<BridgeService::Stub> stub_;
};

/**
 * Encode a request as a stream frame body.
 */
std::string encode_request_body(const SignalRequest& request);

/**
 * Decode a stream frame body into a response.
 *
 * @throws DecodeError if the body is not a valid response
 */
EngineResponse decode_response_body(const std::string& body);

} // namespace portico
