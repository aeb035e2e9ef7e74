#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace portico {

/**
 * Base exception for all Portico bridge errors.
 *
 * Every failure is scoped to the single event being processed; callers use
 * the introspection methods to decide between dropping, retrying the
 * connection, or writing a failed outcome back.
 */
class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if the event was malformed and must not be sent.
     */
    virtual bool is_validation_error() const { return false; }

    /**
     * Returns true if this is a connection or transport error.
     */
    virtual bool is_connection_error() const { return false; }

    /**
     * Returns true if a deadline expired before the engine answered.
     */
    virtual bool is_timeout() const { return false; }

    /**
     * Returns true if structured data could not be decoded.
     */
    virtual bool is_decode_error() const { return false; }
};

/**
 * Thrown when a change event cannot be turned into a fully valid request.
 * The event is dropped before anything reaches the engine.
 */
class ValidationError : public BridgeError {
public:
    enum class Kind {
        MissingField,
        InvalidEnum,
        InvalidValue
    };

    ValidationError(Kind kind, const std::string& field, const std::string& message)
        : BridgeError(message), kind_(kind), field_(field) {}

    static ValidationError missing_field(const std::string& field) {
        return ValidationError(Kind::MissingField, field, "missing required field: " + field);
    }

    static ValidationError invalid_enum(const std::string& field, const std::string& value) {
        return ValidationError(Kind::InvalidEnum, field,
                               "invalid value for " + field + ": '" + value + "'");
    }

    static ValidationError invalid_value(const std::string& field, const std::string& detail) {
        return ValidationError(Kind::InvalidValue, field, field + ": " + detail);
    }

    Kind kind() const { return kind_; }
    const std::string& field() const { return field_; }

    bool is_validation_error() const override { return true; }

private:
    Kind kind_;
    std::string field_;
};

/**
 * Thrown when the engine cannot be reached. The caller decides whether to retry.
 */
class ConnectError : public BridgeError {
public:
    explicit ConnectError(const std::string& message)
        : BridgeError(message) {}

    bool is_connection_error() const override { return true; }
};

/**
 * Thrown when a send or receive fails mid-exchange. The connection is
 * discarded before this propagates.
 */
class TransportError : public BridgeError {
public:
    explicit TransportError(const std::string& message, bool timeout = false)
        : BridgeError(message), timeout_(timeout) {}

    static TransportError timed_out(const std::string& what) {
        return TransportError(what + " timed out", true);
    }

    bool is_connection_error() const override { return true; }
    bool is_timeout() const override { return timeout_; }

private:
    bool timeout_;
};

/**
 * Thrown when a gRPC call fails for a reason other than the engine
 * rejecting the request.
 */
class GrpcError : public TransportError {
public:
    GrpcError(const std::string& message, grpc::StatusCode status_code)
        : TransportError(message, status_code == grpc::StatusCode::DEADLINE_EXCEEDED),
          status_code_(status_code) {}

    grpc::StatusCode status_code() const { return status_code_; }

private:
    grpc::StatusCode status_code_;
};

/**
 * Thrown when an embedded JSON string or a frame body cannot be decoded.
 */
class DecodeError : public BridgeError {
public:
    explicit DecodeError(const std::string& message)
        : BridgeError(message) {}

    bool is_decode_error() const override { return true; }
};

/**
 * Thrown when startup configuration is missing or malformed.
 */
class ConfigError : public BridgeError {
public:
    explicit ConfigError(const std::string& message)
        : BridgeError(message) {}
};

} // namespace portico
