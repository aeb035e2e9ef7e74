#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include "portico/helpers.hpp"
#include "portico/transport.hpp"
#include "support/stub_engine.hpp"

using namespace portico;
using portico::test_support::StubEngine;

class StreamTransportTest : public ::testing::Test {
protected:
    TransportOptions options_for(const StubEngine& engine) {
        TransportOptions options;
        options.host = "127.0.0.1";
        options.port = engine.port();
        options.connect_timeout = std::chrono::milliseconds(1000);
        options.request_timeout = std::chrono::milliseconds(1000);
        return options;
    }

    SignalRequest fyi_request(const std::string& correlation) {
        SignalRequest request;
        request.set_correlation_id(correlation);
        request.set_user_correlation_id("u-" + correlation);
        request.set_signal_type(FYI);
        *request.mutable_fyi_data() = helpers::to_struct({{"note", "hi"}});
        return request;
    }
};

// =============================================================================
// Exchange Tests
// =============================================================================

TEST_F(StreamTransportTest, Exchange_StubRepliesWithSession_ShouldReturnDecodedResponse) {
    StubEngine engine([](const SignalRequest& request) -> std::optional<EngineResponse> {
        return StubEngine::reply(request, true, "ok", "s1");
    });
    StreamTransport transport(options_for(engine));

    transport.connect();
    auto response = transport.exchange(fyi_request("g1"));

    EXPECT_TRUE(response.success());
    EXPECT_EQ(response.session_id(), "s1");
    EXPECT_EQ(response.correlation_id(), "g1");
    EXPECT_EQ(engine.requests(), 1);
}

TEST_F(StreamTransportTest, Exchange_ShouldSendRequestFieldsUnderOriginalNames) {
    std::string seen_user_correlation;
    StubEngine engine([&](const SignalRequest& request) -> std::optional<EngineResponse> {
        seen_user_correlation = request.user_correlation_id();
        return StubEngine::reply(request, true);
    });
    StreamTransport transport(options_for(engine));

    transport.exchange(fyi_request("g2"));

    EXPECT_EQ(seen_user_correlation, "u-g2");
    EXPECT_NE(encode_request_body(fyi_request("g2")).find("\"user_correlation_id\""),
              std::string::npos);
}

TEST_F(StreamTransportTest, Exchange_WithoutConnect_ShouldConnectLazily) {
    StubEngine engine([](const SignalRequest& request) -> std::optional<EngineResponse> {
        return StubEngine::reply(request, true);
    });
    StreamTransport transport(options_for(engine));

    EXPECT_FALSE(transport.connected());
    transport.exchange(fyi_request("g1"));

    EXPECT_TRUE(transport.connected());
}

TEST_F(StreamTransportTest, Exchange_SequentialRequests_ShouldReuseOneConnection) {
    StubEngine engine([](const SignalRequest& request) -> std::optional<EngineResponse> {
        return StubEngine::reply(request, true);
    });
    StreamTransport transport(options_for(engine));

    for (int i = 0; i < 5; ++i) {
        auto response = transport.exchange(fyi_request("g" + std::to_string(i)));
        EXPECT_EQ(response.correlation_id(), "g" + std::to_string(i));
    }

    EXPECT_EQ(engine.connections(), 1);
}

TEST_F(StreamTransportTest, InitServer_ShouldSendHandshakeFrame) {
    StubEngine engine([](const SignalRequest& request) -> std::optional<EngineResponse> {
        return StubEngine::reply(request, true);
    });
    StreamTransport transport(options_for(engine));

    auto response = transport.init_server();

    EXPECT_TRUE(response.success());
    EXPECT_EQ(engine.init_requests(), 1);
    EXPECT_EQ(engine.requests(), 0);
}

// =============================================================================
// Failure Tests
// =============================================================================

TEST_F(StreamTransportTest, Exchange_SilentEngine_ShouldTimeOutAndDropConnection) {
    StubEngine engine([](const SignalRequest&) -> std::optional<EngineResponse> {
        return std::nullopt;
    });
    auto options = options_for(engine);
    options.request_timeout = std::chrono::milliseconds(150);
    StreamTransport transport(options);

    try {
        transport.exchange(fyi_request("g1"));
        FAIL() << "Expected TransportError";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.is_timeout());
    }
    EXPECT_FALSE(transport.connected());
}

TEST_F(StreamTransportTest, Exchange_OversizedResponseHeader_ShouldThrowTransportError) {
    StubEngine engine([](const SignalRequest& request) -> std::optional<EngineResponse> {
        return StubEngine::reply(request, true);
    });
    engine.set_raw_reply(framing::encode_header(64u * 1024u * 1024u));
    StreamTransport transport(options_for(engine));

    EXPECT_THROW(transport.exchange(fyi_request("g1")), TransportError);
    EXPECT_FALSE(transport.connected());
}

TEST_F(StreamTransportTest, Exchange_MalformedResponseBody_ShouldThrowTransportError) {
    StubEngine engine([](const SignalRequest& request) -> std::optional<EngineResponse> {
        return StubEngine::reply(request, true);
    });
    engine.set_raw_reply(framing::encode_frame("not json"));
    StreamTransport transport(options_for(engine));

    EXPECT_THROW(transport.exchange(fyi_request("g1")), TransportError);
}

TEST_F(StreamTransportTest, Exchange_AfterFailure_ShouldReconnectOnNextCall) {
    StubEngine engine([](const SignalRequest& request) -> std::optional<EngineResponse> {
        if (request.correlation_id() == "silent") return std::nullopt;
        return StubEngine::reply(request, true);
    });
    auto options = options_for(engine);
    options.request_timeout = std::chrono::milliseconds(150);
    StreamTransport transport(options);

    EXPECT_THROW(transport.exchange(fyi_request("silent")), TransportError);
    auto response = transport.exchange(fyi_request("g2"));

    EXPECT_EQ(response.correlation_id(), "g2");
    EXPECT_EQ(engine.connections(), 2);
}

TEST_F(StreamTransportTest, Connect_NothingListening_ShouldThrowConnectError) {
    std::uint16_t port;
    {
        StubEngine engine([](const SignalRequest&) -> std::optional<EngineResponse> {
            return std::nullopt;
        });
        port = engine.port();
    }
    TransportOptions options;
    options.host = "127.0.0.1";
    options.port = port;
    options.connect_timeout = std::chrono::milliseconds(300);
    StreamTransport transport(options);

    EXPECT_THROW(transport.connect(), ConnectError);
    EXPECT_FALSE(transport.connected());
}

TEST_F(StreamTransportTest, Close_Twice_ShouldBeHarmless) {
    StubEngine engine([](const SignalRequest& request) -> std::optional<EngineResponse> {
        return StubEngine::reply(request, true);
    });
    StreamTransport transport(options_for(engine));
    transport.connect();

    transport.close();
    transport.close();

    EXPECT_FALSE(transport.connected());
}

// =============================================================================
// Body Codec Tests
// =============================================================================

TEST(StreamBodyTest, DecodeResponseBody_UnknownFields_ShouldBeIgnored) {
    auto response = decode_response_body(
        R"({"success":true,"session_id":"s9","engine_version":"2"})");

    EXPECT_TRUE(response.success());
    EXPECT_EQ(response.session_id(), "s9");
}

TEST(StreamBodyTest, DecodeResponseBody_InvalidJson_ShouldThrowDecodeError) {
    EXPECT_THROW(decode_response_body("{"), DecodeError);
}
