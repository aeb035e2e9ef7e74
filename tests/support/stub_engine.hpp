#pragma once

#include <arpa/inet.h>
#include <atomic>
#include <functional>
#include <mutex>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>
#include <google/protobuf/util/json_util.h>
#include <nlohmann/json.hpp>
#include "portico/bridge.pb.h"
#include "portico/errors.hpp"
#include "portico/framing.hpp"

namespace portico {
namespace test_support {

/**
 * Blocking socket reads and writes for the stub side of a connection.
 */
class FdStream : public framing::ByteSource, public framing::ByteSink {
public:
    explicit FdStream(int fd) : fd_(fd) {}

    std::size_t read_some(char* buffer, std::size_t length) override {
        ssize_t n = ::recv(fd_, buffer, length, 0);
        if (n < 0) throw TransportError("stub recv failed");
        return static_cast<std::size_t>(n);
    }

    std::size_t write_some(const char* data, std::size_t length) override {
        ssize_t n = ::send(fd_, data, length, MSG_NOSIGNAL);
        if (n <= 0) throw TransportError("stub send failed");
        return static_cast<std::size_t>(n);
    }

private:
    int fd_;
};

/**
 * In-process engine speaking the length-prefixed JSON protocol on an
 * ephemeral loopback port.
 *
 * The handler decides each response; returning nullopt leaves the request
 * unanswered (a silent engine). When raw_reply is set, those bytes are sent
 * verbatim instead of a frame.
 */
class StubEngine {
public:
    using Handler = std::function<std::optional<EngineResponse>(const SignalRequest&)>;

    explicit StubEngine(Handler handler) : handler_(std::move(handler)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(listen_fd_, 16);

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        acceptor_ = std::thread([this] { accept_loop(); });
    }

    ~StubEngine() {
        stopping_ = true;
        acceptor_.join();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (int fd : client_fds_) {
                ::shutdown(fd, SHUT_RDWR);
            }
        }
        for (auto& thread : connection_threads_) {
            thread.join();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        for (int fd : client_fds_) {
            ::close(fd);
        }
        ::close(listen_fd_);
    }

    StubEngine(const StubEngine&) = delete;
    StubEngine& operator=(const StubEngine&) = delete;

    std::uint16_t port() const { return port_; }

    int requests() const { return requests_.load(); }
    int init_requests() const { return init_requests_.load(); }
    int connections() const { return connections_.load(); }

    void set_raw_reply(std::string bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        raw_reply_ = std::move(bytes);
    }

    /// Echo the request's correlation id with the given outcome.
    static EngineResponse reply(const SignalRequest& request, bool success,
                                const std::string& message = "",
                                const std::string& session_id = "") {
        EngineResponse response;
        response.set_success(success);
        response.set_message(message);
        response.set_correlation_id(request.correlation_id());
        if (!session_id.empty()) {
            response.set_session_id(session_id);
        }
        return response;
    }

private:
    void accept_loop() {
        while (!stopping_) {
            pollfd pfd{listen_fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) continue;
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) continue;
            ++connections_;
            std::lock_guard<std::mutex> lock(mutex_);
            client_fds_.push_back(fd);
            connection_threads_.emplace_back([this, fd] { serve(fd); });
        }
    }

    void serve(int fd) {
        FdStream stream(fd);
        while (true) {
            std::string body;
            try {
                body = framing::read_frame(stream);
            } catch (const TransportError&) {
                return;
            }

            auto json = nlohmann::json::parse(body, nullptr, false);
            std::optional<EngineResponse> response;
            if (json.is_object() && json.contains("server_init")) {
                ++init_requests_;
                EngineResponse init;
                init.set_success(true);
                init.set_message("initialized");
                response = init;
            } else {
                ++requests_;
                SignalRequest request;
                google::protobuf::util::JsonParseOptions options;
                options.ignore_unknown_fields = true;
                if (!google::protobuf::util::JsonStringToMessage(body, &request, options).ok()) {
                    return;
                }
                response = handler_(request);
            }

            std::string raw;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                raw = raw_reply_;
            }
            try {
                if (!raw.empty()) {
                    framing::write_all(stream, raw.data(), raw.size());
                } else if (response) {
                    std::string out;
                    google::protobuf::util::JsonPrintOptions print;
                    print.preserve_proto_field_names = true;
                    google::protobuf::util::MessageToJsonString(*response, &out, print);
                    framing::write_frame(stream, out);
                }
            } catch (const TransportError&) {
                return;
            }
        }
    }

    Handler handler_;
    int listen_fd_ = -1;
    std::uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<int> requests_{0};
    std::atomic<int> init_requests_{0};
    std::atomic<int> connections_{0};
    std::mutex mutex_;
    std::string raw_reply_;
    std::vector<int> client_fds_;
    std::vector<std::thread> connection_threads_;
    std::thread acceptor_;
};

} // namespace test_support
} // namespace portico
