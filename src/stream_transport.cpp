#include "portico/transport.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <google/protobuf/util/json_util.h>
#include "portico/logging.hpp"

namespace portico {

namespace {

constexpr const char* COMPONENT = "stream_transport";

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

/// Wait until fd is ready for the given events or the deadline passes.
bool wait_ready(int fd, short events, Clock::time_point deadline) {
    while (true) {
        pollfd pfd{fd, events, 0};
        int rc = ::poll(&pfd, 1, remaining_ms(deadline));
        if (rc > 0) return true;
        if (rc == 0) return false;
        if (errno != EINTR) {
            throw TransportError(std::string("poll failed: ") + std::strerror(errno));
        }
    }
}

/// Socket reads and writes bounded by one deadline for the whole exchange.
class SocketStream : public framing::ByteSource, public framing::ByteSink {
public:
    SocketStream(int fd, Clock::time_point deadline) : fd_(fd), deadline_(deadline) {}

    std::size_t read_some(char* buffer, std::size_t length) override {
        while (true) {
            if (!wait_ready(fd_, POLLIN, deadline_)) {
                throw TransportError::timed_out("receive");
            }
            ssize_t n = ::recv(fd_, buffer, length, 0);
            if (n >= 0) return static_cast<std::size_t>(n);
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw TransportError(std::string("recv failed: ") + std::strerror(errno));
        }
    }

    std::size_t write_some(const char* data, std::size_t length) override {
        while (true) {
            if (!wait_ready(fd_, POLLOUT, deadline_)) {
                throw TransportError::timed_out("send");
            }
            ssize_t n = ::send(fd_, data, length, MSG_NOSIGNAL);
            if (n > 0) return static_cast<std::size_t>(n);
            if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
            throw TransportError(std::string("send failed: ") +
                                 (n == 0 ? "connection closed" : std::strerror(errno)));
        }
    }

private:
    int fd_;
    Clock::time_point deadline_;
};

/// Non-blocking connect to one resolved address, bounded by deadline.
int connect_address(const addrinfo* addr, Clock::time_point deadline, std::string& error) {
    int fd = ::socket(addr->ai_family, addr->ai_socktype | SOCK_CLOEXEC, addr->ai_protocol);
    if (fd < 0) {
        error = std::string("socket() failed: ") + std::strerror(errno);
        return -1;
    }
    int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    if (::connect(fd, addr->ai_addr, addr->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            error = std::string("connect() failed: ") + std::strerror(errno);
            ::close(fd);
            return -1;
        }
        bool ready = false;
        try {
            ready = wait_ready(fd, POLLOUT, deadline);
        } catch (const TransportError& e) {
            error = e.what();
            ::close(fd);
            return -1;
        }
        if (!ready) {
            error = "connect() timed out";
            ::close(fd);
            return -1;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) {
            error = std::string("connect() failed: ") + std::strerror(so_error);
            ::close(fd);
            return -1;
        }
    }

    int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return fd;
}

google::protobuf::util::JsonPrintOptions print_options() {
    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
    return options;
}

} // namespace

std::string encode_request_body(const SignalRequest& request) {
    std::string body;
    auto status = google::protobuf::util::MessageToJsonString(request, &body, print_options());
    if (!status.ok()) {
        throw TransportError("cannot encode request: " + status.ToString());
    }
    return body;
}

EngineResponse decode_response_body(const std::string& body) {
    EngineResponse response;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(body, &response, options);
    if (!status.ok()) {
        throw DecodeError("malformed engine response: " + status.ToString());
    }
    return response;
}

StreamTransport::StreamTransport(TransportOptions options)
    : options_(std::move(options)) {}

StreamTransport::~StreamTransport() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

void StreamTransport::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_locked();
}

bool StreamTransport::connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd_ >= 0;
}

void StreamTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

EngineResponse StreamTransport::init_server() {
    ServerInitRequest init;
    init.set_server_init(true);
    std::string body;
    auto status = google::protobuf::util::MessageToJsonString(init, &body, print_options());
    if (!status.ok()) {
        throw TransportError("cannot encode init request: " + status.ToString());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return round_trip_locked(body);
}

EngineResponse StreamTransport::exchange(const SignalRequest& request) {
    auto body = encode_request_body(request);

    // One request in flight per connection: the lock covers send and receive.
    std::lock_guard<std::mutex> lock(mutex_);
    return round_trip_locked(body);
}

void StreamTransport::connect_locked() {
    if (fd_ >= 0) return;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    auto port = std::to_string(options_.port);
    int rc = ::getaddrinfo(options_.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        throw ConnectError("cannot resolve " + options_.endpoint() + ": " + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(results, &::freeaddrinfo);

    auto deadline = Clock::now() + options_.connect_timeout;
    std::string error = "no addresses";
    for (const addrinfo* addr = results; addr != nullptr; addr = addr->ai_next) {
        int fd = connect_address(addr, deadline, error);
        if (fd >= 0) {
            fd_ = fd;
            log_info(COMPONENT, "connected", {{"endpoint", options_.endpoint()}});
            return;
        }
    }
    throw ConnectError("cannot connect to " + options_.endpoint() + ": " + error);
}

void StreamTransport::close_locked() {
    if (fd_ < 0) return;
    ::close(fd_);
    fd_ = -1;
    log_info(COMPONENT, "disconnected", {{"endpoint", options_.endpoint()}});
}

EngineResponse StreamTransport::round_trip_locked(const std::string& body) {
    connect_locked();

    std::string reply;
    try {
        SocketStream stream(fd_, Clock::now() + options_.request_timeout);
        framing::write_frame(stream, body, options_.max_frame_bytes);
        reply = framing::read_frame(stream, options_.max_frame_bytes);
    } catch (const TransportError&) {
        // A half-finished exchange leaves the stream at an unknown offset.
        close_locked();
        throw;
    }

    try {
        return decode_response_body(reply);
    } catch (const DecodeError& e) {
        close_locked();
        throw TransportError(e.what());
    }
}

} // namespace portico
