#include "stdin_event_source.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include "portico/helpers.hpp"
#include "portico/logging.hpp"

namespace portico {
namespace bridge {

namespace {
constexpr const char* COMPONENT = "stdin_source";
constexpr int POLL_INTERVAL_MS = 200;
}

StdinEventSource::StdinEventSource(int fd) : fd_(fd) {}

void StdinEventSource::subscribe(const Subscription& subscription, Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.emplace_back(subscription, std::move(callback));
    log_info(COMPONENT, "subscription_added",
             {{"table", subscription.table}, {"operation", operation_name(subscription.operation)}});
}

void StdinEventSource::unsubscribe_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.clear();
    stop_requested_ = true;
}

std::size_t StdinEventSource::run() {
    std::size_t dispatched = 0;
    std::string pending;
    char buffer[4096];

    while (!stop_requested_) {
        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, POLL_INTERVAL_MS);
        if (rc == 0) continue;
        if (rc < 0) {
            if (errno == EINTR) continue;
            log_error(COMPONENT, "poll_failed", {{"error", std::strerror(errno)}});
            break;
        }

        ssize_t n = ::read(fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            log_error(COMPONENT, "read_failed", {{"error", std::strerror(errno)}});
            break;
        }
        if (n == 0) {
            break;
        }
        pending.append(buffer, static_cast<std::size_t>(n));

        std::size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            auto line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            dispatch_line(line);
            ++dispatched;
        }
    }

    if (!stop_requested_ && pending.find_first_not_of(" \t\r\n") != std::string::npos) {
        dispatch_line(pending);
        ++dispatched;
    }
    log_info(COMPONENT, "input_finished", {{"lines", dispatched}});
    return dispatched;
}

void StdinEventSource::dispatch_line(const std::string& line) {
    ChangeEvent event;
    try {
        event = ChangeEvent::from_payload(helpers::parse_json(line));
    } catch (const BridgeError& e) {
        log_warn(COMPONENT, "payload_invalid", {{"error", e.what()}});
        return;
    }

    std::vector<Callback> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : subscriptions_) {
            const auto& subscription = entry.first;
            if (subscription.table == event.table &&
                (subscription.operation == Operation::Any ||
                 subscription.operation == event.operation)) {
                targets.push_back(entry.second);
            }
        }
    }

    if (targets.empty()) {
        log_debug(COMPONENT, "payload_unsubscribed",
                  {{"table", event.table}, {"operation", operation_name(event.operation)}});
        return;
    }
    for (const auto& callback : targets) {
        callback(event);
    }
}

} // namespace bridge
} // namespace portico
