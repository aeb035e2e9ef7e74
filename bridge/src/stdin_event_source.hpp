#pragma once

#include <atomic>
#include <mutex>
#include <utility>
#include <vector>
#include "portico/ingress.hpp"

namespace portico {
namespace bridge {

/**
 * Subscription client that reads realtime payloads from a file descriptor,
 * one JSON document per line:
 *
 *   {"table":"signals","type":"INSERT","record":{...}}
 *
 * Each payload is delivered to every matching subscription. Lines that do
 * not decode are logged and skipped.
 */
class StdinEventSource : public SubscriptionClient {
public:
    explicit StdinEventSource(int fd = 0);

    void subscribe(const Subscription& subscription, Callback callback) override;
    void unsubscribe_all() override;

    /**
     * Read and dispatch lines until end of input or request_stop().
     *
     * @return Number of lines dispatched
     */
    std::size_t run();

    /**
     * Ask run() to return. Safe to call from a signal handler.
     */
    void request_stop() { stop_requested_ = true; }

private:
    void dispatch_line(const std::string& line);

    int fd_;
    std::atomic<bool> stop_requested_{false};
    std::mutex mutex_;
    std::vector<std::pair<Subscription, Callback>> subscriptions_;
};

} // namespace bridge
} // namespace portico
