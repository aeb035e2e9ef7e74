#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "portico/change_event.hpp"
#include "portico/connection_manager.hpp"
#include "portico/response_handler.hpp"
#include "portico/translator.hpp"
#include "portico/worker_pool.hpp"

namespace portico {

/**
 * One notification stream: changes of the given kind on one table.
 */
struct Subscription {
    std::string table;
    Operation operation = Operation::Any;
};

/**
 * Delivers change notifications from the upstream record store.
 *
 * Callbacks may be invoked from any thread and may block (backpressure).
 */
class SubscriptionClient {
public:
    using Callback = std::function<void(ChangeEvent)>;

    virtual ~SubscriptionClient() = default;

    virtual void subscribe(const Subscription& subscription, Callback callback) = 0;

    /**
     * Stop delivering events. Callbacks already running may still finish.
     */
    virtual void unsubscribe_all() = 0;
};

struct IngressOptions {
    std::size_t workers = 8;
    std::size_t queue_capacity = 256;
    BackoffPolicy backoff;
};

/**
 * Snapshot of the ingress counters.
 */
struct IngressStats {
    std::uint64_t received = 0;
    std::uint64_t ignored = 0;
    std::uint64_t dropped = 0;
    std::uint64_t attached = 0;
    std::uint64_t completed = 0;
    std::uint64_t rejected = 0;
    std::uint64_t transport_failed = 0;
};

/**
 * Turns change notifications into engine requests.
 *
 * Every accepted event becomes an independent unit of work on the worker pool:
 *
 *   sanitize -> translate -> exchange -> handle response
 *
 * A unit that fails affects only its own event. Units run concurrently; the
 * only ordering is delivery order into the queue.
 *
 * Example:
 *   Ingress ingress(subscriptions, Translator(), connections, responses, {});
 *   ingress.start();
 *   ...
 *   ingress.stop(std::chrono::seconds(10));
 */
class Ingress {
public:
    Ingress(SubscriptionClient& subscriptions, Translator translator,
            ConnectionManager& connections, ResponseHandler& responses,
            IngressOptions options = {});

    ~Ingress();

    Ingress(const Ingress&) = delete;
    Ingress& operator=(const Ingress&) = delete;

    /**
     * Send the server-initialization handshake, then subscribe to the signal
     * table (INSERT) and each entity table (any operation). A failed
     * handshake is logged; events are still accepted.
     */
    void start();

    /**
     * Filter an event and queue it for processing. Blocks while the queue is
     * full.
     *
     * @return false if the ingress has been stopped
     */
    bool submit(ChangeEvent event);

    /**
     * Unsubscribe, drain for up to grace, then close the connection.
     *
     * @return true if every queued unit ran
     */
    bool stop(std::chrono::milliseconds grace);

    /**
     * Run one unit of work on the calling thread.
     *
     * @return The outcome, or nullopt if the event failed translation
     */
    std::optional<Outcome> process(const ChangeEvent& event);

    /**
     * Returns true if the event belongs to a subscribed stream.
     */
    bool accepts(const ChangeEvent& event) const;

    IngressStats stats() const;

private:
    void record(Outcome outcome);

    SubscriptionClient& subscriptions_;
    Translator translator_;
    ConnectionManager& connections_;
    ResponseHandler& responses_;
    IngressOptions options_;
    std::unique_ptr<WorkerPool> pool_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};

    std::atomic<std::uint64_t> received_{0};
    std::atomic<std::uint64_t> ignored_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> attached_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::atomic<std::uint64_t> transport_failed_{0};
};

} // namespace portico
