#include <atomic>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include "portico/portico.hpp"
#include "stdin_event_source.hpp"

namespace {

constexpr const char* COMPONENT = "portico-bridge";

/**
 * Record updater that logs each write-back instead of calling the record store.
 */
class LoggingRecordUpdater : public portico::RecordUpdater {
public:
    void attach_session(const std::string& event_id, const std::string& session_id) override {
        portico::log_info(COMPONENT, "attach_session",
                          {{"event_id", event_id}, {"session_id", session_id}});
    }

    void mark_failed(const std::string& event_id, const std::string& reason) override {
        portico::log_info(COMPONENT, "mark_failed", {{"event_id", event_id}, {"reason", reason}});
    }

    void report_entity_failure(const std::string& table, const std::string& entity_id,
                               const std::string& reason) override {
        portico::log_info(COMPONENT, "report_entity_failure",
                          {{"table", table}, {"entity_id", entity_id}, {"reason", reason}});
    }
};

std::atomic<portico::bridge::StdinEventSource*> g_source{nullptr};

void on_signal(int) {
    if (auto* source = g_source.load()) {
        source->request_stop();
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string env_file = argc > 1 ? argv[1] : ".env";

    portico::Config config;
    try {
        int loaded = portico::load_env_file(env_file);
        config = portico::Config::from_env();
        portico::set_log_level(config.log_level);
        if (loaded > 0) {
            portico::log_info(COMPONENT, "env_file_loaded", {{"path", env_file}, {"variables", loaded}});
        }
    } catch (const portico::ConfigError& e) {
        portico::log_error(COMPONENT, "config_invalid", {{"error", e.what()}});
        return EXIT_FAILURE;
    }

    portico::log_info(COMPONENT, "bridge_starting",
                      {{"engine", config.engine.endpoint()},
                       {"transport", config.transport == portico::TransportKind::Rpc ? "rpc" : "stream"},
                       {"workers", config.ingress.workers},
                       {"queue_capacity", config.ingress.queue_capacity},
                       {"supabase_url", config.supabase_url}});

    portico::ConnectionManager connections(config.transport, config.engine);
    LoggingRecordUpdater updater;
    portico::ResponseHandler responses(updater, config.secondary_failures);
    portico::bridge::StdinEventSource source;

    portico::Ingress ingress(source, portico::Translator(config.tables), connections, responses,
                             config.ingress);

    g_source = &source;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    ingress.start();
    source.run();

    bool drained = ingress.stop(config.shutdown_grace);
    g_source = nullptr;

    auto stats = ingress.stats();
    portico::log_info(COMPONENT, "bridge_stopped",
                      {{"drained", drained},
                       {"received", stats.received},
                       {"dropped", stats.dropped},
                       {"rejected", stats.rejected},
                       {"transport_failed", stats.transport_failed}});
    return drained ? EXIT_SUCCESS : EXIT_FAILURE;
}
