#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include "portico/connection_manager.hpp"
#include "portico/errors.hpp"
#include "portico/ingress.hpp"
#include "portico/logging.hpp"
#include "portico/response_handler.hpp"
#include "portico/translator.hpp"

namespace portico {

/**
 * Bridge settings, read once at startup.
 *
 * Production deployments configure the bridge through environment variables
 * (optionally seeded from a .env file) so the same binary runs everywhere.
 */
struct Config {
    TransportKind transport = TransportKind::Stream;
    TransportOptions engine;

    std::string supabase_url;
    std::string supabase_key;

    IngressOptions ingress;
    std::chrono::milliseconds shutdown_grace{10000};
    SecondaryFailurePolicy secondary_failures = SecondaryFailurePolicy::LogOnly;
    TranslatorOptions tables;
    LogLevel log_level = LogLevel::Info;

    using Lookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * Read the process environment.
     *
     * @throws ConfigError if a required value is missing or any value is malformed
     */
    static Config from_env();

    /**
     * Read settings through an arbitrary name -> value lookup.
     *
     * @throws ConfigError if a required value is missing or any value is malformed
     */
    static Config from_lookup(const Lookup& lookup);
};

/**
 * Merge KEY=VALUE lines from a .env file into the environment. Variables
 * already set are left alone. Blank lines and # comments are skipped; values
 * may be wrapped in single or double quotes.
 *
 * @return Number of variables set, 0 if the file does not exist
 * @throws ConfigError if a line is not KEY=VALUE
 */
int load_env_file(const std::string& path);

/**
 * Parse "debug", "info", "warn"/"warning" or "error" (any case).
 */
std::optional<LogLevel> parse_log_level(const std::string& text);

/**
 * Parse "table=ENTITY,table=ENTITY".
 *
 * @throws ConfigError on malformed entries or unknown entity types
 */
std::map<std::string, EntityType> parse_entity_tables(const std::string& text);

} // namespace portico
