#include "portico/config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include "portico/helpers.hpp"

namespace portico {

namespace {

std::string trim(const std::string& text) {
    const char* space = " \t\r\n";
    auto first = text.find_first_not_of(space);
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(space);
    return text.substr(first, last - first + 1);
}

std::optional<std::string> lookup_nonempty(const Config::Lookup& lookup, const std::string& name) {
    auto value = lookup(name);
    if (!value) {
        return std::nullopt;
    }
    auto text = trim(*value);
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::string require(const Config::Lookup& lookup, const std::string& name) {
    auto value = lookup_nonempty(lookup, name);
    if (!value) {
        throw ConfigError("missing required setting " + name);
    }
    return *value;
}

long long parse_integer(const std::string& name, const std::string& text,
                        long long min, long long max) {
    std::size_t consumed = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + " must be an integer, got '" + text + "'");
    }
    if (consumed != text.size()) {
        throw ConfigError(name + " must be an integer, got '" + text + "'");
    }
    if (value < min || value > max) {
        throw ConfigError(name + " must be between " + std::to_string(min) + " and " +
                          std::to_string(max) + ", got " + text);
    }
    return value;
}

long long integer_or(const Config::Lookup& lookup, const std::string& name,
                     long long fallback, long long min, long long max) {
    auto value = lookup_nonempty(lookup, name);
    return value ? parse_integer(name, *value, min, max) : fallback;
}

std::chrono::milliseconds millis_or(const Config::Lookup& lookup, const std::string& name,
                                    long long fallback) {
    return std::chrono::milliseconds(
        integer_or(lookup, name, fallback, 0, std::numeric_limits<int>::max()));
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 &&
        ((value.front() == '"' && value.back() == '"') ||
         (value.front() == '\'' && value.back() == '\''))) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string& text) {
    auto upper = helpers::to_upper(text);
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

std::map<std::string, EntityType> parse_entity_tables(const std::string& text) {
    std::map<std::string, EntityType> tables;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find(',', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        auto entry = trim(text.substr(start, end - start));
        start = end + 1;
        if (entry.empty()) {
            continue;
        }

        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("BRIDGE_ENTITY_TABLES entry '" + entry + "' is not table=ENTITY");
        }
        auto table = trim(entry.substr(0, eq));
        auto type_text = trim(entry.substr(eq + 1));
        auto type = helpers::parse_symbol<EntityType>(type_text, EntityType_Parse);
        if (table.empty() || !type) {
            throw ConfigError("BRIDGE_ENTITY_TABLES entry '" + entry + "' is not table=ENTITY");
        }
        tables[table] = *type;
    }
    if (tables.empty()) {
        throw ConfigError("BRIDGE_ENTITY_TABLES names no tables");
    }
    return tables;
}

Config Config::from_env() {
    return from_lookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

Config Config::from_lookup(const Lookup& lookup) {
    Config config;

    config.engine.host = require(lookup, "ENGINE_HOST");
    config.engine.port = static_cast<std::uint16_t>(
        parse_integer("ENGINE_PORT", require(lookup, "ENGINE_PORT"), 1, 65535));
    config.supabase_url = require(lookup, "SUPABASE_URL");
    config.supabase_key = require(lookup, "SUPABASE_KEY");

    if (auto text = lookup_nonempty(lookup, "ENGINE_TRANSPORT")) {
        auto kind = parse_transport_kind(*text);
        if (!kind) {
            throw ConfigError("ENGINE_TRANSPORT must be stream or rpc, got '" + *text + "'");
        }
        config.transport = *kind;
    }

    config.engine.request_timeout = millis_or(lookup, "ENGINE_TIMEOUT_MS", 5000);
    config.engine.connect_timeout = millis_or(lookup, "ENGINE_CONNECT_TIMEOUT_MS", 3000);
    config.engine.max_frame_bytes = static_cast<std::uint32_t>(
        integer_or(lookup, "ENGINE_MAX_FRAME_BYTES", framing::DEFAULT_MAX_FRAME_BYTES, 1,
                   std::numeric_limits<std::uint32_t>::max()));

    config.ingress.workers =
        static_cast<std::size_t>(integer_or(lookup, "BRIDGE_WORKERS", 8, 1, 1024));
    config.ingress.queue_capacity =
        static_cast<std::size_t>(integer_or(lookup, "BRIDGE_QUEUE_CAPACITY", 256, 1, 1000000));
    config.shutdown_grace = millis_or(lookup, "BRIDGE_SHUTDOWN_GRACE_MS", 10000);

    if (auto text = lookup_nonempty(lookup, "BRIDGE_SECONDARY_FAILURES")) {
        auto policy = parse_secondary_failure_policy(*text);
        if (!policy) {
            throw ConfigError("BRIDGE_SECONDARY_FAILURES must be log or report, got '" + *text + "'");
        }
        config.secondary_failures = *policy;
    }

    if (auto text = lookup_nonempty(lookup, "BRIDGE_ENTITY_TABLES")) {
        config.tables.entity_tables = parse_entity_tables(*text);
    }
    if (config.tables.entity_tables.count(config.tables.signals_table) > 0) {
        throw ConfigError("BRIDGE_ENTITY_TABLES must not include " + config.tables.signals_table);
    }

    if (auto text = lookup_nonempty(lookup, "LOG_LEVEL")) {
        auto level = parse_log_level(*text);
        if (!level) {
            throw ConfigError("LOG_LEVEL must be debug, info, warn or error, got '" + *text + "'");
        }
        config.log_level = *level;
    }

    return config;
}

int load_env_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return 0;
    }

    int loaded = 0;
    std::string line;
    int number = 0;
    while (std::getline(in, line)) {
        ++number;
        auto text = trim(line);
        if (text.empty() || text[0] == '#') {
            continue;
        }
        if (text.compare(0, 7, "export ") == 0) {
            text = trim(text.substr(7));
        }
        auto eq = text.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw ConfigError(path + ":" + std::to_string(number) + ": expected KEY=VALUE");
        }
        auto key = trim(text.substr(0, eq));
        auto value = unquote(trim(text.substr(eq + 1)));
        if (std::getenv(key.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(key.c_str(), value.c_str(), 0) != 0) {
            throw ConfigError(path + ":" + std::to_string(number) + ": cannot set " + key);
        }
        ++loaded;
    }
    return loaded;
}

} // namespace portico
