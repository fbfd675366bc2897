#include "config/app_config.hpp"
#include "utils/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace wordbase {

namespace {

std::string readString(const AppConfig::EnvLookup& lookup, const char* name, const std::string& fallback) {
    const char* value = lookup(name);
    return value ? std::string(value) : fallback;
}

long long readInteger(const AppConfig::EnvLookup& lookup, const char* name, long long fallback) {
    const char* value = lookup(name);
    if (!value || *value == '\0') {
        return fallback;
    }
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != std::char_traits<char>::length(value)) {
            throw ConfigurationError(std::string(name) + " is not an integer: " + value);
        }
        if (parsed < 0) {
            throw ConfigurationError(std::string(name) + " must not be negative: " + value);
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        throw ConfigurationError(std::string(name) + " is not an integer: " + value);
    } catch (const std::out_of_range&) {
        throw ConfigurationError(std::string(name) + " is out of range: " + value);
    }
}

bool readFlag(const AppConfig::EnvLookup& lookup, const char* name, bool fallback) {
    const char* value = lookup(name);
    if (!value) {
        return fallback;
    }
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

bool isDecimalAmount(const std::string& amount) {
    bool seen_digit = false;
    bool seen_dot = false;
    for (char c : amount) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            seen_digit = true;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            return false;
        }
    }
    return seen_digit;
}

} // namespace

AppConfig AppConfig::fromEnvironment() {
    return fromEnvironment([](const char* name) { return std::getenv(name); });
}

AppConfig AppConfig::fromEnvironment(const EnvLookup& lookup) {
    AppConfig config;

    DatabaseSettings& db = config.database;
    db.host = readString(lookup, "POSTGRES_HOST", db.host);
    db.port = readString(lookup, "POSTGRES_PORT", db.port);
    db.dbname = readString(lookup, "POSTGRES_DB", db.dbname);
    db.user = readString(lookup, "POSTGRES_USER", db.user);
    db.password = readString(lookup, "POSTGRES_PASSWORD", db.password);
    db.pool_min_size = static_cast<size_t>(readInteger(lookup, "DB_POOL_MIN", static_cast<long long>(db.pool_min_size)));
    db.pool_max_size = static_cast<size_t>(readInteger(lookup, "DB_POOL_MAX", static_cast<long long>(db.pool_max_size)));
    db.pool_timeout = std::chrono::seconds(readInteger(lookup, "DB_POOL_TIMEOUT", db.pool_timeout.count()));

    QueueSettings& queue = config.queue;
    queue.name = readString(lookup, "QUEUE_NAME", queue.name);
    queue.poll_interval = std::chrono::milliseconds(
        readInteger(lookup, "QUEUE_POLL_INTERVAL_MS", queue.poll_interval.count()));
    queue.consume_timeout = std::chrono::milliseconds(
        readInteger(lookup, "CONSUMER_POLL_TIMEOUT_MS", queue.consume_timeout.count()));
    queue.consumer_workers = static_cast<size_t>(
        readInteger(lookup, "CONSUMER_WORKERS", static_cast<long long>(queue.consumer_workers)));

    config.trial.amount = readString(lookup, "TRIAL_AMOUNT", config.trial.amount);
    config.trial.currency = readString(lookup, "TRIAL_CURRENCY", config.trial.currency);
    config.trial.days = static_cast<int>(readInteger(lookup, "TRIAL_DAYS", config.trial.days));

    config.lock_cleanup_interval = std::chrono::seconds(
        readInteger(lookup, "LOCK_CLEANUP_INTERVAL", config.lock_cleanup_interval.count()));

    config.debug = readFlag(lookup, "DEBUG", false);
    config.log_level = readString(lookup, "LOG_LEVEL", config.debug ? "DEBUG" : config.log_level);
    config.log_file = readString(lookup, "LOG_FILE", config.log_file);

    config.validate();
    return config;
}

void AppConfig::validate() const {
    if (database.host.empty() || database.dbname.empty() || database.user.empty()) {
        throw ConfigurationError("Database host, name and user must be set");
    }
    if (database.pool_max_size == 0) {
        throw ConfigurationError("DB_POOL_MAX must be at least 1");
    }
    if (database.pool_min_size > database.pool_max_size) {
        throw ConfigurationError("DB_POOL_MIN (" + std::to_string(database.pool_min_size) +
                                 ") exceeds DB_POOL_MAX (" + std::to_string(database.pool_max_size) + ")");
    }
    if (queue.name.empty()) {
        throw ConfigurationError("QUEUE_NAME must not be empty");
    }
    if (queue.consumer_workers == 0) {
        throw ConfigurationError("CONSUMER_WORKERS must be at least 1");
    }
    if (queue.poll_interval.count() == 0) {
        throw ConfigurationError("QUEUE_POLL_INTERVAL_MS must be positive");
    }
    if (lock_cleanup_interval.count() == 0) {
        throw ConfigurationError("LOCK_CLEANUP_INTERVAL must be positive");
    }
    if (!isDecimalAmount(trial.amount)) {
        throw ConfigurationError("TRIAL_AMOUNT is not a decimal amount: " + trial.amount);
    }
    if (trial.currency.size() != 3) {
        throw ConfigurationError("TRIAL_CURRENCY must be a 3-letter code: " + trial.currency);
    }
}

} // namespace wordbase
