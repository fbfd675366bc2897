#ifndef WORDBASE_APP_CONFIG_HPP
#define WORDBASE_APP_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace wordbase {

struct DatabaseSettings {
    std::string host = "postgres";
    std::string port = "5432";
    std::string dbname = "wordbase";
    std::string user = "wordbase";
    std::string password;
    size_t pool_min_size = 5;
    size_t pool_max_size = 20;
    std::chrono::seconds pool_timeout{60};
};

struct QueueSettings {
    std::string name = "new_users";
    std::chrono::milliseconds poll_interval{200};
    std::chrono::milliseconds consume_timeout{1000};
    size_t consumer_workers = 4;
};

// Default subscription granted to every new user
struct TrialPolicy {
    std::string amount = "199.00";
    std::string currency = "RUB";
    std::string period = "trial";
    int days = 3;
};

struct AppConfig {
    DatabaseSettings database;
    QueueSettings queue;
    TrialPolicy trial;
    std::chrono::seconds lock_cleanup_interval{300};
    std::string log_level = "INFO";
    std::string log_file;
    bool debug = false;

    using EnvLookup = std::function<const char*(const char*)>;

    // Throws ConfigurationError on unparsable or inconsistent values
    static AppConfig fromEnvironment();
    static AppConfig fromEnvironment(const EnvLookup& lookup);

    void validate() const;
};

} // namespace wordbase

#endif // WORDBASE_APP_CONFIG_HPP
