#ifndef WORDBASE_LOGGER_HPP
#define WORDBASE_LOGGER_HPP

#include <string>
#include <fstream>
#include <mutex>
#include <iostream>

namespace wordbase {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();
    
    void log(LogLevel level, const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    
    void setLogFile(const std::string& filename);
    void setLevel(LogLevel level);
    LogLevel getLevel() const;
    bool isEnabled(LogLevel level) const;
    
    // Accepts DEBUG/INFO/WARNING/WARN/ERROR in any case, falls back to INFO
    static LogLevel parseLevel(const std::string& name);
    static std::string levelToString(LogLevel level);
    
private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    mutable std::mutex mutex_;
    std::ofstream log_file_;
    bool file_logging_enabled_ = false;
    LogLevel min_level_ = LogLevel::INFO;
    
    std::string getCurrentTime();
};

} // namespace wordbase

#endif // WORDBASE_LOGGER_HPP
