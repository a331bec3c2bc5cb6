// File: Logger.hpp
// Description: Provides the run-wide logging facility that writes leveled,
//              timestamped messages to a log file and mirrors them to the console.

#pragma once

#include <mutex>
#include <string>

namespace backend {

enum class LogLevel { Info, Warning, Error };

class Logger {
public:
    static Logger& instance();

    void initialize(const std::string& logFilePath, bool mirrorToConsole = true);
    void log(const std::string& message);
    void log(LogLevel level, const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    bool isInitialized() const noexcept;
    bool mirrorsToConsole() const noexcept;
    const std::string& logFilePath() const noexcept;

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex m_mutex;
    std::string m_logFilePath;
    bool m_initialized{false};
    bool m_mirrorToConsole{true};
    struct Impl;
    Impl* m_impl{nullptr};
};

const char* toString(LogLevel level);

}  // namespace backend
