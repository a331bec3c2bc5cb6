// File: Logger.cpp
// Description: Implements the leveled logger. Info lines are mirrored to
//              stdout, warnings and errors to stderr.

#include "backend/Logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace backend {

struct Logger::Impl {
    std::ofstream logStream;
};

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> guard(m_mutex);
    delete m_impl;
    m_impl = nullptr;
}

void Logger::initialize(const std::string& logFilePath, bool mirrorToConsole) {
    std::lock_guard<std::mutex> guard(m_mutex);

    if (!m_impl) {
        m_impl = new Impl();
    }

    const std::filesystem::path targetPath(logFilePath);
    if (const auto parent = targetPath.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create log directory " + parent.string() + ": " +
                                     ec.message());
        }
    }

    m_impl->logStream.close();
    m_impl->logStream.open(targetPath, std::ios::out | std::ios::app);
    if (!m_impl->logStream.is_open()) {
        throw std::runtime_error("Failed to open log file: " + targetPath.string());
    }

    m_logFilePath = targetPath.string();
    m_mirrorToConsole = mirrorToConsole;
    m_initialized = true;
}

void Logger::log(const std::string& message) {
    log(LogLevel::Info, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::Warning, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::Error, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (!m_initialized || !m_impl) {
        return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &timeT);
#else
    localtime_r(&timeT, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    oss << " | " << toString(level) << " | " << message;
    const std::string line = oss.str();

    m_impl->logStream << line << '\n';
    m_impl->logStream.flush();
    if (!m_mirrorToConsole) {
        return;
    }
    if (level == LogLevel::Info) {
        std::cout << line << std::endl;
    } else {
        std::cerr << line << std::endl;
    }
}

bool Logger::isInitialized() const noexcept {
    return m_initialized;
}

bool Logger::mirrorsToConsole() const noexcept {
    return m_mirrorToConsole;
}

const std::string& Logger::logFilePath() const noexcept {
    return m_logFilePath;
}

}  // namespace backend
