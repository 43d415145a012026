#include "Logger.hpp"
#include <iostream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <algorithm>
#include <cctype>

namespace toy_ecc {

// Static member initialization
std::mutex Logger::log_mutex_;
LogLevel Logger::min_log_level_ = LogLevel::Warning;
std::string Logger::log_file_path_;
bool Logger::console_output_enabled_ = true;

namespace {
    std::string currentTimeString() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        #ifdef _WIN32
            localtime_s(&tm_buf, &time);
        #else
            localtime_r(&time, &tm_buf);
        #endif

        std::ostringstream ss;
        ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    const char* levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:    return "[DEBUG]   ";
            case LogLevel::Info:     return "[INFO]    ";
            case LogLevel::Warning:  return "[WARNING] ";
            case LogLevel::Error:    return "[ERROR]   ";
            case LogLevel::Security: return "[SECURITY]";
            case LogLevel::Fatal:    return "[FATAL]   ";
            default:                 return "[UNKNOWN] ";
        }
    }

    // Identifier form of the code, e.g. "PointNotOnCurve"
    const char* errorName(ErrorCode code) {
        switch (code) {
            case ErrorCode::None:                   return "None";
            case ErrorCode::PointNotOnCurve:        return "PointNotOnCurve";
            case ErrorCode::MalformedHexInput:      return "MalformedHexInput";
            case ErrorCode::ScalarOutOfRange:       return "ScalarOutOfRange";
            case ErrorCode::InvalidCurveParameters: return "InvalidCurveParameters";
            case ErrorCode::MalformedPointInput:    return "MalformedPointInput";
            case ErrorCode::MalformedScalarInput:   return "MalformedScalarInput";
            case ErrorCode::InvalidParameter:       return "InvalidParameter";
            case ErrorCode::ProcessingError:        return "ProcessingError";
            default:                                return "Unknown";
        }
    }
}

void Logger::logEvent(LogLevel level, std::string_view message) {
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (level < min_log_level_) {
            return;
        }
    }

    write(std::string(levelTag(level)) + " " + currentTimeString() + " " +
          std::string(message) + "\n");
}

void Logger::logError(ErrorCode code, std::string_view details) {
    {
        std::lock_guard<std::mutex> lock(log_mutex_);
        if (LogLevel::Error < min_log_level_) {
            return;
        }
    }

    write(std::string(levelTag(LogLevel::Error)) + " " + currentTimeString() +
          " Code: " + errorName(code) + " Details: " + std::string(details) + "\n");
}

void Logger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (console_output_enabled_) {
        std::cerr << line << std::flush;
    }

    if (!log_file_path_.empty()) {
        writeToFile(line);
    }
}

void Logger::writeToFile(std::string_view message) {
    std::ofstream file(log_file_path_, std::ios::app);
    if (file.is_open()) {
        file << message;
        file.flush();
    } else if (console_output_enabled_) {
        std::cerr << "[FILE_ERROR] Failed to write to log file " << log_file_path_ << "\n";
    }
}

void Logger::setLogLevel(LogLevel minLevel) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_log_level_ = minLevel;
}

LogLevel Logger::logLevel() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return min_log_level_;
}

void Logger::setLogFile(std::string_view path) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_file_path_ = path;
}

void Logger::enableConsoleOutput(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_output_enabled_ = enable;
}

LogLevel Logger::parseLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug")    return LogLevel::Debug;
    if (lower == "info")     return LogLevel::Info;
    if (lower == "warning")  return LogLevel::Warning;
    if (lower == "error")    return LogLevel::Error;
    if (lower == "security") return LogLevel::Security;
    if (lower == "fatal")    return LogLevel::Fatal;

    throw EccError(ErrorCode::InvalidParameter,
        "Unknown log level: " + std::string(name));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr.flush();
}

} // namespace toy_ecc
