#include "Logger.hpp"
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace bluetray {

namespace {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string source;
    std::string function;
};

const char* levelString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

} // namespace

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    size_t maxFileSize{5 * 1024 * 1024}; // 5MB default

    std::deque<LogEntry> recentLogs;
    size_t maxRecentLogs{500};
    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (!logFile.empty()) {
            fileStream = std::make_unique<std::ofstream>(logFile, std::ios::app);
            if (!fileStream->is_open()) {
                std::cerr << "Failed to open log file: " << logFile << std::endl;
                fileStream.reset();
            }
        }
    }

    void closeLogFile() {
        if (fileStream) {
            fileStream->close();
            fileStream.reset();
        }
    }

    void writeToFile(const std::string& formatted) {
        if (!fileStream) {
            openLogFile();
        }
        if (fileStream) {
            (*fileStream) << formatted << '\n';
            fileStream->flush();
        }
    }

    void rotateIfNeeded() {
        std::error_code ec;
        if (logFile.empty() || !std::filesystem::exists(logFile, ec)) {
            return;
        }
        auto size = std::filesystem::file_size(logFile, ec);
        if (ec || size < maxFileSize) {
            return;
        }

        // Keep a single previous generation
        closeLogFile();
        std::string previous = logFile + ".1";
        std::filesystem::remove(previous, ec);
        std::filesystem::rename(logFile, previous, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
        }
        openLogFile();
    }

    std::string format(const LogEntry& entry) const {
        std::stringstream ss;
        auto time = std::chrono::system_clock::to_time_t(entry.timestamp);
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            entry.timestamp.time_since_epoch()).count() % 1000;
        std::tm tm{};
        localtime_r(&time, &tm);
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
           << "." << std::setw(3) << std::setfill('0') << millis << " ";

        ss << "[" << levelString(entry.level) << "] ";

        if (!entry.source.empty()) {
            ss << std::filesystem::path(entry.source).filename().string();
            if (!entry.function.empty()) {
                ss << ":" << entry.function;
            }
            ss << " - ";
        }

        ss << entry.message;
        return ss.str();
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
}

Logger::~Logger() = default;

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->currentLevel = level;
}

LogLevel Logger::logLevel() const {
    std::lock_guard<std::mutex> lock(d->logMutex);
    return d->currentLevel;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
    d->logFile = filename;
    d->openLogFile();
}

void Logger::setMaxFileSize(size_t bytes) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->maxFileSize = bytes;
}

LogLevel Logger::levelFromVerbosity(int verbosity) {
    switch (verbosity) {
        case 0: return LogLevel::Debug;
        case 1: return LogLevel::Info;
        case 2: return LogLevel::Warning;
        case 3: return LogLevel::Error;
        case 4: return LogLevel::Critical;
        default: return LogLevel::Info;
    }
}

void Logger::debug(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message,
                     const std::string& source,
                     const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message,
                      const std::string& source,
                      const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    {
        std::lock_guard<std::mutex> lock(d->logMutex);

        if (level < d->currentLevel) {
            return;
        }

        LogEntry entry{std::chrono::system_clock::now(), level, message, source, function};
        std::string formatted = d->format(entry);

        d->recentLogs.push_back(std::move(entry));
        while (d->recentLogs.size() > d->maxRecentLogs) {
            d->recentLogs.pop_front();
        }

        if (d->destination == LogDestination::Console ||
            d->destination == LogDestination::All) {
            std::cerr << formatted << std::endl;
        }

        if (d->destination == LogDestination::File ||
            d->destination == LogDestination::All) {
            d->rotateIfNeeded();
            d->writeToFile(formatted);
        }
    }

    // Emitted outside the lock so receivers may log themselves
    emit logAdded(level, QString::fromStdString(message));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (d->fileStream) {
        d->fileStream->flush();
    }
}

std::vector<std::string> Logger::getRecentLogs(size_t count) const {
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(d->logMutex);

    size_t start = (count >= d->recentLogs.size()) ? 0 :
                   d->recentLogs.size() - count;

    for (size_t i = start; i < d->recentLogs.size(); ++i) {
        result.push_back(d->format(d->recentLogs[i]));
    }

    return result;
}

void Logger::clearRecentLogs() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->recentLogs.clear();
}

} // namespace bluetray
