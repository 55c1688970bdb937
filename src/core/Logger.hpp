#pragma once
#include <QObject>
#include <memory>
#include <string>
#include <vector>

namespace bluetray {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    Console,
    File,
    All
};

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Configuration
    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;
    void setLogDestination(LogDestination dest);
    void setLogFile(const std::string& filename);
    void setMaxFileSize(size_t bytes);

    // Maps the 0-4 verbosity used by the CLI and the config file.
    static LogLevel levelFromVerbosity(int verbosity);

    void debug(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void info(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void warning(const std::string& message,
                 const std::string& source = "",
                 const std::string& function = "");
    void error(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void critical(const std::string& message,
                  const std::string& source = "",
                  const std::string& function = "");

    void flush();
    std::vector<std::string> getRecentLogs(size_t count = 100) const;
    void clearRecentLogs();

signals:
    void logAdded(bluetray::LogLevel level, const QString& message);

private:
    Logger();
    ~Logger() override;

    void log(LogLevel level,
             const std::string& message,
             const std::string& source,
             const std::string& function);

    class Private;
    std::unique_ptr<Private> d;
};

#define LOG_DEBUG(msg) \
    ::bluetray::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define LOG_INFO(msg) \
    ::bluetray::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define LOG_WARNING(msg) \
    ::bluetray::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define LOG_ERROR(msg) \
    ::bluetray::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define LOG_CRITICAL(msg) \
    ::bluetray::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace bluetray
