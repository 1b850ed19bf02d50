#pragma once
#include <QObject>
#include <QString>
#include <memory>
#include <string>
#include <vector>

namespace mirror_launcher {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    None,
    Console,
    File,
    All
};

// Process-wide logger. logAdded is emitted from whichever thread logged the
// entry; receivers on the GUI thread get it queued.
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
    void enableTimestamps(bool enable);
    void enableSourceInfo(bool enable);

    // Logging methods
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
    void clear();
    std::vector<std::string> getRecentLogs(size_t count = 100) const;
    size_t countAtLeast(LogLevel level) const;

    static QString levelTag(LogLevel level);

signals:
    void logAdded(mirror_launcher::LogLevel level, const QString& message);

private:
    Logger();
    ~Logger();

    void log(LogLevel level,
             const std::string& message,
             const std::string& source,
             const std::string& function);
    std::string formatLogMessage(LogLevel level,
                                 const std::string& message,
                                 const std::string& source,
                                 const std::string& function) const;

    class Private;
    std::unique_ptr<Private> d;
};

#define LOG_DEBUG(msg) \
    ::mirror_launcher::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define LOG_INFO(msg) \
    ::mirror_launcher::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define LOG_WARNING(msg) \
    ::mirror_launcher::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define LOG_ERROR(msg) \
    ::mirror_launcher::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define LOG_CRITICAL(msg) \
    ::mirror_launcher::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace mirror_launcher

Q_DECLARE_METATYPE(mirror_launcher::LogLevel)
