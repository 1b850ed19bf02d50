#include "Logger.hpp"
#include <chrono>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace mirror_launcher {

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string source;
    std::string function;
};

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    bool includeTimestamps{true};
    bool includeSourceInfo{false};

    std::deque<LogEntry> recentLogs;
    size_t maxRecentLogs{1000};
    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (!logFile.empty()) {
            fileStream = std::make_unique<std::ofstream>(logFile, std::ios::app);
            if (!fileStream->is_open()) {
                std::cerr << "Cannot open log file " << logFile << std::endl;
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

    void writeToFile(const std::string& formattedMessage) {
        if (!fileStream) {
            openLogFile();
        }
        if (fileStream) {
            (*fileStream) << formattedMessage << '\n';
            fileStream->flush();
        }
    }

    bool writesConsole() const {
        return destination == LogDestination::Console || destination == LogDestination::All;
    }

    bool writesFile() const {
        return destination == LogDestination::File || destination == LogDestination::All;
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
    qRegisterMetaType<mirror_launcher::LogLevel>("mirror_launcher::LogLevel");
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

void Logger::enableTimestamps(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeTimestamps = enable;
}

void Logger::enableSourceInfo(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeSourceInfo = enable;
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

        d->recentLogs.push_back(LogEntry{
            std::chrono::system_clock::now(), level, message, source, function});
        while (d->recentLogs.size() > d->maxRecentLogs) {
            d->recentLogs.pop_front();
        }

        const std::string formatted = formatLogMessage(level, message, source, function);
        if (d->writesConsole()) {
            std::clog << formatted << std::endl;
        }
        if (d->writesFile()) {
            d->writeToFile(formatted);
        }
    }

    // Emitted outside the lock: a direct-connected slot may log again.
    emit logAdded(level, QString::fromStdString(message));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (d->fileStream) {
        d->fileStream->flush();
    }
}

void Logger::clear() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->recentLogs.clear();
}

std::vector<std::string> Logger::getRecentLogs(size_t count) const {
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(d->logMutex);

    size_t start = (count >= d->recentLogs.size()) ? 0 :
                   d->recentLogs.size() - count;

    for (size_t i = start; i < d->recentLogs.size(); ++i) {
        const auto& entry = d->recentLogs[i];
        result.push_back("[" + levelTag(entry.level).toStdString() + "] " + entry.message);
    }

    return result;
}

size_t Logger::countAtLeast(LogLevel level) const {
    std::lock_guard<std::mutex> lock(d->logMutex);
    size_t count = 0;
    for (const auto& entry : d->recentLogs) {
        if (entry.level >= level) {
            ++count;
        }
    }
    return count;
}

std::string Logger::formatLogMessage(LogLevel level,
                                     const std::string& message,
                                     const std::string& source,
                                     const std::string& function) const {
    std::stringstream ss;

    if (d->includeTimestamps) {
        auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &time);
#else
        localtime_r(&time, &local);
#endif
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " ";
    }

    ss << "[" << levelTag(level).toStdString() << "] ";

    if (d->includeSourceInfo && !source.empty()) {
        ss << source;
        if (!function.empty()) {
            ss << ":" << function;
        }
        ss << " - ";
    }

    ss << message;
    return ss.str();
}

QString Logger::levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return QStringLiteral("DEBUG");
        case LogLevel::Info:     return QStringLiteral("INFO");
        case LogLevel::Warning:  return QStringLiteral("WARN");
        case LogLevel::Error:    return QStringLiteral("ERROR");
        case LogLevel::Critical: return QStringLiteral("CRITICAL");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace mirror_launcher
