// tests/TestSupport.hpp
#pragma once
#include "CommandRunner.hpp"
#include "Logger.hpp"
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEvent>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTemporaryDir>
#include <QThread>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace mirror_launcher {
namespace testing {

// Pumps the event loop until the predicate holds or the timeout expires.
inline bool waitFor(const std::function<bool()>& predicate, int timeoutMs = 5000) {
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);
        QThread::msleep(5);
    }
    return true;
}

inline void pumpEvents(int ms) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(5);
    }
}

// Canned adb answers keyed by the space-joined argument list. Unknown
// argument lists get the fallback result.
class ScriptedRunner : public CommandRunner {
public:
    struct Call {
        std::string program;
        std::vector<std::string> arguments;
        int timeoutMs{0};
    };

    void on(const std::vector<std::string>& arguments, CommandResult result) {
        QMutexLocker lock(&m_mutex);
        m_results[join(arguments)] = std::move(result);
    }

    void onOutput(const std::vector<std::string>& arguments, const std::string& output) {
        CommandResult result;
        result.output = output;
        on(arguments, result);
    }

    void setFallback(CommandResult result) {
        QMutexLocker lock(&m_mutex);
        m_fallback = std::move(result);
    }

    CommandResult run(const std::string& program,
                      const std::vector<std::string>& arguments,
                      int timeoutMs) override {
        QMutexLocker lock(&m_mutex);
        m_calls.push_back(Call{program, arguments, timeoutMs});
        auto it = m_results.find(join(arguments));
        return it == m_results.end() ? m_fallback : it->second;
    }

    std::vector<Call> calls() const {
        QMutexLocker lock(&m_mutex);
        return m_calls;
    }

    int callCount(const std::vector<std::string>& arguments) const {
        QMutexLocker lock(&m_mutex);
        const std::string key = join(arguments);
        int count = 0;
        for (const auto& call : m_calls) {
            if (join(call.arguments) == key) {
                ++count;
            }
        }
        return count;
    }

    static std::string join(const std::vector<std::string>& arguments) {
        std::string joined;
        for (const auto& arg : arguments) {
            if (!joined.empty()) {
                joined += ' ';
            }
            joined += arg;
        }
        return joined;
    }

private:
    mutable QMutex m_mutex;
    std::map<std::string, CommandResult> m_results;
    CommandResult m_fallback;
    std::vector<Call> m_calls;
};

// Throwaway directory for executable shell scripts standing in for adb and
// scrcpy. POSIX only.
class ScriptDirectory {
public:
    bool isValid() const { return m_dir.isValid(); }
    QString path() const { return m_dir.path(); }

    std::string writeScript(const QString& name, const QString& body) {
        const QString filePath = m_dir.filePath(name);
        QFile file(filePath);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            return std::string();
        }
        file.write("#!/bin/sh\n");
        file.write(body.toUtf8());
        file.write("\n");
        file.close();
        file.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner |
                            QFile::ReadGroup | QFile::ExeGroup);
        return filePath.toStdString();
    }

private:
    QTemporaryDir m_dir;
};

// Counts log entries at or above a level since construction. Clears the
// logger's recent history so the bounded buffer never evicts counted entries.
class LogCounter {
public:
    explicit LogCounter(LogLevel level)
        : m_level(level) {
        Logger::instance().clear();
    }

    size_t count() const {
        return Logger::instance().countAtLeast(m_level);
    }

private:
    LogLevel m_level;
};

inline bool recentLogsContain(const std::string& needle, size_t depth = 200) {
    for (const auto& line : Logger::instance().getRecentLogs(depth)) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace testing
} // namespace mirror_launcher
