#include "Logger.hpp"
#include <QDateTime>
#include <QFileInfo>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

namespace usbbw {

struct LogEntry {
    QDateTime timestamp;
    LogLevel level;
    std::string message;
    std::string source;
    std::string function;
};

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Warning};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    size_t maxFileSize{10 * 1024 * 1024};
    bool includeTimestamps{true};
    bool includeSourceInfo{true};

    std::deque<LogEntry> recentLogs;
    size_t maxRecentLogs{1000};
    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (!logFile.empty()) {
            fileStream = std::make_unique<std::ofstream>(logFile, std::ios::app);
        }
    }

    void closeLogFile() {
        if (fileStream) {
            fileStream->close();
            fileStream.reset();
        }
    }

    // stdout carries the reports, so console logging goes to stderr
    void writeToConsole(const std::string& formattedMessage) {
        std::cerr << formattedMessage << std::endl;
    }

    void writeToFile(const std::string& formattedMessage) {
        if (!fileStream || !fileStream->is_open()) {
            openLogFile();
        }
        if (fileStream && fileStream->is_open()) {
            (*fileStream) << formattedMessage << '\n';
            fileStream->flush();
        }
    }

    void pruneRecentLogs() {
        while (recentLogs.size() > maxRecentLogs) {
            recentLogs.pop_front();
        }
    }

    bool shouldRotateLogFile() const {
        if (logFile.empty()) {
            return false;
        }
        std::error_code ec;
        auto size = std::filesystem::file_size(logFile, ec);
        return !ec && size >= maxFileSize;
    }

    // Returns the name the old file was moved to, empty when nothing moved
    std::string rotateLogFile() {
        closeLogFile();

        std::string rotated = logFile + "." +
            QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss").toStdString();

        std::error_code ec;
        std::filesystem::rename(logFile, rotated, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
            rotated.clear();
        }

        openLogFile();
        return rotated;
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
}

Logger::~Logger() {
    d->closeLogFile();
}

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
    std::string rotatedFrom;
    std::string rotatedTo;
    {
        std::lock_guard<std::mutex> lock(d->logMutex);
        if (level < d->currentLevel) {
            return;
        }

        d->recentLogs.push_back(LogEntry{
            QDateTime::currentDateTime(), level, message, source, function});
        d->pruneRecentLogs();

        std::string formatted = formatLogMessage(level, message, source, function);

        if (d->destination == LogDestination::Console ||
            d->destination == LogDestination::All) {
            d->writeToConsole(formatted);
        }

        if (d->destination == LogDestination::File ||
            d->destination == LogDestination::All) {
            if (d->shouldRotateLogFile()) {
                rotatedFrom = d->logFile;
                rotatedTo = d->rotateLogFile();
            }
            d->writeToFile(formatted);
        }
    }

    if (!rotatedTo.empty()) {
        emit logFileRotated(rotatedFrom, rotatedTo);
    }
    emit logAdded(level, message);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (d->fileStream) {
        d->fileStream->flush();
    }
    std::cerr.flush();
}

void Logger::clear() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->recentLogs.clear();
}

std::vector<std::string> Logger::getRecentLogs(size_t count) const {
    std::vector<std::string> result;
    std::lock_guard<std::mutex> lock(d->logMutex);

    size_t start = (count >= d->recentLogs.size()) ? 0 : d->recentLogs.size() - count;
    for (size_t i = start; i < d->recentLogs.size(); ++i) {
        const auto& entry = d->recentLogs[i];
        result.push_back(formatLogMessage(
            entry.level, entry.message, entry.source, entry.function));
    }
    return result;
}

LogLevel Logger::levelFromVerbosity(int verbosity) {
    switch (verbosity) {
        case 0: return LogLevel::Debug;
        case 1: return LogLevel::Info;
        case 2: return LogLevel::Warning;
        case 3: return LogLevel::Error;
        case 4: return LogLevel::Critical;
        default: return LogLevel::Warning;
    }
}

std::string Logger::formatLogMessage(LogLevel level,
                                     const std::string& message,
                                     const std::string& source,
                                     const std::string& function) const {
    std::stringstream ss;

    if (d->includeTimestamps) {
        ss << QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss").toStdString() << " ";
    }

    ss << "[" << levelString(level) << "] ";

    if (d->includeSourceInfo && !source.empty()) {
        ss << QFileInfo(QString::fromStdString(source)).fileName().toStdString();
        if (!function.empty()) {
            ss << ":" << function;
        }
        ss << " - ";
    }

    ss << message;
    return ss.str();
}

const char* Logger::levelString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

} // namespace usbbw
