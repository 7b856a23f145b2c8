/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <vector>

namespace Riposte {
namespace {

namespace fs = std::filesystem;

constexpr size_t MAX_SESSION_LOGS{5};
constexpr size_t FLUSH_INTERVAL{50};
constexpr std::string_view SESSION_PREFIX{"riposte_"};

std::tm toLocalTime(std::time_t time) {
    std::tm result{};
#ifdef _WIN32
    localtime_s(&result, &time);
#else
    localtime_r(&time, &result);
#endif
    return result;
}

std::string wallClockStamp(const char* pattern) {
    const std::tm local = toLocalTime(std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now()));
    char buffer[32]{};
    const size_t written = std::strftime(buffer, sizeof(buffer), pattern, &local);
    return std::string(buffer, written);
}

// Deletes the oldest session logs so that at most keepCount remain
void pruneSessionLogs(const fs::path& logDir, size_t keepCount) {
    std::error_code ec;
    std::vector<fs::directory_entry> sessions;
    for (const auto& entry : fs::directory_iterator(logDir, ec)) {
        const std::string name = entry.path().filename().string();
        if (entry.path().extension() == ".log" && name.starts_with(SESSION_PREFIX)) {
            sessions.push_back(entry);
        }
    }
    if (sessions.size() <= keepCount) {
        return;
    }

    std::sort(sessions.begin(), sessions.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.last_write_time() < b.last_write_time();
              });
    const size_t excess = sessions.size() - keepCount;
    for (size_t i = 0; i < excess; ++i) {
        if (!fs::remove(sessions[i].path(), ec)) {
            std::fprintf(stderr, "Riposte - could not prune %s\n",
                         sessions[i].path().string().c_str());
        }
    }
}

/**
 * One file per process run under <directory>/logs, opened on the first
 * message. Falls back to stderr when the directory is unusable.
 */
class SessionLog {
public:
    static SessionLog& Instance() {
        static SessionLog instance;
        return instance;
    }

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    void setDirectory(const std::string& directory) {
        std::lock_guard<std::mutex> lock(m_mutex);
        close();
        m_directory = directory;
        m_openAttempted = false;
    }

    void append(LogLevel level, const std::string& line) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_openAttempted) {
            m_openAttempted = true;
            open();
        }

        if (!m_file.is_open()) {
            std::fprintf(stderr, "%s\n", line.c_str());
            return;
        }

        m_file << line << '\n';
        if (level == LogLevel::CRITICAL || ++m_pending >= FLUSH_INTERVAL) {
            m_file.flush();
            m_pending = 0;
        }
    }

private:
    SessionLog() = default;
    ~SessionLog() { close(); }

    void open() {
        if (m_directory.empty()) {
            return;
        }
        const fs::path logDir = fs::path(m_directory) / "logs";
        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            std::fprintf(stderr, "Riposte - cannot create %s: %s\n",
                         logDir.string().c_str(), ec.message().c_str());
            return;
        }

        // Leave room for the session about to be opened
        pruneSessionLogs(logDir, MAX_SESSION_LOGS - 1);

        const std::string fileName =
            std::string(SESSION_PREFIX) + wallClockStamp("%Y%m%d_%H%M%S") + ".log";
        m_file.open(logDir / fileName, std::ios::out | std::ios::app);
        if (m_file.is_open()) {
            m_file << "=== Riposte combat session " << wallClockStamp("%Y-%m-%d %H:%M:%S")
                   << " ===\n";
            m_file.flush();
        }
    }

    void close() {
        if (m_file.is_open()) {
            m_file.flush();
            m_file.close();
        }
        m_pending = 0;
    }

    std::mutex m_mutex;
    std::ofstream m_file;
    std::string m_directory;
    bool m_openAttempted{false};
    size_t m_pending{0};
};

} // namespace

void Logger::SetLogDirectory(const std::string& directory) {
    SessionLog::Instance().setDirectory(directory);
}

void Logger::Log(LogLevel level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(LogLevel level, const char* system, const char* message) {
    if (IsQuiet()) {
        return;
    }
    SessionLog::Instance().append(
        level, detail::formatLogLine(detail::levelName(level), system, message));
}

} // namespace Riposte

#endif // ifndef DEBUG
