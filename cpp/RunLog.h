#pragma once

#include <cstddef>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace snapsorter {

// Error: the item (or the run) cannot be completed.
// Warn:  degraded evidence, fallback or a loose match the user should see.
// Info:  per-item progress and the run summary.
// Debug: which source said what.
enum class LogLevel {
    Error = 0,
    Warn = 1,
    Info = 2,
    Debug = 3
};

const char* logLevelName(LogLevel level);

// Console + log file reporting for one run. Debug/info go to stdout,
// warnings/errors to stderr. The log file receives Info and above
// regardless of the console level.
class RunLog {
public:
    RunLog() = default;
    RunLog(const RunLog&) = delete;
    RunLog& operator=(const RunLog&) = delete;

    // Open (append) the log file; returns false if it cannot be created.
    bool openFile(const fs::path& logPath);
    void closeFile();
    bool hasFile() const { return m_file.is_open(); }
    const fs::path& filePath() const { return m_filePath; }

    void setConsoleLevel(LogLevel level) { m_consoleLevel = level; }
    LogLevel consoleLevel() const { return m_consoleLevel; }
    // Tests run with the console muted; counters keep working.
    void setConsoleEnabled(bool enabled) { m_consoleEnabled = enabled; }

    void log(LogLevel level, const std::string& message);
    void error(const std::string& message) { log(LogLevel::Error, message); }
    void warn(const std::string& message) { log(LogLevel::Warn, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void debug(const std::string& message) { log(LogLevel::Debug, message); }

    // Write a line to the log file only (section headers, summary).
    void fileOnly(const std::string& line);

    std::size_t warningCount() const { return m_warnings; }
    std::size_t errorCount() const { return m_errors; }
    const std::string& lastWarning() const { return m_lastWarning; }
    void resetCounters();

private:
    std::ofstream m_file;
    fs::path m_filePath;
    LogLevel m_consoleLevel = LogLevel::Info;
    bool m_consoleEnabled = true;
    std::size_t m_warnings = 0;
    std::size_t m_errors = 0;
    std::string m_lastWarning;
};

// "<folder>_<YYYYMMDD_HHMMSS>.log" with path separators and reserved characters replaced.
std::string makeLogFileName(const fs::path& folder, std::time_t now);

}  // namespace snapsorter
