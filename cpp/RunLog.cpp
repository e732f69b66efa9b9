#include "RunLog.h"
#include <cstdio>
#include <iostream>

namespace snapsorter {

static std::string sanitizeForLogFilename(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '\\' || c == '/' || c == ':' || c == '*' || c == '?' || c == '"' || c == '<' || c == '>' || c == '|')
            out += '_';
        else
            out += c;
    }
    return out;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        default: return "?";
    }
}

bool RunLog::openFile(const fs::path& logPath) {
    closeFile();
    m_file.open(logPath, std::ios::out | std::ios::app);
    if (!m_file) return false;
    m_filePath = logPath;
    return true;
}

void RunLog::closeFile() {
    if (m_file.is_open()) m_file.close();
    m_filePath.clear();
}

void RunLog::log(LogLevel level, const std::string& message) {
    if (level == LogLevel::Warn) {
        ++m_warnings;
        m_lastWarning = message;
    } else if (level == LogLevel::Error) {
        ++m_errors;
    }

    if (m_consoleEnabled && level <= m_consoleLevel) {
        if (level <= LogLevel::Warn)
            std::cerr << "[" << logLevelName(level) << "] " << message << std::endl;
        else
            std::cout << message << std::endl;
    }
    if (m_file && level <= LogLevel::Info)
        m_file << "[" << logLevelName(level) << "] " << message << "\n";
}

void RunLog::fileOnly(const std::string& line) {
    if (m_file) m_file << line << "\n";
}

void RunLog::resetCounters() {
    m_warnings = 0;
    m_errors = 0;
    m_lastWarning.clear();
}

std::string makeLogFileName(const fs::path& folder, std::time_t now) {
    std::tm lt = {};
#ifdef _WIN32
    localtime_s(&lt, &now);
#else
    localtime_r(&now, &lt);
#endif
    char dateTimeBuf[32];
    std::snprintf(dateTimeBuf, sizeof(dateTimeBuf), "%04d%02d%02d_%02d%02d%02d",
        lt.tm_year + 1900, lt.tm_mon + 1, lt.tm_mday,
        lt.tm_hour, lt.tm_min, lt.tm_sec);
    std::string folderName = folder.filename().string();
    if (folderName.empty()) folderName = folder.parent_path().filename().string();
    if (folderName.empty()) folderName = "folder";
    return sanitizeForLogFilename(folderName) + "_" + dateTimeBuf + ".log";
}

}  // namespace snapsorter
