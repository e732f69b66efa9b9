#include "VideoMetaHelper.h"
#include "RunLog.h"
#include <cstdio>
#include <utility>
#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace snapsorter {

bool runCommand(const std::string& command, std::string& output) {
    output.clear();
#ifdef _WIN32
    FILE* pipe = _popen(command.c_str(), "r");
#else
    FILE* pipe = popen(command.c_str(), "r");
#endif
    if (!pipe) return false;
    char buf[256];
    while (fgets(buf, sizeof(buf), pipe) != nullptr)
        output += buf;
#ifdef _WIN32
    int status = _pclose(pipe);
    return status == 0;
#else
    int status = pclose(pipe);
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
#endif
}

std::string quotePath(const std::string& path) {
#ifdef _WIN32
    std::string out = "\"";
    for (char c : path) {
        if (c == '"') out += "\\\"";
        else out += c;
    }
    out += "\"";
    return out;
#else
    std::string out = "'";
    for (char c : path) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
#endif
}

std::optional<std::string> getVideoCreationTime(const std::string& ffprobe, const std::string& filePath,
                                                ProbeStatus& status) {
    status = ProbeStatus::ProbeFailed;
    if (filePath.empty()) return std::nullopt;
    std::string cmd = quotePath(ffprobe)
        + " -v error -select_streams 0 -show_entries stream_tags=creation_time"
          " -of default=noprint_wrappers=1:nokey=1 "
        + quotePath(filePath);
#ifdef _WIN32
    cmd += " 2>nul";
#else
    cmd += " 2>/dev/null";
#endif
    std::string out;
    if (!runCommand(cmd, out)) return std::nullopt;
    // One line per tag; the first stream only has one creation_time.
    size_t eol = out.find_first_of("\r\n");
    if (eol != std::string::npos) out.erase(eol);
    if (out.empty()) {
        status = ProbeStatus::NoTag;
        return std::nullopt;
    }
    status = ProbeStatus::Ok;
    return out;
}

std::string normalizeCreationTime(const std::string& raw) {
    std::string t = raw;
    while (!t.empty() && (t.back() == '\r' || t.back() == '\n' || t.back() == ' '))
        t.pop_back();
    size_t start = t.find_first_not_of(' ');
    if (start == std::string::npos) return "";
    t.erase(0, start);
    size_t dot = t.find('.');
    if (dot != std::string::npos) t.erase(dot);
    if (!t.empty() && t.back() == 'Z') t.pop_back();
    return t;
}

VideoProbeSource::VideoProbeSource(std::string ffprobe) : m_ffprobe(std::move(ffprobe)) {}

Evidence VideoProbeSource::lookup(const MediaItem& item, RunLog& log) {
    const std::string fileName = item.path.filename().string();
    ProbeStatus status = ProbeStatus::Ok;
    std::optional<std::string> raw = getVideoCreationTime(m_ffprobe, item.path.string(), status);
    if (status == ProbeStatus::NoTag) {
        log.debug(fileName + ": no creation_time tag in first stream");
        return std::nullopt;
    }
    if (!raw) {
        std::string msg = fileName + ": failed to get video metadata (is " + m_ffprobe + " installed?)";
        if (!m_failureReported) {
            log.warn(msg);
            m_failureReported = true;
        } else {
            log.debug(msg);
        }
        return std::nullopt;
    }
    std::string text = normalizeCreationTime(*raw);
    Evidence t = parseIsoDateTime(text);
    if (!t) {
        log.warn(fileName + ": invalid date found in video metadata (" + *raw + "), ignoring");
        return std::nullopt;
    }
    return t;
}

}  // namespace snapsorter
