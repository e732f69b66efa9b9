#pragma once

#include "DateReconciler.h"
#include "FileTimeHelper.h"
#include "RunLog.h"
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace snapsorter {

struct Options {
    fs::path sourceDir;
    fs::path destinationDir;

    bool copy = false;    // copy instead of move
    bool dryRun = false;  // only print the plan

    ConflictPolicy conflictPolicy = ConflictPolicy::Fail;
    bool fallbackFileTime = false;

    std::vector<std::string> extraPatterns;  // tried before the built-in patterns
    std::string ffprobe = "ffprobe";

    fs::path logDir;  // empty: current directory
    bool writeLogFile = true;
    LogLevel consoleLevel = LogLevel::Info;

    bool runTests = false;
    bool showHelp = false;

    TransferMode transferMode() const;
};

// Parse argv[1..]. Returns false with error for unknown options, missing
// option values or a wrong number of positional arguments.
bool parseOptions(const std::vector<std::string>& args, Options& options, std::string& error);

void printUsage(std::ostream& os, const std::string& program);

}  // namespace snapsorter
