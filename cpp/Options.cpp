#include "Options.h"

namespace snapsorter {

TransferMode Options::transferMode() const {
    if (dryRun) return TransferMode::DryRun;
    return copy ? TransferMode::Copy : TransferMode::Move;
}

bool parseOptions(const std::vector<std::string>& args, Options& options, std::string& error) {
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&](std::string& out) -> bool {
            if (i + 1 >= args.size()) {
                error = "Missing value for " + arg;
                return false;
            }
            out = args[++i];
            return true;
        };

        if (arg == "--test" || arg == "-t") {
            options.runTests = true;
        } else if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--copy") {
            options.copy = true;
        } else if (arg == "--dry-run" || arg == "-n") {
            options.dryRun = true;
        } else if (arg == "--prefer-metadata") {
            options.conflictPolicy = ConflictPolicy::PreferPrimary;
        } else if (arg == "--fallback-file-time") {
            options.fallbackFileTime = true;
        } else if (arg == "--pattern") {
            std::string pattern;
            if (!value(pattern)) return false;
            options.extraPatterns.push_back(pattern);
        } else if (arg == "--ffprobe") {
            if (!value(options.ffprobe)) return false;
        } else if (arg == "--log-dir") {
            std::string dir;
            if (!value(dir)) return false;
            options.logDir = dir;
        } else if (arg == "--no-log-file") {
            options.writeLogFile = false;
        } else if (arg == "--verbose" || arg == "-v") {
            options.consoleLevel = LogLevel::Debug;
        } else if (arg == "--quiet" || arg == "-q") {
            options.consoleLevel = LogLevel::Warn;
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (options.runTests || options.showHelp) return true;
    if (positional.size() != 2) {
        error = "Expected <source-dir> <destination-dir>, got " + std::to_string(positional.size()) + " path(s)";
        return false;
    }
    options.sourceDir = positional[0];
    options.destinationDir = positional[1];
    return true;
}

void printUsage(std::ostream& os, const std::string& program) {
    os << "Usage: " << program << " [options] <source-dir> <destination-dir>\n"
       << "       " << program << " --test\n"
       << "\n"
       << "Dates every image and video under <source-dir> from its metadata and file name\n"
       << "and moves it to <destination-dir>/<year>/<month>/<Y-M-D-HhM[mSs]>_<IMG|VID><n>.<ext>.\n"
       << "\n"
       << "Options:\n"
       << "  --copy                 copy instead of move\n"
       << "  -n, --dry-run          print the plan, touch nothing\n"
       << "  --prefer-metadata      on a date conflict use the metadata date instead of skipping\n"
       << "  --fallback-file-time   use the file modification time when nothing else dates a file\n"
       << "  --pattern <regex>      extra filename pattern with (?<year>..) style groups (repeatable)\n"
       << "  --ffprobe <exe>        ffprobe executable (default: ffprobe)\n"
       << "  --log-dir <dir>        directory for the run log (default: current directory)\n"
       << "  --no-log-file          do not write a run log\n"
       << "  -v, --verbose          debug output\n"
       << "  -q, --quiet            warnings and errors only\n"
       << "  -t, --test             run the built-in tests\n"
       << "  -h, --help             this help\n";
}

}  // namespace snapsorter
