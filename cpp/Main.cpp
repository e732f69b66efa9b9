#include "DateReconciler.h"
#include "ExifHelper.h"
#include "FileTimeHelper.h"
#include "MediaScanner.h"
#include "Options.h"
#include "PathAssigner.h"
#include "RunLog.h"
#include "TimeParse.h"
#include "VideoMetaHelper.h"
#include <ctime>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

int runAllTests();

namespace {

using snapsorter::RunLog;

std::unique_ptr<snapsorter::DateReconciler> buildReconciler(const snapsorter::Options& options,
                                                            std::vector<snapsorter::FilenamePattern> patterns) {
    std::vector<std::unique_ptr<snapsorter::TimestampSource>> sources;
    sources.push_back(std::make_unique<snapsorter::MetadataSource>(
        std::make_unique<snapsorter::ExifSource>(),
        std::make_unique<snapsorter::VideoProbeSource>(options.ffprobe)));
    sources.push_back(std::make_unique<snapsorter::FilenameSource>(std::move(patterns)));

    std::unique_ptr<snapsorter::TimestampSource> fallback;
    if (options.fallbackFileTime)
        fallback = std::make_unique<snapsorter::FileTimeSource>();
    return std::make_unique<snapsorter::DateReconciler>(std::move(sources), options.conflictPolicy,
                                                        std::move(fallback));
}

int sortMedia(const snapsorter::Options& options) {
    RunLog log;
    log.setConsoleLevel(options.consoleLevel);

    std::error_code ec;
    if (!fs::is_directory(options.sourceDir, ec)) {
        log.error("Path does not exist or is not a directory: " + options.sourceDir.string());
        return 1;
    }

    if (options.writeLogFile) {
        fs::path logDir = options.logDir.empty() ? fs::current_path(ec) : options.logDir;
        fs::path logPath = logDir / snapsorter::makeLogFileName(options.sourceDir, std::time(nullptr));
        if (!log.openFile(logPath))
            log.warn("Cannot write log file " + logPath.string() + ", continuing without it");
        else
            log.fileOnly("===== SnapSorter run (" + std::string(snapsorter::transferModeName(options.transferMode()))
                         + ") " + options.sourceDir.string() + " -> " + options.destinationDir.string() + " =====");
    }

    std::vector<std::string> patternSources = options.extraPatterns;
    const auto& defaults = snapsorter::defaultFilenamePatterns();
    patternSources.insert(patternSources.end(), defaults.begin(), defaults.end());
    std::vector<snapsorter::FilenamePattern> patterns;
    std::string patternError;
    if (!snapsorter::compileFilenamePatterns(patternSources, patterns, patternError)) {
        log.error(patternError);
        return 1;
    }
    std::unique_ptr<snapsorter::DateReconciler> reconciler = buildReconciler(options, std::move(patterns));

    const snapsorter::TransferMode mode = options.transferMode();
    int transferred = 0;
    int inPlace = 0;
    int undated = 0;
    std::vector<std::pair<std::string, std::string>> errorEntries;  // (full path, error message)

    log.info("---- Traverse Directory: " + options.sourceDir.string() + " ----");
    snapsorter::MediaScanner scanner(options.sourceDir, log, options.destinationDir);

    snapsorter::AssignmentStream stream([&]() -> std::optional<snapsorter::DatedMedia> {
        while (std::optional<snapsorter::MediaItem> item = scanner.next()) {
            snapsorter::ReconcileResult result;
            try {
                result = reconciler->reconcile(*item, log);
            } catch (const std::exception& e) {
                log.error("[Skip] Exception on " + item->path.string() + ": " + e.what());
                errorEntries.emplace_back(item->path.string(), std::string("Exception: ") + e.what());
                continue;
            }
            if (!result.ok()) {
                log.error("[Skip] " + item->path.string() + ": " + result.message);
                errorEntries.emplace_back(item->path.string(), result.message);
                ++undated;
                continue;
            }
            log.debug(item->path.filename().string() + ": snap date " + result.time->toString()
                      + " [" + snapsorter::scenarioName(result.scenario) + "]");
            return snapsorter::DatedMedia{ *item, *result.time };
        }
        return std::nullopt;
    });

    while (std::optional<snapsorter::Assignment> a = stream.next()) {
        const fs::path target = options.destinationDir / a->output;
        try {
            if (snapsorter::isSameFile(a->source, target)) {
                ++inPlace;
                log.debug(a->source.string() + ": already in place");
                continue;
            }
            std::string error;
            if (!snapsorter::transferFile(a->source, target, mode, error)) {
                log.error(a->source.string() + ": " + error);
                errorEntries.emplace_back(a->source.string(), error);
                continue;
            }
            ++transferred;
            log.info(a->source.string() + " => " + a->output.generic_string());
        } catch (const std::exception& e) {
            log.error("[Skip] Exception on " + a->source.string() + ": " + e.what());
            errorEntries.emplace_back(a->source.string(), std::string("Exception: ") + e.what());
        }
    }

    std::ostringstream summary;
    summary << "------------------------------------------\n"
            << "[Summary]\n"
            << "  Files seen:      " << scanner.filesSeen() << "\n"
            << "  Non-media:       " << scanner.skippedFiles() << "\n"
            << "  " << (mode == snapsorter::TransferMode::DryRun ? "Planned:         "
                                                                 : "Transferred:     ") << transferred << "\n"
            << "  Already sorted:  " << inPlace << "\n"
            << "  Undated:         " << undated << "\n"
            << "  Errors:          " << errorEntries.size();
    std::cout << summary.str() << std::endl;
    log.fileOnly(summary.str());

    if (!errorEntries.empty()) {
        std::cout << "[Error details]" << std::endl;
        for (size_t i = 0; i < errorEntries.size(); ++i) {
            std::cout << "  " << (i + 1) << ". " << errorEntries[i].first << "\n      " << errorEntries[i].second << std::endl;
            log.fileOnly("  Error: " + errorEntries[i].first + " | " + errorEntries[i].second);
        }
    }
    std::cout << "------------------------------------------" << std::endl;
    if (log.hasFile()) {
        log.fileOnly("Log file: " + log.filePath().string());
        std::cout << "Log written to: " << log.filePath().string() << std::endl;
        log.closeFile();
    }
    return errorEntries.empty() ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Suppress Exiv2 warnings (e.g. "Directory Photo has an unexpected next pointer"); keep errors visible
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::error);

    const std::string program = argc > 0 ? fs::path(argv[0]).filename().string() : "SnapSorter";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    snapsorter::Options options;
    std::string error;
    if (!snapsorter::parseOptions(args, options, error)) {
        std::cerr << error << "\n" << std::endl;
        snapsorter::printUsage(std::cerr, program);
        return 1;
    }
    if (options.showHelp) {
        snapsorter::printUsage(std::cout, program);
        return 0;
    }
    if (options.runTests) return runAllTests();
    return sortMedia(options);
}
