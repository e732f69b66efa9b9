#pragma once

#include "TimestampSource.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snapsorter {

class RunLog;

// Which rule decided the snap date (avoid enum value "None" - macro on some Windows builds)
enum class ReconcileScenario {
    NoEvidence,          // no source produced a timestamp: failure
    SingleSource,        // exactly one source produced a timestamp
    AllMatch,            // every source agrees to the second
    SameDayUsePrimary,   // same date, different time: highest-priority source wins
    ConflictUsePrimary,  // different dates, relaxed policy: highest-priority source wins
    Conflict,            // different dates: failure
    FileTimeFallback     // nothing else, file modification time used
};

const char* scenarioName(ReconcileScenario s);

enum class ConflictPolicy {
    Fail,
    PreferPrimary
};

struct ReconcileResult {
    std::optional<SnapTime> time;  // empty on failure
    ReconcileScenario scenario = ReconcileScenario::NoEvidence;
    std::string source;            // name of the source whose time was taken
    std::string message;

    bool ok() const { return time.has_value(); }
};

// Combines evidence from sources given in priority order (metadata before
// filename). Each source is asked exactly once per item. Source errors
// never escape; only NoEvidence and Conflict results are failures.
class DateReconciler {
public:
    explicit DateReconciler(std::vector<std::unique_ptr<TimestampSource>> sources,
                            ConflictPolicy policy = ConflictPolicy::Fail,
                            std::unique_ptr<TimestampSource> fallback = nullptr);

    ReconcileResult reconcile(const MediaItem& item, RunLog& log) const;

    ConflictPolicy policy() const { return m_policy; }

private:
    std::vector<std::unique_ptr<TimestampSource>> m_sources;
    ConflictPolicy m_policy;
    std::unique_ptr<TimestampSource> m_fallback;
};

}  // namespace snapsorter
