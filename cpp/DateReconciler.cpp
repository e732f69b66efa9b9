#include "DateReconciler.h"
#include "RunLog.h"
#include <exception>
#include <utility>

namespace snapsorter {

const char* scenarioName(ReconcileScenario s) {
    switch (s) {
        case ReconcileScenario::NoEvidence: return "NoEvidence";
        case ReconcileScenario::SingleSource: return "SingleSource";
        case ReconcileScenario::AllMatch: return "AllMatch";
        case ReconcileScenario::SameDayUsePrimary: return "SameDayUsePrimary";
        case ReconcileScenario::ConflictUsePrimary: return "ConflictUsePrimary";
        case ReconcileScenario::Conflict: return "Conflict";
        case ReconcileScenario::FileTimeFallback: return "FileTimeFallback";
        default: return "?";
    }
}

namespace {

// A throwing source counts as no evidence for this item only.
Evidence askSource(TimestampSource& source, const MediaItem& item, RunLog& log) {
    try {
        return source.lookup(item, log);
    } catch (const std::exception& e) {
        log.warn(item.path.filename().string() + ": " + source.name() + " failed (" + e.what() + "), ignoring");
        return std::nullopt;
    }
}

}  // namespace

DateReconciler::DateReconciler(std::vector<std::unique_ptr<TimestampSource>> sources,
                               ConflictPolicy policy,
                               std::unique_ptr<TimestampSource> fallback)
    : m_sources(std::move(sources)), m_policy(policy), m_fallback(std::move(fallback)) {}

ReconcileResult DateReconciler::reconcile(const MediaItem& item, RunLog& log) const {
    const std::string fileName = item.path.filename().string();
    ReconcileResult out;

    std::vector<std::pair<const TimestampSource*, SnapTime>> found;
    for (const auto& source : m_sources) {
        Evidence e = askSource(*source, item, log);
        if (e) {
            log.debug(fileName + ": " + source->name() + " says " + e->toString());
            found.emplace_back(source.get(), *e);
        } else {
            log.debug(fileName + ": no evidence from " + source->name());
        }
    }

    if (found.empty()) {
        if (m_fallback) {
            Evidence e = askSource(*m_fallback, item, log);
            if (e) {
                out.time = e;
                out.scenario = ReconcileScenario::FileTimeFallback;
                out.source = m_fallback->name();
                out.message = "no metadata or filename date, using " + out.source + " " + e->toString();
                log.warn(fileName + ": " + out.message);
                return out;
            }
        }
        out.scenario = ReconcileScenario::NoEvidence;
        out.message = "could not determine date";
        return out;
    }

    const TimestampSource* primary = found.front().first;
    const SnapTime& reference = found.front().second;
    out.source = primary->name();

    if (found.size() == 1) {
        out.time = reference;
        out.scenario = ReconcileScenario::SingleSource;
        out.message = std::string("using ") + primary->name() + " date";
        return out;
    }

    bool allEqual = true;
    bool sameDay = true;
    const TimestampSource* disagreeing = nullptr;
    for (size_t i = 1; i < found.size(); ++i) {
        const SnapTime& other = found[i].second;
        if (other == reference) continue;
        allEqual = false;
        if (!disagreeing) disagreeing = found[i].first;
        if (!other.sameDate(reference)) {
            sameDay = false;
            disagreeing = found[i].first;
            break;
        }
    }

    if (allEqual) {
        out.time = reference;
        out.scenario = ReconcileScenario::AllMatch;
        out.message = "all sources match";
        return out;
    }

    std::string detail;
    for (const auto& f : found) {
        if (!detail.empty()) detail += ", ";
        detail += std::string(f.first->name()) + " " + f.second.toString();
    }

    if (sameDay) {
        out.time = reference;
        out.scenario = ReconcileScenario::SameDayUsePrimary;
        out.message = std::string(primary->name()) + " and " + disagreeing->name()
            + " only loosely match (" + detail + "), using " + primary->name();
        log.warn(fileName + ": " + out.message);
        return out;
    }

    if (m_policy == ConflictPolicy::PreferPrimary) {
        out.time = reference;
        out.scenario = ReconcileScenario::ConflictUsePrimary;
        out.message = std::string(primary->name()) + " and " + disagreeing->name()
            + " disagree (" + detail + "), using " + primary->name();
        log.warn(fileName + ": " + out.message);
        return out;
    }

    out.scenario = ReconcileScenario::Conflict;
    out.source.clear();
    out.message = std::string(primary->name()) + " and " + disagreeing->name() + " dates do not match (" + detail + ")";
    return out;
}

}  // namespace snapsorter
