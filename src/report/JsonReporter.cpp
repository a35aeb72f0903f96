#include "report/JsonReporter.hpp"

#include <sstream>
#include <utility>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Triage
{
namespace Report
{
    JsonReporter::JsonReporter(PrettyPrint pretty)
        : m_prettyPrint(pretty)
    {
    }

    template <typename T, typename Fn>
    std::string JsonReporter::objectArray(const std::vector<T>& items, Fn&& toJson) const
    {
        std::string out = "[";
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            if (i) out += ",";
            out += toJson(items[i]);
        }
        out += "]";
        return out;
    }

    std::string JsonReporter::manifestToJson(const core::Manifest& manifest) const
    {
        // Nested objects are always compact, whatever the print mode.
        const JsonReporter compact(PrettyPrint::COMPACT);

        return object({
            { "request_id",      quote(manifest.requestId) },
            { "build",           buildToJson(manifest.build) },
            { "tier_1_findings", compact.objectArray(manifest.tier1Findings,
                                    [&compact](const core::ClassifiedFinding& f) { return compact.findingToJson(f); }) },
            { "other_findings",  compact.objectArray(manifest.otherFindings,
                                    [&compact](const core::FindingSummary& s) { return compact.summaryToJson(s); }) },
        });
    }

    std::string JsonReporter::findingToJson(const core::ClassifiedFinding& f) const
    {
        std::vector<std::pair<std::string, std::string>> members {
            { "id",                   quote(f.id) },
            { "tier",                 std::to_string(core::tierNumber(f.tier)) },
            { "message",              quote(f.message) },
            { "severity",             quote(f.severity) },
            { "confidence",           formatNumber(f.confidence) },
            { "job",                  quote(f.jobName) },
            { "job_state",            quote(core::toString(f.jobOutcome)) },
            { "pattern",              quote(f.pattern) },
            { "recurrence",           std::to_string(f.recurrenceCount) },
            { "also_in_passing_jobs", f.alsoInPassingJobs ? "true" : "false" },
            { "pre_context",          stringArray(f.preContext) },
            { "post_context",         stringArray(f.postContext) },
        };

        if (f.recurrenceThisBuild)
            members.emplace_back("recurrence_this_build", std::to_string(*f.recurrenceThisBuild));
        if (f.avgRecurrence)
            members.emplace_back("avg_recurrence", formatNumber(*f.avgRecurrence));
        if (f.passingJobCount)
            members.emplace_back("passing_job_count", std::to_string(*f.passingJobCount));

        return object(members);
    }

    std::string JsonReporter::tieredResultToJson(const std::string& requestId, const core::TieredResult& result) const
    {
        const JsonReporter compact(PrettyPrint::COMPACT);
        auto toJson = [&compact](const core::ClassifiedFinding& f) { return compact.findingToJson(f); };

        return object({
            { "request_id",             quote(requestId) },
            { "build",                  buildToJson(result.build) },
            { "tier_1_unique_failures", compact.objectArray(result.tier1, toJson) },
            { "tier_2_frequency_spikes", compact.objectArray(result.tier2, toJson) },
            { "tier_3_common_noise",    compact.objectArray(result.tier3, toJson) },
        });
    }

    std::string JsonReporter::summaryToJson(const core::FindingSummary& s) const
    {
        return object({
            { "id",         quote(s.id) },
            { "tier",       std::to_string(core::tierNumber(s.tier)) },
            { "message",    quote(s.message) },
            { "severity",   quote(s.severity) },
            { "confidence", formatNumber(s.confidence) },
            { "job",        quote(s.jobName) },
        });
    }

    std::string JsonReporter::buildToJson(const core::BuildInfo& build) const
    {
        std::ostringstream oss;
        oss << "{";
        oss << "\"url\":" << quote(build.url) << ",";
        oss << "\"status\":" << quote(build.status) << ",";
        oss << "\"failed_jobs\":" << stringArray(build.failedJobs) << ",";
        oss << "\"passed_jobs_count\":" << build.passedJobsCount << ",";
        oss << "\"timestamp\":" << quote(build.timestamp);
        oss << "}";
        return oss.str();
    }

    void JsonReporter::writeManifest(std::ostream& output, const core::Manifest& manifest) const
    {
        output << manifestToJson(manifest) << "\n";
        output.flush();
        Utils::getLogger().debug("Manifest written for request " + manifest.requestId);
    }

    void JsonReporter::setPrettyPrint(PrettyPrint mode) noexcept
    {
        m_prettyPrint = mode;
    }

    // ---- Private helpers ----

    std::string JsonReporter::quote(const std::string& str)
    {
        return "\"" + Utils::escapeJson(str) + "\"";
    }

    std::string JsonReporter::stringArray(const std::vector<std::string>& values)
    {
        std::string out = "[";
        for (std::size_t i = 0; i < values.size(); ++i)
        {
            if (i) out += ",";
            out += quote(values[i]);
        }
        out += "]";
        return out;
    }

    std::string JsonReporter::formatNumber(double value)
    {
        // Shortest round-trippable form for scores such as 0.95.
        std::ostringstream oss;
        oss.precision(15);
        oss << value;
        return oss.str();
    }

    std::string JsonReporter::object(const std::vector<std::pair<std::string, std::string>>& members) const
    {
        const bool pretty = m_prettyPrint == PrettyPrint::PRETTY;

        std::ostringstream oss;
        oss << (pretty ? "{\n" : "{");
        for (std::size_t i = 0; i < members.size(); ++i)
        {
            if (pretty)
                oss << "  " << quote(members[i].first) << ": " << members[i].second;
            else
                oss << quote(members[i].first) << ":" << members[i].second;

            if (i + 1 < members.size())
                oss << ",";
            if (pretty)
                oss << "\n";
        }
        oss << "}";
        return oss.str();
    }

} // namespace Report
} // namespace Triage
