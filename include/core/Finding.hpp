// Core data model for a single extracted error finding, before and after
// tier classification. Plain value types, freely copied between the
// classifier, the store and the reporters.

#ifndef CORE_FINDING_HPP
#define CORE_FINDING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace core
{

/**
 * @brief Outcome of the CI job a finding was extracted from.
 *
 * Unknown covers jobs whose result was not reported (still running,
 * cancelled, or a provider value we do not recognize).
 */
enum class JobOutcome : std::uint8_t
{
    Failed = 0,
    Passed,
    Unknown
};

/**
 * @brief Aggregate outcome of every job that produced a given pattern.
 *
 * Derived per normalized pattern by the classifier; never stored on a
 * finding. Unknown is the state of a pattern no failed or passed job
 * has produced.
 */
enum class JobState : std::uint8_t
{
    Failed = 0,
    Passed,
    Both,
    Unknown
};

/**
 * @brief Triage tier.
 *
 *  - UniqueFailure  (1): only seen in failing jobs, highest signal.
 *  - FrequencySpike (2): recurs more than usual. Reserved; never assigned.
 *  - CommonNoise    (3): also appears in passing jobs, usually noise.
 */
enum class Tier : std::uint8_t
{
    UniqueFailure  = 1,
    FrequencySpike = 2,
    CommonNoise    = 3
};

inline const char *toString(JobOutcome outcome) noexcept
{
    switch (outcome)
    {
    case JobOutcome::Failed:  return "failed";
    case JobOutcome::Passed:  return "passed";
    case JobOutcome::Unknown: return "unknown";
    }
    return "unknown";
}

inline const char *toString(JobState state) noexcept
{
    switch (state)
    {
    case JobState::Failed:  return "failed";
    case JobState::Passed:  return "passed";
    case JobState::Both:    return "both";
    case JobState::Unknown: return "unknown";
    }
    return "unknown";
}

inline int tierNumber(Tier tier) noexcept
{
    return static_cast<int>(tier);
}

/**
 * @brief Parse a provider job result, case-insensitively.
 *
 * "failed"/"failure"/"error" map to Failed, "passed"/"success"/"succeeded"
 * map to Passed, everything else (including "") to Unknown.
 */
JobOutcome parseJobOutcome(std::string_view text);

/**
 * @brief One error occurrence extracted from a CI job log.
 *
 * Produced upstream (log extraction is out of scope) and consumed
 * read-only by the classifier.
 *
 * Field notes:
 *  - id: content hash of the message; unique within a build.
 *  - normalizedPattern: Recurrence-mode normalization of message. When
 *    empty, the classifier derives it from message.
 *  - recurrenceCount: how many times the message repeated inside its job.
 */
struct RawFinding
{
    std::string              id;
    std::string              requestId;
    std::string              message;
    std::string              severity;
    double                   confidence = 0.0;
    std::string              jobName;
    JobOutcome               jobOutcome = JobOutcome::Unknown;
    std::string              normalizedPattern;
    std::vector<std::string> preContext;
    std::vector<std::string> postContext;
    int                      recurrenceCount = 1;
};

/**
 * @brief A finding after tier assignment.
 *
 * Context vectors are already truncated to the tier's window. The
 * optional members are only meaningful for some tiers:
 *  - recurrenceThisBuild / avgRecurrence: tier 2 (never populated today).
 *  - passingJobCount: tier 3.
 */
struct ClassifiedFinding
{
    std::string              id;
    std::string              message;
    std::string              severity;
    double                   confidence = 0.0;
    std::string              jobName;
    JobOutcome               jobOutcome = JobOutcome::Unknown;
    std::string              pattern;
    int                      recurrenceCount = 1;
    Tier                     tier = Tier::UniqueFailure;
    bool                     alsoInPassingJobs = false;
    std::vector<std::string> preContext;
    std::vector<std::string> postContext;

    std::optional<int>       recurrenceThisBuild;
    std::optional<double>    avgRecurrence;
    std::optional<int>       passingJobCount;
};

} // namespace core

#endif // CORE_FINDING_HPP
