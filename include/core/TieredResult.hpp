// Full classification result for one build, plus the build metadata
// the manifest and the store carry alongside it.

#ifndef CORE_TIERED_RESULT_HPP
#define CORE_TIERED_RESULT_HPP

#include <string>
#include <vector>

#include "core/Finding.hpp"

namespace core
{

/**
 * @brief Metadata of the build being triaged.
 *
 * failedJobs lists distinct job names, sorted. timestamp is UTC ISO-8601.
 */
struct BuildInfo
{
    std::string              url;
    std::string              status;
    std::vector<std::string> failedJobs;
    int                      passedJobsCount = 0;
    std::string              timestamp;
};

/**
 * @brief Findings of one build grouped by tier.
 *
 * Each vector is ordered by confidence (descending); each finding id
 * appears in at most one tier.
 */
struct TieredResult
{
    BuildInfo                      build;
    std::vector<ClassifiedFinding> tier1;
    std::vector<ClassifiedFinding> tier2;
    std::vector<ClassifiedFinding> tier3;

    const std::vector<ClassifiedFinding> &findings(Tier tier) const noexcept
    {
        switch (tier)
        {
        case Tier::UniqueFailure:  return tier1;
        case Tier::FrequencySpike: return tier2;
        case Tier::CommonNoise:    return tier3;
        }
        return tier1;
    }

    std::size_t totalCount() const noexcept
    {
        return tier1.size() + tier2.size() + tier3.size();
    }
};

} // namespace core

#endif // CORE_TIERED_RESULT_HPP
