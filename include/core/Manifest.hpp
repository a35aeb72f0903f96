// Compact, token-efficient view of a TieredResult handed to the
// consuming agent. Only tier-1 findings carry their full record.

#ifndef CORE_MANIFEST_HPP
#define CORE_MANIFEST_HPP

#include <string>
#include <vector>

#include "core/Finding.hpp"
#include "core/TieredResult.hpp"

namespace core
{

/**
 * @brief One-line summary of a non-tier-1 finding.
 *
 * message is capped at the summary limit; the full record stays
 * retrievable from the store by id.
 */
struct FindingSummary
{
    std::string id;
    Tier        tier = Tier::CommonNoise;
    std::string message;
    std::string severity;
    double      confidence = 0.0;
    std::string jobName;
};

struct Manifest
{
    std::string                    requestId;
    BuildInfo                      build;
    std::vector<ClassifiedFinding> tier1Findings;
    std::vector<FindingSummary>    otherFindings;
};

} // namespace core

#endif // CORE_MANIFEST_HPP
