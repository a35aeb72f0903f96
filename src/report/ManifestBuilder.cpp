#include "report/ManifestBuilder.hpp"

#include "analysis/PatternNormalizer.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Triage
{
namespace Report
{
    using Analysis::MaskingLevel;
    using Analysis::PatternNormalizer;

    ManifestBuilder::ManifestBuilder(std::size_t summaryLimit) noexcept
        : m_summaryLimit(summaryLimit)
    {
    }

    core::Manifest ManifestBuilder::build(const std::string &requestId, const core::TieredResult &result) const
    {
        core::Manifest manifest;
        manifest.requestId = requestId;
        manifest.build     = result.build;

        manifest.tier1Findings.reserve(result.tier1.size());
        for (const auto &finding : result.tier1)
        {
            manifest.tier1Findings.push_back(presentTier1(finding));
        }

        manifest.otherFindings.reserve(result.tier2.size() + result.tier3.size());
        for (const auto &finding : result.tier2)
        {
            manifest.otherFindings.push_back(summarize(finding));
        }
        for (const auto &finding : result.tier3)
        {
            manifest.otherFindings.push_back(summarize(finding));
        }

        Utils::getLogger().debug("Manifest " + requestId + ": "
                                 + std::to_string(manifest.tier1Findings.size()) + " full, "
                                 + std::to_string(manifest.otherFindings.size()) + " summarized");
        return manifest;
    }

    core::ClassifiedFinding ManifestBuilder::presentTier1(const core::ClassifiedFinding &finding) const
    {
        core::ClassifiedFinding presented = finding;
        presented.message     = PatternNormalizer::normalize(finding.message, MaskingLevel::Presentation);
        presented.preContext  = PatternNormalizer::normalizeLines(finding.preContext, MaskingLevel::Presentation);
        presented.postContext = PatternNormalizer::normalizeLines(finding.postContext, MaskingLevel::Presentation);
        return presented;
    }

    core::FindingSummary ManifestBuilder::summarize(const core::ClassifiedFinding &finding) const
    {
        core::FindingSummary summary;
        summary.id         = finding.id;
        summary.tier       = finding.tier;
        summary.message    = Utils::truncateWithEllipsis(finding.message, m_summaryLimit);
        summary.severity   = finding.severity;
        summary.confidence = finding.confidence;
        summary.jobName    = finding.jobName;
        return summary;
    }

} // namespace Report
} // namespace Triage
