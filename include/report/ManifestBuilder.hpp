#pragma once

#include <cstddef>
#include <string>

#include "core/Manifest.hpp"
#include "core/TieredResult.hpp"

namespace Triage
{
    namespace Report
    {
        /**
         * ManifestBuilder
         *
         * Responsibilities:
         *  - Turn a TieredResult into the compact Manifest an agent reads first.
         *  - Keep tier-1 findings whole (message and context rendered in
         *    Presentation mode, never truncated).
         *  - Reduce tiers 2 and 3 to one-line summaries whose raw message is
         *    capped at the summary limit.
         *
         * Design notes:
         *  - Pure function of its input; the TieredResult is not modified.
         *  - Summaries are ordered tier 2 first, then tier 3, each keeping
         *    the tier's own order.
         */
        class ManifestBuilder
        {
        public:
            static constexpr std::size_t kDefaultSummaryLimit = 100;

            explicit ManifestBuilder(std::size_t summaryLimit = kDefaultSummaryLimit) noexcept;

            std::size_t summaryLimit() const noexcept { return m_summaryLimit; }

            core::Manifest build(const std::string &requestId, const core::TieredResult &result) const;

            /// Tier-1 finding as presented in the manifest.
            core::ClassifiedFinding presentTier1(const core::ClassifiedFinding &finding) const;

            core::FindingSummary summarize(const core::ClassifiedFinding &finding) const;

        private:
            std::size_t m_summaryLimit;
        };

    } // namespace Report
} // namespace Triage
