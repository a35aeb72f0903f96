#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analysis/TieringClassifier.hpp"
#include "core/Finding.hpp"
#include "core/Manifest.hpp"
#include "core/TieredResult.hpp"
#include "report/ManifestBuilder.hpp"
#include "store/FindingsStore.hpp"

namespace Triage
{
    namespace Service
    {
        /**
         * TriageService
         *
         * Responsibilities:
         *  - Run one triage: classify a build's findings, store the full
         *    result and return the compact manifest.
         *  - Serve drill-down requests (one finding, or the whole result)
         *    from the store.
         *
         * Design notes:
         *  - The store is shared; several services (or threads) may use it.
         *  - Fetching findings from a CI provider happens upstream; the
         *    service starts from already-extracted RawFindings.
         */
        class TriageService
        {
        public:
            TriageService(std::shared_ptr<Store::FindingsStore> store,
                          Analysis::TieringPolicy policy = Analysis::TieringPolicy{},
                          std::size_t summaryLimit = Report::ManifestBuilder::kDefaultSummaryLimit);

            TriageService(const TriageService &)            = delete;
            TriageService &operator=(const TriageService &) = delete;

            /**
             * Classify, store and summarize.
             *
             * build: url/status as known by the caller. failedJobs and
             *   passedJobsCount are derived from the findings when empty;
             *   timestamp defaults to now (UTC).
             * limit: tier-1 capacity; <= 0 means the policy default.
             * requestId: explicit id, else the first finding's request id,
             *   else a fresh "req-<epoch-nanos>".
             */
            core::Manifest analyzeBuild(core::BuildInfo build,
                                        const std::vector<core::RawFinding> &findings,
                                        int limit,
                                        const std::string &requestId = std::string());

            std::optional<core::ClassifiedFinding> getFindingDetails(const std::string &requestId,
                                                                     const std::string &findingId) const;

            std::optional<core::TieredResult> getFullResult(const std::string &requestId) const;

            static std::string resolveRequestId(const std::string &requested,
                                                 const std::vector<core::RawFinding> &findings);

            /// Fill failedJobs / passedJobsCount from the findings' job outcomes.
            static void deriveJobSummary(core::BuildInfo &build,
                                         const std::vector<core::RawFinding> &findings);

        private:
            std::shared_ptr<Store::FindingsStore> m_store;
            Analysis::TieringClassifier m_classifier;
            Report::ManifestBuilder m_manifestBuilder;
        };

    } // namespace Service
} // namespace Triage
