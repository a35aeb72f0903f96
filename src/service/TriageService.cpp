#include "service/TriageService.hpp"

#include <set>
#include <utility>

#include "utils/Logger.hpp"
#include "utils/TimeUtils.hpp"

namespace Triage
{
    namespace Service
    {
        TriageService::TriageService(std::shared_ptr<Store::FindingsStore> store,
                                     Analysis::TieringPolicy policy,
                                     std::size_t summaryLimit)
            : m_store(std::move(store)),
              m_classifier(std::move(policy)),
              m_manifestBuilder(summaryLimit)
        {
        }

        core::Manifest TriageService::analyzeBuild(core::BuildInfo build,
                                                   const std::vector<core::RawFinding> &findings,
                                                   int limit,
                                                   const std::string &requestId)
        {
            auto &log = Utils::getLogger();
            const Utils::TimePoint start = Utils::now();

            const std::string id = resolveRequestId(requestId, findings);
            log.info("Triage " + id + ": " + std::to_string(findings.size()) + " findings, limit "
                     + std::to_string(m_classifier.policy().effectiveLimit(limit)));

            if (build.failedJobs.empty() && build.passedJobsCount == 0)
            {
                deriveJobSummary(build, findings);
            }
            if (build.timestamp.empty())
            {
                build.timestamp = Utils::toIso8601Utc(start);
            }

            core::TieredResult result = m_classifier.classify(findings, limit);
            result.build = std::move(build);

            if (m_store)
            {
                m_store->store(id, result);
            }
            else
            {
                log.warn("No findings store configured; drill-down unavailable for " + id);
            }

            core::Manifest manifest = m_manifestBuilder.build(id, result);

            log.debug("Triage " + id + " done in "
                      + std::to_string(Utils::diffMillis(start, Utils::now())) + " ms");
            return manifest;
        }

        std::optional<core::ClassifiedFinding> TriageService::getFindingDetails(const std::string &requestId,
                                                                                const std::string &findingId) const
        {
            if (!m_store)
            {
                return std::nullopt;
            }

            auto finding = m_store->get(requestId, findingId);
            if (!finding)
            {
                Utils::getLogger().debug("Finding " + findingId + " not found in request " + requestId);
            }
            return finding;
        }

        std::optional<core::TieredResult> TriageService::getFullResult(const std::string &requestId) const
        {
            if (!m_store)
            {
                return std::nullopt;
            }
            return m_store->getAll(requestId);
        }

        std::string TriageService::resolveRequestId(const std::string &requested,
                                                    const std::vector<core::RawFinding> &findings)
        {
            if (!requested.empty())
            {
                return requested;
            }
            if (!findings.empty() && !findings.front().requestId.empty())
            {
                return findings.front().requestId;
            }
            return "req-" + std::to_string(Utils::toNanosSinceEpoch(Utils::now()));
        }

        void TriageService::deriveJobSummary(core::BuildInfo &build,
                                             const std::vector<core::RawFinding> &findings)
        {
            std::set<std::string> failed;
            std::set<std::string> passed;
            for (const auto &finding : findings)
            {
                if (finding.jobName.empty())
                {
                    continue;
                }
                if (finding.jobOutcome == core::JobOutcome::Failed)
                {
                    failed.insert(finding.jobName);
                }
                else if (finding.jobOutcome == core::JobOutcome::Passed)
                {
                    passed.insert(finding.jobName);
                }
            }

            build.failedJobs.assign(failed.begin(), failed.end());
            build.passedJobsCount = static_cast<int>(passed.size());
        }

    } // namespace Service
} // namespace Triage
