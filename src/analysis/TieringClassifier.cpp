#include "analysis/TieringClassifier.hpp"

#include <algorithm>
#include <utility>

#include "analysis/PatternNormalizer.hpp"
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

namespace Triage
{
    namespace Analysis
    {
        namespace
        {
            core::JobState combine(core::JobState current, core::JobOutcome outcome) noexcept
            {
                const core::JobState incoming =
                    outcome == core::JobOutcome::Failed ? core::JobState::Failed : core::JobState::Passed;

                if (current == core::JobState::Unknown || current == incoming)
                {
                    return incoming;
                }
                return core::JobState::Both;
            }

            std::size_t configSize(const Utils::ConfigLoader &config, const char *key, std::size_t fallback)
            {
                const int value = config.getIntOr(key, static_cast<int>(fallback));
                if (value < 0)
                {
                    Utils::getLogger().warn(std::string("Config key '") + key + "' is negative, using default");
                    return fallback;
                }
                return static_cast<std::size_t>(value);
            }

            struct Candidate
            {
                const core::RawFinding *finding;
                std::string             pattern;
                core::Tier              tier;
                core::JobState          state;
            };
        } // anonymous namespace

        // ---------- TieringPolicy ----------

        int TieringPolicy::effectiveLimit(int limit) const noexcept
        {
            return limit > 0 ? limit : defaultLimit;
        }

        std::size_t TieringPolicy::capacity(core::Tier tier, int limit) const noexcept
        {
            const int effective = effectiveLimit(limit);
            const bool isDefault = effective == defaultLimit;

            switch (tier)
            {
            case core::Tier::UniqueFailure:
                return static_cast<std::size_t>(effective);
            case core::Tier::FrequencySpike:
                return isDefault ? tier2DefaultCapacity
                                 : static_cast<std::size_t>(std::max(1, effective / 4));
            case core::Tier::CommonNoise:
                return isDefault ? tier3DefaultCapacity
                                 : static_cast<std::size_t>(std::max(1, effective / 2));
            }
            return 0;
        }

        const ContextWindow &TieringPolicy::window(core::Tier tier) const noexcept
        {
            switch (tier)
            {
            case core::Tier::UniqueFailure:  return tier1Window;
            case core::Tier::FrequencySpike: return tier2Window;
            case core::Tier::CommonNoise:    return tier3Window;
            }
            return tier1Window;
        }

        TieringPolicy TieringPolicy::fromConfig(const Utils::ConfigLoader &config)
        {
            TieringPolicy policy;

            const int limit = config.getIntOr("default_limit", policy.defaultLimit);
            if (limit > 0)
            {
                policy.defaultLimit = limit;
            }
            else
            {
                Utils::getLogger().warn("Config key 'default_limit' must be positive, using default");
            }

            policy.tier2DefaultCapacity = configSize(config, "tier2_default_capacity", policy.tier2DefaultCapacity);
            policy.tier3DefaultCapacity = configSize(config, "tier3_default_capacity", policy.tier3DefaultCapacity);

            policy.tier1Window.pre  = configSize(config, "tier1_pre_context",  policy.tier1Window.pre);
            policy.tier1Window.post = configSize(config, "tier1_post_context", policy.tier1Window.post);
            policy.tier2Window.pre  = configSize(config, "tier2_pre_context",  policy.tier2Window.pre);
            policy.tier2Window.post = configSize(config, "tier2_post_context", policy.tier2Window.post);
            policy.tier3Window.pre  = configSize(config, "tier3_pre_context",  policy.tier3Window.pre);
            policy.tier3Window.post = configSize(config, "tier3_post_context", policy.tier3Window.post);

            return policy;
        }

        // ---------- TieringClassifier ----------

        TieringClassifier::TieringClassifier(TieringPolicy policy)
            : m_policy(std::move(policy))
        {
        }

        std::optional<core::Tier> TieringClassifier::tierForState(core::JobState state) noexcept
        {
            switch (state)
            {
            case core::JobState::Failed:
            case core::JobState::Unknown:
                return core::Tier::UniqueFailure;
            case core::JobState::Both:
                return core::Tier::CommonNoise;
            case core::JobState::Passed:
                return std::nullopt;
            }
            return std::nullopt;
        }

        std::string TieringClassifier::patternKey(const core::RawFinding &finding)
        {
            if (!finding.normalizedPattern.empty())
            {
                return finding.normalizedPattern;
            }
            return PatternNormalizer::normalize(finding.message, MaskingLevel::Recurrence);
        }

        JobStateMap TieringClassifier::buildJobStateMap(const std::vector<core::RawFinding> &findings)
        {
            JobStateMap states;
            for (const auto &finding : findings)
            {
                if (finding.jobOutcome == core::JobOutcome::Unknown)
                {
                    continue;
                }

                auto [it, inserted] = states.try_emplace(patternKey(finding), core::JobState::Unknown);
                it->second = combine(it->second, finding.jobOutcome);
            }
            return states;
        }

        int TieringClassifier::countPassingJobs(const std::vector<core::RawFinding> &findings,
                                                const std::string &pattern)
        {
            std::unordered_set<std::string> jobs;
            for (const auto &finding : findings)
            {
                if (finding.jobOutcome == core::JobOutcome::Passed && patternKey(finding) == pattern)
                {
                    jobs.insert(finding.jobName);
                }
            }
            return static_cast<int>(jobs.size());
        }

        std::vector<std::string> TieringClassifier::keepTail(const std::vector<std::string> &lines, std::size_t count)
        {
            if (lines.size() <= count)
            {
                return lines;
            }
            return std::vector<std::string>(lines.end() - static_cast<std::ptrdiff_t>(count), lines.end());
        }

        std::vector<std::string> TieringClassifier::keepHead(const std::vector<std::string> &lines, std::size_t count)
        {
            if (lines.size() <= count)
            {
                return lines;
            }
            return std::vector<std::string>(lines.begin(), lines.begin() + static_cast<std::ptrdiff_t>(count));
        }

        core::ClassifiedFinding TieringClassifier::toClassified(const core::RawFinding &finding,
                                                                const std::string &pattern,
                                                                core::Tier tier,
                                                                core::JobState state) const
        {
            const ContextWindow &window = m_policy.window(tier);

            core::ClassifiedFinding out;
            out.id                = finding.id;
            out.message           = finding.message;
            out.severity          = finding.severity;
            out.confidence        = finding.confidence;
            out.jobName           = finding.jobName;
            out.jobOutcome        = finding.jobOutcome;
            out.pattern           = pattern;
            out.recurrenceCount   = finding.recurrenceCount;
            out.tier              = tier;
            out.alsoInPassingJobs = state == core::JobState::Both;
            out.preContext        = keepTail(finding.preContext, window.pre);
            out.postContext       = keepHead(finding.postContext, window.post);
            return out;
        }

        core::TieredResult TieringClassifier::classify(const std::vector<core::RawFinding> &findings, int limit) const
        {
            auto &log = Utils::getLogger();

            const JobStateMap states = buildJobStateMap(findings);

            // Passing jobs per pattern, gathered once instead of rescanning
            // the batch for every tier-3 survivor.
            std::unordered_map<std::string, std::unordered_set<std::string>> passingJobs;

            std::vector<Candidate> candidates;
            candidates.reserve(findings.size());

            for (const auto &finding : findings)
            {
                std::string pattern = patternKey(finding);

                if (finding.jobOutcome == core::JobOutcome::Passed)
                {
                    passingJobs[pattern].insert(finding.jobName);
                }

                auto it = states.find(pattern);
                const core::JobState state = it != states.end() ? it->second : core::JobState::Unknown;

                const auto tier = tierForState(state);
                if (!tier)
                {
                    log.debug("Pattern only seen in passing jobs, skipped: " + pattern);
                    continue;
                }

                candidates.push_back(Candidate{ &finding, std::move(pattern), *tier, state });
            }

            std::stable_sort(candidates.begin(), candidates.end(),
                             [](const Candidate &a, const Candidate &b)
                             {
                                 if (a.finding->confidence != b.finding->confidence)
                                 {
                                     return a.finding->confidence > b.finding->confidence;
                                 }
                                 return a.finding->recurrenceCount > b.finding->recurrenceCount;
                             });

            core::TieredResult result;
            std::unordered_set<std::string> seenPatterns;

            const std::size_t tier1Cap = m_policy.capacity(core::Tier::UniqueFailure, limit);
            const std::size_t tier3Cap = m_policy.capacity(core::Tier::CommonNoise, limit);

            for (const auto &candidate : candidates)
            {
                if (!seenPatterns.insert(candidate.pattern).second)
                {
                    log.trace("Duplicate pattern dropped: " + candidate.finding->id);
                    continue;
                }

                if (candidate.tier == core::Tier::UniqueFailure)
                {
                    if (result.tier1.size() >= tier1Cap)
                    {
                        log.trace("Tier 1 full, dropped: " + candidate.finding->id);
                        continue;
                    }
                    result.tier1.push_back(toClassified(*candidate.finding, candidate.pattern,
                                                        candidate.tier, candidate.state));
                }
                else if (candidate.tier == core::Tier::CommonNoise)
                {
                    if (result.tier3.size() >= tier3Cap)
                    {
                        log.trace("Tier 3 full, dropped: " + candidate.finding->id);
                        continue;
                    }
                    core::ClassifiedFinding classified = toClassified(*candidate.finding, candidate.pattern,
                                                                      candidate.tier, candidate.state);
                    classified.passingJobCount = static_cast<int>(passingJobs[candidate.pattern].size());
                    result.tier3.push_back(std::move(classified));
                }
            }

            log.info("Classified " + std::to_string(findings.size()) + " findings: tier1="
                     + std::to_string(result.tier1.size()) + " tier2="
                     + std::to_string(result.tier2.size()) + " tier3="
                     + std::to_string(result.tier3.size()));

            return result;
        }

    } // namespace Analysis
} // namespace Triage
