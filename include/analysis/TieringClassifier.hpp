#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "core/Finding.hpp"
#include "core/TieredResult.hpp"

namespace Triage
{
    namespace Utils
    {
        class ConfigLoader;
    }

    namespace Analysis
    {
        /// Number of context lines kept before and after a finding.
        struct ContextWindow
        {
            std::size_t pre  = 0;
            std::size_t post = 0;
        };

        /**
         * Tier capacities and context windows.
         *
         * Capacity rules for a requested limit L:
         *  - L <= 0 means defaultLimit.
         *  - Tier 1 holds L findings.
         *  - At L == defaultLimit tiers 2 and 3 use their fixed defaults,
         *    otherwise max(1, L / 4) and max(1, L / 2).
         */
        struct TieringPolicy
        {
            int           defaultLimit        = 20;
            std::size_t   tier2DefaultCapacity = 10;
            std::size_t   tier3DefaultCapacity = 15;

            ContextWindow tier1Window { 10, 15 };
            ContextWindow tier2Window { 5, 8 };
            ContextWindow tier3Window { 3, 3 };

            int effectiveLimit(int limit) const noexcept;
            std::size_t capacity(core::Tier tier, int limit) const noexcept;
            const ContextWindow &window(core::Tier tier) const noexcept;

            /**
             * Read overrides from a config ("default_limit",
             * "tier2_default_capacity", "tier1_pre_context", ...).
             * Missing, invalid or negative values keep the built-in default.
             */
            static TieringPolicy fromConfig(const Utils::ConfigLoader &config);
        };

        /// Aggregate job outcome per normalized pattern.
        using JobStateMap = std::unordered_map<std::string, core::JobState>;

        /**
         * TieringClassifier
         *
         * Responsibilities:
         *  - Group raw findings by normalized pattern and derive each
         *    pattern's aggregate job state.
         *  - Map the job state to a tier, keep the best finding per pattern,
         *    cap each tier and truncate context to the tier's window.
         *
         * Design notes:
         *  - Stateless apart from the policy; classify() is const and may be
         *    called concurrently.
         *  - Patterns produced only by passing jobs belong to no tier and are
         *    dropped (logged at DEBUG).
         *  - Tier 2 is reserved: no finding is assigned to it.
         */
        class TieringClassifier
        {
        public:
            explicit TieringClassifier(TieringPolicy policy = TieringPolicy{});

            const TieringPolicy &policy() const noexcept { return m_policy; }

            /**
             * Classify the findings of one build.
             *
             * Ordering inside a tier: confidence descending, then recurrence
             * count descending, then input order. Each pattern contributes at
             * most one finding across all tiers. The returned build metadata
             * is left empty for the caller to fill.
             */
            core::TieredResult classify(const std::vector<core::RawFinding> &findings, int limit) const;

            /**
             * Tier for a job state: Failed and Unknown give tier 1, Both
             * gives tier 3, Passed gives std::nullopt.
             */
            static std::optional<core::Tier> tierForState(core::JobState state) noexcept;

            /// Grouping key of a finding; derived from the message when not supplied.
            static std::string patternKey(const core::RawFinding &finding);

            /**
             * Aggregate outcome per pattern. Findings with an Unknown job
             * outcome do not contribute.
             */
            static JobStateMap buildJobStateMap(const std::vector<core::RawFinding> &findings);

            /// Distinct passing jobs whose findings share the pattern.
            static int countPassingJobs(const std::vector<core::RawFinding> &findings,
                                        const std::string &pattern);

            /// Keep the last `count` lines (the ones closest to the error).
            static std::vector<std::string> keepTail(const std::vector<std::string> &lines, std::size_t count);

            /// Keep the first `count` lines.
            static std::vector<std::string> keepHead(const std::vector<std::string> &lines, std::size_t count);

        private:
            core::ClassifiedFinding toClassified(const core::RawFinding &finding,
                                                 const std::string &pattern,
                                                 core::Tier tier,
                                                 core::JobState state) const;

        private:
            TieringPolicy m_policy;
        };

    } // namespace Analysis
} // namespace Triage
