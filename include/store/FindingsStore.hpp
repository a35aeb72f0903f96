#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "core/Finding.hpp"
#include "core/TieredResult.hpp"

namespace Triage
{
    namespace Store
    {
        /**
         * FindingsStore
         *
         * Keyed storage of classification results so an agent can drill
         * down from a manifest summary to the full finding.
         *
         * Contract:
         *  - store() replaces any earlier result under the same request id.
         *  - Lookups are scoped to a request id; the same finding id under
         *    another request is a different entry.
         *  - Implementations must tolerate concurrent callers.
         */
        class FindingsStore
        {
        public:
            virtual ~FindingsStore() = default;

            virtual void store(const std::string &requestId, const core::TieredResult &result) = 0;

            /// Single finding; std::nullopt if the request or the id is unknown.
            virtual std::optional<core::ClassifiedFinding> get(const std::string &requestId,
                                                               const std::string &findingId) const = 0;

            /// Whole result; std::nullopt if the request is unknown.
            virtual std::optional<core::TieredResult> getAll(const std::string &requestId) const = 0;
        };

        /**
         * InMemoryFindingsStore
         *
         * Process-local FindingsStore. Results live as long as the store;
         * there is no eviction.
         *
         * Design notes:
         *  - One reader/writer lock guards both maps, so a reader never sees
         *    a result without its id index (or the reverse).
         *  - The id index is filled tier 1 first, then tier 2, then tier 3.
         *    If an id repeats, the first entry wins and a WARN is logged.
         */
        class InMemoryFindingsStore final : public FindingsStore
        {
        public:
            InMemoryFindingsStore() = default;

            InMemoryFindingsStore(const InMemoryFindingsStore &)            = delete;
            InMemoryFindingsStore &operator=(const InMemoryFindingsStore &) = delete;

            void store(const std::string &requestId, const core::TieredResult &result) override;

            std::optional<core::ClassifiedFinding> get(const std::string &requestId,
                                                       const std::string &findingId) const override;

            std::optional<core::TieredResult> getAll(const std::string &requestId) const override;

            /// Number of stored requests.
            std::size_t size() const;

        private:
            using FindingIndex = std::unordered_map<std::string, core::ClassifiedFinding>;

            mutable std::shared_mutex m_mutex;
            std::unordered_map<std::string, core::TieredResult> m_results;
            std::unordered_map<std::string, FindingIndex> m_index;
        };

    } // namespace Store
} // namespace Triage
