#include "store/FindingsStore.hpp"

#include <mutex>

#include "utils/Logger.hpp"

namespace Triage
{
    namespace Store
    {
        void InMemoryFindingsStore::store(const std::string &requestId, const core::TieredResult &result)
        {
            FindingIndex index;
            index.reserve(result.totalCount());

            std::size_t collisions = 0;
            for (const auto tier : { core::Tier::UniqueFailure, core::Tier::FrequencySpike, core::Tier::CommonNoise })
            {
                for (const auto &finding : result.findings(tier))
                {
                    if (!index.emplace(finding.id, finding).second)
                    {
                        ++collisions;
                    }
                }
            }

            if (collisions > 0)
            {
                Utils::getLogger().warn("Request " + requestId + ": " + std::to_string(collisions)
                                        + " duplicate finding ids, kept the first");
            }

            {
                std::unique_lock<std::shared_mutex> lock(m_mutex);
                m_results[requestId] = result;
                m_index[requestId]   = std::move(index);
            }

            Utils::getLogger().debug("Stored " + std::to_string(result.totalCount())
                                     + " findings for request " + requestId);
        }

        std::optional<core::ClassifiedFinding> InMemoryFindingsStore::get(const std::string &requestId,
                                                                          const std::string &findingId) const
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);

            auto requestIt = m_index.find(requestId);
            if (requestIt == m_index.end())
            {
                return std::nullopt;
            }

            auto findingIt = requestIt->second.find(findingId);
            if (findingIt == requestIt->second.end())
            {
                return std::nullopt;
            }
            return findingIt->second;
        }

        std::optional<core::TieredResult> InMemoryFindingsStore::getAll(const std::string &requestId) const
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);

            auto it = m_results.find(requestId);
            if (it == m_results.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::size_t InMemoryFindingsStore::size() const
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            return m_results.size();
        }

    } // namespace Store
} // namespace Triage
