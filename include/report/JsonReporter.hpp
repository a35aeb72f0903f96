#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "core/Finding.hpp"
#include "core/Manifest.hpp"
#include "core/TieredResult.hpp"

namespace Triage
{
    namespace Report
    {
        /**
         * JsonReporter
         *
         * Responsibilities:
         *  - Serialize manifests, single findings and full tiered results
         *    for the consuming agent.
         *  - Proper escaping of every string field (RFC 8259).
         *
         * Design notes:
         *  - No external dependencies; output is assembled with ostringstream.
         *  - Field names are snake_case and stable; tier-specific optional
         *    fields are omitted when absent rather than written as null.
         *  - PRETTY breaks the top-level object over lines and keeps nested
         *    objects compact, one per line.
         */
        class JsonReporter
        {
        public:
            enum class PrettyPrint
            {
                COMPACT,  // Single line, minimal whitespace
                PRETTY    // Top-level fields on their own lines
            };

            explicit JsonReporter(PrettyPrint pretty = PrettyPrint::COMPACT);

            JsonReporter(const JsonReporter&) = default;
            JsonReporter& operator=(const JsonReporter&) = default;

            std::string manifestToJson(const core::Manifest& manifest) const;

            /// Full finding record, as returned by a drill-down.
            std::string findingToJson(const core::ClassifiedFinding& finding) const;

            /// Whole classification result, grouped by tier.
            std::string tieredResultToJson(const std::string& requestId, const core::TieredResult& result) const;

            std::string summaryToJson(const core::FindingSummary& summary) const;
            std::string buildToJson(const core::BuildInfo& build) const;

            void writeManifest(std::ostream& output, const core::Manifest& manifest) const;

            void setPrettyPrint(PrettyPrint mode) noexcept;
            PrettyPrint prettyPrint() const noexcept { return m_prettyPrint; }

        private:
            static std::string quote(const std::string& str);
            static std::string stringArray(const std::vector<std::string>& values);
            static std::string formatNumber(double value);

            template <typename T, typename Fn>
            std::string objectArray(const std::vector<T>& items, Fn&& toJson) const;

            /// Join "\"key\":value" members according to the print mode.
            std::string object(const std::vector<std::pair<std::string, std::string>>& members) const;

        private:
            PrettyPrint m_prettyPrint;
        };

    } // namespace Report
} // namespace Triage
