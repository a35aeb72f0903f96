#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/Finding.hpp"

namespace Triage
{
    namespace Input
    {
        /**
         * FindingParser
         *
         * Responsibilities:
         *  - Turn one JSON object (one line of a findings JSONL file) into a
         *    RawFinding.
         *  - Report malformed lines with a readable reason instead of throwing.
         *
         * Recognized keys:
         *  - "message_hash" (preferred) or "id": finding id. Required.
         *  - "raw_message" (preferred) or "message": error text. Required.
         *  - "request_id", "job_name", "severity", "normalized_message"
         *  - "job_state": "failed" / "passed" / anything else (unknown)
         *  - "confidence_score" or "confidence": clamped to [0, 1]
         *  - "recurrence_count": defaults to 1
         *  - "pre_context", "post_context": arrays of strings
         *  - "metadata": object; its "job_state" and "recurrence_count"
         *    string values are used when the top-level keys are absent.
         * Unknown keys are skipped, whatever their value type.
         *
         * Design notes:
         *  - Small hand-written JSON scanner, no external dependency.
         *  - Stateless; safe to share between threads.
         */
        class FindingParser
        {
        public:
            struct ParseResult
            {
                std::optional<core::RawFinding> finding;
                bool malformed = false;
                std::string error;
            };

            FindingParser() = default;

            ParseResult parseLine(std::string_view line) const;
        };

    } // namespace Input
} // namespace Triage
