#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace Triage
{
    namespace Analysis
    {
        /**
         * How aggressively volatile tokens are masked.
         *
         *  - Presentation: keeps text readable for a human or agent. Leading
         *    timestamps are dropped, long paths shortened to ".../file:line",
         *    UUIDs, hex addresses and long hashes replaced by <UUID>, <HEX>,
         *    <HASH>. Plain numbers survive.
         *  - Recurrence: maximal masking, used to group occurrences of the
         *    same error. Every timestamp, path, UUID, hex address, hash and
         *    standalone number is replaced by a placeholder.
         */
        enum class MaskingLevel
        {
            Presentation,
            Recurrence
        };

        const char *toString(MaskingLevel level) noexcept;

        /**
         * PatternNormalizer
         *
         * Responsibilities:
         *  - Rewrite a single log line into its normalized form.
         *  - Normalize blocks of context lines, dropping a long prefix
         *    shared by every line of the block (Presentation only).
         *
         * Design notes:
         *  - All regexes are compiled once into a process-wide immutable
         *    table on first use; afterwards every call is read-only and
         *    safe from any thread.
         *  - Presentation output is a fixed point: normalizing it again
         *    yields the same string.
         */
        class PatternNormalizer
        {
        public:
            /// Prefixes shorter than this are not worth eliding.
            static constexpr std::size_t kMinCommonPrefix = 20;

            /// Marker prepended to lines whose common prefix was removed.
            static constexpr std::string_view kElisionMarker = "... ";

            PatternNormalizer() = delete;

            /**
             * Normalize one line.
             *
             * Transform order: timestamps, UUIDs, hex addresses, then
             * paths/hashes (and numbers in Recurrence mode), then
             * whitespace collapsing and trimming.
             */
            static std::string normalize(std::string_view line, MaskingLevel level);

            /**
             * Normalize each line; in Presentation mode additionally replace
             * a common prefix of at least kMinCommonPrefix characters by
             * kElisionMarker. Output has the same length as the input.
             */
            static std::vector<std::string> normalizeLines(const std::vector<std::string> &lines,
                                                           MaskingLevel level);

            /**
             * Longest prefix shared by every line, or "" when there are fewer
             * than two lines or the shared prefix is shorter than kMinCommonPrefix.
             */
            static std::string findCommonPrefix(const std::vector<std::string> &lines);
        };

    } // namespace Analysis
} // namespace Triage
