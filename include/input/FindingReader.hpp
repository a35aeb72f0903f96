#pragma once

#include <cstddef>
#include <fstream>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "core/Finding.hpp"
#include "input/FindingParser.hpp"

namespace Triage
{
    namespace Input
    {
        /**
         * FindingReader
         *
         * Responsibilities:
         *  - Stream findings out of a JSONL file (or any std::istream), one
         *    JSON object per line.
         *  - Skip blank lines silently and malformed lines with a WARN entry.
         *  - Keep per-source counters for the final summary log line.
         *
         * Design notes:
         *  - Owns its std::ifstream when opened from a path (RAII); borrows
         *    the stream otherwise, which must outlive the reader.
         *  - Not copyable; single-threaded ownership.
         */
        class FindingReader
        {
        public:
            struct Stats
            {
                std::size_t lines     = 0;
                std::size_t findings  = 0;
                std::size_t malformed = 0;
            };

            /// Reader over a borrowed stream (stdin, a test stringstream, ...).
            explicit FindingReader(std::istream &input);

            /// Reader over a file; check isOpen() before reading.
            explicit FindingReader(const std::string &filePath);

            FindingReader(const FindingReader &)            = delete;
            FindingReader &operator=(const FindingReader &) = delete;

            bool isOpen() const noexcept;

            /// Next well-formed finding; std::nullopt at end of input.
            std::optional<core::RawFinding> next();

            /// Remaining well-formed findings, in input order.
            std::vector<core::RawFinding> readAll();

            const Stats &stats() const noexcept { return m_stats; }

        private:
            std::optional<std::string> nextLine();

        private:
            std::ifstream  m_file;
            std::istream  *m_input;
            std::string    m_source;
            FindingParser  m_parser;
            Stats          m_stats;
        };

    } // namespace Input
} // namespace Triage
