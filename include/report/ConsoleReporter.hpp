#pragma once

#include <cstddef>
#include <iostream>
#include <string>

#include "core/Manifest.hpp"

namespace Triage
{
    namespace Report
    {
        /**
         * ConsoleReporter
         *
         * Responsibilities:
         *  - Human-readable rendering of a triage manifest
         *  - Tier-coded colors when writing to a terminal
         *
         * Design notes:
         *  - Writes to std::cout unless another stream is given
         *  - Colors are auto-detected from stdout being a TTY
         */
        class ConsoleReporter
        {
        public:
            enum class Verbosity
            {
                NORMAL,   // Build header + tier-1 messages + summaries
                VERBOSE   // Also tier-1 context lines
            };

            explicit ConsoleReporter(Verbosity verbosity = Verbosity::NORMAL,
                                     std::ostream &output = std::cout);

            void printManifest(const core::Manifest &manifest);

            void setVerbosity(Verbosity level) noexcept;
            void setEnableColors(bool enable) noexcept;

        private:
            static const char *tierColor(core::Tier tier) noexcept;

            void printTier1(const core::ClassifiedFinding &finding, std::size_t index);
            void printSummary(const core::FindingSummary &summary);

        private:
            Verbosity     m_verbosity;
            bool          m_colorsEnabled;
            std::ostream *m_output;
        };

    } // namespace Report
} // namespace Triage
