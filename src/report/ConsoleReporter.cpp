#include "report/ConsoleReporter.hpp"

#include <cstdio>
#include <iomanip>

#if defined(_WIN32)
  #include <io.h>      // _isatty, _fileno
#else
  #include <unistd.h>  // isatty, fileno
#endif

namespace Triage
{
namespace Report
{
    namespace
    {
        bool stdoutIsTty() noexcept
        {
        #if defined(_WIN32)
            return _isatty(_fileno(stdout)) != 0;
        #else
            return ::isatty(::fileno(stdout)) != 0;
        #endif
        }

        constexpr const char *kReset = "\033[0m";
    } // namespace

    ConsoleReporter::ConsoleReporter(Verbosity verbosity, std::ostream &output)
        : m_verbosity(verbosity),
          m_colorsEnabled(&output == &std::cout && stdoutIsTty()),
          m_output(&output)
    {
    }

    void ConsoleReporter::printManifest(const core::Manifest &manifest)
    {
        const core::BuildInfo &build = manifest.build;

        *m_output << "\n=== BUILD TRIAGE ===\n";
        *m_output << "Request:      " << manifest.requestId << "\n";
        if (!build.url.empty())
            *m_output << "Build:        " << build.url << "\n";
        if (!build.status.empty())
            *m_output << "Status:       " << build.status << "\n";
        *m_output << "Failed jobs:  " << build.failedJobs.size() << "\n";
        *m_output << "Passed jobs:  " << build.passedJobsCount << "\n";
        *m_output << "Timestamp:    " << build.timestamp << "\n\n";

        if (manifest.tier1Findings.empty())
        {
            *m_output << "No unique failures found.\n";
        }
        else
        {
            *m_output << "Unique failures (" << manifest.tier1Findings.size() << ")\n";
            *m_output << std::string(70, '-') << "\n";
            for (std::size_t i = 0; i < manifest.tier1Findings.size(); ++i)
            {
                printTier1(manifest.tier1Findings[i], i + 1);
            }
        }

        if (!manifest.otherFindings.empty())
        {
            *m_output << "\nOther findings (" << manifest.otherFindings.size() << ")\n";
            *m_output << std::string(70, '-') << "\n";
            for (const auto &summary : manifest.otherFindings)
            {
                printSummary(summary);
            }
        }

        *m_output << "=== END TRIAGE ===\n\n";
        m_output->flush();
    }

    void ConsoleReporter::setVerbosity(Verbosity level) noexcept
    {
        m_verbosity = level;
    }

    void ConsoleReporter::setEnableColors(bool enable) noexcept
    {
        m_colorsEnabled = enable;
    }

    // ---- Private helpers ----

    const char *ConsoleReporter::tierColor(core::Tier tier) noexcept
    {
        switch (tier)
        {
        case core::Tier::UniqueFailure:  return "\033[91m"; // bright red
        case core::Tier::FrequencySpike: return "\033[93m"; // yellow
        case core::Tier::CommonNoise:    return "\033[90m"; // grey
        }
        return "";
    }

    void ConsoleReporter::printTier1(const core::ClassifiedFinding &finding, std::size_t index)
    {
        const char *color = m_colorsEnabled ? tierColor(finding.tier) : "";
        const char *reset = m_colorsEnabled ? kReset : "";

        *m_output << "#" << index << " [" << finding.severity << "] "
                  << "[conf=" << std::fixed << std::setprecision(2) << finding.confidence << "] "
                  << finding.jobName << "  (" << finding.id << ")\n";
        *m_output << "  " << color << finding.message << reset << "\n";

        if (m_verbosity == Verbosity::VERBOSE)
        {
            for (const auto &line : finding.preContext)
                *m_output << "    | " << line << "\n";
            *m_output << "    > " << finding.message << "\n";
            for (const auto &line : finding.postContext)
                *m_output << "    | " << line << "\n";
        }
        *m_output << "\n";
    }

    void ConsoleReporter::printSummary(const core::FindingSummary &summary)
    {
        const char *color = m_colorsEnabled ? tierColor(summary.tier) : "";
        const char *reset = m_colorsEnabled ? kReset : "";

        *m_output << color << "[T" << core::tierNumber(summary.tier) << "] " << reset
                  << std::left << std::setw(12) << summary.jobName << " "
                  << summary.message << "  (" << summary.id << ")\n";
        *m_output << std::right;
    }

} // namespace Report
} // namespace Triage
