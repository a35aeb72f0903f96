#include "input/FindingReader.hpp"

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Triage
{
    namespace Input
    {
        FindingReader::FindingReader(std::istream &input)
            : m_file(),
              m_input(&input),
              m_source("<stream>")
        {
        }

        FindingReader::FindingReader(const std::string &filePath)
            : m_file(filePath, std::ios::in),
              m_input(nullptr),
              m_source(filePath)
        {
            if (m_file.is_open())
            {
                m_input = &m_file;
            }
            else
            {
                Utils::getLogger().error("Cannot open findings file: " + filePath);
            }
        }

        bool FindingReader::isOpen() const noexcept
        {
            return m_input != nullptr;
        }

        std::optional<std::string> FindingReader::nextLine()
        {
            if (!m_input)
            {
                return std::nullopt;
            }

            std::string line;
            if (!std::getline(*m_input, line))
            {
                return std::nullopt;
            }

            // Drop trailing '\r' for Windows-style line endings.
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }

            ++m_stats.lines;
            return line;
        }

        std::optional<core::RawFinding> FindingReader::next()
        {
            while (auto line = nextLine())
            {
                if (Utils::trim(*line).empty())
                {
                    continue;
                }

                auto result = m_parser.parseLine(*line);
                if (result.finding)
                {
                    ++m_stats.findings;
                    return std::move(result.finding);
                }

                ++m_stats.malformed;
                Utils::getLogger().warn(m_source + ":" + std::to_string(m_stats.lines)
                                        + ": skipped malformed finding: " + result.error);
            }
            return std::nullopt;
        }

        std::vector<core::RawFinding> FindingReader::readAll()
        {
            std::vector<core::RawFinding> findings;
            while (auto finding = next())
            {
                findings.push_back(std::move(*finding));
            }

            Utils::getLogger().info("Read " + std::to_string(m_stats.findings) + " findings from "
                                    + m_source + " (" + std::to_string(m_stats.malformed) + " malformed)");
            return findings;
        }

    } // namespace Input
} // namespace Triage
