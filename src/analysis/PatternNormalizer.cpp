#include "analysis/PatternNormalizer.hpp"

#include <algorithm>
#include <regex>

#include "utils/StringUtils.hpp"

namespace Triage
{
    namespace Analysis
    {
        namespace
        {
            constexpr auto kRegexFlags = std::regex::ECMAScript | std::regex::optimize;

            // Leading timestamps closer than this to the start of the line are
            // treated as a log prefix and dropped in Presentation mode.
            constexpr std::ptrdiff_t kLeadingTimestampWindow = 5;

            struct PatternTable
            {
                std::regex timestamp  { R"(\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2}([.,]\d+)?(Z|[+-]\d{2}:?\d{2})?)", kRegexFlags };
                std::regex uuid       { R"(\b[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}\b)", kRegexFlags };
                std::regex hexAddress { R"(\b0x[0-9a-fA-F]+\b)", kRegexFlags };
                std::regex longHash   { R"(\b[a-f0-9]{12,}\b)", kRegexFlags };
                std::regex number     { R"(\b\d+\b)", kRegexFlags };
                // Three or more directories, then the file name with an optional :line.
                std::regex longPath   { R"(/(?:[^/\s]+/){3,}([^/\s:]+(?::\d+)?))", kRegexFlags };
                std::regex whitespace { R"(\s+)", kRegexFlags };
            };

            const PatternTable &patterns()
            {
                static const PatternTable table;
                return table;
            }

            std::string collapseWhitespace(const std::string &line)
            {
                const std::string collapsed = std::regex_replace(line, patterns().whitespace, " ");
                return std::string(Utils::trim(collapsed));
            }

            // Drop timestamps sitting at the very start of the line, repeatedly,
            // so "ts1 ts2 msg" and "ts2 msg" normalize alike.
            std::string stripLeadingTimestamps(std::string line)
            {
                std::smatch match;
                while (std::regex_search(line, match, patterns().timestamp)
                       && match.position(0) < kLeadingTimestampWindow)
                {
                    line = std::string(Utils::trim(match.suffix().str()));
                }
                return line;
            }

            std::string normalizePresentation(std::string line)
            {
                const PatternTable &p = patterns();

                // Collapse first so the leading-timestamp window sees the same
                // offsets on the first and on any later pass.
                line = collapseWhitespace(line);
                line = stripLeadingTimestamps(std::move(line));
                line = std::regex_replace(line, p.uuid, "<UUID>");
                line = std::regex_replace(line, p.hexAddress, "<HEX>");
                line = std::regex_replace(line, p.longPath, ".../$1");
                line = std::regex_replace(line, p.longHash, "<HASH>");
                return collapseWhitespace(line);
            }

            std::string normalizeRecurrence(std::string line)
            {
                const PatternTable &p = patterns();

                line = std::regex_replace(line, p.timestamp, "[TIMESTAMP]");
                line = std::regex_replace(line, p.uuid, "[UUID]");
                line = std::regex_replace(line, p.hexAddress, "[HEX]");
                line = std::regex_replace(line, p.longPath, "[PATH]");
                line = std::regex_replace(line, p.longHash, "<HASH>");
                line = std::regex_replace(line, p.number, "[NUM]");
                return collapseWhitespace(line);
            }
        } // anonymous namespace

        const char *toString(MaskingLevel level) noexcept
        {
            switch (level)
            {
            case MaskingLevel::Presentation: return "presentation";
            case MaskingLevel::Recurrence:   return "recurrence";
            }
            return "unknown";
        }

        std::string PatternNormalizer::normalize(std::string_view line, MaskingLevel level)
        {
            if (level == MaskingLevel::Recurrence)
            {
                return normalizeRecurrence(std::string(line));
            }
            return normalizePresentation(std::string(line));
        }

        std::vector<std::string> PatternNormalizer::normalizeLines(const std::vector<std::string> &lines,
                                                                   MaskingLevel level)
        {
            std::vector<std::string> normalized;
            normalized.reserve(lines.size());
            for (const auto &line : lines)
            {
                normalized.push_back(normalize(line, level));
            }

            if (level != MaskingLevel::Presentation)
            {
                return normalized;
            }

            const std::string prefix = findCommonPrefix(normalized);
            if (prefix.empty())
            {
                return normalized;
            }

            for (auto &line : normalized)
            {
                line = std::string(kElisionMarker) + line.substr(prefix.size());
            }
            return normalized;
        }

        std::string PatternNormalizer::findCommonPrefix(const std::vector<std::string> &lines)
        {
            if (lines.size() < 2)
            {
                return {};
            }

            std::size_t length = lines.front().size();
            for (std::size_t i = 1; i < lines.size() && length > 0; ++i)
            {
                const std::string &line = lines[i];
                std::size_t common = 0;
                const std::size_t limit = std::min(length, line.size());
                while (common < limit && line[common] == lines.front()[common])
                {
                    ++common;
                }
                length = common;
            }

            if (length < kMinCommonPrefix)
            {
                return {};
            }
            return lines.front().substr(0, length);
        }

    } // namespace Analysis
} // namespace Triage
