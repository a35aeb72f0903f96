#include "utils/StringUtils.hpp"

namespace
{
    char toHex(unsigned int v) noexcept
    {
        return static_cast<char>(v < 10 ? ('0' + v) : ('A' + (v - 10)));
    }
}

namespace Triage
{
    namespace Utils
    {
        std::string truncateWithEllipsis(std::string_view sv, std::size_t maxLength)
        {
            if (sv.size() <= maxLength)
            {
                return std::string(sv);
            }
            if (maxLength < 3)
            {
                return std::string(sv.substr(0, maxLength));
            }

            // Back off to a UTF-8 lead byte so no sequence is split.
            std::size_t cut = maxLength - 3;
            while (cut > 0 && (static_cast<unsigned char>(sv[cut]) & 0xC0) == 0x80)
            {
                --cut;
            }

            std::string out(sv.substr(0, cut));
            out += "...";
            return out;
        }

        std::string escapeJson(std::string_view sv)
        {
            std::string out;
            out.reserve(sv.size() + 8);

            for (char ch : sv)
            {
                const unsigned char c = static_cast<unsigned char>(ch);
                switch (ch)
                {
                case '\"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\b': out += "\\b";  break;
                case '\f': out += "\\f";  break;
                case '\n': out += "\\n";  break;
                case '\r': out += "\\r";  break;
                case '\t': out += "\\t";  break;
                default:
                    if (c < 0x20)
                    {
                        out += "\\u00";
                        out.push_back(toHex((c >> 4) & 0x0F));
                        out.push_back(toHex(c & 0x0F));
                    }
                    else
                    {
                        out.push_back(ch);
                    }
                    break;
                }
            }

            return out;
        }

    } // namespace Utils
} // namespace Triage
