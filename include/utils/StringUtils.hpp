#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace Triage
{
    namespace Utils
    {
        /**
         * String helpers shared by the normalizer, the JSON reader/writer,
         * the config loader and the manifest builder.
         *
         * All functions are stateless and thread-safe.
         */

        /// Trim whitespace (space, tab, CR, LF) from the left side of the string view.
        inline std::string_view ltrim(std::string_view sv) noexcept
        {
            const auto it = std::find_if_not(
                sv.begin(),
                sv.end(),
                [](unsigned char ch) { return std::isspace(ch) != 0; }
            );
            return sv.substr(static_cast<std::size_t>(it - sv.begin()));
        }

        /// Trim whitespace from the right side of the string view.
        inline std::string_view rtrim(std::string_view sv) noexcept
        {
            std::size_t end = sv.size();
            while (end > 0 && std::isspace(static_cast<unsigned char>(sv[end - 1])) != 0)
            {
                --end;
            }
            return sv.substr(0, end);
        }

        inline std::string_view trim(std::string_view sv) noexcept
        {
            return rtrim(ltrim(sv));
        }

        inline std::string toLower(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); }
            );
            return result;
        }

        inline std::string toUpper(std::string_view sv)
        {
            std::string result;
            result.reserve(sv.size());
            std::transform(
                sv.begin(),
                sv.end(),
                std::back_inserter(result),
                [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); }
            );
            return result;
        }

        /**
         * Safely parse an integer from a string_view.
         *
         * Returns std::nullopt if parsing fails or if there are
         * non-numeric trailing characters after trimming.
         */
        template <typename IntType>
        std::optional<IntType> parseInteger(std::string_view sv)
        {
            static_assert(std::is_integral<IntType>::value,
                          "parseInteger requires an integral type");

            sv = trim(sv);
            if (sv.empty())
            {
                return std::nullopt;
            }

            std::istringstream iss{std::string(sv)};
            IntType value{};
            iss >> value;

            if (!iss || !iss.eof())
            {
                return std::nullopt;
            }
            return value;
        }

        /// Floating-point counterpart of parseInteger().
        template <typename FloatType>
        std::optional<FloatType> parseFloat(std::string_view sv)
        {
            static_assert(std::is_floating_point<FloatType>::value,
                          "parseFloat requires a floating-point type");

            sv = trim(sv);
            if (sv.empty())
            {
                return std::nullopt;
            }

            std::istringstream iss{std::string(sv)};
            FloatType value{};
            iss >> value;

            if (!iss || !iss.eof())
            {
                return std::nullopt;
            }
            return value;
        }

        /**
         * Cap a string at maxLength bytes.
         *
         * Strings longer than maxLength keep their first (maxLength - 3)
         * bytes followed by "...", so the result is exactly maxLength long.
         * The cut moves back to the start of a UTF-8 sequence when it would
         * split one, making the result up to 3 bytes shorter.
         * Shorter strings are returned unchanged.
         */
        std::string truncateWithEllipsis(std::string_view sv, std::size_t maxLength);

        /**
         * Escape a string for embedding inside a JSON string literal.
         * Control characters below 0x20 become \uXXXX.
         */
        std::string escapeJson(std::string_view sv);

    } // namespace Utils
} // namespace Triage
