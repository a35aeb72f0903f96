#pragma once

#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Triage
{
    namespace Utils
    {
        /**
         * ConfigLoader
         *
         * Responsibilities:
         *  - Load a "key = value" configuration file for the triage tool.
         *  - Provide typed getters with defaults, so a missing or bad key
         *    never stops a triage run.
         *
         * Format:
         *  - Lines starting with '#' or ';' are comments; blank lines are ignored.
         *  - Whitespace around key and value is trimmed.
         *  - Later occurrences of a key win.
         *  - Lines without '=' are skipped with a WARN log entry.
         *
         * Example:
         *   default_limit          = 20
         *   tier1_pre_context      = 10
         *   summary_message_limit  = 100
         *   log_level              = INFO
         */
        class ConfigLoader
        {
        public:
            ConfigLoader() = default;

            ConfigLoader(const ConfigLoader &)            = delete;
            ConfigLoader &operator=(const ConfigLoader &) = delete;

            /**
             * Load configuration from a file path.
             * Returns false if the file cannot be opened; existing values are kept.
             */
            bool loadFromFile(const std::string &filePath);

            /// Replace the current values with the ones parsed from `in`.
            void loadFromStream(std::istream &in);

            void set(std::string key, std::string value);

            bool hasKey(std::string_view key) const;

            std::optional<std::string> getString(std::string_view key) const;
            std::string getStringOr(std::string_view key, std::string_view defaultValue) const;

            /// Integer value; std::nullopt if missing or not a whole number.
            std::optional<int> getInt(std::string_view key) const;
            int getIntOr(std::string_view key, int defaultValue) const;

            /**
             * Boolean value; std::nullopt if missing or unrecognized.
             * True: "1", "true", "yes", "on". False: "0", "false", "no", "off".
             */
            std::optional<bool> getBool(std::string_view key) const;
            bool getBoolOr(std::string_view key, bool defaultValue) const;

            std::size_t size() const;

        private:
            std::optional<std::string> getRawUnlocked(std::string_view key) const;

        private:
            std::unordered_map<std::string, std::string> m_values;
            mutable std::mutex m_mutex;
        };

    } // namespace Utils
} // namespace Triage
