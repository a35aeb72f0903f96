#include "utils/ConfigLoader.hpp"

#include <fstream>

#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

namespace Triage
{
    namespace Utils
    {
        bool ConfigLoader::loadFromFile(const std::string &filePath)
        {
            std::ifstream in(filePath);
            if (!in.is_open())
            {
                getLogger().warn("Config file not readable: " + filePath);
                return false;
            }

            loadFromStream(in);
            getLogger().debug("Loaded " + std::to_string(size()) + " config keys from " + filePath);
            return true;
        }

        void ConfigLoader::loadFromStream(std::istream &in)
        {
            std::unordered_map<std::string, std::string> newValues;

            std::string line;
            std::size_t lineNo = 0;
            while (std::getline(in, line))
            {
                ++lineNo;
                const std::string_view content = trim(line);
                if (content.empty() || content.front() == '#' || content.front() == ';')
                {
                    continue;
                }

                const auto pos = content.find('=');
                if (pos == std::string_view::npos)
                {
                    getLogger().warn("Config line " + std::to_string(lineNo) + " has no '=', skipped");
                    continue;
                }

                const std::string_view key   = trim(content.substr(0, pos));
                const std::string_view value = trim(content.substr(pos + 1));
                if (key.empty())
                {
                    continue;
                }

                newValues[std::string(key)] = std::string(value);
            }

            std::lock_guard<std::mutex> lock(m_mutex);
            m_values = std::move(newValues);
        }

        void ConfigLoader::set(std::string key, std::string value)
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_values[std::move(key)] = std::move(value);
        }

        bool ConfigLoader::hasKey(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.find(std::string(key)) != m_values.end();
        }

        std::size_t ConfigLoader::size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_values.size();
        }

        std::optional<std::string> ConfigLoader::getRawUnlocked(std::string_view key) const
        {
            auto it = m_values.find(std::string(key));
            if (it == m_values.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::string> ConfigLoader::getString(std::string_view key) const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return getRawUnlocked(key);
        }

        std::string ConfigLoader::getStringOr(std::string_view key,
                                              std::string_view defaultValue) const
        {
            auto v = getString(key);
            return v ? *v : std::string(defaultValue);
        }

        std::optional<int> ConfigLoader::getInt(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }

            auto parsed = parseInteger<int>(*v);
            if (!parsed)
            {
                getLogger().warn("Config key '" + std::string(key) + "' is not an integer: " + *v);
            }
            return parsed;
        }

        int ConfigLoader::getIntOr(std::string_view key, int defaultValue) const
        {
            auto v = getInt(key);
            return v ? *v : defaultValue;
        }

        std::optional<bool> ConfigLoader::getBool(std::string_view key) const
        {
            auto v = getString(key);
            if (!v)
            {
                return std::nullopt;
            }

            const std::string s = toLower(trim(*v));
            if (s == "1" || s == "true" || s == "yes" || s == "on")
            {
                return true;
            }
            if (s == "0" || s == "false" || s == "no" || s == "off")
            {
                return false;
            }

            getLogger().warn("Config key '" + std::string(key) + "' is not a boolean: " + *v);
            return std::nullopt;
        }

        bool ConfigLoader::getBoolOr(std::string_view key, bool defaultValue) const
        {
            auto v = getBool(key);
            return v ? *v : defaultValue;
        }

    } // namespace Utils
} // namespace Triage
