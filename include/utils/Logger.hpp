#pragma once

#include <string>
#include <string_view>
#include <fstream>
#include <mutex>
#include <ostream>
#include <optional>

namespace Triage
{
    namespace Utils
    {
        /**
         * Log severity levels used across the triage pipeline.
         *
         *  - TRACE: per-finding decisions (dedup, capacity drops)
         *  - DEBUG: per-batch internals
         *  - INFO: pipeline flow (batch sizes, tier counts)
         *  - WARN: malformed input, index collisions
         *  - ERROR: unreadable inputs or outputs
         *  - CRITICAL: unrecoverable startup failures
         */
        enum class LogLevel
        {
            TRACE    = 0,
            DEBUG    = 1,
            INFO     = 2,
            WARN     = 3,
            ERROR    = 4,
            CRITICAL = 5,
        };

        /// Parse "info", "WARN", ... (case-insensitive). Returns std::nullopt on unknown names.
        std::optional<LogLevel> parseLogLevel(std::string_view name);

        /**
         * Logger
         *
         * Thread-safe logging facility shared by the classifier, the store,
         * the finding reader and the CLI.
         *
         * Line format: "[YYYY-MM-DD HH:MM:SS] [LEVEL] message"
         *
         * Sinks:
         *  - a console stream (stderr by default, so stdout stays clean for
         *    the JSON manifest)
         *  - an optional append-mode log file
         */
        class Logger
        {
        public:
            /// Logger writing to stderr only, INFO level.
            Logger();

            Logger(const Logger &)            = delete;
            Logger &operator=(const Logger &) = delete;

            ~Logger();

            void setLevel(LogLevel level) noexcept;
            LogLevel level() const noexcept;
            bool isEnabled(LogLevel level) const noexcept;

            /**
             * Redirect console output. Passing nullptr silences the console sink
             * (the file sink, if any, keeps working).
             */
            void setConsole(std::ostream *console) noexcept;

            /**
             * Open (or replace) the file sink in append mode.
             * Returns false if the file cannot be opened; console logging continues.
             */
            bool openFile(const std::string &filePath);

            /// Close the file sink, if open.
            void closeFile() noexcept;

            void log(LogLevel level, std::string_view message);

            void trace(std::string_view message)    { log(LogLevel::TRACE, message); }
            void debug(std::string_view message)    { log(LogLevel::DEBUG, message); }
            void info(std::string_view message)     { log(LogLevel::INFO,  message); }
            void warn(std::string_view message)     { log(LogLevel::WARN,  message); }
            void error(std::string_view message)    { log(LogLevel::ERROR, message); }
            void critical(std::string_view message) { log(LogLevel::CRITICAL, message); }

            static const char *toString(LogLevel level) noexcept;

        private:
            void writeLineUnlocked(std::string_view line);

        private:
            LogLevel           m_level;
            std::ofstream      m_file;
            std::ostream      *m_console;
            mutable std::mutex m_mutex;
        };

        /**
         * Process-wide logger (lazily constructed static).
         *
         *   Logger &log = getLogger();
         *   log.info("Classified 42 findings");
         */
        Logger &getLogger();

    } // namespace Utils
} // namespace Triage
