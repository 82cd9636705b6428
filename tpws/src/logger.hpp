#pragma once

#include <string>
#include <string_view>

namespace tpws {
    namespace log {

        enum class level {
            debug = 10,
            info = 20,
            warning = 30,
            error = 40,
            off = 100
        };

        enum class console {
            std_out,
            std_err,
            none
        };

        /// Where log lines go and which of them are kept.
        struct sink_config {
            level min_level = level::info;
            std::string file;   // empty disables file logging
            console stream = console::std_out;
        };

        /// Replace the active sinks. Throws std::runtime_error if the log file can't be opened.
        void configure(const sink_config& config);

        bool enabled(level lvl);

        void write(level lvl, std::string_view message);

        const char* level_name(level lvl);

        inline void debug(std::string_view message) { write(level::debug, message); }
        inline void info(std::string_view message) { write(level::info, message); }
        inline void warning(std::string_view message) { write(level::warning, message); }
        inline void error(std::string_view message) { write(level::error, message); }

    }
}
