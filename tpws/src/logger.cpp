#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace tpws {
    namespace log {

        namespace {

            struct log_state {
                std::mutex lock;
                level min_level = level::info;
                console stream = console::std_out;
                std::ofstream file;
            };

            log_state& state() {
                static log_state s_state;
                return s_state;
            }

            std::string timestamp() {
                auto now = std::chrono::system_clock::now();
                std::time_t seconds = std::chrono::system_clock::to_time_t(now);
                auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()).count() % 1000;

                std::tm local{};
#ifdef _WIN32
                localtime_s(&local, &seconds);
#else
                localtime_r(&seconds, &local);
#endif
                char date[32];
                std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

                char result[40];
                std::snprintf(result, sizeof(result), "%s.%03d", date, static_cast<int>(millis));
                return result;
            }

        }

        void configure(const sink_config& config) {
            auto& s = state();
            std::lock_guard<std::mutex> lock(s.lock);

            if (s.file.is_open()) {
                s.file.close();
            }
            if (!config.file.empty()) {
                s.file.open(config.file, std::ios::out | std::ios::app);
                if (!s.file.is_open()) {
                    throw std::runtime_error("Could not open log file: " + config.file);
                }
            }

            s.min_level = config.min_level;
            s.stream = config.stream;
        }

        bool enabled(level lvl) {
            auto& s = state();
            std::lock_guard<std::mutex> lock(s.lock);
            return lvl >= s.min_level && s.min_level != level::off;
        }

        void write(level lvl, std::string_view message) {
            auto& s = state();
            std::lock_guard<std::mutex> lock(s.lock);

            if (s.min_level == level::off || lvl < s.min_level) {
                return;
            }

            std::string line = timestamp();
            line += " [";
            line += level_name(lvl);
            line += "] ";
            line.append(message.data(), message.size());
            line += '\n';

            if (s.stream != console::none) {
                std::FILE* out = (s.stream == console::std_err) ? stderr : stdout;
                std::fwrite(line.data(), 1, line.size(), out);
                std::fflush(out);
            }
            if (s.file.is_open()) {
                s.file << line;
                s.file.flush();
            }
        }

        const char* level_name(level lvl) {
            switch (lvl) {
            case level::debug:
                return "DEBUG";
            case level::info:
                return "INFO";
            case level::warning:
                return "WARNING";
            case level::error:
                return "ERROR";
            case level::off:
                break;
            }
            return "OFF";
        }

    }
}
