#include "plugin_entry.hpp"

#include <format>
#include <fstream>
#include <stdexcept>

namespace tpws {

    namespace {

        nlohmann::json text_data(const std::string& id, const std::string& label)
        {
            // clang-format off
            return
            {
                { "id", id },
                { "type", "text" },
                { "label", label },
                { "default", "<None>" }
            };
            // clang-format on
        }

        nlohmann::json send_message_action()
        {
            std::string format = std::format("Send the text string {{${}$}} to {{${}$}}",
                                             actions::s_send_message_message,
                                             actions::s_send_message_destination);

            // clang-format off
            return
            {
                { "id", actions::s_send_message },
                { "name", "Send Message" },
                { "prefix", s_plugin_name },
                { "type", "communicate" },
                { "tryInline", true },
                { "format", format },
                { "data", nlohmann::json::array({
                    text_data(actions::s_send_message_destination, "Destination"),
                    text_data(actions::s_send_message_message, "Message")
                }) }
            };
            // clang-format on
        }

    }

    nlohmann::json build_entry_tp()
    {
        // clang-format off
        nlohmann::json setting =
        {
            { "name", settings::s_example },
            { "type", "text" },
            { "default", settings::s_example_default },
            { "readOnly", false }
        };

        nlohmann::json category =
        {
            { "id", categories::s_main },
            { "name", s_plugin_name },
            { "actions", nlohmann::json::array({ send_message_action() }) },
            { "states", nlohmann::json::array() },
            { "events", nlohmann::json::array() }
        };

        nlohmann::json entry =
        {
            { "sdk", s_sdk_version },
            { "version", s_plugin_version_code },
            { "name", s_plugin_name },
            { "id", s_plugin_id },
            { "plugin_start_cmd", s_plugin_start_cmd },
            { "configuration",
                {
                    { "colorDark", s_color_dark },
                    { "colorLight", s_color_light }
                }
            },
            { "settings", nlohmann::json::array({ setting }) },
            { "categories", nlohmann::json::array({ category }) }
        };
        // clang-format on

        return entry;
    }

    void write_entry_tp(const std::string& path)
    {
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("Could not open " + path + " for writing");
        }

        out << build_entry_tp().dump(4) << '\n';
        if (!out) {
            throw std::runtime_error("Failed writing " + path);
        }
    }

}
