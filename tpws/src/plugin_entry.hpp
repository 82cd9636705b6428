#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace tpws {

    // The plugin id is also the prefix of every other id TouchPortal sees.
    constexpr const char* s_plugin_id = "tp.plugin.websockets.python";
    constexpr const char* s_plugin_name = "Websockets";
    constexpr const char* s_plugin_version = "1.0";
    constexpr int s_plugin_version_code = 100;
    constexpr int s_sdk_version = 3;

    constexpr const char* s_plugin_start_cmd = "%TP_PLUGIN_FOLDER%TPWebsockets/tp-websockets @config.txt";
    constexpr const char* s_color_dark = "#25274c";
    constexpr const char* s_color_light = "#707ab5";

    namespace categories {
        constexpr const char* s_main = "tp.plugin.websockets.python.main";
    }

    namespace actions {
        constexpr const char* s_send_message = "tp.plugin.websockets.python.act.sendmessage";
        constexpr const char* s_send_message_destination = "tp.plugin.websockets.python.act.sendmessage.data.destination";
        constexpr const char* s_send_message_message = "tp.plugin.websockets.python.act.sendmessage.data.message";
    }

    namespace settings {
        constexpr const char* s_example = "Example Setting";
        constexpr const char* s_example_default = "Example value";
    }

    /// Build the entry.tp document TouchPortal uses to generate the plugin's UI.
    nlohmann::json build_entry_tp();

    /// Write entry.tp to a file. Throws std::runtime_error if the file can't be written.
    void write_entry_tp(const std::string& path);

}
