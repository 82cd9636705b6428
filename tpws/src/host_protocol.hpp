#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "host_events.hpp"

namespace tpws {
    namespace host {

        constexpr const char* s_default_host = "127.0.0.1";
        constexpr unsigned short s_default_port = 12136;

        namespace message_types {
            constexpr const char* s_pair = "pair";
            constexpr const char* s_info = "info";
            constexpr const char* s_settings = "settings";
            constexpr const char* s_action = "action";
            constexpr const char* s_close_plugin = "closePlugin";
        }

        /// First message a plugin sends after connecting.
        nlohmann::json make_pair_message(std::string_view plugin_id);

        /// Text form of an action or setting value. Strings are returned as-is, null as empty.
        std::string value_to_string(const nlohmann::json& value);

        /// [{"name": "value"}, ...] -> {name: value}. null values are left out, and anything that
        /// isn't a list gives an empty map.
        settings_map flatten_settings(const nlohmann::json& settings);

        /// Action "data" list in order. Entries without an id keep an empty id.
        std::vector<action_data> parse_action_data(const nlohmann::json& data);

        /// Decode one inbound message. Returns nullopt for message types the plugin doesn't
        /// handle and, when plugin_id is non-empty, for messages addressed to another plugin.
        std::optional<host_event> decode_message(const nlohmann::json& message, std::string_view plugin_id);

    }
}
