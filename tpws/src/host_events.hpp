#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace tpws {
    namespace host {

        /// Plugin settings flattened from TouchPortal's list of single-key objects.
        using settings_map = std::map<std::string, std::string>;

        /// One {id, value} entry of an action invocation.
        struct action_data {
            std::string id;
            std::string value;
        };

        /// TouchPortal accepted the pairing ("info" message).
        struct connect_event {
            std::string tp_version = "?";
            int tp_version_code = 0;
            int sdk_version = 0;
            std::string plugin_version = "?";
            settings_map settings;
            nlohmann::json raw;
        };

        /// The user changed plugin settings ("settings" message).
        struct setting_update_event {
            settings_map values;
            nlohmann::json raw;
        };

        /// The user triggered one of the plugin's actions ("action" message).
        /// An empty action_id or data list marks an incomplete invocation.
        struct action_event {
            std::string action_id;
            std::vector<action_data> data;
            nlohmann::json raw;
        };

        /// TouchPortal asked the plugin to exit ("closePlugin" message).
        struct shutdown_event {
            nlohmann::json raw;
        };

        /// An event handler threw.
        struct error_event {
            std::string what;
        };

        using host_event = std::variant<connect_event,
                                        setting_update_event,
                                        action_event,
                                        shutdown_event,
                                        error_event>;

    }
}
