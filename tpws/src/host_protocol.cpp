#include "host_protocol.hpp"

#include "logger.hpp"

namespace tpws {
    namespace host {

        namespace {

            std::string text_field(const nlohmann::json& message, const char* key, const std::string& fallback)
            {
                auto it = message.find(key);
                if (it == message.end() || it->is_null()) {
                    return fallback;
                }
                return value_to_string(*it);
            }

            int int_field(const nlohmann::json& message, const char* key)
            {
                auto it = message.find(key);
                if (it == message.end() || !it->is_number_integer()) {
                    return 0;
                }
                return it->get<int>();
            }

            nlohmann::json member_or_null(const nlohmann::json& message, const char* key)
            {
                auto it = message.find(key);
                return it == message.end() ? nlohmann::json() : *it;
            }

        }

        nlohmann::json make_pair_message(std::string_view plugin_id)
        {
            // clang-format off
            return
            {
                { "type", message_types::s_pair },
                { "id", std::string(plugin_id) }
            };
            // clang-format on
        }

        std::string value_to_string(const nlohmann::json& value)
        {
            if (value.is_string()) {
                return value.get<std::string>();
            }
            if (value.is_null()) {
                return std::string();
            }
            if (value.is_boolean()) {
                return value.get<bool>() ? "true" : "false";
            }
            return value.dump();
        }

        settings_map flatten_settings(const nlohmann::json& settings)
        {
            settings_map flattened;
            if (!settings.is_array()) {
                return flattened;
            }

            for (const auto& entry : settings) {
                if (!entry.is_object()) {
                    continue;
                }
                for (auto it = entry.begin(); it != entry.end(); ++it) {
                    // null means "no value", not an empty one
                    if (it.value().is_null()) {
                        continue;
                    }
                    flattened[it.key()] = value_to_string(it.value());
                }
            }
            return flattened;
        }

        std::vector<action_data> parse_action_data(const nlohmann::json& data)
        {
            std::vector<action_data> fields;
            if (!data.is_array()) {
                return fields;
            }

            for (const auto& entry : data) {
                if (!entry.is_object()) {
                    continue;
                }
                fields.push_back({ text_field(entry, "id", ""), text_field(entry, "value", "") });
            }
            return fields;
        }

        std::optional<host_event> decode_message(const nlohmann::json& message, std::string_view plugin_id)
        {
            if (!message.is_object()) {
                log::debug("Ignoring message that is not a JSON object: " + message.dump());
                return std::nullopt;
            }

            auto target = message.find("pluginId");
            if (!plugin_id.empty() && target != message.end() && target->is_string() &&
                target->get<std::string>() != plugin_id) {
                log::debug("Ignoring message for plugin " + target->get<std::string>());
                return std::nullopt;
            }

            std::string type = text_field(message, "type", "");

            if (type == message_types::s_info) {
                connect_event event;
                event.tp_version = text_field(message, "tpVersionString", "?");
                event.tp_version_code = int_field(message, "tpVersionCode");
                event.sdk_version = int_field(message, "sdkVersion");
                event.plugin_version = text_field(message, "pluginVersion", "?");
                event.settings = flatten_settings(member_or_null(message, "settings"));
                event.raw = message;
                return event;
            }

            if (type == message_types::s_settings) {
                setting_update_event event;
                event.values = flatten_settings(member_or_null(message, "values"));
                event.raw = message;
                return event;
            }

            if (type == message_types::s_action) {
                action_event event;
                event.action_id = text_field(message, "actionId", "");
                event.data = parse_action_data(member_or_null(message, "data"));
                event.raw = message;
                return event;
            }

            if (type == message_types::s_close_plugin) {
                return shutdown_event{ message };
            }

            log::debug("Unhandled message type: " + (type.empty() ? std::string("<none>") : type));
            return std::nullopt;
        }

    }
}
