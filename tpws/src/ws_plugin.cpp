#include "ws_plugin.hpp"

#include <format>
#include <variant>

#include "logger.hpp"
#include "plugin_entry.hpp"

namespace tpws {

    namespace {

        template <typename... Handlers>
        struct overloaded : Handlers... {
            using Handlers::operator()...;
        };

        template <typename... Handlers>
        overloaded(Handlers...) -> overloaded<Handlers...>;

    }

    send_message_fields extract_send_message_fields(const std::vector<host::action_data>& data)
    {
        send_message_fields fields;
        for (const auto& entry : data) {
            if (entry.id == actions::s_send_message_destination) {
                fields.destination = entry.value;
            } else if (entry.id == actions::s_send_message_message) {
                fields.message = entry.value;
            }
        }
        return fields;
    }

    websockets_plugin::websockets_plugin(dispatch::ws_connection_factory& connections)
        : m_connections(connections)
    {
    }

    void websockets_plugin::handle_event(const host::host_event& event)
    {
        std::visit(overloaded{
                       [this](const host::connect_event& e) { on_connect(e); },
                       [this](const host::setting_update_event& e) { on_setting_update(e); },
                       [this](const host::action_event& e) { on_action(e); },
                       [this](const host::shutdown_event& e) { on_shutdown(e); },
                       [this](const host::error_event& e) { on_error(e); },
                   },
                   event);
    }

    void websockets_plugin::on_connect(const host::connect_event& event)
    {
        log::info(std::format("Connected to TP v{}, plugin v{}.", event.tp_version, event.plugin_version));
        if (log::enabled(log::level::debug)) {
            log::debug("Connection: " + event.raw.dump());
        }

        if (!event.settings.empty()) {
            apply_settings(event.settings);
        }
    }

    void websockets_plugin::on_setting_update(const host::setting_update_event& event)
    {
        if (log::enabled(log::level::debug)) {
            log::debug("Settings: " + event.raw.dump());
        }

        if (!event.values.empty()) {
            apply_settings(event.values);
        }
    }

    void websockets_plugin::on_action(const host::action_event& event)
    {
        if (log::enabled(log::level::debug)) {
            log::debug("Action: " + event.raw.dump());
        }

        if (event.action_id.empty() || event.data.empty()) {
            return;
        }

        if (event.action_id != actions::s_send_message) {
            log::warning("Got unknown action ID: " + event.action_id);
            return;
        }

        send_message_fields fields = extract_send_message_fields(event.data);
        log::info(std::format("Sending message to {} ({} bytes)", fields.destination, fields.message.size()));

        dispatch::send_message(m_connections, fields.destination, fields.message);
    }

    void websockets_plugin::on_shutdown(const host::shutdown_event&)
    {
        log::info("Received shutdown event from TP Client.");
    }

    void websockets_plugin::on_error(const host::error_event& event)
    {
        log::error("Error in TP Client event handler: " + event.what);
    }

    std::optional<std::string> websockets_plugin::example_setting() const
    {
        std::lock_guard<std::mutex> lock(m_lock);
        return m_example_setting;
    }

    void websockets_plugin::apply_settings(const host::settings_map& values)
    {
        auto it = values.find(settings::s_example);
        if (it == values.end()) {
            return;
        }

        std::lock_guard<std::mutex> lock(m_lock);
        m_example_setting = it->second;
    }

}
