#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "host_events.hpp"
#include "message_dispatch.hpp"

namespace tpws {

    /// Destination and message of one Send Message invocation.
    struct send_message_fields {
        std::string destination;
        std::string message;
    };

    /// Linear scan of the action data. Missing fields stay empty; a repeated id keeps the last value.
    send_message_fields extract_send_message_fields(const std::vector<host::action_data>& data);

    /// Handlers for everything TouchPortal sends the plugin.
    class websockets_plugin {
    public:
        explicit websockets_plugin(dispatch::ws_connection_factory& connections);

        /// Entry point for the host link. Dispatch failures propagate to the caller.
        void handle_event(const host::host_event& event);

        void on_connect(const host::connect_event& event);
        void on_setting_update(const host::setting_update_event& event);
        void on_action(const host::action_event& event);
        void on_shutdown(const host::shutdown_event& event);
        void on_error(const host::error_event& event);

        /// Last value TouchPortal sent for "Example Setting", if any.
        std::optional<std::string> example_setting() const;

    private:
        void apply_settings(const host::settings_map& values);

        dispatch::ws_connection_factory& m_connections;

        mutable std::mutex m_lock;
        std::optional<std::string> m_example_setting;
    };

}
