#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include "host_events.hpp"
#include "host_protocol.hpp"

namespace tpws {
    namespace host {

        class host_link_error : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
        };

        /// Longest inbound line kept; anything longer is dropped as malformed.
        constexpr std::size_t s_max_line_size = 1024 * 1024;

        struct link_options {
            std::string plugin_id;
            std::string host = s_default_host;
            unsigned short port = s_default_port;
            std::size_t max_workers = 4;
            std::size_t max_line_size = s_max_line_size;
            bool auto_close = true;        // disconnect after handling closePlugin
            bool check_plugin_id = true;   // drop messages addressed to other plugins
            bool handle_signals = false;   // disconnect on SIGINT/SIGTERM
        };

        /// Control connection to the TouchPortal plugin socket.
        ///
        /// Messages are newline-delimited JSON. Each decoded event is handed to the event
        /// handler on a fixed pool of worker threads, so handlers may run concurrently.
        /// An exception thrown by a handler is delivered once as an error_event.
        class host_link {
        public:
            using event_handler = std::function<void(const host_event&)>;

            explicit host_link(link_options options);
            ~host_link();

            host_link(const host_link&) = delete;
            host_link& operator=(const host_link&) = delete;

            /// Must be set before connect().
            void set_event_handler(event_handler handler);

            /// Connect, pair and process messages until disconnected. Waits for running
            /// handlers before returning. A link connects once.
            /// Throws host_link_error if the connection can't be made or fails.
            void connect();

            /// Close the control connection. Safe from any thread, and more than once.
            void disconnect();

            bool is_connected() const;

        private:
            void start_read();
            void on_read(const asio::error_code& error_code, std::size_t bytes);
            void handle_line(std::string_view line);
            void dispatch(host_event event);
            void run_handler(const host_event& event);
            void close_socket();

            link_options m_options;
            event_handler m_handler;

            asio::io_context m_io;
            asio::ip::tcp::socket m_socket;
            asio::streambuf m_read_buffer;
            asio::thread_pool m_workers;
            std::unique_ptr<asio::signal_set> m_signals;

            std::atomic<bool> m_connected{false};
            std::atomic<bool> m_closing{false};

            mutable std::mutex m_lock;
            std::optional<asio::error_code> m_read_error;
        };

    }
}
