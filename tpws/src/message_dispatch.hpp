#pragma once

#include <memory>
#include <stdexcept>
#include <string>

namespace tpws {
    namespace dispatch {

        /// Connect, handshake or send failure on an outbound WebSocket.
        class dispatch_error : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
        };

        /// One short-lived outbound WebSocket connection: opened, used and closed once.
        class ws_connection {
        public:
            virtual ~ws_connection() = default;

            /// Blocks until the handshake completes. Throws dispatch_error on failure.
            virtual void open(const std::string& destination) = 0;

            /// Send one complete text frame. Throws dispatch_error on failure.
            virtual void send_text(const std::string& message) = 0;

            /// Close the connection and release the endpoint, whatever state it is in.
            virtual void close() = 0;
        };

        class ws_connection_factory {
        public:
            virtual ~ws_connection_factory() = default;

            /// A fresh connection for every call; connections are never shared or reused.
            virtual std::unique_ptr<ws_connection> create(const std::string& destination) = 0;
        };

        /// Owns a connection and closes it exactly once, on every exit path.
        class scoped_connection {
        public:
            explicit scoped_connection(std::unique_ptr<ws_connection> connection);
            ~scoped_connection();

            scoped_connection(const scoped_connection&) = delete;
            scoped_connection& operator=(const scoped_connection&) = delete;

            ws_connection* operator->() const { return m_connection.get(); }

            /// Close now. Errors propagate to the caller; the destructor won't close again.
            void close();

        private:
            std::unique_ptr<ws_connection> m_connection;
            bool m_closed = false;
        };

        /// Open a connection to destination, send message as one text frame, close.
        /// Blocks until done. Failures propagate as dispatch_error; nothing is retried.
        void send_message(ws_connection_factory& connections, const std::string& destination,
                          const std::string& message);

    }
}
