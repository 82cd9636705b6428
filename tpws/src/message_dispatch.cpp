#include "message_dispatch.hpp"

#include <format>
#include <utility>

#include "logger.hpp"

namespace tpws {
    namespace dispatch {

        scoped_connection::scoped_connection(std::unique_ptr<ws_connection> connection)
            : m_connection(std::move(connection))
        {
            if (!m_connection) {
                throw dispatch_error("No connection available");
            }
        }

        scoped_connection::~scoped_connection()
        {
            if (m_closed) {
                return;
            }
            m_closed = true;

            try {
                m_connection->close();
            } catch (const std::exception& e) {
                log::warning(std::string("Error closing connection after failed send: ") + e.what());
            }
        }

        void scoped_connection::close()
        {
            if (m_closed) {
                return;
            }
            m_closed = true;
            m_connection->close();
        }

        void send_message(ws_connection_factory& connections, const std::string& destination,
                          const std::string& message)
        {
            log::debug(std::format("Opening connection to {}", destination));

            scoped_connection connection(connections.create(destination));
            connection->open(destination);
            connection->send_text(message);
            connection.close();

            log::debug(std::format("Sent {} bytes to {}", message.size(), destination));
        }

    }
}
