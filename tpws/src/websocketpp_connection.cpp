#include "websocketpp_connection.hpp"

#define _WEBSOCKETPP_CPP11_RANDOM_DEVICE_

#ifndef ASIO_STANDALONE
    #define ASIO_STANDALONE
#endif

#ifndef _WEBSOCKETPP_CPP11_TYPE_TRAITS_
    #define _WEBSOCKETPP_CPP11_TYPE_TRAITS_
#endif

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include <format>
#include <system_error>
#include <type_traits>

#include "logger.hpp"

namespace tpws {
    namespace dispatch {

        namespace {

            using plain_client = websocketpp::client<websocketpp::config::asio_client>;
            using tls_client = websocketpp::client<websocketpp::config::asio_tls_client>;

            template <typename Client>
            class websocketpp_connection : public ws_connection {
            public:
                websocketpp_connection()
                {
                    m_client.clear_access_channels(websocketpp::log::alevel::all);
                    m_client.clear_error_channels(websocketpp::log::elevel::all);
                    m_client.set_error_channels(websocketpp::log::elevel::rerror);
                    m_client.set_error_channels(websocketpp::log::elevel::fatal);
                }

                void open(const std::string& destination) override
                {
                    websocketpp::lib::error_code error_code;
                    m_client.init_asio(error_code);
                    if (error_code) {
                        throw dispatch_error("Failed to initialize WebSocket client: " + error_code.message());
                    }
                    m_initialized = true;

                    if constexpr (std::is_same_v<Client, tls_client>) {
                        std::string host = websocketpp::uri(destination).get_host();
                        m_client.set_tls_init_handler([host](websocketpp::connection_hdl) {
                            auto context = websocketpp::lib::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
                            context->set_default_verify_paths();
                            context->set_verify_mode(asio::ssl::verify_peer);
                            context->set_verify_callback(asio::ssl::host_name_verification(host));
                            return context;
                        });
                    }

                    auto connection = m_client.get_connection(destination, error_code);
                    if (error_code || !connection) {
                        throw dispatch_error(std::format("Invalid destination '{}': {}", destination, error_code.message()));
                    }

                    connection->set_open_handler([this](const websocketpp::connection_hdl &) {
                        m_state = state::open;
                    });
                    connection->set_fail_handler([this](const websocketpp::connection_hdl &connection_handle) {
                        m_state = state::failed;
                        websocketpp::lib::error_code lookup_error;
                        auto failed = m_client.get_con_from_hdl(connection_handle, lookup_error);
                        m_error = failed ? failed->get_ec().message() : lookup_error.message();
                    });
                    connection->set_close_handler([this](const websocketpp::connection_hdl &) {
                        m_state = state::closed;
                    });

                    m_connection_handle = connection->get_handle();
                    m_client.connect(connection);
                    m_state = state::connecting;

                    try {
                        while (m_state == state::connecting) {
                            if (m_client.run_one() == 0) {
                                break;
                            }
                        }
                    } catch (const std::system_error& e) {
                        m_state = state::failed;
                        m_error = e.what();
                    }

                    if (m_state != state::open) {
                        throw dispatch_error(std::format("Could not connect to {}: {}", destination,
                                                         m_error.empty() ? "connection closed during handshake" : m_error));
                    }
                }

                void send_text(const std::string& message) override
                {
                    if (m_state != state::open) {
                        throw dispatch_error("Connection is not open");
                    }

                    websocketpp::lib::error_code error_code;
                    m_client.send(m_connection_handle, message, websocketpp::frame::opcode::text, error_code);
                    if (error_code) {
                        throw dispatch_error("Send failed: " + error_code.message());
                    }
                }

                void close() override
                {
                    if (!m_initialized) {
                        return;
                    }

                    if (m_state != state::open) {
                        // Nothing to hand over; drop pending handshake work
                        m_client.stop();
                        return;
                    }

                    websocketpp::lib::error_code error_code;
                    m_client.close(m_connection_handle, websocketpp::close::status::normal, "", error_code);
                    if (error_code) {
                        m_client.stop();
                        throw dispatch_error("Close failed: " + error_code.message());
                    }

                    // Writes the queued frame, then runs the closing handshake to completion
                    try {
                        m_client.run();
                    } catch (const std::system_error& e) {
                        throw dispatch_error(std::string("Error while closing: ") + e.what());
                    }
                    m_state = state::closed;
                    log::debug("WebSocket connection closed");
                }

            private:
                enum class state {
                    idle,
                    connecting,
                    open,
                    failed,
                    closed
                };

                Client m_client;
                websocketpp::connection_hdl m_connection_handle;
                state m_state = state::idle;
                bool m_initialized = false;
                std::string m_error;
            };

        }

        std::unique_ptr<ws_connection> websocketpp_connection_factory::create(const std::string& destination)
        {
            if (destination.starts_with("wss://")) {
                return std::make_unique<websocketpp_connection<tls_client>>();
            }
            return std::make_unique<websocketpp_connection<plain_client>>();
        }

    }
}
