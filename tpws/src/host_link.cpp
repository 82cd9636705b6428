#include "host_link.hpp"

#include <csignal>
#include <format>
#include <utility>

#include "logger.hpp"

namespace tpws {
    namespace host {

        host_link::host_link(link_options options)
            : m_options(std::move(options))
            , m_socket(m_io)
            , m_read_buffer(m_options.max_line_size)
            , m_workers(m_options.max_workers)
        {
        }

        host_link::~host_link()
        {
            asio::error_code error_code;
            m_socket.close(error_code);
            m_workers.join();
        }

        void host_link::set_event_handler(event_handler handler)
        {
            m_handler = std::move(handler);
        }

        void host_link::connect()
        {
            if (!m_handler) {
                throw host_link_error("No event handler set");
            }

            log::info(std::format("Connecting to TouchPortal at {}:{}", m_options.host, m_options.port));

            asio::error_code error_code;
            asio::ip::tcp::resolver resolver(m_io);
            auto endpoints = resolver.resolve(m_options.host, std::to_string(m_options.port), error_code);
            if (error_code) {
                throw host_link_error(std::format("Could not resolve {}: {}", m_options.host, error_code.message()));
            }

            asio::connect(m_socket, endpoints, error_code);
            if (error_code) {
                throw host_link_error(std::format("Could not connect to TouchPortal at {}:{}: {}",
                                                  m_options.host, m_options.port, error_code.message()));
            }

            std::string pair = make_pair_message(m_options.plugin_id).dump() + "\n";
            asio::write(m_socket, asio::buffer(pair), error_code);
            if (error_code) {
                close_socket();
                throw host_link_error("Failed to send pairing message: " + error_code.message());
            }

            m_connected = true;
            log::info("Paired with TouchPortal as " + m_options.plugin_id);

            if (m_options.handle_signals) {
                m_signals = std::make_unique<asio::signal_set>(m_io, SIGINT, SIGTERM);
                m_signals->async_wait([this](const asio::error_code& signal_error, int) {
                    if (signal_error) {
                        return;
                    }
                    log::warning("Caught interrupt signal, exiting.");
                    close_socket();
                });
            }

            start_read();
            m_io.run();

            m_connected = false;

            // Let handlers that are already queued finish
            m_workers.join();

            std::optional<asio::error_code> read_error;
            {
                std::lock_guard<std::mutex> lock(m_lock);
                read_error = m_read_error;
            }
            if (read_error) {
                throw host_link_error("Connection to TouchPortal failed: " + read_error->message());
            }

            log::info("Disconnected from TouchPortal");
        }

        void host_link::disconnect()
        {
            asio::post(m_io, [this]() { close_socket(); });
        }

        bool host_link::is_connected() const
        {
            return m_connected;
        }

        void host_link::start_read()
        {
            asio::async_read_until(m_socket, m_read_buffer, '\n',
                                   [this](const asio::error_code& error_code, std::size_t bytes) {
                                       on_read(error_code, bytes);
                                   });
        }

        void host_link::on_read(const asio::error_code& error_code, std::size_t bytes)
        {
            if (error_code == asio::error::not_found && !m_closing) {
                // The buffer filled up before a newline arrived; drop what was read so far
                log::warning(std::format("Ignoring message from TouchPortal longer than {} bytes",
                                         m_options.max_line_size));
                m_read_buffer.consume(m_read_buffer.size());
                start_read();
                return;
            }

            if (error_code) {
                if (m_closing || error_code == asio::error::operation_aborted) {
                    log::debug("Read loop stopped");
                } else if (error_code == asio::error::eof) {
                    log::info("TouchPortal closed the connection");
                } else {
                    log::error("Error reading from TouchPortal: " + error_code.message());
                    std::lock_guard<std::mutex> lock(m_lock);
                    m_read_error = error_code;
                }
                close_socket();
                return;
            }

            auto begin = asio::buffers_begin(m_read_buffer.data());
            std::string line(begin, begin + static_cast<std::ptrdiff_t>(bytes));
            m_read_buffer.consume(bytes);

            handle_line(line);

            if (m_socket.is_open() && !m_closing) {
                start_read();
            }
        }

        void host_link::handle_line(std::string_view line)
        {
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                line.remove_suffix(1);
            }
            if (line.empty()) {
                return;
            }

            log::debug(std::format("Received: {}", line));

            nlohmann::json message = nlohmann::json::parse(line, nullptr, false);
            if (message.is_discarded()) {
                log::warning(std::format("Ignoring malformed message from TouchPortal: {}", line));
                return;
            }

            std::string_view expected_id = m_options.check_plugin_id ? std::string_view(m_options.plugin_id)
                                                                     : std::string_view();
            std::optional<host_event> event = decode_message(message, expected_id);
            if (!event) {
                return;
            }

            bool is_shutdown = std::holds_alternative<shutdown_event>(*event);
            dispatch(std::move(*event));

            if (is_shutdown && m_options.auto_close) {
                log::info("closePlugin received, disconnecting");
                close_socket();
            }
        }

        void host_link::dispatch(host_event event)
        {
            asio::post(m_workers, [this, event = std::move(event)]() { run_handler(event); });
        }

        void host_link::run_handler(const host_event& event)
        {
            try {
                m_handler(event);
            } catch (const std::exception& e) {
                if (std::holds_alternative<error_event>(event)) {
                    log::error(std::string("Exception in error handler: ") + e.what());
                    return;
                }
                run_handler(error_event{ e.what() });
            } catch (...) {
                if (std::holds_alternative<error_event>(event)) {
                    log::error("Unknown exception in error handler");
                    return;
                }
                run_handler(error_event{ "unknown exception" });
            }
        }

        void host_link::close_socket()
        {
            m_closing = true;
            m_connected = false;

            if (m_signals) {
                asio::error_code signal_error;
                m_signals->cancel(signal_error);
                if (signal_error) {
                    log::debug("Signal set cancel: " + signal_error.message());
                }
            }

            if (!m_socket.is_open()) {
                return;
            }

            asio::error_code error_code;
            m_socket.shutdown(asio::ip::tcp::socket::shutdown_both, error_code);
            if (error_code) {
                log::debug("Socket shutdown: " + error_code.message());
            }
            m_socket.close(error_code);
            if (error_code) {
                log::warning("Error closing TouchPortal socket: " + error_code.message());
            }
        }

    }
}
