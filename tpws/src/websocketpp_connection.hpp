#pragma once

#include <memory>
#include <string>

#include "message_dispatch.hpp"

namespace tpws {
    namespace dispatch {

        /// websocketpp-backed connections. wss:// destinations get a TLS endpoint that
        /// verifies the server certificate, everything else a plain endpoint.
        class websocketpp_connection_factory : public ws_connection_factory {
        public:
            std::unique_ptr<ws_connection> create(const std::string& destination) override;
        };

    }
}
