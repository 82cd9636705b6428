#include <exception>
#include <iostream>
#include <string>

#include "logger.hpp"
#include "message_dispatch.hpp"
#include "websocketpp_connection.hpp"

void print_usage()
{
    std::cout << "Usage: tpws-send <destination> <message>" << std::endl;
    std::cout << "Sends <message> as one text frame to <destination> (ws:// or wss://)." << std::endl;
}

int main(int argc, char* argv[])
{
    if (argc != 3) {
        print_usage();
        return 2;
    }

    std::string destination = argv[1];
    std::string message = argv[2];

    tpws::log::configure({ tpws::log::level::debug, "", tpws::log::console::std_err });

    std::cout << "WebSocket Send Test Tool" << std::endl;
    std::cout << "========================" << std::endl;
    std::cout << "Destination: " << destination << std::endl;
    std::cout << "Message:     " << message << std::endl << std::endl;

    try {
        tpws::dispatch::websocketpp_connection_factory connections;
        tpws::dispatch::send_message(connections, destination, message);
    } catch (const std::exception& e) {
        std::cerr << "Send failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Message sent, connection closed." << std::endl;
    return 0;
}
