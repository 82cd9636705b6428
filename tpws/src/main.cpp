#include <exception>
#include <format>
#include <iostream>

#include "cli_options.hpp"
#include "host_link.hpp"
#include "logger.hpp"
#include "plugin_entry.hpp"
#include "websocketpp_connection.hpp"
#include "ws_plugin.hpp"

namespace {

    const char* platform_name()
    {
#if defined(_WIN32)
        return "win32";
#elif defined(__APPLE__)
        return "darwin";
#else
        return "linux";
#endif
    }

}

int main(int argc, char* argv[])
{
    tpws::cli_options options;
    try {
        options = tpws::parse_command_line(argc, argv);
    } catch (const tpws::cli_error& e) {
        std::cerr << e.what() << "\n\n" << tpws::usage();
        return 2;
    }

    if (options.show_help) {
        std::cout << tpws::usage();
        return 0;
    }

    if (!options.entry_path.empty()) {
        try {
            tpws::write_entry_tp(options.entry_path);
        } catch (const std::exception& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
        std::cout << "Wrote " << options.entry_path << std::endl;
        return 0;
    }

    try {
        tpws::log::configure({ options.log_level, options.log_file, options.log_stream });
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    tpws::log::info(std::format("Starting {} v{} on {}.", tpws::s_plugin_name, tpws::s_plugin_version, platform_name()));

    tpws::dispatch::websocketpp_connection_factory connections;
    tpws::websockets_plugin plugin(connections);

    tpws::host::link_options link_options;
    link_options.plugin_id = tpws::s_plugin_id;
    link_options.handle_signals = true;

    tpws::host::host_link link(link_options);
    link.set_event_handler([&plugin](const tpws::host::host_event& event) { plugin.handle_event(event); });

    int ret = 0;
    try {
        // Blocks until TouchPortal closes the plugin or the connection drops
        link.connect();
        tpws::log::info("TP Client closed.");
    } catch (const std::exception& e) {
        tpws::log::error(std::format("Exception in TP Client:\n{}", e.what()));
        ret = -1;
    }

    link.disconnect();

    tpws::log::info(std::format("{} stopped.", tpws::s_plugin_name));
    return ret;
}
