#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "logger.hpp"

namespace tpws {

    class cli_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    struct cli_options {
        log::level log_level = log::level::info;
        std::string log_file;                       // empty: no file logging
        log::console log_stream = log::console::std_out;
        std::string entry_path;                     // non-empty: write entry.tp and exit
        bool show_help = false;
    };

    /// Replace every "@file" argument with the lines of that file, trimmed, skipping blank lines.
    /// Throws cli_error if a file can't be read.
    std::vector<std::string> expand_args_files(const std::vector<std::string>& args);

    /// Parse arguments (without the program name). Throws cli_error on bad input.
    cli_options parse_command_line(const std::vector<std::string>& args);

    cli_options parse_command_line(int argc, char* argv[]);

    std::string usage();

}
