#include "cli_options.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace tpws {

    namespace {

        std::string trim(const std::string& value)
        {
            auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
            auto begin = std::find_if_not(value.begin(), value.end(), is_space);
            auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
            return begin < end ? std::string(begin, end) : std::string();
        }

        std::string to_lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        // A switch may be given more than once
        po::typed_value<bool>* flag()
        {
            return po::value<bool>()->default_value(false, "")->implicit_value(true, "")->zero_tokens();
        }

        // Every occurrence is kept; the last one wins
        po::typed_value<std::vector<std::string>>* repeatable(const char* name)
        {
            return po::value<std::vector<std::string>>()->composing()->value_name(name);
        }

        std::optional<std::string> last_value(const po::variables_map& values, const char* key)
        {
            if (!values.count(key)) {
                return std::nullopt;
            }
            const auto& occurrences = values[key].as<std::vector<std::string>>();
            if (occurrences.empty()) {
                return std::nullopt;
            }
            return trim(occurrences.back());
        }

        po::options_description make_options()
        {
            po::options_description options("Options");
            // clang-format off
            options.add_options()
                ("help,h", flag(), "Show this help and exit.")
                ("debug,d", flag(), "Use debug logging.")
                ("warnings,w", flag(), "Only log warnings and errors.")
                ("quiet,q", flag(), "Disable all logging (quiet).")
                ("logfile,l", repeatable("<logfile>"),
                    "Log file name. Use 'none' to disable file logging (default).")
                ("stream,s", repeatable("<stream>"),
                    "Log to output stream: 'stdout' (default), 'stderr', or 'none'.")
                ("entry", repeatable("<path>"),
                    "Write the entry.tp plugin description to <path> and exit.");
            // clang-format on
            return options;
        }

    }

    std::vector<std::string> expand_args_files(const std::vector<std::string>& args)
    {
        std::vector<std::string> expanded;
        for (const auto& arg : args) {
            if (arg.size() < 2 || arg.front() != '@') {
                expanded.push_back(arg);
                continue;
            }

            std::string path = arg.substr(1);
            std::ifstream file(path);
            if (!file.is_open()) {
                throw cli_error("Could not read arguments file: " + path);
            }

            std::string line;
            while (std::getline(file, line)) {
                line = trim(line);
                if (!line.empty()) {
                    expanded.push_back(line);
                }
            }
        }
        return expanded;
    }

    cli_options parse_command_line(const std::vector<std::string>& args)
    {
        std::vector<std::string> expanded = expand_args_files(args);

        po::options_description options = make_options();
        po::positional_options_description no_positionals;
        po::variables_map values;
        try {
            po::store(po::command_line_parser(expanded).options(options).positional(no_positionals).run(), values);
            po::notify(values);
        } catch (const po::error& e) {
            throw cli_error(e.what());
        }

        cli_options result;
        result.show_help = values["help"].as<bool>();

        if (values["quiet"].as<bool>()) {
            result.log_level = log::level::off;
        } else if (values["debug"].as<bool>()) {
            result.log_level = log::level::debug;
        } else if (values["warnings"].as<bool>()) {
            result.log_level = log::level::warning;
        }

        if (auto file = last_value(values, "logfile")) {
            if (to_lower(*file) != "none") {
                result.log_file = *file;
            }
        }

        if (auto stream = last_value(values, "stream")) {
            std::string name = to_lower(*stream);
            if (name == "stdout") {
                result.log_stream = log::console::std_out;
            } else if (name == "stderr") {
                result.log_stream = log::console::std_err;
            } else {
                result.log_stream = log::console::none;
            }
        }

        if (auto entry = last_value(values, "entry")) {
            result.entry_path = *entry;
        }

        return result;
    }

    cli_options parse_command_line(int argc, char* argv[])
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }
        return parse_command_line(args);
    }

    std::string usage()
    {
        std::ostringstream out;
        out << "Usage: tp-websockets [options] [@argsfile]\n\n"
            << "Arguments may also be read from a file given as @argsfile, one per line.\n\n"
            << make_options();
        return out.str();
    }

}
