#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "cli_options.hpp"

using namespace tpws;

TEST(CliOptionsTest, DefaultsLogInfoToStdout)
{
    cli_options options = parse_command_line(std::vector<std::string>{});

    EXPECT_EQ(log::level::info, options.log_level);
    EXPECT_EQ(log::console::std_out, options.log_stream);
    EXPECT_TRUE(options.log_file.empty());
    EXPECT_TRUE(options.entry_path.empty());
    EXPECT_FALSE(options.show_help);
}

TEST(CliOptionsTest, LevelSwitches)
{
    EXPECT_EQ(log::level::debug, parse_command_line({ "-d" }).log_level);
    EXPECT_EQ(log::level::warning, parse_command_line({ "-w" }).log_level);
    EXPECT_EQ(log::level::off, parse_command_line({ "--quiet" }).log_level);
}

TEST(CliOptionsTest, QuietBeatsDebugBeatsWarnings)
{
    EXPECT_EQ(log::level::off, parse_command_line({ "-d", "-w", "-q" }).log_level);
    EXPECT_EQ(log::level::debug, parse_command_line({ "-w", "-d" }).log_level);
}

TEST(CliOptionsTest, LogFileNoneDisablesFileLogging)
{
    EXPECT_EQ("plugin.log", parse_command_line({ "-l", "plugin.log" }).log_file);
    EXPECT_TRUE(parse_command_line({ "-l", "none" }).log_file.empty());
    EXPECT_TRUE(parse_command_line({ "--logfile", "NONE" }).log_file.empty());
}

TEST(CliOptionsTest, StreamSelection)
{
    EXPECT_EQ(log::console::std_out, parse_command_line({ "-s", "stdout" }).log_stream);
    EXPECT_EQ(log::console::std_err, parse_command_line({ "-s", "STDERR" }).log_stream);
    EXPECT_EQ(log::console::none, parse_command_line({ "-s", "none" }).log_stream);
    EXPECT_EQ(log::console::none, parse_command_line({ "--stream", "printer" }).log_stream);
}

TEST(CliOptionsTest, HelpAndEntry)
{
    EXPECT_TRUE(parse_command_line({ "-h" }).show_help);
    EXPECT_EQ("out/entry.tp", parse_command_line({ "--entry", "out/entry.tp" }).entry_path);
}

TEST(CliOptionsTest, BadArgumentsAreRejected)
{
    EXPECT_THROW(parse_command_line({ "--bogus" }), cli_error);
    EXPECT_THROW(parse_command_line({ "stray" }), cli_error);
    EXPECT_THROW(parse_command_line({ "-l" }), cli_error);
}

TEST(CliOptionsTest, ArgumentsFileIsExpandedInPlace)
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / "tpws_cli_options_test_config.txt";
    {
        std::ofstream file(path);
        file << "-d\n\n  -l plugin.log  \n-s\nstderr\n";
    }

    std::vector<std::string> expanded = expand_args_files({ "-w", "@" + path.string() });
    std::vector<std::string> expected = { "-w", "-d", "-l plugin.log", "-s", "stderr" };
    EXPECT_EQ(expected, expanded);

    cli_options options = parse_command_line({ "@" + path.string() });
    EXPECT_EQ(log::level::debug, options.log_level);
    EXPECT_EQ("plugin.log", options.log_file);
    EXPECT_EQ(log::console::std_err, options.log_stream);

    std::filesystem::remove(path);
}

TEST(CliOptionsTest, RepeatedOptionsKeepTheLastValue)
{
    cli_options options = parse_command_line({ "-s", "stdout", "-s", "stderr", "-l", "a.log", "-l", "b.log" });
    EXPECT_EQ(log::console::std_err, options.log_stream);
    EXPECT_EQ("b.log", options.log_file);

    EXPECT_TRUE(parse_command_line({ "-l", "a.log", "-l", "none" }).log_file.empty());
    EXPECT_EQ(log::level::debug, parse_command_line({ "-d", "-d" }).log_level);
    EXPECT_TRUE(parse_command_line({ "-h", "--help" }).show_help);
}

TEST(CliOptionsTest, CommandLineOverridesArgumentsFile)
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / "tpws_cli_options_test_override.txt";
    {
        std::ofstream file(path);
        file << "-l\nnone\n-s\nstdout\n";
    }

    cli_options options = parse_command_line({ "@" + path.string(), "-s", "stderr", "-l", "plugin.log" });
    EXPECT_EQ(log::console::std_err, options.log_stream);
    EXPECT_EQ("plugin.log", options.log_file);

    std::filesystem::remove(path);
}

TEST(CliOptionsTest, MissingArgumentsFileThrows)
{
    EXPECT_THROW(parse_command_line({ "@/nonexistent-dir/config.txt" }), cli_error);
}

TEST(CliOptionsTest, LoneAtSignIsAPlainArgument)
{
    EXPECT_EQ(std::vector<std::string>{ "@" }, expand_args_files({ "@" }));
}

TEST(CliOptionsTest, UsageListsOptions)
{
    std::string text = usage();

    EXPECT_NE(std::string::npos, text.find("--logfile"));
    EXPECT_NE(std::string::npos, text.find("--stream"));
    EXPECT_NE(std::string::npos, text.find("@argsfile"));
}
