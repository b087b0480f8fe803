/**
 * @file main.cpp
 * @brief jsondelta CLI entry point
 *
 * Commands:
 *   compare   - Compare two JSON files line by line
 *   render    - Print the canonical rendering of a JSON file
 *   version   - Show version information
 */

#include "jsondelta/require_cpp23.hpp"

#include "jsondelta/canonical_json.hpp"
#include "jsondelta/common.hpp"
#include "jsondelta/delta.hpp"
#include "jsondelta/input.hpp"
#include "jsondelta/report.hpp"
#include "jsondelta/schema_validate.hpp"
#include "jsondelta/version.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>

#ifndef JSONDELTA_DEFAULT_SCHEMA_DIR
    #define JSONDELTA_DEFAULT_SCHEMA_DIR "schemas"
#endif

namespace {

enum class OutputFormat { kText, kJson };

void print_version()
{
    std::println("jsondelta {} ({})", jsondelta::kVersion, jsondelta::kBuildId);
    std::println("  report format: {}", jsondelta::kReportFormatVersion);
}

void print_help()
{
    std::print(R"(jsondelta - Line-level comparison of JSON documents

Usage: jsondelta <command> [options]

Commands:
  compare     Compare two JSON files and report added/removed lines
  render      Print the canonical rendering of a JSON file
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'jsondelta <command> --help' for command-specific options.
)");
}

void print_compare_help()
{
    std::print(R"(Usage: jsondelta compare [options]

Compare two JSON files on their canonical renderings (sorted keys,
two-space indentation) and report the lines added and removed.

Options:
  --left FILE               First JSON document (required)
  --right FILE              Second JSON document (required)
  --format text|json        Output format (default: text)
  --output FILE, -o         Also write the report to FILE
  --schema-dir DIR          Path to schema directory
                            (default: the source tree's schemas/)
  --help, -h                Show this help

Output:
  report.json (with --output), fields added_to_json2, removed_from_json1,
  total_changes
)");
}

void print_render_help()
{
    std::print(R"(Usage: jsondelta render [options]

Print the canonical rendering of a JSON file

Options:
  --input FILE              JSON document (required)
  --help, -h                Show this help
)");
}

struct CompareOptions
{
    std::string left;
    std::string right;
    std::optional<std::string> output;
    std::string schema_dir;
    OutputFormat format;
    bool show_help;
};

struct RenderOptions
{
    std::string input;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> jsondelta::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(jsondelta::Error::make(
            "MissingArgument", std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] jsondelta::Result<OutputFormat> parse_format_value(std::string_view value)
{
    if (value == "text") {
        return OutputFormat::kText;
    }
    if (value == "json") {
        return OutputFormat::kJson;
    }
    return std::unexpected(jsondelta::Error::make(
        "InvalidArgument", std::string("Invalid --format value: ") + std::string(value)));
}

[[nodiscard]] auto set_compare_option(std::string_view arg,
                                      // CLI parsing signature is stable.
                                      // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                                      std::span<char*> args,
                                      std::size_t idx,
                                      CompareOptions& options,
                                      bool& skip_next) -> jsondelta::Result<bool>
{
    if (arg != "--left" && arg != "--right" && arg != "--output" && arg != "-o"
        && arg != "--schema-dir" && arg != "--format") {
        return jsondelta::Result<bool>{false};
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;

    if (arg == "--left") {
        options.left = *value;
    } else if (arg == "--right") {
        options.right = *value;
    } else if (arg == "--output" || arg == "-o") {
        options.output = *value;
    } else if (arg == "--schema-dir") {
        options.schema_dir = *value;
    } else {
        auto format = parse_format_value(*value);
        if (!format) {
            return std::unexpected(format.error());
        }
        options.format = *format;
    }
    return jsondelta::Result<bool>{true};
}

[[nodiscard]] jsondelta::Result<CompareOptions> parse_compare_args(std::span<char*> args)
{
    CompareOptions options{.left = std::string{},
                           .right = std::string{},
                           .output = std::nullopt,
                           .schema_dir = JSONDELTA_DEFAULT_SCHEMA_DIR,
                           .format = OutputFormat::kText,
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto handled = set_compare_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(jsondelta::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
    }
    return options;
}

[[nodiscard]] jsondelta::Result<RenderOptions> parse_render_args(std::span<char*> args)
{
    RenderOptions options{.input = std::string{}, .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--input") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.input = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(jsondelta::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

[[nodiscard]] jsondelta::VoidResult write_validated_report(const CompareOptions& options,
                                                           const jsondelta::delta::DeltaSummary& summary)
{
    const std::filesystem::path schema_path =
        std::filesystem::path(options.schema_dir) / jsondelta::report::kReportSchemaFile;
    if (auto validation =
            jsondelta::common::validate_json(jsondelta::report::to_json(summary), schema_path.string());
        !validation) {
        return std::unexpected(validation.error());
    }
    return jsondelta::report::write_report(*options.output, summary);
}

[[nodiscard]] int run_compare(const CompareOptions& options)
{
    // Both sides are parsed before giving up so each error is reported.
    auto json1 = jsondelta::input::read_json_file(options.left);
    auto json2 = jsondelta::input::read_json_file(options.right);
    if (!json1) {
        std::println(stderr, "Error in first file: {}", json1.error().message);
    }
    if (!json2) {
        std::println(stderr, "Error in second file: {}", json2.error().message);
    }
    if (!json1 || !json2) {
        return 1;
    }

    auto summary = jsondelta::delta::compare(*json1, *json2);
    if (!summary) {
        std::println(stderr, "Error: compare failed: {}", summary.error().message);
        return 1;
    }

    if (options.format == OutputFormat::kJson) {
        auto text = jsondelta::report::serialize_report(*summary);
        if (!text) {
            std::println(stderr, "Error: failed to serialize report: {}", text.error().message);
            return 1;
        }
        std::print("{}", *text);
    } else {
        for (const auto& line : jsondelta::report::render_text(*summary)) {
            std::println("{}", line);
        }
    }

    if (options.output) {
        if (auto write = write_validated_report(options, *summary); !write) {
            std::println(stderr, "Error: failed to write report: {}", write.error().message);
            return 1;
        }
        std::println(stderr, "[compare] Wrote report");
        std::println(stderr, "  output: {}", *options.output);
    }
    return 0;
}

[[nodiscard]] int run_render(const RenderOptions& options)
{
    auto document = jsondelta::input::read_json_file(options.input);
    if (!document) {
        std::println(stderr, "Error: {}", document.error().message);
        return 1;
    }
    auto lines = jsondelta::canonical::canonicalize(*document);
    if (!lines) {
        std::println(stderr, "Error: render failed: {}", lines.error().message);
        return 1;
    }
    std::println("{}", jsondelta::canonical::join_lines(*lines));
    return 0;
}

int cmd_compare(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_compare_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_compare_help();
        return 0;
    }
    if (options->left.empty() || options->right.empty()) {
        std::println(stderr, "Error: --left and --right are required");
        print_compare_help();
        return 1;
    }
    return run_compare(*options);
}

int cmd_render(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_render_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        print_render_help();
        return 0;
    }
    if (options->input.empty()) {
        std::println(stderr, "Error: --input is required");
        print_render_help();
        return 1;
    }
    return run_render(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "compare") {
            return cmd_compare(sub_argc, sub_argv);
        }
        if (cmd == "render") {
            return cmd_render(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
