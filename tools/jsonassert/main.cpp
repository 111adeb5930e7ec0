/**
 * @file main.cpp
 * @brief jsonassert CLI entry point
 *
 * Commands:
 *   diff      - Compare an actual JSON file against an expected one
 *   check     - Run every comparison listed in a case file
 *   version   - Show version information
 *
 * Exit status: 0 when everything matched, 1 when differences were found,
 * 2 on usage, I/O, parse or schema errors.
 */

#include "jsonassert/require_cpp23.hpp"

#include "jsonassert/common.hpp"
#include "jsonassert/diff.hpp"
#include "jsonassert/json_io.hpp"
#include "jsonassert/report.hpp"
#include "jsonassert/schema_validate.hpp"
#include "jsonassert/version.hpp"

#include <cstddef>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>

namespace {

constexpr int kExitMatch = 0;
constexpr int kExitDifferences = 1;
constexpr int kExitError = 2;

void print_version()
{
    std::println("jsonassert {} ({})", jsonassert::kVersion, jsonassert::kBuildId);
    std::println("  report schema: {}", jsonassert::kReportSchemaVersion);
    std::println("  cases schema:  {}", jsonassert::kCasesSchemaVersion);
}

void print_help()
{
    std::print(R"(jsonassert - structural JSON comparison with path-qualified differences

Usage: jsonassert <command> [options]

Commands:
  diff        Compare an actual JSON file against an expected one
  check       Run every comparison listed in a case file
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'jsonassert <command> --help' for command-specific options.
)");
}

void print_diff_help()
{
    std::print(R"(Usage: jsonassert diff [options]

Compare an actual JSON file against an expected one

Options:
  --actual FILE                        Path to the actual document (required)
  --expected FILE                      Path to the expected document (required)
  --mode exact|inclusive               Comparison mode (default: exact)
  --array-length per-element|summary   Reporting of extra actual array elements
                                       in exact mode (default: per-element)
  --format text|json                   Output format (default: text)
  --out FILE, -o FILE                  Output file (default: stdout)
  --schema-dir DIR                     Path to schema directory (default: ./schemas)
  --help, -h                           Show this help
)");
}

void print_check_help()
{
    std::print(R"(Usage: jsonassert check [options]

Run every comparison listed in a case file

Options:
  --cases FILE              Path to a cases.v1 document (required)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

struct DiffOptions
{
    std::string actual;
    std::string expected;
    jsonassert::diff::Config config;
    jsonassert::report::ReportFormat format;
    std::optional<std::string> output;
    std::string schema_dir;
    bool show_help;
};

struct CheckOptions
{
    std::string cases;
    std::string schema_dir;
    bool show_help;
};

[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> jsonassert::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(jsonassert::Error::make(
            "MissingArgument", std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] jsonassert::Result<jsonassert::diff::Mode> parse_mode_value(std::string_view value)
{
    if (value == "exact") {
        return jsonassert::diff::Mode::kExact;
    }
    if (value == "inclusive") {
        return jsonassert::diff::Mode::kInclusive;
    }
    return std::unexpected(jsonassert::Error::make(
        "InvalidArgument", std::string("Invalid mode: ") + std::string(value)));
}

[[nodiscard]] jsonassert::Result<jsonassert::diff::ArrayLengthPolicy>
parse_array_length_value(std::string_view value)
{
    if (value == "per-element") {
        return jsonassert::diff::ArrayLengthPolicy::kPerElement;
    }
    if (value == "summary") {
        return jsonassert::diff::ArrayLengthPolicy::kSummary;
    }
    return std::unexpected(jsonassert::Error::make(
        "InvalidArgument", std::string("Invalid array length policy: ") + std::string(value)));
}

[[nodiscard]] jsonassert::Result<jsonassert::report::ReportFormat>
parse_format_value(std::string_view value)
{
    if (value == "text") {
        return jsonassert::report::ReportFormat::kText;
    }
    if (value == "json") {
        return jsonassert::report::ReportFormat::kJson;
    }
    return std::unexpected(jsonassert::Error::make(
        "InvalidArgument", std::string("Invalid format: ") + std::string(value)));
}

// NOLINTBEGIN(readability-function-size) - One branch per option keeps parsing flat.
[[nodiscard]] auto set_diff_option(std::string_view arg, const std::string& value, DiffOptions& options)
    -> jsonassert::Result<bool>
{
    if (arg == "--actual") {
        options.actual = value;
        return true;
    }
    if (arg == "--expected") {
        options.expected = value;
        return true;
    }
    if (arg == "--mode") {
        auto mode = parse_mode_value(value);
        if (!mode) {
            return std::unexpected(mode.error());
        }
        options.config.mode = *mode;
        return true;
    }
    if (arg == "--array-length") {
        auto policy = parse_array_length_value(value);
        if (!policy) {
            return std::unexpected(policy.error());
        }
        options.config.array_length = *policy;
        return true;
    }
    if (arg == "--format") {
        auto format = parse_format_value(value);
        if (!format) {
            return std::unexpected(format.error());
        }
        options.format = *format;
        return true;
    }
    if (arg == "--out" || arg == "-o") {
        options.output = value;
        return true;
    }
    if (arg == "--schema-dir") {
        options.schema_dir = value;
        return true;
    }
    return false;
}
// NOLINTEND(readability-function-size)

[[nodiscard]] jsonassert::Result<DiffOptions> parse_diff_args(std::span<char*> args)
{
    DiffOptions options{.actual = std::string{},
                        .expected = std::string{},
                        .config = jsonassert::diff::Config{},
                        .format = jsonassert::report::ReportFormat::kText,
                        .output = std::nullopt,
                        .schema_dir = "schemas",
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
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (!arg.starts_with("-")) {
            return std::unexpected(jsonassert::Error::make(
                "InvalidArgument", std::string("Unexpected argument: ") + std::string(arg)));
        }
        auto value = read_option_value(args, static_cast<std::size_t>(i), arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto known = set_diff_option(arg, *value, options);
        if (!known) {
            return std::unexpected(known.error());
        }
        if (!*known) {
            return std::unexpected(jsonassert::Error::make(
                "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
        }
        skip_next = true;
    }
    return options;
}

[[nodiscard]] jsonassert::Result<CheckOptions> parse_check_args(std::span<char*> args)
{
    CheckOptions options{.cases = std::string{}, .schema_dir = "schemas", .show_help = false};
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
        if (arg == "--cases") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.cases = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.schema_dir = *value;
            skip_next = true;
            continue;
        }
        return std::unexpected(jsonassert::Error::make(
            "InvalidArgument", std::string("Unknown option: ") + std::string(arg)));
    }
    return options;
}

[[nodiscard]] jsonassert::VoidResult write_json_report(const DiffOptions& options,
                                                       const nlohmann::json& report)
{
    const auto schema_path =
        std::filesystem::path(options.schema_dir) / "diff_report.v1.schema.json";
    if (auto validation = jsonassert::common::validate_json(report, schema_path); !validation) {
        return std::unexpected(jsonassert::Error::make(
            "SchemaInvalid",
            std::string("report schema validation failed: ") + validation.error().message));
    }
    // Both sinks get the same bytes.
    std::string text = jsonassert::report::pretty_json(report);
    if (options.output) {
        text += '\n';
        return jsonassert::common::write_text_file(*options.output, text);
    }
    std::println("{}", text);
    return {};
}

[[nodiscard]] jsonassert::VoidResult
write_text_report(const DiffOptions& options,
                  std::span<const jsonassert::diff::Difference> differences)
{
    std::string text = differences.empty() ? std::string("No differences")
                                           : jsonassert::report::format_differences(differences);
    if (options.output) {
        text += '\n';
        return jsonassert::common::write_text_file(*options.output, text);
    }
    std::println("{}", text);
    return {};
}

[[nodiscard]] int run_diff(const DiffOptions& options)
{
    auto actual = jsonassert::common::read_json_file(options.actual);
    if (!actual) {
        std::println(stderr, "Error: {}", actual.error().message);
        return kExitError;
    }
    auto expected = jsonassert::common::read_json_file(options.expected);
    if (!expected) {
        std::println(stderr, "Error: {}", expected.error().message);
        return kExitError;
    }

    const auto differences = jsonassert::diff::diff(*actual, *expected, options.config);

    auto written = options.format == jsonassert::report::ReportFormat::kJson
                       ? write_json_report(options,
                                           jsonassert::report::build_report(differences,
                                                                            options.config))
                       : write_text_report(options, differences);
    if (!written) {
        std::println(stderr, "Error: {}", written.error().message);
        return kExitError;
    }
    return differences.empty() ? kExitMatch : kExitDifferences;
}

[[nodiscard]] jsonassert::Result<jsonassert::diff::Config> case_config(const nlohmann::json& test_case)
{
    jsonassert::diff::Config config;
    if (test_case.contains("mode")) {
        auto mode = parse_mode_value(test_case.at("mode").get_ref<const std::string&>());
        if (!mode) {
            return std::unexpected(mode.error());
        }
        config.mode = *mode;
    }
    if (test_case.contains("array_length")) {
        auto policy =
            parse_array_length_value(test_case.at("array_length").get_ref<const std::string&>());
        if (!policy) {
            return std::unexpected(policy.error());
        }
        config.array_length = *policy;
    }
    return config;
}

[[nodiscard]] int run_check(const CheckOptions& options)
{
    auto cases = jsonassert::common::read_json_file(options.cases);
    if (!cases) {
        std::println(stderr, "Error: {}", cases.error().message);
        return kExitError;
    }
    const auto schema_path = std::filesystem::path(options.schema_dir) / "cases.v1.schema.json";
    if (auto validation = jsonassert::common::validate_json(*cases, schema_path); !validation) {
        std::println(stderr, "Error: cases schema validation failed: {}", validation.error().message);
        return kExitError;
    }

    std::size_t total = 0;
    std::size_t passed = 0;
    for (const auto& test_case : cases->at("cases")) {
        const auto& name = test_case.at("name").get_ref<const std::string&>();
        auto config = case_config(test_case);
        if (!config) {
            std::println(stderr, "Error: case {}: {}", name, config.error().message);
            return kExitError;
        }
        ++total;
        const auto differences =
            jsonassert::diff::diff(test_case.at("actual"), test_case.at("expected"), *config);
        if (differences.empty()) {
            ++passed;
            std::println("[PASS] {}", name);
            continue;
        }
        std::println("[FAIL] {}", name);
        std::println("{}", jsonassert::report::indent(
                               jsonassert::report::format_differences(differences), 4));
    }

    std::println("{}/{} cases passed", passed, total);
    return passed == total ? kExitMatch : kExitDifferences;
}

int cmd_diff(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_diff_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_diff_help();
        return kExitMatch;
    }
    if (options->actual.empty() || options->expected.empty()) {
        std::println(stderr, "Error: --actual and --expected are required");
        print_diff_help();
        return kExitError;
    }
    return run_diff(*options);
}

int cmd_check(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_check_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitError;
    }
    if (options->show_help) {
        print_check_help();
        return kExitMatch;
    }
    if (options->cases.empty()) {
        std::println(stderr, "Error: --cases is required");
        print_check_help();
        return kExitError;
    }
    return run_check(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitError;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return kExitMatch;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitMatch;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "diff") {
            return cmd_diff(sub_argc, sub_argv);
        }
        if (cmd == "check") {
            return cmd_check(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return kExitError;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitError;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
