/**
 * @file main.cpp
 * @brief linkdiff CLI entry point
 *
 * Commands:
 *   diff          - Compute a delta between two JSON documents
 *   patch         - Apply a delta to a document
 *   validate      - Check whether a delta applies cleanly
 *   merge         - Merge several deltas
 *   inverse       - Invert a delta
 *   hash          - Content hash of a document
 *   canonicalize  - Canonical form of a document
 *   version       - Show version information
 *
 * Output and diagnostics are written with std::print/std::println.
 */

#include "linkdiff/c14n.hpp"
#include "linkdiff/common.hpp"
#include "linkdiff/config.hpp"
#include "linkdiff/diff.hpp"
#include "linkdiff/document.hpp"
#include "linkdiff/log.hpp"
#include "linkdiff/print.hpp"
#include "linkdiff/schema_validate.hpp"
#include "linkdiff/version.hpp"

#include <charconv>
#include <cstdint>
#include <exception>
#include <format>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_version()
{
    std::println("linkdiff {} ({})", linkdiff::kVersion, linkdiff::kBuildId);
    std::println("  structural:  {}", linkdiff::kStructuralDeltaVersion);
    std::println("  operational: {}", linkdiff::kOperationalDiffVersion);
    std::println("  semantic:    {}", linkdiff::kSemanticDiffVersion);
}

void print_help()
{
    std::print(R"(linkdiff - structural, operational and semantic diffs of JSON documents

Usage: linkdiff <command> [options]

Commands:
  diff          Compute a delta between two documents
  patch         Apply a delta to a document
  validate      Check whether a delta applies cleanly (prints true/false)
  merge         Merge several deltas
  inverse       Invert a delta
  hash          Content hash of a document
  canonicalize  Canonical form of a document
  version       Show version information

Global Options:
  --help, -h          Show this help message
  --config FILE       Configuration file (config.v1)
  --schema-dir DIR    Path to schema directory (default: ./schemas)
  --output FILE, -o   Write the result to FILE instead of stdout

Exit codes: 0 success, 1 operation failure, 2 usage error.
Run 'linkdiff <command> --help' for command-specific options.
)");
}

void print_diff_help()
{
    std::print(R"(Usage: linkdiff diff --old FILE --new FILE [options]

Options:
  --strategy S        structural (default), operational or semantic
  --no-moves          Structural: report moves as delete + insert
  --simple-arrays     Structural: compare arrays index by index
  --no-text-diff      Structural: never emit text deltas for long strings
  --actor ID          Operational: actor id (default: random)
  --timestamp N       Operational: first logical timestamp (default: now)
)");
}

void print_patch_help()
{
    std::print(R"(Usage: linkdiff patch --doc FILE --delta FILE [--strategy S]

The strategy is inferred from the delta when not given.
)");
}

void print_validate_help()
{
    std::print(R"(Usage: linkdiff validate --doc FILE --delta FILE [--strategy S]

Prints true and exits 0 when the delta applies cleanly, else prints false
and exits 1.
)");
}

void print_merge_help()
{
    std::print(R"(Usage: linkdiff merge [--strategy S] [--conflict-resolution P] FILE...

Options:
  --strategy S               operational (default), structural or semantic
  --conflict-resolution P    Operational: last_write_wins or merge
)");
}

void print_inverse_help()
{
    std::print(R"(Usage: linkdiff inverse --delta FILE [--strategy S]
)");
}

void print_hash_help()
{
    std::print(R"(Usage: linkdiff hash [--form F] FILE

Options:
  --form F            stable_json (default) or urdna2015_nquads
)");
}

void print_canonicalize_help()
{
    std::print(R"(Usage: linkdiff canonicalize [--rdf] FILE

Options:
  --rdf               Print the canonical N-Quads instead of canonical JSON
)");
}

struct CliOptions
{
    std::optional<std::string> config_path;
    std::string schema_dir = "schemas";
    std::optional<std::string> output;
    std::optional<std::string> strategy;
    std::string old_path;
    std::string new_path;
    std::string doc_path;
    std::string delta_path;
    std::vector<std::string> inputs;
    bool include_moves = true;
    bool simple_arrays = false;
    bool text_diff = true;
    std::optional<std::string> actor_id;
    std::optional<std::uint64_t> timestamp;
    std::optional<std::string> conflict_resolution;
    std::string form = "stable_json";
    bool rdf = false;
    bool show_help = false;
};

[[nodiscard]] linkdiff::Result<std::string> read_option_value(std::span<char*> args,
                                                              std::size_t index,
                                                              std::string_view option)
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(linkdiff::Error::make("MissingArgument",
                                                     std::format("Missing value for option: {}", option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] linkdiff::Result<std::uint64_t> parse_timestamp_value(std::string_view value)
{
    std::uint64_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (value.empty() || ec != std::errc{} || ptr != end) {
        return std::unexpected(linkdiff::Error::make("InvalidArgument",
                                                     std::format("Invalid --timestamp value: {}", value)));
    }
    return parsed;
}

/**
 * Options taking a value. Returns the field to fill, or nullptr when the
 * option is not a value option.
 */
[[nodiscard]] std::string* string_option_slot(std::string_view arg, CliOptions& options)
{
    if (arg == "--old") {
        return &options.old_path;
    }
    if (arg == "--new") {
        return &options.new_path;
    }
    if (arg == "--doc") {
        return &options.doc_path;
    }
    if (arg == "--delta") {
        return &options.delta_path;
    }
    if (arg == "--schema-dir") {
        return &options.schema_dir;
    }
    if (arg == "--form") {
        return &options.form;
    }
    return nullptr;
}

[[nodiscard]] linkdiff::Result<bool> set_option(std::string_view arg,
                                                std::span<char*> args,
                                                std::size_t idx,
                                                CliOptions& options,
                                                bool& skip_next)
{
    if (arg == "--help" || arg == "-h") {
        options.show_help = true;
        return true;
    }
    if (arg == "--no-moves") {
        options.include_moves = false;
        return true;
    }
    if (arg == "--simple-arrays") {
        options.simple_arrays = true;
        return true;
    }
    if (arg == "--no-text-diff") {
        options.text_diff = false;
        return true;
    }
    if (arg == "--rdf") {
        options.rdf = true;
        return true;
    }

    const bool optional_value = arg == "--config" || arg == "--output" || arg == "-o" || arg == "--strategy"
                                || arg == "--actor" || arg == "--timestamp" || arg == "--conflict-resolution";
    std::string* slot = string_option_slot(arg, options);
    if (slot == nullptr && !optional_value) {
        return false;
    }
    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    skip_next = true;
    if (slot != nullptr) {
        *slot = *value;
    } else if (arg == "--config") {
        options.config_path = *value;
    } else if (arg == "--output" || arg == "-o") {
        options.output = *value;
    } else if (arg == "--strategy") {
        options.strategy = *value;
    } else if (arg == "--actor") {
        options.actor_id = *value;
    } else if (arg == "--conflict-resolution") {
        options.conflict_resolution = *value;
    } else {
        auto parsed = parse_timestamp_value(*value);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.timestamp = *parsed;
    }
    return true;
}

[[nodiscard]] linkdiff::Result<CliOptions> parse_args(std::span<char*> args)
{
    CliOptions options;
    bool skip_next = false;
    for (std::size_t idx = 0; idx < args.size(); ++idx) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (args[idx] == nullptr) {
            continue;
        }
        std::string_view arg(args[idx]);
        auto handled = set_option(arg, args, idx, options, skip_next);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (*handled) {
            continue;
        }
        if (arg.starts_with('-') && arg.size() > 1) {
            return std::unexpected(linkdiff::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
        }
        options.inputs.emplace_back(arg);
    }
    return options;
}

/// Defaults < --config file < environment, then install process-wide.
[[nodiscard]] linkdiff::VoidResult configure(const CliOptions& options)
{
    linkdiff::config::Config config;
    if (options.config_path) {
        auto loaded = linkdiff::config::load_config(*options.config_path, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    auto resolved = linkdiff::config::apply_environment(std::move(config));
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    return linkdiff::apply_config(*resolved);
}

[[nodiscard]] linkdiff::VoidResult write_output(const CliOptions& options, const std::string& text)
{
    if (!options.output) {
        std::print("{}", text);
        return {};
    }
    std::ofstream out(*options.output);
    if (!out) {
        return std::unexpected(linkdiff::Error::make("IOError", std::format("Failed to open output file: {}", *options.output)));
    }
    out << text;
    if (!out) {
        return std::unexpected(linkdiff::Error::make("IOError", std::format("Failed to write output file: {}", *options.output)));
    }
    return {};
}

[[nodiscard]] int emit_json(const CliOptions& options, const nlohmann::json& payload)
{
    if (auto written = write_output(options, payload.dump(2) + "\n"); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return kExitFailure;
    }
    return kExitOk;
}

[[nodiscard]] std::string_view schema_for(linkdiff::Strategy strategy)
{
    switch (strategy) {
        case linkdiff::Strategy::kStructural:
            return linkdiff::common::kStructuralDeltaSchema;
        case linkdiff::Strategy::kOperational:
            return linkdiff::common::kOperationalDiffSchema;
        case linkdiff::Strategy::kSemantic:
            return linkdiff::common::kSemanticDiffSchema;
    }
    return linkdiff::common::kStructuralDeltaSchema;
}

/// Operational and semantic diffs are recognized by their top-level keys.
[[nodiscard]] linkdiff::Strategy infer_strategy(const nlohmann::json& delta)
{
    if (delta.is_object() && delta.contains("operations") && delta.contains("metadata")) {
        return linkdiff::Strategy::kOperational;
    }
    if (delta.is_object() && delta.contains("added_triples") && delta.contains("removed_triples")) {
        return linkdiff::Strategy::kSemantic;
    }
    return linkdiff::Strategy::kStructural;
}

/// Read a delta file, settle its strategy and validate it against the matching schema.
[[nodiscard]] linkdiff::Result<std::pair<linkdiff::Strategy, nlohmann::json>>
load_delta_file(const CliOptions& options, const std::string& path)
{
    auto payload = linkdiff::common::read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    linkdiff::Strategy strategy = infer_strategy(*payload);
    if (options.strategy) {
        auto parsed = linkdiff::parse_strategy(*options.strategy);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        strategy = *parsed;
    }
    if (auto valid = linkdiff::common::validate_json_named(*payload, options.schema_dir, schema_for(strategy));
        !valid) {
        return std::unexpected(
            linkdiff::Error::make(valid.error().code, std::format("{}: {}", path, valid.error().message)));
    }
    return std::pair{strategy, std::move(*payload)};
}

[[nodiscard]] linkdiff::DiffOptions diff_options_for(const CliOptions& options, linkdiff::Strategy strategy)
{
    linkdiff::DiffOptions diff_options;
    diff_options.strategy = std::string(linkdiff::strategy_name(strategy));
    diff_options.structural.include_moves = options.include_moves;
    diff_options.structural.array_diff =
        options.simple_arrays ? linkdiff::structural::ArrayDiffMode::kSimple : linkdiff::structural::ArrayDiffMode::kLcs;
    diff_options.structural.text_diff = options.text_diff;
    diff_options.operational.actor_id = options.actor_id;
    diff_options.operational.timestamp = options.timestamp;
    return diff_options;
}

int run_diff(const CliOptions& options)
{
    auto strategy = linkdiff::parse_strategy(options.strategy.value_or("structural"));
    if (!strategy) {
        std::println(stderr, "Error: {}", strategy.error().message);
        return kExitUsage;
    }
    auto old_doc = linkdiff::common::read_json_file(options.old_path);
    if (!old_doc) {
        std::println(stderr, "Error: {}", old_doc.error().message);
        return kExitFailure;
    }
    auto new_doc = linkdiff::common::read_json_file(options.new_path);
    if (!new_doc) {
        std::println(stderr, "Error: {}", new_doc.error().message);
        return kExitFailure;
    }
    auto delta = linkdiff::diff(*old_doc, *new_doc, diff_options_for(options, *strategy));
    if (!delta) {
        std::println(stderr, "Error: diff failed: {}", delta.error().message);
        return kExitFailure;
    }
    return emit_json(options, *delta);
}

int run_patch(const CliOptions& options, bool validate_only)
{
    auto doc = linkdiff::common::read_json_file(options.doc_path);
    if (!doc) {
        std::println(stderr, "Error: {}", doc.error().message);
        return kExitFailure;
    }
    auto delta = load_delta_file(options, options.delta_path);
    if (!delta) {
        std::println(stderr, "Error: {}", delta.error().message);
        return delta.error().code == linkdiff::errc::kInvalidStrategy ? kExitUsage : kExitFailure;
    }
    const auto diff_options = diff_options_for(options, delta->first);
    if (validate_only) {
        const bool valid = linkdiff::validate_patch(*doc, delta->second, diff_options);
        std::println("{}", valid);
        return valid ? kExitOk : kExitFailure;
    }
    auto patched = linkdiff::patch(*doc, delta->second, diff_options);
    if (!patched) {
        std::println(stderr, "Error: patch failed: {}", patched.error().message);
        return kExitFailure;
    }
    return emit_json(options, *patched);
}

int run_merge(const CliOptions& options)
{
    linkdiff::MergeOptions merge_options;
    if (options.strategy) {
        merge_options.strategy = *options.strategy;
    }
    if (auto strategy = linkdiff::parse_strategy(merge_options.strategy); !strategy) {
        std::println(stderr, "Error: {}", strategy.error().message);
        return kExitUsage;
    }
    if (options.conflict_resolution) {
        merge_options.conflict_resolution = linkdiff::operational::parse_conflict_resolution(*options.conflict_resolution);
        if (!merge_options.conflict_resolution) {
            std::println(stderr, "Error: Unknown conflict resolution: {}", *options.conflict_resolution);
            return kExitUsage;
        }
    }

    CliOptions per_file = options;
    per_file.strategy = merge_options.strategy;
    std::vector<nlohmann::json> deltas;
    for (const auto& path : options.inputs) {
        auto delta = load_delta_file(per_file, path);
        if (!delta) {
            std::println(stderr, "Error: {}", delta.error().message);
            return kExitFailure;
        }
        deltas.push_back(std::move(delta->second));
    }
    auto merged = linkdiff::merge_diffs(deltas, merge_options);
    if (!merged) {
        std::println(stderr, "Error: merge failed: {}", merged.error().message);
        return kExitFailure;
    }
    return emit_json(options, *merged);
}

int run_inverse(const CliOptions& options)
{
    auto delta = load_delta_file(options, options.delta_path);
    if (!delta) {
        std::println(stderr, "Error: {}", delta.error().message);
        return delta.error().code == linkdiff::errc::kInvalidStrategy ? kExitUsage : kExitFailure;
    }
    auto inverted = linkdiff::inverse(delta->second, diff_options_for(options, delta->first));
    if (!inverted) {
        std::println(stderr, "Error: inverse failed: {}", inverted.error().message);
        return kExitFailure;
    }
    return emit_json(options, *inverted);
}

int run_hash(const CliOptions& options)
{
    auto form = linkdiff::c14n::parse_form(options.form);
    if (!form) {
        std::println(stderr, "Error: Unknown hash form: {}", options.form);
        return kExitUsage;
    }
    auto doc = linkdiff::common::read_json_file(options.inputs.front());
    if (!doc) {
        std::println(stderr, "Error: {}", doc.error().message);
        return kExitFailure;
    }
    auto hash = linkdiff::c14n::hash(*doc, *form);
    if (!hash) {
        std::println(stderr, "Error: hash failed: {}", hash.error().message);
        return kExitFailure;
    }
    return emit_json(options, linkdiff::c14n::hash_to_json(*hash));
}

int run_canonicalize(const CliOptions& options)
{
    auto doc = linkdiff::common::read_json_file(options.inputs.front());
    if (!doc) {
        std::println(stderr, "Error: {}", doc.error().message);
        return kExitFailure;
    }
    std::string text;
    if (options.rdf) {
        auto form = linkdiff::accel::canonicalize_rdf(*doc);
        if (!form) {
            std::println(stderr, "Error: canonicalization failed: {}", form.error().message);
            return kExitFailure;
        }
        if (!form->conformant) {
            linkdiff::log::info("no canonicalization provider; output uses the non-conformant fallback ordering");
        }
        text = std::move(form->nquads);
    } else {
        auto canonical = linkdiff::accel::canonical_json(*doc);
        if (!canonical) {
            std::println(stderr, "Error: canonicalization failed: {}", canonical.error().message);
            return kExitFailure;
        }
        text = std::move(*canonical) + "\n";
    }
    if (auto written = write_output(options, text); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return kExitFailure;
    }
    return kExitOk;
}

using HelpFn = void (*)();

/// Parse, print help, check required arguments and configure.
[[nodiscard]] std::optional<int> prepare(std::span<char*> args,
                                         HelpFn help,
                                         CliOptions& options,
                                         std::vector<std::string_view> required,
                                         std::size_t min_inputs)
{
    auto parsed = parse_args(args);
    if (!parsed) {
        std::println(stderr, "Error: {}", parsed.error().message);
        return kExitUsage;
    }
    options = std::move(*parsed);
    if (options.show_help) {
        help();
        return kExitOk;
    }
    for (auto flag : required) {
        std::string* slot = string_option_slot(flag, options);
        if (slot != nullptr && slot->empty()) {
            std::println(stderr, "Error: {} is required", flag);
            help();
            return kExitUsage;
        }
    }
    if (options.inputs.size() < min_inputs) {
        std::println(stderr, "Error: missing input file");
        help();
        return kExitUsage;
    }
    if (auto configured = configure(options); !configured) {
        std::println(stderr, "Error: {}", configured.error().message);
        return kExitFailure;
    }
    return std::nullopt;
}

int cmd_diff(std::span<char*> args)
{
    CliOptions options;
    if (auto early = prepare(args, print_diff_help, options, {"--old", "--new"}, 0)) {
        return *early;
    }
    return run_diff(options);
}

int cmd_patch(std::span<char*> args, bool validate_only)
{
    CliOptions options;
    if (auto early = prepare(args,
                             validate_only ? print_validate_help : print_patch_help,
                             options,
                             {"--doc", "--delta"},
                             0)) {
        return *early;
    }
    return run_patch(options, validate_only);
}

int cmd_merge(std::span<char*> args)
{
    CliOptions options;
    if (auto early = prepare(args, print_merge_help, options, {}, 1)) {
        return *early;
    }
    return run_merge(options);
}

int cmd_inverse(std::span<char*> args)
{
    CliOptions options;
    if (auto early = prepare(args, print_inverse_help, options, {"--delta"}, 0)) {
        return *early;
    }
    return run_inverse(options);
}

int cmd_hash(std::span<char*> args)
{
    CliOptions options;
    if (auto early = prepare(args, print_hash_help, options, {}, 1)) {
        return *early;
    }
    return run_hash(options);
}

int cmd_canonicalize(std::span<char*> args)
{
    CliOptions options;
    if (auto early = prepare(args, print_canonicalize_help, options, {}, 1)) {
        return *early;
    }
    return run_canonicalize(options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitUsage;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return kExitOk;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitOk;
        }

        auto args = std::span<char*>(argv + 2, static_cast<std::size_t>(argc - 2));

        if (cmd == "diff") {
            return cmd_diff(args);
        }
        if (cmd == "patch") {
            return cmd_patch(args, false);
        }
        if (cmd == "validate") {
            return cmd_patch(args, true);
        }
        if (cmd == "merge") {
            return cmd_merge(args);
        }
        if (cmd == "inverse") {
            return cmd_inverse(args);
        }
        if (cmd == "hash") {
            return cmd_hash(args);
        }
        if (cmd == "canonicalize") {
            return cmd_canonicalize(args);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return kExitUsage;
    } catch (const std::exception& ex) {
        std::println(stderr, "Error: {}", ex.what());
        return kExitFailure;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
