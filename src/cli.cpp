#include "tracesift/cli.hpp"

#include "internal/files.hpp"
#include "tracesift/format.hpp"

#include <CLI/CLI.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace tracesift::literals;

namespace tracesift::cli {

    namespace detail {

        using namespace std::string_view_literals;
        namespace fs = std::filesystem;

        static constexpr auto rank_log_prefix = "dedicated_log_torch_trace_rank_"sv;

        static std::optional<uint32_t> rank_from_log_name(std::string_view name) {
            if (!name.starts_with(rank_log_prefix) || !name.ends_with(".log"sv)) {
                return std::nullopt;
            }
            name.remove_prefix(rank_log_prefix.size());
            name.remove_suffix(4U);
            if (auto sep = name.find('_'); sep != std::string_view::npos) {
                name = name.substr(0U, sep);
            }
            return utils::parse_arithmetic<uint32_t>(name);
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"tracesift: structured trace log report generator"};

        bool show_version = false;
        bool plain_text = false;
        std::string input_arg{};
        std::string out_arg{cfg.output_dir.string()};

        app.add_option("path", input_arg, "Trace log, or a directory with --latest / --all-ranks");
        app.add_option("-o,--out", out_arg, "Output directory");
        app.add_flag("--overwrite", cfg.overwrite, "Delete the output directory if it already exists");
        app.add_flag("--latest", cfg.latest, "Parse the most recently modified log of the input directory");
        app.add_flag("--all-ranks", cfg.all_ranks, "Parse every rank log of the input directory");
        app.add_flag("--strict", cfg.strict, "Fail on any malformed line or handler failure");
        app.add_flag("--strict-compile-id", cfg.strict_compile_id, "Fail when a record has no compile id");
        app.add_flag("-v,--verbose", cfg.verbose, "Report every unknown envelope field");
        app.add_flag("--quiet", cfg.quiet, "Suppress warnings and statistics");
        app.add_flag("-p,--plain-text", plain_text, "Emit plain text artifacts instead of rendered HTML");
        app.add_flag("-e,--export", cfg.export_mode, "Collect exported program failures only");
        app.add_flag("--version", show_version, "Print version and exit");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "tracesift 0.1.0\n";
            return std::optional<int>{0};
        }

        if (input_arg.empty()) {
            std::cerr << "missing input path\n";
            return std::optional<int>{2};
        }
        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (cfg.latest && cfg.all_ranks) {
            std::cerr << "--latest cannot be used with --all-ranks\n";
            return std::optional<int>{2};
        }

        cfg.input = input_arg;
        cfg.output_dir = out_arg;
        cfg.output = plain_text ? output_mode::plain_text : output_mode::rendered;
        return std::nullopt;
    }

    void setup_output_directory(const std::filesystem::path& out_dir, bool overwrite) {
        if (std::filesystem::exists(out_dir)) {
            if (!overwrite) {
                throw std::runtime_error(
                        "Directory {} already exists; pass --overwrite to replace it or use -o OUTDIR"_format(
                                out_dir.string()));
            }
            std::error_code ec{};
            std::filesystem::remove_all(out_dir, ec);
            if (ec) {
                throw std::runtime_error("failed to remove directory {}: {}"_format(out_dir.string(), ec.message()));
            }
        }
        internal::files::ensure_dir(out_dir);
    }

    std::filesystem::path resolve_latest(const std::filesystem::path& dir) {
        namespace fs = std::filesystem;
        if (!fs::is_directory(dir)) {
            throw std::runtime_error(
                    "Input path {} is not a directory (required when using --latest)"_format(dir.string()));
        }

        std::optional<fs::path> latest{};
        fs::file_time_type latest_time{};
        for (const auto& entry : fs::directory_iterator{dir}) {
            if (!entry.is_regular_file()) {
                continue;
            }
            auto modified = entry.last_write_time();
            if (!latest || modified > latest_time) {
                latest = entry.path();
                latest_time = modified;
            }
        }
        if (!latest) {
            throw std::runtime_error("No files found in directory {}"_format(dir.string()));
        }
        return *latest;
    }

    std::vector<std::pair<std::filesystem::path, uint32_t>> discover_rank_logs(const std::filesystem::path& dir) {
        std::vector<std::pair<std::filesystem::path, uint32_t>> logs{};
        for (const auto& entry : std::filesystem::directory_iterator{dir}) {
            if (!entry.is_regular_file()) {
                continue;
            }
            if (auto rank = detail::rank_from_log_name(entry.path().filename().string())) {
                logs.emplace_back(entry.path(), *rank);
            }
        }
        std::ranges::sort(logs, [](const auto& a, const auto& b) {
            return a.second != b.second ? a.second < b.second : a.first < b.first;
        });
        return logs;
    }

    void write_parse_output(const parse_output& output, const std::filesystem::path& out_dir) {
        for (const auto& [path, content] : output) {
            internal::files::write_text_file(out_dir / path, content);
        }
    }

    parse_result handle_one_rank(
            const parse_config& cfg, const std::filesystem::path& log_path, const std::filesystem::path& out_dir,
            bool overwrite) {
        auto result = parse_path(log_path, cfg);
        setup_output_directory(out_dir, overwrite);
        write_parse_output(result.output, out_dir);
        return result;
    }

    diagnostics handle_all_ranks(
            const parse_config& cfg, const std::filesystem::path& input_dir, const std::filesystem::path& out_dir,
            bool overwrite) {
        if (!std::filesystem::is_directory(input_dir)) {
            throw std::runtime_error(
                    "Input path {} must be a directory when using --all-ranks"_format(input_dir.string()));
        }

        auto logs = discover_rank_logs(input_dir);
        if (logs.empty()) {
            throw std::runtime_error("No rank log files found in directory {}"_format(input_dir.string()));
        }

        setup_output_directory(out_dir, overwrite);

        std::set<uint32_t> seen{};
        std::vector<uint32_t> ranks{};
        for (const auto& [log_path, rank] : logs) {
            auto subdir = out_dir / "rank_{}"_format(rank);
            if (!cfg.quiet) {
                std::cout << "Processing rank {} -> {}"_format(rank, subdir.string()) << '\n';
            }
            if (seen.contains(rank) && !cfg.quiet) {
                std::cerr << "Rank {} appears in more than one log; {} replaces the earlier output"_format(
                                     rank, log_path.string())
                          << '\n';
            }
            handle_one_rank(cfg, log_path, subdir, overwrite);
            if (seen.insert(rank).second) {
                ranks.push_back(rank);
            }
        }

        auto report = analyze_ranks(out_dir, ranks);
        if (!cfg.quiet) {
            std::cout << "Multi-rank report generated under {}"_format(out_dir.string()) << '\n';
            if (report.any_divergence()) {
                std::cout << "Ranks diverged; see {}"_format((out_dir / "diagnostics.json").string()) << '\n';
            }
        }
        return report;
    }

    int run(const startup_config& cfg) {
        auto parse_cfg = make_parse_config(cfg);

        if (cfg.all_ranks) {
            handle_all_ranks(parse_cfg, cfg.input, cfg.output_dir, cfg.overwrite);
            return 0;
        }

        auto log_path = cfg.latest ? resolve_latest(cfg.input) : cfg.input;
        handle_one_rank(parse_cfg, log_path, cfg.output_dir, cfg.overwrite);
        return 0;
    }

}  // namespace tracesift::cli
