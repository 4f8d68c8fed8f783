#pragma once

#include "config.hpp"
#include "interpreter.hpp"
#include "ranks.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

namespace tracesift::cli {

    // nullopt to proceed, otherwise the process exit code
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

    int run(const startup_config& cfg);

    // Removes an existing directory only when overwrite is set
    void setup_output_directory(const std::filesystem::path& out_dir, bool overwrite);

    // Most recently modified regular file of dir
    std::filesystem::path resolve_latest(const std::filesystem::path& dir);

    // dedicated_log_torch_trace_rank_<N>[_*].log files of dir, ordered by rank then path
    std::vector<std::pair<std::filesystem::path, uint32_t>> discover_rank_logs(const std::filesystem::path& dir);

    void write_parse_output(const parse_output& output, const std::filesystem::path& out_dir);

    parse_result handle_one_rank(
            const parse_config& cfg, const std::filesystem::path& log_path, const std::filesystem::path& out_dir,
            bool overwrite);

    diagnostics handle_all_ranks(
            const parse_config& cfg, const std::filesystem::path& input_dir, const std::filesystem::path& out_dir,
            bool overwrite);

}  // namespace tracesift::cli
