#pragma once

#include "json.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tracesift {

    struct op_runtime {
        std::string name{};
        double estimated_runtime_ns{};
    };

    // Ops of one graph (a compile directory of one rank), in file order
    struct graph_runtime {
        uint32_t rank{};
        std::string graph{};
        std::vector<op_runtime> ops{};
    };

    struct collective_schedule {
        uint32_t rank{};
        std::string graph{};
        std::vector<std::string> ops{};
    };

    // Compact re-serialization of a graph's tensor metadata artifact
    struct tensor_meta_fingerprint {
        uint32_t rank{};
        std::string graph{};
        std::string fingerprint{};
    };

    // Derived from rank_<n>/compile_directory.json
    struct rank_metadata {
        uint32_t rank{};
        std::set<std::string> compile_ids{};
        std::string cache_sequence{};
    };

    struct divergence_group {
        std::string sequence{};
        std::vector<uint32_t> ranks{};
    };

    // Groups ordered by signature, ranks ascending within a group
    struct divergence_result {
        std::vector<divergence_group> groups{};

        bool divergent() const { return groups.size() > 1U; }
    };

    struct runtime_rank_detail {
        uint32_t rank{};
        double runtime_ms{};
    };

    struct graph_analysis {
        size_t graph_index{};
        std::string graph_id{};
        double delta_ms{};
        // fastest, slowest
        std::vector<runtime_rank_detail> rank_details{};
    };

    struct runtime_analysis {
        std::vector<graph_analysis> graphs{};
        bool has_mismatched_graph_counts{false};
    };

    struct divergence_flags {
        bool cache{false};
        bool collective{false};
        bool tensor_meta{false};
        bool compile_ids{false};
    };

    struct artifact_flags {
        bool runtime_trace{false};
    };

    /*
     * Cross-rank summary handed to report renderers.
     *
     * Group lists are empty unless their signature kind diverged; analysis is absent when no rank
     * produced runtime estimations.
     */
    struct diagnostics {
        divergence_flags divergence{};
        artifact_flags artifacts{};
        std::optional<runtime_analysis> analysis{};
        std::vector<divergence_group> cache_groups{};
        std::vector<divergence_group> collective_groups{};
        std::vector<divergence_group> tensor_meta_groups{};
        std::vector<divergence_group> compile_id_groups{};
        bool has_chromium_events{false};

        bool any_divergence() const {
            return divergence.cache || divergence.collective || divergence.tensor_meta || divergence.compile_ids;
        }
    };

    divergence_result group_by_signature(const std::vector<std::pair<uint32_t, std::string>>& signatures);

    // Compile ids exclude the unknown buckets; the cache sequence concatenates non-empty suffixes by number
    rank_metadata rank_metadata_from_json(std::string_view content, uint32_t rank);

    rank_metadata read_rank_metadata(const std::filesystem::path& rank_dir, uint32_t rank);

    // Readers over <out>/rank_<n>/<compile dir>/<prefix>*.json; missing rank directories are skipped
    std::vector<graph_runtime> read_runtime_estimations(
            const std::filesystem::path& out_dir, const std::vector<uint32_t>& ranks);

    std::vector<collective_schedule> read_collective_schedules(
            const std::filesystem::path& out_dir, const std::vector<uint32_t>& ranks);

    std::vector<tensor_meta_fingerprint> read_tensor_meta_fingerprints(
            const std::filesystem::path& out_dir, const std::vector<uint32_t>& ranks);

    // Events tagged with "pid": rank; a missing or unreadable file yields no events
    std::vector<json::value> read_chromium_events_with_pid(const std::filesystem::path& path, uint32_t rank);

    runtime_analysis analyze_graph_runtime_deltas(const std::vector<graph_runtime>& runtimes);

    // Deterministic 32-bit thread id for a (rank, graph) pair
    uint32_t runtime_trace_tid(uint32_t rank, std::string_view graph);

    // Duration events per op followed by process and thread metadata events
    std::vector<json::value> build_runtime_trace(const std::vector<graph_runtime>& runtimes);

    // Per-rank collective op names across graphs joined by ','; ranks without schedules sign ""
    std::vector<std::pair<uint32_t, std::string>> collective_signatures(
            const std::vector<collective_schedule>& schedules, const std::vector<uint32_t>& ranks);

    // Per-rank fingerprints sorted by graph and joined by ','
    std::vector<std::pair<uint32_t, std::string>> tensor_meta_signatures(
            const std::vector<tensor_meta_fingerprint>& fingerprints);

    /*
     * Second pass over <out>/rank_<n>/ for every rank.
     *
     * Writes the combined chromium_events.json, runtime_estimations.json,
     * chromium_trace_with_runtime.json, collective_schedules.json (each only when non-empty) and
     * diagnostics.json under out_dir.
     */
    diagnostics analyze_ranks(const std::filesystem::path& out_dir, const std::vector<uint32_t>& ranks);

}  // namespace tracesift
