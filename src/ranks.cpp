#include "tracesift/ranks.hpp"

#include "internal/files.hpp"
#include "internal/types.hpp"
#include "tracesift/format.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>

using namespace tracesift::literals;

namespace tracesift {

    namespace detail {

        namespace fs = std::filesystem;

        static std::vector<fs::path> sorted_entries(const fs::path& dir, bool directories) {
            std::vector<fs::path> out{};
            for (const auto& entry : fs::directory_iterator{dir}) {
                if (directories ? entry.is_directory() : entry.is_regular_file()) {
                    out.push_back(entry.path());
                }
            }
            std::ranges::sort(out);
            return out;
        }

        // First <prefix>*.json of every compile directory, compile directories in name order
        template <typename T, typename F>
        static std::vector<T> read_artifacts(
                const fs::path& out_dir, const std::vector<uint32_t>& ranks, std::string_view prefix, F&& parse_fn) {
            std::vector<T> results{};
            for (auto rank : ranks) {
                auto rank_dir = out_dir / "rank_{}"_format(rank);
                if (!fs::is_directory(rank_dir)) {
                    continue;
                }
                for (const auto& compile_dir : sorted_entries(rank_dir, true)) {
                    std::optional<fs::path> match{};
                    for (const auto& file : sorted_entries(compile_dir, false)) {
                        if (file.extension() == ".json" && file.stem().string().starts_with(prefix)) {
                            match = file;
                            break;
                        }
                    }
                    if (!match) {
                        continue;
                    }
                    auto content = internal::files::read_text_file(*match);
                    std::optional<T> result{};
                    try {
                        result = parse_fn(content, rank, compile_dir.filename().string());
                    } catch (const std::runtime_error& e) {
                        throw std::runtime_error("reading {} for rank {}: {}"_format(prefix, rank, e.what()));
                    }
                    if (result) {
                        results.push_back(std::move(*result));
                    }
                }
            }
            return results;
        }

        static std::optional<uint64_t> lenient_unsigned(const json::value& v) {
            auto* d = std::get_if<double>(&v.data);
            // below 2^64; NaN and infinities fail the range check
            if (d == nullptr || !(*d >= 0.0 && *d < 18446744073709551616.0) || std::floor(*d) != *d) {
                return std::nullopt;
            }
            return static_cast<uint64_t>(*d);
        }

        static std::string join_ranks(const std::vector<uint32_t>& ranks) {
            std::vector<std::string> parts{};
            parts.reserve(ranks.size());
            for (auto rank : ranks) {
                parts.push_back(std::to_string(rank));
            }
            return utils::join_with_separator(parts, ", "sv);
        }

        static std::vector<internal::divergence_group_record> to_records(const std::vector<divergence_group>& groups) {
            std::vector<internal::divergence_group_record> out{};
            out.reserve(groups.size());
            for (const auto& group : groups) {
                out.push_back(internal::divergence_group_record{.sequence = group.sequence, .ranks = join_ranks(group.ranks)});
            }
            return out;
        }

    }  // namespace detail

    divergence_result group_by_signature(const std::vector<std::pair<uint32_t, std::string>>& signatures) {
        std::map<std::string, std::vector<uint32_t>> by_signature{};
        for (const auto& [rank, signature] : signatures) {
            by_signature[signature].push_back(rank);
        }
        divergence_result out{};
        for (auto& [signature, ranks] : by_signature) {
            std::ranges::sort(ranks);
            out.groups.push_back(divergence_group{.sequence = signature, .ranks = std::move(ranks)});
        }
        return out;
    }

    rank_metadata rank_metadata_from_json(std::string_view content, uint32_t rank) {
        rank_metadata out{.rank = rank};

        json::value parsed{};
        try {
            parsed = json::parse(content);
        } catch (const std::runtime_error& e) {
            debug_log("unreadable compile directory for rank ", rank, ": ", e.what());
            return out;
        }
        auto* buckets = json::as_object(parsed);
        if (buckets == nullptr) {
            return out;
        }

        std::vector<std::pair<uint64_t, std::string>> suffixes{};
        for (const auto& [key, bucket] : *buckets) {
            if (key != "unknown" && !key.starts_with("unknown_")) {
                out.compile_ids.insert(key);
            }
            auto* artifacts = json::find(bucket, "artifacts"sv);
            if (artifacts == nullptr) {
                continue;
            }
            auto* list = json::as_array(*artifacts);
            if (list == nullptr) {
                continue;
            }
            for (const auto& artifact : *list) {
                auto suffix = json::get_string(artifact, "suffix"sv).value_or("");
                if (suffix.empty()) {
                    continue;
                }
                auto* number = json::find(artifact, "number"sv);
                if (number == nullptr) {
                    continue;
                }
                if (auto n = detail::lenient_unsigned(*number)) {
                    suffixes.emplace_back(*n, std::move(suffix));
                }
            }
        }

        std::ranges::stable_sort(suffixes, {}, &std::pair<uint64_t, std::string>::first);
        for (const auto& entry : suffixes) {
            out.cache_sequence += entry.second;
        }
        return out;
    }

    rank_metadata read_rank_metadata(const std::filesystem::path& rank_dir, uint32_t rank) {
        return rank_metadata_from_json(internal::files::read_text_file(rank_dir / "compile_directory.json"), rank);
    }

    std::vector<graph_runtime> read_runtime_estimations(
            const std::filesystem::path& out_dir, const std::vector<uint32_t>& ranks) {
        return detail::read_artifacts<graph_runtime>(
                out_dir,
                ranks,
                "inductor_runtime_and_tensor_meta"sv,
                [](const std::string& content, uint32_t rank, std::string graph) -> std::optional<graph_runtime> {
                    internal::runtime_file_record record{};
                    auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(record, content);
                    if (ec) {
                        throw std::runtime_error(glz::format_error(ec, content));
                    }
                    if (record.ops.empty()) {
                        return std::nullopt;
                    }
                    return graph_runtime{.rank = rank, .graph = std::move(graph), .ops = std::move(record.ops)};
                });
    }

    std::vector<collective_schedule> read_collective_schedules(
            const std::filesystem::path& out_dir, const std::vector<uint32_t>& ranks) {
        return detail::read_artifacts<collective_schedule>(
                out_dir,
                ranks,
                "inductor_collective_schedule"sv,
                [](const std::string& content, uint32_t rank, std::string graph) -> std::optional<collective_schedule> {
                    std::vector<std::string> ops{};
                    auto ec = glz::read_json(ops, content);
                    if (ec) {
                        throw std::runtime_error(glz::format_error(ec, content));
                    }
                    if (ops.empty()) {
                        return std::nullopt;
                    }
                    return collective_schedule{.rank = rank, .graph = std::move(graph), .ops = std::move(ops)};
                });
    }

    std::vector<tensor_meta_fingerprint> read_tensor_meta_fingerprints(
            const std::filesystem::path& out_dir, const std::vector<uint32_t>& ranks) {
        return detail::read_artifacts<tensor_meta_fingerprint>(
                out_dir,
                ranks,
                "inductor_runtime_and_tensor_meta"sv,
                [](const std::string& content,
                   uint32_t rank,
                   std::string graph) -> std::optional<tensor_meta_fingerprint> {
                    return tensor_meta_fingerprint{
                            .rank = rank,
                            .graph = std::move(graph),
                            .fingerprint = json::write_compact(json::parse(content))};
                });
    }

    std::vector<json::value> read_chromium_events_with_pid(const std::filesystem::path& path, uint32_t rank) {
        if (!std::filesystem::exists(path)) {
            return {};
        }
        auto content = internal::files::read_text_file(path);

        std::vector<json::value> events{};
        auto ec = glz::read_json(events, content);
        if (ec) {
            debug_log("ignoring unreadable chromium events for rank ", rank);
            return {};
        }
        for (auto& event : events) {
            if (auto* fields = json::as_object(event)) {
                fields->insert_or_assign("pid", json::make_number(static_cast<double>(rank)));
            }
        }
        return events;
    }

    std::vector<std::pair<uint32_t, std::string>> collective_signatures(
            const std::vector<collective_schedule>& schedules, const std::vector<uint32_t>& ranks) {
        std::vector<std::pair<uint32_t, std::string>> out{};
        for (auto rank : ranks) {
            std::vector<std::string> ops{};
            for (const auto& schedule : schedules) {
                if (schedule.rank == rank) {
                    ops.insert(ops.end(), schedule.ops.begin(), schedule.ops.end());
                }
            }
            out.emplace_back(rank, utils::join_with_separator(ops, ","sv));
        }
        return out;
    }

    std::vector<std::pair<uint32_t, std::string>> tensor_meta_signatures(
            const std::vector<tensor_meta_fingerprint>& fingerprints) {
        std::map<uint32_t, std::vector<std::pair<std::string, std::string>>> by_rank{};
        for (const auto& fp : fingerprints) {
            by_rank[fp.rank].emplace_back(fp.graph, fp.fingerprint);
        }
        std::vector<std::pair<uint32_t, std::string>> out{};
        for (auto& [rank, entries] : by_rank) {
            std::ranges::stable_sort(entries, {}, &std::pair<std::string, std::string>::first);
            std::vector<std::string> parts{};
            for (auto& entry : entries) {
                parts.push_back(std::move(entry.second));
            }
            out.emplace_back(rank, utils::join_with_separator(parts, ","sv));
        }
        return out;
    }

    diagnostics analyze_ranks(const std::filesystem::path& out_dir, const std::vector<uint32_t>& ranks) {
        namespace files = internal::files;

        diagnostics out{};
        std::vector<std::pair<uint32_t, std::string>> cache_signatures{};
        std::vector<std::pair<uint32_t, std::string>> compile_id_signatures{};
        std::vector<json::value> events{};

        for (auto rank : ranks) {
            auto rank_dir = out_dir / "rank_{}"_format(rank);
            auto metadata = read_rank_metadata(rank_dir, rank);
            cache_signatures.emplace_back(rank, std::move(metadata.cache_sequence));
            std::vector<std::string> ids{metadata.compile_ids.begin(), metadata.compile_ids.end()};
            compile_id_signatures.emplace_back(rank, utils::join_with_separator(ids, ","sv));

            auto rank_events = read_chromium_events_with_pid(rank_dir / "chromium_events.json", rank);
            std::ranges::move(rank_events, std::back_inserter(events));
        }

        if (!events.empty()) {
            out.has_chromium_events = true;
            files::write_text_file(out_dir / "chromium_events.json", json::write_pretty(events));
        }

        auto runtimes = read_runtime_estimations(out_dir, ranks);
        if (!runtimes.empty()) {
            files::write_text_file(out_dir / "runtime_estimations.json", json::write_pretty(runtimes));
            files::write_text_file(
                    out_dir / "chromium_trace_with_runtime.json", json::write_pretty(build_runtime_trace(runtimes)));
            out.artifacts.runtime_trace = true;
            out.analysis = analyze_graph_runtime_deltas(runtimes);
        }

        auto schedules = read_collective_schedules(out_dir, ranks);
        divergence_result collective_groups{};
        if (!schedules.empty()) {
            files::write_text_file(out_dir / "collective_schedules.json", json::write_pretty(schedules));
            collective_groups = group_by_signature(collective_signatures(schedules, ranks));
        }

        auto fingerprints = read_tensor_meta_fingerprints(out_dir, ranks);
        divergence_result tensor_meta_groups{};
        if (!fingerprints.empty()) {
            tensor_meta_groups = group_by_signature(tensor_meta_signatures(fingerprints));
        }

        auto cache_groups = group_by_signature(cache_signatures);
        auto compile_id_groups = group_by_signature(compile_id_signatures);

        out.divergence = divergence_flags{
                .cache = cache_groups.divergent(),
                .collective = collective_groups.divergent(),
                .tensor_meta = tensor_meta_groups.divergent(),
                .compile_ids = compile_id_groups.divergent()};
        if (cache_groups.divergent()) {
            out.cache_groups = std::move(cache_groups.groups);
        }
        if (collective_groups.divergent()) {
            out.collective_groups = std::move(collective_groups.groups);
        }
        if (tensor_meta_groups.divergent()) {
            out.tensor_meta_groups = std::move(tensor_meta_groups.groups);
        }
        if (compile_id_groups.divergent()) {
            out.compile_id_groups = std::move(compile_id_groups.groups);
        }

        internal::diagnostics_record record{
                .divergence = out.divergence,
                .artifacts = out.artifacts,
                .analysis = out.analysis,
                .cache_groups = detail::to_records(out.cache_groups),
                .collective_groups = detail::to_records(out.collective_groups),
                .tensor_meta_groups = detail::to_records(out.tensor_meta_groups),
                .compile_id_groups = detail::to_records(out.compile_id_groups)};
        files::write_text_file(out_dir / "diagnostics.json", json::write_pretty(record));
        return out;
    }

}  // namespace tracesift
