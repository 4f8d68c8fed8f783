#include "tracesift/ranks.hpp"

#include "internal/digest.hpp"
#include "tracesift/format.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <map>
#include <set>

using namespace tracesift::literals;

namespace tracesift {

    namespace detail {

        static double round_ms(double ns) { return std::round(ns / 1e6 * 1000.0) / 1000.0; }

        static json::value make_unsigned(uint64_t v) { return json::make_number(static_cast<double>(v)); }

        static json::value make_metadata_event(std::string_view name, uint32_t pid, json::value args) {
            auto event = json::make_object();
            auto& fields = *json::as_object(event);
            fields["name"] = json::make_string(std::string{name});
            fields["ph"] = json::make_string("M");
            fields["pid"] = make_unsigned(pid);
            fields["args"] = std::move(args);
            return event;
        }

        static json::value make_args(std::string_view key, json::value value) {
            auto args = json::make_object();
            (*json::as_object(args))[std::string{key}] = std::move(value);
            return args;
        }

    }  // namespace detail

    runtime_analysis analyze_graph_runtime_deltas(const std::vector<graph_runtime>& runtimes) {
        // rank -> (graph id, total ns) in input order
        std::map<uint32_t, std::vector<std::pair<std::string, double>>> by_rank{};
        for (const auto& gr : runtimes) {
            double total = 0.0;
            for (const auto& op : gr.ops) {
                total += op.estimated_runtime_ns;
            }
            by_rank[gr.rank].emplace_back(gr.graph, total);
        }

        runtime_analysis out{};
        if (by_rank.empty()) {
            return out;
        }

        auto [min_it, max_it] = std::ranges::minmax_element(
                by_rank, {}, [](const auto& entry) { return entry.second.size(); });
        if (min_it->second.size() != max_it->second.size()) {
            out.has_mismatched_graph_counts = true;
            return out;
        }

        auto num_graphs = by_rank.begin()->second.size();
        for (size_t index = 0U; index < num_graphs; ++index) {
            auto min_runtime = std::numeric_limits<double>::infinity();
            auto max_runtime = -std::numeric_limits<double>::infinity();
            uint32_t fastest = 0U;
            uint32_t slowest = 0U;

            // ranks ascending; on equal totals the later rank takes both sides
            for (const auto& [rank, graphs] : by_rank) {
                auto runtime = graphs[index].second;
                if (runtime <= min_runtime) {
                    min_runtime = runtime;
                    fastest = rank;
                }
                if (runtime >= max_runtime) {
                    max_runtime = runtime;
                    slowest = rank;
                }
            }

            out.graphs.push_back(graph_analysis{
                    .graph_index = index,
                    .graph_id = by_rank.begin()->second[index].first,
                    .delta_ms = detail::round_ms(max_runtime - min_runtime),
                    .rank_details = {
                            runtime_rank_detail{.rank = fastest, .runtime_ms = detail::round_ms(min_runtime)},
                            runtime_rank_detail{.rank = slowest, .runtime_ms = detail::round_ms(max_runtime)}}});
        }

        std::ranges::stable_sort(out.graphs, {}, &graph_analysis::graph_id);
        return out;
    }

    // FNV-1a over the little-endian rank followed by the graph name
    uint32_t runtime_trace_tid(uint32_t rank, std::string_view graph) {
        std::array<char, 4> rank_bytes{};
        for (size_t i = 0U; i < rank_bytes.size(); ++i) {
            rank_bytes[i] = static_cast<char>((rank >> (8U * i)) & 0xffU);
        }
        auto hash = internal::digest::fnv1a_32(std::string_view{rank_bytes.data(), rank_bytes.size()});
        return internal::digest::fnv1a_32(graph, hash);
    }

    std::vector<json::value> build_runtime_trace(const std::vector<graph_runtime>& runtimes) {
        std::vector<json::value> events{};
        std::set<uint32_t> pids{};
        std::map<std::pair<uint32_t, uint32_t>, std::string> thread_names{};

        for (const auto& gr : runtimes) {
            pids.insert(gr.rank);
            auto tid = runtime_trace_tid(gr.rank, gr.graph);
            thread_names.try_emplace({gr.rank, tid}, gr.graph);

            uint64_t time_offset_us = 0U;
            for (const auto& op : gr.ops) {
                auto dur_us = static_cast<uint64_t>(std::max(1.0, std::ceil(op.estimated_runtime_ns / 1000.0)));

                auto args = json::make_object();
                auto& arg_fields = *json::as_object(args);
                arg_fields["graph"] = json::make_string(gr.graph);
                arg_fields["rank"] = detail::make_unsigned(gr.rank);
                arg_fields["runtime_ns"] = detail::make_unsigned(static_cast<uint64_t>(op.estimated_runtime_ns));

                auto event = json::make_object();
                auto& fields = *json::as_object(event);
                fields["name"] = json::make_string(op.name);
                fields["ph"] = json::make_string("X");
                fields["ts"] = detail::make_unsigned(time_offset_us);
                fields["dur"] = detail::make_unsigned(dur_us);
                fields["pid"] = detail::make_unsigned(gr.rank);
                fields["tid"] = detail::make_unsigned(tid);
                fields["cat"] = json::make_string("runtime");
                fields["args"] = std::move(args);
                events.push_back(std::move(event));

                time_offset_us += dur_us;
            }
        }

        for (auto pid : pids) {
            events.push_back(detail::make_metadata_event(
                    "process_name"sv, pid, detail::make_args("name"sv, json::make_string("Rank {}"_format(pid)))));
            events.push_back(detail::make_metadata_event(
                    "process_sort_index"sv, pid, detail::make_args("sort_index"sv, detail::make_unsigned(pid))));
        }

        std::map<uint32_t, std::vector<std::pair<std::string, uint32_t>>> threads_by_pid{};
        for (const auto& [key, graph] : thread_names) {
            threads_by_pid[key.first].emplace_back(graph, key.second);
        }
        for (auto& [pid, threads] : threads_by_pid) {
            std::ranges::sort(threads);
            for (size_t idx = 0U; idx < threads.size(); ++idx) {
                const auto& [graph, tid] = threads[idx];

                auto name = detail::make_metadata_event(
                        "thread_name"sv, pid, detail::make_args("name"sv, json::make_string("graph {}"_format(graph))));
                (*json::as_object(name))["tid"] = detail::make_unsigned(tid);
                events.push_back(std::move(name));

                auto sort_index = detail::make_metadata_event(
                        "thread_sort_index"sv, pid, detail::make_args("sort_index"sv, detail::make_unsigned(idx)));
                (*json::as_object(sort_index))["tid"] = detail::make_unsigned(tid);
                events.push_back(std::move(sort_index));
            }
        }
        return events;
    }

}  // namespace tracesift
