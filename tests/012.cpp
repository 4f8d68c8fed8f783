#include "utils.hpp"

namespace tracesift::test {

    namespace detail {
        static constexpr auto compile_fields = R"("compile_id": {"frame_id": 0, "frame_compile_id": 0})"sv;

        static std::string rank_log(uint32_t rank, std::string_view cache_artifact, std::string_view collective) {
            std::string log{};
            log += record_with_payload(
                    R"("rank": {}, "artifact": {{"name": "{}", "encoding": "string"}}, {})"_format(
                            rank, cache_artifact, compile_fields),
                    "cache entry");
            log += record_with_payload(
                    R"("rank": {}, "artifact": {{"name": "inductor_collective_schedule", "encoding": "json"}}, {})"_format(
                            rank, compile_fields),
                    collective);
            log += record_with_payload(
                    R"("rank": {}, "artifact": {{"name": "inductor_runtime_and_tensor_meta", "encoding": "json"}}, {})"_format(
                            rank, compile_fields),
                    R"({"ops": [{"name": "mm", "estimated_runtime_ns": 100000.0}], "tensor_meta": [1]})");
            return log;
        }
    }  // namespace detail

    TEST_CASE("012: runtime trace thread ids", "[012][trace]") {
        CHECK(runtime_trace_tid(0U, "-_0_0_0"sv) == 2403570615U);
        CHECK(runtime_trace_tid(1U, "-_0_0_0"sv) == 2218455276U);
        CHECK(runtime_trace_tid(0U, "-_0_0_0"sv) != runtime_trace_tid(0U, "-_1_0_0"sv));
    }

    TEST_CASE("012: runtime trace events", "[012][trace]") {
        std::vector<graph_runtime> runtimes{
                {.rank = 0U, .graph = "-_0_0_0", .ops = {{"mm", 1500.0}, {"add", 200.0}}},
        };
        auto events = build_runtime_trace(runtimes);
        REQUIRE(events.size() == 6U);

        CHECK(json::get_string(events[0], "ph"sv) == "X");
        CHECK(json::get_string(events[0], "name"sv) == "mm");
        CHECK(json::get_number(events[0], "ts"sv) == 0.0);
        CHECK(json::get_number(events[0], "dur"sv) == 2.0);
        CHECK(json::get_number(events[0], "tid"sv) == static_cast<double>(runtime_trace_tid(0U, "-_0_0_0"sv)));
        CHECK(json::get_number(events[1], "ts"sv) == 2.0);
        CHECK(json::get_number(events[1], "dur"sv) == 1.0);

        CHECK(json::get_string(events[2], "name"sv) == "process_name");
        CHECK(json::get_string(*json::find(events[2], "args"sv), "name"sv) == "Rank 0");
        CHECK(json::get_string(events[3], "name"sv) == "process_sort_index");
        CHECK(json::get_string(events[4], "name"sv) == "thread_name");
        CHECK(json::get_string(*json::find(events[4], "args"sv), "name"sv) == "graph -_0_0_0");
        CHECK(json::get_string(events[5], "name"sv) == "thread_sort_index");
        CHECK(json::get_number(*json::find(events[5], "args"sv), "sort_index"sv) == 0.0);
    }

    TEST_CASE("012: analyze ranks over written rank directories", "[012][ranks]") {
        temp_dir out{"analyze"};
        out.write("rank_0/compile_directory.json",
                  R"({"[0/0]": {"artifacts": [{"url": "-_0_0_0/x.json", "name": "x.json", "number": 0, "suffix": "✅"}]}})");
        out.write("rank_1/compile_directory.json",
                  R"({"[0/0]": {"artifacts": [{"url": "-_0_0_0/x.json", "name": "x.json", "number": 0, "suffix": "✅"}]}})");
        out.write("rank_0/chromium_events.json", R"([{"name": "e0"}])");
        out.write("rank_1/chromium_events.json", R"([])");

        auto report = analyze_ranks(out.path, {0U, 1U});
        CHECK_FALSE(report.any_divergence());
        CHECK(report.has_chromium_events);
        CHECK_FALSE(report.artifacts.runtime_trace);
        CHECK_FALSE(report.analysis.has_value());
        CHECK(report.cache_groups.empty());

        CHECK(fs::exists(out.path / "chromium_events.json"));
        CHECK(fs::exists(out.path / "diagnostics.json"));
        CHECK_FALSE(fs::exists(out.path / "runtime_estimations.json"));
        CHECK_FALSE(fs::exists(out.path / "collective_schedules.json"));

        auto combined = json::parse(internal::files::read_text_file(out.path / "chromium_events.json"));
        REQUIRE(json::as_array(combined)->size() == 1U);
        CHECK(json::get_number(json::as_array(combined)->front(), "pid"sv) == 0.0);
    }

    TEST_CASE("012: all ranks end to end", "[012][ranks]") {
        temp_dir in{"all_ranks_in"};
        temp_dir out{"all_ranks_out"};
        in.write("dedicated_log_torch_trace_rank_0_abc.log",
                 detail::rank_log(0U, "fx_graph_cache_hit", R"(["all_reduce", "all_gather"])"));
        in.write("dedicated_log_torch_trace_rank_1_def.log",
                 detail::rank_log(1U, "fx_graph_cache_miss", R"(["all_gather", "all_reduce"])"));
        in.write("unrelated.log", "ignored\n");

        auto target = out.path / "report";
        auto report = cli::handle_all_ranks(quiet_config(), in.path, target, false);

        CHECK(fs::exists(target / "rank_0" / "raw.log"));
        CHECK(fs::exists(target / "rank_1" / "compile_directory.json"));
        CHECK(fs::exists(target / "runtime_estimations.json"));
        CHECK(fs::exists(target / "chromium_trace_with_runtime.json"));
        CHECK(fs::exists(target / "collective_schedules.json"));

        CHECK(report.divergence.cache);
        CHECK(report.divergence.collective);
        CHECK_FALSE(report.divergence.tensor_meta);
        CHECK_FALSE(report.divergence.compile_ids);
        CHECK(report.any_divergence());

        REQUIRE(report.cache_groups.size() == 2U);
        CHECK(report.cache_groups[0].sequence == "✅");
        CHECK(report.cache_groups[0].ranks == std::vector<uint32_t>{0U});
        CHECK(report.cache_groups[1].sequence == "❌");

        REQUIRE(report.analysis.has_value());
        REQUIRE(report.analysis->graphs.size() == 1U);
        CHECK(report.analysis->graphs[0].graph_id == "-_0_0_0");
        CHECK(report.analysis->graphs[0].delta_ms == 0.0);

        auto diagnostics = json::parse(internal::files::read_text_file(target / "diagnostics.json"));
        auto* groups = json::as_array(*json::find(diagnostics, "collective_groups"sv));
        REQUIRE(groups != nullptr);
        REQUIRE(groups->size() == 2U);
        CHECK(json::get_string(groups->front(), "ranks"sv) == "1");

        CHECK_THROWS_AS(cli::handle_all_ranks(quiet_config(), in.path, target, false), std::runtime_error);
        CHECK_NOTHROW(cli::handle_all_ranks(quiet_config(), in.path, target, true));
    }

    TEST_CASE("012: duplicate rank logs need overwrite", "[012][ranks]") {
        temp_dir in{"duplicate_ranks"};
        temp_dir out{"duplicate_ranks_out"};
        in.write("dedicated_log_torch_trace_rank_0_a.log", record(R"({"rank": 0, "link": {"name": "first", "url": "u"}})"));
        in.write("dedicated_log_torch_trace_rank_0_b.log", record(R"({"rank": 0, "link": {"name": "second", "url": "u"}})"));

        CHECK_THROWS_AS(cli::handle_all_ranks(quiet_config(), in.path, out.path / "strict", false), std::runtime_error);

        auto target = out.path / "replaced";
        auto report = cli::handle_all_ranks(quiet_config(), in.path, target, true);
        CHECK_FALSE(report.any_divergence());
        auto directory = internal::files::read_text_file(target / "rank_0" / "compile_directory.json");
        CHECK(directory.find("second") != std::string::npos);
        CHECK(directory.find("first") == std::string::npos);
    }

    TEST_CASE("012: all ranks input validation", "[012][ranks]") {
        temp_dir in{"all_ranks_empty"};
        temp_dir out{"all_ranks_empty_out"};
        CHECK_THROWS_AS(cli::handle_all_ranks(quiet_config(), in.path, out.path / "r", false), std::runtime_error);
        auto file = in.write("plain.log", "x\n");
        CHECK_THROWS_AS(cli::handle_all_ranks(quiet_config(), file, out.path / "r", false), std::runtime_error);
    }

}  // namespace tracesift::test
