#include "utils.hpp"

namespace tracesift::test {

    TEST_CASE("008: side log carries augmented envelopes", "[008][interpreter]") {
        std::string log{};
        log += record(R"({"rank": 0, "link": {"name": "a", "url": "b"}})");
        log += record_with_payload(R"("rank": 0, "dynamo_output_graph": {}, "compile_id": {"frame_id": 0, "frame_compile_id": 0})", "g");

        auto result = run_log(log);
        REQUIRE(result.rank.has_value());
        CHECK(*result.rank == 0U);
        CHECK(result.stats.ok == 2U);

        auto lines = side_log_lines(result);
        REQUIRE(lines.size() == 3U);
        CHECK(lines[0] == R"({"string_table":[null]})");

        auto first = json::parse(lines[1]);
        CHECK(json::get_string(first, "pathname"sv) == "torch/_dynamo/convert_frame.py");
        CHECK(json::get_number(first, "lineno"sv) == 776.0);
        CHECK(json::get_number(first, "thread"sv) == 140064373581632.0);
        auto timestamp = json::get_string(first, "timestamp"sv);
        REQUIRE(timestamp.has_value());
        CHECK(timestamp->ends_with("-04-01T15:37:31.345000Z"));
        CHECK(json::find(first, "payload_filename"sv) == nullptr);

        auto second = json::parse(lines[2]);
        CHECK(json::get_string(second, "payload_filename"sv) == "-_0_0_0/dynamo_output_graph_1.txt");
    }

    TEST_CASE("008: key conflicts drop the side log line only", "[008][interpreter]") {
        auto result = run_log(record(R"({"link": {"name": "a", "url": "b"}, "lineno": 3})"));
        CHECK(result.stats.ok == 1U);
        CHECK(result.stats.fail_key_conflict == 1U);
        CHECK(side_log_lines(result).size() == 1U);
        CHECK(result.stats.strict_failures() == 0U);
    }

    TEST_CASE("008: malformed lines are counted and skipped", "[008][interpreter]") {
        std::string log{};
        log += "not a glog line\n";
        log += record("{broken");
        log += record("[1, 2, 3]");
        log += record(R"({"link": {"name": "a", "url": "b"}})");

        auto result = run_log(log);
        CHECK(result.stats.fail_glog == 1U);
        CHECK(result.stats.fail_json == 2U);
        CHECK(result.stats.ok == 1U);
        CHECK(has_output(result, "compile_directory.json"));
        CHECK(has_output(result, "failures_and_restarts.json"));
        CHECK(has_output(result, "chromium_events.json"));
    }

    TEST_CASE("008: payload record followed by an incomplete record", "[008][interpreter]") {
        std::string log{};
        log += record_with_payload(
                R"("dynamo_output_graph": {}, "compile_id": {"frame_id": 0, "frame_compile_id": 0})", "graph():\n  return x");
        log += record(R"({"link": {"name": "a"}})");
        log += record(R"({"link": {"name": "b", "url": "u"}})");

        auto result = run_log(log);
        CHECK(result.stats.fail_payload_md5 == 0U);
        CHECK(result.stats.ok == 3U);
        CHECK(result.stats.handler_failures.at("link_parser") == 1U);
        CHECK(result.stats.total_handler_failures() == 1U);

        auto* graph = result.find("-_0_0_0/dynamo_output_graph_0.txt");
        REQUIRE(graph != nullptr);
        CHECK(*graph == "graph():\n  return x");

        size_t payload_backed = 0U;
        for (const auto& path : output_paths(result)) {
            if (path.find("dynamo_output_graph") != std::string::npos || path.starts_with("payloads/")) {
                ++payload_backed;
            }
        }
        CHECK(payload_backed == 1U);

        auto directory = json::parse(*result.find("compile_directory.json"));
        auto* unknown = json::as_array(*json::find(*json::find(directory, "unknown"sv), "artifacts"sv));
        REQUIRE(unknown != nullptr);
        REQUIRE(unknown->size() == 1U);
        CHECK(json::get_string(unknown->front(), "name"sv) == "b");
        CHECK(side_log_lines(result).size() == 4U);
    }

    TEST_CASE("008: side log keeps integer digits", "[008][interpreter]") {
        auto result = run_log(record(R"({"link": {"name": "a", "url": "b"}, "trace_id": 9007199254740993})"));
        auto lines = side_log_lines(result);
        REQUIRE(lines.size() == 2U);
        CHECK(lines[1].find("\"trace_id\": 9007199254740993") != std::string::npos);
        CHECK(lines[1].find("\"thread\":140064373581632") != std::string::npos);
        CHECK(lines[1].ends_with(R"("lineno":776})"));

        auto empty = side_log_lines(run_log(record("{}")));
        REQUIRE(empty.size() == 2U);
        CHECK(empty[1].starts_with(R"({"timestamp":")"));
    }

    TEST_CASE("008: oversized string table ids drop only their record", "[008][interpreter]") {
        std::string log{};
        log += record(R"({"str": ["huge.py", 4294967295]})");
        log += record(R"({"str": ["model.py", 1]})");
        log += record(R"({"link": {"name": "a", "url": "b"}})");

        auto result = run_log(log);
        CHECK(result.stats.fail_json == 1U);
        CHECK(result.stats.ok == 1U);
        auto lines = side_log_lines(result);
        REQUIRE_FALSE(lines.empty());
        CHECK(lines[0] == R"({"string_table":[null,"model.py"]})");
    }

    TEST_CASE("008: stack records are recognized without output", "[008][interpreter]") {
        auto result = run_log(record(R"({"stack": [{"line": 1, "name": "f", "filename": 0}]})"));
        CHECK(result.stats.ok == 1U);
        CHECK(result.stats.unknown == 0U);
        CHECK(result.unknown_fields.empty());
        for (const auto& path : output_paths(result)) {
            CHECK((path.ends_with(".json") || path.ends_with(".jsonl")));
        }
    }

    TEST_CASE("008: rank stickiness", "[008][interpreter]") {
        std::string log{};
        log += record(R"({"link": {"name": "init", "url": "u0"}})");
        log += record(R"({"rank": 1, "link": {"name": "a", "url": "u1"}})");
        log += record_with_payload(R"("rank": 2, "dynamo_output_graph": {})", "other rank graph");
        log += record(R"({"link": {"name": "late", "url": "u2"}})");
        log += record(R"({"rank": 1, "link": {"name": "b", "url": "u3"}})");

        auto result = run_log(log);
        REQUIRE(result.rank.has_value());
        CHECK(*result.rank == 1U);
        CHECK(result.stats.ok == 3U);
        CHECK(result.stats.other_rank == 2U);
        for (const auto& path : output_paths(result)) {
            CHECK(path.find("dynamo_output_graph") == std::string::npos);
        }
    }

    TEST_CASE("008: strict modes", "[008][interpreter]") {
        auto strict = quiet_config();
        strict.strict = true;

        CHECK_NOTHROW(run_log(record(R"({"link": {"name": "a", "url": "b"}})"), strict));

        try {
            run_log("garbage\n" + record(R"({"link": {"name": "a", "url": "b"}})"), strict);
            FAIL("strict pass should have raised");
        } catch (const parse_error& e) {
            CHECK(e.stats.fail_glog == 1U);
            CHECK(std::string_view{e.what()}.starts_with("Something went wrong"));
        }

        auto strict_id = quiet_config();
        strict_id.strict_compile_id = true;
        CHECK_THROWS_AS(run_log(record(R"({"link": {"name": "a", "url": "b"}})"), strict_id), parse_error);
        CHECK_NOTHROW(run_log(
                record(R"({"link": {"name": "a", "url": "b"}, "compile_id": {"frame_id": 0, "frame_compile_id": 0}})"),
                strict_id));
    }

    TEST_CASE("008: compilation metrics consume indices and record failures", "[008][interpreter]") {
        std::string log{};
        log += record(R"({"str": ["/site-packages/user/model.py", 0]})");
        log += record(
                R"({"dynamo_start": {"stack": [{"filename": 0, "line": 5, "name": "train"}]},)"
                R"( "compile_id": {"frame_id": 0, "frame_compile_id": 0}})");
        log += record(
                R"({"symbolic_shape_specialization": {"symbol": "s0", "sources": ["L['x'].size()[0]"], "value": "4"},)"
                R"( "compile_id": {"frame_id": 0, "frame_compile_id": 0}})");
        log += record(
                R"({"guard_added_fast": {"expr": "Eq(s0, 4)"}, "compile_id": {"frame_id": 0, "frame_compile_id": 0}})");
        log += record(
                R"({"compilation_metrics": {"co_name": "train", "co_filename": "model.py", "co_firstlineno": 5,)"
                R"( "restart_reasons": ["graph break"], "fail_type": "Unsupported", "fail_reason": "bad op",)"
                R"( "fail_user_frame_filename": "model.py", "fail_user_frame_lineno": 9},)"
                R"( "compile_id": {"frame_id": 0, "frame_compile_id": 0}})");
        log += record(
                R"({"compilation_metrics": {"fail_type": "Unsupported"}, "compile_id": {"frame_id": 1, "frame_compile_id": 0}})");

        auto result = run_log(log);
        CHECK(result.stats.handler_failures.at("compilation_metrics") == 1U);

        auto* metrics_text = result.find("-_0_0_0/compilation_metrics_0.json");
        REQUIRE(metrics_text != nullptr);
        auto metrics = json::parse(*metrics_text);
        CHECK(json::get_string(metrics, "compile_id"sv) == "[0/0]");
        auto* stack = json::as_array(*json::find(metrics, "stack"sv));
        REQUIRE(stack != nullptr);
        REQUIRE(stack->size() == 1U);
        CHECK(json::get_string(stack->front(), "filename"sv) == "user/model.py");
        CHECK(json::as_array(*json::find(metrics, "mini_stack"sv))->size() == 1U);
        CHECK(json::as_array(*json::find(metrics, "symbolic_shape_specializations"sv))->size() == 1U);
        CHECK(json::as_array(*json::find(metrics, "guards_added_fast"sv))->size() == 1U);

        auto failures = json::parse(*result.find("failures_and_restarts.json"));
        auto* entries = json::as_array(failures);
        REQUIRE(entries != nullptr);
        REQUIRE(entries->size() == 2U);
        CHECK(json::get_string((*entries)[0], "kind"sv) == "restart");
        CHECK(json::get_string((*entries)[0], "reason"sv) == "graph break");
        CHECK(json::get_string((*entries)[1], "kind"sv) == "failure");
        CHECK(json::get_string((*entries)[1], "reason"sv) == "Unsupported: bad op (model.py:9)");
        CHECK(json::get_string((*entries)[1], "url"sv) == "-_0_0_0/compilation_metrics_0.json");
    }

    TEST_CASE("008: chromium events and provenance stack traces", "[008][interpreter]") {
        std::string log{};
        log += record_with_payload(R"("chromium_event": {})", R"({"name": "dynamo", "ph": "B", "ts": 1})");
        log += record_with_payload(
                R"("artifact": {"name": "inductor_provenance_tracking_kernel_stack_traces", "encoding": "json"},)"
                R"( "compile_id": {"frame_id": 0, "frame_compile_id": 0})",
                R"({"triton_poi_0": ["File a.py\\nline <1>\\n"]})");

        auto result = run_log(log);
        auto events = json::parse(*result.find("chromium_events.json"));
        REQUIRE(json::as_array(events)->size() == 1U);
        CHECK(json::get_string(json::as_array(events)->front(), "name"sv) == "dynamo");
        CHECK(side_log_lines(result).size() == 2U);

        auto* html = result.find("-_0_0_0/inductor_provenance_tracking_kernel_stack_traces_0_readable.html");
        REQUIRE(html != nullptr);
        CHECK(*html == "<html><body>\n<h3>triton_poi_0</h3>\n<pre>File a.py\nline &lt;1&gt;</pre>\n</body></html>\n");
        CHECK(has_output(result, "-_0_0_0/inductor_provenance_tracking_kernel_stack_traces_0.json"));

        auto directory = json::parse(*result.find("compile_directory.json"));
        auto& artifact = json::as_array(*json::find(*json::find(directory, "[0/0]"sv), "artifacts"sv))->front();
        CHECK(json::get_number(artifact, "number"sv) == 1.0);
        CHECK(json::get_string(artifact, "readable_url"sv) ==
              "-_0_0_0/inductor_provenance_tracking_kernel_stack_traces_0_readable.html");
    }

    TEST_CASE("008: export mode collects failures", "[008][export]") {
        auto cfg = quiet_config();
        cfg.export_mode = true;

        constexpr auto cid = R"("compile_id": {"frame_id": 0, "frame_compile_id": 0})"sv;
        std::string log{};
        log += record(
                R"({{"expression_created": {{"result_id": 1, "result": "Eq(s0, 3)", "method": "eq",)"
                R"( "arguments": ["s0", "3"], "argument_ids": [2]}}, {}}})"_format(cid));
        log += record(R"({{"create_unbacked_symbol": {{"node_id": 2, "symbol": "u0"}}, {}}})"_format(cid));
        log += record(
                R"({{"guard_added": {{"expr": "Eq(s0, 3)", "prefix": "eval", "expr_node_id": 1}}, {}}})"_format(cid));
        log += record(
                R"({{"guard_added": {{"expr": "Ne(s0, 0)", "prefix": "runtime_assert", "expr_node_id": 1}}, {}}})"_format(
                        cid));
        log += record(R"({"missing_fake_kernel": {"op": "mylib.foo"}})");
        log += record_with_payload(R"("exported_program": {}, {})"_format(cid), "graph()");

        auto result = run_log(log, cfg);
        CHECK_FALSE(has_output(result, "failures_and_restarts.json"));
        CHECK_FALSE(has_output(result, "raw.jsonl"));
        CHECK(has_output(result, "compile_directory.json"));

        auto* guard_text = result.find("-_0_0_0/symbolic_guard_information_0.txt");
        REQUIRE(guard_text != nullptr);
        CHECK(guard_text->starts_with("expr: Eq(s0, 3)\n"));
        CHECK(guard_text->find("symbolic expression tree:\nEq(s0, 3)\n  method: eq\n  arguments: s0, 3\n") !=
              std::string::npos);
        CHECK(guard_text->find("\n  u0\n") != std::string::npos);

        auto report = json::parse(*result.find("export_report.json"));
        CHECK(std::get<bool>(json::find(report, "success"sv)->data) == false);
        CHECK(json::get_number(report, "num_failures"sv) == 2.0);
        CHECK(json::get_string(report, "exported_program_url"sv) == "-_0_0_0/exported_program_1.txt");

        auto* failures = json::as_array(*json::find(report, "failures"sv));
        REQUIRE(failures != nullptr);
        REQUIRE(failures->size() == 2U);
        CHECK(json::get_string((*failures)[0], "failure_type"sv) == "Guard Evaluated");
        CHECK(json::get_string((*failures)[0], "additional_info"sv) ==
              "Please see -_0_0_0/symbolic_guard_information_0.txt for more information.");
        CHECK(json::get_string((*failures)[1], "failure_type"sv) == "Missing Fake Kernel");
        CHECK(json::get_string((*failures)[1], "reason"sv) ==
              "torch.ops.mylib.foo is missing a fake kernel implementation");
    }

    TEST_CASE("008: parse_path appends the raw log", "[008][interpreter]") {
        temp_dir dir{"parse_path"};
        auto text = record(R"({"link": {"name": "a", "url": "b"}})");
        auto log = dir.write("trace.log", text);

        auto result = parse_path(log, quiet_config());
        auto* raw = result.find("raw.log");
        REQUIRE(raw != nullptr);
        CHECK(*raw == text);
        CHECK_THROWS_AS(parse_path(dir.path, quiet_config()), std::runtime_error);
    }

}  // namespace tracesift::test
