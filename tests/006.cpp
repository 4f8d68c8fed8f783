#include "utils.hpp"

namespace tracesift::test {

    TEST_CASE("006: compile id display and directory forms", "[006][compile_id]") {
        compile_id cid{.frame_id = 0U, .frame_compile_id = 1U};
        CHECK(cid.to_string() == "[0/1]");
        CHECK(cid.as_directory_name() == "-_0_1_-");

        cid.normalize();
        CHECK(cid.attempt == 0U);
        CHECK(cid.to_string() == "[0/1]");
        CHECK(cid.as_directory_name() == "-_0_1_0");
        CHECK(cid.normalized() == cid);

        compile_id restarted{.frame_id = 2U, .frame_compile_id = 0U, .attempt = 3U, .compiled_autograd_id = 5U};
        CHECK(restarted.to_string() == "[!5/2/0_3]");
        CHECK(restarted.as_directory_name() == "5_2_0_3");

        compile_id partial{.compiled_autograd_id = 1U};
        CHECK(partial.to_string() == "[!1/-/-]");
        CHECK(partial.normalized() == partial);

        CHECK(compile_id_directory(std::nullopt, 42U) == "unknown_42");
        CHECK(compile_id_directory(restarted, 42U) == "5_2_0_3");
    }

    TEST_CASE("006: compile id decoding", "[006][compile_id]") {
        CHECK_FALSE(compile_id_from_json(json::parse("null")).has_value());

        auto cid = compile_id_from_json(json::parse(R"({"frame_id": 4, "frame_compile_id": 0, "attempt": null})"));
        REQUIRE(cid.has_value());
        CHECK(cid->frame_id == 4U);
        CHECK(cid->frame_compile_id == 0U);
        CHECK_FALSE(cid->attempt.has_value());

        CHECK_THROWS_AS(compile_id_from_json(json::parse(R"({"frame_id": 1.5})")), std::runtime_error);
        CHECK_THROWS_AS(compile_id_from_json(json::parse(R"({"frame_id": 4294967296})")), std::runtime_error);
    }

    TEST_CASE("006: directory buckets keep insertion order and status suffixes", "[006][compile_id]") {
        compile_directory directory{};
        compile_id first{.frame_id = 1U, .frame_compile_id = 0U, .attempt = 0U};
        compile_id second{.frame_id = 0U, .frame_compile_id = 0U, .attempt = 0U};

        directory.bucket(first).push_back(output_file{
                .url = "-_1_0_0/fx_graph_cache_hit_0.json",
                .name = "-_1_0_0/fx_graph_cache_hit_0.json",
                .number = 0U,
                .status = cache_status_from_filename("fx_graph_cache_hit"sv)});
        directory.bucket(std::nullopt);
        directory.bucket(second).push_back(output_file{.url = "x", .name = "x", .number = 1U});
        CHECK(&directory.bucket(first) == &directory.bucket(first));

        REQUIRE(directory.size() == 3U);
        CHECK(directory.entries()[0].first == first);
        CHECK_FALSE(directory.entries()[1].first.has_value());
        CHECK(directory.contains_unknown());
        CHECK(directory.find_url("cache_hit"sv) == "-_1_0_0/fx_graph_cache_hit_0.json");

        auto parsed = json::parse(directory.to_json());
        auto* artifacts = json::find(*json::find(parsed, "[1/0]"sv), "artifacts"sv);
        REQUIRE(artifacts != nullptr);
        auto& artifact = json::as_array(*artifacts)->front();
        CHECK(json::get_string(artifact, "name"sv) == "fx_graph_cache_hit_0.json");
        CHECK(json::get_string(artifact, "suffix"sv) == "✅");
        CHECK(json::find(parsed, "unknown"sv) != nullptr);
    }

    TEST_CASE("006: cache status from file names", "[006][compile_id]") {
        CHECK(cache_status_from_filename("fx_graph_cache_miss_3.json"sv) == cache_status::miss);
        CHECK(cache_status_from_filename("fx_graph_cache_hit_3.json"sv) == cache_status::hit);
        CHECK(cache_status_from_filename("fx_graph_cache_bypass_3.json"sv) == cache_status::bypass);
        CHECK(cache_status_from_filename("cache_hit_after_cache_miss.json"sv) == cache_status::miss);
        CHECK(cache_status_from_filename("output_code.txt"sv) == cache_status::none);

        cache_status status = cache_status::none;
        REQUIRE(try_parse_cache_status("❓"sv, status));
        CHECK(status == cache_status::bypass);
        CHECK_FALSE(try_parse_cache_status("?"sv, status));
    }

    TEST_CASE("006: unique suffixes and attempt normalization in a pass", "[006][compile_id]") {
        CHECK(add_unique_suffix("-_0_0_0/dynamo_output_graph.txt"sv, 7U) == "-_0_0_0/dynamo_output_graph_7.txt");
        CHECK(add_unique_suffix("graph"sv, 2U) == "graph_2");

        std::string log{};
        log += record_with_payload(R"("dynamo_output_graph": {}, "compile_id": {"frame_id": 0, "frame_compile_id": 0})", "a");
        log += record_with_payload(
                R"("dynamo_output_graph": {}, "compile_id": {"frame_id": 0, "frame_compile_id": 0, "attempt": 0})", "b");
        log += record_with_payload(R"("dynamo_output_graph": {})", "c");

        auto result = run_log(log);
        CHECK(has_output(result, "-_0_0_0/dynamo_output_graph_0.txt"));
        CHECK(has_output(result, "-_0_0_0/dynamo_output_graph_1.txt"));
        CHECK(has_output(result, "unknown_5/dynamo_output_graph_2.txt"));

        auto directory = json::parse(*result.find("compile_directory.json"));
        auto* bucket = json::find(directory, "[0/0]"sv);
        REQUIRE(bucket != nullptr);
        CHECK(json::as_array(*json::find(*bucket, "artifacts"sv))->size() == 2U);
        CHECK(json::find(directory, "unknown"sv) != nullptr);
    }

    TEST_CASE("006: attempt normalization is independent of arrival order", "[006][compile_id]") {
        constexpr auto bare = R"("dynamo_output_graph": {}, "compile_id": {"frame_id": 0, "frame_compile_id": 0})"sv;
        constexpr auto explicit_attempt =
                R"("dynamo_output_graph": {}, "compile_id": {"frame_id": 0, "frame_compile_id": 0, "attempt": 0})"sv;
        constexpr auto no_id = R"("dynamo_output_graph": {})"sv;

        auto check_bucket = [](const parse_result& result, std::vector<std::string> expected_urls) {
            auto directory = json::parse(*result.find("compile_directory.json"));
            auto* bucket = json::find(directory, "[0/0]"sv);
            REQUIRE(bucket != nullptr);
            auto* artifacts = json::as_array(*json::find(*bucket, "artifacts"sv));
            REQUIRE(artifacts != nullptr);
            REQUIRE(artifacts->size() == expected_urls.size());
            for (size_t i = 0U; i < expected_urls.size(); ++i) {
                CHECK(json::get_string((*artifacts)[i], "url"sv) == expected_urls[i]);
            }
        };

        SECTION("explicit attempt first") {
            auto result = run_log(record_with_payload(explicit_attempt, "a") + record_with_payload(bare, "b"));
            check_bucket(result, {"-_0_0_0/dynamo_output_graph_0.txt", "-_0_0_0/dynamo_output_graph_1.txt"});
            CHECK(*result.find("-_0_0_0/dynamo_output_graph_0.txt") == "a");
        }

        SECTION("interleaved with a record without compile id") {
            auto result = run_log(
                    record_with_payload(bare, "a") + record_with_payload(no_id, "b") +
                    record_with_payload(explicit_attempt, "c"));
            check_bucket(result, {"-_0_0_0/dynamo_output_graph_0.txt", "-_0_0_0/dynamo_output_graph_2.txt"});
            CHECK(has_output(result, "unknown_3/dynamo_output_graph_1.txt"));
            CHECK(*result.find("-_0_0_0/dynamo_output_graph_2.txt") == "c");
        }

        SECTION("record without compile id first") {
            auto result = run_log(
                    record_with_payload(no_id, "a") + record_with_payload(explicit_attempt, "b") +
                    record_with_payload(bare, "c"));
            check_bucket(result, {"-_0_0_0/dynamo_output_graph_1.txt", "-_0_0_0/dynamo_output_graph_2.txt"});
            CHECK(has_output(result, "unknown_1/dynamo_output_graph_0.txt"));
        }
    }

}  // namespace tracesift::test
