#include "tracesift/interpreter.hpp"

#include "internal/digest.hpp"
#include "internal/files.hpp"
#include "internal/types.hpp"
#include "tracesift/envelope.hpp"
#include "tracesift/format.hpp"
#include "tracesift/parsers.hpp"

#include <filesystem>
#include <iostream>
#include <set>
#include <sstream>

using namespace tracesift::literals;

namespace tracesift {

    std::string parse_stats::to_string() const {
        std::string out =
                "Stats {{ ok: {}, other_rank: {}, fail_glog: {}, fail_json: {}, fail_payload_md5: {}, fail_parser: {}, "
                "fail_key_conflict: {}, fail_json_serialization: {}, unknown: {}"_format(
                        ok,
                        other_rank,
                        fail_glog,
                        fail_json,
                        fail_payload_md5,
                        fail_parser,
                        fail_key_conflict,
                        fail_json_serialization,
                        unknown);
        for (const auto& [name, count] : handler_failures) {
            out += ", fail_{}: {}"_format(name, count);
        }
        out += " }";
        return out;
    }

    namespace detail {

        namespace fs = std::filesystem;

        static constexpr auto fake_kernel_help =
                "Please refer to "
                "https://docs.google.com/document/d/1_W62p8WJOQQUzPsJYa7s701JXt0qf2OfLub2sbkHOaU/"
                "edit#heading=h.ahugy69p2jmz for more detailed instructions on how to write a fake kernel."sv;

        struct dispatch_result {
            std::optional<std::string> payload_filename{};
            std::optional<std::string> last_path{};
        };

        static bool is_stack_traces_file(const fs::path& path) {
            auto name = path.filename().string();
            return name.starts_with("inductor_provenance_tracking_kernel_stack_traces") && name.ends_with(".json");
        }

        static std::string replace_escaped_newlines(std::string_view text) {
            std::string out{};
            out.reserve(text.size());
            for (size_t i = 0U; i < text.size(); ++i) {
                if (text[i] == '\\' && i + 1U < text.size() && text[i + 1U] == 'n') {
                    out += '\n';
                    ++i;
                }
                else {
                    out += text[i];
                }
            }
            return out;
        }

        // kernel name -> list of trace strings, rendered as escaped <pre> blocks
        static std::optional<std::string> render_stack_traces(std::string_view content) {
            json::value parsed{};
            try {
                parsed = json::parse(content);
            } catch (const std::runtime_error&) {
                return std::nullopt;
            }
            std::string html{"<html><body>\n"};
            if (auto* kernels = json::as_object(parsed)) {
                for (const auto& [kernel, traces] : *kernels) {
                    html += "<h3>{}</h3>\n"_format(utils::html_escape(kernel));
                    auto* list = json::as_array(traces);
                    if (list == nullptr) {
                        continue;
                    }
                    for (const auto& trace : *list) {
                        if (auto* s = json::as_string(trace)) {
                            auto decoded = replace_escaped_newlines(*s);
                            std::string_view body{decoded};
                            while (body.ends_with('\n')) {
                                body.remove_suffix(1U);
                            }
                            html += "<pre>{}</pre>\n"_format(utils::html_escape(body));
                        }
                    }
                }
            }
            html += "</body></html>\n";
            return html;
        }

        class log_interpreter {
          public:
            explicit log_interpreter(const parse_config& cfg) :
                    cfg{cfg}, parsers{default_parsers(cfg)}, metrics_parser{compilation_metrics_parser()},
                    guard_parser{symbolic_guard_parser()}, year{current_utc_year()} {
                for (const auto& custom : cfg.custom_parsers) {
                    parsers.push_back(custom);
                }
            }

            parse_result run(std::istream& in) {
                line_reader reader{in};
                while (auto next = reader.next()) {
                    process_line(next->first, next->second, reader);
                }
                return finish();
            }

          private:
            template <typename... Args>
            void warn(std::format_string<Args...> fmt, Args&&... args) const {
                if (!cfg.quiet) {
                    std::cerr << std::format(fmt, std::forward<Args>(args)...) << '\n';
                }
            }

            template <typename F>
            void isolated(std::string_view name, F&& fn) {
                try {
                    fn();
                } catch (const std::exception& e) {
                    warn("Parser {} failed: {}", name, e.what());
                    ctx.stats.count_handler_failure(name);
                }
            }

            void process_line(size_t lineno, const std::string& line, line_reader& reader) {
                auto prefix = parse_log_prefix(line);
                if (!prefix) {
                    warn("Failed to parse glog prefix on line {}", lineno);
                    ++ctx.stats.fail_glog;
                    return;
                }
                auto text = std::string_view{line}.substr(prefix->payload_offset);

                json::value parsed{};
                try {
                    parsed = json::parse(text);
                } catch (const std::runtime_error& e) {
                    warn("Failed to parse metadata JSON on line {}: {}", lineno, e.what());
                    ++ctx.stats.fail_json;
                    return;
                }

                envelope e{};
                try {
                    e = decode_envelope(parsed, default_known_kinds());
                } catch (const std::runtime_error& ex) {
                    warn("Failed to decode envelope on line {}: {}", lineno, ex.what());
                    ++ctx.stats.fail_json;
                    write_side_log(text, parsed, *prefix, std::nullopt);
                    return;
                }

                ctx.stats.unknown += e.unknown_fields.size();
                for (const auto& field : e.unknown_fields) {
                    unknown_fields.insert(field.first);
                    if (cfg.verbose) {
                        warn("Unknown field {}", field.first);
                    }
                }

                if (e.intern) {
                    ctx.strings.insert(e.intern->id, std::move(e.intern->value));
                    return;
                }

                std::string payload{};
                if (e.has_payload) {
                    payload = collect_payload(reader);
                    if (!payload_matches_digest(payload, *e.has_payload)) {
                        debug_log("payload digest mismatch on line ", lineno);
                        ++ctx.stats.fail_payload_md5;
                    }
                }

                if (expected_rank) {
                    if (*expected_rank != e.rank) {
                        ++ctx.stats.other_rank;
                        write_side_log(text, parsed, *prefix, std::nullopt);
                        return;
                    }
                }
                else if (e.rank) {
                    warn("Detected rank: {}", *e.rank);
                    expected_rank = e.rank;
                }

                ++ctx.stats.ok;

                directory_key key{};
                if (e.cid) {
                    key = e.cid->normalized();
                }
                auto& bucket = ctx.directory.bucket(key);

                std::optional<std::string> payload_filename{};
                for (const auto& parser : parsers) {
                    auto result = dispatch(parser, e, lineno, key, payload, bucket);
                    if (result.payload_filename) {
                        payload_filename = std::move(result.payload_filename);
                    }
                }

                if (auto* metrics = e.kind("compilation_metrics"sv)) {
                    auto result = dispatch(metrics_parser, e, lineno, key, payload, bucket);
                    if (result.payload_filename) {
                        payload_filename = std::move(result.payload_filename);
                    }
                    isolated("compilation_metrics"sv, [&] { record_breaks(*metrics, key, result.last_path); });
                }

                if (cfg.export_mode) {
                    if (auto* guard = e.kind("guard_added"sv)) {
                        if (json::get_string(*guard, "prefix"sv) != "eval") {
                            write_side_log(text, parsed, *prefix, std::nullopt);
                            return;
                        }
                    }
                    collect_export_failures(e, lineno, key, payload, bucket);
                }

                if (e.has_kind("chromium_event"sv)) {
                    isolated("chromium_event"sv, [&] { chromium_events.push_back(json::parse(payload)); });
                }
                if (auto* spec = e.kind("symbolic_shape_specialization"sv)) {
                    isolated("symbolic_shape_specialization"sv, [&] {
                        ctx.specializations.push(key, shape_specialization::from_json(*spec));
                    });
                }
                if (auto* guard = e.kind("guard_added_fast"sv)) {
                    isolated("guard_added_fast"sv, [&] { ctx.fast_guards.push(key, fast_guard::from_json(*guard)); });
                }
                if (auto* start = e.kind("dynamo_start"sv)) {
                    isolated("dynamo_start"sv, [&] {
                        if (auto* stack = json::find(*start, "stack"sv); stack && !json::is_null(*stack)) {
                            auto frames = stack_from_json(*stack);
                            remove_convert_frame_suffixes(frames, ctx.strings);
                            ctx.stacks.insert_or_assign(key, std::move(frames));
                        }
                    });
                }

                bool chromium = e.has_kind("chromium_event"sv);
                if (!payload_filename && e.has_payload && !payload.empty() && !chromium) {
                    auto name = *e.has_payload;
                    if (!internal::digest::decode_lower_hex(name)) {
                        name = internal::digest::to_hex(internal::digest::md5(payload));
                    }
                    auto path = "payloads/{}.txt"_format(name);
                    output.emplace_back(path, payload);
                    payload_filename = std::move(path);
                }

                if (!chromium) {
                    write_side_log(text, parsed, *prefix, payload_filename);
                }
            }

            dispatch_result dispatch(
                    const log_parser& parser,
                    const envelope& e,
                    size_t lineno,
                    const directory_key& key,
                    std::string_view payload,
                    compile_directory::bucket_type& bucket) {
                dispatch_result out{};
                if (!parser.get_metadata || !parser.parse) {
                    return out;
                }
                const auto* metadata = parser.get_metadata(e);
                if (metadata == nullptr) {
                    return out;
                }

                parser_results results{};
                try {
                    results = parser.parse(parser_input{
                            .lineno = lineno,
                            .metadata = *metadata,
                            .record = e,
                            .rank = e.rank,
                            .cid = key,
                            .payload = payload,
                            .context = ctx});
                } catch (const std::exception& ex) {
                    warn("Parser {} failed: {}", parser.name, ex.what());
                    ctx.stats.count_handler_failure(parser.name);
                    return out;
                }

                for (auto& result : results) {
                    if (auto* file = std::get_if<file_output>(&result)) {
                        auto path = add_unique_suffix(file->path, sequence);
                        out.last_path = add_file_output(std::move(path), std::move(file->content), bucket);
                    }
                    else if (auto* global = std::get_if<global_file_output>(&result)) {
                        out.last_path = add_file_output(std::move(global->path), std::move(global->content), bucket);
                    }
                    else if (auto* raw = std::get_if<payload_file_output>(&result)) {
                        auto path = add_unique_suffix(raw->path, sequence);
                        out.payload_filename = path;
                        out.last_path = add_file_output(std::move(path), std::string{payload}, bucket);
                    }
                    else if (auto* reformat = std::get_if<payload_reformat_output>(&result)) {
                        auto path = add_unique_suffix(reformat->path, sequence);
                        std::string formatted{};
                        try {
                            formatted = reformat->formatter(payload);
                        } catch (const std::exception& ex) {
                            warn("Failed to format payload for {}: {}", path, ex.what());
                            ++ctx.stats.fail_parser;
                            continue;
                        }
                        out.payload_filename = path;
                        out.last_path = add_file_output(std::move(path), std::move(formatted), bucket);
                    }
                    else if (auto* link = std::get_if<link_output>(&result)) {
                        bucket.push_back(output_file{
                                .url = std::move(link->url),
                                .name = std::move(link->name),
                                .number = sequence++,
                                .status = cache_status::none,
                                .readable_url = std::nullopt});
                    }
                }
                return out;
            }

            std::string add_file_output(std::string path, std::string content, compile_directory::bucket_type& bucket) {
                fs::path file_path{path};
                std::optional<std::string> readable{};
                if (is_stack_traces_file(file_path)) {
                    if (auto html = render_stack_traces(content)) {
                        auto html_path = file_path;
                        html_path.replace_filename(file_path.stem().string() + "_readable.html");
                        readable = html_path.generic_string();
                        output.emplace_back(html_path, std::move(*html));
                        ++sequence;
                    }
                }
                output.emplace_back(file_path, std::move(content));
                bucket.push_back(output_file{
                        .url = path,
                        .name = path,
                        .number = sequence++,
                        .status = cache_status_from_filename(path),
                        .readable_url = std::move(readable)});
                return path;
            }

            void record_breaks(
                    const json::value& metrics, const directory_key& key, const std::optional<std::string>& metrics_path) {
                auto id = key ? key->to_string() : std::string{intern_table::unknown_string};
                if (auto* restarts = json::find(metrics, "restart_reasons"sv)) {
                    if (auto* reasons = json::as_array(*restarts)) {
                        for (const auto& reason : *reasons) {
                            auto* text = json::as_string(reason);
                            breaks.push_back(internal::failure_record{
                                    .compile_id = id,
                                    .url = metrics_path,
                                    .kind = "restart",
                                    .reason = text ? *text : json::write_compact(reason)});
                        }
                    }
                }
                if (auto fail_type = json::get_string(metrics, "fail_type"sv)) {
                    auto fail_reason = json::get_string(metrics, "fail_reason"sv);
                    if (!fail_reason) {
                        throw std::runtime_error("Fail reason not found");
                    }
                    auto user_file = json::get_string(metrics, "fail_user_frame_filename"sv).value_or("N/A");
                    auto user_line = json::get_unsigned(metrics, "fail_user_frame_lineno"sv).value_or(0U);
                    breaks.push_back(internal::failure_record{
                            .compile_id = id,
                            .url = metrics_path,
                            .kind = "failure",
                            .reason = "{}: {} ({}:{})"_format(*fail_type, *fail_reason, user_file, user_line)});
                }
            }

            void collect_export_failures(
                    const envelope& e,
                    size_t lineno,
                    const directory_key& key,
                    std::string_view payload,
                    compile_directory::bucket_type& bucket) {
                auto guard_failure = [&](std::string_view failure_type, std::string reason) {
                    auto result = dispatch(guard_parser, e, lineno, key, payload, bucket);
                    std::string info{};
                    if (result.last_path) {
                        info = "Please see {} for more information."_format(*result.last_path);
                    }
                    export_failures.push_back(internal::export_failure_record{
                            .failure_type = std::string{failure_type},
                            .reason = std::move(reason),
                            .additional_info = std::move(info)});
                };

                if (auto* guard = e.kind("guard_added"sv)) {
                    isolated("guard_added"sv, [&] {
                        auto expr = json::get_string(*guard, "expr"sv);
                        if (!expr) {
                            throw std::runtime_error("guard_added without expr");
                        }
                        guard_failure(
                                "Guard Evaluated"sv,
                                "When exporting, the following guard was evaluated `{}`. This might've resulted in a "
                                "constraint violation error."_format(*expr));
                    });
                }
                if (auto* provenance = e.kind("propagate_real_tensors_provenance"sv)) {
                    isolated("propagate_real_tensors_provenance"sv, [&] {
                        auto expr = json::get_string(*provenance, "expr"sv);
                        auto result = json::get_string(*provenance, "result"sv);
                        if (!expr || !result) {
                            throw std::runtime_error("propagate_real_tensors_provenance without expr or result");
                        }
                        guard_failure(
                                "Data Dependent Error"sv,
                                "When exporting, we were unable to figure out if the expression `{}` always holds. As a "
                                "result, it was specialized to evaluate to `{}`, and asserts were inserted into the "
                                "graph."_format(*expr, *result));
                    });
                }
                if (auto* kernel = e.kind("missing_fake_kernel"sv)) {
                    isolated("missing_fake_kernel"sv, [&] {
                        auto op = json::get_string(*kernel, "op"sv);
                        if (!op) {
                            throw std::runtime_error("missing_fake_kernel without op");
                        }
                        export_failures.push_back(internal::export_failure_record{
                                .failure_type = "Missing Fake Kernel",
                                .reason = "torch.ops.{} is missing a fake kernel implementation"_format(*op),
                                .additional_info = std::string{fake_kernel_help}});
                    });
                }
                if (auto* kernel = e.kind("mismatched_fake_kernel"sv)) {
                    isolated("mismatched_fake_kernel"sv, [&] {
                        auto op = json::get_string(*kernel, "op"sv);
                        auto reason = json::get_string(*kernel, "reason"sv);
                        if (!op || !reason) {
                            throw std::runtime_error("mismatched_fake_kernel without op or reason");
                        }
                        export_failures.push_back(internal::export_failure_record{
                                .failure_type = "Mismatched Fake Kernel",
                                .reason = "torch.ops.{} has a fake kernel implementation, but it has incorrect behavior, "
                                          "based on the real kernel. The reason for the mismatch is: {}"_format(
                                                  *op, *reason),
                                .additional_info = std::string{fake_kernel_help}});
                    });
                }
                if (auto* created = e.kind("expression_created"sv)) {
                    isolated("expression_created"sv, [&] {
                        auto id = json::get_unsigned(*created, "result_id"sv);
                        if (!id) {
                            throw std::runtime_error("expression_created without result_id");
                        }
                        sym_expr_node node{};
                        node.result = json::get_string(*created, "result"sv).value_or("");
                        node.method = json::get_string(*created, "method"sv).value_or("");
                        if (auto* args = json::find(*created, "arguments"sv)) {
                            if (auto* list = json::as_array(*args)) {
                                for (const auto& arg : *list) {
                                    auto* s = json::as_string(arg);
                                    node.arguments.push_back(s ? *s : json::write_compact(arg));
                                }
                            }
                        }
                        if (auto* ids = json::find(*created, "argument_ids"sv)) {
                            if (auto* list = json::as_array(*ids)) {
                                for (const auto& arg : *list) {
                                    if (auto arg_id = json::to_unsigned(arg, "argument_ids"sv)) {
                                        node.argument_ids.push_back(*arg_id);
                                    }
                                }
                            }
                        }
                        if (auto* stack = json::find(*created, "user_stack"sv)) {
                            node.user_stack = stack_from_json(*stack);
                        }
                        if (auto* stack = json::find(*created, "stack"sv)) {
                            node.stack = stack_from_json(*stack);
                        }
                        ctx.sym_exprs.insert(*id, std::move(node));
                    });
                }
                if (auto* unbacked = e.kind("create_unbacked_symbol"sv)) {
                    isolated("create_unbacked_symbol"sv, [&] {
                        auto id = json::get_unsigned(*unbacked, "node_id"sv);
                        if (!id) {
                            throw std::runtime_error("create_unbacked_symbol without node_id");
                        }
                        sym_expr_node node{};
                        node.result = json::get_string(*unbacked, "symbol"sv).value_or("");
                        if (auto* stack = json::find(*unbacked, "user_stack"sv)) {
                            node.user_stack = stack_from_json(*stack);
                        }
                        if (auto* stack = json::find(*unbacked, "stack"sv)) {
                            node.stack = stack_from_json(*stack);
                        }
                        ctx.sym_exprs.insert(*id, std::move(node));
                    });
                }
            }

            // Augmented copy of the envelope for raw.jsonl; any pre-existing key drops the line.
            // Fields are appended to the original text so integers keep their exact digits.
            void write_side_log(
                    std::string_view text,
                    const json::value& parsed,
                    const log_prefix& prefix,
                    const std::optional<std::string>& payload_filename) {
                auto* fields = json::as_object(parsed);
                if (fields == nullptr) {
                    return;
                }
                auto body = utils::trim_ascii(text);
                if (!body.ends_with('}')) {
                    return;
                }
                body.remove_suffix(1U);

                std::string augmented{body};
                bool first = fields->empty();
                auto append = [&](std::string_view key, std::string_view value) {
                    if (!first) {
                        augmented += ',';
                    }
                    first = false;
                    augmented += "\"{}\":{}"_format(key, value);
                };

                std::vector<std::string_view> keys{"timestamp"sv, "thread"sv, "pathname"sv, "lineno"sv};
                if (payload_filename) {
                    keys.push_back("payload_filename"sv);
                }
                for (auto key : keys) {
                    if (fields->contains(key)) {
                        warn("Key conflict: '{}' already exists in JSON payload, skipping raw.jsonl conversion", key);
                        ++ctx.stats.fail_key_conflict;
                        return;
                    }
                }

                try {
                    append("timestamp"sv, json::write_compact(format_timestamp(prefix, year)));
                    append("thread"sv, std::to_string(prefix.thread));
                    append("pathname"sv, json::write_compact(std::string{prefix.pathname}));
                    append("lineno"sv, std::to_string(prefix.line));
                    if (payload_filename) {
                        append("payload_filename"sv, json::write_compact(*payload_filename));
                    }
                } catch (const std::runtime_error& ex) {
                    warn("Failed to serialize JSON for raw.jsonl: {}", ex.what());
                    ++ctx.stats.fail_json_serialization;
                    return;
                }
                augmented += '}';
                side_log += augmented;
                side_log += '\n';
            }

            parse_result finish() {
                if (cfg.export_mode) {
                    internal::export_report_record report{};
                    report.num_failures = export_failures.size();
                    report.success = export_failures.empty();
                    report.exported_program_url = ctx.directory.find_url("exported_program"sv).value_or("");
                    report.failures = std::move(export_failures);
                    output.emplace_back("export_report.json", json::write_pretty(report));
                    output.emplace_back("compile_directory.json", ctx.directory.to_json());
                    return make_result();
                }

                output.emplace_back("failures_and_restarts.json", json::write_pretty(breaks));
                output.emplace_back("chromium_events.json", json::write_pretty(chromium_events));

                if (!cfg.quiet) {
                    std::cerr << "{}"_format(ctx.stats) << '\n';
                    if (!unknown_fields.empty()) {
                        std::vector<std::string> names{unknown_fields.begin(), unknown_fields.end()};
                        std::cerr << "Unknown fields: {} (consider updating tracesift to render these)"_format(
                                             utils::join_with_separator(names, ", "sv))
                                  << '\n';
                    }
                }

                auto has_unknown_compile_id = ctx.directory.contains_unknown();
                output.emplace_back("compile_directory.json", ctx.directory.to_json());

                internal::string_table_record table{.string_table = ctx.strings.to_dense()};
                output.emplace_back("raw.jsonl", json::write_compact(table) + "\n" + side_log);

                if (cfg.strict && ctx.stats.strict_failures() > 0U) {
                    throw parse_error{"Something went wrong: {}"_format(ctx.stats), ctx.stats};
                }
                if (cfg.strict_compile_id && has_unknown_compile_id) {
                    throw parse_error{"Some log entries did not have compile id", ctx.stats};
                }
                return make_result();
            }

            parse_result make_result() {
                parse_result result{};
                result.output = std::move(output);
                result.stats = ctx.stats;
                if (expected_rank) {
                    result.rank = *expected_rank;
                }
                result.unknown_fields.assign(unknown_fields.begin(), unknown_fields.end());
                return result;
            }

            const parse_config& cfg;
            std::vector<log_parser> parsers;
            log_parser metrics_parser;
            log_parser guard_parser;
            int year;

            pass_context ctx{};
            parse_output output{};
            std::string side_log{};
            std::optional<std::optional<uint32_t>> expected_rank{};
            uint64_t sequence{};
            std::vector<json::value> chromium_events{};
            std::vector<internal::failure_record> breaks{};
            std::vector<internal::export_failure_record> export_failures{};
            std::set<std::string> unknown_fields{};
        };

    }  // namespace detail

    parse_result parse_log(std::istream& in, const parse_config& cfg) {
        detail::log_interpreter interpreter{cfg};
        return interpreter.run(in);
    }

    parse_result parse_path(const std::filesystem::path& path, const parse_config& cfg) {
        if (!std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("{} is not a file"_format(path.string()));
        }
        auto text = internal::files::read_text_file(path);
        std::istringstream in{text};
        auto result = parse_log(in, cfg);
        result.output.emplace_back("raw.log", std::move(text));
        return result;
    }

}  // namespace tracesift
