#include "tracesift/parsers.hpp"

#include "internal/types.hpp"
#include "tracesift/config.hpp"
#include "tracesift/context.hpp"
#include "tracesift/format.hpp"
#include "tracesift/utils.hpp"

#include <array>
#include <filesystem>
#include <stdexcept>

using namespace tracesift::literals;

namespace tracesift {
    namespace detail {

        namespace fs = std::filesystem;

        static constexpr std::array sentinel_kinds{
                "optimize_ddp_split_graph"sv,
                "compiled_autograd_graph"sv,
                "aot_forward_graph"sv,
                "aot_backward_graph"sv,
                "aot_inference_graph"sv,
                "aot_joint_graph"sv,
                "inductor_post_grad_graph"sv,
                "inductor_pre_grad_graph"sv,
                "dynamo_cpp_guards_str"sv,
        };

        static std::string require_string(const json::value& metadata, std::string_view key) {
            auto value = json::get_string(metadata, key);
            if (!value) {
                throw std::runtime_error("missing string field '{}'"_format(key));
            }
            return *value;
        }

        static std::vector<internal::frame_record> frame_records(
                const stack_summary& frames, const intern_table& strings) {
            std::vector<internal::frame_record> out{};
            out.reserve(frames.size());
            for (const auto& frame : frames) {
                out.push_back(internal::frame_record{
                        .filename = std::string{simplify_filename(frame.filename(strings))},
                        .line = frame.line,
                        .name = frame.name,
                        .loc = frame.loc});
            }
            return out;
        }

        static std::string display_id(const std::optional<compile_id>& cid) {
            return cid ? cid->to_string() : std::string{intern_table::unknown_string};
        }

        // "<compile dir>/<rest>" -> "<rest>"; urls without a directory stay as they are
        static std::string strip_first_component(std::string_view url) {
            if (auto slash = url.find('/'); slash != std::string_view::npos) {
                return std::string{url.substr(slash + 1U)};
            }
            return std::string{url};
        }

        static log_parser sentinel_parser(std::string_view kind) {
            std::string name{kind};
            return log_parser{
                    .name = name,
                    .get_metadata = kind_predicate(name),
                    .parse = [filename = name + ".txt"](const parser_input& in) -> parser_results {
                        return {payload_file_output{compile_file_path(filename, in.lineno, in.cid)}};
                    }};
        }

        static parser_results parse_graph_dump(const parser_input& in) {
            auto name = require_string(in.metadata, "name"sv);
            return {payload_file_output{compile_file_path(name + ".txt", in.lineno, in.cid)}};
        }

        static parser_results parse_dynamo_output_graph(const parser_input& in) {
            return {payload_file_output{compile_file_path("dynamo_output_graph.txt"sv, in.lineno, in.cid)}};
        }

        static parser_results parse_dynamo_guards(const parser_input& in) {
            auto guards = json::parse(in.payload);
            if (json::as_array(guards) == nullptr) {
                throw std::runtime_error("dynamo_guards payload is not a JSON array");
            }
            return {file_output{compile_file_path("dynamo_guards.json"sv, in.lineno, in.cid), json::write_pretty(guards)}};
        }

        static log_parser inductor_output_code_parser(output_mode mode) {
            return log_parser{
                    .name = "inductor_output_code",
                    .get_metadata = kind_predicate("inductor_output_code"),
                    .parse = [mode](const parser_input& in) -> parser_results {
                        auto extension = mode == output_mode::plain_text ? ".txt"sv : ".html"sv;
                        std::string filename{"inductor_output_code"};
                        if (auto source = json::get_string(in.metadata, "filename"sv)) {
                            if (auto stem = fs::path{*source}.stem().string(); !stem.empty()) {
                                filename += "_" + stem;
                            }
                        }
                        filename += extension;
                        auto path = compile_file_path(filename, in.lineno, in.cid);
                        if (mode == output_mode::plain_text) {
                            return {payload_file_output{std::move(path)}};
                        }
                        return {file_output{std::move(path), anchor_source(in.payload)}};
                    }};
        }

        static parser_results parse_optimize_ddp_split_child(const parser_input& in) {
            auto name = require_string(in.metadata, "name"sv);
            return {payload_file_output{compile_file_path("optimize_ddp_split_child_{}.txt"_format(name), in.lineno, in.cid)}};
        }

        static log_parser kind_metrics_parser(std::string_view kind) {
            std::string name{kind};
            return log_parser{
                    .name = name,
                    .get_metadata = kind_predicate(name),
                    .parse = [filename = name + ".json"](const parser_input& in) -> parser_results {
                        internal::kind_metrics_record record{.compile_id = display_id(in.cid), .metrics = in.metadata};
                        return {file_output{compile_file_path(filename, in.lineno, in.cid), json::write_pretty(record)}};
                    }};
        }

        static parser_results parse_link(const parser_input& in) {
            return {link_output{require_string(in.metadata, "name"sv), require_string(in.metadata, "url"sv)}};
        }

        static parser_results parse_artifact(const parser_input& in) {
            auto name = require_string(in.metadata, "name"sv);
            auto encoding = require_string(in.metadata, "encoding"sv);
            if (encoding == "string"sv) {
                return {payload_file_output{compile_file_path(name + ".txt", in.lineno, in.cid)}};
            }
            if (encoding == "json"sv) {
                return {payload_reformat_output{compile_file_path(name + ".json", in.lineno, in.cid), format_json_pretty}};
            }
            throw std::runtime_error("Unsupported encoding: {}"_format(encoding));
        }

        static parser_results parse_dump_file(const parser_input& in) {
            auto name = require_string(in.metadata, "name"sv);
            std::string filename{};
            if (auto fx_id = extract_eval_with_key_id(name)) {
                filename = "eval_with_key_{}.html"_format(*fx_id);
            }
            else {
                filename = name + ".html";
            }
            return {global_file_output{"dump_file/" + filename, anchor_source(in.payload)}};
        }

    }  // namespace detail

    std::function<const json::value*(const envelope&)> kind_predicate(std::string kind) {
        return [kind = std::move(kind)](const envelope& e) -> const json::value* { return e.kind(kind); };
    }

    std::vector<log_parser> default_parsers(const parse_config& cfg) {
        std::vector<log_parser> parsers{};
        if (cfg.export_mode) {
            parsers.push_back(detail::sentinel_parser("exported_program"sv));
            return parsers;
        }

        for (auto kind : detail::sentinel_kinds) {
            parsers.push_back(detail::sentinel_parser(kind));
        }
        parsers.push_back(log_parser{"graph_dump", kind_predicate("graph_dump"), detail::parse_graph_dump});
        parsers.push_back(log_parser{
                "dynamo_output_graph", kind_predicate("dynamo_output_graph"), detail::parse_dynamo_output_graph});
        parsers.push_back(log_parser{"dynamo_guards", kind_predicate("dynamo_guards"), detail::parse_dynamo_guards});
        parsers.push_back(detail::inductor_output_code_parser(cfg.output));
        parsers.push_back(log_parser{
                "optimize_ddp_split_child",
                kind_predicate("optimize_ddp_split_child"),
                detail::parse_optimize_ddp_split_child});
        parsers.push_back(detail::kind_metrics_parser("aot_autograd_backward_compilation_metrics"sv));
        parsers.push_back(detail::kind_metrics_parser("bwd_compilation_metrics"sv));
        parsers.push_back(log_parser{"link_parser", kind_predicate("link"), detail::parse_link});
        parsers.push_back(log_parser{"artifact", kind_predicate("artifact"), detail::parse_artifact});
        parsers.push_back(log_parser{"dump_file", kind_predicate("dump_file"), detail::parse_dump_file});
        return parsers;
    }

    log_parser compilation_metrics_parser() {
        return log_parser{
                .name = "compilation_metrics",
                .get_metadata = kind_predicate("compilation_metrics"),
                .parse = [](const parser_input& in) -> parser_results {
                    auto& ctx = in.context;
                    internal::compilation_metrics_record record{};
                    record.compile_id = detail::display_id(in.cid);
                    record.compile_id_dir = compile_id_directory(in.cid, in.lineno);
                    record.metrics = in.metadata;

                    if (auto it = ctx.stacks.find(in.cid); it != ctx.stacks.end()) {
                        record.stack = detail::frame_records(it->second, ctx.strings);
                    }

                    auto co_name = json::get_string(in.metadata, "co_name"sv);
                    auto co_filename = json::get_string(in.metadata, "co_filename"sv);
                    auto co_firstlineno = json::get_unsigned(in.metadata, "co_firstlineno"sv);
                    if (co_name && co_filename && co_firstlineno) {
                        record.mini_stack.push_back(internal::frame_record{
                                .filename = std::string{simplify_filename(*co_filename)},
                                .line = *co_firstlineno,
                                .name = *co_name});
                    }

                    for (auto& spec : ctx.specializations.take(in.cid)) {
                        record.symbolic_shape_specializations.push_back(internal::specialization_record{
                                .symbol = std::move(spec.symbol),
                                .sources = std::move(spec.sources),
                                .value = std::move(spec.value),
                                .user_stack = detail::frame_records(spec.user_stack, ctx.strings),
                                .stack = detail::frame_records(spec.stack, ctx.strings)});
                    }
                    for (auto& guard : ctx.fast_guards.take(in.cid)) {
                        record.guards_added_fast.push_back(internal::fast_guard_record{
                                .expr = std::move(guard.expr),
                                .user_stack = detail::frame_records(guard.user_stack, ctx.strings),
                                .stack = detail::frame_records(guard.stack, ctx.strings)});
                    }

                    if (auto* files = ctx.directory.find(in.cid)) {
                        for (const auto& file : *files) {
                            std::optional<std::string> readable{};
                            if (file.readable_url) {
                                readable = detail::strip_first_component(*file.readable_url);
                            }
                            record.output_files.push_back(internal::artifact_record{
                                    .url = detail::strip_first_component(file.url),
                                    .name = detail::strip_first_component(file.name),
                                    .number = file.number,
                                    .suffix = std::string{to_string(file.status)},
                                    .readable_url = std::move(readable)});
                        }
                    }

                    return {file_output{
                            compile_file_path("compilation_metrics.json"sv, in.lineno, in.cid),
                            json::write_pretty(record)}};
                }};
    }

    log_parser symbolic_guard_parser() {
        return log_parser{
                .name = "guard_added",
                .get_metadata = [](const envelope& e) -> const json::value* {
                    if (auto* m = e.kind("propagate_real_tensors_provenance"sv)) {
                        return m;
                    }
                    return e.kind("guard_added"sv);
                },
                .parse = [](const parser_input& in) -> parser_results {
                    const auto& strings = in.context.strings;
                    auto expr = detail::require_string(in.metadata, "expr"sv);
                    auto node_id = json::get_unsigned(in.metadata, "expr_node_id"sv);
                    if (!node_id) {
                        throw std::runtime_error("missing expr_node_id");
                    }

                    std::string out = "expr: {}\n"_format(expr);
                    if (auto* user_stack = json::find(in.metadata, "user_stack"sv)) {
                        out += "\nuser stack:\n" + format_stack(stack_from_json(*user_stack), strings);
                    }
                    if (auto* stack = json::find(in.metadata, "stack"sv)) {
                        out += "\nframework stack:\n" + format_stack(stack_from_json(*stack), strings);
                    }
                    if (auto* locals = json::find(in.metadata, "frame_locals"sv); locals && !json::is_null(*locals)) {
                        out += "\nlocals:\n" + json::write_pretty(*locals) + "\n";
                    }
                    out += "\nsymbolic expression tree:\n" + in.context.sym_exprs.render(*node_id, strings);

                    return {file_output{
                            compile_file_path("symbolic_guard_information.txt"sv, in.lineno, in.cid), std::move(out)}};
                }};
    }

    std::string compile_file_path(std::string_view filename, size_t lineno, const std::optional<compile_id>& cid) {
        return "{}/{}"_format(compile_id_directory(cid, lineno), filename);
    }

    std::string format_json_pretty(std::string_view payload) {
        try {
            return json::write_pretty(json::parse(payload));
        } catch (const std::runtime_error&) {
            return std::string{payload};
        }
    }

    std::string anchor_source(std::string_view text) {
        std::string html{
                "<!DOCTYPE html>\n"
                "<html lang=\"en\">\n"
                "<head>\n"
                "<meta charset=\"UTF-8\">\n"
                "<title>Source Code</title>\n"
                "<style>\n"
                "pre { counter-reset: line; }\n"
                "pre span { display: block; }\n"
                "pre span:before { counter-increment: line; content: counter(line); display: inline-block; "
                "padding: 0 .5em; margin-right: .5em; color: #888; }\n"
                "pre span:target { background-color: #ffff00; }\n"
                "</style>\n"
                "</head>\n"
                "<body>\n"
                "<pre>"};

        size_t line_number = 0U;
        while (!text.empty()) {
            auto eol = text.find('\n');
            auto line = text.substr(0U, eol);
            if (line.ends_with('\r')) {
                line.remove_suffix(1U);
            }
            html += "<span id=\"L{}\">{}</span>"_format(++line_number, utils::html_escape(line));
            if (eol == std::string_view::npos) {
                break;
            }
            text.remove_prefix(eol + 1U);
        }
        html += "</pre>\n</body>\n</html>\n";
        return html;
    }

    std::optional<uint64_t> extract_eval_with_key_id(std::string_view name) {
        static constexpr auto marker = "<eval_with_key>."sv;
        auto pos = name.find(marker);
        if (pos == std::string_view::npos) {
            return std::nullopt;
        }
        auto digits = name.substr(pos + marker.size());
        size_t n = 0U;
        while (n < digits.size() && utils::ascii_is_digit(digits[n])) {
            ++n;
        }
        if (n == 0U) {
            return std::nullopt;
        }
        return utils::parse_arithmetic<uint64_t>(digits.substr(0U, n));
    }

}  // namespace tracesift
