#include "tracesift/indices.hpp"

#include "tracesift/format.hpp"
#include "tracesift/utils.hpp"

#include <array>
#include <limits>
#include <stdexcept>
#include <unordered_set>

using namespace tracesift::literals;

namespace tracesift {
    namespace detail {

        using convert_frame_suffix = std::array<std::pair<std::string_view, std::string_view>, 3>;

        static constexpr std::array<convert_frame_suffix, 2> convert_frame_suffixes{{
                {{{"torch/_dynamo/convert_frame.py"sv, "catch_errors"sv},
                  {"torch/_dynamo/convert_frame.py"sv, "_convert_frame"sv},
                  {"torch/_dynamo/convert_frame.py"sv, "_convert_frame_assert"sv}}},
                {{{"torch/_dynamo/convert_frame.py"sv, "__call__"sv},
                  {"torch/_dynamo/convert_frame.py"sv, "__call__"sv},
                  {"torch/_dynamo/convert_frame.py"sv, "__call__"sv}}},
        }};

        static std::string optional_string(const json::value& v, std::string_view key) {
            return json::get_string(v, key).value_or(std::string{});
        }

        static std::vector<std::string> string_list(const json::value& v, std::string_view key) {
            std::vector<std::string> out{};
            auto* member = json::find(v, key);
            if (member == nullptr || json::is_null(*member)) {
                return out;
            }
            auto* arr = json::as_array(*member);
            if (arr == nullptr) {
                throw std::runtime_error("{} must be an array"_format(key));
            }
            for (const auto& item : *arr) {
                if (auto* s = json::as_string(item)) {
                    out.push_back(*s);
                }
                else {
                    out.push_back(json::write_compact(item));
                }
            }
            return out;
        }

        static stack_summary member_stack(const json::value& v, std::string_view key) {
            auto* member = json::find(v, key);
            return member ? stack_from_json(*member) : stack_summary{};
        }

        static stack_frame frame_from_json(const json::value& v) {
            if (json::as_object(v) == nullptr) {
                throw std::runtime_error("stack frame must be an object");
            }
            stack_frame frame{};
            if (auto* filename = json::find(v, "filename"sv)) {
                if (auto* s = json::as_string(*filename)) {
                    frame.uninterned_filename = *s;
                }
                else if (auto id = json::to_unsigned(*filename, "filename"sv)) {
                    if (*id > std::numeric_limits<uint32_t>::max()) {
                        throw std::runtime_error("filename id out of range: {}"_format(*id));
                    }
                    frame.filename_id = static_cast<uint32_t>(*id);
                }
            }
            frame.line = json::get_unsigned(v, "line"sv).value_or(0U);
            frame.name = optional_string(v, "name"sv);
            frame.loc = json::get_string(v, "loc"sv);
            return frame;
        }

        static void render_sym_expr(
                const sym_expr_arena& arena,
                uint64_t id,
                size_t depth,
                const intern_table& strings,
                std::unordered_set<uint64_t>& visited,
                std::string& out) {
            if (!visited.insert(id).second) {
                return;
            }
            auto* node = arena.find(id);
            if (node == nullptr) {
                return;
            }
            std::string indent(depth * 2U, ' ');
            out += "{}{}\n"_format(indent, node->result);
            out += "{}  method: {}\n"_format(indent, node->method);
            out += "{}  arguments: {}\n"_format(indent, utils::join_with_separator(node->arguments, ", "sv));
            if (!node->user_stack.empty()) {
                out += "{}  user stack:\n"_format(indent);
                out += format_stack(node->user_stack, strings);
            }
            if (!node->stack.empty()) {
                out += "{}  stack:\n"_format(indent);
                out += format_stack(node->stack, strings);
            }
            for (auto child : node->argument_ids) {
                render_sym_expr(arena, child, depth + 1U, strings, visited, out);
            }
        }

    }  // namespace detail

    std::string stack_frame::filename(const intern_table& strings) const {
        if (uninterned_filename) {
            return *uninterned_filename;
        }
        if (filename_id) {
            return std::string{strings.resolve(*filename_id)};
        }
        return std::string{intern_table::unknown_string};
    }

    stack_summary stack_from_json(const json::value& v) {
        stack_summary frames{};
        if (json::is_null(v)) {
            return frames;
        }
        auto* arr = json::as_array(v);
        if (arr == nullptr) {
            throw std::runtime_error("stack must be an array of frames");
        }
        frames.reserve(arr->size());
        for (const auto& frame : *arr) {
            frames.push_back(detail::frame_from_json(frame));
        }
        return frames;
    }

    std::string_view simplify_filename(std::string_view filename) {
        for (auto marker : {"#link-tree/"sv, "/site-packages/"sv}) {
            if (auto pos = filename.find(marker); pos != std::string_view::npos) {
                return filename.substr(pos + marker.size());
            }
        }
        return filename;
    }

    void remove_convert_frame_suffixes(stack_summary& frames, const intern_table& strings) {
        for (const auto& suffix : detail::convert_frame_suffixes) {
            if (frames.size() < suffix.size()) {
                continue;
            }
            auto first = frames.size() - suffix.size();
            bool matches = true;
            for (size_t i = 0U; i < suffix.size() && matches; ++i) {
                const auto& frame = frames[first + i];
                matches = simplify_filename(frame.filename(strings)) == suffix[i].first &&
                          frame.name == suffix[i].second;
            }
            if (matches) {
                frames.resize(first);
                return;
            }
        }
    }

    std::string format_stack(const stack_summary& frames, const intern_table& strings) {
        std::string out{};
        for (const auto& frame : frames) {
            auto filename = frame.filename(strings);
            out += "  File \"{}\", line {}, in {}\n"_format(simplify_filename(filename), frame.line, frame.name);
            if (frame.loc) {
                out += "    {}\n"_format(*frame.loc);
            }
        }
        return out;
    }

    shape_specialization shape_specialization::from_json(const json::value& v) {
        if (json::as_object(v) == nullptr) {
            throw std::runtime_error("symbolic_shape_specialization must be an object");
        }
        shape_specialization out{};
        out.symbol = detail::optional_string(v, "symbol"sv);
        out.sources = detail::string_list(v, "sources"sv);
        out.value = detail::optional_string(v, "value"sv);
        out.user_stack = detail::member_stack(v, "user_stack"sv);
        out.stack = detail::member_stack(v, "stack"sv);
        return out;
    }

    fast_guard fast_guard::from_json(const json::value& v) {
        if (json::as_object(v) == nullptr) {
            throw std::runtime_error("guard_added_fast must be an object");
        }
        fast_guard out{};
        out.expr = detail::optional_string(v, "expr"sv);
        out.user_stack = detail::member_stack(v, "user_stack"sv);
        out.stack = detail::member_stack(v, "stack"sv);
        return out;
    }

    std::string sym_expr_arena::render(uint64_t root, const intern_table& strings) const {
        std::unordered_set<uint64_t> visited{};
        std::string out{};
        detail::render_sym_expr(*this, root, 0U, strings, visited, out);
        return out;
    }

}  // namespace tracesift
