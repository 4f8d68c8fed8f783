#include "tracesift/envelope.hpp"

#include "internal/digest.hpp"
#include "tracesift/format.hpp"
#include "tracesift/intern.hpp"
#include "tracesift/utils.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

using namespace tracesift::literals;

namespace tracesift {
    namespace detail {

        // Fixed-width digit field; false when any position is not a digit
        static bool read_fixed_digits(std::string_view line, size_t pos, size_t width, uint32_t& out) noexcept {
            if (pos + width > line.size()) {
                return false;
            }
            uint32_t value = 0U;
            for (size_t i = 0U; i < width; ++i) {
                auto c = line[pos + i];
                if (!utils::ascii_is_digit(c)) {
                    return false;
                }
                value = value * 10U + static_cast<uint32_t>(c - '0');
            }
            out = value;
            return true;
        }

        static size_t count_digits(std::string_view line, size_t pos) noexcept {
            size_t n = 0U;
            while (pos + n < line.size() && utils::ascii_is_digit(line[pos + n])) {
                ++n;
            }
            return n;
        }

        static bool is_level_char(char c) noexcept {
            return c == 'V' || c == 'I' || c == 'W' || c == 'E' || c == 'C';
        }

        static std::optional<log_prefix> match_at(std::string_view line, size_t pos) noexcept {
            log_prefix out{};
            if (!is_level_char(line[pos])) {
                return std::nullopt;
            }
            out.level = line[pos];
            size_t cur = pos + 1U;

            // "MMDD hh:mm:ss.uuuuuu "
            if (!read_fixed_digits(line, cur, 2U, out.month) || !read_fixed_digits(line, cur + 2U, 2U, out.day)) {
                return std::nullopt;
            }
            cur += 4U;
            if (cur >= line.size() || line[cur] != ' ') {
                return std::nullopt;
            }
            ++cur;
            if (!read_fixed_digits(line, cur, 2U, out.hour) || cur + 2U >= line.size() || line[cur + 2U] != ':' ||
                !read_fixed_digits(line, cur + 3U, 2U, out.minute) || cur + 5U >= line.size() ||
                line[cur + 5U] != ':' || !read_fixed_digits(line, cur + 6U, 2U, out.second)) {
                return std::nullopt;
            }
            cur += 8U;
            // any single separator before the fraction
            if (cur >= line.size()) {
                return std::nullopt;
            }
            ++cur;
            if (!read_fixed_digits(line, cur, 6U, out.microsecond)) {
                return std::nullopt;
            }
            cur += 6U;
            if (cur >= line.size() || line[cur] != ' ') {
                return std::nullopt;
            }
            ++cur;

            auto thread_digits = count_digits(line, cur);
            if (thread_digits == 0U) {
                return std::nullopt;
            }
            auto colon = line.find(':', cur + thread_digits);
            if (colon == std::string_view::npos) {
                return std::nullopt;
            }
            // the path needs at least one character; borrow the last thread digit when it would be empty
            if (colon == cur + thread_digits) {
                if (thread_digits < 2U) {
                    return std::nullopt;
                }
                --thread_digits;
            }
            auto thread = utils::parse_arithmetic<uint64_t>(line.substr(cur, thread_digits));
            if (!thread) {
                return std::nullopt;
            }
            out.thread = *thread;
            auto path_start = cur + thread_digits;
            out.pathname = utils::trim_ascii(line.substr(path_start, colon - path_start));

            cur = colon + 1U;
            auto line_digits = count_digits(line, cur);
            if (line_digits == 0U) {
                return std::nullopt;
            }
            auto source_line = utils::parse_arithmetic<uint64_t>(line.substr(cur, line_digits));
            if (!source_line) {
                return std::nullopt;
            }
            out.line = *source_line;
            cur += line_digits;
            if (cur + 2U >= line.size() || line[cur] != ']' || line[cur + 1U] != ' ') {
                return std::nullopt;
            }
            out.payload_offset = cur + 2U;
            return out;
        }

        static intern_entry decode_intern_entry(const json::value& v) {
            auto* arr = json::as_array(v);
            if (arr == nullptr || arr->size() != 2U) {
                throw std::runtime_error("'str' must be a [string, id] pair");
            }
            auto* text = json::as_string((*arr)[0]);
            if (text == nullptr) {
                throw std::runtime_error("'str' value must be a string");
            }
            auto id = json::to_unsigned((*arr)[1], "str id"sv);
            if (!id) {
                throw std::runtime_error("'str' id must be an unsigned integer");
            }
            if (*id > intern_table::max_id) {
                throw std::runtime_error("'str' id {} exceeds {}"_format(*id, intern_table::max_id));
            }
            return intern_entry{static_cast<uint32_t>(*id), *text};
        }

    }  // namespace detail

    std::optional<log_prefix> parse_log_prefix(std::string_view line) noexcept {
        for (size_t pos = 0U; pos < line.size(); ++pos) {
            if (auto m = detail::match_at(line, pos)) {
                return m;
            }
        }
        return std::nullopt;
    }

    std::string format_timestamp(const log_prefix& prefix, int year) {
        return "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z"_format(
                year, prefix.month, prefix.day, prefix.hour, prefix.minute, prefix.second, prefix.microsecond);
    }

    int current_utc_year() {
        auto today = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
        return static_cast<int>(std::chrono::year_month_day{today}.year());
    }

    const kind_set& default_known_kinds() {
        static const kind_set kinds{
                "aot_autograd_backward_compilation_metrics",
                "aot_backward_graph",
                "aot_forward_graph",
                "aot_inference_graph",
                "aot_joint_graph",
                "artifact",
                "bwd_compilation_metrics",
                "chromium_event",
                "compilation_metrics",
                "compiled_autograd_graph",
                "create_unbacked_symbol",
                "describe_source",
                "describe_storage",
                "describe_tensor",
                "dump_file",
                "dynamo_cpp_guards_str",
                "dynamo_guards",
                "dynamo_output_graph",
                "dynamo_start",
                "exported_program",
                "expression_created",
                "graph_dump",
                "guard_added",
                "guard_added_fast",
                "inductor_output_code",
                "inductor_post_grad_graph",
                "inductor_pre_grad_graph",
                "link",
                "mismatched_fake_kernel",
                "missing_fake_kernel",
                "optimize_ddp_split_child",
                "optimize_ddp_split_graph",
                "propagate_real_tensors_provenance",
                "stack",
                "symbolic_shape_specialization",
        };
        return kinds;
    }

    envelope decode_envelope(const json::value& object, const kind_set& known_kinds) {
        auto* fields = json::as_object(object);
        if (fields == nullptr) {
            throw std::runtime_error("envelope is not a JSON object");
        }

        envelope e{};
        for (const auto& [key, value] : *fields) {
            if (key == "rank"sv) {
                auto rank = json::to_unsigned(value, "rank"sv);
                if (rank && *rank > std::numeric_limits<uint32_t>::max()) {
                    throw std::runtime_error("rank out of range: {}"_format(*rank));
                }
                if (rank) {
                    e.rank = static_cast<uint32_t>(*rank);
                }
            }
            else if (key == "compile_id"sv) {
                e.cid = compile_id_from_json(value);
            }
            else if (key == "has_payload"sv) {
                if (json::is_null(value)) {
                    continue;
                }
                auto* digest = json::as_string(value);
                if (digest == nullptr) {
                    throw std::runtime_error("has_payload must be a string");
                }
                e.has_payload = *digest;
            }
            else if (key == "str"sv) {
                if (!json::is_null(value)) {
                    e.intern = detail::decode_intern_entry(value);
                }
            }
            else {
                if (!json::is_null(value)) {
                    e.kinds.emplace(key, value);
                }
                if (!known_kinds.contains(key)) {
                    e.unknown_fields.emplace(key, value);
                }
            }
        }
        return e;
    }

    std::optional<std::pair<size_t, std::string>> line_reader::next() {
        if (!fill()) {
            return std::nullopt;
        }
        auto out = std::move(peeked);
        peeked.reset();
        return out;
    }

    std::optional<std::pair<size_t, std::string>> line_reader::next_if_continuation() {
        if (!fill() || !peeked->second.starts_with('\t')) {
            return std::nullopt;
        }
        auto out = std::move(peeked);
        peeked.reset();
        return out;
    }

    bool line_reader::fill() {
        if (peeked) {
            return true;
        }
        std::string line{};
        while (std::getline(in, line)) {
            ++lineno;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty()) {
                continue;
            }
            peeked.emplace(lineno, std::move(line));
            return true;
        }
        return false;
    }

    std::string collect_payload(line_reader& reader) {
        std::string payload{};
        bool first = true;
        while (auto continuation = reader.next_if_continuation()) {
            if (!first) {
                payload += '\n';
            }
            first = false;
            payload.append(std::string_view{continuation->second}.substr(1U));
        }
        return payload;
    }

    bool payload_matches_digest(std::string_view payload, std::string_view expected_hex) {
        auto expected = internal::digest::decode_lower_hex(expected_hex);
        if (!expected) {
            return false;
        }
        return internal::digest::md5(payload) == *expected;
    }

}  // namespace tracesift
