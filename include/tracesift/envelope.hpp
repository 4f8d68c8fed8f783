#pragma once

#include "compile_id.hpp"
#include "json.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace tracesift {

    using namespace std::string_view_literals;

    /*
     * Fixed glog-style prefix preceding every record:
     *
     *     V0401 15:37:31.345000 140064373581632 torch/_dynamo/convert_frame.py:776] {...}
     *
     * level, month/day, time with microseconds, thread id, source path:line, then the JSON
     * payload starting at payload_offset.
     */
    struct log_prefix {
        char level{};
        uint32_t month{};
        uint32_t day{};
        uint32_t hour{};
        uint32_t minute{};
        uint32_t second{};
        uint32_t microsecond{};
        uint64_t thread{};
        std::string_view pathname{};
        uint64_t line{};
        size_t payload_offset{};
    };

    // Searches for the leftmost position where the prefix grammar matches
    std::optional<log_prefix> parse_log_prefix(std::string_view line) noexcept;

    // ISO-8601 with microseconds; the log carries no year so the caller supplies one
    std::string format_timestamp(const log_prefix& prefix, int year);

    int current_utc_year();

    struct intern_entry {
        uint32_t id{};
        std::string value{};
    };

    using kind_map = std::map<std::string, json::value, std::less<>>;
    using kind_set = std::set<std::string, std::less<>>;

    struct envelope {
        std::optional<uint32_t> rank{};
        std::optional<compile_id> cid{};
        std::optional<std::string> has_payload{};
        std::optional<intern_entry> intern{};
        kind_map kinds{};
        kind_map unknown_fields{};

        const json::value* kind(std::string_view name) const noexcept {
            if (auto it = kinds.find(name); it != kinds.end()) {
                return &it->second;
            }
            return nullptr;
        }

        bool has_kind(std::string_view name) const noexcept { return kind(name) != nullptr; }
    };

    // Every record kind the default catalog and the interpreter itself understand
    const kind_set& default_known_kinds();

    // Throws std::runtime_error when the object is not a JSON object or a reserved field is malformed.
    // Every non-reserved field is a kind (null counts as absent); those outside known_kinds are also
    // captured in unknown_fields.
    envelope decode_envelope(const json::value& object, const kind_set& known_kinds);

    // Physical line source that skips blank lines and can peek one line ahead
    class line_reader {
      public:
        explicit line_reader(std::istream& in) : in{in} {}

        // (1-based physical line number, line without the trailing newline)
        std::optional<std::pair<size_t, std::string>> next();

        std::optional<std::pair<size_t, std::string>> next_if_continuation();

      private:
        bool fill();

        std::istream& in;
        std::optional<std::pair<size_t, std::string>> peeked{};
        size_t lineno{};
    };

    // Consumes tab-prefixed continuation lines, joined by '\n' with no trailing newline
    std::string collect_payload(line_reader& reader);

    // False on mismatch and on an expectation that is not 32 lowercase hex digits
    bool payload_matches_digest(std::string_view payload, std::string_view expected_hex);

}  // namespace tracesift
