#pragma once

#include "compile_id.hpp"
#include "envelope.hpp"
#include "json.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tracesift {

    struct parse_config;
    struct pass_context;

    // Written under the record's compile id directory, "_<seq>" inserted before the extension
    struct file_output {
        std::string path{};
        std::string content{};
    };

    // Written at the given path verbatim
    struct global_file_output {
        std::string path{};
        std::string content{};
    };

    // Suffixed like file_output, content is the record's continuation payload
    struct payload_file_output {
        std::string path{};
    };

    using payload_formatter = std::function<std::string(std::string_view)>;

    // Suffixed like file_output, content is formatter(payload); a throwing formatter emits nothing
    struct payload_reformat_output {
        std::string path{};
        payload_formatter formatter{};
    };

    // Directory entry only
    struct link_output {
        std::string name{};
        std::string url{};
    };

    using parser_output =
            std::variant<file_output, global_file_output, payload_file_output, payload_reformat_output, link_output>;

    using parser_results = std::vector<parser_output>;

    struct parser_input {
        size_t lineno{};
        const json::value& metadata;
        const envelope& record;
        std::optional<uint32_t> rank{};
        // normalized
        const std::optional<compile_id>& cid;
        std::string_view payload{};
        pass_context& context;
    };

    /*
     * One (predicate, handler) registration.
     *
     * get_metadata returns the envelope field the handler consumes, or nullptr to skip the record.
     * parse throws to signal failure; the dispatcher counts the failure under name.
     */
    struct log_parser {
        std::string name{};
        std::function<const json::value*(const envelope&)> get_metadata{};
        std::function<parser_results(const parser_input&)> parse{};
    };

    // Predicate matching records whose kind field is populated
    std::function<const json::value*(const envelope&)> kind_predicate(std::string kind);

    std::vector<log_parser> default_parsers(const parse_config& cfg);

    // Runs after the registry with the pass indices; consumes specializations and fast guards
    log_parser compilation_metrics_parser();

    // Export-mode guard report including the symbolic expression tree
    log_parser symbolic_guard_parser();

    // "<compile id dir>/<filename>", unknown_<lineno> when the record has no compile id
    std::string compile_file_path(std::string_view filename, size_t lineno, const std::optional<compile_id>& cid);

    // Pretty JSON, or the payload unchanged when it does not parse
    std::string format_json_pretty(std::string_view payload);

    // Escaped source with one <span id="L<n>"> per line
    std::string anchor_source(std::string_view text);

    // N from fx module names of the form "<eval_with_key>.N"
    std::optional<uint64_t> extract_eval_with_key_id(std::string_view name);

}  // namespace tracesift
