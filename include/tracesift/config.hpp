#pragma once

#include "parsers.hpp"
#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tracesift {

    using namespace std::string_view_literals;

    /*
     * tracesift parse options
     *
     * - strict: fail the pass when any grammar, JSON, payload digest, off-rank, formatter or
     *   handler failure was counted.
     * - strict_compile_id: fail the pass when any record landed in the unknown compile id bucket.
     * - verbose: also report every unrecognized envelope field as it is seen.
     * - quiet: suppress per-line warnings and the final statistics line.
     * - output: rendered (line-anchored HTML for source-like artifacts) or plain_text.
     * - export_mode: only collect exported-program artifacts and export failures.
     * - custom_parsers: extra handlers run after the default catalog.
     */
    enum class output_mode : uint8_t { rendered, plain_text };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::rendered:
                return "rendered"sv;
            case output_mode::plain_text:
                return "plain_text"sv;
        }
        return "rendered"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "rendered"sv) || utils::str_case_eq(text, "html"sv)) {
            out = output_mode::rendered;
            return true;
        }
        if (utils::str_case_eq(text, "plain_text"sv) || utils::str_case_eq(text, "plain"sv) ||
            utils::str_case_eq(text, "text"sv)) {
            out = output_mode::plain_text;
            return true;
        }
        return false;
    }

    struct parse_config {
        bool strict{false};
        bool strict_compile_id{false};
        bool verbose{false};
        bool quiet{false};
        output_mode output{output_mode::rendered};
        bool export_mode{false};
        std::vector<log_parser> custom_parsers{};
    };

    /*
     * Command line startup options
     *
     * - input: log file, or a directory with --latest / --all-ranks.
     * - output_dir: report root, created fresh unless overwrite.
     * - latest: parse the most recently modified file of the input directory.
     * - all_ranks: parse every per-rank log of the input directory and run the cross-rank pass.
     */
    struct startup_config {
        std::filesystem::path input{};
        std::filesystem::path output_dir{"tl_out"};
        bool overwrite{false};
        bool latest{false};
        bool all_ranks{false};

        bool strict{false};
        bool strict_compile_id{false};
        bool verbose{false};
        bool quiet{false};
        output_mode output{output_mode::rendered};
        bool export_mode{false};
    };

    inline parse_config make_parse_config(const startup_config& cfg) {
        parse_config out{};
        out.strict = cfg.strict;
        out.strict_compile_id = cfg.strict_compile_id;
        out.verbose = cfg.verbose;
        out.quiet = cfg.quiet;
        out.output = cfg.output;
        out.export_mode = cfg.export_mode;
        return out;
    }

}  // namespace tracesift
