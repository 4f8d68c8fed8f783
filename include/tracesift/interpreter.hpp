#pragma once

#include "config.hpp"
#include "context.hpp"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tracesift {

    // (path relative to the report root, content) in emission order
    using parse_output = std::vector<std::pair<std::filesystem::path, std::string>>;

    struct parse_result {
        parse_output output{};
        parse_stats stats{};
        std::optional<uint32_t> rank{};
        std::vector<std::string> unknown_fields{};

        const std::string* find(const std::filesystem::path& path) const {
            for (const auto& [p, content] : output) {
                if (p == path) {
                    return &content;
                }
            }
            return nullptr;
        }
    };

    // Raised at pass end by strict and strict-compile-id modes; carries the counters of the pass
    class parse_error : public std::runtime_error {
      public:
        parse_error(const std::string& what, parse_stats stats) : std::runtime_error{what}, stats{std::move(stats)} {}

        parse_stats stats;
    };

    /*
     * Runs one interpreter pass over a rank's log.
     *
     * Every physical line is decoded independently; malformed lines, payload digest mismatches,
     * off-rank records and failing handlers are counted and skipped. At the end of the stream the
     * aggregate side files are appended to the output, then strict modes are evaluated.
     */
    parse_result parse_log(std::istream& in, const parse_config& cfg);

    // parse_log over a file, plus a verbatim raw.log copy of the input
    parse_result parse_path(const std::filesystem::path& path, const parse_config& cfg);

}  // namespace tracesift
