#pragma once

#include "directory.hpp"
#include "indices.hpp"
#include "intern.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace tracesift {

    // Pass-scoped failure and progress counters
    struct parse_stats {
        uint64_t ok{};
        uint64_t other_rank{};
        uint64_t fail_glog{};
        uint64_t fail_json{};
        uint64_t fail_payload_md5{};
        uint64_t fail_parser{};
        uint64_t fail_key_conflict{};
        uint64_t fail_json_serialization{};
        uint64_t unknown{};
        std::map<std::string, uint64_t, std::less<>> handler_failures{};

        uint64_t total_handler_failures() const {
            uint64_t total = 0U;
            for (const auto& [name, count] : handler_failures) {
                total += count;
            }
            return total;
        }

        // Everything strict mode refuses
        uint64_t strict_failures() const {
            return fail_glog + fail_json + fail_payload_md5 + other_rank + fail_parser + total_handler_failures();
        }

        void count_handler_failure(std::string_view name) {
            if (auto it = handler_failures.find(name); it != handler_failures.end()) {
                ++it->second;
            }
            else {
                handler_failures.emplace(std::string{name}, 1U);
            }
        }

        std::string to_string() const;

        static constexpr bool to_string_formattable = true;
    };

    /*
     * State owned by one interpreter pass and lent to handlers for the duration of a call.
     *
     * - strings: intern table fed by {"str": [value, id]} records.
     * - directory: artifacts grouped by normalized compile id.
     * - stacks: dynamo_start stacks, read by compilation metrics.
     * - specializations, fast_guards: consumed by the compilation metrics of the same compile id.
     * - sym_exprs: symbolic expression arena used by export-mode guard reports.
     */
    struct pass_context {
        intern_table strings{};
        compile_directory directory{};
        stack_index stacks{};
        compile_index<shape_specialization> specializations{};
        compile_index<fast_guard> fast_guards{};
        sym_expr_arena sym_exprs{};
        parse_stats stats{};
    };

}  // namespace tracesift
