#pragma once

#include "tracesift/ranks.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tracesift::internal {

    struct artifact_record {
        std::string url{};
        std::string name{};
        uint64_t number{};
        std::string suffix{};
        std::optional<std::string> readable_url{};
    };

    struct directory_entry_record {
        std::vector<artifact_record> artifacts{};
    };

    using directory_record = std::map<std::string, directory_entry_record>;

    struct frame_record {
        std::string filename{};
        uint64_t line{};
        std::string name{};
        std::optional<std::string> loc{};
    };

    struct specialization_record {
        std::string symbol{};
        std::vector<std::string> sources{};
        std::string value{};
        std::vector<frame_record> user_stack{};
        std::vector<frame_record> stack{};
    };

    struct fast_guard_record {
        std::string expr{};
        std::vector<frame_record> user_stack{};
        std::vector<frame_record> stack{};
    };

    struct compilation_metrics_record {
        std::string compile_id{};
        std::string compile_id_dir{};
        glz::generic metrics{};
        std::vector<frame_record> stack{};
        std::vector<frame_record> mini_stack{};
        std::vector<specialization_record> symbolic_shape_specializations{};
        std::vector<fast_guard_record> guards_added_fast{};
        std::vector<artifact_record> output_files{};
    };

    // bwd / aot backward metrics: the metrics object tagged with its compile id
    struct kind_metrics_record {
        std::string compile_id{};
        glz::generic metrics{};
    };

    struct failure_record {
        std::string compile_id{};
        std::optional<std::string> url{};
        std::string kind{};
        std::string reason{};
    };

    struct export_failure_record {
        std::string failure_type{};
        std::string reason{};
        std::string additional_info{};
    };

    struct export_report_record {
        bool success{true};
        size_t num_failures{};
        std::string exported_program_url{};
        std::vector<export_failure_record> failures{};
    };

    struct string_table_record {
        std::vector<std::optional<std::string>> string_table{};
    };

    // {"ops": [...]} section of inductor_runtime_and_tensor_meta artifacts
    struct runtime_file_record {
        std::vector<op_runtime> ops{};
    };

    // ranks rendered as "0, 1, 3"
    struct divergence_group_record {
        std::string sequence{};
        std::string ranks{};
    };

    struct diagnostics_record {
        divergence_flags divergence{};
        artifact_flags artifacts{};
        std::optional<runtime_analysis> analysis{};
        std::vector<divergence_group_record> cache_groups{};
        std::vector<divergence_group_record> collective_groups{};
        std::vector<divergence_group_record> tensor_meta_groups{};
        std::vector<divergence_group_record> compile_id_groups{};
    };

}  // namespace tracesift::internal
