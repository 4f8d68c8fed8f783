#pragma once

#include "json.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace tracesift {

    /*
     * Identifies one compilation attempt within a rank.
     *
     * - frame_id: outer frame being compiled.
     * - frame_compile_id: how many times that frame has been compiled.
     * - attempt: restart counter within one frame compile.
     * - compiled_autograd_id: sub-id for compiled autograd graphs.
     *
     * Older logs omit the attempt; normalize() collapses those into attempt 0 so records with
     * and without an explicit attempt share a directory bucket.
     */
    struct compile_id {
        std::optional<uint32_t> frame_id{};
        std::optional<uint32_t> frame_compile_id{};
        std::optional<uint32_t> attempt{};
        std::optional<uint32_t> compiled_autograd_id{};

        static constexpr bool to_string_formattable = true;

        void normalize() noexcept {
            if (frame_compile_id && !attempt) {
                attempt = 0U;
            }
        }

        compile_id normalized() const noexcept {
            auto copy = *this;
            copy.normalize();
            return copy;
        }

        // Display form, e.g. "[0/1]", "[0/1_2]", "[!3/0/1]"
        std::string to_string() const;

        // Directory form "<ca>_<frame>_<fcid>_<attempt>", "-" for absent parts
        std::string as_directory_name() const;

        auto operator<=>(const compile_id&) const = default;
        bool operator==(const compile_id&) const = default;
    };

    // Throws on malformed members; a null or missing compile id yields nullopt
    std::optional<compile_id> compile_id_from_json(const json::value& v);

    std::string compile_id_directory(const std::optional<compile_id>& cid, size_t lineno);

}  // namespace tracesift
