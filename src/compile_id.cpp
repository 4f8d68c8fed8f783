#include "tracesift/compile_id.hpp"

#include "tracesift/format.hpp"

#include <limits>
#include <stdexcept>

using namespace tracesift::literals;

namespace tracesift {
    namespace detail {

        using namespace std::string_view_literals;

        static std::string part_or_dash(const std::optional<uint32_t>& part) {
            return part ? std::to_string(*part) : std::string{"-"};
        }

        static std::optional<uint32_t> read_part(const json::value& obj, std::string_view key) {
            auto value = json::get_unsigned(obj, key);
            if (!value) {
                return std::nullopt;
            }
            if (*value > std::numeric_limits<uint32_t>::max()) {
                throw std::runtime_error("compile_id.{} out of range"_format(key));
            }
            return static_cast<uint32_t>(*value);
        }

    }  // namespace detail

    std::string compile_id::to_string() const {
        std::string out{"["};
        if (compiled_autograd_id) {
            out += "!{}/"_format(*compiled_autograd_id);
        }
        out += "{}/{}"_format(detail::part_or_dash(frame_id), detail::part_or_dash(frame_compile_id));
        if (attempt && *attempt != 0U) {
            out += "_{}"_format(*attempt);
        }
        out += ']';
        return out;
    }

    std::string compile_id::as_directory_name() const {
        return "{}_{}_{}_{}"_format(
                detail::part_or_dash(compiled_autograd_id),
                detail::part_or_dash(frame_id),
                detail::part_or_dash(frame_compile_id),
                detail::part_or_dash(attempt));
    }

    std::optional<compile_id> compile_id_from_json(const json::value& v) {
        if (json::is_null(v)) {
            return std::nullopt;
        }
        if (json::as_object(v) == nullptr) {
            throw std::runtime_error("compile_id must be an object");
        }
        compile_id cid{};
        cid.frame_id = detail::read_part(v, "frame_id"sv);
        cid.frame_compile_id = detail::read_part(v, "frame_compile_id"sv);
        cid.attempt = detail::read_part(v, "attempt"sv);
        cid.compiled_autograd_id = detail::read_part(v, "compiled_autograd_id"sv);
        return cid;
    }

    std::string compile_id_directory(const std::optional<compile_id>& cid, size_t lineno) {
        if (cid) {
            return cid->as_directory_name();
        }
        return "unknown_{}"_format(lineno);
    }

}  // namespace tracesift
