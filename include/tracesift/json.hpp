#pragma once

#include "format.hpp"

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace tracesift::json {

    using namespace tracesift::literals;

    using value = glz::generic;
    using object_t = glz::generic::object_t;
    using array_t = glz::generic::array_t;

    inline const object_t* as_object(const value& v) noexcept { return std::get_if<object_t>(&v.data); }

    inline object_t* as_object(value& v) noexcept { return std::get_if<object_t>(&v.data); }

    inline const array_t* as_array(const value& v) noexcept { return std::get_if<array_t>(&v.data); }

    inline const std::string* as_string(const value& v) noexcept { return std::get_if<std::string>(&v.data); }

    inline bool is_null(const value& v) noexcept { return std::holds_alternative<glz::generic::null_t>(v.data); }

    inline const value* find(const value& v, std::string_view key) noexcept {
        auto* obj = as_object(v);
        if (obj == nullptr) {
            return nullptr;
        }
        if (auto it = obj->find(key); it != obj->end()) {
            return &it->second;
        }
        return nullptr;
    }

    // Null and missing members both read as absent
    inline std::optional<std::string> get_string(const value& v, std::string_view key) {
        auto* member = find(v, key);
        if (member == nullptr) {
            return std::nullopt;
        }
        if (auto* s = as_string(*member)) {
            return *s;
        }
        return std::nullopt;
    }

    inline std::optional<double> get_number(const value& v, std::string_view key) {
        auto* member = find(v, key);
        if (member == nullptr) {
            return std::nullopt;
        }
        if (auto* d = std::get_if<double>(&member->data)) {
            return *d;
        }
        return std::nullopt;
    }

    // Strict conversion for id-like fields: null is absent, anything but a non-negative integer throws
    inline std::optional<uint64_t> to_unsigned(const value& v, std::string_view what) {
        if (is_null(v)) {
            return std::nullopt;
        }
        auto* d = std::get_if<double>(&v.data);
        if (d == nullptr || *d < 0.0 || std::floor(*d) != *d ||
            *d >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
            throw std::runtime_error("expected unsigned integer for {}"_format(what));
        }
        return static_cast<uint64_t>(*d);
    }

    inline std::optional<uint64_t> get_unsigned(const value& v, std::string_view key) {
        auto* member = find(v, key);
        if (member == nullptr) {
            return std::nullopt;
        }
        return to_unsigned(*member, key);
    }

    inline value make_string(std::string s) {
        value v{};
        v.data = std::move(s);
        return v;
    }

    inline value make_number(double d) {
        value v{};
        v.data = d;
        return v;
    }

    inline value make_object() {
        value v{};
        v.data = object_t{};
        return v;
    }

    inline value parse(std::string_view text) {
        value parsed{};
        auto ec = glz::read_json(parsed, text);
        if (ec) {
            throw std::runtime_error("invalid json: {}"_format(glz::format_error(ec, text)));
        }
        return parsed;
    }

    template <typename T>
    std::string write_compact(const T& v) {
        std::string out{};
        auto ec = glz::write_json(v, out);
        if (ec) {
            throw std::runtime_error("failed to serialize json");
        }
        return out;
    }

    template <typename T>
    std::string write_pretty(const T& v) {
        std::string out{};
        auto ec = glz::write<glz::opts{.prettify = true}>(v, out);
        if (ec) {
            throw std::runtime_error("failed to serialize json");
        }
        return out;
    }

}  // namespace tracesift::json
