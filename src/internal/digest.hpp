#pragma once

#include "tracesift/utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tracesift::internal::digest {

    using namespace std::string_view_literals;

    using md5_bytes = std::array<unsigned char, 16>;

    inline md5_bytes md5(std::string_view data) {
        std::array<unsigned char, EVP_MAX_MD_SIZE> buffer{};
        unsigned int size = 0U;
        if (EVP_Digest(data.data(), data.size(), buffer.data(), &size, EVP_md5(), nullptr) != 1 || size != 16U) {
            throw std::runtime_error("md5 digest failed");
        }
        md5_bytes out{};
        std::copy_n(buffer.begin(), out.size(), out.begin());
        return out;
    }

    inline std::string to_hex(const md5_bytes& bytes) {
        static constexpr auto digits = "0123456789abcdef"sv;
        std::string out{};
        out.reserve(bytes.size() * 2U);
        for (auto b : bytes) {
            out.push_back(digits[b >> 4U]);
            out.push_back(digits[b & 0x0FU]);
        }
        return out;
    }

    // Lowercase only, exactly one digest worth of digits
    inline std::optional<md5_bytes> decode_lower_hex(std::string_view hex) {
        md5_bytes out{};
        if (hex.size() != out.size() * 2U) {
            return std::nullopt;
        }
        auto nibble = [](char c) -> std::optional<unsigned char> {
            if (utils::ascii_is_digit(c)) {
                return static_cast<unsigned char>(c - '0');
            }
            if (c >= 'a' && c <= 'f') {
                return static_cast<unsigned char>(c - 'a' + 10);
            }
            return std::nullopt;
        };
        for (size_t i = 0U; i < out.size(); ++i) {
            auto hi = nibble(hex[2U * i]);
            auto lo = nibble(hex[2U * i + 1U]);
            if (!hi || !lo) {
                return std::nullopt;
            }
            out[i] = static_cast<unsigned char>((*hi << 4U) | *lo);
        }
        return out;
    }

    // 32-bit FNV-1a, stable across platforms and runs
    inline uint32_t fnv1a_32(std::string_view data, uint32_t seed = 2166136261U) {
        auto hash = seed;
        for (unsigned char c : data) {
            hash ^= c;
            hash *= 16777619U;
        }
        return hash;
    }

}  // namespace tracesift::internal::digest
