#pragma once

#include "tracesift.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/digest.hpp"
#include "../src/internal/files.hpp"
#include "../src/internal/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace tracesift::test {

    using namespace std::string_view_literals;
    using namespace tracesift::literals;
    namespace fs = std::filesystem;

    // Scratch directory removed on scope exit
    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view tag) {
            static std::atomic<uint64_t> counter{0U};
            auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path = fs::temp_directory_path() / "tracesift_{}_{}_{}"_format(tag, stamp, counter++);
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }

        temp_dir(const temp_dir&) = delete;
        temp_dir& operator=(const temp_dir&) = delete;

        fs::path write(const fs::path& relative, std::string_view content) const {
            auto target = path / relative;
            internal::files::write_text_file(target, content);
            return target;
        }
    };

    inline constexpr auto default_prefix = "V0401 15:37:31.345000 140064373581632 torch/_dynamo/convert_frame.py:776] "sv;

    // One glog-prefixed record line
    inline std::string record(std::string_view json_payload) {
        return "{}{}\n"_format(default_prefix, json_payload);
    }

    // has_payload record followed by tab-prefixed continuation lines
    inline std::string record_with_payload(std::string_view json_fields, std::string_view payload) {
        auto digest = internal::digest::to_hex(internal::digest::md5(payload));
        std::string fields{json_fields};
        std::string out = record("{{{}{}\"has_payload\": \"{}\"}}"_format(fields, fields.empty() ? "" : ", ", digest));
        std::string_view rest{payload};
        while (true) {
            auto eol = rest.find('\n');
            out += "\t{}\n"_format(rest.substr(0U, eol));
            if (eol == std::string_view::npos) {
                break;
            }
            rest.remove_prefix(eol + 1U);
        }
        return out;
    }

    inline parse_config quiet_config() {
        parse_config cfg{};
        cfg.quiet = true;
        return cfg;
    }

    inline parse_result run_log(std::string_view text, const parse_config& cfg = quiet_config()) {
        std::istringstream in{std::string{text}};
        return parse_log(in, cfg);
    }

    inline std::vector<std::string> output_paths(const parse_result& result) {
        std::vector<std::string> out{};
        for (const auto& [path, content] : result.output) {
            out.push_back(path.generic_string());
        }
        return out;
    }

    inline bool has_output(const parse_result& result, std::string_view path) {
        return result.find(fs::path{path}) != nullptr;
    }

    // raw.jsonl lines after the string table
    inline std::vector<std::string> side_log_lines(const parse_result& result) {
        std::vector<std::string> lines{};
        auto* content = result.find("raw.jsonl");
        if (content == nullptr) {
            return lines;
        }
        std::istringstream in{*content};
        std::string line{};
        while (std::getline(in, line)) {
            if (!line.empty()) {
                lines.push_back(line);
            }
        }
        return lines;
    }

}  // namespace tracesift::test
