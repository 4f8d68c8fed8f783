#pragma once

#include "tracesift/format.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace tracesift::internal::files {

    using namespace tracesift::literals;
    namespace fs = std::filesystem;

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (!in.good() && !in.eof()) {
            throw std::runtime_error("failed to read {}"_format(path.string()));
        }
        return ss.str();
    }

    inline void ensure_dir(const fs::path& path) {
        std::error_code ec{};
        fs::create_directories(path, ec);
        if (ec) {
            throw std::runtime_error("failed to create directory: {}"_format(path.string()));
        }
    }

    // Creates missing parent directories
    inline void write_text_file(const fs::path& path, std::string_view content) {
        if (path.has_parent_path()) {
            ensure_dir(path.parent_path());
        }
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        out << content;
        if (!out) {
            throw std::runtime_error("failed to write {}"_format(path.string()));
        }
    }

}  // namespace tracesift::internal::files
