#include "tracesift/directory.hpp"

#include "internal/types.hpp"
#include "tracesift/json.hpp"

#include <filesystem>

namespace tracesift {

    namespace fs = std::filesystem;

    compile_directory::bucket_type& compile_directory::bucket(const directory_key& key) {
        if (auto it = index.find(key); it != index.end()) {
            return buckets[it->second].second;
        }
        index.emplace(key, buckets.size());
        buckets.emplace_back(key, bucket_type{});
        return buckets.back().second;
    }

    const compile_directory::bucket_type* compile_directory::find(const directory_key& key) const {
        if (auto it = index.find(key); it != index.end()) {
            return &buckets[it->second].second;
        }
        return nullptr;
    }

    std::optional<std::string> compile_directory::find_url(std::string_view fragment) const {
        for (const auto& [key, files] : buckets) {
            for (const auto& file : files) {
                if (file.url.find(fragment) != std::string::npos) {
                    return file.url;
                }
            }
        }
        return std::nullopt;
    }

    std::string compile_directory::to_json() const {
        internal::directory_record record{};
        for (const auto& [key, files] : buckets) {
            auto& entry = record[directory_key_string(key)];
            for (const auto& file : files) {
                std::string_view name{file.name};
                if (auto slash = name.rfind('/'); slash != std::string_view::npos) {
                    name.remove_prefix(slash + 1U);
                }
                entry.artifacts.push_back(internal::artifact_record{
                        .url = file.url,
                        .name = std::string{name},
                        .number = file.number,
                        .suffix = std::string{to_string(file.status)},
                        .readable_url = file.readable_url});
            }
        }
        return json::write_pretty(record);
    }

    std::string directory_key_string(const directory_key& key) {
        return key ? key->to_string() : std::string{"unknown"};
    }

    std::string add_unique_suffix(std::string_view path, uint64_t number) {
        fs::path raw{path};
        auto stem = raw.stem().string();
        if (stem.empty()) {
            return std::string{path};
        }
        auto renamed = stem + "_" + std::to_string(number) + raw.extension().string();
        return raw.replace_filename(renamed).generic_string();
    }

}  // namespace tracesift
