#pragma once

#include "compile_id.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tracesift {

    using namespace std::string_view_literals;

    enum class cache_status : uint8_t {
        none,
        hit,
        miss,
        bypass,
    };

    // Glyph recorded in the directory index as the artifact's suffix
    inline constexpr std::string_view to_string(cache_status status) {
        switch (status) {
            case cache_status::none:
                return ""sv;
            case cache_status::hit:
                return "✅"sv;
            case cache_status::miss:
                return "❌"sv;
            case cache_status::bypass:
                return "❓"sv;
        }
        return ""sv;
    }

    inline constexpr bool try_parse_cache_status(std::string_view glyph, cache_status& out) {
        for (auto status : {cache_status::none, cache_status::hit, cache_status::miss, cache_status::bypass}) {
            if (glyph == to_string(status)) {
                out = status;
                return true;
            }
        }
        return false;
    }

    // miss is checked before hit, then bypass
    inline constexpr cache_status cache_status_from_filename(std::string_view filename) {
        if (filename.find("cache_miss"sv) != std::string_view::npos) {
            return cache_status::miss;
        }
        if (filename.find("cache_hit"sv) != std::string_view::npos) {
            return cache_status::hit;
        }
        if (filename.find("cache_bypass"sv) != std::string_view::npos) {
            return cache_status::bypass;
        }
        return cache_status::none;
    }

    struct output_file {
        std::string url{};
        std::string name{};
        uint64_t number{};
        cache_status status{cache_status::none};
        std::optional<std::string> readable_url{};
    };

    // nullopt is the synthetic "unknown" bucket
    using directory_key = std::optional<compile_id>;

    /*
     * Insertion-ordered mapping from normalized compile id to the artifacts emitted for it.
     *
     * Callers pass keys that are already normalized; bucket() creates the entry on first touch
     * and keeps the creation order for serialization and display.
     */
    class compile_directory {
      public:
        using bucket_type = std::vector<output_file>;
        using entry_type = std::pair<directory_key, bucket_type>;

        bucket_type& bucket(const directory_key& key);

        const bucket_type* find(const directory_key& key) const;

        bool contains_unknown() const { return index.contains(std::nullopt); }

        size_t size() const { return buckets.size(); }

        bool empty() const { return buckets.empty(); }

        const std::vector<entry_type>& entries() const { return buckets; }

        // First url in any bucket containing the fragment
        std::optional<std::string> find_url(std::string_view fragment) const;

        // {"<display id>|unknown": {"artifacts": [{url, name, number, suffix, readable_url}, ...]}, ...}
        std::string to_json() const;

      private:
        std::vector<entry_type> buckets{};
        std::map<directory_key, size_t> index{};
    };

    // Display key used in the serialized index
    std::string directory_key_string(const directory_key& key);

    // Inserts "_<number>" between stem and extension of the last path component
    std::string add_unique_suffix(std::string_view path, uint64_t number);

}  // namespace tracesift
