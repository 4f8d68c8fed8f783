#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tracesift {

    using namespace std::string_view_literals;

    // Pass-scoped id -> string table fed by {"str": [value, id]} side-channel records
    class intern_table {
      public:
        static constexpr auto unknown_string = "(unknown)"sv;

        // Largest id accepted from a log; to_dense allocates max id + 1 slots
        static constexpr uint32_t max_id = (1U << 24U) - 1U;

        void insert(uint32_t id, std::string value) {
            if (!highest_id || id > *highest_id) {
                highest_id = id;
            }
            entries.insert_or_assign(id, std::move(value));
        }

        std::optional<std::string_view> find(uint32_t id) const {
            if (auto it = entries.find(id); it != entries.end()) {
                return it->second;
            }
            return std::nullopt;
        }

        std::string_view resolve(uint32_t id) const { return find(id).value_or(unknown_string); }

        size_t size() const { return entries.size(); }

        bool empty() const { return entries.empty(); }

        // Dense form indexed by id, nulls for ids never inserted; a lone null when empty
        std::vector<std::optional<std::string>> to_dense() const {
            std::vector<std::optional<std::string>> dense(highest_id ? static_cast<size_t>(*highest_id) + 1U : 1U);
            for (const auto& [id, value] : entries) {
                dense[id] = value;
            }
            return dense;
        }

      private:
        std::unordered_map<uint32_t, std::string> entries{};
        std::optional<uint32_t> highest_id{};
    };

}  // namespace tracesift
