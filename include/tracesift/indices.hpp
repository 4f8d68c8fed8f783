#pragma once

#include "directory.hpp"
#include "intern.hpp"
#include "json.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tracesift {

    // One frame of a logged stack; the filename is normally an intern id
    struct stack_frame {
        std::optional<uint32_t> filename_id{};
        std::optional<std::string> uninterned_filename{};
        uint64_t line{};
        std::string name{};
        std::optional<std::string> loc{};

        std::string filename(const intern_table& strings) const;
    };

    using stack_summary = std::vector<stack_frame>;

    // Null reads as an empty stack; anything else but an array of frames throws
    stack_summary stack_from_json(const json::value& v);

    // Drops everything up to a known install-tree marker ("#link-tree/", "/site-packages/")
    std::string_view simplify_filename(std::string_view filename);

    // Strips the trailing frames contributed by the frame-conversion entry points
    void remove_convert_frame_suffixes(stack_summary& frames, const intern_table& strings);

    // "  File "<file>", line N, in <name>" per frame, innermost last
    std::string format_stack(const stack_summary& frames, const intern_table& strings);

    struct shape_specialization {
        std::string symbol{};
        std::vector<std::string> sources{};
        std::string value{};
        stack_summary user_stack{};
        stack_summary stack{};

        static shape_specialization from_json(const json::value& v);
    };

    struct fast_guard {
        std::string expr{};
        stack_summary user_stack{};
        stack_summary stack{};

        static fast_guard from_json(const json::value& v);
    };

    /*
     * Per compile id arena whose entries are consumed once.
     *
     * Records are pushed as they stream by; the consumer takes the whole vector for its compile id,
     * leaving nothing behind for a later consumer of the same key.
     */
    template <typename T>
    class compile_index {
      public:
        void push(const directory_key& key, T value) { entries[key].push_back(std::move(value)); }

        std::vector<T> take(const directory_key& key) {
            auto it = entries.find(key);
            if (it == entries.end()) {
                return {};
            }
            auto out = std::move(it->second);
            entries.erase(it);
            return out;
        }

        size_t count(const directory_key& key) const {
            auto it = entries.find(key);
            return it == entries.end() ? 0U : it->second.size();
        }

        bool empty() const { return entries.empty(); }

      private:
        std::map<directory_key, std::vector<T>> entries{};
    };

    // Latest stack recorded for a compile id; read, never consumed
    using stack_index = std::map<directory_key, stack_summary>;

    struct sym_expr_node {
        std::string result{};
        std::string method{};
        std::vector<std::string> arguments{};
        std::vector<uint64_t> argument_ids{};
        stack_summary user_stack{};
        stack_summary stack{};
    };

    // Symbolic expressions addressed by node id; argument ids may form cycles
    class sym_expr_arena {
      public:
        void insert(uint64_t id, sym_expr_node node) { nodes.insert_or_assign(id, std::move(node)); }

        const sym_expr_node* find(uint64_t id) const {
            if (auto it = nodes.find(id); it != nodes.end()) {
                return &it->second;
            }
            return nullptr;
        }

        size_t size() const { return nodes.size(); }

        // Depth-first, each id expanded at most once; empty when the root is unknown
        std::string render(uint64_t root, const intern_table& strings) const;

      private:
        std::unordered_map<uint64_t, sym_expr_node> nodes{};
    };

}  // namespace tracesift
