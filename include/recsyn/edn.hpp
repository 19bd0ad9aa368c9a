// Node-based EDN representation used by module files and instruction forms.
#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace recsyn::edn
{

    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, int line, int col)
            : std::runtime_error(msg + " (line " + std::to_string(line) + ":" + std::to_string(col) + ")"),
              line(line), col(col) {}
        int line;
        int col;
    };

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct list;
    struct vector_t;
    struct node;

    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, std::string, keyword, symbol, list, vector_t>;

    struct node
    {
        node_data data;
        int line = -1;
        int col = -1;
    };

    // Parse exactly one form; trailing content is an error.
    node_ptr parse(std::string_view src);

    // Compact single-line rendering (used in diagnostics).
    std::string to_string(const node &n);
    inline std::string to_string(const node_ptr &p) { return p ? to_string(*p) : std::string("<null>"); }

    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline bool is_nil(const node &n) { return std::holds_alternative<std::monostate>(n.data); }
    inline const list *as_list(const node &n) { return std::get_if<list>(&n.data); }
    inline const vector_t *as_vector(const node &n) { return std::get_if<vector_t>(&n.data); }
    inline const symbol *as_symbol(const node &n) { return std::get_if<symbol>(&n.data); }
    inline const keyword *as_keyword(const node &n) { return std::get_if<keyword>(&n.data); }
    inline const std::string *as_string(const node &n) { return std::get_if<std::string>(&n.data); }
    inline const int64_t *as_int(const node &n) { return std::get_if<int64_t>(&n.data); }
    inline const bool *as_bool(const node &n) { return std::get_if<bool>(&n.data); }

    // Head symbol of a list form, or empty.
    inline std::string head_name(const node &n)
    {
        auto *l = as_list(n);
        if (!l || l->elems.empty() || !l->elems[0])
            return {};
        auto *s = as_symbol(*l->elems[0]);
        return s ? s->name : std::string{};
    }

    // Symbol name or string contents, whichever the node holds.
    inline std::string name_of(const node &n)
    {
        if (auto *s = as_symbol(n))
            return s->name;
        if (auto *str = as_string(n))
            return *str;
        return {};
    }

    // A list form split into `:key value` pairs and positional elements.
    // Used for `(type :name "P" (field ...) (method ...))` shaped forms.
    struct form_view
    {
        std::vector<std::pair<std::string, node_ptr>> kwargs;
        std::vector<node_ptr> positional;

        node_ptr get(std::string_view key) const
        {
            for (auto &kv : kwargs)
                if (kv.first == key)
                    return kv.second;
            return nullptr;
        }
        bool has(std::string_view key) const { return get(key) != nullptr; }
    };

    form_view split_form(const list &l, size_t start = 1);

} // namespace recsyn::edn
