/**
 * HolySheet - Store query grammar.
 *
 * The grammar is the subset of the Drive v3 `q` syntax the catalog emits:
 *
 *   expr      := term ("or" term)*
 *   term      := factor ("and" factor)*
 *   factor    := "not" factor | "(" expr ")" | predicate
 *   predicate := "name" ("=" | "!=" | "contains") STRING
 *              | "mimeType" ("=" | "!=") STRING
 *              | "trashed" ("=" | "!=") ("true" | "false")
 *              | STRING "in" "parents" | "parents" "in" STRING
 *              | "properties" "has" "{" "key" "=" STRING "and" "value" "=" STRING "}"
 *
 * Strings are single quoted with \' and \\ escapes. The builders below produce
 * text in this grammar; Query parses it back for stores that evaluate queries
 * locally.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "holysheet/catalog/remote_item.hpp"

namespace holysheet::catalog::query
{

    std::string quote(std::string_view value);

    std::string name_equals(std::string_view name);
    std::string name_contains(std::string_view fragment);
    std::string mime_type_equals(std::string_view mime_type);
    std::string trashed_equals(bool trashed);
    std::string in_parents(std::string_view parent_id);
    std::string property_equals(std::string_view key, std::string_view value);

    // Joins non-empty clauses, parenthesising each when more than one remains.
    std::string all_of(const std::vector<std::string> &clauses);
    std::string any_of(const std::vector<std::string> &clauses);

    struct Predicate
    {
        enum class Field
        {
            Name,
            MimeType,
            Trashed,
            Parents,
            Property
        };

        enum class Operator
        {
            Equals,
            NotEquals,
            Contains,
            In,
            Has
        };

        Field field{Field::Name};
        Operator op{Operator::Equals};
        std::string key;
        std::string value;
        bool flag{};
    };

    struct Node
    {
        enum class Kind
        {
            All,
            And,
            Or,
            Not,
            Leaf
        };

        Kind kind{Kind::All};
        std::vector<Node> children;
        Predicate predicate;
    };

    class Query
    {
    public:
        // Throws StoreError(InvalidQuery) when `text` is outside the grammar. Blank text matches everything.
        static Query parse(std::string_view text);

        bool matches(const RemoteItem &item) const;

        const Node &root() const noexcept { return root_; }

    private:
        explicit Query(Node root);

        Node root_;
    };

} // namespace holysheet::catalog::query
