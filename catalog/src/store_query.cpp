#include "holysheet/catalog/store_query.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <utility>

#include "holysheet/catalog/remote_store.hpp"

namespace holysheet::catalog::query
{

    namespace
    {

        struct Token
        {
            enum class Kind
            {
                Word,
                String,
                Symbol,
                End
            };

            Kind kind{Kind::End};
            std::string text;
            std::size_t offset{};
        };

        bool equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b)); });
        }

        [[noreturn]] void fail(std::size_t offset, const std::string &reason)
        {
            throw StoreError(ErrorCode::InvalidQuery,
                             "Invalid query at offset " + std::to_string(offset) + ": " + reason);
        }

        std::vector<Token> tokenize(std::string_view text)
        {
            std::vector<Token> tokens;
            std::size_t pos = 0;
            while (pos < text.size())
            {
                const char ch = text[pos];
                if (std::isspace(static_cast<unsigned char>(ch)))
                {
                    ++pos;
                    continue;
                }
                const std::size_t start = pos;
                if (ch == '\'')
                {
                    std::string value;
                    ++pos;
                    bool closed = false;
                    while (pos < text.size())
                    {
                        const char c = text[pos++];
                        if (c == '\\')
                        {
                            if (pos >= text.size())
                            {
                                fail(pos, "dangling escape");
                            }
                            value.push_back(text[pos++]);
                            continue;
                        }
                        if (c == '\'')
                        {
                            closed = true;
                            break;
                        }
                        value.push_back(c);
                    }
                    if (!closed)
                    {
                        fail(start, "unterminated string literal");
                    }
                    tokens.push_back(Token{Token::Kind::String, std::move(value), start});
                    continue;
                }
                if (std::isalpha(static_cast<unsigned char>(ch)) || ch == '_')
                {
                    while (pos < text.size() &&
                           (std::isalnum(static_cast<unsigned char>(text[pos])) || text[pos] == '_'))
                    {
                        ++pos;
                    }
                    tokens.push_back(Token{Token::Kind::Word, std::string(text.substr(start, pos - start)), start});
                    continue;
                }
                if (ch == '!' && pos + 1 < text.size() && text[pos + 1] == '=')
                {
                    pos += 2;
                    tokens.push_back(Token{Token::Kind::Symbol, "!=", start});
                    continue;
                }
                if (ch == '=' || ch == '(' || ch == ')' || ch == '{' || ch == '}')
                {
                    ++pos;
                    tokens.push_back(Token{Token::Kind::Symbol, std::string(1, ch), start});
                    continue;
                }
                fail(start, std::string("unexpected character '") + ch + "'");
            }
            tokens.push_back(Token{Token::Kind::End, {}, text.size()});
            return tokens;
        }

        class Parser
        {
        public:
            explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

            Node parse()
            {
                auto node = parse_or();
                if (peek().kind != Token::Kind::End)
                {
                    fail(peek().offset, "unexpected '" + peek().text + "'");
                }
                return node;
            }

        private:
            const Token &peek() const
            {
                return tokens_[index_];
            }

            const Token &next()
            {
                const auto &token = tokens_[index_];
                if (token.kind != Token::Kind::End)
                {
                    ++index_;
                }
                return token;
            }

            bool accept_keyword(std::string_view keyword)
            {
                if (peek().kind == Token::Kind::Word && equals_ignore_case(peek().text, keyword))
                {
                    ++index_;
                    return true;
                }
                return false;
            }

            void expect_keyword(std::string_view keyword)
            {
                if (!accept_keyword(keyword))
                {
                    fail(peek().offset, "expected '" + std::string(keyword) + "'");
                }
            }

            bool accept_symbol(std::string_view symbol)
            {
                if (peek().kind == Token::Kind::Symbol && peek().text == symbol)
                {
                    ++index_;
                    return true;
                }
                return false;
            }

            void expect_symbol(std::string_view symbol)
            {
                if (!accept_symbol(symbol))
                {
                    fail(peek().offset, "expected '" + std::string(symbol) + "'");
                }
            }

            std::string expect_string()
            {
                if (peek().kind != Token::Kind::String)
                {
                    fail(peek().offset, "expected a quoted string");
                }
                return next().text;
            }

            Node parse_or()
            {
                Node first = parse_and();
                if (!(peek().kind == Token::Kind::Word && equals_ignore_case(peek().text, "or")))
                {
                    return first;
                }
                Node node;
                node.kind = Node::Kind::Or;
                node.children.push_back(std::move(first));
                while (accept_keyword("or"))
                {
                    node.children.push_back(parse_and());
                }
                return node;
            }

            Node parse_and()
            {
                Node first = parse_factor();
                if (!(peek().kind == Token::Kind::Word && equals_ignore_case(peek().text, "and")))
                {
                    return first;
                }
                Node node;
                node.kind = Node::Kind::And;
                node.children.push_back(std::move(first));
                while (accept_keyword("and"))
                {
                    node.children.push_back(parse_factor());
                }
                return node;
            }

            Node parse_factor()
            {
                if (accept_keyword("not"))
                {
                    Node node;
                    node.kind = Node::Kind::Not;
                    node.children.push_back(parse_factor());
                    return node;
                }
                if (accept_symbol("("))
                {
                    Node inner = parse_or();
                    expect_symbol(")");
                    return inner;
                }
                Node leaf;
                leaf.kind = Node::Kind::Leaf;
                leaf.predicate = parse_predicate();
                return leaf;
            }

            Predicate::Operator parse_comparison(bool allow_contains)
            {
                if (accept_symbol("="))
                {
                    return Predicate::Operator::Equals;
                }
                if (accept_symbol("!="))
                {
                    return Predicate::Operator::NotEquals;
                }
                if (allow_contains && accept_keyword("contains"))
                {
                    return Predicate::Operator::Contains;
                }
                fail(peek().offset, "expected a comparison operator");
            }

            Predicate parse_predicate()
            {
                Predicate predicate;
                if (peek().kind == Token::Kind::String)
                {
                    predicate.field = Predicate::Field::Parents;
                    predicate.op = Predicate::Operator::In;
                    predicate.value = next().text;
                    expect_keyword("in");
                    expect_keyword("parents");
                    return predicate;
                }
                if (peek().kind != Token::Kind::Word)
                {
                    fail(peek().offset, "expected a predicate");
                }
                const Token field = next();
                if (field.text == "parents")
                {
                    predicate.field = Predicate::Field::Parents;
                    predicate.op = Predicate::Operator::In;
                    expect_keyword("in");
                    predicate.value = expect_string();
                }
                else if (field.text == "properties")
                {
                    predicate.field = Predicate::Field::Property;
                    predicate.op = Predicate::Operator::Has;
                    expect_keyword("has");
                    expect_symbol("{");
                    expect_keyword("key");
                    expect_symbol("=");
                    predicate.key = expect_string();
                    expect_keyword("and");
                    expect_keyword("value");
                    expect_symbol("=");
                    predicate.value = expect_string();
                    expect_symbol("}");
                }
                else if (field.text == "name")
                {
                    predicate.field = Predicate::Field::Name;
                    predicate.op = parse_comparison(true);
                    predicate.value = expect_string();
                }
                else if (field.text == "mimeType")
                {
                    predicate.field = Predicate::Field::MimeType;
                    predicate.op = parse_comparison(false);
                    predicate.value = expect_string();
                }
                else if (field.text == "trashed")
                {
                    predicate.field = Predicate::Field::Trashed;
                    predicate.op = parse_comparison(false);
                    if (accept_keyword("true"))
                    {
                        predicate.flag = true;
                    }
                    else if (accept_keyword("false"))
                    {
                        predicate.flag = false;
                    }
                    else
                    {
                        fail(peek().offset, "expected true or false");
                    }
                }
                else
                {
                    fail(field.offset, "unsupported query field '" + field.text + "'");
                }
                return predicate;
            }

            std::vector<Token> tokens_;
            std::size_t index_{0};
        };

        bool compare(Predicate::Operator op, std::string_view actual, std::string_view expected)
        {
            switch (op)
            {
            case Predicate::Operator::Equals:
                return actual == expected;
            case Predicate::Operator::NotEquals:
                return actual != expected;
            case Predicate::Operator::Contains:
                return actual.find(expected) != std::string_view::npos;
            default:
                return false;
            }
        }

        bool evaluate(const Predicate &predicate, const RemoteItem &item)
        {
            switch (predicate.field)
            {
            case Predicate::Field::Name:
                return compare(predicate.op, item.name, predicate.value);
            case Predicate::Field::MimeType:
                return compare(predicate.op, item.mime_type, predicate.value);
            case Predicate::Field::Trashed:
                return predicate.op == Predicate::Operator::Equals ? item.trashed == predicate.flag
                                                                   : item.trashed != predicate.flag;
            case Predicate::Field::Parents:
                return std::find(item.parents.begin(), item.parents.end(), predicate.value) != item.parents.end();
            case Predicate::Field::Property:
                return item.has_property(predicate.key, predicate.value);
            }
            return false;
        }

        bool evaluate(const Node &node, const RemoteItem &item)
        {
            switch (node.kind)
            {
            case Node::Kind::All:
                return true;
            case Node::Kind::And:
                return std::all_of(node.children.begin(), node.children.end(), [&item](const Node &child)
                                   { return evaluate(child, item); });
            case Node::Kind::Or:
                return std::any_of(node.children.begin(), node.children.end(), [&item](const Node &child)
                                   { return evaluate(child, item); });
            case Node::Kind::Not:
                return !evaluate(node.children.front(), item);
            case Node::Kind::Leaf:
                return evaluate(node.predicate, item);
            }
            return false;
        }

        std::string join(const std::vector<std::string> &clauses, std::string_view separator)
        {
            std::vector<const std::string *> present;
            for (const auto &clause : clauses)
            {
                if (clause.find_first_not_of(" \t\r\n") != std::string::npos)
                {
                    present.push_back(&clause);
                }
            }
            if (present.size() == 1)
            {
                return *present.front();
            }
            std::string joined;
            for (const auto *clause : present)
            {
                if (!joined.empty())
                {
                    joined += separator;
                }
                joined += '(';
                joined += *clause;
                joined += ')';
            }
            return joined;
        }

    } // namespace

    std::string quote(std::string_view value)
    {
        std::string quoted;
        quoted.reserve(value.size() + 2);
        quoted.push_back('\'');
        for (const char ch : value)
        {
            if (ch == '\'' || ch == '\\')
            {
                quoted.push_back('\\');
            }
            quoted.push_back(ch);
        }
        quoted.push_back('\'');
        return quoted;
    }

    std::string name_equals(std::string_view name)
    {
        return "name = " + quote(name);
    }

    std::string name_contains(std::string_view fragment)
    {
        return "name contains " + quote(fragment);
    }

    std::string mime_type_equals(std::string_view mime_type)
    {
        return "mimeType = " + quote(mime_type);
    }

    std::string trashed_equals(bool trashed)
    {
        return trashed ? "trashed = true" : "trashed = false";
    }

    std::string in_parents(std::string_view parent_id)
    {
        return quote(parent_id) + " in parents";
    }

    std::string property_equals(std::string_view key, std::string_view value)
    {
        return "properties has { key=" + quote(key) + " and value=" + quote(value) + " }";
    }

    std::string all_of(const std::vector<std::string> &clauses)
    {
        return join(clauses, " and ");
    }

    std::string any_of(const std::vector<std::string> &clauses)
    {
        return join(clauses, " or ");
    }

    Query::Query(Node root) : root_(std::move(root)) {}

    Query Query::parse(std::string_view text)
    {
        if (text.find_first_not_of(" \t\r\n") == std::string_view::npos)
        {
            return Query(Node{});
        }
        Parser parser(tokenize(text));
        return Query(parser.parse());
    }

    bool Query::matches(const RemoteItem &item) const
    {
        return evaluate(root_, item);
    }

} // namespace holysheet::catalog::query
