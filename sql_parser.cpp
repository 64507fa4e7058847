#include "sql_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>

bool iequals(const std::string &a, const std::string &b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

static bool is_ident_char(char c)
{
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '$' || u >= 0x80;
}

static void report_lex_error(const std::string &sql, size_t pos, const std::string &msg)
{
    std::cerr << "❌ SQL error at offset " << pos << ": " << msg
              << " in \"" << sql << "\"\n";
}

// Quoted text up to the closing quote; a doubled quote is an escaped quote
static bool read_quoted(const std::string &sql, size_t &i, char close, bool doubling,
                        std::string &out)
{
    size_t start = i;
    ++i;
    while (i < sql.size())
    {
        if (sql[i] == close)
        {
            if (doubling && i + 1 < sql.size() && sql[i + 1] == close)
            {
                out.push_back(close);
                i += 2;
                continue;
            }
            ++i;
            return true;
        }
        out.push_back(sql[i++]);
    }
    report_lex_error(sql, start, "unterminated quoted token");
    return false;
}

bool tokenize(const std::string &sql, std::vector<Token> &tokens)
{
    tokens.clear();
    size_t i = 0;
    const size_t n = sql.size();

    while (i < n)
    {
        char c = sql[i];
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            ++i;
            continue;
        }

        // comments
        if (c == '-' && i + 1 < n && sql[i + 1] == '-')
        {
            while (i < n && sql[i] != '\n')
                ++i;
            continue;
        }
        if (c == '/' && i + 1 < n && sql[i + 1] == '*')
        {
            size_t end = sql.find("*/", i + 2);
            i = end == std::string::npos ? n : end + 2;
            continue;
        }

        Token tok;
        tok.pos = i;

        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && i + 1 < n && std::isdigit(static_cast<unsigned char>(sql[i + 1]))))
        {
            size_t start = i;
            bool real = false;
            if (c == '0' && i + 1 < n && (sql[i + 1] == 'x' || sql[i + 1] == 'X'))
            {
                i += 2;
                while (i < n && std::isxdigit(static_cast<unsigned char>(sql[i])))
                    ++i;
            }
            else
            {
                while (i < n && std::isdigit(static_cast<unsigned char>(sql[i])))
                    ++i;
                if (i < n && sql[i] == '.')
                {
                    real = true;
                    ++i;
                    while (i < n && std::isdigit(static_cast<unsigned char>(sql[i])))
                        ++i;
                }
                if (i < n && (sql[i] == 'e' || sql[i] == 'E'))
                {
                    size_t j = i + 1;
                    if (j < n && (sql[j] == '+' || sql[j] == '-'))
                        ++j;
                    if (j < n && std::isdigit(static_cast<unsigned char>(sql[j])))
                    {
                        real = true;
                        i = j;
                        while (i < n && std::isdigit(static_cast<unsigned char>(sql[i])))
                            ++i;
                    }
                }
            }
            if (i < n && is_ident_char(sql[i]))
            {
                report_lex_error(sql, start, "malformed number");
                return false;
            }
            tok.type = real ? TokenType::Real : TokenType::Integer;
            tok.text = sql.substr(start, i - start);
        }
        else if (is_ident_char(c))
        {
            size_t start = i;
            while (i < n && is_ident_char(sql[i]))
                ++i;
            tok.type = TokenType::Word;
            tok.text = sql.substr(start, i - start);
        }
        else if (c == '\'')
        {
            tok.type = TokenType::String;
            if (!read_quoted(sql, i, '\'', true, tok.text))
                return false;
        }
        else if (c == '"' || c == '`')
        {
            tok.type = TokenType::QuotedIdentifier;
            if (!read_quoted(sql, i, c, true, tok.text))
                return false;
        }
        else if (c == '[')
        {
            tok.type = TokenType::QuotedIdentifier;
            if (!read_quoted(sql, i, ']', false, tok.text))
                return false;
        }
        else
        {
            static const char *two_char[] = {"==", "!=", "<>", "<=", ">="};
            tok.type = TokenType::Symbol;
            for (const char *op : two_char)
            {
                if (sql.compare(i, 2, op) == 0)
                {
                    tok.text = op;
                    break;
                }
            }
            if (tok.text.empty())
            {
                if (std::string("=<>(),;*.-+").find(c) == std::string::npos)
                {
                    report_lex_error(sql, i, std::string("unrecognized token '") + c + "'");
                    return false;
                }
                tok.text = std::string(1, c);
            }
            i += tok.text.size();
        }

        tokens.push_back(tok);
    }

    Token end;
    end.type = TokenType::End;
    end.pos = n;
    tokens.push_back(end);
    return true;
}

namespace {

struct Cursor {
    const std::string &sql;
    std::vector<Token> tokens;
    size_t i = 0;

    explicit Cursor(const std::string &s) : sql(s) {}

    const Token &peek(size_t ahead = 0) const
    {
        size_t k = std::min(i + ahead, tokens.size() - 1);
        return tokens[k];
    }

    const Token &next()
    {
        const Token &t = peek();
        if (i < tokens.size() - 1)
            ++i;
        return t;
    }

    bool at_keyword(const char *kw, size_t ahead = 0) const
    {
        const Token &t = peek(ahead);
        return t.type == TokenType::Word && iequals(t.text, kw);
    }

    bool at_symbol(const char *sym, size_t ahead = 0) const
    {
        const Token &t = peek(ahead);
        return t.type == TokenType::Symbol && t.text == sym;
    }

    bool accept_keyword(const char *kw)
    {
        if (!at_keyword(kw))
            return false;
        next();
        return true;
    }

    bool accept_symbol(const char *sym)
    {
        if (!at_symbol(sym))
            return false;
        next();
        return true;
    }

    bool fail(const std::string &msg) const
    {
        const Token &t = peek();
        std::cerr << "❌ SQL error at offset " << t.pos << " near \""
                  << (t.type == TokenType::End ? std::string("end of input") : t.text)
                  << "\": " << msg << "\n";
        return false;
    }

    bool expect_keyword(const char *kw)
    {
        if (accept_keyword(kw))
            return true;
        return fail(std::string("expected ") + kw);
    }

    bool expect_symbol(const char *sym)
    {
        if (accept_symbol(sym))
            return true;
        return fail(std::string("expected '") + sym + "'");
    }
};

} // namespace

// Words that end a bare name in SELECT and WHERE positions
static bool is_reserved(const std::string &word)
{
    static const char *reserved[] = {"SELECT", "FROM", "WHERE", "LIMIT", "AND", "OR",
                                     "NOT", "IS", "NULL", "ON", "CREATE", "TABLE"};
    for (const char *r : reserved)
        if (iequals(word, r))
            return true;
    return false;
}

static bool parse_name(Cursor &c, std::string &name, bool allow_string = false)
{
    const Token &t = c.peek();
    if ((t.type == TokenType::Word && !is_reserved(t.text)) ||
        t.type == TokenType::QuotedIdentifier ||
        (allow_string && t.type == TokenType::String))
    {
        name = t.text;
        c.next();
        return true;
    }
    return c.fail("expected a name");
}

// name or schema.name; the schema qualifier is dropped
static bool parse_qualified_name(Cursor &c, std::string &name, bool allow_string = false)
{
    if (!parse_name(c, name, allow_string))
        return false;
    if (c.accept_symbol("."))
        return parse_name(c, name, allow_string);
    return true;
}

static bool number_literal(const Token &t, bool negate, Value &out)
{
    const char *s = t.text.c_str();
    if (t.type == TokenType::Integer)
    {
        // magnitude of the most negative 64-bit integer
        const uint64_t min_magnitude = uint64_t(1) << 63;

        errno = 0;
        bool hex = t.text.size() > 2 && (t.text[1] == 'x' || t.text[1] == 'X');
        uint64_t u = hex ? std::strtoull(s + 2, nullptr, 16) : std::strtoull(s, nullptr, 10);
        if (errno != ERANGE)
        {
            if (hex)
            {
                // hex literals are 64-bit two's complement
                int64_t v = static_cast<int64_t>(u);
                if (!negate)
                    out = make_integer(v);
                else if (u == min_magnitude)
                    out = make_real(-static_cast<double>(v));
                else
                    out = make_integer(-v);
                return true;
            }
            if (u < min_magnitude)
            {
                int64_t v = static_cast<int64_t>(u);
                out = make_integer(negate ? -v : v);
                return true;
            }
            if (u == min_magnitude && negate)
            {
                out = make_integer(std::numeric_limits<int64_t>::min());
                return true;
            }
        }
        // too large for 64 bits: falls back to a real
    }
    double d = std::strtod(s, nullptr);
    out = make_real(negate ? -d : d);
    return true;
}

static std::unique_ptr<Expr> parse_expr(Cursor &c);

static std::unique_ptr<Expr> parse_primary(Cursor &c)
{
    if (c.accept_symbol("("))
    {
        std::unique_ptr<Expr> inner = parse_expr(c);
        if (!inner || !c.expect_symbol(")"))
            return nullptr;
        return inner;
    }

    auto e = std::make_unique<Expr>();
    const Token &t = c.peek();

    if (t.type == TokenType::String)
    {
        e->kind = ExprKind::Literal;
        e->literal = make_text(t.text);
        c.next();
        return e;
    }
    if (t.type == TokenType::Integer || t.type == TokenType::Real)
    {
        e->kind = ExprKind::Literal;
        number_literal(t, false, e->literal);
        c.next();
        return e;
    }
    if ((c.at_symbol("-") || c.at_symbol("+")) &&
        (c.peek(1).type == TokenType::Integer || c.peek(1).type == TokenType::Real))
    {
        bool negate = c.at_symbol("-");
        c.next();
        e->kind = ExprKind::Literal;
        number_literal(c.peek(), negate, e->literal);
        c.next();
        return e;
    }
    if (c.accept_keyword("NULL"))
    {
        e->kind = ExprKind::Literal;
        e->literal = make_null();
        return e;
    }

    e->kind = ExprKind::Column;
    if (!parse_qualified_name(c, e->column))
        return nullptr;
    return e;
}

static bool compare_op(const std::string &sym, CompareOp &op)
{
    if (sym == "=" || sym == "==")
        op = CompareOp::Eq;
    else if (sym == "!=" || sym == "<>")
        op = CompareOp::Ne;
    else if (sym == "<")
        op = CompareOp::Lt;
    else if (sym == "<=")
        op = CompareOp::Le;
    else if (sym == ">")
        op = CompareOp::Gt;
    else if (sym == ">=")
        op = CompareOp::Ge;
    else
        return false;
    return true;
}

static std::unique_ptr<Expr> parse_comparison(Cursor &c)
{
    std::unique_ptr<Expr> lhs = parse_primary(c);
    if (!lhs)
        return nullptr;

    if (c.accept_keyword("IS"))
    {
        auto e = std::make_unique<Expr>();
        e->kind = ExprKind::IsNull;
        e->negated = c.accept_keyword("NOT");
        if (!c.expect_keyword("NULL"))
            return nullptr;
        e->lhs = std::move(lhs);
        return e;
    }
    if (c.at_keyword("NOT") && c.at_keyword("NULL", 1))
    {
        c.next();
        c.next();
        auto e = std::make_unique<Expr>();
        e->kind = ExprKind::IsNull;
        e->negated = true;
        e->lhs = std::move(lhs);
        return e;
    }

    CompareOp op;
    if (c.peek().type == TokenType::Symbol && compare_op(c.peek().text, op))
    {
        c.next();
        std::unique_ptr<Expr> rhs = parse_primary(c);
        if (!rhs)
            return nullptr;
        auto e = std::make_unique<Expr>();
        e->kind = ExprKind::Compare;
        e->op = op;
        e->lhs = std::move(lhs);
        e->rhs = std::move(rhs);
        return e;
    }
    return lhs;
}

static std::unique_ptr<Expr> parse_not(Cursor &c)
{
    if (c.accept_keyword("NOT"))
    {
        std::unique_ptr<Expr> inner = parse_not(c);
        if (!inner)
            return nullptr;
        auto e = std::make_unique<Expr>();
        e->kind = ExprKind::Not;
        e->lhs = std::move(inner);
        return e;
    }
    return parse_comparison(c);
}

static std::unique_ptr<Expr> parse_and(Cursor &c)
{
    std::unique_ptr<Expr> lhs = parse_not(c);
    while (lhs && c.accept_keyword("AND"))
    {
        std::unique_ptr<Expr> rhs = parse_not(c);
        if (!rhs)
            return nullptr;
        auto e = std::make_unique<Expr>();
        e->kind = ExprKind::And;
        e->lhs = std::move(lhs);
        e->rhs = std::move(rhs);
        lhs = std::move(e);
    }
    return lhs;
}

static std::unique_ptr<Expr> parse_expr(Cursor &c)
{
    std::unique_ptr<Expr> lhs = parse_and(c);
    while (lhs && c.accept_keyword("OR"))
    {
        std::unique_ptr<Expr> rhs = parse_and(c);
        if (!rhs)
            return nullptr;
        auto e = std::make_unique<Expr>();
        e->kind = ExprKind::Or;
        e->lhs = std::move(lhs);
        e->rhs = std::move(rhs);
        lhs = std::move(e);
    }
    return lhs;
}

static bool parse_result_column(Cursor &c, ResultColumn &col)
{
    size_t start = c.peek().pos;

    if (c.accept_symbol("*"))
    {
        col.kind = ResultKind::Star;
        col.label = "*";
        return true;
    }

    if (c.at_keyword("COUNT") && c.at_symbol("(", 1))
    {
        c.next();
        c.next();
        if (c.accept_symbol("*"))
        {
            col.kind = ResultKind::CountStar;
        }
        else
        {
            col.kind = ResultKind::CountColumn;
            if (!parse_qualified_name(c, col.name))
                return false;
        }
        size_t close = c.peek().pos;
        if (!c.expect_symbol(")"))
            return false;
        col.label = c.sql.substr(start, close + 1 - start);
        return true;
    }

    col.kind = ResultKind::Column;
    if (!parse_qualified_name(c, col.name))
        return false;
    col.label = col.name;
    return true;
}

static bool expect_end(Cursor &c)
{
    while (c.accept_symbol(";"))
        ;
    if (c.peek().type != TokenType::End)
        return c.fail("unexpected trailing input");
    return true;
}

bool is_select(const std::string &sql)
{
    std::vector<Token> tokens;
    if (!tokenize(sql, tokens))
        return false;
    return tokens.front().type == TokenType::Word && iequals(tokens.front().text, "SELECT");
}

bool parse_select(const std::string &sql, SelectStatement &stmt)
{
    Cursor c(sql);
    if (!tokenize(sql, c.tokens))
        return false;

    SelectStatement s;
    if (!c.expect_keyword("SELECT"))
        return false;

    do
    {
        ResultColumn col;
        if (!parse_result_column(c, col))
            return false;
        s.columns.push_back(col);
    } while (c.accept_symbol(","));

    if (!c.expect_keyword("FROM") || !parse_qualified_name(c, s.table))
        return false;

    if (c.accept_keyword("WHERE"))
    {
        s.where = parse_expr(c);
        if (!s.where)
            return false;
    }

    if (c.accept_keyword("LIMIT"))
    {
        Value limit;
        bool negate = c.accept_symbol("-");
        if (c.peek().type != TokenType::Integer)
            return c.fail("LIMIT expects an integer");
        number_literal(c.next(), negate, limit);
        s.limit = limit.type == ValueType::Integer ? limit.integer : -1;
    }

    if (!expect_end(c))
        return false;

    stmt = std::move(s);
    return true;
}

static bool is_column_constraint_start(const Token &t)
{
    static const char *starts[] = {"CONSTRAINT", "PRIMARY", "NOT", "NULL", "UNIQUE", "CHECK",
                                   "DEFAULT", "COLLATE", "REFERENCES", "GENERATED", "AS"};
    if (t.type != TokenType::Word)
        return false;
    for (const char *s : starts)
        if (iequals(t.text, s))
            return true;
    return false;
}

static bool is_word(const Token &t, const char *kw)
{
    return t.type == TokenType::Word && iequals(t.text, kw);
}

// Raw text of a parenthesised group starting at tokens[i], advancing i past it
static std::string paren_group(const Cursor &c, const std::vector<Token> &seg, size_t &i)
{
    size_t start = seg[i].pos;
    int depth = 0;
    for (; i < seg.size(); ++i)
    {
        if (seg[i].type == TokenType::Symbol && seg[i].text == "(")
            ++depth;
        else if (seg[i].type == TokenType::Symbol && seg[i].text == ")" && --depth == 0)
        {
            size_t end = seg[i].pos + 1;
            ++i;
            return c.sql.substr(start, end - start);
        }
    }
    return c.sql.substr(start);
}

struct PrimaryKeyInfo {
    std::vector<std::string> columns;
    bool descending = false;
};

// Table constraint PRIMARY KEY (a [COLLATE x] [ASC|DESC], ...)
static void read_pk_constraint(const std::vector<Token> &seg, size_t i, PrimaryKeyInfo &pk)
{
    int depth = 0;
    bool expect_name = false;
    for (; i < seg.size(); ++i)
    {
        const Token &t = seg[i];
        if (t.type == TokenType::Symbol && t.text == "(")
        {
            if (++depth == 1)
                expect_name = true;
            continue;
        }
        if (t.type == TokenType::Symbol && t.text == ")")
        {
            if (--depth == 0)
                break;
            continue;
        }
        if (depth != 1)
            continue;
        if (t.type == TokenType::Symbol && t.text == ",")
        {
            expect_name = true;
            continue;
        }
        if (expect_name && (t.type == TokenType::Word || t.type == TokenType::QuotedIdentifier ||
                            t.type == TokenType::String))
        {
            pk.columns.push_back(t.text);
            expect_name = false;
            continue;
        }
        if (is_word(t, "DESC"))
            pk.descending = true;
    }
}

// Split the tokens between the outer parentheses at top-level commas
static bool split_definitions(Cursor &c, std::vector<std::vector<Token>> &segments)
{
    if (!c.expect_symbol("("))
        return false;

    int depth = 1;
    std::vector<Token> current;
    while (true)
    {
        const Token &t = c.peek();
        if (t.type == TokenType::End)
            return c.fail("unbalanced parentheses");

        if (t.type == TokenType::Symbol && t.text == "(")
            ++depth;
        else if (t.type == TokenType::Symbol && t.text == ")" && --depth == 0)
        {
            c.next();
            break;
        }

        if (depth == 1 && t.type == TokenType::Symbol && t.text == ",")
        {
            if (current.empty())
                return c.fail("empty definition");
            segments.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current.push_back(t);
        }
        c.next();
    }

    if (current.empty())
        return c.fail("empty definition");
    segments.push_back(std::move(current));
    return true;
}

static bool parse_column_def(Cursor &c, const std::vector<Token> &seg, ColumnDef &col,
                             bool &pk_descending)
{
    const Token &first = seg[0];
    if (first.type != TokenType::Word && first.type != TokenType::QuotedIdentifier &&
        first.type != TokenType::String)
    {
        std::cerr << "❌ SQL error at offset " << first.pos << ": expected a column name\n";
        return false;
    }
    col.name = first.text;

    size_t i = 1;
    std::string type;
    while (i < seg.size() && !is_column_constraint_start(seg[i]))
    {
        const Token &t = seg[i];
        if (t.type == TokenType::Symbol && t.text == "(")
        {
            type += paren_group(c, seg, i);
            continue;
        }
        if (t.type != TokenType::Word && t.type != TokenType::QuotedIdentifier)
            break;
        if (!type.empty())
            type += " ";
        type += t.text;
        ++i;
    }
    col.type = type;

    // only constraint keywords outside parentheses count
    int depth = 0;
    for (; i < seg.size(); ++i)
    {
        const Token &t = seg[i];
        if (t.type == TokenType::Symbol && t.text == "(")
            ++depth;
        else if (t.type == TokenType::Symbol && t.text == ")")
            --depth;
        else if (depth == 0 && is_word(t, "PRIMARY") && i + 1 < seg.size() && is_word(seg[i + 1], "KEY"))
        {
            col.primary_key = true;
            if (i + 2 < seg.size() && is_word(seg[i + 2], "DESC"))
                pk_descending = true;
        }
    }
    return true;
}

bool parse_create_table(const std::string &sql, CreateTableStatement &stmt)
{
    Cursor c(sql);
    if (!tokenize(sql, c.tokens))
        return false;

    CreateTableStatement s;
    if (!c.expect_keyword("CREATE"))
        return false;
    if (!c.accept_keyword("TEMP"))
        c.accept_keyword("TEMPORARY");
    if (c.at_keyword("VIRTUAL"))
        return c.fail("virtual tables are not supported");
    if (!c.expect_keyword("TABLE"))
        return false;
    if (c.accept_keyword("IF"))
    {
        if (!c.expect_keyword("NOT") || !c.expect_keyword("EXISTS"))
            return false;
    }
    if (!parse_qualified_name(c, s.table, true))
        return false;
    if (c.at_keyword("AS"))
        return c.fail("CREATE TABLE ... AS SELECT is not supported");

    std::vector<std::vector<Token>> segments;
    if (!split_definitions(c, segments))
        return false;

    PrimaryKeyInfo table_pk;
    int inline_pk = -1;
    bool inline_pk_desc = false;

    for (const auto &seg : segments)
    {
        const Token &head = seg[0];
        bool constraint = head.type == TokenType::Word &&
                          (iequals(head.text, "CONSTRAINT") || iequals(head.text, "PRIMARY") ||
                           iequals(head.text, "UNIQUE") || iequals(head.text, "CHECK") ||
                           iequals(head.text, "FOREIGN"));
        if (constraint)
        {
            for (size_t i = 0; i + 1 < seg.size(); ++i)
            {
                if (is_word(seg[i], "PRIMARY") && is_word(seg[i + 1], "KEY"))
                {
                    read_pk_constraint(seg, i + 2, table_pk);
                    break;
                }
            }
            continue;
        }

        ColumnDef col;
        bool desc = false;
        if (!parse_column_def(c, seg, col, desc))
            return false;
        if (col.primary_key)
        {
            inline_pk = static_cast<int>(s.columns.size());
            inline_pk_desc = desc;
        }
        s.columns.push_back(col);
    }

    // WITHOUT ROWID and STRICT options
    while (true)
    {
        if (c.accept_keyword("WITHOUT"))
        {
            if (!c.expect_keyword("ROWID"))
                return false;
            s.without_rowid = true;
        }
        else if (!c.accept_keyword("STRICT"))
        {
            break;
        }
        if (!c.accept_symbol(","))
            break;
    }
    if (!expect_end(c))
        return false;

    int pk_column = -1;
    bool pk_desc = false;
    if (inline_pk >= 0)
    {
        pk_column = inline_pk;
        pk_desc = inline_pk_desc;
    }
    else if (table_pk.columns.size() == 1)
    {
        for (size_t i = 0; i < s.columns.size(); ++i)
        {
            if (iequals(s.columns[i].name, table_pk.columns[0]))
            {
                s.columns[i].primary_key = true;
                pk_column = static_cast<int>(i);
            }
        }
        pk_desc = table_pk.descending;
    }
    else
    {
        for (const auto &name : table_pk.columns)
            for (auto &col : s.columns)
                if (iequals(col.name, name))
                    col.primary_key = true;
    }

    // Only a lone INTEGER PRIMARY KEY (not DESC) aliases the rowid
    if (pk_column >= 0 && !pk_desc && !s.without_rowid &&
        iequals(s.columns[pk_column].type, "INTEGER"))
        s.rowid_alias = pk_column;

    stmt = std::move(s);
    return true;
}

bool parse_create_index(const std::string &sql, CreateIndexStatement &stmt)
{
    Cursor c(sql);
    if (!tokenize(sql, c.tokens))
        return false;

    CreateIndexStatement s;
    if (!c.expect_keyword("CREATE"))
        return false;
    s.unique = c.accept_keyword("UNIQUE");
    if (!c.expect_keyword("INDEX"))
        return false;
    if (c.accept_keyword("IF"))
    {
        if (!c.expect_keyword("NOT") || !c.expect_keyword("EXISTS"))
            return false;
    }
    if (!parse_qualified_name(c, s.name, true) || !c.expect_keyword("ON") ||
        !parse_name(c, s.table, true))
        return false;

    std::vector<std::vector<Token>> segments;
    if (!split_definitions(c, segments))
        return false;

    for (const auto &seg : segments)
    {
        const Token &head = seg[0];
        bool plain = head.type == TokenType::Word || head.type == TokenType::QuotedIdentifier ||
                     head.type == TokenType::String;
        size_t i = 1;
        for (; plain && i < seg.size(); ++i)
        {
            if (is_word(seg[i], "COLLATE"))
            {
                s.has_collation = true;
                ++i;
            }
            else if (!is_word(seg[i], "ASC") && !is_word(seg[i], "DESC"))
            {
                plain = false;
            }
        }
        s.columns.push_back(plain ? head.text : std::string());
    }

    // a partial index only holds the rows matching its WHERE clause
    s.partial = c.accept_keyword("WHERE");
    stmt = std::move(s);
    return true;
}
