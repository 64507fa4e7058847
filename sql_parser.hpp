#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "record.hpp"

enum class TokenType {
    Word,              // bare identifier or keyword
    QuotedIdentifier,  // "x", `x` or [x]
    String,            // 'text'
    Integer,
    Real,
    Symbol,            // operators and punctuation
    End
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;  // unquoted contents for strings and quoted identifiers
    size_t pos = 0;    // byte offset in the statement
};

bool tokenize(const std::string &sql, std::vector<Token> &tokens);

// ASCII case-insensitive equality, as SQL keywords and identifiers compare
bool iequals(const std::string &a, const std::string &b);

enum class ExprKind {
    Column,
    Literal,
    Compare,
    And,
    Or,
    Not,
    IsNull
};

enum class CompareOp {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge
};

struct Expr {
    ExprKind kind = ExprKind::Literal;
    std::string column;          // Column
    Value literal;               // Literal
    CompareOp op = CompareOp::Eq;
    bool negated = false;        // IsNull: IS NOT NULL
    std::unique_ptr<Expr> lhs;   // operand of Not and IsNull
    std::unique_ptr<Expr> rhs;
};

enum class ResultKind {
    Star,
    Column,
    CountStar,
    CountColumn
};

struct ResultColumn {
    ResultKind kind = ResultKind::Column;
    std::string name;   // column name for Column and CountColumn
    std::string label;  // output header, as written in the statement
};

struct SelectStatement {
    std::vector<ResultColumn> columns;
    std::string table;
    std::unique_ptr<Expr> where;
    int64_t limit = -1;  // negative: no limit
};

struct ColumnDef {
    std::string name;
    std::string type;    // declared type, may be empty
    bool primary_key = false;
};

struct CreateTableStatement {
    std::string table;
    std::vector<ColumnDef> columns;
    int rowid_alias = -1;  // index of the INTEGER PRIMARY KEY column
    bool without_rowid = false;
};

struct CreateIndexStatement {
    std::string name;
    std::string table;
    std::vector<std::string> columns;  // empty string for an expression column
    bool unique = false;
    bool has_collation = false;
    bool partial = false;
};

bool parse_select(const std::string &sql, SelectStatement &stmt);
bool parse_create_table(const std::string &sql, CreateTableStatement &stmt);
bool parse_create_index(const std::string &sql, CreateIndexStatement &stmt);

// True when the statement begins with SELECT
bool is_select(const std::string &sql);
