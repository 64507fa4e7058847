#include "query.hpp"
#include "btree.hpp"
#include "log_util.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <unordered_map>

// Slot of the rowid pseudo-column
static const int ROWID_COLUMN = -1;

namespace {

// Column names of one table mapped to record slots
struct Binding {
    const TableInfo *table = nullptr;
    std::unordered_map<std::string, int> slots;  // lower-cased name
    TextEncoding encoding = TextEncoding::UTF8;
};

struct Row {
    int64_t rowid = 0;
    std::vector<Value> values;
};

struct OutputColumn {
    ResultKind kind = ResultKind::Column;
    int slot = 0;
};

enum class PathKind {
    Scan,
    Rowid,
    Index
};

struct AccessPath {
    PathKind kind = PathKind::Scan;
    int64_t rowid = 0;
    Value key;
    IndexInfo index;
};

} // namespace

static std::string lower(const std::string &s)
{
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}

static Binding bind_table(const TableInfo &table)
{
    Binding b;
    b.table = &table;
    const auto &cols = table.def.columns;
    for (size_t i = 0; i < cols.size(); ++i)
        b.slots.emplace(lower(cols[i].name), static_cast<int>(i));

    // real columns shadow the rowid names
    for (const char *name : {"rowid", "oid", "_rowid_"})
        b.slots.emplace(name, ROWID_COLUMN);
    return b;
}

static bool resolve(const Binding &b, const std::string &name, int &slot)
{
    auto it = b.slots.find(lower(name));
    if (it == b.slots.end())
    {
        std::cerr << "❌ no such column: " << name << "\n";
        return false;
    }
    slot = it->second;
    return true;
}

static bool is_rowid_slot(const Binding &b, int slot)
{
    return slot == ROWID_COLUMN || slot == b.table->def.rowid_alias;
}

static Affinity slot_affinity(const Binding &b, int slot)
{
    if (is_rowid_slot(b, slot))
        return Affinity::Integer;
    return affinity_for_type(b.table->def.columns[slot].type);
}

static Value column_value(const Binding &b, const Row &row, int slot)
{
    if (is_rowid_slot(b, slot))
        return make_integer(row.rowid);
    // rows written before ALTER TABLE ADD COLUMN are shorter
    if (static_cast<size_t>(slot) >= row.values.size())
        return make_null();

    // REAL columns store integral values as integers on disk
    const Value &v = row.values[slot];
    if (v.type == ValueType::Integer && slot_affinity(b, slot) == Affinity::Real)
        return make_real(static_cast<double>(v.integer));
    return v;
}

static bool check_columns(const Binding &b, const Expr &e)
{
    int slot = 0;
    switch (e.kind)
    {
    case ExprKind::Column:
        return resolve(b, e.column, slot);
    case ExprKind::Literal:
        return true;
    case ExprKind::Compare:
    case ExprKind::And:
    case ExprKind::Or:
        return check_columns(b, *e.lhs) && check_columns(b, *e.rhs);
    case ExprKind::Not:
    case ExprKind::IsNull:
        return check_columns(b, *e.lhs);
    }
    return false;
}

// -1 unknown (NULL), 0 false, 1 true
static int truth(const Value &v)
{
    switch (v.type)
    {
    case ValueType::Null:
        return -1;
    case ValueType::Integer:
        return v.integer != 0;
    case ValueType::Real:
        return v.real != 0.0;
    case ValueType::Text:
    {
        Value n = apply_affinity(v, Affinity::Numeric);
        return n.type == ValueType::Text ? 0 : truth(n);
    }
    case ValueType::Blob:
        return 0;
    }
    return 0;
}

static Value from_truth(int t)
{
    return t < 0 ? make_null() : make_integer(t);
}

static Value eval(const Expr &e, const Binding &b, const Row &row)
{
    switch (e.kind)
    {
    case ExprKind::Column:
    {
        int slot = 0;
        if (!resolve(b, e.column, slot))
            return make_null();
        return column_value(b, row, slot);
    }
    case ExprKind::Literal:
        return e.literal;
    case ExprKind::Compare:
    {
        Value l = eval(*e.lhs, b, row);
        Value r = eval(*e.rhs, b, row);

        // a literal takes the affinity of the column it is compared with
        int slot = 0;
        if (e.lhs->kind == ExprKind::Column && e.rhs->kind == ExprKind::Literal &&
            resolve(b, e.lhs->column, slot))
            r = apply_affinity(r, slot_affinity(b, slot));
        else if (e.rhs->kind == ExprKind::Column && e.lhs->kind == ExprKind::Literal &&
                 resolve(b, e.rhs->column, slot))
            l = apply_affinity(l, slot_affinity(b, slot));

        if (l.type == ValueType::Null || r.type == ValueType::Null)
            return make_null();

        int c = compare_values(l, r, b.encoding);
        switch (e.op)
        {
        case CompareOp::Eq:
            return make_integer(c == 0);
        case CompareOp::Ne:
            return make_integer(c != 0);
        case CompareOp::Lt:
            return make_integer(c < 0);
        case CompareOp::Le:
            return make_integer(c <= 0);
        case CompareOp::Gt:
            return make_integer(c > 0);
        case CompareOp::Ge:
            return make_integer(c >= 0);
        }
        return make_null();
    }
    case ExprKind::And:
    {
        int l = truth(eval(*e.lhs, b, row));
        if (l == 0)
            return make_integer(0);
        int r = truth(eval(*e.rhs, b, row));
        if (r == 0)
            return make_integer(0);
        return from_truth(l < 0 || r < 0 ? -1 : 1);
    }
    case ExprKind::Or:
    {
        int l = truth(eval(*e.lhs, b, row));
        if (l == 1)
            return make_integer(1);
        int r = truth(eval(*e.rhs, b, row));
        if (r == 1)
            return make_integer(1);
        return from_truth(l < 0 || r < 0 ? -1 : 0);
    }
    case ExprKind::Not:
    {
        int t = truth(eval(*e.lhs, b, row));
        return from_truth(t < 0 ? -1 : !t);
    }
    case ExprKind::IsNull:
    {
        bool is_null = eval(*e.lhs, b, row).type == ValueType::Null;
        return make_integer(is_null != e.negated);
    }
    }
    return make_null();
}

static void collect_conjuncts(const Expr &e, std::vector<const Expr *> &out)
{
    if (e.kind == ExprKind::And)
    {
        collect_conjuncts(*e.lhs, out);
        collect_conjuncts(*e.rhs, out);
        return;
    }
    out.push_back(&e);
}

// column = literal, in either order, with a non-NULL literal
static bool column_equals_literal(const Expr &e, const Expr *&column, const Expr *&literal)
{
    if (e.kind != ExprKind::Compare || e.op != CompareOp::Eq)
        return false;

    if (e.lhs->kind == ExprKind::Column && e.rhs->kind == ExprKind::Literal)
    {
        column = e.lhs.get();
        literal = e.rhs.get();
    }
    else if (e.rhs->kind == ExprKind::Column && e.lhs->kind == ExprKind::Literal)
    {
        column = e.rhs.get();
        literal = e.lhs.get();
    }
    else
    {
        return false;
    }
    return literal->literal.type != ValueType::Null;
}

static AccessPath choose_access_path(const Database &db, const Binding &b, const Expr *where)
{
    AccessPath path;
    if (!where)
        return path;

    std::vector<const Expr *> conjuncts;
    collect_conjuncts(*where, conjuncts);

    // rowid equality beats any index
    for (const Expr *e : conjuncts)
    {
        const Expr *column = nullptr, *literal = nullptr;
        int slot = 0;
        if (!column_equals_literal(*e, column, literal) || !resolve(b, column->column, slot) ||
            !is_rowid_slot(b, slot))
            continue;

        Value key = apply_affinity(literal->literal, Affinity::Integer);
        if (key.type != ValueType::Integer)
            continue;
        path.kind = PathKind::Rowid;
        path.rowid = key.integer;
        return path;
    }

    // index keys sort by UTF-8 bytes only in UTF-8 databases
    if (db.pager.header.text_encoding != TextEncoding::UTF8)
        return path;

    std::vector<IndexInfo> indexes = indexes_for_table(db, b.table->name);
    for (const Expr *e : conjuncts)
    {
        const Expr *column = nullptr, *literal = nullptr;
        int slot = 0;
        if (!column_equals_literal(*e, column, literal) || !resolve(b, column->column, slot) ||
            is_rowid_slot(b, slot))
            continue;

        for (const auto &idx : indexes)
        {
            if (idx.def.columns.empty() || idx.def.columns[0].empty() ||
                idx.def.has_collation || idx.def.partial)
                continue;

            auto it = b.slots.find(lower(idx.def.columns[0]));
            if (it == b.slots.end() || it->second != slot)
                continue;

            path.kind = PathKind::Index;
            path.key = apply_affinity(literal->literal, slot_affinity(b, slot));
            path.index = idx;
            return path;
        }
    }
    return path;
}

bool execute_select(Database &db, const SelectStatement &stmt, ResultSet &result)
{
    TableInfo table;
    if (!find_table(db, stmt.table, table))
        return false;
    Binding b = bind_table(table);
    b.encoding = db.pager.header.text_encoding;

    ResultSet rs;
    std::vector<OutputColumn> out;
    bool aggregate = false, plain = false;

    for (const auto &col : stmt.columns)
    {
        OutputColumn oc;
        oc.kind = col.kind;
        switch (col.kind)
        {
        case ResultKind::Star:
            plain = true;
            for (size_t i = 0; i < table.def.columns.size(); ++i)
            {
                OutputColumn each;
                each.kind = ResultKind::Column;
                each.slot = static_cast<int>(i);
                out.push_back(each);
                rs.columns.push_back(table.def.columns[i].name);
            }
            continue;
        case ResultKind::Column:
            plain = true;
            if (!resolve(b, col.name, oc.slot))
                return false;
            break;
        case ResultKind::CountColumn:
            aggregate = true;
            if (!resolve(b, col.name, oc.slot))
                return false;
            break;
        case ResultKind::CountStar:
            aggregate = true;
            break;
        }
        out.push_back(oc);
        rs.columns.push_back(col.label);
    }

    if (aggregate && plain)
    {
        std::cerr << "❌ Cannot mix COUNT with plain columns without GROUP BY\n";
        return false;
    }
    if (stmt.where && !check_columns(b, *stmt.where))
        return false;

    bool count_only = aggregate && !stmt.where &&
                      std::all_of(out.begin(), out.end(), [](const OutputColumn &oc)
                                  { return oc.kind == ResultKind::CountStar; });
    if (count_only)
    {
        uint64_t n = 0;
        if (!count_table_rows(db.pager, table.rootpage, n))
            return false;
        if (stmt.limit != 0)
            rs.rows.emplace_back(out.size(), make_integer(static_cast<int64_t>(n)));
        result = std::move(rs);
        return true;
    }

    TextEncoding encoding = db.pager.header.text_encoding;
    std::vector<int64_t> counts(out.size(), 0);
    int64_t emitted = 0;
    bool ok = true;

    auto visit = [&](int64_t rowid, const std::vector<char> &payload) -> bool
    {
        Row row;
        row.rowid = rowid;
        if (!decode_record(payload, encoding, row.values))
        {
            std::cerr << "❌ Unreadable row " << rowid << " in table " << table.name << "\n";
            ok = false;
            return false;
        }
        if (stmt.where && truth(eval(*stmt.where, b, row)) != 1)
            return true;

        if (aggregate)
        {
            for (size_t i = 0; i < out.size(); ++i)
            {
                if (out[i].kind == ResultKind::CountStar ||
                    column_value(b, row, out[i].slot).type != ValueType::Null)
                    ++counts[i];
            }
            return true;
        }

        std::vector<Value> values;
        values.reserve(out.size());
        for (const auto &oc : out)
            values.push_back(column_value(b, row, oc.slot));
        rs.rows.push_back(std::move(values));

        ++emitted;
        return stmt.limit < 0 || emitted < stmt.limit;
    };

    bool walked = true;
    if (aggregate || stmt.limit != 0)
    {
        AccessPath path = choose_access_path(db, b, stmt.where.get());
        std::vector<char> payload;
        bool found = false;

        switch (path.kind)
        {
        case PathKind::Scan:
            walked = scan_table(db.pager, table.rootpage, visit);
            break;
        case PathKind::Rowid:
            if (g_verbose)
                std::cerr << "[DEBUG] rowid lookup " << path.rowid << " in " << table.name << "\n";
            walked = find_row(db.pager, table.rootpage, path.rowid, found, payload);
            if (walked && found)
                visit(path.rowid, payload);
            break;
        case PathKind::Index:
        {
            if (g_verbose)
                std::cerr << "[DEBUG] using index " << path.index.name << " on " << table.name << "\n";
            std::vector<int64_t> rowids;
            walked = search_index_equal(db.pager, path.index.rootpage, path.key, rowids);
            for (size_t i = 0; walked && i < rowids.size(); ++i)
            {
                walked = find_row(db.pager, table.rootpage, rowids[i], found, payload);
                if (walked && !found)
                {
                    std::cerr << "❌ Index " << path.index.name << " refers to missing row "
                              << rowids[i] << "\n";
                    walked = false;
                }
                if (walked && !visit(rowids[i], payload))
                    break;
            }
            break;
        }
        }
    }

    if (!walked || !ok)
    {
        std::cerr << "❌ Query on table " << table.name << " failed\n";
        return false;
    }

    if (aggregate && stmt.limit != 0)
    {
        std::vector<Value> values;
        for (int64_t n : counts)
            values.push_back(make_integer(n));
        rs.rows.push_back(std::move(values));
    }

    result = std::move(rs);
    return true;
}

bool execute_sql(Database &db, const std::string &sql, ResultSet &result)
{
    if (!is_select(sql))
    {
        std::cerr << "❌ Only SELECT statements are supported: " << sql << "\n";
        return false;
    }

    SelectStatement stmt;
    if (!parse_select(sql, stmt))
        return false;
    return execute_select(db, stmt, result);
}
