#include "database.hpp"

#include <algorithm>
#include <initializer_list>
#include <iostream>

bool open_database(const std::string &path, Database &db)
{
    if (!open_pager(db.pager, path))
        return false;
    if (!load_schema(db.pager, db.schema))
    {
        std::cerr << "❌ Failed to read the schema of " << path << "\n";
        return false;
    }
    return true;
}

std::vector<std::string> object_names(const Database &db, SchemaType type)
{
    std::vector<std::string> names;
    for (const auto &entry : db.schema)
        if (entry.type == type)
            names.push_back(entry.name);
    return names;
}

std::vector<std::string> user_table_names(const Database &db)
{
    std::vector<std::string> names;
    for (const auto &name : object_names(db, SchemaType::Table))
        if (name.compare(0, 7, "sqlite_") != 0)
            names.push_back(name);
    std::sort(names.begin(), names.end());
    return names;
}

size_t count_objects(const Database &db, SchemaType type)
{
    return static_cast<size_t>(std::count_if(db.schema.begin(), db.schema.end(),
                                             [type](const SchemaEntry &e) { return e.type == type; }));
}

static TableInfo schema_table_info(const std::string &name)
{
    TableInfo t;
    t.name = name;
    t.rootpage = SCHEMA_ROOT_PAGE;
    t.def.table = name;
    for (const char *col : {"type", "name", "tbl_name", "rootpage", "sql"})
    {
        ColumnDef def;
        def.name = col;
        def.type = std::string(col) == "rootpage" ? "int" : "text";
        t.def.columns.push_back(def);
    }
    return t;
}

bool find_table(const Database &db, const std::string &name, TableInfo &table)
{
    if (iequals(name, "sqlite_schema") || iequals(name, "sqlite_master"))
    {
        table = schema_table_info(name);
        return true;
    }

    for (const auto &entry : db.schema)
    {
        if (!iequals(entry.name, name))
            continue;

        if (entry.type != SchemaType::Table)
        {
            std::cerr << "❌ '" << entry.name << "' is a " << schema_type_name(entry.type)
                      << ", not a table\n";
            return false;
        }

        TableInfo t;
        t.name = entry.name;
        t.rootpage = entry.rootpage;
        if (!parse_create_table(entry.sql, t.def))
        {
            std::cerr << "❌ Cannot parse the definition of table '" << entry.name << "'\n";
            return false;
        }
        if (t.def.without_rowid)
        {
            std::cerr << "❌ WITHOUT ROWID table '" << entry.name << "' is not supported\n";
            return false;
        }
        if (t.rootpage == 0)
        {
            std::cerr << "❌ Table '" << entry.name << "' has no root page\n";
            return false;
        }
        table = std::move(t);
        return true;
    }

    std::cerr << "❌ no such table: " << name << "\n";
    return false;
}

std::vector<IndexInfo> indexes_for_table(const Database &db, const std::string &table)
{
    std::vector<IndexInfo> indexes;
    for (const auto &entry : db.schema)
    {
        // automatic indexes have no SQL text
        if (entry.type != SchemaType::Index || entry.sql.empty() || entry.rootpage == 0 ||
            !iequals(entry.tbl_name, table))
            continue;

        IndexInfo idx;
        idx.name = entry.name;
        idx.rootpage = entry.rootpage;
        if (!parse_create_index(entry.sql, idx.def))
        {
            std::cerr << "❌ Ignoring index '" << entry.name << "' with unparseable definition\n";
            continue;
        }
        indexes.push_back(std::move(idx));
    }
    return indexes;
}
