#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pager.hpp"
#include "schema.hpp"
#include "sql_parser.hpp"

struct Database {
    Pager pager;
    std::vector<SchemaEntry> schema;
};

// A table resolved from the schema, with its parsed definition
struct TableInfo {
    std::string name;
    uint32_t rootpage = 0;
    CreateTableStatement def;
};

struct IndexInfo {
    std::string name;
    uint32_t rootpage = 0;
    CreateIndexStatement def;
};

bool open_database(const std::string &path, Database &db);

// Names of all schema objects of a type, in schema order
std::vector<std::string> object_names(const Database &db, SchemaType type);

// Tables as .tables lists them: sorted, without sqlite_ internals
std::vector<std::string> user_table_names(const Database &db);

size_t count_objects(const Database &db, SchemaType type);

// Case-insensitive lookup; sqlite_schema and sqlite_master name the schema table
bool find_table(const Database &db, const std::string &name, TableInfo &table);

// Indexes on a table that carry a parseable CREATE INDEX statement
std::vector<IndexInfo> indexes_for_table(const Database &db, const std::string &table);
