#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pager.hpp"

// The schema table is the table b-tree rooted here
constexpr uint32_t SCHEMA_ROOT_PAGE = 1;

enum class SchemaType {
    Table,
    Index,
    View,
    Trigger
};

// One row of sqlite_schema(type, name, tbl_name, rootpage, sql)
struct SchemaEntry {
    SchemaType type = SchemaType::Table;
    std::string name;
    std::string tbl_name;
    uint32_t rootpage = 0;  // 0 for views and triggers
    std::string sql;        // empty for automatic indexes
};

bool parse_schema_type(const std::string &text, SchemaType &type);
const char *schema_type_name(SchemaType type);

// Read every schema row, in rowid order
bool load_schema(Pager &pager, std::vector<SchemaEntry> &entries);
