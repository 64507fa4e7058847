#pragma once

#include <string>
#include <vector>

#include "database.hpp"
#include "record.hpp"
#include "sql_parser.hpp"

struct ResultSet {
    std::vector<std::string> columns;
    std::vector<std::vector<Value>> rows;
};

bool execute_select(Database &db, const SelectStatement &stmt, ResultSet &result);

// Parse and run one statement; only SELECT is accepted
bool execute_sql(Database &db, const std::string &sql, ResultSet &result);
