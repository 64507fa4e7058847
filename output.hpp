#pragma once

#include <ostream>

#include <nlohmann/json.hpp>

#include "database.hpp"
#include "query.hpp"

// sqlite3 "list" mode: values joined with '|', one row per line
void print_list(const ResultSet &rs, std::ostream &out);

// Rows as objects keyed by column name, in column order
nlohmann::ordered_json result_to_json(const ResultSet &rs);
void print_json(const ResultSet &rs, std::ostream &out);

nlohmann::ordered_json dbinfo_to_json(const Database &db);
void print_dbinfo(const Database &db, std::ostream &out);

void print_tables(const Database &db, std::ostream &out);
void print_schema(const Database &db, std::ostream &out);
void print_indexes(const Database &db, std::ostream &out);
