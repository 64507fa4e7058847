#include "output.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <string>
#include <utility>
#include <vector>

void print_list(const ResultSet &rs, std::ostream &out)
{
    for (const auto &row : rs.rows)
    {
        for (size_t i = 0; i < row.size(); ++i)
        {
            if (i)
                out << '|';
            out << format_value(row[i]);
        }
        out << '\n';
    }
}

static std::string to_hex(const std::string &bytes)
{
    std::string hex;
    hex.reserve(bytes.size() * 2);
    char buf[3];
    for (unsigned char c : bytes)
    {
        std::snprintf(buf, sizeof(buf), "%02x", c);
        hex += buf;
    }
    return hex;
}

static nlohmann::ordered_json value_to_json(const Value &v)
{
    switch (v.type)
    {
    case ValueType::Null:
        return nullptr;
    case ValueType::Integer:
        return v.integer;
    case ValueType::Real:
        return v.real;
    case ValueType::Text:
        return v.bytes;
    case ValueType::Blob:
        return to_hex(v.bytes);
    }
    return nullptr;
}

nlohmann::ordered_json result_to_json(const ResultSet &rs)
{
    nlohmann::ordered_json rows = nlohmann::ordered_json::array();
    for (const auto &row : rs.rows)
    {
        nlohmann::ordered_json obj = nlohmann::ordered_json::object();
        for (size_t i = 0; i < row.size() && i < rs.columns.size(); ++i)
            obj[rs.columns[i]] = value_to_json(row[i]);
        rows.push_back(std::move(obj));
    }
    return rows;
}

static void dump_json(const nlohmann::ordered_json &j, std::ostream &out)
{
    // stored text is not guaranteed to be valid UTF-8
    out << j.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace) << '\n';
}

void print_json(const ResultSet &rs, std::ostream &out)
{
    dump_json(result_to_json(rs), out);
}

// Characters, not bytes, as length() counts them
static uint64_t utf8_length(const std::string &s)
{
    return static_cast<uint64_t>(std::count_if(s.begin(), s.end(), [](char c)
                                               { return (static_cast<unsigned char>(c) & 0xc0) != 0x80; }));
}

static std::vector<std::pair<std::string, uint64_t>> dbinfo_fields(const Database &db)
{
    const DbHeader &h = db.pager.header;
    uint64_t schema_size = 0;
    for (const auto &e : db.schema)
        schema_size += utf8_length(e.sql);

    return {
        {"database page size", h.page_size},
        {"write format", h.write_version},
        {"read format", h.read_version},
        {"reserved bytes", h.reserved_bytes},
        {"file change counter", h.file_change_counter},
        {"database page count", db.pager.page_count},
        {"freelist page count", h.freelist_count},
        {"schema cookie", h.schema_cookie},
        {"schema format", h.schema_format},
        {"default cache size", h.default_cache_size},
        {"autovacuum top root", h.autovacuum_top_root},
        {"incremental vacuum", h.incremental_vacuum},
        {"text encoding", static_cast<uint32_t>(h.text_encoding)},
        {"user version", h.user_version},
        {"application id", h.application_id},
        {"software version", h.sqlite_version},
        {"number of tables", count_objects(db, SchemaType::Table)},
        {"number of indexes", count_objects(db, SchemaType::Index)},
        {"number of triggers", count_objects(db, SchemaType::Trigger)},
        {"number of views", count_objects(db, SchemaType::View)},
        {"schema size", schema_size},
    };
}

nlohmann::ordered_json dbinfo_to_json(const Database &db)
{
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto &field : dbinfo_fields(db))
    {
        std::string key = field.first;
        std::replace(key.begin(), key.end(), ' ', '_');
        j[key] = field.second;
    }
    j["text_encoding_name"] = text_encoding_name(db.pager.header.text_encoding);
    return j;
}

void print_dbinfo(const Database &db, std::ostream &out)
{
    for (const auto &field : dbinfo_fields(db))
    {
        out << std::left << std::setw(20) << (field.first + ":") << ' ' << field.second;
        if (field.first == "text encoding")
            out << " (" << text_encoding_name(db.pager.header.text_encoding) << ")";
        out << '\n';
    }
}

static void print_names(const std::vector<std::string> &names, std::ostream &out)
{
    if (names.empty())
        return;
    for (size_t i = 0; i < names.size(); ++i)
        out << (i ? " " : "") << names[i];
    out << '\n';
}

void print_tables(const Database &db, std::ostream &out)
{
    print_names(user_table_names(db), out);
}

void print_schema(const Database &db, std::ostream &out)
{
    for (const auto &e : db.schema)
        if (!e.sql.empty())
            out << e.sql << ";\n";
}

void print_indexes(const Database &db, std::ostream &out)
{
    std::vector<std::string> names = object_names(db, SchemaType::Index);
    std::sort(names.begin(), names.end());
    print_names(names, out);
}
