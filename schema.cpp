#include "schema.hpp"
#include "btree.hpp"
#include "record.hpp"
#include "log_util.hpp"

#include <iostream>

bool parse_schema_type(const std::string &text, SchemaType &type)
{
    if (text == "table")
        type = SchemaType::Table;
    else if (text == "index")
        type = SchemaType::Index;
    else if (text == "view")
        type = SchemaType::View;
    else if (text == "trigger")
        type = SchemaType::Trigger;
    else
        return false;
    return true;
}

const char *schema_type_name(SchemaType type)
{
    switch (type)
    {
    case SchemaType::Table:
        return "table";
    case SchemaType::Index:
        return "index";
    case SchemaType::View:
        return "view";
    case SchemaType::Trigger:
        return "trigger";
    }
    return "unknown";
}

static std::string text_or_empty(const Value &v)
{
    return v.type == ValueType::Text ? v.bytes : std::string();
}

bool load_schema(Pager &pager, std::vector<SchemaEntry> &entries)
{
    entries.clear();
    bool ok = true;

    bool walked = scan_table(pager, SCHEMA_ROOT_PAGE,
        [&](int64_t rowid, const std::vector<char> &payload)
        {
            std::vector<Value> values;
            if (!decode_record(payload, pager.header.text_encoding, values))
            {
                std::cerr << "❌ Unreadable schema row " << rowid << "\n";
                ok = false;
                return false;
            }
            if (values.size() < 5)
            {
                std::cerr << "❌ Schema row " << rowid << " has " << values.size()
                          << " columns, expected 5\n";
                ok = false;
                return false;
            }

            SchemaEntry entry;
            std::string type_text = text_or_empty(values[0]);
            if (!parse_schema_type(type_text, entry.type))
            {
                std::cerr << "❌ Skipping schema row " << rowid << " of unknown type '"
                          << type_text << "'\n";
                return true;
            }

            entry.name = text_or_empty(values[1]);
            entry.tbl_name = text_or_empty(values[2]);
            if (values[3].type == ValueType::Integer && values[3].integer > 0)
                entry.rootpage = static_cast<uint32_t>(values[3].integer);
            entry.sql = text_or_empty(values[4]);

            if (g_verbose)
                std::cerr << "[DEBUG] schema " << type_text << " '" << entry.name
                          << "' root page " << entry.rootpage << "\n";
            entries.push_back(std::move(entry));
            return true;
        });

    if (!walked || !ok)
    {
        std::cerr << "❌ Failed to load the schema table\n";
        return false;
    }
    return true;
}
