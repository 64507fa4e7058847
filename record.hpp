#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "db_header.hpp"

// Storage classes
enum class ValueType {
    Null,
    Integer,
    Real,
    Text,   // always UTF-8 once decoded
    Blob
};

struct Value {
    ValueType type = ValueType::Null;
    int64_t integer = 0;
    double real = 0.0;
    std::string bytes;   // text or blob contents
};

Value make_null();
Value make_integer(int64_t v);
Value make_real(double v);
Value make_text(const std::string &s);
Value make_blob(const std::string &s);

// Column type affinity, derived from the declared type
enum class Affinity {
    Text,
    Numeric,
    Integer,
    Real,
    Blob
};

// Content size in bytes for a record serial type. False for the reserved types 10 and 11.
bool serial_type_size(uint64_t serial_type, size_t &size);

// Decode a whole record (header + bodies) into values
bool decode_record(const std::vector<char> &payload, TextEncoding encoding,
                   std::vector<Value> &values);

std::string utf16_to_utf8(const char *data, size_t size, bool big_endian);
std::string utf8_to_utf16(const std::string &utf8, bool big_endian);

// SQLite sort order with BINARY collation: <0, 0, >0.
// Text compares byte-wise in the database encoding.
int compare_values(const Value &a, const Value &b, TextEncoding encoding = TextEncoding::UTF8);

Affinity affinity_for_type(const std::string &declared_type);

// Coerce a value the way storing it into a column of the given affinity would
Value apply_affinity(const Value &v, Affinity affinity);

// Text rendering used by the list output mode (NULL is empty)
std::string format_value(const Value &v);
