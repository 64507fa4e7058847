#include "record.hpp"
#include "byte_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

Value make_null()
{
    return Value{};
}

Value make_integer(int64_t v)
{
    Value r;
    r.type = ValueType::Integer;
    r.integer = v;
    return r;
}

Value make_real(double v)
{
    Value r;
    r.type = ValueType::Real;
    r.real = v;
    return r;
}

Value make_text(const std::string &s)
{
    Value r;
    r.type = ValueType::Text;
    r.bytes = s;
    return r;
}

Value make_blob(const std::string &s)
{
    Value r;
    r.type = ValueType::Blob;
    r.bytes = s;
    return r;
}

bool serial_type_size(uint64_t serial_type, size_t &size)
{
    static const size_t fixed[] = {0, 1, 2, 3, 4, 6, 8, 8, 0, 0};
    if (serial_type < 10)
    {
        size = fixed[serial_type];
        return true;
    }
    if (serial_type < 12)
        return false;

    size = static_cast<size_t>((serial_type - (serial_type % 2 == 0 ? 12 : 13)) / 2);
    return true;
}

static void append_utf8(std::string &out, uint32_t cp)
{
    if (cp < 0x80)
    {
        out.push_back(static_cast<char>(cp));
    }
    else if (cp < 0x800)
    {
        out.push_back(static_cast<char>(0xc0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
    else if (cp < 0x10000)
    {
        out.push_back(static_cast<char>(0xe0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
    else
    {
        out.push_back(static_cast<char>(0xf0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
}

std::string utf16_to_utf8(const char *data, size_t size, bool big_endian)
{
    const unsigned char *u = reinterpret_cast<const unsigned char *>(data);
    std::string out;
    out.reserve(size);

    auto unit_at = [&](size_t i) -> uint32_t {
        return big_endian ? (uint32_t(u[i]) << 8) | u[i + 1]
                          : (uint32_t(u[i + 1]) << 8) | u[i];
    };

    size_t i = 0;
    while (i + 1 < size)
    {
        uint32_t unit = unit_at(i);
        i += 2;

        if (unit >= 0xd800 && unit <= 0xdbff)
        {
            if (i + 1 < size)
            {
                uint32_t low = unit_at(i);
                if (low >= 0xdc00 && low <= 0xdfff)
                {
                    i += 2;
                    append_utf8(out, 0x10000 + ((unit - 0xd800) << 10) + (low - 0xdc00));
                    continue;
                }
            }
            append_utf8(out, 0xfffd);
        }
        else if (unit >= 0xdc00 && unit <= 0xdfff)
        {
            append_utf8(out, 0xfffd);
        }
        else
        {
            append_utf8(out, unit);
        }
    }
    return out;
}

// Invalid sequences become U+FFFD
static uint32_t next_code_point(const std::string &s, size_t &i)
{
    unsigned char lead = static_cast<unsigned char>(s[i++]);
    size_t extra = 0;
    uint32_t cp = 0;
    if (lead < 0x80)
        return lead;
    if ((lead & 0xe0) == 0xc0)
    {
        extra = 1;
        cp = lead & 0x1f;
    }
    else if ((lead & 0xf0) == 0xe0)
    {
        extra = 2;
        cp = lead & 0x0f;
    }
    else if ((lead & 0xf8) == 0xf0)
    {
        extra = 3;
        cp = lead & 0x07;
    }
    else
    {
        return 0xfffd;
    }

    for (size_t k = 0; k < extra; ++k)
    {
        if (i >= s.size() || (static_cast<unsigned char>(s[i]) & 0xc0) != 0x80)
            return 0xfffd;
        cp = (cp << 6) | (static_cast<unsigned char>(s[i++]) & 0x3f);
    }
    return cp > 0x10ffff ? 0xfffd : cp;
}

std::string utf8_to_utf16(const std::string &utf8, bool big_endian)
{
    std::string out;
    out.reserve(utf8.size() * 2);

    auto put_unit = [&](uint32_t unit) {
        char hi = static_cast<char>((unit >> 8) & 0xff);
        char lo = static_cast<char>(unit & 0xff);
        out.push_back(big_endian ? hi : lo);
        out.push_back(big_endian ? lo : hi);
    };

    size_t i = 0;
    while (i < utf8.size())
    {
        uint32_t cp = next_code_point(utf8, i);
        if (cp >= 0x10000)
        {
            cp -= 0x10000;
            put_unit(0xd800 + (cp >> 10));
            put_unit(0xdc00 + (cp & 0x3ff));
        }
        else
        {
            put_unit(cp);
        }
    }
    return out;
}

bool decode_record(const std::vector<char> &payload, TextEncoding encoding,
                   std::vector<Value> &values)
{
    values.clear();
    const char *data = payload.data();
    size_t size = payload.size();

    size_t pos = 0;
    uint64_t header_size = 0;
    if (!read_varint(data, size, pos, header_size) || header_size > size || header_size < pos)
    {
        std::cerr << "❌ Corrupt record header (payload " << size << " bytes)\n";
        return false;
    }

    std::vector<uint64_t> serial_types;
    while (pos < header_size)
    {
        uint64_t st = 0;
        if (!read_varint(data, static_cast<size_t>(header_size), pos, st))
        {
            std::cerr << "❌ Corrupt serial type in record header\n";
            return false;
        }
        serial_types.push_back(st);
    }

    size_t body = static_cast<size_t>(header_size);
    for (uint64_t st : serial_types)
    {
        size_t len = 0;
        if (!serial_type_size(st, len))
        {
            std::cerr << "❌ Invalid column serial type: " << st << "\n";
            return false;
        }
        if (len > size - body)
        {
            std::cerr << "❌ Record body overruns payload (serial type " << st << ")\n";
            return false;
        }

        const char *p = data + body;
        if (st == 0)
            values.push_back(make_null());
        else if (st <= 6)
            values.push_back(make_integer(read_be_int(p, len)));
        else if (st == 7)
            values.push_back(make_real(read_be_double(p)));
        else if (st == 8)
            values.push_back(make_integer(0));
        else if (st == 9)
            values.push_back(make_integer(1));
        else if (st % 2 == 0)
            values.push_back(make_blob(std::string(p, len)));
        else if (encoding == TextEncoding::UTF8)
            values.push_back(make_text(std::string(p, len)));
        else
            values.push_back(make_text(utf16_to_utf8(p, len, encoding == TextEncoding::UTF16BE)));

        body += len;
    }
    return true;
}

static int type_rank(ValueType t)
{
    switch (t)
    {
    case ValueType::Null:
        return 0;
    case ValueType::Integer:
    case ValueType::Real:
        return 1;
    case ValueType::Text:
        return 2;
    case ValueType::Blob:
        return 3;
    }
    return 0;
}

static int compare_bytes(const std::string &a, const std::string &b)
{
    size_t n = std::min(a.size(), b.size());
    int c = n ? std::memcmp(a.data(), b.data(), n) : 0;
    if (c != 0)
        return c < 0 ? -1 : 1;
    if (a.size() == b.size())
        return 0;
    return a.size() < b.size() ? -1 : 1;
}

int compare_values(const Value &a, const Value &b, TextEncoding encoding)
{
    int ra = type_rank(a.type), rb = type_rank(b.type);
    if (ra != rb)
        return ra < rb ? -1 : 1;

    switch (a.type)
    {
    case ValueType::Null:
        return 0;
    case ValueType::Integer:
    case ValueType::Real:
        if (a.type == ValueType::Integer && b.type == ValueType::Integer)
            return a.integer < b.integer ? -1 : (a.integer > b.integer ? 1 : 0);
        else
        {
            long double x = a.type == ValueType::Integer ? (long double)a.integer : a.real;
            long double y = b.type == ValueType::Integer ? (long double)b.integer : b.real;
            return x < y ? -1 : (x > y ? 1 : 0);
        }
    case ValueType::Text:
        if (encoding != TextEncoding::UTF8)
        {
            bool big_endian = encoding == TextEncoding::UTF16BE;
            return compare_bytes(utf8_to_utf16(a.bytes, big_endian), utf8_to_utf16(b.bytes, big_endian));
        }
        return compare_bytes(a.bytes, b.bytes);
    case ValueType::Blob:
        return compare_bytes(a.bytes, b.bytes);
    }
    return 0;
}

static std::string upper(const std::string &s)
{
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return r;
}

Affinity affinity_for_type(const std::string &declared_type)
{
    std::string t = upper(declared_type);
    if (t.find("INT") != std::string::npos)
        return Affinity::Integer;
    if (t.find("CHAR") != std::string::npos || t.find("CLOB") != std::string::npos ||
        t.find("TEXT") != std::string::npos)
        return Affinity::Text;
    if (t.empty() || t.find("BLOB") != std::string::npos)
        return Affinity::Blob;
    if (t.find("REAL") != std::string::npos || t.find("FLOA") != std::string::npos ||
        t.find("DOUB") != std::string::npos)
        return Affinity::Real;
    return Affinity::Numeric;
}

// Parse text as a number the way numeric affinity does (surrounding blanks allowed)
static bool text_to_number(const std::string &s, Value &out)
{
    size_t b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos)
        return false;
    size_t e = s.find_last_not_of(" \t\n\r");
    std::string t = s.substr(b, e - b + 1);

    const char *begin = t.c_str();
    char *end = nullptr;

    errno = 0;
    long long i = std::strtoll(begin, &end, 10);
    if (end == begin + t.size() && errno == 0)
    {
        out = make_integer(i);
        return true;
    }

    errno = 0;
    double d = std::strtod(begin, &end);
    if (end != begin + t.size() || errno == ERANGE || std::isnan(d))
        return false;
    // hex floats and words like "inf" are not SQL numbers
    for (char c : t)
        if (std::isalpha(static_cast<unsigned char>(c)) && c != 'e' && c != 'E')
            return false;

    // a real that is exactly an integer is stored as one
    if (d == std::floor(d) && std::fabs(d) < 9.2e18)
        out = make_integer(static_cast<int64_t>(d));
    else
        out = make_real(d);
    return true;
}

Value apply_affinity(const Value &v, Affinity affinity)
{
    switch (affinity)
    {
    case Affinity::Text:
        if (v.type == ValueType::Integer || v.type == ValueType::Real)
            return make_text(format_value(v));
        return v;
    case Affinity::Numeric:
    case Affinity::Integer:
    case Affinity::Real:
        if (v.type == ValueType::Text)
        {
            Value n;
            if (text_to_number(v.bytes, n))
                return n;
        }
        return v;
    case Affinity::Blob:
        return v;
    }
    return v;
}

static std::string format_real(double d)
{
    if (std::isinf(d))
        return d > 0 ? "Inf" : "-Inf";

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.15g", d);
    std::string s = buf;

    // always show a decimal point, like sqlite3 does
    if (s.find_first_of(".n") == std::string::npos)
    {
        size_t e = s.find('e');
        if (e == std::string::npos)
            s += ".0";
        else
            s.insert(e, ".0");
    }
    return s;
}

std::string format_value(const Value &v)
{
    switch (v.type)
    {
    case ValueType::Null:
        return "";
    case ValueType::Integer:
        return std::to_string(v.integer);
    case ValueType::Real:
        return format_real(v.real);
    case ValueType::Text:
    case ValueType::Blob:
        return v.bytes;
    }
    return "";
}
