#include "db_header.hpp"
#include "byte_utils.hpp"

#include <iostream>
#include <cstring>

static const char SQLITE_MAGIC[] = "SQLite format 3";

bool has_sqlite_magic(const char *buf, size_t size)
{
    // the magic includes its terminating NUL
    return size >= sizeof(SQLITE_MAGIC) &&
           std::memcmp(buf, SQLITE_MAGIC, sizeof(SQLITE_MAGIC)) == 0;
}

bool parse_db_header(const char *buf, size_t size, DbHeader &header)
{
    if (size < DB_HEADER_SIZE)
    {
        std::cerr << "❌ Database file is too short for a header (" << size << " bytes)\n";
        return false;
    }
    if (!has_sqlite_magic(buf, size))
    {
        std::cerr << "❌ Not a SQLite 3 database (bad header magic)\n";
        return false;
    }

    DbHeader h;
    uint32_t raw_page_size = read_be16(buf + 16);
    h.page_size = raw_page_size == 1 ? 65536 : raw_page_size;
    if (h.page_size < 512 || h.page_size > 65536 || (h.page_size & (h.page_size - 1)) != 0)
    {
        std::cerr << "❌ Invalid page size in header: " << raw_page_size << "\n";
        return false;
    }

    h.write_version = static_cast<uint8_t>(buf[18]);
    h.read_version = static_cast<uint8_t>(buf[19]);
    if (h.read_version > 2)
    {
        std::cerr << "❌ Unsupported file format read version: " << int(h.read_version) << "\n";
        return false;
    }

    h.reserved_bytes = static_cast<uint8_t>(buf[20]);
    h.max_payload_fraction = static_cast<uint8_t>(buf[21]);
    h.min_payload_fraction = static_cast<uint8_t>(buf[22]);
    h.leaf_payload_fraction = static_cast<uint8_t>(buf[23]);
    if (h.max_payload_fraction != 64 || h.min_payload_fraction != 32 || h.leaf_payload_fraction != 32)
    {
        std::cerr << "❌ Invalid payload fractions in header\n";
        return false;
    }
    if (h.page_size - h.reserved_bytes < 480)
    {
        std::cerr << "❌ Usable page size below 480 bytes (reserved=" << int(h.reserved_bytes) << ")\n";
        return false;
    }

    h.file_change_counter = read_be32(buf + 24);
    h.page_count = read_be32(buf + 28);
    h.first_freelist_trunk = read_be32(buf + 32);
    h.freelist_count = read_be32(buf + 36);
    h.schema_cookie = read_be32(buf + 40);
    h.schema_format = read_be32(buf + 44);
    h.default_cache_size = read_be32(buf + 48);
    h.autovacuum_top_root = read_be32(buf + 52);

    uint32_t encoding = read_be32(buf + 56);
    if (encoding == 0)
        encoding = 1; // brand-new database, nothing written yet
    if (encoding < 1 || encoding > 3)
    {
        std::cerr << "❌ Unknown text encoding in header: " << encoding << "\n";
        return false;
    }
    h.text_encoding = static_cast<TextEncoding>(encoding);

    h.user_version = read_be32(buf + 60);
    h.incremental_vacuum = read_be32(buf + 64);
    h.application_id = read_be32(buf + 68);
    h.version_valid_for = read_be32(buf + 92);
    h.sqlite_version = read_be32(buf + 96);

    header = h;
    return true;
}

uint32_t usable_page_size(const DbHeader &header)
{
    return header.page_size - header.reserved_bytes;
}

const char *text_encoding_name(TextEncoding encoding)
{
    switch (encoding)
    {
    case TextEncoding::UTF8:
        return "utf8";
    case TextEncoding::UTF16LE:
        return "utf16le";
    case TextEncoding::UTF16BE:
        return "utf16be";
    }
    return "unknown";
}
