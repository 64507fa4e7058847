#pragma once

#include <cstddef>
#include <cstdint>

constexpr size_t DB_HEADER_SIZE = 100;

// Text encodings as stored at header offset 56
enum class TextEncoding : uint32_t {
    UTF8 = 1,
    UTF16LE = 2,
    UTF16BE = 3
};

// The 100-byte database file header
struct DbHeader {
    uint32_t page_size = 0;   // 65536 when stored as 1
    uint8_t write_version = 0;
    uint8_t read_version = 0;
    uint8_t reserved_bytes = 0;
    uint8_t max_payload_fraction = 0;
    uint8_t min_payload_fraction = 0;
    uint8_t leaf_payload_fraction = 0;
    uint32_t file_change_counter = 0;
    uint32_t page_count = 0;  // in-header database size
    uint32_t first_freelist_trunk = 0;
    uint32_t freelist_count = 0;
    uint32_t schema_cookie = 0;
    uint32_t schema_format = 0;
    uint32_t default_cache_size = 0;
    uint32_t autovacuum_top_root = 0;
    TextEncoding text_encoding = TextEncoding::UTF8;
    uint32_t user_version = 0;
    uint32_t incremental_vacuum = 0;
    uint32_t application_id = 0;
    uint32_t version_valid_for = 0;
    uint32_t sqlite_version = 0;
};

// True when buf starts with "SQLite format 3\0"
bool has_sqlite_magic(const char *buf, size_t size);

// Decode and validate the header. Reports the first problem on stderr.
bool parse_db_header(const char *buf, size_t size, DbHeader &header);

// Page size minus the reserved region at the end of each page
uint32_t usable_page_size(const DbHeader &header);

// "utf8", "utf16le", "utf16be"
const char *text_encoding_name(TextEncoding encoding);
