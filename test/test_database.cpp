#include "btree.hpp"
#include "byte_utils.hpp"
#include "database.hpp"
#include "output.hpp"
#include "query.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

static int g_failures = 0;

static void check(bool cond, const std::string &what)
{
    if (cond)
    {
        std::cout << "✅ " << what << "\n";
    }
    else
    {
        std::cerr << "❌ " << what << "\n";
        ++g_failures;
    }
}

static bool exec_sql(const std::string &path, const std::string &sql)
{
    sqlite3 *db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK)
    {
        std::cerr << "❌ sqlite3_open failed: " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        return false;
    }
    char *err = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK)
    {
        std::cerr << "❌ sqlite3_exec failed: " << (err ? err : "?") << "\n";
        sqlite3_free(err);
    }
    sqlite3_close(db);
    return rc == SQLITE_OK;
}

// Rows from the real engine, columns joined with '|' and NULL as empty
static std::vector<std::string> sqlite_rows(const std::string &path, const std::string &sql)
{
    std::vector<std::string> rows;
    sqlite3 *db = nullptr;
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK ||
        sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::cerr << "❌ sqlite3 cannot run: " << sql << ": " << sqlite3_errmsg(db) << "\n";
        sqlite3_close(db);
        return rows;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        std::string line;
        for (int i = 0; i < sqlite3_column_count(stmt); ++i)
        {
            if (i)
                line += '|';
            const unsigned char *text = sqlite3_column_text(stmt, i);
            if (text)
                line.append(reinterpret_cast<const char *>(text),
                            static_cast<size_t>(sqlite3_column_bytes(stmt, i)));
        }
        rows.push_back(line);
    }
    sqlite3_finalize(stmt);
    sqlite3_close(db);
    return rows;
}

static bool our_rows(Database &db, const std::string &sql, std::vector<std::string> &rows)
{
    ResultSet rs;
    if (!execute_sql(db, sql, rs))
        return false;

    std::ostringstream out;
    print_list(rs, out);

    rows.clear();
    std::istringstream in(out.str());
    std::string line;
    while (std::getline(in, line))
        rows.push_back(line);
    return true;
}

static void same_as_sqlite(Database &db, const std::string &path, const std::string &sql)
{
    std::vector<std::string> ours;
    bool ok = our_rows(db, sql, ours);
    std::vector<std::string> expected = sqlite_rows(path, sql);
    check(ok && ours == expected,
          sql + " (" + std::to_string(ours.size()) + " rows, sqlite3 " + std::to_string(expected.size()) + ")");
}

// For queries sqlite3 may answer through an index, in key order
static void same_rows_as_sqlite(Database &db, const std::string &path, const std::string &sql)
{
    std::vector<std::string> ours;
    bool ok = our_rows(db, sql, ours);
    std::vector<std::string> expected = sqlite_rows(path, sql);
    std::sort(ours.begin(), ours.end());
    std::sort(expected.begin(), expected.end());
    check(ok && ours == expected,
          sql + " (" + std::to_string(ours.size()) + " rows, sqlite3 " + std::to_string(expected.size()) + ")");
}

static int64_t pragma_int(const std::string &path, const std::string &pragma)
{
    std::vector<std::string> rows = sqlite_rows(path, "PRAGMA " + pragma);
    return rows.empty() ? -1 : std::stoll(rows[0]);
}

static void test_fruits(const fs::path &dir)
{
    std::string path = (dir / "fruits.db").string();
    bool created = exec_sql(path,
        "PRAGMA user_version = 7;"
        "PRAGMA application_id = 1234;"
        "CREATE TABLE apples (id integer primary key autoincrement, name text, color text);"
        "INSERT INTO apples (name, color) VALUES ('Granny Smith', 'Light Green'), ('Fuji', 'Red'),"
        " ('Honeycrisp', 'Blush Red'), ('Golden Delicious', 'Yellow');"
        "CREATE TABLE oranges (id integer primary key autoincrement, name text, description text);"
        "INSERT INTO oranges (name, description) VALUES ('Mandarin', 'great for snacking'),"
        " ('Tangelo', 'sweet and tart'), ('Blood Orange', NULL), ('Navel', 'seedless'),"
        " ('Valencia', 'juicy'), ('Cara Cara', 'pinkish');"
        "CREATE VIEW red_apples AS SELECT name FROM apples WHERE color LIKE '%Red';");
    check(created, "fruits fixture created");

    Database db;
    bool opened = open_database(path, db);
    check(opened, "fruits.db opens");
    if (!opened)
        return;

    check(db.pager.header.page_size == 4096, "default page size");
    check(db.pager.header.user_version == 7 && db.pager.header.application_id == 1234,
          "user version and application id");
    check(int64_t(db.pager.page_count) == pragma_int(path, "page_count"), "page count matches PRAGMA");
    check(int64_t(db.pager.header.schema_cookie) == pragma_int(path, "schema_version"),
          "schema cookie matches PRAGMA");
    check(count_objects(db, SchemaType::Table) == 3, "three tables including sqlite_sequence");
    check(count_objects(db, SchemaType::View) == 1, "one view");

    std::vector<std::string> tables = user_table_names(db);
    check(tables == std::vector<std::string>({"apples", "oranges"}), "user tables sorted, internals hidden");

    std::ostringstream out;
    print_tables(db, out);
    check(out.str() == "apples oranges\n", ".tables output");

    out.str("");
    print_dbinfo(db, out);
    check(out.str().find("database page size:  4096\n") != std::string::npos, ".dbinfo page size line");
    check(out.str().find("number of tables:    3\n") != std::string::npos, ".dbinfo table count line");
    check(out.str().find("text encoding:       1 (utf8)\n") != std::string::npos, ".dbinfo encoding line");

    out.str("");
    print_schema(db, out);
    check(out.str().find("CREATE TABLE apples (id integer primary key autoincrement, name text, color text);\n") == 0,
          ".schema starts with apples");

    same_as_sqlite(db, path, "SELECT COUNT(*) FROM apples");
    same_as_sqlite(db, path, "SELECT name FROM apples");
    same_as_sqlite(db, path, "SELECT id, name FROM apples");
    same_as_sqlite(db, path, "SELECT * FROM oranges");
    same_as_sqlite(db, path, "SELECT name, color FROM apples WHERE color = 'Yellow'");
    same_as_sqlite(db, path, "SELECT NAME FROM APPLES WHERE Color = 'Red'");
    same_as_sqlite(db, path, "SELECT name FROM apples WHERE color = 'yellow'");
    same_as_sqlite(db, path, "SELECT COUNT(description) FROM oranges");
    same_as_sqlite(db, path, "SELECT name FROM oranges WHERE description IS NULL");
    same_as_sqlite(db, path, "SELECT name FROM oranges WHERE id = '3'");
    same_as_sqlite(db, path, "SELECT rowid, name FROM oranges WHERE rowid >= 5");
    same_as_sqlite(db, path, "SELECT name FROM sqlite_master WHERE type = 'table'");

    std::vector<std::string> rows;
    check(!our_rows(db, "SELECT name FROM pears", rows), "unknown table is an error");
    check(!our_rows(db, "SELECT flavour FROM apples", rows), "unknown column is an error");
    check(!our_rows(db, "SELECT name FROM red_apples", rows), "selecting from a view is an error");
    check(!our_rows(db, "SELECT name, COUNT(*) FROM apples", rows), "mixed aggregate is an error");
    check(!our_rows(db, "DELETE FROM apples", rows), "non-SELECT is an error");

    ResultSet rs;
    bool ok = execute_sql(db, "SELECT id, name FROM apples WHERE id = 2", rs);
    check(ok && result_to_json(rs).dump() == "[{\"id\":2,\"name\":\"Fuji\"}]", "JSON rendering");
}

static void test_people(const fs::path &dir)
{
    std::string path = (dir / "people.db").string();
    bool created = exec_sql(path,
        "PRAGMA page_size = 1024;"
        "CREATE TABLE people (id INTEGER PRIMARY KEY, name TEXT, country TEXT, bio TEXT, score REAL, age INTEGER);"
        "CREATE INDEX idx_people_country ON people (country);"
        "CREATE INDEX idx_people_name_nocase ON people (name COLLATE NOCASE);"
        "CREATE INDEX idx_people_age_over_ten ON people (age) WHERE age > 10;");

    sqlite3 *raw = nullptr;
    sqlite3_stmt *ins = nullptr;
    const char *countries[] = {"Chile", "Peru", "Norway", "Japan", "Kenya", "Canada", "Fiji"};
    const int total = 3000;

    created = created && sqlite3_open(path.c_str(), &raw) == SQLITE_OK &&
              sqlite3_exec(raw, "BEGIN", nullptr, nullptr, nullptr) == SQLITE_OK &&
              sqlite3_prepare_v2(raw, "INSERT INTO people VALUES (?, ?, ?, ?, ?, ?)", -1, &ins, nullptr) == SQLITE_OK;
    for (int i = 1; created && i <= total; ++i)
    {
        std::string name = "person " + std::to_string(i);
        std::string bio = i % 50 == 0 ? std::string(3000, char('a' + i % 26)) + " end" : "short bio";
        sqlite3_bind_int(ins, 1, i);
        sqlite3_bind_text(ins, 2, name.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(ins, 3, countries[i % 7], -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(ins, 4, bio.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_double(ins, 5, i + 0.5);
        if (i % 10 == 0)
            sqlite3_bind_null(ins, 6);
        else
            sqlite3_bind_int(ins, 6, i % 90);
        created = sqlite3_step(ins) == SQLITE_DONE && sqlite3_reset(ins) == SQLITE_OK;
    }
    sqlite3_finalize(ins);
    created = created && sqlite3_exec(raw, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK &&
              sqlite3_exec(raw, "DELETE FROM people WHERE id > 2900", nullptr, nullptr, nullptr) == SQLITE_OK;
    sqlite3_close(raw);
    check(created, "people fixture created");

    Database db;
    bool opened = open_database(path, db);
    check(opened, "people.db opens");
    if (!opened)
        return;

    check(db.pager.header.page_size == 1024, "1024-byte pages");
    check(int64_t(db.pager.header.freelist_count) == pragma_int(path, "freelist_count"),
          "freelist count matches PRAGMA");

    TableInfo people;
    check(find_table(db, "People", people) && people.def.rowid_alias == 0, "table lookup ignores case");

    BtreePage root;
    check(load_btree_page(db.pager, people.rootpage, root) && root.type == PageType::InteriorTable,
          "table root is an interior page");

    std::vector<IndexInfo> all_indexes = indexes_for_table(db, "people");
    check(all_indexes.size() == 3, "all indexes found for table");

    std::vector<IndexInfo> indexes;
    for (const auto &idx : all_indexes)
        if (idx.name == "idx_people_country")
            indexes.push_back(idx);
    check(indexes.size() == 1 && indexes[0].def.columns[0] == "country", "country index found");
    if (indexes.size() == 1)
    {
        BtreePage index_root;
        check(load_btree_page(db.pager, indexes[0].rootpage, index_root) &&
                  index_root.type == PageType::InteriorIndex,
              "index root is an interior page");

        std::vector<int64_t> rowids;
        check(search_index_equal(db.pager, indexes[0].rootpage, make_text("Chile"), rowids) &&
                  rowids.size() == 414,
              "index search finds every Chile row");

        uint64_t entries = 0;
        bool scanned = scan_index(db.pager, indexes[0].rootpage, [&](const std::vector<char> &) {
            ++entries;
            return true;
        });
        check(scanned && entries == 2900, "index scan visits every entry");
    }

    uint64_t count = 0;
    check(count_table_rows(db.pager, people.rootpage, count) && count == 2900, "row count after delete");

    bool found = false;
    std::vector<char> payload;
    check(find_row(db.pager, people.rootpage, 1500, found, payload) && found, "rowid 1500 found");
    check(find_row(db.pager, people.rootpage, 2950, found, payload) && !found, "deleted rowid not found");

    same_as_sqlite(db, path, "SELECT COUNT(*) FROM people");
    same_as_sqlite(db, path, "SELECT COUNT(age) FROM people");
    same_as_sqlite(db, path, "SELECT COUNT(*) FROM people WHERE country = 'Chile'");
    same_as_sqlite(db, path, "SELECT id, name FROM people WHERE country = 'Chile'");
    same_as_sqlite(db, path, "SELECT id, name FROM people WHERE country = 'Atlantis'");
    same_as_sqlite(db, path, "SELECT bio FROM people WHERE id = 50");
    same_as_sqlite(db, path, "SELECT id, bio FROM people WHERE country = 'Fiji' AND age IS NULL");
    same_as_sqlite(db, path, "SELECT * FROM people WHERE id = 1234");
    same_as_sqlite(db, path, "SELECT name, score FROM people WHERE score > 2890 OR id < 3");
    same_as_sqlite(db, path, "SELECT id FROM people WHERE age = '42'");
    same_as_sqlite(db, path, "SELECT id FROM people WHERE NOT (age <> 7)");
    same_as_sqlite(db, path, "SELECT id FROM people LIMIT 5");
    same_as_sqlite(db, path, "SELECT id FROM people WHERE country = 'Peru' LIMIT 3");
    same_as_sqlite(db, path, "SELECT id FROM people WHERE country = 'Peru' LIMIT -1");
    same_as_sqlite(db, path, "SELECT COUNT(*) FROM people LIMIT -1");
    same_as_sqlite(db, path, "SELECT id FROM people WHERE id > 2890 LIMIT -5");

    // a NOCASE index orders names differently from the BINARY comparison
    same_as_sqlite(db, path, "SELECT id FROM people WHERE name = 'person 77'");
    same_as_sqlite(db, path, "SELECT id FROM people WHERE name = 'PERSON 77'");

    // ages 10 and below are missing from the partial index
    same_as_sqlite(db, path, "SELECT id FROM people WHERE age = 5");
    same_as_sqlite(db, path, "SELECT COUNT(*) FROM people WHERE age = 42");
    same_as_sqlite(db, path, "SELECT id, name, country, bio, score, age FROM people");
}

static void test_utf16(const fs::path &dir, const std::string &pragma, TextEncoding encoding)
{
    std::string path = (dir / ("words_" + pragma + ".db")).string();
    bool created = exec_sql(path,
        "PRAGMA encoding = '" + pragma + "';"
        "CREATE TABLE words (w TEXT, n INTEGER);"
        "CREATE INDEX idx_words_w ON words (w);"
        "INSERT INTO words VALUES ('héllo', 1), ('日本語', 2), ('😀 grin', 3), ('plain', 4),"
        " ('a', 5), ('ā', 6), ('b', 7), ('日', 8);");
    check(created, pragma + " fixture created");

    Database db;
    bool opened = open_database(path, db);
    check(opened && db.pager.header.text_encoding == encoding, pragma + " database opens");
    if (!opened)
        return;

    check(user_table_names(db) == std::vector<std::string>({"words"}), pragma + " schema decodes");
    same_as_sqlite(db, path, "SELECT w, n FROM words");

    // equality falls back to a scan despite idx_words_w
    same_as_sqlite(db, path, "SELECT n FROM words WHERE w = '日本語'");
    same_as_sqlite(db, path, "SELECT n FROM words WHERE w = 'ā'");

    // text ranges follow the byte order of the stored encoding
    same_rows_as_sqlite(db, path, "SELECT w FROM words WHERE w < 'b'");
    same_rows_as_sqlite(db, path, "SELECT w FROM words WHERE w > 'b'");
    same_rows_as_sqlite(db, path, "SELECT w FROM words WHERE w >= '日'");
    same_rows_as_sqlite(db, path, "SELECT n FROM words WHERE w <= 'ā'");
}

static void test_altered(const fs::path &dir)
{
    std::string path = (dir / "altered.db").string();
    bool created = exec_sql(path,
        "CREATE TABLE t (id INTEGER PRIMARY KEY, a TEXT);"
        "INSERT INTO t VALUES (-5, 'negative'), (1099511627776, 'large'), (3, 'three');"
        "ALTER TABLE t ADD COLUMN b TEXT;"
        "INSERT INTO t VALUES (4, 'four', 'bee');"
        "CREATE TABLE blobs (x BLOB, y);"
        "INSERT INTO blobs VALUES (x'00ff10', 1.0), (NULL, -0.25);"
        "CREATE TABLE prices (item TEXT, amount REAL);"
        "INSERT INTO prices VALUES ('tea', 3), ('cake', 2.5), ('jam', '4'), ('gift', NULL);");
    check(created, "altered fixture created");

    Database db;
    bool opened = open_database(path, db);
    check(opened, "altered.db opens");
    if (!opened)
        return;

    same_as_sqlite(db, path, "SELECT id, a, b FROM t");
    same_as_sqlite(db, path, "SELECT a FROM t WHERE id = 1099511627776");
    same_as_sqlite(db, path, "SELECT a FROM t WHERE b IS NULL");
    same_as_sqlite(db, path, "SELECT y FROM blobs");
    same_as_sqlite(db, path, "SELECT item, amount FROM prices");
    same_as_sqlite(db, path, "SELECT item FROM prices WHERE amount = '3'");

    ResultSet rs;
    bool ok = execute_sql(db, "SELECT x FROM blobs", rs);
    check(ok && result_to_json(rs).dump() == "[{\"x\":\"00ff10\"},{\"x\":null}]", "blobs render as hex in JSON");
}

static std::string be32_bytes(uint32_t v)
{
    std::string b(4, '\0');
    b[0] = static_cast<char>(v >> 24);
    b[1] = static_cast<char>(v >> 16);
    b[2] = static_cast<char>(v >> 8);
    b[3] = static_cast<char>(v);
    return b;
}

// Copy src to dst, then overwrite bytes of dst at the given file offsets
static bool corrupt_copy(const std::string &src, const std::string &dst,
                         const std::vector<std::pair<uint64_t, std::string>> &patches)
{
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        std::cerr << "❌ Cannot copy " << src << ": " << ec.message() << "\n";
        return false;
    }

    std::fstream f(dst, std::ios::in | std::ios::out | std::ios::binary);
    for (const auto &patch : patches)
    {
        f.seekp(static_cast<std::streamoff>(patch.first));
        f.write(patch.second.data(), static_cast<std::streamsize>(patch.second.size()));
    }
    return static_cast<bool>(f);
}

static void test_corrupt_trees(const fs::path &dir)
{
    std::string path = (dir / "tree.db").string();
    bool created = exec_sql(path,
        "PRAGMA page_size = 1024;"
        "CREATE TABLE t (id INTEGER PRIMARY KEY, v TEXT);"
        "WITH RECURSIVE n(i) AS (SELECT 1 UNION ALL SELECT i + 1 FROM n WHERE i < 1000)"
        " INSERT INTO t SELECT i, printf('%0100d', i) FROM n;");
    check(created, "tree fixture created");

    uint32_t root = 0, page_count = 0, page_size = 0;
    std::vector<uint16_t> cell_offsets;
    {
        Database db;
        TableInfo t;
        BtreePage page;
        if (!open_database(path, db) || !find_table(db, "t", t) || !load_btree_page(db.pager, t.rootpage, page) ||
            page.type != PageType::InteriorTable || t.rootpage == 1)
        {
            check(false, "tree fixture has an interior root");
            return;
        }
        root = t.rootpage;
        page_count = db.pager.page_count;
        page_size = db.pager.header.page_size;
        cell_offsets = page.cell_offsets;
    }
    uint64_t root_offset = uint64_t(root - 1) * page_size;

    // right child pointing back at the root
    std::string cycle = (dir / "tree_cycle.db").string();
    check(corrupt_copy(path, cycle, {{root_offset + 8, be32_bytes(root)}}), "cyclic tree written");
    {
        Database db;
        check(open_database(cycle, db), "cyclic tree opens");
        uint64_t count = 0;
        bool found = false;
        std::vector<char> payload;
        check(!scan_table(db.pager, root, [](int64_t, const std::vector<char> &) { return true; }),
              "scan stops at a cycle");
        check(!count_table_rows(db.pager, root, count), "count stops at a cycle");
        check(!find_row(db.pager, root, 5000, found, payload), "lookup stops at the depth limit");
        check(find_row(db.pager, root, 1, found, payload) && found, "rows left of the cycle still readable");

        ResultSet rs;
        check(!execute_sql(db, "SELECT COUNT(*) FROM t", rs), "query on cyclic tree fails");
    }

    // every child pointer aimed at the root
    std::vector<std::pair<uint64_t, std::string>> patches = {{root_offset + 8, be32_bytes(root)}};
    for (uint16_t off : cell_offsets)
        patches.push_back({root_offset + off, be32_bytes(root)});
    std::string self = (dir / "tree_self.db").string();
    check(corrupt_copy(path, self, patches), "self-referencing tree written");
    {
        Database db;
        check(open_database(self, db), "self-referencing tree opens");
        check(!scan_table(db.pager, root, [](int64_t, const std::vector<char> &) { return true; }),
              "scan of self-referencing tree fails");
    }

    // child beyond the end of the file
    std::string range = (dir / "tree_range.db").string();
    check(corrupt_copy(path, range, {{root_offset + 8, be32_bytes(page_count + 100)}}), "out-of-range tree written");
    {
        Database db;
        check(open_database(range, db), "out-of-range tree opens");
        bool found = false;
        std::vector<char> payload;
        check(!scan_table(db.pager, root, [](int64_t, const std::vector<char> &) { return true; }),
              "scan rejects a child past the last page");
        check(!find_row(db.pager, root, 5000, found, payload), "lookup rejects a child past the last page");
    }
}

static void test_corrupt_overflow(const fs::path &dir)
{
    std::string path = (dir / "overflow.db").string();
    bool created = exec_sql(path,
        "PRAGMA page_size = 1024;"
        "CREATE TABLE big (b BLOB);"
        "INSERT INTO big VALUES (zeroblob(50000));");
    check(created, "overflow fixture created");

    uint32_t root = 0, page_count = 0, page_size = 0, usable = 0, first_overflow = 0;
    uint64_t payload_size = 0;
    size_t cell = 0, size_len = 0, local = 0, local_start = 0;
    {
        Database db;
        TableInfo t;
        BtreePage page;
        if (!open_database(path, db) || !find_table(db, "big", t) || !load_btree_page(db.pager, t.rootpage, page) ||
            page.type != PageType::LeafTable || page.cell_count != 1)
        {
            check(false, "overflow fixture has a single leaf cell");
            return;
        }
        root = t.rootpage;
        page_count = db.pager.page_count;
        page_size = db.pager.header.page_size;
        usable = usable_page_size(db.pager.header);

        const std::vector<char> &data = *page.data;
        cell = page.cell_offsets[0];
        size_t pos = cell;
        uint64_t rowid = 0;
        bool parsed = read_varint(data.data(), data.size(), pos, payload_size);
        size_len = pos - cell;
        parsed = parsed && read_varint(data.data(), data.size(), pos, rowid);
        if (!parsed)
        {
            check(false, "overflow fixture cell header parses");
            return;
        }
        local_start = pos;
        local = local_payload_size(payload_size, usable, true);
        first_overflow = read_be32(data.data() + local_start + local);
    }
    check(size_len == 3 && local < payload_size && first_overflow > root, "payload spills to overflow pages");
    if (size_len != 3)
        return;
    uint64_t page_offset = uint64_t(root - 1) * page_size;

    std::string range = (dir / "overflow_range.db").string();
    check(corrupt_copy(path, range, {{page_offset + local_start + local, be32_bytes(page_count + 50)}}),
          "out-of-range overflow pointer written");
    {
        Database db;
        check(open_database(range, db), "out-of-range overflow database opens");
        check(!scan_table(db.pager, root, [](int64_t, const std::vector<char> &) { return true; }),
              "overflow pointer past the last page rejected");
    }

    // A larger declared size with the same local share, and an overflow page linked to itself
    uint64_t step = usable - 4;
    uint64_t forged = payload_size + step * ((2097151 - payload_size) / step);
    check(local_payload_size(forged, usable, true) == local, "forged size keeps the local share");
    std::string size_bytes(3, '\0');
    size_bytes[0] = static_cast<char>(0x80 | (forged >> 14));
    size_bytes[1] = static_cast<char>(0x80 | ((forged >> 7) & 0x7f));
    size_bytes[2] = static_cast<char>(forged & 0x7f);

    std::string loop = (dir / "overflow_loop.db").string();
    check(corrupt_copy(path, loop, {{page_offset + cell, size_bytes},
                                    {uint64_t(first_overflow - 1) * page_size, be32_bytes(first_overflow)}}),
          "looping overflow chain written");
    {
        Database db;
        check(open_database(loop, db), "looping overflow database opens");
        check(!scan_table(db.pager, root, [](int64_t, const std::vector<char> &) { return true; }),
              "overflow chain longer than the file rejected");

        ResultSet rs;
        check(!execute_sql(db, "SELECT b FROM big", rs), "query over looping chain fails");
    }
}

static void test_bad_files(const fs::path &dir)
{
    Database missing;
    check(!open_database((dir / "nope.db").string(), missing), "missing file rejected");

    std::string junk = (dir / "junk.db").string();
    {
        std::ofstream out(junk, std::ios::binary);
        out << std::string(4096, 'x');
    }
    Database bad;
    check(!open_database(junk, bad), "non-SQLite file rejected");

    std::string truncated = (dir / "short.db").string();
    {
        std::ofstream out(truncated, std::ios::binary);
        out.write("SQLite format 3", 16);
    }
    Database short_db;
    check(!open_database(truncated, short_db), "truncated header rejected");
}

int main()
{
    fs::path dir = fs::temp_directory_path() / "minisqlite_test_database";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir);

    test_fruits(dir);
    test_people(dir);
    test_utf16(dir, "UTF-16le", TextEncoding::UTF16LE);
    test_utf16(dir, "UTF-16be", TextEncoding::UTF16BE);
    test_altered(dir);
    test_corrupt_trees(dir);
    test_corrupt_overflow(dir);
    test_bad_files(dir);

    fs::remove_all(dir, ec);

    if (g_failures)
    {
        std::cerr << "❌ " << g_failures << " check(s) failed\n";
        return 1;
    }
    std::cout << "✅ all database checks passed\n";
    return 0;
}
