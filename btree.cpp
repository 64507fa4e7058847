#include "btree.hpp"
#include "byte_utils.hpp"
#include "log_util.hpp"

#include <algorithm>
#include <iostream>

// Deeper than any valid b-tree; guards against cycles in corrupt files
static const int MAX_TREE_DEPTH = 64;

enum class WalkStatus {
    Continue,
    Stop,
    Error
};

bool is_leaf(PageType type)
{
    return type == PageType::LeafTable || type == PageType::LeafIndex;
}

bool is_table(PageType type)
{
    return type == PageType::LeafTable || type == PageType::InteriorTable;
}

bool load_btree_page(Pager &pager, uint32_t page_no, BtreePage &page)
{
    PageBuffer data = get_page(pager, page_no);
    if (!data)
        return false;

    const char *p = data->data();
    size_t hdr = page_no == 1 ? DB_HEADER_SIZE : 0;

    uint8_t raw_type = static_cast<uint8_t>(p[hdr]);
    if (raw_type != 2 && raw_type != 5 && raw_type != 10 && raw_type != 13)
    {
        std::cerr << "❌ Page " << page_no << " is not a b-tree page (type " << int(raw_type) << ")\n";
        return false;
    }

    BtreePage bp;
    bp.page_no = page_no;
    bp.type = static_cast<PageType>(raw_type);
    bp.first_freeblock = read_be16(p + hdr + 1);
    bp.cell_count = read_be16(p + hdr + 3);
    uint16_t content = read_be16(p + hdr + 5);
    bp.content_start = content == 0 ? 65536 : content;
    bp.fragmented_bytes = static_cast<uint8_t>(p[hdr + 7]);

    size_t header_size = 8;
    if (!is_leaf(bp.type))
    {
        bp.right_child = read_be32(p + hdr + 8);
        header_size = 12;
    }

    size_t ptr_array = hdr + header_size;
    size_t ptr_end = ptr_array + 2 * size_t(bp.cell_count);
    if (ptr_end > data->size())
    {
        std::cerr << "❌ Cell pointer array overruns page " << page_no
                  << " (" << bp.cell_count << " cells)\n";
        return false;
    }

    bp.cell_offsets.reserve(bp.cell_count);
    for (size_t i = 0; i < bp.cell_count; ++i)
    {
        uint16_t off = read_be16(p + ptr_array + 2 * i);
        if (off < ptr_end || off >= data->size())
        {
            std::cerr << "❌ Cell " << i << " of page " << page_no
                      << " points outside the cell content area (" << off << ")\n";
            return false;
        }
        bp.cell_offsets.push_back(off);
    }

    bp.data = data;
    page = std::move(bp);
    return true;
}

size_t local_payload_size(uint64_t payload_size, uint32_t usable_size, bool table_leaf)
{
    uint64_t u = usable_size;
    uint64_t max_local = table_leaf ? u - 35 : ((u - 12) * 64 / 255) - 23;
    if (payload_size <= max_local)
        return static_cast<size_t>(payload_size);

    uint64_t min_local = ((u - 12) * 32 / 255) - 23;
    uint64_t k = min_local + ((payload_size - min_local) % (u - 4));
    return static_cast<size_t>(k <= max_local ? k : min_local);
}

// Gather a payload that starts at pos on the page, following its overflow chain
static bool read_payload(Pager &pager, const BtreePage &page, size_t pos,
                         uint64_t payload_size, bool table_leaf, std::vector<char> &out)
{
    const std::vector<char> &data = *page.data;
    uint32_t usable = usable_page_size(pager.header);
    size_t local = local_payload_size(payload_size, usable, table_leaf);

    bool spills = local < payload_size;
    if (pos + local + (spills ? 4 : 0) > data.size())
    {
        std::cerr << "❌ Cell payload overruns page " << page.page_no << "\n";
        return false;
    }

    out.assign(data.begin() + pos, data.begin() + pos + local);
    if (!spills)
        return true;

    uint32_t overflow = read_be32(data.data() + pos + local);
    uint64_t remaining = payload_size - local;
    uint32_t hops = 0;

    while (remaining > 0)
    {
        if (overflow == 0 || ++hops > pager.page_count)
        {
            std::cerr << "❌ Broken overflow chain from page " << page.page_no << "\n";
            return false;
        }

        PageBuffer ov = get_page(pager, overflow);
        if (!ov)
            return false;

        size_t n = static_cast<size_t>(std::min<uint64_t>(remaining, usable - 4));
        out.insert(out.end(), ov->begin() + 4, ov->begin() + 4 + n);
        remaining -= n;
        overflow = read_be32(ov->data());
    }
    return true;
}

bool read_table_leaf_cell(Pager &pager, const BtreePage &page, size_t index, TableLeafCell &cell)
{
    const std::vector<char> &data = *page.data;
    size_t pos = page.cell_offsets[index];

    uint64_t payload_size = 0, rowid = 0;
    if (!read_varint(data.data(), data.size(), pos, payload_size) ||
        !read_varint(data.data(), data.size(), pos, rowid))
    {
        std::cerr << "❌ Truncated table leaf cell " << index << " on page " << page.page_no << "\n";
        return false;
    }

    cell.rowid = static_cast<int64_t>(rowid);
    return read_payload(pager, page, pos, payload_size, true, cell.payload);
}

bool read_table_interior_cell(const BtreePage &page, size_t index, TableInteriorCell &cell)
{
    const std::vector<char> &data = *page.data;
    size_t pos = page.cell_offsets[index];
    if (pos + 4 > data.size())
    {
        std::cerr << "❌ Truncated table interior cell " << index << " on page " << page.page_no << "\n";
        return false;
    }

    cell.left_child = read_be32(data.data() + pos);
    pos += 4;

    uint64_t rowid = 0;
    if (!read_varint(data.data(), data.size(), pos, rowid))
    {
        std::cerr << "❌ Truncated table interior cell " << index << " on page " << page.page_no << "\n";
        return false;
    }
    cell.rowid = static_cast<int64_t>(rowid);
    return true;
}

bool read_index_cell(Pager &pager, const BtreePage &page, size_t index, IndexCell &cell)
{
    const std::vector<char> &data = *page.data;
    size_t pos = page.cell_offsets[index];

    cell.left_child = 0;
    if (page.type == PageType::InteriorIndex)
    {
        if (pos + 4 > data.size())
        {
            std::cerr << "❌ Truncated index interior cell " << index << " on page " << page.page_no << "\n";
            return false;
        }
        cell.left_child = read_be32(data.data() + pos);
        pos += 4;
    }

    uint64_t payload_size = 0;
    if (!read_varint(data.data(), data.size(), pos, payload_size))
    {
        std::cerr << "❌ Truncated index cell " << index << " on page " << page.page_no << "\n";
        return false;
    }
    return read_payload(pager, page, pos, payload_size, false, cell.payload);
}

// visits counts pages loaded by one walk; a valid tree never needs more than page_count
static bool load_checked(Pager &pager, uint32_t page_no, int depth, uint64_t &visits,
                         bool want_table, BtreePage &page)
{
    if (depth > MAX_TREE_DEPTH)
    {
        std::cerr << "❌ B-tree deeper than " << MAX_TREE_DEPTH << " levels at page " << page_no << "\n";
        return false;
    }
    if (++visits > pager.page_count)
    {
        std::cerr << "❌ B-tree walk revisits pages (cycle at page " << page_no << ")\n";
        return false;
    }
    if (!load_btree_page(pager, page_no, page))
        return false;
    if (is_table(page.type) != want_table)
    {
        std::cerr << "❌ Page " << page_no << " is not a " << (want_table ? "table" : "index")
                  << " b-tree page\n";
        return false;
    }
    return true;
}

static WalkStatus walk_table(Pager &pager, uint32_t page_no, const RowVisitor &visit, int depth,
                             uint64_t &visits)
{
    BtreePage page;
    if (!load_checked(pager, page_no, depth, visits, true, page))
        return WalkStatus::Error;

    if (page.type == PageType::LeafTable)
    {
        TableLeafCell cell;
        for (size_t i = 0; i < page.cell_count; ++i)
        {
            if (!read_table_leaf_cell(pager, page, i, cell))
                return WalkStatus::Error;
            if (!visit(cell.rowid, cell.payload))
                return WalkStatus::Stop;
        }
        return WalkStatus::Continue;
    }

    TableInteriorCell cell;
    for (size_t i = 0; i < page.cell_count; ++i)
    {
        if (!read_table_interior_cell(page, i, cell))
            return WalkStatus::Error;
        WalkStatus s = walk_table(pager, cell.left_child, visit, depth + 1, visits);
        if (s != WalkStatus::Continue)
            return s;
    }
    return walk_table(pager, page.right_child, visit, depth + 1, visits);
}

bool scan_table(Pager &pager, uint32_t root, const RowVisitor &visit)
{
    if (g_verbose)
        std::cerr << "[DEBUG] table scan from root page " << root << "\n";
    uint64_t visits = 0;
    return walk_table(pager, root, visit, 0, visits) != WalkStatus::Error;
}

static bool count_rows(Pager &pager, uint32_t page_no, uint64_t &count, int depth, uint64_t &visits)
{
    BtreePage page;
    if (!load_checked(pager, page_no, depth, visits, true, page))
        return false;

    if (page.type == PageType::LeafTable)
    {
        count += page.cell_count;
        return true;
    }

    TableInteriorCell cell;
    for (size_t i = 0; i < page.cell_count; ++i)
    {
        if (!read_table_interior_cell(page, i, cell) ||
            !count_rows(pager, cell.left_child, count, depth + 1, visits))
            return false;
    }
    return count_rows(pager, page.right_child, count, depth + 1, visits);
}

bool count_table_rows(Pager &pager, uint32_t root, uint64_t &count)
{
    count = 0;
    uint64_t visits = 0;
    return count_rows(pager, root, count, 0, visits);
}

// Rowid of leaf cell i without assembling its payload
static bool leaf_rowid_at(const BtreePage &page, size_t index, int64_t &rowid)
{
    const std::vector<char> &data = *page.data;
    size_t pos = page.cell_offsets[index];
    uint64_t payload_size = 0, raw = 0;
    if (!read_varint(data.data(), data.size(), pos, payload_size) ||
        !read_varint(data.data(), data.size(), pos, raw))
    {
        std::cerr << "❌ Truncated table leaf cell " << index << " on page " << page.page_no << "\n";
        return false;
    }
    rowid = static_cast<int64_t>(raw);
    return true;
}

bool find_row(Pager &pager, uint32_t root, int64_t rowid, bool &found,
              std::vector<char> &payload)
{
    found = false;
    uint32_t page_no = root;
    uint64_t visits = 0;

    for (int depth = 0;; ++depth)
    {
        BtreePage page;
        if (!load_checked(pager, page_no, depth, visits, true, page))
            return false;

        // first cell whose key is >= rowid
        size_t lo = 0, hi = page.cell_count;
        while (lo < hi)
        {
            size_t mid = lo + (hi - lo) / 2;
            int64_t key = 0;
            if (page.type == PageType::LeafTable)
            {
                if (!leaf_rowid_at(page, mid, key))
                    return false;
            }
            else
            {
                TableInteriorCell cell;
                if (!read_table_interior_cell(page, mid, cell))
                    return false;
                key = cell.rowid;
            }

            if (key < rowid)
                lo = mid + 1;
            else
                hi = mid;
        }

        if (page.type == PageType::LeafTable)
        {
            if (lo == page.cell_count)
                return true;

            TableLeafCell cell;
            if (!read_table_leaf_cell(pager, page, lo, cell))
                return false;
            if (cell.rowid == rowid)
            {
                found = true;
                payload = std::move(cell.payload);
            }
            return true;
        }

        if (lo == page.cell_count)
        {
            page_no = page.right_child;
        }
        else
        {
            TableInteriorCell cell;
            if (!read_table_interior_cell(page, lo, cell))
                return false;
            page_no = cell.left_child;
        }
    }
}

static WalkStatus walk_index(Pager &pager, uint32_t page_no, const IndexVisitor &visit, int depth,
                             uint64_t &visits)
{
    BtreePage page;
    if (!load_checked(pager, page_no, depth, visits, false, page))
        return WalkStatus::Error;

    bool leaf = page.type == PageType::LeafIndex;
    IndexCell cell;
    for (size_t i = 0; i < page.cell_count; ++i)
    {
        if (!read_index_cell(pager, page, i, cell))
            return WalkStatus::Error;

        if (!leaf)
        {
            WalkStatus s = walk_index(pager, cell.left_child, visit, depth + 1, visits);
            if (s != WalkStatus::Continue)
                return s;
        }
        // interior index cells are entries too
        if (!visit(cell.payload))
            return WalkStatus::Stop;
    }

    if (leaf)
        return WalkStatus::Continue;
    return walk_index(pager, page.right_child, visit, depth + 1, visits);
}

bool scan_index(Pager &pager, uint32_t root, const IndexVisitor &visit)
{
    if (g_verbose)
        std::cerr << "[DEBUG] index scan from root page " << root << "\n";
    uint64_t visits = 0;
    return walk_index(pager, root, visit, 0, visits) != WalkStatus::Error;
}

// Decode an index entry: first column for comparison, last column is the rowid
static bool index_entry(Pager &pager, const IndexCell &cell, uint32_t page_no,
                        Value &first, int64_t &rowid)
{
    std::vector<Value> values;
    if (!decode_record(cell.payload, pager.header.text_encoding, values))
        return false;
    if (values.size() < 2 || values.back().type != ValueType::Integer)
    {
        std::cerr << "❌ Malformed index entry on page " << page_no << "\n";
        return false;
    }
    first = values.front();
    rowid = values.back().integer;
    return true;
}

static WalkStatus search_equal(Pager &pager, uint32_t page_no, const Value &key,
                               std::vector<int64_t> &rowids, int depth, uint64_t &visits)
{
    BtreePage page;
    if (!load_checked(pager, page_no, depth, visits, false, page))
        return WalkStatus::Error;

    bool leaf = page.type == PageType::LeafIndex;
    IndexCell cell;
    Value first;
    int64_t rowid = 0;

    for (size_t i = 0; i < page.cell_count; ++i)
    {
        if (!read_index_cell(pager, page, i, cell) ||
            !index_entry(pager, cell, page.page_no, first, rowid))
            return WalkStatus::Error;

        int c = compare_values(key, first, pager.header.text_encoding);
        if (c > 0)
            continue;

        if (!leaf)
        {
            WalkStatus s = search_equal(pager, cell.left_child, key, rowids, depth + 1, visits);
            if (s != WalkStatus::Continue)
                return s;
        }
        // everything from here on sorts after the key
        if (c < 0)
            return WalkStatus::Stop;

        rowids.push_back(rowid);
    }

    if (leaf)
        return WalkStatus::Continue;
    return search_equal(pager, page.right_child, key, rowids, depth + 1, visits);
}

bool search_index_equal(Pager &pager, uint32_t root, const Value &key,
                        std::vector<int64_t> &rowids)
{
    rowids.clear();
    if (g_verbose)
        std::cerr << "[DEBUG] index search from root page " << root << " for '"
                  << format_value(key) << "'\n";
    uint64_t visits = 0;
    return search_equal(pager, root, key, rowids, 0, visits) != WalkStatus::Error;
}
