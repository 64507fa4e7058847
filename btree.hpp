#pragma once

#include <cstdint>
#include <functional>
#include <vector>

#include "pager.hpp"
#include "record.hpp"

enum class PageType : uint8_t {
    InteriorIndex = 2,
    InteriorTable = 5,
    LeafIndex = 10,
    LeafTable = 13
};

// A decoded b-tree page header plus its cell pointer array
struct BtreePage {
    uint32_t page_no = 0;
    PageType type = PageType::LeafTable;
    uint16_t first_freeblock = 0;
    uint16_t cell_count = 0;
    uint32_t content_start = 0;   // 0 in the file means 65536
    uint8_t fragmented_bytes = 0;
    uint32_t right_child = 0;     // interior pages only
    std::vector<uint16_t> cell_offsets;
    PageBuffer data;
};

struct TableLeafCell {
    int64_t rowid = 0;
    std::vector<char> payload;
};

struct TableInteriorCell {
    uint32_t left_child = 0;
    int64_t rowid = 0;
};

// Leaf and interior index cells; left_child is 0 on leaves
struct IndexCell {
    uint32_t left_child = 0;
    std::vector<char> payload;
};

bool is_leaf(PageType type);
bool is_table(PageType type);

bool load_btree_page(Pager &pager, uint32_t page_no, BtreePage &page);

// Bytes of a payload of the given size kept on the b-tree page itself
size_t local_payload_size(uint64_t payload_size, uint32_t usable_size, bool table_leaf);

bool read_table_leaf_cell(Pager &pager, const BtreePage &page, size_t index, TableLeafCell &cell);
bool read_table_interior_cell(const BtreePage &page, size_t index, TableInteriorCell &cell);
bool read_index_cell(Pager &pager, const BtreePage &page, size_t index, IndexCell &cell);

// Visitors return false to stop the walk early (not an error)
using RowVisitor = std::function<bool(int64_t rowid, const std::vector<char> &payload)>;
using IndexVisitor = std::function<bool(const std::vector<char> &payload)>;

// In-order walk of every row of a table b-tree
bool scan_table(Pager &pager, uint32_t root, const RowVisitor &visit);

// Row count from leaf cell counts, no payload decoding
bool count_table_rows(Pager &pager, uint32_t root, uint64_t &count);

// Binary search by rowid. found is false when no such row exists.
bool find_row(Pager &pager, uint32_t root, int64_t rowid, bool &found,
              std::vector<char> &payload);

// In-order walk of every entry of an index b-tree
bool scan_index(Pager &pager, uint32_t root, const IndexVisitor &visit);

// Rowids of all index entries whose first column equals key, in index order
bool search_index_equal(Pager &pager, uint32_t root, const Value &key,
                        std::vector<int64_t> &rowids);
