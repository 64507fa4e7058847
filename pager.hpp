#pragma once

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "db_header.hpp"

// Immutable page bytes; stays valid after the pager drops it from its cache
using PageBuffer = std::shared_ptr<const std::vector<char>>;

struct Pager {
    std::string path;
    std::ifstream file;
    DbHeader header;
    uint64_t file_size = 0;
    uint32_t page_count = 0;
    size_t max_cached_pages = 2048;
    std::unordered_map<uint32_t, PageBuffer> cache;
};

// Open the file read-only and decode its header
bool open_pager(Pager &pager, const std::string &path);

// Page n (1-based). Returns nullptr after reporting on stderr.
PageBuffer get_page(Pager &pager, uint32_t page_no);
