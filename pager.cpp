#include "pager.hpp"
#include "log_util.hpp"

#include <filesystem>
#include <iostream>

bool open_pager(Pager &pager, const std::string &path)
{
    std::error_code ec;
    uint64_t size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        std::cerr << "❌ Cannot open database: " << path << " (" << ec.message() << ")\n";
        return false;
    }

    pager.file.open(path, std::ios::binary);
    if (!pager.file.is_open())
    {
        std::cerr << "❌ Cannot open database: " << path << "\n";
        return false;
    }

    char buf[DB_HEADER_SIZE];
    pager.file.read(buf, DB_HEADER_SIZE);
    if (!parse_db_header(buf, static_cast<size_t>(pager.file.gcount()), pager.header))
    {
        std::cerr << "❌ Failed to read header of " << path << "\n";
        return false;
    }

    pager.path = path;
    pager.file_size = size;
    pager.cache.clear();

    // The in-header size is only trusted when written by a version that maintains it
    uint32_t from_file = static_cast<uint32_t>(size / pager.header.page_size);
    if (pager.header.page_count != 0 &&
        pager.header.version_valid_for == pager.header.file_change_counter)
        pager.page_count = pager.header.page_count;
    else
        pager.page_count = from_file;

    if (g_verbose)
        std::cerr << "[DEBUG] opened " << path << ": page size " << pager.header.page_size
                  << ", " << pager.page_count << " pages\n";
    return true;
}

PageBuffer get_page(Pager &pager, uint32_t page_no)
{
    if (page_no == 0 || page_no > pager.page_count)
    {
        std::cerr << "❌ Page number out of range: " << page_no
                  << " (database has " << pager.page_count << " pages)\n";
        return nullptr;
    }

    auto it = pager.cache.find(page_no);
    if (it != pager.cache.end())
        return it->second;

    uint64_t offset = uint64_t(page_no - 1) * pager.header.page_size;
    auto data = std::make_shared<std::vector<char>>(pager.header.page_size);

    pager.file.clear();
    pager.file.seekg(static_cast<std::streamoff>(offset));
    pager.file.read(data->data(), static_cast<std::streamsize>(data->size()));
    if (static_cast<size_t>(pager.file.gcount()) != data->size())
    {
        std::cerr << "❌ Short read on page " << page_no << " of " << pager.path << "\n";
        return nullptr;
    }

    if (pager.cache.size() >= pager.max_cached_pages)
        pager.cache.clear();

    PageBuffer page = data;
    pager.cache.emplace(page_no, page);
    return page;
}
