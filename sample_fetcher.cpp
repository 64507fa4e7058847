#include "sample_fetcher.hpp"
#include "db_header.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

static bool valid_file_name(const std::string &name)
{
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

bool parse_sample_manifest(const std::string &text, std::vector<SampleDatabase> &samples)
{
    samples.clear();
    try
    {
        json j = json::parse(text);
        if (!j.is_object() || !j.contains("databases") || !j["databases"].is_array())
        {
            std::cerr << "❌ Manifest must be an object with a \"databases\" array\n";
            return false;
        }

        for (const auto &el : j["databases"])
        {
            SampleDatabase s;
            s.name = el.at("name").get<std::string>();
            s.url = el.at("url").get<std::string>();
            if (!valid_file_name(s.name) || s.url.empty())
            {
                std::cerr << "❌ Invalid manifest entry: " << el.dump() << "\n";
                return false;
            }
            samples.push_back(s);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "❌ Failed to parse manifest: " << e.what() << "\n";
        return false;
    }
    return true;
}

bool load_sample_manifest(const std::string &path, std::vector<SampleDatabase> &samples)
{
    std::ifstream in(path);
    if (!in)
    {
        std::cerr << "❌ Failed to open manifest: " << path << "\n";
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_sample_manifest(ss.str(), samples);
}

bool is_sqlite_file(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    char buf[DB_HEADER_SIZE];
    in.read(buf, sizeof(buf));
    return has_sqlite_magic(buf, static_cast<size_t>(in.gcount()));
}

static size_t write_to_stream(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    std::ofstream *out = static_cast<std::ofstream *>(userdata);
    out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return out->good() ? size * nmemb : 0;
}

bool download_database(const std::string &url, const std::string &dest)
{
    std::string part = dest + ".part";
    std::ofstream out(part, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        std::cerr << "❌ Cannot write " << part << "\n";
        return false;
    }

    std::error_code ec;
    CURL *curl = curl_easy_init();
    if (!curl)
    {
        std::cerr << "❌ curl_easy_init failed\n";
        out.close();
        std::filesystem::remove(part, ec);
        return false;
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "minisqlite-fetch/1.0");
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out);

    CURLcode rc = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    out.close();

    if (rc != CURLE_OK)
    {
        std::cerr << "❌ Download failed: " << url << " ("
                  << (errbuf[0] ? errbuf : curl_easy_strerror(rc)) << ")\n";
        std::filesystem::remove(part, ec);
        return false;
    }
    if (!is_sqlite_file(part))
    {
        std::cerr << "❌ Downloaded file is not a SQLite database: " << url << "\n";
        std::filesystem::remove(part, ec);
        return false;
    }

    std::filesystem::rename(part, dest, ec);
    if (ec)
    {
        std::cerr << "❌ Cannot move " << part << " to " << dest << ": " << ec.message() << "\n";
        std::filesystem::remove(part, ec);
        return false;
    }
    return true;
}

bool fetch_sample_databases(const std::string &manifest_path, const std::string &output_dir)
{
    std::vector<SampleDatabase> samples;
    if (!load_sample_manifest(manifest_path, samples))
        return false;

    std::error_code ec;
    std::filesystem::create_directories(output_dir, ec);
    if (ec)
    {
        std::cerr << "❌ Cannot create output directory " << output_dir << ": " << ec.message() << "\n";
        return false;
    }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        std::cerr << "❌ curl_global_init failed\n";
        return false;
    }

    size_t failures = 0;
    for (const auto &s : samples)
    {
        std::filesystem::path dest = std::filesystem::path(output_dir) / s.name;
        std::cout << "[FETCH] " << s.url << " -> " << dest.string() << "\n";
        if (download_database(s.url, dest.string()))
            std::cout << "[FETCH] " << s.name << " ✅\n";
        else
            ++failures;
    }

    curl_global_cleanup();

    if (failures)
    {
        std::cerr << "❌ " << failures << " of " << samples.size() << " downloads failed\n";
        return false;
    }
    std::cout << "✅ Fetched " << samples.size() << " sample databases into " << output_dir << "\n";
    return true;
}
