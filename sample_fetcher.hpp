#pragma once

#include <string>
#include <vector>

// One downloadable sample database
struct SampleDatabase {
    std::string name;  // plain file name written into the output directory
    std::string url;
};

// Manifest format: { "databases": [ { "name": "...", "url": "..." }, ... ] }
bool parse_sample_manifest(const std::string &text, std::vector<SampleDatabase> &samples);
bool load_sample_manifest(const std::string &path, std::vector<SampleDatabase> &samples);

// True when the file exists and starts with the SQLite header magic
bool is_sqlite_file(const std::string &path);

// Download url to dest via a temporary file; dest only appears if it is a SQLite database
bool download_database(const std::string &url, const std::string &dest);

// Fetch every manifest entry in turn. False if any download failed.
bool fetch_sample_databases(const std::string &manifest_path, const std::string &output_dir);
