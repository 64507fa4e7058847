#include <iostream>
#include <string>
#include <vector>

#include "database.hpp"
#include "log_util.hpp"
#include "output.hpp"
#include "query.hpp"
#include "sample_fetcher.hpp"

static void print_usage(const char *prog)
{
    std::cerr << "Usage:\n"
              << "  " << prog << " [--json] [--verbose] <database> .dbinfo|.tables|.schema|.indexes\n"
              << "  " << prog << " [--json] [--verbose] <database> \"SELECT ...\"\n"
              << "  " << prog << " fetch-samples [manifest.json] [output_dir]\n";
}

static int run_fetch(const std::vector<std::string> &args)
{
    std::string manifest = args.size() > 1 ? args[1] : "samples.json";
    std::string output_dir = args.size() > 2 ? args[2] : ".";
    if (!fetch_sample_databases(manifest, output_dir))
    {
        std::cerr << "Fetching sample databases failed.\n";
        return 1;
    }
    return 0;
}

int main(int argc, char *argv[])
{
    bool json_mode = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--json")
            json_mode = true;
        else if (arg == "--verbose")
            g_verbose = true;
        else
            args.push_back(arg);
    }

    if (!args.empty() && args[0] == "fetch-samples")
        return run_fetch(args);

    if (args.size() < 2)
    {
        std::cerr << (args.empty() ? "Missing <database> and <command>.\n" : "Missing <command>.\n");
        print_usage(argv[0]);
        return 1;
    }

    std::string db_path = args[0];
    std::string command = args[1];

    if (!command.empty() && command[0] == '.' &&
        command != ".dbinfo" && command != ".tables" && command != ".schema" && command != ".indexes")
    {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    }

    Database db;
    if (!open_database(db_path, db))
        return 1;

    if (command == ".dbinfo")
    {
        if (json_mode)
            std::cout << dbinfo_to_json(db).dump(2) << "\n";
        else
            print_dbinfo(db, std::cout);
    }
    else if (command == ".tables")
    {
        print_tables(db, std::cout);
    }
    else if (command == ".schema")
    {
        print_schema(db, std::cout);
    }
    else if (command == ".indexes")
    {
        print_indexes(db, std::cout);
    }
    else
    {
        ResultSet rs;
        if (!execute_sql(db, command, rs))
            return 1;
        if (json_mode)
            print_json(rs, std::cout);
        else
            print_list(rs, std::cout);
    }

    return 0;
}
