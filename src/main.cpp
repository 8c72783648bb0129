#include <iostream>
#include <string>
#include <cstdlib>
#include "api/client_registry.hpp"
#include "api/http_client.hpp"
#include "cache/retrieval_cache.hpp"
#include "config/config_parser.hpp"
#include "errors.hpp"
#include "io/content_hash.hpp"
#include "io/tabular_reader.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
using json = nlohmann::json;

using namespace tabfetch;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitOther = 1;
constexpr int kExitNetwork = 2;
constexpr int kExitCacheMiss = 3;
constexpr int kExitDecode = 4;

struct CLIArgs {
    std::string url;
    std::string filename;
    std::string kind = "file";
    std::string config_path;
    std::string client;
    std::string fallback_dir;
    std::string saved_dir;
    std::string temp_dir;
    std::string log_level;
    bool save = false;
    bool use_saved = false;
    bool fallback = false;
    bool rows = false;
    bool dict = false;
    int header_row = 1;
    bool hash = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "tabfetch v" << TABFETCH_VERSION << "\n\n";
    std::cerr << "Usage: " << program_name << " --url <url> [options]\n\n";
    std::cerr << "Retrieval options:\n";
    std::cerr << "  --url <url>                 URL or local path to retrieve\n";
    std::cerr << "  --filename <name>           File name for saved copies (default: from URL)\n";
    std::cerr << "  --kind <kind>               file, text, json or yaml (default: file)\n";
    std::cerr << "  --config <path>             JSON configuration file\n";
    std::cerr << "  --client <name>             Named client from the configuration (default: default)\n\n";
    std::cerr << "Cache options:\n";
    std::cerr << "  --fallback-dir <dir>        Static copies used when the download fails\n";
    std::cerr << "  --saved-dir <dir>           Folder for saved copies\n";
    std::cerr << "  --temp-dir <dir>            Folder for downloads (default: TEMP_DIR or system temp)\n";
    std::cerr << "  --save                      Save downloads to the saved folder\n";
    std::cerr << "  --use-saved                 Read only from the saved folder\n";
    std::cerr << "  --fallback                  Use the fallback folder if the download fails\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --rows                      Print table rows as JSON lines\n";
    std::cerr << "  --dict                      With --rows, print rows as objects\n";
    std::cerr << "  --header-row <n>            With --rows, 1-based header row (default: 1)\n";
    std::cerr << "  --hash                      With file kind, print the MD5 of the file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Exit codes: 0 success, 2 network error, 3 cache miss, 4 decode error, 1 other\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  " << program_name << " --url https://example.org/data.csv --rows --dict\n";
    std::cerr << "  " << program_name << " --url https://example.org/config.json --kind json \\\n";
    std::cerr << "      --saved-dir saved --save\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--url" && i + 1 < argc) {
            args.url = argv[++i];
        } else if (arg == "--filename" && i + 1 < argc) {
            args.filename = argv[++i];
        } else if (arg == "--kind" && i + 1 < argc) {
            args.kind = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--client" && i + 1 < argc) {
            args.client = argv[++i];
        } else if (arg == "--fallback-dir" && i + 1 < argc) {
            args.fallback_dir = argv[++i];
        } else if (arg == "--saved-dir" && i + 1 < argc) {
            args.saved_dir = argv[++i];
        } else if (arg == "--temp-dir" && i + 1 < argc) {
            args.temp_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--header-row" && i + 1 < argc) {
            args.header_row = std::stoi(argv[++i]);
        } else if (arg == "--save") {
            args.save = true;
        } else if (arg == "--use-saved") {
            args.use_saved = true;
        } else if (arg == "--fallback") {
            args.fallback = true;
        } else if (arg == "--rows") {
            args.rows = true;
        } else if (arg == "--dict") {
            args.dict = true;
        } else if (arg == "--hash") {
            args.hash = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }

    if (args.url.empty()) {
        std::cerr << "Error: --url is required\n\n";
        return false;
    }
    return true;
}

void print_rows(HttpClient& client, const std::string& path, const CLIArgs& args) {
    TabularReader reader(client);
    TabularOptions options;
    options.header = HeaderSpec::row(args.header_row);

    if (args.dict) {
        for (const RowDict& row : reader.open_dict_rows(path, options)) {
            std::cout << json(row).dump() << "\n";
        }
    } else {
        options.include_headers = true;
        for (const Row& row : reader.open_rows(path, options)) {
            std::cout << json(row).dump() << "\n";
        }
    }
}

int run(const CLIArgs& args) {
    FetchConfig config;
    if (!args.config_path.empty()) {
        config = parse_fetch_config_from_file(args.config_path);
    }

    RetrievalPolicy& policy = config.retrieval;
    if (!args.fallback_dir.empty()) policy.fallback_dir = args.fallback_dir;
    if (!args.saved_dir.empty()) policy.saved_dir = args.saved_dir;
    if (!args.temp_dir.empty()) policy.temp_dir = args.temp_dir;
    if (args.save) policy.save = true;
    if (args.use_saved) policy.use_saved = true;

    ClientRegistry registry;
    registry.generate(config.client, config.clients);
    if (!args.client.empty() && !registry.contains(args.client)) {
        Logger::get_instance().log_warning("Unknown client, using the default", {{"client", args.client}});
    }
    HttpClient& client = registry.get(args.client);
    RetrievalCache cache(client, policy);

    RetrievalKind kind = args.rows ? RetrievalKind::File : string_to_kind(args.kind);
    RetrievalResult result = cache.fetch(args.url, args.filename, kind, args.fallback);

    if (args.rows) {
        print_rows(client, result.path, args);
        return kExitOk;
    }

    switch (result.kind) {
        case RetrievalKind::File:
            if (args.hash) {
                std::cout << md5_file(result.path) << "  " << result.path << "\n";
            } else {
                std::cout << result.path << "\n";
            }
            break;
        case RetrievalKind::Text:
            std::cout << result.text;
            break;
        case RetrievalKind::Json:
            std::cout << result.json.dump(2) << "\n";
            break;
        case RetrievalKind::Yaml: {
            YAML::Emitter out;
            out << result.yaml;
            std::cout << out.c_str() << "\n";
            break;
        }
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return kExitOther;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid argument value: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return kExitOther;
    }

    if (args.help) {
        print_usage(argv[0]);
        return kExitOk;
    }

    LoggerConfig log_config;
    log_config.enable_json = false;
    if (!args.log_level.empty()) {
        log_config.min_level = string_to_level(args.log_level);
    }
    Logger::get_instance().configure(log_config);

    try {
        return run(args);
    } catch (const NetworkError& e) {
        std::cerr << "Network error: " << e.what() << "\n";
        return kExitNetwork;
    } catch (const CacheMissError& e) {
        std::cerr << "Cache miss: " << e.what() << "\n";
        return kExitCacheMiss;
    } catch (const DecodeError& e) {
        std::cerr << "Decode error: " << e.what() << "\n";
        return kExitDecode;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitOther;
    }
}
