// kosha: command-line client for koshad
//
// Usage: kosha <command> [args] [options]
//
// Commands:
//   index ID TEXT           Embed TEXT and upsert it as ID
//   index ID --vector CSV   Upsert a raw vector
//   delete ID               Remove a record
//   get ID                  Show a record
//   search QUERY            Nearest records to QUERY (or --vector CSV)
//   ingest FILE.jsonl       Bulk index {"id","content","payload"?,"tags"?} lines
//   rebuild                 Build a fresh index generation
//   checkpoint              Snapshot and truncate the WAL
//   stats | health          Daemon state
//   methods                 List RPC methods
//   shutdown                Stop the daemon

#include <kosha/config.hpp>
#include <kosha/socket_client.hpp>
#include <kosha/version.hpp>
#include <nlohmann/json.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace kosha;
using json = nlohmann::json;

namespace {

void print_usage(const char* prog) {
    std::cerr << "kosha v" << KOSHA_VERSION << " - embedding index client\n\n"
              << "Usage: " << prog << " <command> [args] [options]\n\n"
              << "Commands:\n"
              << "  index ID TEXT          Embed TEXT and upsert it as ID\n"
              << "  index ID --vector CSV  Upsert a raw vector\n"
              << "  delete ID              Remove a record\n"
              << "  get ID                 Show a record (--with-vector to include it)\n"
              << "  search QUERY           Nearest records (or --vector CSV)\n"
              << "  ingest FILE.jsonl      Bulk index JSON lines\n"
              << "  rebuild                Build a fresh index generation\n"
              << "  checkpoint             Snapshot and truncate the WAL\n"
              << "  stats                  Engine and daemon counters\n"
              << "  health                 Liveness and index state\n"
              << "  methods                List RPC methods\n"
              << "  shutdown               Stop the daemon\n\n"
              << "Options:\n"
              << "  --socket PATH          Daemon socket (default: derived from data dir)\n"
              << "  --data-dir PATH        Data dir of the daemon to reach\n"
              << "  --payload TEXT         Payload for index\n"
              << "  --vector CSV           index/search: raw vector instead of text\n"
              << "  --tag T                Tag for index; required tag for search (repeatable)\n"
              << "  --any-tag T            search: at least one of these tags\n"
              << "  --not-tag T            search: none of these tags\n"
              << "  --prefix P             search: id prefix\n"
              << "  -k N                   search: results (default 10)\n"
              << "  --effort N             search: beam width\n"
              << "  --timeout MS           search: time budget\n"
              << "  --exact                search: brute-force scan\n"
              << "  --json                 Print raw JSON responses\n";
}

bool parse_csv_vector(const std::string& text, json& out) {
    out = json::array();
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        char* end = nullptr;
        errno = 0;
        float v = std::strtof(item.c_str(), &end);
        if (errno != 0 || end == item.c_str()) return false;
        while (*end == ' ') ++end;
        if (*end != '\0') return false;
        out.push_back(v);
    }
    return !out.empty();
}

bool parse_int(const std::string& text, int64_t& out) {
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    out = v;
    return true;
}

struct Options {
    std::string socket_path;
    std::string data_dir;
    std::string payload;
    std::string vector_csv;
    std::string prefix;
    std::vector<std::string> tags;
    std::vector<std::string> any_tags;
    std::vector<std::string> not_tags;
    std::vector<std::string> positional;
    int64_t k = 10;
    int64_t effort = 0;
    int64_t timeout_ms = 0;
    bool exact = false;
    bool include_vector = false;
    bool json_output = false;
};

// Returns an error message, empty on success
std::string parse_options(int argc, char* argv[], int start, Options& opt) {
    for (int i = start; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        auto value = [&]() { return std::string(argv[++i]); };

        if (arg == "--json") {
            opt.json_output = true;
        } else if (arg == "--exact") {
            opt.exact = true;
        } else if (arg == "--socket" && has_value) {
            opt.socket_path = value();
        } else if (arg == "--data-dir" && has_value) {
            opt.data_dir = value();
        } else if (arg == "--payload" && has_value) {
            opt.payload = value();
        } else if (arg == "--with-vector") {
            opt.include_vector = true;
        } else if (arg == "--vector" && has_value) {
            opt.vector_csv = value();
        } else if (arg == "--tag" && has_value) {
            opt.tags.push_back(value());
        } else if (arg == "--any-tag" && has_value) {
            opt.any_tags.push_back(value());
        } else if (arg == "--not-tag" && has_value) {
            opt.not_tags.push_back(value());
        } else if (arg == "--prefix" && has_value) {
            opt.prefix = value();
        } else if ((arg == "-k" || arg == "--k") && has_value) {
            if (!parse_int(value(), opt.k)) return "-k expects an integer";
        } else if (arg == "--effort" && has_value) {
            if (!parse_int(value(), opt.effort)) return "--effort expects an integer";
        } else if (arg == "--timeout" && has_value) {
            if (!parse_int(value(), opt.timeout_ms)) return "--timeout expects milliseconds";
        } else if (arg.size() > 1 && arg[0] == '-' && !std::isdigit(static_cast<unsigned char>(arg[1]))) {
            return "Unknown option: " + arg;
        } else {
            opt.positional.push_back(arg);
        }
    }
    return "";
}

std::string resolve_socket(const Options& opt) {
    if (!opt.socket_path.empty()) return opt.socket_path;

    EngineConfig config;
    Status env = config.merge_env();
    if (!env) std::cerr << "Warning: " << env.error().message << "\n";
    if (!opt.data_dir.empty()) config.data_dir = opt.data_dir;

    // Same normalization as koshad so both derive the same path
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(config.data_dir, ec);
    if (!ec) config.data_dir = absolute.lexically_normal().string();
    return config.socket_path();
}

// Print the error part of a response; returns the process exit code
int report(const json& response, bool json_output) {
    if (json_output) {
        std::cout << response.dump(2) << "\n";
        return response.contains("error") ? 1 : 0;
    }
    if (response.contains("error")) {
        const json& e = response["error"];
        std::cerr << "Error";
        if (e.contains("data") && e["data"].contains("kind")) {
            std::cerr << " (" << e["data"]["kind"].get<std::string>() << ")";
        }
        std::cerr << ": " << e.value("message", std::string("unknown")) << "\n";
        return 1;
    }
    return -1;  // Caller formats the result
}

void print_hits(const json& result) {
    const json& hits = result["hits"];
    if (hits.empty()) {
        std::cout << "No results\n";
    }
    size_t rank = 1;
    for (const auto& h : hits) {
        std::cout << std::setw(3) << rank++ << ". " << std::fixed << std::setprecision(4)
                  << h.value("score", 0.0) << "  " << h.value("id", std::string());
        if (!h["tags"].empty()) {
            std::cout << "  [";
            bool first = true;
            for (const auto& t : h["tags"]) {
                std::cout << (first ? "" : ", ") << t.get<std::string>();
                first = false;
            }
            std::cout << "]";
        }
        std::cout << "\n";
        std::string payload = h.value("payload", std::string());
        if (!payload.empty()) {
            if (payload.size() > 120) payload = payload.substr(0, 117) + "...";
            std::cout << "       " << payload << "\n";
        }
    }
    if (result.value("partial", false)) {
        std::cout << "(partial: budget exhausted)\n";
    }
    const json& stats = result["stats"];
    std::cout << "generation " << result.value("generation", 0) << ", visited "
              << stats.value("visited", 0) << ", "
              << stats.value("elapsed_us", 0) << "us\n";
}

int run_ingest(SocketClient& client, const std::string& path, bool json_output) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Error: cannot read " << path << "\n";
        return 1;
    }

    size_t line_no = 0, indexed = 0, unchanged = 0, malformed = 0, failed = 0;
    std::string line;
    while (std::getline(in, line)) {
        line_no++;
        if (line.empty() || line.find_first_not_of(" \t\r") == std::string::npos) continue;

        json doc = json::parse(line, nullptr, false);
        if (doc.is_discarded() || !doc.is_object() ||
            !doc.contains("id") || !doc["id"].is_string() ||
            !doc.contains("content") || !doc["content"].is_string()) {
            malformed++;
            std::cerr << path << ":" << line_no << ": skipped malformed line\n";
            continue;
        }

        json params = {{"id", doc["id"]}, {"content", doc["content"]}};
        if (doc.contains("payload")) params["payload"] = doc["payload"];
        if (doc.contains("tags")) params["tags"] = doc["tags"];

        auto response = client.call("index_document", params);
        if (!response) {
            std::cerr << "Error: " << client.last_error() << "\n";
            return 1;
        }
        if (response->contains("error")) {
            failed++;
            std::cerr << path << ":" << line_no << ": "
                      << (*response)["error"].value("message", std::string("failed")) << "\n";
            continue;
        }
        if ((*response)["result"].value("outcome", std::string()) == "unchanged") {
            unchanged++;
        } else {
            indexed++;
        }
    }

    if (json_output) {
        std::cout << json{{"indexed", indexed}, {"unchanged", unchanged},
                          {"malformed", malformed}, {"failed", failed}}.dump(2) << "\n";
    } else {
        std::cout << "Ingested " << path << ": " << indexed << " indexed, " << unchanged
                  << " unchanged, " << malformed << " malformed, " << failed << " failed\n";
    }
    return failed > 0 ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "--version" || command == "version") {
        std::cout << "kosha " << KOSHA_VERSION << "\n";
        return 0;
    }

    Options opt;
    std::string err = parse_options(argc, argv, 2, opt);
    if (!err.empty()) {
        std::cerr << "Error: " << err << "\n";
        return 2;
    }
    auto& args = opt.positional;

    SocketClient client(resolve_socket(opt));

    if (command == "shutdown") {
        if (!client.connect()) {
            std::cerr << "No daemon running at " << client.socket_path() << "\n";
            return 1;
        }
        if (!client.request_shutdown()) {
            std::cerr << "Failed to request shutdown: " << client.last_error() << "\n";
            return 1;
        }
        std::cout << "Daemon shutdown requested\n";
        if (client.wait_for_socket_gone(5000)) {
            std::cout << "Daemon stopped\n";
        }
        return 0;
    }

    if (!client.connect_checked()) {
        std::cerr << "Error: " << client.last_error() << "\n";
        return 1;
    }

    if (command == "ingest") {
        if (args.size() != 1) {
            std::cerr << "Usage: kosha ingest FILE.jsonl\n";
            return 2;
        }
        return run_ingest(client, args[0], opt.json_output);
    }

    std::string method;
    json params = json::object();

    if (command == "index") {
        if (args.empty() || (opt.vector_csv.empty() && args.size() != 2)) {
            std::cerr << "Usage: kosha index ID TEXT | kosha index ID --vector CSV\n";
            return 2;
        }
        params["id"] = args[0];
        if (!opt.payload.empty()) params["payload"] = opt.payload;
        if (!opt.tags.empty()) params["tags"] = opt.tags;
        if (!opt.vector_csv.empty()) {
            method = "index_vector";
            if (!parse_csv_vector(opt.vector_csv, params["vector"])) {
                std::cerr << "Error: --vector expects comma-separated numbers\n";
                return 2;
            }
        } else {
            method = "index_document";
            params["content"] = args[1];
        }
    } else if (command == "delete" || command == "get") {
        if (args.size() != 1) {
            std::cerr << "Usage: kosha " << command << " ID\n";
            return 2;
        }
        method = command == "delete" ? "delete_document" : "get_document";
        params["id"] = args[0];
        if (command == "get" && opt.include_vector) params["include_vector"] = true;
    } else if (command == "search") {
        method = "search";
        if (!opt.vector_csv.empty()) {
            if (!parse_csv_vector(opt.vector_csv, params["vector"])) {
                std::cerr << "Error: --vector expects comma-separated numbers\n";
                return 2;
            }
        } else if (!args.empty()) {
            std::string query;
            for (const auto& a : args) query += (query.empty() ? "" : " ") + a;
            params["query"] = query;
        } else {
            std::cerr << "Usage: kosha search QUERY | kosha search --vector CSV\n";
            return 2;
        }
        params["k"] = opt.k;
        if (opt.effort > 0) params["effort"] = opt.effort;
        if (opt.timeout_ms > 0) params["timeout_ms"] = opt.timeout_ms;
        if (opt.exact) params["exact"] = true;
        json filter = json::object();
        if (!opt.tags.empty()) filter["all_tags"] = opt.tags;
        if (!opt.any_tags.empty()) filter["any_tags"] = opt.any_tags;
        if (!opt.not_tags.empty()) filter["none_tags"] = opt.not_tags;
        if (!opt.prefix.empty()) filter["id_prefix"] = opt.prefix;
        if (!filter.empty()) params["filter"] = filter;
    } else if (command == "rebuild") {
        method = "rebuild_index";
    } else if (command == "checkpoint" || command == "stats" || command == "health") {
        method = command;
    } else if (command == "methods") {
        method = "rpc.methods";
    } else {
        std::cerr << "Unknown command: " << command << "\n\n";
        print_usage(argv[0]);
        return 2;
    }

    auto response = client.call(method, params);
    if (!response) {
        std::cerr << "Error: " << client.last_error() << "\n";
        return 1;
    }

    int code = report(*response, opt.json_output);
    if (code >= 0) return code;

    const json& result = (*response)["result"];
    if (command == "search") {
        print_hits(result);
    } else if (command == "index") {
        std::cout << result.value("outcome", std::string()) << " " << result.value("id", std::string())
                  << " (seq " << result.value("sequence", 0) << ")\n";
    } else if (command == "delete") {
        std::cout << "deleted " << result.value("id", std::string()) << "\n";
    } else if (command == "methods") {
        for (const auto& m : result["methods"]) {
            std::cout << std::left << std::setw(18) << m.value("name", std::string())
                      << m.value("description", std::string()) << "\n";
        }
    } else {
        std::cout << result.dump(2) << "\n";
    }
    return 0;
}
