// main.cpp
#include <iostream>
#include <csignal>
#include <filesystem>
#include <getopt.h>
#include <yaml-cpp/yaml.h>

#include "asset_cache.hpp"
#include "background_resolver.hpp"
#include "batch_renderer.hpp"
#include "config.hpp"
#include "event_record.hpp"
#include "net/http_client.hpp"
#include "net/pexels_client.hpp"
#include "net/webhook_publisher.hpp"
#include "poster_assembler.hpp"
#include "utils.hpp"

using namespace eventposter;

CancellationToken g_cancel;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_cancel.cancel();
    }
}

struct Options {
    // Event
    std::string time;
    std::string date;
    std::string title;
    std::string venue;
    std::string address;
    std::string query;
    int page = 1;

    // Batch, -1 keeps the config value
    int variants = -1;
    int derive_queries = -1;

    std::string config_file = "config/poster.yaml";
    std::string output_dir = "output";
    bool publish = false;
    bool verbose = false;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -t, --time TIME           Event time, e.g. 19:00\n"
              << "  -d, --date DATE           Event date, YYYY-MM-DD or as displayed\n"
              << "  -n, --title TITLE         Title, lines separated by \\n\n"
              << "  -v, --venue VENUE         Venue name\n"
              << "  -a, --address ADDRESS     Venue address\n"
              << "  -q, --query QUERY         Background search keywords\n"
              << "  -p, --page PAGE           First result page (default: 1)\n"
              << "  -k, --variants N          Number of variants (default: from config)\n"
              << "  -D, --derive-queries on|off  Derive queries from the title when no query is given\n"
              << "  -c, --config FILE         Config file path (default: config/poster.yaml)\n"
              << "  -o, --output-dir DIR      Output directory (default: output)\n"
              << "  -P, --publish             Post the first poster to the configured webhook\n"
              << "  -V, --verbose             Debug logging\n"
              << "  -h, --help                Show this help\n";
}

bool parse_int(const char* text, const char* name, int& value) {
    try {
        size_t used = 0;
        value = std::stoi(text, &used);
        if (used == std::string(text).size()) return true;
    } catch (const std::exception&) {
    }
    std::cerr << "Invalid value for --" << name << ": " << text << std::endl;
    return false;
}

// Turns the two-character sequence "\n" into a line break
std::string unescape_lines(const std::string& text) {
    std::string out;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == 'n') {
            out += '\n';
            ++i;
        } else {
            out += text[i];
        }
    }
    return out;
}

// Returns 0 to continue, otherwise the process exit code + 1
int parse_args(int argc, char* argv[], Options& opts) {
    static struct option long_options[] = {
        {"time", required_argument, 0, 't'},
        {"date", required_argument, 0, 'd'},
        {"title", required_argument, 0, 'n'},
        {"venue", required_argument, 0, 'v'},
        {"address", required_argument, 0, 'a'},
        {"query", required_argument, 0, 'q'},
        {"page", required_argument, 0, 'p'},
        {"variants", required_argument, 0, 'k'},
        {"derive-queries", required_argument, 0, 'D'},
        {"config", required_argument, 0, 'c'},
        {"output-dir", required_argument, 0, 'o'},
        {"publish", no_argument, 0, 'P'},
        {"verbose", no_argument, 0, 'V'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "t:d:n:v:a:q:p:k:D:c:o:PVh",
                              long_options, &option_index)) != -1) {
        switch (opt) {
            case 't': opts.time = optarg; break;
            case 'd': opts.date = optarg; break;
            case 'n': opts.title = unescape_lines(optarg); break;
            case 'v': opts.venue = optarg; break;
            case 'a': opts.address = optarg; break;
            case 'q': opts.query = optarg; break;
            case 'p':
                if (!parse_int(optarg, "page", opts.page) || opts.page < 1) return 2;
                break;
            case 'k':
                if (!parse_int(optarg, "variants", opts.variants) || opts.variants < 1) return 2;
                break;
            case 'D': {
                std::string v = optarg;
                if (v == "on" || v == "true" || v == "1") {
                    opts.derive_queries = 1;
                } else if (v == "off" || v == "false" || v == "0") {
                    opts.derive_queries = 0;
                } else {
                    std::cerr << "Invalid value for --derive-queries: " << v << std::endl;
                    return 2;
                }
                break;
            }
            case 'c': opts.config_file = optarg; break;
            case 'o': opts.output_dir = optarg; break;
            case 'P': opts.publish = true; break;
            case 'V': opts.verbose = true; break;
            case 'h':
                print_usage(argv[0]);
                return 1;
            default:
                print_usage(argv[0]);
                return 2;
        }
    }

    if (parseTitle(opts.title).empty()) {
        std::cerr << "--title is required" << std::endl;
        return 2;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    Options opts;
    if (int rc = parse_args(argc, argv, opts)) {
        return rc - 1;
    }

    if (opts.verbose) {
        Logger::setLevel(Logger::DEBUG);
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Load YAML config
    YAML::Node yaml_config;
    try {
        yaml_config = YAML::LoadFile(opts.config_file);
    } catch (const std::exception& e) {
        Logger::log(Logger::WARNING, "Could not load config file, using defaults: " + std::string(e.what()));
    }

    AppConfig config;
    std::string error;
    if (!loadAppConfig(yaml_config, config, error)) {
        Logger::log(Logger::ERROR, "Invalid configuration: " + error);
        return 1;
    }
    if (opts.variants > 0) config.batch.variants = opts.variants;
    if (opts.derive_queries >= 0) config.batch.derive_queries = opts.derive_queries == 1;

    EventRecord record = EventRecord::fromInput(opts.time, opts.date, opts.title, opts.venue,
                                                opts.address, opts.query, opts.page);

    // Initialize components
    net::HttpClient http(config.http);
    FileAssetCache assets(config.assets, http);
    net::PexelsSearchClient search(config.search, http);
    BackgroundResolver resolver(&search, config.search.per_page);
    PosterAssembler assembler(config.layout, assets, resolver);
    BatchRenderer batch(assembler, config.batch.max_workers);

    std::vector<VariantRequest> plan = planVariants(record, config.batch.variants, config.batch.derive_queries);
    Logger::log(Logger::INFO, "Rendering " + std::to_string(plan.size()) + " variant(s) for '" +
                record.title.front() + "'");

    std::vector<RenderResult> results = batch.renderBatch(record, plan, &g_cancel);
    if (g_cancel.isCancelled()) {
        Logger::log(Logger::WARNING, "Interrupted, nothing written");
        return 130;
    }

    std::error_code ec;
    std::filesystem::create_directories(opts.output_dir, ec);
    if (ec) {
        Logger::log(Logger::ERROR, "Cannot create " + opts.output_dir + ": " + ec.message());
        return 1;
    }

    std::vector<WrittenPoster> written = writePosters(results, record, opts.output_dir);
    for (const WrittenPoster& poster : written) {
        std::cout << poster.result->label << ": " << poster.path
                  << (poster.result->used_fallback_background ? " (fallback background)" : "") << std::endl;
    }

    if (written.empty()) {
        Logger::log(Logger::ERROR, "No poster could be generated");
        return 1;
    }

    if (opts.publish) {
        net::WebhookPublisher publisher(config.webhook.url, http);
        net::PublishResult published = publisher.publish(written.front().result->png, record, opts.title);
        if (published.ok) {
            std::cout << "Published: " << published.message << std::endl;
        } else {
            std::cerr << "Publishing failed: " << published.message << std::endl;
        }
    }

    return 0;
}
