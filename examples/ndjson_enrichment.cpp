/**
 * @file ndjson_enrichment.cpp
 * @brief Run the enrichment pipeline over NDJSON files
 *
 * Each stream is read from one or more NDJSON files (one file per
 * partition). Enriched records are appended to the output file as
 * {"index","id","document"} lines; the last line per id is current.
 *
 * Usage:
 *   ./ndjson_enrichment --products products.ndjson --users users.ndjson \
 *                       --sales sales.ndjson --views views.ndjson \
 *                       --output enriched.ndjson [--config pipeline.conf]
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "shopstream/pipeline/enrichment_pipeline.h"

using namespace shopstream;

namespace {

std::atomic<bool> g_stop_requested{false};

void handleSignal(int) {
    g_stop_requested.store(true);
}

struct DriverOptions {
    std::vector<std::string> products;
    std::vector<std::string> users;
    std::vector<std::string> sales;
    std::vector<std::string> views;
    std::string output;
    std::string dead_letter;
    std::string config_file;
    bool follow = false;
    int64_t status_interval_ms = 5000;
};

// Comma-separated list of partition files
std::vector<std::string> splitPaths(const std::string& value) {
    std::vector<std::string> paths;
    std::stringstream ss(value);
    std::string path;
    while (std::getline(ss, path, ',')) {
        if (!path.empty()) {
            paths.push_back(path);
        }
    }
    return paths;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --products <files>    Product NDJSON file(s), comma-separated partitions\n"
              << "  --users <files>       User NDJSON file(s)\n"
              << "  --sales <files>       Sale NDJSON file(s)\n"
              << "  --views <files>       View NDJSON file(s)\n"
              << "  --output <file>       Enriched output (NDJSON upsert log)\n"
              << "  --dead-letter <file>  Dead-letter output (default: <output>.dead)\n"
              << "  --config <file>       key = value configuration file\n"
              << "  --follow              Keep tailing the inputs until SIGINT/SIGTERM\n"
              << "  --status-ms <ms>      Status line interval (default: 5000)\n"
              << "  --version             Print the version\n"
              << "  --help                Show this help\n";
}

void printStatus(const EnrichmentPipeline& pipeline) {
    auto stats = pipeline.getStats();
    auto health = pipeline.health();
    std::cout << "[status] watermark=" << health.global_watermark
              << " emitted=" << stats["join.emitted"]
              << " delivered=" << stats["sink.delivered_seq"]
              << " pending=" << stats["store.pending_views"]
              << " dead_lettered=" << stats["sink.dead_lettered"]
              << (health.stalled ? " STALLED" : "") << std::endl;
}

void printSummary(const EnrichmentPipeline& pipeline) {
    auto stats = pipeline.getStats();
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "Pipeline Statistics\n";
    std::cout << std::string(60, '=') << "\n";
    for (const auto& [key, value] : stats) {
        std::cout << "  " << std::left << std::setw(44) << key << value << "\n";
    }
    std::cout << std::string(60, '=') << std::endl;
}

} // anonymous namespace

int main(int argc, char** argv) {
    DriverOptions options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--products" && i + 1 < argc) {
            options.products = splitPaths(argv[++i]);
        } else if (arg == "--users" && i + 1 < argc) {
            options.users = splitPaths(argv[++i]);
        } else if (arg == "--sales" && i + 1 < argc) {
            options.sales = splitPaths(argv[++i]);
        } else if (arg == "--views" && i + 1 < argc) {
            options.views = splitPaths(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            options.output = argv[++i];
        } else if (arg == "--dead-letter" && i + 1 < argc) {
            options.dead_letter = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            options.config_file = argv[++i];
        } else if (arg == "--follow") {
            options.follow = true;
        } else if (arg == "--status-ms" && i + 1 < argc) {
            try {
                options.status_interval_ms = parse_duration_ms(argv[++i], false);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Invalid --status-ms: " << e.what() << "\n";
                return 2;
            }
        } else if (arg == "--version") {
            std::cout << "shopstream " << SHOPSTREAM_VERSION << std::endl;
            return 0;
        } else if (arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (options.products.empty() || options.users.empty() || options.sales.empty() ||
        options.views.empty() || options.output.empty()) {
        std::cerr << "All four inputs and --output are required\n";
        printUsage(argv[0]);
        return 2;
    }
    if (options.dead_letter.empty()) {
        options.dead_letter = options.output + ".dead";
    }

    PipelineConfig config;
    try {
        if (!options.config_file.empty()) {
            config = PipelineConfig::from_map(load_config_file(options.config_file));
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 2;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    std::unique_ptr<EnrichmentPipeline> pipeline;
    try {
        PipelineEndpoints endpoints;
        endpoints.products = std::make_unique<io::NdjsonFileSource>(options.products, options.follow);
        endpoints.users = std::make_unique<io::NdjsonFileSource>(options.users, options.follow);
        endpoints.sales = std::make_unique<io::NdjsonFileSource>(options.sales, options.follow);
        endpoints.views = std::make_unique<io::NdjsonFileSource>(options.views, options.follow);
        endpoints.sink = std::make_unique<io::NdjsonFileSink>(options.output);
        endpoints.dead_letter = std::make_unique<io::NdjsonDeadLetterOutput>(options.dead_letter);
        endpoints.checkpoint_store =
            std::make_unique<io::FileCheckpointStore>(config.checkpoint.store_location);

        pipeline = std::make_unique<EnrichmentPipeline>(config, std::move(endpoints));
    } catch (const std::exception& e) {
        std::cerr << "Failed to set up pipeline: " << e.what() << std::endl;
        return 1;
    }

    if (!pipeline->start()) {
        return 1;
    }

    auto last_status = std::chrono::steady_clock::now();
    while (!g_stop_requested.load() && !pipeline->failed()) {
        if (!options.follow && pipeline->waitUntilIdle(std::chrono::milliseconds(200))) {
            std::cout << "All inputs drained" << std::endl;
            break;
        }
        if (options.follow) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        auto now = std::chrono::steady_clock::now();
        if (options.status_interval_ms > 0 &&
            now - last_status >= std::chrono::milliseconds(options.status_interval_ms)) {
            printStatus(*pipeline);
            last_status = now;
        }
    }

    pipeline->shutdown();
    printSummary(*pipeline);

    if (pipeline->failed()) {
        std::cerr << "Pipeline failed: " << pipeline->failureReason() << std::endl;
        return 1;
    }
    return 0;
}
