#include "recognition_server.hpp"
#include <iostream>
#include <csignal>
#include <memory>
#include <string>

// Global pointer for signal handler
std::unique_ptr<dre::RecognitionServer> g_server;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\n\nReceived shutdown signal..." << std::endl;
        if (g_server) {
            g_server->stop();
        }
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --endpoint <endpoint>       Server endpoint (default: tcp://*:5560)" << std::endl;
    std::cout << "  --database <path>           Catalog database (default: drugs.db)" << std::endl;
    std::cout << "  --workers <n>               Worker threads, 0 = CPU cores (default: 0)" << std::endl;
    std::cout << "  --batch-size <n>            Comparisons between progress reports (default: 200)" << std::endl;
    std::cout << "  --top-k <n>                 Results when a request asks for 0 (default: 5)" << std::endl;
    std::cout << "  --job-ttl <s>               Forget jobs idle this long (default: 600)" << std::endl;
    std::cout << "  --max-duration <s>          Time out jobs running this long (default: 120)" << std::endl;
    std::cout << "  --refresh-interval <s>      Catalog reload period, 0 = never (default: 300)" << std::endl;
    std::cout << "  --text-density <ratio>      OCR rule: small/total contour ratio (default: 0.6)" << std::endl;
    std::cout << "  --small-contours <n>        OCR rule: minimum small contours (default: 50)" << std::endl;
    std::cout << "  --max-contours <n>          Feature rule: maximum contours (default: 9)" << std::endl;
    std::cout << "  --edge-density <ratio>      Feature rule: maximum edge density (default: 0.10)" << std::endl;
    std::cout << "  --reject-empty-catalog      Fail requests instead of returning no results" << std::endl;
    std::cout << "  --help                      Show this help message" << std::endl;
    std::cout << "\nExample:" << std::endl;
    std::cout << "  " << program_name << " --endpoint tcp://*:5560 --database drugs.db --workers 4" << std::endl;
}

// Reads the value following flag; false (with a message) if missing or invalid
bool read_long(int argc, char* argv[], int& i, long min_value, long& out) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
        std::cerr << "Error: " << flag << " requires a value" << std::endl;
        return false;
    }
    try {
        out = std::stol(argv[++i]);
    } catch (const std::exception&) {
        std::cerr << "Error: invalid value for " << flag << std::endl;
        return false;
    }
    if (out < min_value) {
        std::cerr << "Error: " << flag << " must be at least " << min_value << std::endl;
        return false;
    }
    return true;
}

bool read_ratio(int argc, char* argv[], int& i, double& out) {
    std::string flag = argv[i];
    if (i + 1 >= argc) {
        std::cerr << "Error: " << flag << " requires a value" << std::endl;
        return false;
    }
    try {
        out = std::stod(argv[++i]);
    } catch (const std::exception&) {
        std::cerr << "Error: invalid value for " << flag << std::endl;
        return false;
    }
    if (out < 0.0 || out > 1.0) {
        std::cerr << "Error: " << flag << " must be between 0 and 1" << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    dre::ServerConfig config;
    dre::EngineConfig& engine = config.engine;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        long value = 0;

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--endpoint") {
            if (i + 1 < argc) {
                config.endpoint = argv[++i];
            } else {
                std::cerr << "Error: --endpoint requires a value" << std::endl;
                return 1;
            }
        } else if (arg == "--database") {
            if (i + 1 < argc) {
                config.database_path = argv[++i];
            } else {
                std::cerr << "Error: --database requires a value" << std::endl;
                return 1;
            }
        } else if (arg == "--workers") {
            if (!read_long(argc, argv, i, 0, value)) return 1;
            engine.worker_threads = static_cast<size_t>(value);
        } else if (arg == "--batch-size") {
            if (!read_long(argc, argv, i, 1, value)) return 1;
            engine.search.batch_size = static_cast<size_t>(value);
        } else if (arg == "--top-k") {
            if (!read_long(argc, argv, i, 1, value)) return 1;
            engine.search.default_top_k = static_cast<uint32_t>(value);
        } else if (arg == "--job-ttl") {
            if (!read_long(argc, argv, i, 1, value)) return 1;
            engine.jobs.ttl = std::chrono::seconds(value);
        } else if (arg == "--max-duration") {
            if (!read_long(argc, argv, i, 1, value)) return 1;
            engine.jobs.max_duration = std::chrono::seconds(value);
        } else if (arg == "--refresh-interval") {
            if (!read_long(argc, argv, i, 0, value)) return 1;
            config.refresh_interval = std::chrono::seconds(value);
        } else if (arg == "--text-density") {
            if (!read_ratio(argc, argv, i, engine.mode_selector.text_density_threshold)) return 1;
        } else if (arg == "--small-contours") {
            if (!read_long(argc, argv, i, 0, value)) return 1;
            engine.mode_selector.small_contour_threshold = static_cast<size_t>(value);
        } else if (arg == "--max-contours") {
            if (!read_long(argc, argv, i, 0, value)) return 1;
            engine.mode_selector.max_object_contours = static_cast<size_t>(value);
        } else if (arg == "--edge-density") {
            if (!read_ratio(argc, argv, i, engine.mode_selector.edge_density_threshold)) return 1;
        } else if (arg == "--reject-empty-catalog") {
            engine.reject_empty_catalog = true;
        } else {
            std::cerr << "Error: unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (engine.jobs.max_duration > engine.jobs.ttl) {
        std::cerr << "Warning: --max-duration exceeds --job-ttl; idle running jobs "
                  << "will be purged before they time out" << std::endl;
    }

    // Set up signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        // No OCR engine is linked in; auto mode falls back to feature matching
        g_server = std::make_unique<dre::RecognitionServer>(config);

        g_server->run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
