/**
 * tvsort CLI - Merges IPTV playlist sources into a categorized channel list
 *
 * Downloads every source in the source list, normalizes channel names
 * through the mapping file, orders channels by the category template and
 * writes the result as "{category},#genre#" / "name,url" text.
 *
 * Usage:
 *   tvsort_cli [options]
 *
 * Exit codes:
 *   0  merged, or stopped early (no content / empty template)
 *   1  output could not be written
 *   2  invalid arguments
 */

#include "lib/src/ChannelSorter.h"
#include <iostream>
#include <iomanip>
#include <chrono>
#include <stdexcept>
#include <string>

void log_callback(const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::cout << "[" << std::put_time(std::localtime(&time), "%H:%M:%S")
              << "." << std::setfill('0') << std::setw(3) << ms.count() << "] "
              << message << std::endl;
}

void print_usage(const char* program) {
    tvsort::SorterConfig defaults;

    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Merge playlist sources and sort channels by a category template" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --sources PATH         Source list, one URL per line (default: " << defaults.source_list_path << ")" << std::endl;
    std::cout << "  --template PATH        Category template (default: " << defaults.template_path << ")" << std::endl;
    std::cout << "  --mapping PATH         Channel name mapping (default: " << defaults.mapping_path << ")" << std::endl;
    std::cout << "  --output PATH          Output file (default: " << defaults.output_path << ")" << std::endl;
    std::cout << "  --default-source URL   Source used when the source list is missing or empty" << std::endl;
    std::cout << "  --timeout SECONDS      Per-source download timeout (default: " << defaults.fetch_timeout_seconds << ")" << std::endl;
    std::cout << "  --user-agent STRING    HTTP User-Agent header" << std::endl;
    std::cout << "  --help                 Show this help" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << std::endl;
    std::cout << "  " << program << " --sources my_sources.txt --output out/live.txt" << std::endl;
}

int main(int argc, char** argv) {
    tvsort::SorterConfig config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--sources" && i + 1 < argc) {
            config.source_list_path = argv[++i];
        } else if (arg == "--template" && i + 1 < argc) {
            config.template_path = argv[++i];
        } else if (arg == "--mapping" && i + 1 < argc) {
            config.mapping_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            config.output_path = argv[++i];
        } else if (arg == "--default-source" && i + 1 < argc) {
            config.default_source_url = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            try {
                config.fetch_timeout_seconds = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "ERROR: --timeout expects a number of seconds" << std::endl;
                return 2;
            }
        } else if (arg == "--user-agent" && i + 1 < argc) {
            config.user_agent = argv[++i];
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "ERROR: Unknown or incomplete option: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    tvsort::ChannelSorter sorter(config);
    sorter.SetLogCallback(log_callback);

    tvsort::RunStatus status = sorter.Run();

    switch (status) {
        case tvsort::RunStatus::Success: {
            const auto& stats = sorter.GetLastStats();
            std::cout << std::endl;
            std::cout << "Saved " << config.output_path << ": "
                      << stats.matched << " matched, "
                      << stats.unmatched << " unclassified" << std::endl;
            return 0;
        }
        case tvsort::RunStatus::NoContent:
        case tvsort::RunStatus::NoTemplate:
            std::cerr << "Stopped: " << tvsort::RunStatusToString(status) << std::endl;
            return 0;
        case tvsort::RunStatus::WriteFailed:
            std::cerr << "ERROR: " << tvsort::RunStatusToString(status) << std::endl;
            return 1;
    }

    return 1;
}
