// DexPilot - Service Entry Point
//
// Loads a TOML config, starts DEX and wallet monitoring with the
// copy-trading and take-profit/stop-loss strategies, and runs until
// SIGINT or SIGTERM. Orders are paper-filled.

#include <dexpilot/logging.hpp>
#include <dexpilot/service.hpp>
#include <dexpilot/source.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_shutdown{false};

void on_signal(int) {
    g_shutdown.store(true);
}

struct Options {
    std::string config_path = "config.toml";
    std::string rpc_url;
    bool verbose = false;
    bool check_only = false;
    bool print_status = false;
};

void print_usage(const char* prog) {
    std::cout << "DexPilot - Solana DEX copy-trading and TP/SL engine\n\n"
              << "Usage: " << prog << " [options] [config.toml]\n\n"
              << "Options:\n"
              << "  -c, --config <path>  Config file (default: config.toml)\n"
              << "  -u, --rpc-url <url>  Override [rpc] url\n"
              << "  -v, --verbose        Debug logging\n"
              << "      --check          Validate the config and exit\n"
              << "      --status-json    Print final status as JSON on exit\n"
              << "  -h, --help           Show this help message\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config path\n";
                std::exit(1);
            }
            opts.config_path = argv[++i];
        } else if (arg == "-u" || arg == "--rpc-url") {
            if (i + 1 >= argc) {
                std::cerr << "Missing RPC URL\n";
                std::exit(1);
            }
            opts.rpc_url = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--check") {
            opts.check_only = true;
        } else if (arg == "--status-json") {
            opts.print_status = true;
        } else if (arg[0] != '-') {
            opts.config_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }

    return opts;
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);

    dexpilot::Config config;
    try {
        config = dexpilot::Config::from_file(opts.config_path);
        if (!opts.rpc_url.empty()) {
            config.rpc.url = opts.rpc_url;
            config.validate();
        }
        if (opts.verbose) {
            config.logging.level = "debug";
        }
        dexpilot::init_logging(config.logging);
    } catch (const dexpilot::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    if (opts.check_only) {
        std::cout << "Config OK: " << config.dex_monitoring.protocols.size() << " protocols, "
                  << config.wallet_monitoring.wallets.size() << " wallets\n";
        return 0;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        auto source = std::make_shared<dexpilot::RpcTransactionSource>(config.rpc);
        dexpilot::Service service(config, source);
        service.start();

        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        service.stop();
        service.log_status();
        if (opts.print_status) {
            std::cout << service.status().to_json().dump(2) << "\n";
        }
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }

    spdlog::info("Shutdown complete");
    return 0;
}
