#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include <algorithm>
#include <csignal>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <pthread.h>
#include <string>

#include "northstar/config.h"
#include "northstar/error.h"
#include "northstar/filesystem.h"
#include "northstar/isolation.h"
#include "northstar/options.h"
#include "northstar/runtime.h"

constexpr const char* DEFAULT_CONFIG_PATH = "northstar.json";
constexpr const char* LOG_FILE_NAME = "northstar.log";

enum GlobalOptionValue {
    OPT_CONFIG = 1000,
    OPT_DEBUG,
    OPT_VERSION,
    OPT_HELP
};

struct CliOptions {
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool debug = false;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>         Runtime configuration (default: " << DEFAULT_CONFIG_PATH << ")\n"
              << "  --debug                 Force debug logging\n"
              << "  --help                  Show this help message\n"
              << "  --version               Show version information\n"
              << "\n"
              << "SIGINT or SIGTERM stops every container and exits.\n"
              << std::endl;
}

// Returns -1 to continue, otherwise the exit code.
int parse_cli(int argc, char* argv[], CliOptions& options) {
    opterr = 0;
    optind = 1;

    static struct option long_options[] = {
            {"config", required_argument, nullptr, OPT_CONFIG},
            {"debug", no_argument, nullptr, OPT_DEBUG},
            {"version", no_argument, nullptr, OPT_VERSION},
            {"help", no_argument, nullptr, OPT_HELP},
            {nullptr, 0, nullptr, 0}
    };

    int option;
    while ((option = getopt_long(argc, argv, "+", long_options, nullptr)) != -1) {
        switch (option) {
            case OPT_CONFIG:
                options.config_path = optarg;
                break;
            case OPT_DEBUG:
                options.debug = true;
                break;
            case OPT_VERSION:
                std::cout << "northstar version " << RUNTIME_VERSION << std::endl;
                return 0;
            case OPT_HELP:
                print_usage(argv[0]);
                return 0;
            case '?': {
                int idx = std::max(1, optind - 1);
                std::cerr << "Unknown option: " << argv[idx] << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            default:
                std::cerr << "Unknown option encountered." << std::endl;
                return 1;
        }
    }
    if (optind < argc) {
        std::cerr << "Error: Unexpected argument: " << argv[optind] << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    return -1;
}

int main(int argc, char* argv[]) {
    CliOptions options;
    int exit_code = parse_cli(argc, argv, options);
    if (exit_code >= 0) {
        return exit_code;
    }

    Config config;
    try {
        config = load_config(options.config_path);
    } catch (const NorthstarError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    g_global_options.debug = options.debug;
    g_global_options.log_level = options.debug ? LogLevel::Debug : config.log_level;
    if (!config.log_dir.empty()) {
        g_global_options.log_path = path_join(config.log_dir, LOG_FILE_NAME);
        if (!ensure_directory(config.log_dir, 0755) || !configure_log_destination(g_global_options.log_path)) {
            std::cerr << "Error: cannot open log file " << g_global_options.log_path << std::endl;
            return 1;
        }
    }

    try {
        check_host_devices(config);
        // No thread may exist yet: unshare(CLONE_NEWNS) fails in a multithreaded process.
        enter_runtime_mount_namespace(config);
    } catch (const NorthstarError& e) {
        log_error(std::string("Startup aborted: ") + e.what());
        return 1;
    }

    // Every thread inherits this mask, so only sigwait below sees the signals.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    signal(SIGPIPE, SIG_IGN);

    try {
        Runtime runtime(config);
        runtime.start();

        int received = 0;
        while (sigwait(&signals, &received) != 0) {
        }
        log_info(std::string("Received ") + strsignal(received) + ", shutting down");
        runtime.shutdown();
    } catch (const NorthstarError& e) {
        log_error(std::string(error_code_name(e.code())) + ": " + e.what());
        close_log_destination();
        return 1;
    }
    log_info("Shutdown complete");
    close_log_destination();
    return 0;
}
