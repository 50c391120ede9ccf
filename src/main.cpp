#include <iostream>
#include <string>
#include <csignal>
#include <pthread.h>
#include <curl/curl.h>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/log.hpp>
#include <managers/hub_service.hpp>
#include <api/api_router.hpp>
#include <api/http_server.hpp>

void print_usage() {
    std::cout << "rchub " << RCHUB_VERSION << " - transfer orchestration hub\n\n"
              << "Usage:\n"
              << "    rchub [--config <path>]   Run the hub (default: $HUB_CONFIG or ./rchub.yaml)\n"
              << "    rchub --check [--config <path>]\n"
              << "                              Validate the configuration and exit\n"
              << "    rchub --version           Show version\n"
              << "    rchub --help              Show this help\n\n"
              << "Environment:\n"
              << "    HUB_CONFIG                Configuration file path\n"
              << "    HUB_DB_PATH               Overrides storage.db_path\n";
}

// Block SIGINT/SIGTERM in every thread, then wait for one on the main thread.
static sigset_t block_shutdown_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    return set;
}

int main(int argc, char** argv) {
    std::string config_arg;
    bool check_only = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version") {
            std::cout << "rchub version " << RCHUB_VERSION << "\n";
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--check") {
            check_only = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return 1;
            }
            config_arg = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    auto path = resolve_config_path(config_arg);
    auto config = Config::load(path);
    if (config.is_err()) {
        std::cerr << "Invalid configuration " << path.string() << ": " << config.error << "\n";
        return 1;
    }
    if (check_only) {
        std::cout << fmt::format("{}: OK ({} nodes, db {})\n", path.string(),
                                 config.value.nodes().size(), config.value.db_path());
        return 0;
    }

    const auto& logging = config.value.logging();
    init_log(logging.path, logging.job_log_dir, parse_log_level(logging.level));
    log_info("rchub {} starting, config {}", RCHUB_VERSION, path.string());

    sigset_t signals = block_shutdown_signals();
    curl_global_init(CURL_GLOBAL_ALL);

    int rc = 0;
    try {
        HubService hub(config.value);
        ReconcileReport report = hub.start();
        log_info("rchub: reconciled {} running jobs ({} reattached, {} completed, {} failed)",
                 report.reattached + report.completed + report.failed, report.reattached,
                 report.completed, report.failed);

        ApiRouter router(hub);
        HttpServer server(router, hub, config.value.listen());
        auto started = server.start();
        if (started.is_err()) {
            log_error("rchub: {}", started.error);
            std::cerr << started.error << "\n";
            rc = 1;
        } else {
            int sig = 0;
            sigwait(&signals, &sig);
            log_info("rchub: received signal {}, shutting down", sig);
            // Closing subscriptions first lets streaming connections end
            // before the HTTP daemon joins them.
            hub.shutdown();
            server.stop();
        }
    } catch (const std::exception& e) {
        log_error("rchub: fatal: {}", e.what());
        std::cerr << "rchub: " << e.what() << "\n";
        rc = 1;
    }

    curl_global_cleanup();
    log_info("rchub: exit {}", rc);
    return rc;
}
