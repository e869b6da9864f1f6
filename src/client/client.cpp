#define _CRT_SECURE_NO_WARNINGS

#include <iostream>
#include <string>
#include <memory>
#include <chrono>
#include <csignal>
#include <atomic>

#include "client_protocol.h"
#include "client_runner.h"

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#endif

// =============================================================================
// GLOBAL CONTROL
// =============================================================================
std::atomic<bool> g_running(true);

void handle_signal(int) {
    g_running = false;
}

static std::unique_ptr<AsyncLogger> logger;

// =============================================================================
// MAIN
// =============================================================================
int main(int argc, char* argv[]) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    CliArgs cli = parse_client_cli(argc, argv);

    if (cli.show_help) {
        print_client_usage(argv[0]);
        return 0;
    }
    if (cli.show_version) {
        std::cout << "cdc_client v" << CLIENT_VERSION << "\n";
        return 0;
    }
    if (!cli.ok()) {
        std::cerr << argv[0] << ": " << cli.error << "\n";
        print_client_usage(argv[0]);
        return EXIT_USAGE;
    }

    // -------------------------------------------------------------------------
    // 1. Load configuration from file, then apply CLI overrides
    // -------------------------------------------------------------------------
    AppConfig conf = load_config(cli.config_path);
    cli.apply_overrides(conf);

    {
        std::string log_path = conf.get("log_file", "cdc_client.log");
        size_t max_log_size  = conf.get_size("log_max_bytes", 10 * 1024 * 1024);
        int max_log_files    = conf.get_int("log_max_files", 5);
        bool echo            = conf.get_bool("log_console", true);
        AsyncLogger::Level level = AsyncLogger::parse_level(conf.get("log_level", "info"));
        logger = std::make_unique<AsyncLogger>(log_path, max_log_size, max_log_files, echo, level);
    }

    logger->log(AsyncLogger::INFO, "=== cdc_client v" + CLIENT_VERSION + " starting ===");

    // -------------------------------------------------------------------------
    // 2. Validate before any network activity
    // -------------------------------------------------------------------------
    SessionConfig session_conf;
    StreamOptions stream_opts;
    try {
        session_conf = make_session_config(conf);
        stream_opts = make_stream_options(conf);
    } catch (const ConfigurationError& e) {
        logger->log(AsyncLogger::ERROR_LOG, std::string("Configuration error: ") + e.what());
        logger->flush();
        logger.reset();
        return EXIT_USAGE;
    }
    stream_opts.running = &g_running;

    logger->log(AsyncLogger::INFO, "Target: " + session_conf.host + ":" + std::to_string(session_conf.port)
                 + " | Object: " + session_conf.object
                 + " | Format: " + to_string(session_conf.format)
                 + " | Idle limit: " + std::to_string(stream_opts.max_idle_reads));

#ifdef _WIN32
    WSADATA w;
    if (WSAStartup(MAKEWORD(2, 2), &w) != 0) return EXIT_CONNECTION;
    _setmode(_fileno(stdout), _O_BINARY);
#endif

    // -------------------------------------------------------------------------
    // 3. Handshake + stream
    // -------------------------------------------------------------------------
    int rc = run_session(session_conf, stream_opts, std::cout, logger.get());

    logger->log(AsyncLogger::INFO, "=== Exit (status " + std::to_string(rc) + ") ===");
    logger->flush();
    logger.reset();
#ifdef _WIN32
    WSACleanup();
#endif
    return rc;
}
