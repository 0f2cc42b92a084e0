// ============================================================
// client/main.cpp -- filedrop client entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/tui.hpp"
#include "../common/stop_watcher.hpp"
#include "client_app.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <atomic>

// Set by the signal handler; a StopWatcher turns it into app.stop()
static std::atomic<bool> g_stop_requested{false};

static void sig_handler(int /*sig*/) {
    g_stop_requested.store(true);
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <dst> <ip> <port> [options]\n"
        << "\n"
        << "  dst                 destination file, or a directory to save as\n"
        << "                      received_file_YYYYmmdd_HHMMSS inside it\n"
        << "  ip                  filedrop_server IP address\n"
        << "  port                TCP port (default protocol port: " << DEFAULT_PORT << ")\n"
        << "\nOptions:\n"
        << "  --retries N         total connection attempts (default: " << DEFAULT_MAX_RETRIES << ")\n"
        << "  --retry-delay-ms N  wait between attempts (default: " << DEFAULT_RETRY_DELAY_MS << ")\n"
        << "  --log FILE          append log output to FILE (default: filedrop_client.log)\n"
        << "  --verbose           enable debug logging\n"
        << "\nIf the connection drops, the client reconnects and resumes where\n"
        << "it left off. The sender's file extension is appended when dst has none.\n"
        << "\nExamples:\n"
        << "  " << prog << " ./downloads 192.168.1.1 " << DEFAULT_PORT << "\n"
        << "  " << prog << " ./report 192.168.1.1 " << DEFAULT_PORT << " --retries 5\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ClientConfig cfg;
    cfg.dst       = argv[1];
    cfg.server_ip = argv[2];
    int port_int  = std::atoi(argv[3]);
    std::string log_file = "filedrop_client.log";
    LogLevel level = LogLevel::INFO;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--retries") == 0 && i + 1 < argc) {
            cfg.retry.max_retries = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--retry-delay-ms") == 0 && i + 1 < argc) {
            cfg.retry.retry_delay_ms = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            level = LogLevel::DEBUG;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.dst)) {
        std::cerr << "ERROR: Invalid dst\n";
        return 1;
    }
    if (!utils::validate_ip(cfg.server_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.server_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    if (cfg.retry.max_retries < 1 || cfg.retry.max_retries > 100) {
        std::cerr << "ERROR: --retries must be 1-100\n";
        return 1;
    }
    if (cfg.retry.retry_delay_ms < 0) {
        std::cerr << "ERROR: --retry-delay-ms must be >= 0\n";
        return 1;
    }

    cfg.server_port = (u16)port_int;
    Logger::get().set_level(level);
    Logger::get().set_log_file(log_file);
    Logger::get().set_transfer_error_file("transfer_errors.log");

    try {
        ProgressChannel events;
        Tui tui(events, "Recv");

        ClientApp app(std::move(cfg), &events);

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        int rc = 0;
        {
            StopWatcher watcher(g_stop_requested, [&app] { app.stop(); });
            tui.start();
            rc = app.run();
            tui.stop();
        }

        std::cout << "\nTransfer history:\n" << app.history().render_table();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
