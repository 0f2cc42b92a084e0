// ============================================================
// server/main.cpp -- filedrop server entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../common/file_io.hpp"
#include "../common/tui.hpp"
#include "../common/stop_watcher.hpp"
#include "server_app.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <cstdlib>
#include <csignal>
#include <atomic>

// Set by the signal handler; a StopWatcher turns it into app.stop()
static std::atomic<bool> g_stop_requested{false};

static void sig_handler(int /*sig*/) {
    g_stop_requested.store(true);
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <file> <ip> <port> [options]\n"
        << "\n"
        << "  file           file to send to every client that connects\n"
        << "  ip             IP address to listen on (use 0.0.0.0 for all interfaces)\n"
        << "  port           TCP port (default protocol port: " << DEFAULT_PORT << ")\n"
        << "\nOptions:\n"
        << "  --log FILE     append log output to FILE (default: filedrop_server.log)\n"
        << "  --once         exit after serving one client\n"
        << "  --verbose      enable debug logging\n"
        << "\nThe server listens until interrupted and prints the transfer\n"
        << "history on exit.\n"
        << "\nExample:\n"
        << "  " << prog << " report.pdf 0.0.0.0 " << DEFAULT_PORT << "\n";
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

    if (argc < 4) {
        print_usage(argv[0]);
        return 1;
    }

    ServerConfig cfg;
    cfg.file_path  = argv[1];
    cfg.listen_ip  = argv[2];
    int port_int   = std::atoi(argv[3]);
    std::string log_file = "filedrop_server.log";
    LogLevel level = LogLevel::INFO;

    for (int i = 4; i < argc; ++i) {
        if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--once") == 0) {
            cfg.max_clients = 1;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            level = LogLevel::DEBUG;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!utils::validate_path(cfg.file_path) || !file_io::file_exists(cfg.file_path)) {
        std::cerr << "ERROR: File not found: " << cfg.file_path << "\n";
        return 1;
    }
    if (cfg.listen_ip != "0.0.0.0" && !utils::validate_ip(cfg.listen_ip)) {
        std::cerr << "ERROR: Invalid IP address: " << cfg.listen_ip << "\n";
        return 1;
    }
    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }

    cfg.listen_port = (u16)port_int;
    Logger::get().set_level(level);
    Logger::get().set_log_file(log_file);
    Logger::get().set_transfer_error_file("transfer_errors.log");

    try {
        ProgressChannel events;
        Tui tui(events, "Sent");

        ServerApp app(std::move(cfg), &events);

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
