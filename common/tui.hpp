#pragma once

// ============================================================
// tui.hpp -- ANSI TUI progress display
//
// Drains a ProgressChannel on its own thread and renders one
// progress bar per active peer, refreshed every 100ms.
// ============================================================

#include "../common/platform.hpp"
#include "../common/progress.hpp"
#include <string>
#include <atomic>
#include <thread>
#include <map>
#include <chrono>

class Tui {
public:
    // label: "Sent" for server, "Recv" for client
    Tui(ProgressChannel& events, std::string label);
    ~Tui();

    // Start background render thread
    void start();

    // Close the channel, drain it and print the final frame
    void stop();

    static bool is_tty();

private:
    struct PeerView {
        int    percent{0};
        u64    done{0};
        u64    total{0};
        int    last_printed{-1};   // non-TTY: last percent written

        // For speed calculation
        u64    last_bytes{0};
        std::chrono::steady_clock::time_point last_time;
        double smooth_speed{0.0};
    };

    ProgressChannel&  events_;
    std::string       label_;
    std::thread       thread_;
    std::atomic<bool> running_{false};

    // Only touched on the render thread
    std::map<std::string, PeerView> peers_;

    // Track number of lines printed for cursor-up overwrite
    int lines_printed_{0};

    void loop();
    void apply(const TransferEvent& ev);
    void print_message(const std::string& line);
    void render();
    void clear_lines(int n);
    std::string build_progress_bar(double pct, int width) const;
    std::string build_line(const std::string& peer, const PeerView& v) const;
};
