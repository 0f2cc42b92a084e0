// ============================================================
// tui.cpp -- ANSI progress display implementation
// ============================================================

#include "tui.hpp"
#include "../common/utils.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>
#include <cstdio>

#ifdef _WIN32
#  include <windows.h>
#  include <io.h>
#  define ISATTY _isatty
#  define FILENO _fileno
#else
#  include <unistd.h>
#  define ISATTY isatty
#  define FILENO fileno
#endif

static constexpr auto RENDER_INTERVAL = std::chrono::milliseconds(100);

bool Tui::is_tty() {
    return ISATTY(FILENO(stdout)) != 0;
}

Tui::Tui(ProgressChannel& events, std::string label)
    : events_(events)
    , label_(std::move(label))
{}

Tui::~Tui() {
    stop();
}

void Tui::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this] { loop(); });
}

void Tui::stop() {
    events_.close();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
}

void Tui::loop() {
    auto last_render = std::chrono::steady_clock::now();
    for (;;) {
        TransferEvent ev;
        if (events_.pop(ev, RENDER_INTERVAL)) {
            apply(ev);
        } else if (events_.closed()) {
            break;
        }

        auto now = std::chrono::steady_clock::now();
        if (now - last_render >= RENDER_INTERVAL) {
            render();
            last_render = now;
        }
    }

    // Final frame
    render();
    if (lines_printed_ > 0) {
        std::cout << "\n";
        std::cout.flush();
    }
}

void Tui::apply(const TransferEvent& ev) {
    switch (ev.kind) {
        case EventKind::CONNECTED: {
            PeerView v;
            v.last_time = std::chrono::steady_clock::now();
            peers_[ev.peer] = v;
            print_message("[+] " + ev.peer + " connected");
            break;
        }
        case EventKind::DISCONNECTED: {
            auto it = peers_.find(ev.peer);
            if (it != peers_.end()) {
                print_message("[-] " + build_line(ev.peer, it->second));
                peers_.erase(it);
            } else {
                print_message("[-] " + ev.peer + " " + ev.message);
            }
            break;
        }
        case EventKind::PROGRESS: {
            auto it = peers_.find(ev.peer);
            if (it == peers_.end()) {
                PeerView v;
                v.last_time = std::chrono::steady_clock::now();
                it = peers_.emplace(ev.peer, v).first;
            }
            it->second.percent = ev.percent;
            it->second.done    = ev.done;
            it->second.total   = ev.total;
            break;
        }
        case EventKind::STATUS:
            print_message(ev.message);
            break;
        case EventKind::ERROR_MSG:
            print_message("[!] " + ev.peer + ": " + ev.message);
            break;
    }
}

void Tui::print_message(const std::string& line) {
    if (is_tty()) clear_lines(lines_printed_);
    std::cout << line << "\n";
    std::cout.flush();
}

void Tui::clear_lines(int n) {
    for (int i = 0; i < n; ++i) {
        // Move cursor up one line, then clear line
        std::cout << "\x1b[A\x1b[2K";
    }
    if (n > 0) {
        std::cout << "\r";
        std::cout.flush();
    }
    lines_printed_ = 0;
}

std::string Tui::build_progress_bar(double pct, int width) const {
    if (width < 4) return "";
    int fill = (int)(pct / 100.0 * width);
    fill = utils::clamp(fill, 0, width);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        if (i < fill)          bar += '=';
        else if (i == fill)    bar += '>';
        else                   bar += ' ';
    }
    bar += "]";
    return bar;
}

std::string Tui::build_line(const std::string& peer, const PeerView& v) const {
    std::ostringstream ss;
    ss << build_progress_bar((double)v.percent, 30)
       << " " << std::setw(3) << v.percent << "%"
       << "  " << label_ << ": " << utils::format_bytes(v.done)
       << "/" << utils::format_bytes(v.total)
       << "  Speed: " << utils::format_speed(v.smooth_speed)
       << "  " << peer;
    return ss.str();
}

void Tui::render() {
    auto now = std::chrono::steady_clock::now();

    // Compute speed (EWMA)
    for (auto& kv : peers_) {
        PeerView& v = kv.second;
        double elapsed_s = std::chrono::duration<double>(now - v.last_time).count();
        if (elapsed_s < 0.05) continue;
        double instant_speed = v.done >= v.last_bytes
                             ? (double)(v.done - v.last_bytes) / elapsed_s : 0.0;
        if (v.last_bytes == 0) {
            v.smooth_speed = instant_speed;
        } else {
            v.smooth_speed = 0.7 * v.smooth_speed + 0.3 * instant_speed;
        }
        v.last_bytes = v.done;
        v.last_time  = now;
    }

    if (!is_tty()) {
        // Non-TTY: one line per peer every 10%
        for (auto& kv : peers_) {
            PeerView& v = kv.second;
            if (v.total == 0 && v.percent == 0) continue;
            if (v.last_printed >= 0 && v.percent < 100 && v.percent - v.last_printed < 10) continue;
            if (v.last_printed == v.percent) continue;
            std::cout << build_line(kv.first, v) << "\n";
            v.last_printed = v.percent;
        }
        std::cout.flush();
        return;
    }

    // Clear previous output
    clear_lines(lines_printed_);

    for (const auto& kv : peers_) {
        std::cout << build_line(kv.first, kv.second) << "\n";
    }
    std::cout.flush();
    lines_printed_ = (int)peers_.size();
}
