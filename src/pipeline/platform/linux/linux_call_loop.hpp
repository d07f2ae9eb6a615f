#pragma once

#include "call_core.hpp"
#include "clock_anchor.hpp"
#include "config.hpp"
#include "decoder/lan_model_resolver.hpp"

#include <atomic>
#include <chrono>
#include <optional>

class LinuxCallLoop {
public:
    LinuxCallLoop(Config config, bool verbose, CallCore::Options options);
    ~LinuxCallLoop();

    LinuxCallLoop(const LinuxCallLoop&) = delete;
    LinuxCallLoop& operator=(const LinuxCallLoop&) = delete;

    bool init();
    // Runs one call until SIGINT/SIGTERM or until `duration` elapses.
    int run(std::optional<std::chrono::seconds> duration);
    void print_history(int limit) { core_.print_history(limit); }

private:
    void log(const std::string& msg);

    bool verbose_;
    ClockAnchor clock_;
    LanModelResolver resolver_;

    // Portable call wiring
    CallCore core_;

    int signal_fd_ = -1;
};
