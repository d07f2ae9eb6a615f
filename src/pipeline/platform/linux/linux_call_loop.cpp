#include "platform/linux/linux_call_loop.hpp"

#include "platform/linux/pipewire_device.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <print>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

constexpr int kStatusIntervalMs = 5000;
// Resolution probes the server and may block for the probe timeout.
constexpr int kRefreshIntervalMs = 30000;

} // namespace

LinuxCallLoop::LinuxCallLoop(Config config, bool verbose, CallCore::Options options)
    : verbose_(verbose),
      resolver_(config.decoder),
      core_(config, verbose, clock_, resolver_,
            // DeviceFactory
            [config](AudioSource source) -> std::unique_ptr<AudioDevice> {
                const auto& target = source == AudioSource::Loopback
                    ? config.audio.loopback_target : config.audio.microphone_target;
                return std::make_unique<PipeWireDevice>(source, target);
            },
            std::move(options)) {}

LinuxCallLoop::~LinuxCallLoop() {
    if (signal_fd_ >= 0) ::close(signal_fd_);
}

bool LinuxCallLoop::init() {
    // Signal handling via signalfd; blocked before any worker thread exists.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    return core_.init();
}

int LinuxCallLoop::run(std::optional<std::chrono::seconds> duration) {
    auto call_id = core_.start_call();
    if (call_id.empty()) return 1;

    auto started = std::chrono::steady_clock::now();
    auto next_status = started + std::chrono::milliseconds(kStatusIntervalMs);
    auto next_refresh = started + std::chrono::milliseconds(kRefreshIntervalMs);

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (duration && now - started >= *duration) {
            log("duration elapsed");
            break;
        }

        int timeout = kStatusIntervalMs;
        if (duration) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(started + *duration - now);
            timeout = std::min<int>(timeout, static_cast<int>(left.count()) + 1);
        }

        pollfd pfd{.fd = signal_fd_, .events = POLLIN, .revents = 0};
        int n = poll(&pfd, 1, timeout);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "poll error: {}", std::strerror(errno));
            break;
        }
        if (n > 0 && (pfd.revents & POLLIN)) {
            signalfd_siginfo info;
            if (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
                log(std::format("received signal {}, stopping", info.ssi_signo));
            }
            break;
        }

        now = std::chrono::steady_clock::now();
        if (now < next_status) continue;
        next_status += std::chrono::milliseconds(kStatusIntervalMs);

        if (now >= next_refresh && !core_.service().decoder_is_real()) {
            next_refresh = now + std::chrono::milliseconds(kRefreshIntervalMs);
            if (core_.refresh_decoder()) {
                std::println(stderr, "callscribe: decoder {} available", core_.service().decoder_name());
            }
        }

        if (verbose_) {
            auto m = core_.session().get_metrics();
            log(std::format("{}: {:.0f}s, {} / {} chunks, drift {} ms, {}", m.call_id, m.duration_s,
                            m.chunk_counts[0], m.chunk_counts[1], m.sync_drift_ms,
                            to_string(m.health)));
        }
    }

    core_.stop_call();
    core_.print_metrics();
    return 0;
}

void LinuxCallLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[callscribe] {}", msg);
    }
}
