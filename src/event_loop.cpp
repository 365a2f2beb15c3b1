#include "event_loop.hpp"

#include "container.hpp"
#include "control.hpp"
#include "dispatch.hpp"
#include "error.hpp"
#include "log.hpp"
#include "process_supervisor.hpp"
#include "tab_strip.hpp"
#include "xconnection.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <poll.h>
#include <sys/signalfd.h>
#include <unistd.h>
#include <vector>

namespace tabmux {

EventLoop::EventLoop(XConnection &xc, ProcessSupervisor &sup, Container &container, ControlServer &control,
                     TabStrip &strip, ConfigLoader *loader)
    : xc_(xc), sup_(sup), container_(container), control_(control), strip_(strip), loader_(loader) {
    container_.on_event([this](const std::string &type, const json &payload) {
        control_.emit_event(type, payload);
    });
    container_.on_reload([this]() { reload_pending_ = true; });
    control_.on_reject([this](const Error &e) {
        xc_.set_container_property("_TABMUX_ERROR", std::string(to_string(e.kind())) + ": " + e.what());
    });
}

EventLoop::~EventLoop() {
    if (signal_fd_ >= 0) close(signal_fd_);
}

bool EventLoop::setup_signals() {
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGCHLD);
    sigaddset(&mask, SIGTERM);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGHUP);
    if (sigprocmask(SIG_BLOCK, &mask, nullptr) < 0) {
        TABMUX_LOG_ERROR("loop", "sigprocmask: {}", std::strerror(errno));
        return false;
    }
    // control clients may hang up mid-reply
    std::signal(SIGPIPE, SIG_IGN);
    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        TABMUX_LOG_ERROR("loop", "signalfd: {}", std::strerror(errno));
        return false;
    }
    return true;
}

void EventLoop::apply_config(Config cfg) {
    if (exit_when_empty_) cfg.exit_when_empty = true;
    xc_.ungrab_keys();
    for (const auto &kb : cfg.keybinds) xc_.grab_key(kb.keycode, kb.modifiers);
    strip_.apply(cfg);
    TABMUX_LOG_DEBUG("loop", "config applied: {} bindings, strip {}px", cfg.keybinds.size(), cfg.layout.strip_height);
    container_.set_config(std::move(cfg));
}

int EventLoop::run() {
    try {
        while (container_.running()) {
            step();
            if (!container_.running()) break;
            wait();
        }
    } catch (const Error &e) {
        if (!e.fatal()) throw;
        TABMUX_LOG_CRITICAL("loop", "{}: {}", to_string(e.kind()), e.what());
        container_.shutdown();
        control_.stop();
        return 1;
    }
    // replies to a final quit still need to reach the X server
    xc_.flush();
    return 0;
}

void EventLoop::step() {
    Batch batch;
    drain_x(batch.events);
    batch.exits = sup_.poll_exits();
    batch.requests = control_.take_requests();
    dispatch(container_, control_, std::move(batch));
    if (reload_pending_) reload_config();

    if (container_.needs_redraw()) {
        strip_.draw(container_);
        container_.clear_redraw();
    }
    xc_.flush();
    if (xc_.has_error()) throw Error(ErrorKind::ConnectionLost, "X connection lost");
}

void EventLoop::drain_x(std::vector<WindowEvent> &out) {
    while (xcb_generic_event_t *raw = xcb_poll_for_event(xc_.conn())) {
        std::unique_ptr<xcb_generic_event_t, decltype(&std::free)> ev(raw, &std::free);
        if (auto e = xc_.translate(ev.get())) out.push_back(std::move(*e));
    }
    if (xc_.has_error()) throw Error(ErrorKind::ConnectionLost, "X connection lost");
}

void EventLoop::reload_config() {
    reload_pending_ = false;
    if (!loader_) return;
    TABMUX_LOG_INFO("loop", "reloading {}", loader_->path());
    apply_config(loader_->run_once());
}

void EventLoop::handle_signals() {
    signalfd_siginfo si;
    while (read(signal_fd_, &si, sizeof(si)) == static_cast<ssize_t>(sizeof(si))) {
        switch (si.ssi_signo) {
            case SIGCHLD:
                // reaped at the start of the next iteration
                break;
            case SIGTERM:
            case SIGINT:
            case SIGHUP:
                TABMUX_LOG_INFO("loop", "signal {}, quitting", si.ssi_signo);
                container_.quit();
                break;
            default:
                break;
        }
    }
}

void EventLoop::wait() {
    std::vector<pollfd> fds;
    fds.push_back({xc_.fd(), POLLIN, 0});
    if (signal_fd_ >= 0) fds.push_back({signal_fd_, POLLIN, 0});
    int config_fd = loader_ ? loader_->fd() : -1;
    if (config_fd >= 0) fds.push_back({config_fd, POLLIN, 0});
    control_.collect_fds(fds);

    int n = poll(fds.data(), fds.size(), -1);
    if (n < 0) {
        if (errno != EINTR) TABMUX_LOG_WARN("loop", "poll: {}", std::strerror(errno));
        return;
    }
    for (auto &p : fds) {
        if (!p.revents) continue;
        if (p.fd == signal_fd_) handle_signals();
        else if (p.fd == config_fd && loader_->consume_events()) reload_pending_ = true;
    }
    control_.handle_ready(fds);
}

}  // namespace tabmux
