#pragma once

#include "config.hpp"
#include "events.hpp"

#include <vector>

namespace tabmux {

class ConfigLoader;
class Container;
class ControlServer;
class ProcessSupervisor;
class TabStrip;
class XConnection;

// -----------------------------
// Event dispatcher
// -----------------------------
//
// Single thread. Each iteration drains X events, then reaps exited children,
// then applies queued control requests, then reloads the configuration if it
// changed; the strip is redrawn when dirty and the connection flushed before
// the loop blocks in poll() over the X fd, a signalfd, the control sockets and
// the config watch.
class EventLoop {
public:
    EventLoop(XConnection &xc, ProcessSupervisor &sup, Container &container, ControlServer &control,
              TabStrip &strip, ConfigLoader *loader);
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop &operator=(const EventLoop&) = delete;

    // Blocks SIGCHLD, SIGTERM, SIGINT and SIGHUP and routes them to a
    // signalfd. Call before the first child is spawned.
    bool setup_signals();

    // -c on the command line survives config reloads.
    void force_exit_when_empty(bool on) { exit_when_empty_ = on; }

    // Installs cfg in the container, key grabs and strip.
    void apply_config(Config cfg);

    // Runs until the container stops. Returns the process exit status.
    int run();

private:
    void step();
    void drain_x(std::vector<WindowEvent> &out);
    void reload_config();
    void handle_signals();
    void wait();

    XConnection &xc_;
    ProcessSupervisor &sup_;
    Container &container_;
    ControlServer &control_;
    TabStrip &strip_;
    ConfigLoader *loader_;

    int signal_fd_ = -1;
    bool reload_pending_ = false;
    bool exit_when_empty_ = false;
};

}  // namespace tabmux
