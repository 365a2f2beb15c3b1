#include "config.hpp"
#include "container.hpp"
#include "control.hpp"
#include "error.hpp"
#include "event_loop.hpp"
#include "log.hpp"
#include "process_supervisor.hpp"
#include "tab_strip.hpp"
#include "xconnection.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <string>
#include <unistd.h>
#include <vector>

using namespace tabmux;

namespace {

// Starting size; the window manager usually overrides it right away.
constexpr Size INITIAL_SIZE{200, 200};

void usage(const char *prog) {
    std::cerr << "usage: " << prog << " [-c] [-d] [-v] [-f config] [-n name] [command args...]\n"
              << "  -c         exit when the last tab is closed\n"
              << "  -d         detach from the terminal after printing the window id\n"
              << "  -v         debug logging\n"
              << "  -f config  configuration script\n"
              << "  -n name    window class and name\n"
              << "A \"{xid}\" argument is replaced by the container window id; children\n"
              << "also find it in $" << ProcessSupervisor::XID_ENV << ".\n";
}

}  // namespace

// -----------------------------
// main()
// -----------------------------
int main(int argc, char **argv) {
    bool exit_when_empty = false;
    bool detach = false;
    bool verbose = false;
    std::string config_path;
    std::string name = "tabmux";

    int opt;
    // '+' stops at the first non-option so the command keeps its own flags
    while ((opt = getopt(argc, argv, "+cdvf:n:h")) != -1) {
        switch (opt) {
            case 'c': exit_when_empty = true; break;
            case 'd': detach = true; break;
            case 'v': verbose = true; break;
            case 'f': config_path = optarg; break;
            case 'n': name = optarg; break;
            case 'h': usage(argv[0]); return 0;
            default: usage(argv[0]); return 2;
        }
    }
    std::vector<std::string> command(argv + optind, argv + argc);

    Logger &log = Logger::instance();
    log.add_sink(sinks::console_sink());
    if (const char *lvl = std::getenv("TABMUX_LOG_LEVEL")) {
        LogLevel parsed;
        if (Logger::parse_level(lvl, parsed)) log.set_level(parsed);
        else TABMUX_LOG_WARN("main", "unknown log level '{}'", lvl);
    }
    if (verbose) log.set_level(LogLevel::Debug);

    XConnection xc;
    if (!xc.connect()) {
        std::cerr << "tabmux: cannot connect to X server\n";
        return 1;
    }

    if (config_path.empty()) config_path = ConfigLoader::find_config();
    ConfigLoader loader(config_path);
    Config cfg = loader.run_once();
    if (exit_when_empty) cfg.exit_when_empty = true;

    if (!xc.create_container(name, INITIAL_SIZE)) {
        std::cerr << "tabmux: cannot create window\n";
        return 1;
    }
    std::printf("0x%X\n", xc.container());
    std::fflush(stdout);

    if (detach && daemon(0, 0) < 0) {
        TABMUX_LOG_ERROR("main", "cannot detach: {}", std::strerror(errno));
        return 1;
    }

    ProcessSupervisor supervisor;
    supervisor.set_embed_target(xc.container());

    Size size = xc.container_size();
    if (size.w <= 0 || size.h <= 0) size = INITIAL_SIZE;
    Container container(xc, supervisor, cfg, size);
    TabStrip strip(xc);

    ControlServer control(socket_path_for(xc.container()));
    if (control.start()) xc.set_container_property("_TABMUX_SOCKET", control.path());
    else TABMUX_LOG_WARN("main", "running without a control socket");

    if (!config_path.empty() && loader.watch() < 0)
        TABMUX_LOG_WARN("main", "not watching {}", config_path);

    EventLoop loop(xc, supervisor, container, control, strip, config_path.empty() ? nullptr : &loader);
    loop.force_exit_when_empty(exit_when_empty);
    if (!loop.setup_signals()) return 1;
    loop.apply_config(cfg);

    if (!command.empty()) {
        try {
            container.open(SpawnSpec{command, {}});
        } catch (const Error &e) {
            TABMUX_LOG_ERROR("main", "{}", e.what());
            if (exit_when_empty) return 1;
        }
    }

    int status = loop.run();

    control.stop();
    xc.destroy_container();
    return status;
}
