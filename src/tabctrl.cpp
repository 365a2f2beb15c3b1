#include "control.hpp"
#include "error.hpp"
#include "log.hpp"
#include "process_supervisor.hpp"
#include "strings.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <vector>

using namespace tabmux;

namespace {

void usage(const char *prog) {
    std::cerr << "usage: " << prog << " [-w xid | -s socket] [--json] command [args...]\n"
              << "commands: new-tab CMD..., close-tab [N|active|id:N], activate-tab N,\n"
              << "  next-tab, prev-tab, list-tabs, query-geometry, reorder-tab N M,\n"
              << "  move-tab +-N, attach XID, detach-tab [N|active|id:N], detach-all,\n"
              << "  reload-config, subscribe, quit\n"
              << "The container defaults to $TABMUX_XID.\n";
}

int connect_to(const std::string &path) {
    sockaddr_un addr;
    if (path.size() >= sizeof(addr.sun_path)) throw Error(ErrorKind::ConnectionLost, "socket path too long: " + path);
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw Error(ErrorKind::ConnectionLost, std::string("socket: ") + std::strerror(errno));
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        throw Error(ErrorKind::ConnectionLost, path + ": " + std::strerror(err));
    }
    return fd;
}

void send_line(int fd, const std::string &line) {
    std::string out = line + "\n";
    size_t off = 0;
    while (off < out.size()) {
        ssize_t w = write(fd, out.data() + off, out.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            throw Error(ErrorKind::ConnectionLost, std::string("write: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(w);
    }
}

// Reads newline-terminated replies until fn returns false or the peer hangs up.
template <typename Fn>
void read_lines(int fd, Fn fn) {
    std::string acc;
    char buf[1024];
    for (;;) {
        ssize_t r = read(fd, buf, sizeof(buf));
        if (r < 0) {
            if (errno == EINTR) continue;
            throw Error(ErrorKind::ConnectionLost, std::string("read: ") + std::strerror(errno));
        }
        if (r == 0) return;
        acc.append(buf, static_cast<size_t>(r));
        size_t pos;
        while ((pos = acc.find('\n')) != std::string::npos) {
            std::string line = acc.substr(0, pos);
            acc.erase(0, pos + 1);
            if (!fn(line)) return;
        }
    }
}

std::string compact(const json &v) {
    return v.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string display(const json &v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "-";
    return compact(v);
}

void print_result(CommandKind kind, const json &result) {
    if (result.is_null()) return;
    if (kind == CommandKind::ListTabs) {
        for (const auto &t : result) {
            std::cout << t["index"] << '\t' << "id:" << t["id"] << '\t' << display(t["state"])
                      << (t["active"].get<bool>() ? "\t*" : "\t ") << (t["urgent"].get<bool>() ? "!" : " ")
                      << '\t' << display(t["title"]) << '\n';
        }
        return;
    }
    if (result.is_object()) {
        for (auto it = result.begin(); it != result.end(); ++it)
            std::cout << it.key() << '=' << display(it.value()) << '\n';
        return;
    }
    std::cout << display(result) << '\n';
}

}  // namespace

int main(int argc, char **argv) {
    std::string xid_arg;
    std::string sock_arg;
    bool raw_json = false;

    static const option long_opts[] = {
        {"json", no_argument, nullptr, 'j'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };
    int opt;
    while ((opt = getopt_long(argc, argv, "+w:s:jh", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'w': xid_arg = optarg; break;
            case 's': sock_arg = optarg; break;
            case 'j': raw_json = true; break;
            case 'h': usage(argv[0]); return 0;
            default: usage(argv[0]); return 1;
        }
    }
    if (optind >= argc) {
        usage(argv[0]);
        return 1;
    }

    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().set_level(LogLevel::Warning);

    std::vector<std::string> words(argv + optind, argv + argc);
    std::string line = join_words(words);

    try {
        Command cmd = parse_command(line);

        std::string path = sock_arg;
        if (path.empty()) {
            if (xid_arg.empty()) {
                const char *env = std::getenv(ProcessSupervisor::XID_ENV);
                if (env) xid_arg = env;
            }
            if (xid_arg.empty()) throw Error(ErrorKind::UnknownTarget, "no container given (-w, -s or $TABMUX_XID)");
            auto xid = parse_window_id(xid_arg);
            if (!xid) throw Error(ErrorKind::UnknownTarget, "bad window id '" + xid_arg + "'");
            path = socket_path_for(*xid);
        }

        int fd = connect_to(path);
        send_line(fd, line);

        bool ok = false;
        bool replied = false;
        read_lines(fd, [&](const std::string &reply) {
            json j = json::parse(reply, nullptr, false);
            if (j.is_discarded()) {
                TABMUX_LOG_WARN("tabctrl", "malformed reply: {}", reply);
                return true;
            }
            if (raw_json) std::cout << reply << std::endl;
            if (j.contains("event")) {
                if (!raw_json) std::cout << display(j["event"]) << ' ' << compact(j["payload"]) << std::endl;
                return true;
            }
            if (replied) return true;
            replied = true;
            ok = j.value("ok", false);
            if (ok) {
                if (!raw_json) print_result(cmd.kind, j["result"]);
            } else if (!raw_json) {
                const json &e = j["error"];
                std::cerr << "tabctrl: " << display(e["kind"]) << ": " << display(e["message"]) << '\n';
            }
            // subscribers keep reading events until the container goes away
            return cmd.kind == CommandKind::Subscribe && ok;
        });
        close(fd);
        if (!replied) throw Error(ErrorKind::ConnectionLost, "no reply from " + path);
        return ok ? 0 : 1;
    } catch (const Error &e) {
        std::cerr << "tabctrl: " << to_string(e.kind()) << ": " << e.what() << '\n';
        return 1;
    }
}
