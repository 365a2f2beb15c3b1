#include "control.hpp"

#include "log.hpp"
#include "strings.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace tabmux {

namespace {

constexpr size_t MAX_LINE = 64 * 1024;

struct Verb {
    const char *name;
    CommandKind kind;
};

const Verb VERBS[] = {
    {"new-tab", CommandKind::NewTab},
    {"close-tab", CommandKind::CloseTab},
    {"activate-tab", CommandKind::ActivateTab},
    {"next-tab", CommandKind::NextTab},
    {"prev-tab", CommandKind::PrevTab},
    {"list-tabs", CommandKind::ListTabs},
    {"query-geometry", CommandKind::QueryGeometry},
    {"reorder-tab", CommandKind::ReorderTab},
    {"move-tab", CommandKind::MoveTab},
    {"attach", CommandKind::Attach},
    {"detach-tab", CommandKind::DetachTab},
    {"detach-all", CommandKind::DetachAll},
    {"reload-config", CommandKind::ReloadConfig},
    {"subscribe", CommandKind::Subscribe},
    {"quit", CommandKind::Quit},
};

[[noreturn]] void invalid(const std::string &msg) {
    throw Error(ErrorKind::InvalidCommand, msg);
}

void expect_args(const std::vector<std::string> &w, size_t min, size_t max) {
    size_t n = w.size() - 1;
    if (n < min || n > max) {
        if (min == max) invalid(w[0] + " takes " + std::to_string(min) + " argument(s)");
        invalid(w[0] + " takes " + std::to_string(min) + " to " + std::to_string(max) + " arguments");
    }
}

std::size_t parse_index(const std::string &verb, const std::string &s) {
    auto v = parse_integer(s);
    if (!v || *v < 0) invalid(verb + ": bad tab index '" + s + "'");
    return static_cast<std::size_t>(*v);
}

TabRef parse_ref(const std::string &verb, const std::string &s) {
    TabRef ref;
    if (s == "active") {
        ref.kind = TabRef::Kind::Active;
    } else if (s.rfind("id:", 0) == 0) {
        auto v = parse_integer(s.substr(3));
        if (!v || *v <= 0) invalid(verb + ": bad tab id '" + s + "'");
        ref.kind = TabRef::Kind::Id;
        ref.value = static_cast<uint64_t>(*v);
    } else {
        ref.kind = TabRef::Kind::Index;
        ref.value = parse_index(verb, s);
    }
    return ref;
}

}  // namespace

const char *command_name(CommandKind kind) {
    for (auto &v : VERBS) {
        if (v.kind == kind) return v.name;
    }
    return "unknown";
}

Command parse_command(const std::string &line) {
    std::vector<std::string> w;
    std::string err;
    if (!split_words(line, w, &err)) invalid(err);
    if (w.empty()) invalid("empty command");

    const Verb *verb = nullptr;
    for (auto &v : VERBS) {
        if (w[0] == v.name) { verb = &v; break; }
    }
    if (!verb) invalid("unknown command '" + w[0] + "'");

    Command c;
    c.kind = verb->kind;
    switch (c.kind) {
        case CommandKind::NewTab:
            if (w.size() < 2) invalid("new-tab needs a command");
            c.argv.assign(w.begin() + 1, w.end());
            break;
        case CommandKind::CloseTab:
        case CommandKind::DetachTab:
            expect_args(w, 0, 1);
            c.target = w.size() == 2 ? parse_ref(w[0], w[1]) : TabRef{};
            break;
        case CommandKind::ActivateTab:
            expect_args(w, 1, 1);
            c.target = parse_ref(w[0], w[1]);
            break;
        case CommandKind::ReorderTab:
            expect_args(w, 2, 2);
            c.target = parse_ref(w[0], w[1]);
            c.new_index = parse_index(w[0], w[2]);
            break;
        case CommandKind::MoveTab: {
            expect_args(w, 1, 1);
            auto d = parse_integer(w[1]);
            if (!d || *d < -1000 || *d > 1000) invalid("move-tab: bad offset '" + w[1] + "'");
            c.delta = static_cast<int>(*d);
            break;
        }
        case CommandKind::Attach: {
            expect_args(w, 1, 1);
            auto id = parse_window_id(w[1]);
            if (!id) invalid("attach: bad window id '" + w[1] + "'");
            c.window = *id;
            break;
        }
        default:
            expect_args(w, 0, 0);
            break;
    }
    return c;
}

json ok_reply(json result) {
    return json{{"ok", true}, {"result", std::move(result)}};
}

json error_reply(ErrorKind kind, const std::string &message) {
    return json{{"ok", false}, {"error", {{"kind", to_string(kind)}, {"message", message}}}};
}

std::string dump_line(const json &j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

std::string socket_path_for(WindowID xid) {
    const char *runtime = std::getenv("XDG_RUNTIME_DIR");
    if (runtime && *runtime)
        return std::string(runtime) + "/tabmux-" + std::to_string(xid) + ".sock";
    return "/tmp/tabmux-" + std::to_string(getuid()) + "-" + std::to_string(xid) + ".sock";
}

// -----------------------------
// ControlServer
// -----------------------------

ControlServer::ControlServer(std::string sockpath) : sockpath_(std::move(sockpath)) {}
ControlServer::~ControlServer() { stop(); }

bool ControlServer::start() {
    sockaddr_un addr;
    if (sockpath_.size() >= sizeof(addr.sun_path)) {
        TABMUX_LOG_ERROR("control", "socket path too long: {}", sockpath_);
        return false;
    }
    server_fd_ = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        TABMUX_LOG_ERROR("control", "socket: {}", std::strerror(errno));
        return false;
    }
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, sockpath_.c_str(), sizeof(addr.sun_path) - 1);
    unlink(sockpath_.c_str());
    if (bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || listen(server_fd_, 8) < 0) {
        TABMUX_LOG_ERROR("control", "cannot listen on {}: {}", sockpath_, std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    TABMUX_LOG_INFO("control", "listening on {}", sockpath_);
    return true;
}

void ControlServer::stop() {
    for (auto &kv : clients_) close(kv.second.fd);
    clients_.clear();
    queue_.clear();
    if (server_fd_ >= 0) {
        close(server_fd_);
        server_fd_ = -1;
        unlink(sockpath_.c_str());
    }
}

void ControlServer::collect_fds(std::vector<pollfd> &fds) const {
    if (server_fd_ >= 0) fds.push_back({server_fd_, POLLIN, 0});
    for (auto &kv : clients_) fds.push_back({kv.second.fd, POLLIN, 0});
}

void ControlServer::handle_ready(const std::vector<pollfd> &fds) {
    std::map<int, short> ready;
    for (auto &p : fds) {
        if (p.revents) ready[p.fd] = p.revents;
    }
    if (server_fd_ >= 0 && ready.count(server_fd_)) accept_clients();

    std::vector<ClientId> ids;
    for (auto &kv : clients_) {
        if (ready.count(kv.second.fd)) ids.push_back(kv.first);
    }
    for (ClientId id : ids) read_client(id);
}

void ControlServer::accept_clients() {
    for (;;) {
        int fd = accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                TABMUX_LOG_WARN("control", "accept: {}", std::strerror(errno));
            return;
        }
        Client c;
        c.fd = fd;
        ClientId id = next_client_++;
        clients_[id] = std::move(c);
        TABMUX_LOG_DEBUG("control", "client {} connected", id);
    }
}

void ControlServer::read_client(ClientId id) {
    auto it = clients_.find(id);
    if (it == clients_.end()) return;

    constexpr size_t BUF_SZ = 1024;
    char buf[BUF_SZ];
    ssize_t r;
    bool eof = false;
    while ((r = read(it->second.fd, buf, BUF_SZ)) != 0) {
        if (r < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) eof = true;
            break;
        }
        it->second.inbuf.append(buf, static_cast<size_t>(r));
        if (it->second.inbuf.size() > MAX_LINE) {
            TABMUX_LOG_WARN("control", "client {} sent an oversized line, dropping it", id);
            drop_client(id);
            return;
        }
    }
    if (r == 0) eof = true;

    size_t pos;
    std::string &acc = it->second.inbuf;
    std::vector<std::string> lines;
    while ((pos = acc.find('\n')) != std::string::npos) {
        std::string line = acc.substr(0, pos);
        acc.erase(0, pos + 1);
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
        if (!line.empty()) lines.push_back(std::move(line));
    }
    if (eof && !trim(acc).empty()) {
        lines.push_back(trim(acc));
        acc.clear();
    }
    for (auto &line : lines) submit_line(id, line);
    if (!eof) return;
    // a failed reply may already have dropped the client
    it = clients_.find(id);
    if (it == clients_.end()) return;
    // replies to a half-closed client still go out; dropping waits for them
    if (queue_.empty()) drop_client(id);
    else shutdown(it->second.fd, SHUT_RD);
}

void ControlServer::submit_line(ClientId client, const std::string &line) {
    try {
        Command cmd = parse_command(line);
        TABMUX_LOG_DEBUG("control", "client {}: {}", client, line);
        queue_.push_back({client, std::move(cmd)});
    } catch (const Error &e) {
        TABMUX_LOG_WARN("control", "rejected '{}': {}", line, e.what());
        reply(client, error_reply(e.kind(), e.what()));
        if (reject_) reject_(e);
    }
}

std::deque<ControlServer::Request> ControlServer::take_requests() {
    std::deque<Request> out;
    out.swap(queue_);
    return out;
}

void ControlServer::reply(ClientId client, const json &j) {
    send_to(client, dump_line(j));
}

void ControlServer::subscribe(ClientId client) {
    auto it = clients_.find(client);
    if (it != clients_.end()) it->second.subscribed = true;
}

void ControlServer::emit_event(const std::string &type, const json &payload) {
    std::vector<ClientId> subs;
    for (auto &kv : clients_) {
        if (kv.second.subscribed) subs.push_back(kv.first);
    }
    if (subs.empty()) return;
    std::string line = dump_line(json{{"event", type}, {"payload", payload}});
    for (ClientId id : subs) send_to(id, line);
}

void ControlServer::send_to(ClientId id, const std::string &s) {
    auto it = clients_.find(id);
    if (it == clients_.end()) return;
    size_t off = 0;
    while (off < s.size()) {
        ssize_t w = send(it->second.fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            TABMUX_LOG_WARN("control", "client {} write failed: {}", id, std::strerror(errno));
            drop_client(id);
            return;
        }
        off += static_cast<size_t>(w);
    }
}

void ControlServer::drop_client(ClientId id) {
    auto it = clients_.find(id);
    if (it == clients_.end()) return;
    close(it->second.fd);
    clients_.erase(it);
    TABMUX_LOG_DEBUG("control", "client {} disconnected", id);
}

}  // namespace tabmux
