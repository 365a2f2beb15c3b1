#pragma once

#include "error.hpp"
#include "window_system.hpp"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

struct pollfd;

namespace tabmux {

using json = nlohmann::json;

// -----------------------------
// Command set understood by the control socket and key bindings
// -----------------------------
enum class CommandKind {
    NewTab,
    CloseTab,
    ActivateTab,
    NextTab,
    PrevTab,
    ListTabs,
    QueryGeometry,
    ReorderTab,
    MoveTab,
    Attach,
    DetachTab,
    DetachAll,
    ReloadConfig,
    Subscribe,
    Quit,
};

const char *command_name(CommandKind kind);

// "active", a tab index, or "id:N" for a stable tab id
struct TabRef {
    enum class Kind { Active, Index, Id };
    Kind kind = Kind::Active;
    uint64_t value = 0;
};

struct Command {
    CommandKind kind = CommandKind::ListTabs;
    std::vector<std::string> argv;  // new-tab
    TabRef target;                  // close-tab, activate-tab, reorder-tab, detach-tab
    std::size_t new_index = 0;      // reorder-tab
    int delta = 0;                  // move-tab
    WindowID window = 0;            // attach
};

// Validates a command line against the closed set. Throws
// Error(InvalidCommand) for unknown verbs or bad arguments.
Command parse_command(const std::string &line);

json ok_reply(json result = nullptr);
json error_reply(ErrorKind kind, const std::string &message);

// One protocol line. Strings that are not valid UTF-8 (client titles can be
// anything) come out with U+FFFD in place of the bad bytes.
std::string dump_line(const json &j);

// $XDG_RUNTIME_DIR/tabmux-<xid>.sock, or /tmp/tabmux-<uid>-<xid>.sock.
std::string socket_path_for(WindowID xid);

// -----------------------------
// Control server: per-container UNIX socket. Reads command lines from any
// number of clients, validates them and queues them for the dispatcher.
// Replies are one JSON object per line.
// -----------------------------
class ControlServer {
public:
    using ClientId = uint64_t;

    struct Request {
        ClientId client;
        Command command;
    };

    using RejectHandler = std::function<void(const Error&)>;

    explicit ControlServer(std::string sockpath);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer &operator=(const ControlServer&) = delete;

    bool start();
    void stop();
    const std::string &path() const { return sockpath_; }

    void on_reject(RejectHandler handler) { reject_ = std::move(handler); }

    // Descriptors to wait on; handle_ready consumes the poll results for them.
    void collect_fds(std::vector<pollfd> &fds) const;
    void handle_ready(const std::vector<pollfd> &fds);

    // Also the entry point for lines that do not come from a socket.
    void submit_line(ClientId client, const std::string &line);

    bool has_requests() const { return !queue_.empty(); }
    std::deque<Request> take_requests();

    void reply(ClientId client, const json &j);
    void subscribe(ClientId client);

    // Emit events to subscribed clients as JSON lines.
    void emit_event(const std::string &type, const json &payload);

    size_t client_count() const { return clients_.size(); }

private:
    struct Client {
        int fd = -1;
        std::string inbuf;
        bool subscribed = false;
    };

    void accept_clients();
    void read_client(ClientId id);
    void drop_client(ClientId id);
    void send_to(ClientId id, const std::string &s);

    std::string sockpath_;
    int server_fd_ = -1;
    ClientId next_client_ = 1;
    std::map<ClientId, Client> clients_;
    std::deque<Request> queue_;
    RejectHandler reject_;
};

}  // namespace tabmux
