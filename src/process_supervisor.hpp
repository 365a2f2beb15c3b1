#pragma once

#include <cstdint>
#include <string>
#include <sys/types.h>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tabmux {

struct SpawnSpec {
    std::vector<std::string> argv;
    std::vector<std::pair<std::string, std::string>> env;  // added on top of ours
};

struct ExitStatus {
    pid_t pid = 0;
    bool exited = false;   // normal exit, see code
    int code = 0;
    int signal = 0;        // set when killed by a signal
};

// Spawns and reaps the tab client processes.
//
// Spawned children are told where to embed through the TABMUX_XID
// environment variable and through any "{xid}" argument, which is replaced
// by the container window id. Virtual so the container can be driven by a
// fake in tests.
class ProcessSupervisor {
public:
    static constexpr const char *XID_ENV = "TABMUX_XID";
    static constexpr const char *XID_PLACEHOLDER = "{xid}";

    ProcessSupervisor() = default;
    virtual ~ProcessSupervisor() = default;

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor&) = delete;

    void set_embed_target(uint32_t xid) { embed_target_ = xid; }
    uint32_t embed_target() const { return embed_target_; }

    // Launches spec.argv. Throws Error(SpawnError) if it cannot be executed.
    virtual pid_t spawn(const SpawnSpec &spec);

    // SIGTERM to a tracked child. False if the pid is not ours.
    virtual bool terminate(pid_t pid);

    // Non-blocking; every tracked child that exited since the last call.
    virtual std::vector<ExitStatus> poll_exits();

    void terminate_all();

    bool owns(pid_t pid) const { return children_.count(pid) != 0; }
    size_t process_count() const { return children_.size(); }

    // argv with the placeholder substituted, as passed to exec
    std::vector<std::string> expand_argv(const std::vector<std::string> &argv) const;

protected:
    struct Child {
        pid_t pid = 0;
        std::string command;
        bool term_sent = false;
    };
    std::unordered_map<pid_t, Child> children_;

private:
    uint32_t embed_target_ = 0;
};

}  // namespace tabmux
