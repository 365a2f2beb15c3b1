#include "process_supervisor.hpp"

#include "error.hpp"
#include "log.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace tabmux {

std::vector<std::string> ProcessSupervisor::expand_argv(const std::vector<std::string> &argv) const {
    std::vector<std::string> out;
    out.reserve(argv.size());
    const std::string placeholder = XID_PLACEHOLDER;
    const std::string xid = std::to_string(embed_target_);
    for (auto arg : argv) {
        size_t pos = 0;
        while ((pos = arg.find(placeholder, pos)) != std::string::npos) {
            arg.replace(pos, placeholder.size(), xid);
            pos += xid.size();
        }
        out.push_back(std::move(arg));
    }
    return out;
}

pid_t ProcessSupervisor::spawn(const SpawnSpec &spec) {
    if (spec.argv.empty() || spec.argv[0].empty())
        throw Error(ErrorKind::SpawnError, "empty command");

    std::vector<std::string> args = expand_argv(spec.argv);
    std::vector<char*> argv;
    for (auto &a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    // our environment, overridden by the hint and the caller's entries
    std::map<std::string, std::string> env_map;
    for (char **e = environ; e && *e; ++e) {
        const char *eq = std::strchr(*e, '=');
        if (eq) env_map[std::string(*e, eq - *e)] = eq + 1;
    }
    if (embed_target_) env_map[XID_ENV] = std::to_string(embed_target_);
    for (auto &kv : spec.env) env_map[kv.first] = kv.second;
    std::vector<std::string> env_strings;
    for (auto &kv : env_map) env_strings.push_back(kv.first + "=" + kv.second);
    std::vector<char*> envp;
    for (auto &s : env_strings) envp.push_back(const_cast<char*>(s.c_str()));
    envp.push_back(nullptr);

    // the dispatcher blocks SIGCHLD for its signalfd; children start clean
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t empty;
    sigemptyset(&empty);
    posix_spawnattr_setsigmask(&attr, &empty);
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGCHLD);
    sigaddset(&defaults, SIGTERM);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGHUP);
    sigaddset(&defaults, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaults);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSID);

    pid_t pid = 0;
    int ret = posix_spawnp(&pid, argv[0], nullptr, &attr, argv.data(), envp.data());
    posix_spawnattr_destroy(&attr);

    if (ret != 0) {
        TABMUX_LOG_WARN("supervisor", "cannot launch {}: {}", args[0], std::strerror(ret));
        throw Error(ErrorKind::SpawnError, args[0] + ": " + std::strerror(ret));
    }

    Child child;
    child.pid = pid;
    child.command = args[0];
    children_[pid] = std::move(child);
    TABMUX_LOG_INFO("supervisor", "spawned {} pid={}", args[0], pid);
    return pid;
}

bool ProcessSupervisor::terminate(pid_t pid) {
    auto it = children_.find(pid);
    if (it == children_.end()) return false;
    if (it->second.term_sent) return true;
    if (::kill(pid, SIGTERM) != 0 && errno != ESRCH) {
        TABMUX_LOG_WARN("supervisor", "kill({}) failed: {}", pid, std::strerror(errno));
        return false;
    }
    it->second.term_sent = true;
    TABMUX_LOG_DEBUG("supervisor", "sent SIGTERM to pid={}", pid);
    return true;
}

std::vector<ExitStatus> ProcessSupervisor::poll_exits() {
    std::vector<ExitStatus> exits;
    for (auto it = children_.begin(); it != children_.end();) {
        int status = 0;
        pid_t r = ::waitpid(it->first, &status, WNOHANG);
        if (r == 0) { ++it; continue; }
        if (r < 0 && errno == EINTR) { ++it; continue; }

        ExitStatus ex;
        ex.pid = it->first;
        if (r > 0) {
            if (WIFEXITED(status)) { ex.exited = true; ex.code = WEXITSTATUS(status); }
            else if (WIFSIGNALED(status)) { ex.signal = WTERMSIG(status); }
        } else {
            // ECHILD: somebody else reaped it, report it gone anyway
            ex.exited = true;
        }
        TABMUX_LOG_DEBUG("supervisor", "reaped pid={} code={} signal={}", ex.pid, ex.code, ex.signal);
        exits.push_back(ex);
        it = children_.erase(it);
    }
    return exits;
}

void ProcessSupervisor::terminate_all() {
    for (auto &entry : children_) {
        if (!entry.second.term_sent && ::kill(entry.first, SIGTERM) == 0) entry.second.term_sent = true;
    }
}

}  // namespace tabmux
