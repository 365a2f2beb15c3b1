#pragma once

#include "error.hpp"
#include "process_supervisor.hpp"
#include "window_system.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace tabmux::fakes {

constexpr WindowID ROOT = 1;
constexpr WindowID CONTAINER = 100;

// Records every request as a short string, e.g. "reparent 200 100".
class FakeWindowSystem : public WindowSystem {
public:
    WindowID root() const override { return ROOT; }
    WindowID container() const override { return CONTAINER; }

    void watch_client(WindowID w) override { record("watch", w); }
    void reparent(WindowID w, WindowID parent, int, int) override {
        calls.push_back("reparent " + std::to_string(w) + " " + std::to_string(parent));
    }
    void map(WindowID w) override { record("map", w); }
    void unmap(WindowID w) override { record("unmap", w); }
    void configure(WindowID w, const Geometry &g) override {
        record("configure", w);
        last_geometry[w] = g;
    }
    void focus(WindowID w) override { record("focus", w); }
    void send_xembed(WindowID w, XEmbedMessage msg, uint32_t, uint32_t, uint32_t) override {
        calls.push_back("xembed " + std::to_string(w) + " " + std::to_string(static_cast<uint32_t>(msg)));
    }
    void close_window(WindowID w) override { record("close", w); }

    std::string window_title(WindowID w) override {
        auto it = titles.find(w);
        return it == titles.end() ? std::string() : it->second;
    }
    bool window_urgent(WindowID w) override { return urgent[w]; }
    std::optional<pid_t> window_pid(WindowID w) override {
        auto it = pids.find(w);
        if (it == pids.end()) return std::nullopt;
        return it->second;
    }
    void set_container_property(const std::string &name, const std::string &value) override {
        properties[name] = value;
    }

    size_t count(const std::string &call) const {
        return static_cast<size_t>(std::count(calls.begin(), calls.end(), call));
    }
    static std::string xembed(WindowID w, XEmbedMessage msg) {
        return "xembed " + std::to_string(w) + " " + std::to_string(static_cast<uint32_t>(msg));
    }

    std::vector<std::string> calls;
    std::map<WindowID, Geometry> last_geometry;
    std::map<WindowID, std::string> titles;
    std::map<WindowID, bool> urgent;
    std::map<WindowID, pid_t> pids;
    std::map<std::string, std::string> properties;

private:
    void record(const char *what, WindowID w) { calls.push_back(std::string(what) + " " + std::to_string(w)); }
};

// Hands out pids without launching anything. A command named "missing"
// fails the way an unknown executable does.
class FakeSupervisor : public ProcessSupervisor {
public:
    pid_t spawn(const SpawnSpec &spec) override {
        if (spec.argv.empty() || spec.argv[0] == "missing")
            throw Error(ErrorKind::SpawnError, "cannot launch");
        spawned.push_back(spec);
        return next_pid++;
    }
    bool terminate(pid_t pid) override {
        terminated.push_back(pid);
        return true;
    }
    std::vector<ExitStatus> poll_exits() override {
        std::vector<ExitStatus> out;
        out.swap(pending_exits);
        return out;
    }

    bool was_terminated(pid_t pid) const {
        return std::find(terminated.begin(), terminated.end(), pid) != terminated.end();
    }

    pid_t next_pid = 1000;
    std::vector<SpawnSpec> spawned;
    std::vector<pid_t> terminated;
    std::vector<ExitStatus> pending_exits;
};

}  // namespace tabmux::fakes
