#pragma once

#include "config.hpp"
#include "control.hpp"
#include "embedder.hpp"
#include "events.hpp"
#include "geometry.hpp"
#include "process_supervisor.hpp"
#include "tab_registry.hpp"
#include "window_system.hpp"

#include <functional>
#include <optional>
#include <string>

namespace tabmux {

enum class CloseReason {
    User,             // close-tab, middle click, quit
    WindowDestroyed,  // DestroyNotify for the client window
    WindowLost,       // client reparented away by someone else
    ProcessExited,    // owned child reaped
};

// -----------------------------
// Container (core) - owns the tab registry and routes every classified event
// and command to the embedder, supervisor and geometry engine
// -----------------------------
//
// Every path that ends a tab funnels into close(), which is idempotent: a
// DestroyNotify and the exit of the owning process for the same tab converge
// there in whichever order they arrive, and the second finds nothing to do.
class Container {
public:
    using EventSink = std::function<void(const std::string&, const json&)>;

    Container(WindowSystem &ws, ProcessSupervisor &sup, Config cfg, Size size);

    // Core operations (from control commands, key bindings and the strip)
    TabId open(const SpawnSpec &spec);
    TabId adopt_external(WindowID w);
    bool activate(TabId id);
    bool close(TabId id, CloseReason reason = CloseReason::User);
    bool reorder(TabId id, std::size_t new_index);
    bool rename(TabId id, const std::string &title);
    bool cycle(int delta);
    bool move_active(int delta);
    bool detach(TabId id);
    std::size_t detach_all();
    void quit();
    // Connection lost: terminate owned children and stop.
    void shutdown();

    void handle(const WindowEvent &e);
    void handle_exit(const ExitStatus &ex);

    // Applies a validated control command. Throws Error for recoverable
    // failures (SpawnError, UnknownTarget, ProtocolViolation).
    json execute(const Command &c);

    void resize(Size s);
    void set_config(Config cfg);
    const Config &config() const { return cfg_; }

    void on_event(EventSink sink) { sink_ = std::move(sink); }
    void on_reload(std::function<void()> fn) { reload_ = std::move(fn); }

    const TabRegistry &registry() const { return registry_; }
    const Embedder &embedder() const { return embedder_; }
    const Layout &layout() const { return layout_; }
    std::size_t first_visible() const;
    std::optional<TabId> shown() const { return shown_; }

    bool running() const { return running_; }
    bool needs_redraw() const { return dirty_; }
    void clear_redraw() { dirty_ = false; }

    json describe_tab(const Tab &t) const;
    json describe_tabs() const;
    json describe_geometry() const;

private:
    void on(const ev::Create &e);
    void on(const ev::Reparent &e);
    void on(const ev::Destroy &e);
    void on(const ev::MapRequest &e);
    void on(const ev::ConfigureRequest &e);
    void on(const ev::Resize &e);
    void on(const ev::PropertyChange &e);
    void on(const ev::XEmbed &e);
    void on(const ev::DeleteRequest &e);
    void on(const ev::FocusChange &e);
    void on(const ev::Expose &e);
    void on(const ev::KeyPress &e);
    void on(const ev::ButtonPress &e);

    // A window showed up inside the container; give it a tab.
    void claim(WindowID w, bool created_inside);
    void complete_embedding(TabId id);
    void sync_active();
    void relayout(bool force_resize = false);
    void refresh_title(Tab &t);
    void refresh_urgency(Tab &t);
    TabId resolve(const TabRef &ref) const;
    void emit(const std::string &type, const json &payload);

    WindowSystem &ws_;
    ProcessSupervisor &sup_;
    Config cfg_;
    Size size_;
    TabRegistry registry_;
    Embedder embedder_;
    Layout layout_;
    std::optional<TabId> shown_;  // tab whose window is mapped
    bool running_ = true;
    bool dirty_ = true;
    EventSink sink_;
    std::function<void()> reload_;
};

}  // namespace tabmux
