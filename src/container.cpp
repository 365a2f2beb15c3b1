#include "container.hpp"

#include "log.hpp"

#include <vector>

namespace tabmux {

namespace {

// modifiers that take part in binding lookups; Lock and NumLock do not
constexpr uint16_t BINDING_MODS = MOD_SHIFT | MOD_CONTROL | MOD_ALT | MOD_SUPER;

json rect_json(const Geometry &g) {
    return json{{"x", g.x}, {"y", g.y}, {"w", g.w}, {"h", g.h}};
}

}  // namespace

Container::Container(WindowSystem &ws, ProcessSupervisor &sup, Config cfg, Size size)
    : ws_(ws), sup_(sup), cfg_(std::move(cfg)), size_(size), embedder_(ws) {
    layout_ = compute_layout(size_, 0, cfg_.layout);
}

// -----------------------------
// Core operations
// -----------------------------

TabId Container::open(const SpawnSpec &spec) {
    TabId id = registry_.add(TabState::Spawning);
    pid_t pid = 0;
    try {
        pid = sup_.spawn(spec);
    } catch (const Error&) {
        registry_.remove(id);
        throw;
    }
    Tab *t = registry_.find(id);
    t->child_process = pid;
    t->title = spec.argv.empty() ? std::string() : spec.argv.front();
    registry_.set_state(id, TabState::AwaitingEmbed);
    TABMUX_LOG_INFO("container", "tab {} spawned pid={}", id, pid);

    relayout();
    emit("tab-added", describe_tab(*t));
    return id;
}

TabId Container::adopt_external(WindowID w) {
    if (w == ws_.container() || w == ws_.root())
        throw Error(ErrorKind::ProtocolViolation, "cannot attach the container or root window");
    if (registry_.find_by_window(w) || embedder_.is_pending(w) || embedder_.is_embedded(w))
        throw Error(ErrorKind::ProtocolViolation, "window " + std::to_string(w) + " is already managed");

    TabId id = registry_.add(TabState::AwaitingEmbed, std::nullopt, w);
    relayout();
    if (!embedder_.begin(w, layout_.content)) {
        registry_.remove(id);
        relayout();
        throw Error(ErrorKind::ProtocolViolation, "window " + std::to_string(w) + " cannot be adopted");
    }
    TABMUX_LOG_INFO("container", "tab {} adopting external window {}", id, w);
    emit("tab-added", describe_tab(*registry_.find(id)));
    return id;
}

bool Container::activate(TabId id) {
    if (!registry_.set_active(id)) return false;
    sync_active();
    return true;
}

bool Container::close(TabId id, CloseReason reason) {
    Tab *t = registry_.find(id);
    if (!t || t->state == TabState::Closing || t->state == TabState::Closed) return false;

    registry_.set_state(id, TabState::Closing);
    if (shown_ == id) shown_.reset();  // released below, not hidden

    if (t->client_window) {
        WindowID w = *t->client_window;
        switch (reason) {
            case CloseReason::User:
            case CloseReason::ProcessExited:
                embedder_.release(w, true);
                break;
            case CloseReason::WindowDestroyed:
            case CloseReason::WindowLost:
                embedder_.release(w, false);
                embedder_.forget(w);
                break;
        }
    }
    if (t->child_process && (reason == CloseReason::User || reason == CloseReason::WindowDestroyed))
        sup_.terminate(*t->child_process);

    auto removed = registry_.remove(id);
    TABMUX_LOG_INFO("container", "tab {} closed ({} tabs left)", id, registry_.size());

    relayout();
    sync_active();
    emit("tab-removed", json{{"id", id}});

    if (registry_.empty() && cfg_.exit_when_empty) {
        TABMUX_LOG_INFO("container", "last tab closed, exiting");
        running_ = false;
    }
    return removed.has_value();
}

bool Container::reorder(TabId id, std::size_t new_index) {
    if (!registry_.move(id, new_index)) return false;
    dirty_ = true;
    return true;
}

bool Container::rename(TabId id, const std::string &title) {
    Tab *t = registry_.find(id);
    if (!t) return false;
    if (t->title == title) return true;
    registry_.rename(id, title);
    dirty_ = true;
    emit("title", json{{"id", id}, {"title", title}});
    return true;
}

bool Container::cycle(int delta) {
    auto target = registry_.cycle(delta);
    return target && activate(*target);
}

bool Container::move_active(int delta) {
    auto idx = registry_.active_index();
    std::size_t n = registry_.size();
    if (!idx || n < 2) return false;
    long long m = static_cast<long long>(n);
    long long to = ((static_cast<long long>(*idx) + delta) % m + m) % m;
    return reorder(*registry_.active(), static_cast<std::size_t>(to));
}

bool Container::detach(TabId id) {
    Tab *t = registry_.find(id);
    if (!t || !t->client_window || t->state == TabState::Closing) return false;

    WindowID w = *t->client_window;
    registry_.set_state(id, TabState::Closing);
    if (shown_ == id) shown_.reset();
    embedder_.detach(w);
    // the process keeps running and stays supervised until it exits
    registry_.remove(id);
    TABMUX_LOG_INFO("container", "tab {} detached window {}", id, w);

    relayout();
    sync_active();
    emit("tab-removed", json{{"id", id}, {"detached", true}});
    if (registry_.empty() && cfg_.exit_when_empty) running_ = false;
    return true;
}

std::size_t Container::detach_all() {
    std::size_t n = 0;
    std::vector<TabId> ids = registry_.order();
    for (TabId id : ids) {
        if (detach(id)) ++n;
    }
    return n;
}

void Container::quit() {
    std::vector<TabId> ids = registry_.order();
    for (TabId id : ids) close(id, CloseReason::User);
    running_ = false;
}

void Container::shutdown() {
    sup_.terminate_all();
    running_ = false;
}

// -----------------------------
// Window events
// -----------------------------

void Container::handle(const WindowEvent &e) {
    std::visit([this](const auto &event) { on(event); }, e);
}

void Container::on(const ev::Create &e) {
    if (e.parent != ws_.container() || e.override_redirect) return;
    claim(e.window, true);
}

void Container::on(const ev::Reparent &e) {
    Tab *t = registry_.find_by_window(e.window);
    if (e.parent == ws_.container()) {
        if (!t) {
            claim(e.window, false);
        } else if (embedder_.is_pending(e.window)) {
            if (embedder_.acknowledge(e.window, e.parent, layout_.content)) complete_embedding(t->id);
        } else {
            TABMUX_LOG_DEBUG("container", "window {} reparented into container twice", e.window);
        }
        return;
    }
    if (!t) {
        if (embedder_.left(e.window)) TABMUX_LOG_DEBUG("container", "detached window {} is out", e.window);
        return;
    }
    // moved out by someone else, during or after the handshake
    if (embedder_.is_pending(e.window)) embedder_.acknowledge(e.window, e.parent, layout_.content);
    TABMUX_LOG_INFO("container", "window {} of tab {} left the container", e.window, t->id);
    close(t->id, CloseReason::WindowLost);
}

void Container::on(const ev::Destroy &e) {
    if (Tab *t = registry_.find_by_window(e.window)) {
        close(t->id, CloseReason::WindowDestroyed);
    } else if (embedder_.forget(e.window)) {
        TABMUX_LOG_DEBUG("container", "departed window {} destroyed", e.window);
    }
}

void Container::on(const ev::MapRequest &e) {
    Tab *t = registry_.find_by_window(e.window);
    if (!t) {
        claim(e.window, true);
        return;
    }
    // visibility is ours to decide; only the active tab gets mapped
    if (shown_ == t->id && embedder_.is_embedded(e.window))
        embedder_.show(e.window, layout_.content);
}

void Container::on(const ev::ConfigureRequest &e) {
    Tab *t = registry_.find_by_window(e.window);
    if (!t) {
        TABMUX_LOG_DEBUG("container", "ignoring configure request from unknown window {}", e.window);
        return;
    }
    // clients do not get to pick their own size
    ws_.configure(e.window, layout_.content);
}

void Container::on(const ev::Resize &e) {
    resize({e.w, e.h});
}

void Container::on(const ev::PropertyChange &e) {
    Tab *t = registry_.find_by_window(e.window);
    if (!t) return;
    if (e.what == ev::Property::Title) refresh_title(*t);
    else refresh_urgency(*t);
}

void Container::on(const ev::XEmbed &e) {
    // clients address their requests to the embedder window; those come from
    // the mapped one
    WindowID from = e.window;
    if (from == ws_.container() && shown_) {
        const Tab *s = registry_.find(*shown_);
        if (s && s->client_window) from = *s->client_window;
    }
    Tab *t = registry_.find_by_window(from);
    if (!t || !embedder_.is_embedded(from)) {
        TABMUX_LOG_WARN("embed", "ProtocolViolation: XEmbed opcode {} from unmanaged window {}", e.opcode, from);
        return;
    }
    switch (static_cast<XEmbedMessage>(e.opcode)) {
        case XEmbedMessage::RequestFocus:
            activate(t->id);
            break;
        case XEmbedMessage::FocusNext:
            cycle(1);
            break;
        case XEmbedMessage::FocusPrev:
            cycle(-1);
            break;
        case XEmbedMessage::ModalityOn:
        case XEmbedMessage::ModalityOff:
            break;
        default:
            TABMUX_LOG_WARN("embed", "ProtocolViolation: unexpected XEmbed opcode {} from window {}", e.opcode, from);
            break;
    }
}

void Container::on(const ev::DeleteRequest&) {
    TABMUX_LOG_INFO("container", "container window closed");
    quit();
}

void Container::on(const ev::FocusChange &e) {
    if (!shown_) return;
    const Tab *t = registry_.find(*shown_);
    if (!t || !t->client_window) return;
    if (e.what == ev::Focus::In) {
        embedder_.refocus(*t->client_window);
        embedder_.set_window_active(*t->client_window, true);
    } else {
        embedder_.set_window_active(*t->client_window, false);
    }
}

void Container::on(const ev::Expose&) {
    dirty_ = true;
}

void Container::on(const ev::KeyPress &e) {
    uint16_t state = e.state & BINDING_MODS;
    for (const auto &kb : cfg_.keybinds) {
        if (kb.keycode != e.keycode || kb.modifiers != state) continue;
        try {
            execute(parse_command(kb.command));
        } catch (const Error &err) {
            TABMUX_LOG_WARN("input", "binding '{}' failed: {}", kb.command, err.what());
        }
        return;
    }
}

void Container::on(const ev::ButtonPress &e) {
    if (e.y < layout_.strip.y || e.y >= layout_.strip.y + layout_.strip.h) return;
    switch (e.button) {
        case 4: cycle(-1); return;
        case 5: cycle(1); return;
        default: break;
    }
    auto index = tab_at(layout_, first_visible(), e.x, e.y);
    if (!index) return;
    auto id = registry_.at(*index);
    if (!id) return;
    if (e.button == 1) activate(*id);
    else if (e.button == 2) close(*id, CloseReason::User);
}

void Container::handle_exit(const ExitStatus &ex) {
    Tab *t = registry_.find_by_pid(ex.pid);
    if (!t) {
        TABMUX_LOG_DEBUG("container", "pid {} exited with no tab", ex.pid);
        return;
    }
    TABMUX_LOG_INFO("container", "tab {} process {} exited (code={} signal={})", t->id, ex.pid, ex.code, ex.signal);
    close(t->id, CloseReason::ProcessExited);
}

// -----------------------------
// Commands
// -----------------------------

json Container::execute(const Command &c) {
    switch (c.kind) {
        case CommandKind::NewTab: {
            TabId id = open(SpawnSpec{c.argv, {}});
            return json{{"id", id}, {"index", *registry_.index_of(id)}};
        }
        case CommandKind::CloseTab: {
            TabId id = resolve(c.target);
            close(id, CloseReason::User);
            return json{{"id", id}};
        }
        case CommandKind::ActivateTab: {
            TabId id = resolve(c.target);
            return json{{"id", id}, {"activated", activate(id)}};
        }
        case CommandKind::NextTab:
            return json{{"changed", cycle(1)}};
        case CommandKind::PrevTab:
            return json{{"changed", cycle(-1)}};
        case CommandKind::ListTabs:
            return describe_tabs();
        case CommandKind::QueryGeometry:
            return describe_geometry();
        case CommandKind::ReorderTab: {
            TabId id = resolve(c.target);
            if (!reorder(id, c.new_index))
                throw Error(ErrorKind::UnknownTarget, "no position " + std::to_string(c.new_index));
            return json{{"id", id}, {"index", c.new_index}};
        }
        case CommandKind::MoveTab:
            return json{{"changed", move_active(c.delta)}};
        case CommandKind::Attach: {
            TabId id = adopt_external(c.window);
            return json{{"id", id}};
        }
        case CommandKind::DetachTab: {
            TabId id = resolve(c.target);
            if (!detach(id)) throw Error(ErrorKind::UnknownTarget, "tab " + std::to_string(id) + " has no window to detach");
            return json{{"id", id}};
        }
        case CommandKind::DetachAll:
            return json{{"detached", detach_all()}};
        case CommandKind::ReloadConfig:
            if (reload_) reload_();
            return nullptr;
        case CommandKind::Subscribe:
            return nullptr;
        case CommandKind::Quit:
            quit();
            return nullptr;
    }
    throw Error(ErrorKind::InvalidCommand, "unhandled command");
}

TabId Container::resolve(const TabRef &ref) const {
    switch (ref.kind) {
        case TabRef::Kind::Active:
            if (auto id = registry_.active()) return *id;
            throw Error(ErrorKind::UnknownTarget, "no active tab");
        case TabRef::Kind::Index:
            if (auto id = registry_.at(static_cast<std::size_t>(ref.value))) return *id;
            throw Error(ErrorKind::UnknownTarget, "no tab at index " + std::to_string(ref.value));
        case TabRef::Kind::Id:
            if (registry_.find(ref.value)) return ref.value;
            throw Error(ErrorKind::UnknownTarget, "no tab with id " + std::to_string(ref.value));
    }
    throw Error(ErrorKind::UnknownTarget, "bad tab reference");
}

// -----------------------------
// Helpers
// -----------------------------

void Container::claim(WindowID w, bool created_inside) {
    if (w == ws_.container() || w == ws_.root()) return;
    if (registry_.find_by_window(w)) return;
    // closed or detached: late notifies and remaps are not new clients
    if (embedder_.is_departing(w)) {
        TABMUX_LOG_DEBUG("container", "ignoring departing window {}", w);
        return;
    }

    Tab *t = nullptr;
    if (auto pid = ws_.window_pid(w)) {
        Tab *owner = registry_.find_by_pid(*pid);
        if (owner && owner->state == TabState::AwaitingEmbed && !owner->client_window) t = owner;
    }
    // a window created right inside the container comes from one of our
    // spawned clients; hand it to the oldest one still waiting
    if (!t && created_inside) t = registry_.first_unclaimed();

    bool fresh = false;
    if (t) {
        t->client_window = w;
    } else {
        TabId id = registry_.add(TabState::AwaitingEmbed, std::nullopt, w);
        t = registry_.find(id);
        fresh = true;
        relayout();
    }
    TabId id = t->id;

    if (!embedder_.begin(w, layout_.content)) {
        if (fresh) {
            registry_.remove(id);
            relayout();
        } else {
            t->client_window.reset();
        }
        return;
    }
    TABMUX_LOG_DEBUG("container", "window {} claimed by tab {}", w, id);
    if (fresh) emit("tab-added", describe_tab(*registry_.find(id)));
}

void Container::complete_embedding(TabId id) {
    registry_.set_state(id, TabState::Embedded);
    Tab *t = registry_.find(id);
    refresh_title(*t);
    refresh_urgency(*t);
    if (cfg_.focus_new) registry_.set_active(id);
    TABMUX_LOG_INFO("container", "tab {} embedded window {}", id, *t->client_window);
    emit("tab-embedded", describe_tab(*t));
    sync_active();
    dirty_ = true;
}

void Container::sync_active() {
    auto want = registry_.active();
    if (want == shown_) return;

    if (shown_) {
        const Tab *old = registry_.find(*shown_);
        if (old && old->client_window) embedder_.hide(*old->client_window);
    }
    shown_ = want;
    if (shown_) {
        const Tab *t = registry_.find(*shown_);
        embedder_.show(*t->client_window, layout_.content);
        emit("focus", json{{"id", t->id}, {"index", *registry_.index_of(t->id)}, {"title", t->title}});
    }
    dirty_ = true;
}

void Container::relayout(bool force_resize) {
    Geometry old_content = layout_.content;
    layout_ = compute_layout(size_, registry_.size(), cfg_.layout);
    dirty_ = true;
    if (!force_resize && layout_.content == old_content) return;

    for (TabId id : registry_.order()) {
        const Tab *t = registry_.find(id);
        if (t->state == TabState::Embedded && t->client_window) embedder_.resize(*t->client_window, layout_.content);
    }
    emit("layout", describe_geometry());
}

void Container::resize(Size s) {
    if (s.w == size_.w && s.h == size_.h) return;
    size_ = s;
    relayout();
}

void Container::set_config(Config cfg) {
    cfg_ = std::move(cfg);
    relayout(true);
}

void Container::refresh_title(Tab &t) {
    if (!t.client_window) return;
    std::string title = ws_.window_title(*t.client_window);
    if (!title.empty()) rename(t.id, title);
}

void Container::refresh_urgency(Tab &t) {
    if (!t.client_window) return;
    bool urgent = ws_.window_urgent(*t.client_window);
    if (urgent == t.urgent) return;
    if (registry_.set_urgent(t.id, urgent)) {
        dirty_ = true;
        emit("urgent", json{{"id", t.id}, {"urgent", urgent}});
    }
}

std::size_t Container::first_visible() const {
    return first_visible_tab(layout_, registry_.active_index());
}

json Container::describe_tab(const Tab &t) const {
    json j{
        {"id", t.id},
        {"index", registry_.index_of(t.id).value_or(0)},
        {"title", t.title},
        {"urgent", t.urgent},
        {"state", to_string(t.state)},
        {"active", registry_.active() == t.id},
    };
    j["window"] = t.client_window ? json(*t.client_window) : json(nullptr);
    j["pid"] = t.child_process ? json(*t.child_process) : json(nullptr);
    return j;
}

json Container::describe_tabs() const {
    json arr = json::array();
    for (TabId id : registry_.order()) arr.push_back(describe_tab(*registry_.find(id)));
    return arr;
}

json Container::describe_geometry() const {
    return json{
        {"container", {{"w", size_.w}, {"h", size_.h}}},
        {"strip", rect_json(layout_.strip)},
        {"content", rect_json(layout_.content)},
        {"tab_width", layout_.tab_width},
        {"visible_tabs", layout_.visible_tabs},
        {"overflow", layout_.overflow},
        {"first_visible", first_visible()},
    };
}

void Container::emit(const std::string &type, const json &payload) {
    if (sink_) sink_(type, payload);
}

}  // namespace tabmux
