#include "tab_registry.hpp"

#include <algorithm>

namespace tabmux {

const char *to_string(TabState s) {
    switch (s) {
        case TabState::Spawning: return "Spawning";
        case TabState::AwaitingEmbed: return "AwaitingEmbed";
        case TabState::Embedded: return "Embedded";
        case TabState::Closing: return "Closing";
        case TabState::Closed: return "Closed";
    }
    return "Unknown";
}

TabId TabRegistry::add(TabState state, std::optional<pid_t> pid, std::optional<WindowID> window) {
    Tab t;
    t.id = next_id_++;
    t.child_process = pid;
    t.client_window = window;
    tabs_.emplace(t.id, t);
    order_.push_back(t.id);
    // activation rules apply to the starting state too
    set_state(t.id, state);
    return t.id;
}

Tab *TabRegistry::find(TabId id) {
    auto it = tabs_.find(id);
    return it == tabs_.end() ? nullptr : &it->second;
}

const Tab *TabRegistry::find(TabId id) const {
    auto it = tabs_.find(id);
    return it == tabs_.end() ? nullptr : &it->second;
}

Tab *TabRegistry::find_by_window(WindowID w) {
    for (auto &kv : tabs_) {
        if (kv.second.client_window && *kv.second.client_window == w) return &kv.second;
    }
    return nullptr;
}

Tab *TabRegistry::find_by_pid(pid_t pid) {
    for (auto &kv : tabs_) {
        if (kv.second.child_process && *kv.second.child_process == pid) return &kv.second;
    }
    return nullptr;
}

Tab *TabRegistry::first_unclaimed() {
    for (TabId id : order_) {
        Tab &t = tabs_.at(id);
        if (t.state == TabState::AwaitingEmbed && !t.client_window) return &t;
    }
    return nullptr;
}

std::optional<std::size_t> TabRegistry::index_of(TabId id) const {
    auto it = std::find(order_.begin(), order_.end(), id);
    if (it == order_.end()) return std::nullopt;
    return static_cast<std::size_t>(it - order_.begin());
}

std::optional<TabId> TabRegistry::at(std::size_t index) const {
    if (index >= order_.size()) return std::nullopt;
    return order_[index];
}

std::optional<std::size_t> TabRegistry::active_index() const {
    if (!active_) return std::nullopt;
    return index_of(*active_);
}

bool TabRegistry::set_state(TabId id, TabState state) {
    Tab *t = find(id);
    if (!t) return false;
    t->state = state;
    if (state == TabState::Embedded) {
        if (!active_) set_active(id);
    } else if (active_ == id) {
        // a tab leaving Embedded cannot stay active
        active_.reset();
        if (auto next = pick_successor(*index_of(id))) set_active(*next);
    }
    return true;
}

bool TabRegistry::set_active(TabId id) {
    Tab *t = find(id);
    if (!t || t->state != TabState::Embedded) return false;
    active_ = id;
    t->urgent = false;
    return true;
}

std::optional<TabId> TabRegistry::pick_successor(std::size_t index) const {
    if (order_.empty()) return std::nullopt;
    std::size_t start = std::min(index, order_.size() - 1);
    for (std::size_t i = start; i < order_.size(); ++i) {
        if (tabs_.at(order_[i]).state == TabState::Embedded) return order_[i];
    }
    for (std::size_t i = start; i-- > 0;) {
        if (tabs_.at(order_[i]).state == TabState::Embedded) return order_[i];
    }
    return std::nullopt;
}

std::optional<Tab> TabRegistry::remove(TabId id) {
    auto it = tabs_.find(id);
    if (it == tabs_.end()) return std::nullopt;

    std::size_t index = *index_of(id);
    bool was_active = active_ == id;

    Tab removed = std::move(it->second);
    removed.state = TabState::Closed;
    tabs_.erase(it);
    order_.erase(order_.begin() + static_cast<std::ptrdiff_t>(index));

    if (was_active) {
        active_.reset();
        if (auto next = pick_successor(index)) set_active(*next);
    }
    return removed;
}

bool TabRegistry::move(TabId id, std::size_t new_index) {
    auto from = index_of(id);
    if (!from || new_index >= order_.size()) return false;
    if (*from == new_index) return true;
    order_.erase(order_.begin() + static_cast<std::ptrdiff_t>(*from));
    order_.insert(order_.begin() + static_cast<std::ptrdiff_t>(new_index), id);
    return true;
}

bool TabRegistry::rename(TabId id, const std::string &title) {
    Tab *t = find(id);
    if (!t) return false;
    t->title = title;
    return true;
}

bool TabRegistry::set_urgent(TabId id, bool urgent) {
    Tab *t = find(id);
    if (!t) return false;
    if (urgent && active_ == id) return false;
    t->urgent = urgent;
    return true;
}

std::optional<TabId> TabRegistry::cycle(int delta) const {
    auto cur = active_index();
    std::size_t n = order_.size();
    if (!cur || n < 2 || delta == 0) return std::nullopt;

    long long pos = static_cast<long long>(*cur);
    long long step = delta > 0 ? 1 : -1;
    long long remaining = delta > 0 ? delta : -static_cast<long long>(delta);
    const std::size_t max_steps = n * static_cast<std::size_t>(remaining);
    // walk |delta| Embedded tabs, skipping tabs still in the handshake
    for (std::size_t visited = 0; visited < max_steps && remaining > 0; ++visited) {
        pos = ((pos + step) % static_cast<long long>(n) + static_cast<long long>(n)) % static_cast<long long>(n);
        if (tabs_.at(order_[static_cast<std::size_t>(pos)]).state == TabState::Embedded) --remaining;
    }
    if (remaining > 0) return std::nullopt;
    TabId target = order_[static_cast<std::size_t>(pos)];
    if (target == *active_) return std::nullopt;
    return target;
}

std::optional<TabId> TabRegistry::first_embedded() const {
    return pick_successor(0);
}

bool TabRegistry::check_invariants() const {
    if (order_.size() != tabs_.size()) return false;
    for (TabId id : order_) {
        if (!tabs_.count(id)) return false;
    }
    if (active_) {
        const Tab *t = find(*active_);
        if (!t || t->state != TabState::Embedded) return false;
    } else if (first_embedded()) {
        // something is Embedded, so something must be active
        return false;
    }
    return true;
}

}  // namespace tabmux
