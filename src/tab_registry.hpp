#pragma once

#include "window_system.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace tabmux {

using TabId = uint64_t;

enum class TabState { Spawning, AwaitingEmbed, Embedded, Closing, Closed };

const char *to_string(TabState s);

struct Tab {
    TabId id = 0;
    std::optional<WindowID> client_window;
    std::optional<pid_t> child_process;
    std::string title;
    bool urgent = false;
    TabState state = TabState::Spawning;
};

// -----------------------------
// Tab registry: ordered arena of tab records
// -----------------------------
//
// Tabs are stored by id; order_ holds display order. The active tab is kept
// by id so reordering never changes which tab is active. Whenever it is set
// the active tab is Embedded; with no Embedded tab there is no active tab.
// Pure bookkeeping: the container performs the window operations that go
// with each change.
class TabRegistry {
public:
    TabId add(TabState state, std::optional<pid_t> pid = std::nullopt,
              std::optional<WindowID> window = std::nullopt);

    Tab *find(TabId id);
    const Tab *find(TabId id) const;
    Tab *find_by_window(WindowID w);
    Tab *find_by_pid(pid_t pid);

    // Oldest AwaitingEmbed tab that has no window yet.
    Tab *first_unclaimed();

    std::optional<std::size_t> index_of(TabId id) const;
    std::optional<TabId> at(std::size_t index) const;
    const std::vector<TabId> &order() const { return order_; }
    std::size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    std::optional<TabId> active() const { return active_; }
    std::optional<std::size_t> active_index() const;

    // Entering Embedded with nothing active makes the tab active; the active
    // tab leaving Embedded hands activation on as remove() does.
    bool set_state(TabId id, TabState state);

    // Makes an Embedded tab active and clears its urgency. False for unknown
    // or non-Embedded tabs, in which case nothing changes.
    bool set_active(TabId id);

    // Removes the tab and returns its record marked Closed. If it was active,
    // the tab now at the same index (the new last one when it was last)
    // becomes active; if that one is not Embedded, the nearest Embedded tab
    // after it, then before it.
    std::optional<Tab> remove(TabId id);

    // False if id is unknown or new_index is out of range.
    bool move(TabId id, std::size_t new_index);

    bool rename(TabId id, const std::string &title);

    // Urgency is only recorded on tabs that are not active.
    bool set_urgent(TabId id, bool urgent);

    // Next Embedded tab from the active one stepping by delta with
    // wrap-around. nullopt with fewer than two tabs or no other candidate.
    std::optional<TabId> cycle(int delta) const;

    // An Embedded tab to activate when nothing is active.
    std::optional<TabId> first_embedded() const;

    bool check_invariants() const;

private:
    std::optional<TabId> pick_successor(std::size_t index) const;

    std::map<TabId, Tab> tabs_;
    std::vector<TabId> order_;
    std::optional<TabId> active_;
    TabId next_id_ = 1;
};

}  // namespace tabmux
