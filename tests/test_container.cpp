#include <gtest/gtest.h>

#include "container.hpp"
#include "fakes.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <random>
#include <set>

using namespace tabmux;
using namespace tabmux::fakes;

namespace {

ErrorKind error_kind_of(Container &c, const std::string &line) {
    try {
        c.execute(parse_command(line));
    } catch (const Error &e) {
        return e.kind();
    }
    ADD_FAILURE() << "'" << line << "' did not fail";
    return ErrorKind::InvalidCommand;
}

}  // namespace

class ContainerTest : public ::testing::Test {
protected:
    ContainerTest() : container(ws, sup, default_config(), Size{400, 300}) {
        container.on_event([this](const std::string &type, const json &) { events.push_back(type); });
    }

    // Spawns a client and walks its window through the handshake.
    TabId embed(WindowID w, const std::string &cmd = "st") {
        TabId id = container.open(SpawnSpec{{cmd}, {}});
        ws.pids[w] = *container.registry().find(id)->child_process;
        container.handle(ev::Create{w, CONTAINER, false});
        container.handle(ev::Reparent{w, CONTAINER});
        return id;
    }

    size_t event_count(const std::string &type) const {
        return static_cast<size_t>(std::count(events.begin(), events.end(), type));
    }

    FakeWindowSystem ws;
    FakeSupervisor sup;
    Container container;
    std::vector<std::string> events;
};

// -----------------------------
// Embedding handshake
// -----------------------------

TEST_F(ContainerTest, NewTabReachesEmbeddedAfterHandshake) {
    json r = container.execute(parse_command("new-tab st -w {xid}"));
    EXPECT_EQ(r["index"], 0);

    json tabs = container.execute(parse_command("list-tabs"));
    ASSERT_EQ(tabs.size(), 1u);
    EXPECT_EQ(tabs[0]["state"], "AwaitingEmbed");
    EXPECT_EQ(tabs[0]["pid"], 1000);
    EXPECT_TRUE(tabs[0]["window"].is_null());
    EXPECT_FALSE(container.registry().active().has_value());

    ws.pids[200] = 1000;
    container.handle(ev::Create{200, CONTAINER, false});
    EXPECT_EQ(ws.count("reparent 200 100"), 1u);
    EXPECT_EQ(ws.count("unmap 200"), 1u);

    container.handle(ev::Reparent{200, CONTAINER});
    tabs = container.execute(parse_command("list-tabs"));
    EXPECT_EQ(tabs[0]["state"], "Embedded");
    EXPECT_EQ(tabs[0]["window"], 200);
    EXPECT_TRUE(tabs[0]["active"].get<bool>());
    EXPECT_EQ(ws.count(FakeWindowSystem::xembed(200, XEmbedMessage::EmbeddedNotify)), 1u);
    EXPECT_EQ(ws.count("map 200"), 1u);
    EXPECT_EQ(ws.last_geometry[200], (Geometry{0, 20, 400, 280}));

    EXPECT_EQ(event_count("tab-added"), 1u);
    EXPECT_EQ(event_count("tab-embedded"), 1u);
    EXPECT_EQ(event_count("focus"), 1u);
    EXPECT_TRUE(container.registry().check_invariants());
}

TEST_F(ContainerTest, SpawnFailureLeavesNoTab) {
    EXPECT_EQ(error_kind_of(container, "new-tab missing"), ErrorKind::SpawnError);
    EXPECT_EQ(container.registry().size(), 0u);
    EXPECT_EQ(event_count("tab-added"), 0u);
}

TEST_F(ContainerTest, WindowWithoutPidGoesToOldestPendingTab) {
    TabId first = container.open(SpawnSpec{{"st"}, {}});
    container.open(SpawnSpec{{"xterm"}, {}});
    container.handle(ev::Create{200, CONTAINER, false});
    EXPECT_EQ(container.registry().find(first)->client_window, 200u);
}

TEST_F(ContainerTest, UnknownWindowInsideContainerGetsItsOwnTab) {
    container.handle(ev::Create{400, CONTAINER, false});
    ASSERT_EQ(container.registry().size(), 1u);
    const Tab *t = container.registry().find(*container.registry().at(0));
    EXPECT_FALSE(t->child_process.has_value());
    container.handle(ev::Reparent{400, CONTAINER});
    EXPECT_EQ(t->state, TabState::Embedded);
}

TEST_F(ContainerTest, OverrideRedirectWindowsAreIgnored) {
    container.handle(ev::Create{400, CONTAINER, true});
    EXPECT_TRUE(container.registry().empty());
}

TEST_F(ContainerTest, AttachAdoptsExternalWindow) {
    json r = container.execute(parse_command("attach 0x12c"));
    EXPECT_EQ(ws.count("reparent 300 100"), 1u);
    container.handle(ev::Reparent{300, CONTAINER});
    EXPECT_EQ(container.registry().find(r["id"].get<TabId>())->state, TabState::Embedded);

    EXPECT_EQ(error_kind_of(container, "attach 300"), ErrorKind::ProtocolViolation);
    EXPECT_EQ(error_kind_of(container, "attach 100"), ErrorKind::ProtocolViolation);
    EXPECT_EQ(container.registry().size(), 1u);
}

// -----------------------------
// Closing
// -----------------------------

TEST_F(ContainerTest, SecondCloseOfSameTabIsUnknownTarget) {
    TabId id = embed(200);
    std::string line = "close-tab id:" + std::to_string(id);
    container.execute(parse_command(line));
    EXPECT_EQ(error_kind_of(container, line), ErrorKind::UnknownTarget);
    EXPECT_EQ(ws.count("close 200"), 1u);
    EXPECT_EQ(sup.terminated.size(), 1u);
}

TEST_F(ContainerTest, DestroyThenExitConverge) {
    embed(200);
    container.handle(ev::Destroy{200});
    EXPECT_TRUE(container.registry().empty());
    EXPECT_TRUE(sup.was_terminated(1000));
    EXPECT_EQ(ws.count("close 200"), 0u);

    container.handle_exit(ExitStatus{1000, true, 0, 0});
    EXPECT_EQ(event_count("tab-removed"), 1u);
}

TEST_F(ContainerTest, ExitThenDestroyConverge) {
    embed(200);
    container.handle_exit(ExitStatus{1000, true, 0, 0});
    EXPECT_TRUE(container.registry().empty());
    EXPECT_FALSE(sup.was_terminated(1000));
    EXPECT_EQ(ws.count("close 200"), 1u);
    EXPECT_TRUE(container.embedder().is_retiring(200));

    container.handle(ev::Destroy{200});
    EXPECT_FALSE(container.embedder().is_retiring(200));
    EXPECT_EQ(event_count("tab-removed"), 1u);
}

TEST_F(ContainerTest, ClosingActiveTabPicksSuccessor) {
    TabId a = embed(200);
    TabId b = embed(201);
    TabId c = embed(202);

    container.activate(b);
    container.close(b);
    EXPECT_EQ(container.registry().active(), c);
    EXPECT_EQ(container.shown(), c);

    container.activate(c);
    container.close(c);
    EXPECT_EQ(container.registry().active(), a);
    EXPECT_EQ(ws.count("map 200"), 2u);
    EXPECT_TRUE(container.registry().check_invariants());
}

TEST_F(ContainerTest, ClosingFirstActivatesSecond) {
    TabId a = embed(200);
    TabId b = embed(201);
    embed(202);
    container.activate(a);
    container.close(a);
    EXPECT_EQ(container.registry().active(), b);
}

TEST_F(ContainerTest, WindowLeavingContainerClosesTabWithoutKilling) {
    embed(200);
    container.handle(ev::Reparent{200, ROOT});
    EXPECT_TRUE(container.registry().empty());
    EXPECT_TRUE(sup.terminated.empty());
    EXPECT_EQ(ws.count("close 200"), 0u);
}

TEST_F(ContainerTest, ExitWhenEmptyStopsAfterLastTab) {
    Config cfg = default_config();
    cfg.exit_when_empty = true;
    container.set_config(cfg);
    TabId id = embed(200);
    EXPECT_TRUE(container.running());
    container.close(id);
    EXPECT_FALSE(container.running());
}

TEST_F(ContainerTest, QuitClosesEverything) {
    embed(200);
    embed(201);
    container.execute(parse_command("quit"));
    EXPECT_FALSE(container.running());
    EXPECT_TRUE(container.registry().empty());
    EXPECT_EQ(ws.count("close 200"), 1u);
    EXPECT_EQ(ws.count("close 201"), 1u);
    EXPECT_EQ(sup.terminated.size(), 2u);
}

TEST_F(ContainerTest, DeleteRequestQuits) {
    embed(200);
    container.handle(ev::DeleteRequest{});
    EXPECT_FALSE(container.running());
}

// -----------------------------
// Detaching
// -----------------------------

TEST_F(ContainerTest, DetachGivesWindowBackToRoot) {
    embed(200);
    TabId b = embed(201);
    container.execute(parse_command("detach-tab active"));
    EXPECT_EQ(ws.count("reparent 201 1"), 1u);
    EXPECT_EQ(container.registry().find(b), nullptr);
    EXPECT_TRUE(sup.terminated.empty());
    EXPECT_EQ(container.registry().size(), 1u);
    EXPECT_TRUE(container.registry().active().has_value());
}

TEST_F(ContainerTest, DetachAllEmptiesContainer) {
    embed(200);
    embed(201);
    json r = container.execute(parse_command("detach-all"));
    EXPECT_EQ(r["detached"], 2);
    EXPECT_TRUE(container.registry().empty());
    EXPECT_FALSE(container.shown().has_value());
}

TEST_F(ContainerTest, LateNotifiesDoNotReviveClosedPendingWindow) {
    container.execute(parse_command("attach 300"));
    container.execute(parse_command("close-tab 0"));
    EXPECT_TRUE(container.embedder().is_retiring(300));

    // both copies of the handshake notify arrive after the close
    container.handle(ev::Reparent{300, CONTAINER});
    container.handle(ev::Reparent{300, CONTAINER});
    container.handle(ev::MapRequest{300});
    EXPECT_TRUE(container.registry().empty());
    EXPECT_EQ(ws.count("reparent 300 100"), 1u);
    EXPECT_EQ(event_count("tab-added"), 1u);

    container.handle(ev::Destroy{300});
    EXPECT_FALSE(container.embedder().phase(300).has_value());
}

TEST_F(ContainerTest, DuplicateNotifyAfterCloseOfEmbeddedWindowIsIgnored) {
    container.execute(parse_command("attach 300"));
    container.handle(ev::Reparent{300, CONTAINER});
    container.execute(parse_command("close-tab 0"));

    container.handle(ev::Reparent{300, CONTAINER});
    container.handle(ev::MapRequest{300});
    EXPECT_TRUE(container.registry().empty());
    EXPECT_TRUE(container.embedder().is_retiring(300));
}

TEST_F(ContainerTest, RemappedClosingClientStaysClosed) {
    embed(200);
    container.execute(parse_command("close-tab 0"));
    container.handle(ev::MapRequest{200});
    container.handle(ev::Create{200, CONTAINER, false});
    EXPECT_TRUE(container.registry().empty());
    EXPECT_EQ(ws.count("map 200"), 1u);
}

TEST_F(ContainerTest, DetachedPendingWindowIsNotReadopted) {
    container.execute(parse_command("attach 300"));
    container.execute(parse_command("detach-tab 0"));
    EXPECT_TRUE(container.embedder().is_detaching(300));

    // the notify for the adoption, then both copies for the way out
    container.handle(ev::Reparent{300, CONTAINER});
    EXPECT_TRUE(container.registry().empty());
    container.handle(ev::Reparent{300, ROOT});
    container.handle(ev::Reparent{300, ROOT});
    EXPECT_FALSE(container.embedder().phase(300).has_value());
    EXPECT_TRUE(container.registry().empty());

    // once out it is an ordinary window again
    container.handle(ev::Reparent{300, CONTAINER});
    EXPECT_EQ(container.registry().size(), 1u);
}

TEST_F(ContainerTest, DuplicateNotifyAfterDetachIsIgnored) {
    embed(200);
    container.execute(parse_command("detach-tab 0"));
    container.handle(ev::Reparent{200, CONTAINER});
    container.handle(ev::MapRequest{200});
    EXPECT_TRUE(container.registry().empty());
    EXPECT_TRUE(sup.terminated.empty());
}

TEST_F(ContainerTest, DetachingPendingTabIsUnknownTarget) {
    container.open(SpawnSpec{{"st"}, {}});
    EXPECT_EQ(error_kind_of(container, "detach-tab 0"), ErrorKind::UnknownTarget);
}

// -----------------------------
// Ordering and activation
// -----------------------------

TEST_F(ContainerTest, ReorderKeepsActiveTab) {
    TabId a = embed(200);
    TabId b = embed(201);
    TabId c = embed(202);
    container.activate(b);
    container.execute(parse_command("reorder-tab 2 0"));
    EXPECT_EQ(container.registry().order(), (std::vector<TabId>{c, a, b}));
    EXPECT_EQ(container.registry().active(), b);
    EXPECT_EQ(error_kind_of(container, "reorder-tab 0 5"), ErrorKind::UnknownTarget);
}

TEST_F(ContainerTest, MoveTabWraps) {
    TabId a = embed(200);
    TabId b = embed(201);
    embed(202);
    container.execute(parse_command("move-tab 1"));
    EXPECT_EQ(container.registry().active_index(), 0u);
    EXPECT_EQ(container.registry().order()[1], a);
    EXPECT_EQ(container.registry().order()[2], b);
}

TEST_F(ContainerTest, NextAndPrevWrap) {
    TabId a = embed(200);
    TabId b = embed(201);
    json r = container.execute(parse_command("next-tab"));
    EXPECT_TRUE(r["changed"].get<bool>());
    EXPECT_EQ(container.registry().active(), a);
    container.execute(parse_command("prev-tab"));
    EXPECT_EQ(container.registry().active(), b);
    EXPECT_EQ(ws.count(FakeWindowSystem::xembed(200, XEmbedMessage::WindowDeactivate)), 2u);
}

TEST_F(ContainerTest, SingleTabCycleIsNoop) {
    embed(200);
    json r = container.execute(parse_command("next-tab"));
    EXPECT_FALSE(r["changed"].get<bool>());
}

TEST_F(ContainerTest, ActivateUnknownIndexFails) {
    embed(200);
    EXPECT_EQ(error_kind_of(container, "activate-tab 4"), ErrorKind::UnknownTarget);
}

TEST_F(ContainerTest, ActiveTabIsAlwaysEmbedded) {
    embed(200);
    container.open(SpawnSpec{{"st"}, {}});
    json r = container.execute(parse_command("activate-tab 1"));
    EXPECT_FALSE(r["activated"].get<bool>());
    EXPECT_EQ(container.registry().active_index(), 0u);
    EXPECT_TRUE(container.registry().check_invariants());
}

TEST_F(ContainerTest, RequestFocusActivatesSender) {
    TabId a = embed(200);
    embed(201);
    container.handle(ev::XEmbed{200, static_cast<uint32_t>(XEmbedMessage::RequestFocus), 0});
    EXPECT_EQ(container.registry().active(), a);

    container.handle(ev::XEmbed{999, static_cast<uint32_t>(XEmbedMessage::RequestFocus), 0});
    EXPECT_EQ(container.registry().active(), a);
}

TEST_F(ContainerTest, KeyBindingRunsCommand) {
    TabId a = embed(200);
    embed(201);
    // Ctrl+Shift+l with Caps Lock on
    container.handle(ev::KeyPress{46, MOD_CONTROL | MOD_SHIFT | MOD_LOCK});
    EXPECT_EQ(container.registry().active(), a);
}

TEST_F(ContainerTest, ClicksOnStrip) {
    TabId a = embed(200);
    TabId b = embed(201);
    container.handle(ev::ButtonPress{1, 10, 5});
    EXPECT_EQ(container.registry().active(), a);
    container.handle(ev::ButtonPress{5, 10, 5});
    EXPECT_EQ(container.registry().active(), b);
    // below the strip
    container.handle(ev::ButtonPress{2, 10, 100});
    EXPECT_EQ(container.registry().size(), 2u);
    container.handle(ev::ButtonPress{2, 250, 5});
    EXPECT_EQ(container.registry().find(b), nullptr);
}

// -----------------------------
// Properties and geometry
// -----------------------------

TEST_F(ContainerTest, UrgencyOnInactiveTabOnly) {
    TabId a = embed(200);
    TabId b = embed(201);
    ws.urgent[200] = true;
    container.handle(ev::PropertyChange{200, ev::Property::Hints});
    EXPECT_TRUE(container.registry().find(a)->urgent);
    EXPECT_EQ(event_count("urgent"), 1u);

    ws.urgent[201] = true;
    container.handle(ev::PropertyChange{201, ev::Property::Hints});
    EXPECT_FALSE(container.registry().find(b)->urgent);

    container.activate(a);
    EXPECT_FALSE(container.registry().find(a)->urgent);
}

TEST_F(ContainerTest, TitleFollowsWindow) {
    TabId id = embed(200);
    EXPECT_EQ(container.registry().find(id)->title, "st");
    ws.titles[200] = "vim main.cpp";
    container.handle(ev::PropertyChange{200, ev::Property::Title});
    EXPECT_EQ(container.registry().find(id)->title, "vim main.cpp");
    EXPECT_EQ(event_count("title"), 1u);
    EXPECT_TRUE(container.needs_redraw());
}

TEST_F(ContainerTest, UndecodableTitleStillSerializes) {
    std::vector<std::string> lines;
    container.on_event([&](const std::string &type, const json &payload) {
        lines.push_back(dump_line(json{{"event", type}, {"payload", payload}}));
    });
    TabId id = embed(200);
    ws.titles[200] = "caf\xE9";
    ASSERT_NO_THROW(container.handle(ev::PropertyChange{200, ev::Property::Title}));
    EXPECT_EQ(container.registry().find(id)->title, "caf\xE9");
    ASSERT_FALSE(lines.empty());
    EXPECT_NE(lines.back().find("caf\xEF\xBF\xBD"), std::string::npos);

    std::string listing;
    ASSERT_NO_THROW(listing = dump_line(ok_reply(container.execute(parse_command("list-tabs")))));
    EXPECT_EQ(json::parse(listing)["result"][0]["title"], "caf\xEF\xBF\xBD");
}

TEST_F(ContainerTest, ConfigureRequestGetsContentRect) {
    embed(200);
    ws.last_geometry.clear();
    container.handle(ev::ConfigureRequest{200});
    EXPECT_EQ(ws.last_geometry[200], (Geometry{0, 20, 400, 280}));
}

TEST_F(ContainerTest, ResizeReappliesContentRect) {
    embed(200);
    container.handle(ev::Resize{800, 600});
    EXPECT_EQ(ws.last_geometry[200], (Geometry{0, 20, 800, 580}));

    json g = container.execute(parse_command("query-geometry"));
    EXPECT_EQ(g["container"]["w"], 800);
    EXPECT_EQ(g["content"]["h"], 580);
    EXPECT_EQ(g["tab_width"], 800);
    EXPECT_FALSE(g["overflow"].get<bool>());
}

TEST_F(ContainerTest, FocusInRefocusesShownClient) {
    embed(200);
    size_t before = ws.count("focus 200");
    container.handle(ev::FocusChange{ev::Focus::In});
    EXPECT_EQ(ws.count("focus 200"), before + 1);
}

// -----------------------------
// Random interleavings
// -----------------------------

namespace {

// Checks what must hold between any two events.
void expect_consistent(const Container &c) {
    const TabRegistry &reg = c.registry();
    ASSERT_TRUE(reg.check_invariants());
    ASSERT_EQ(c.shown(), reg.active());
    std::set<WindowID> seen;
    for (TabId id : reg.order()) {
        const Tab *t = reg.find(id);
        ASSERT_NE(t, nullptr);
        if (!t->client_window) continue;
        WindowID w = *t->client_window;
        ASSERT_TRUE(seen.insert(w).second) << "window " << w << " in two tabs";
        ASSERT_FALSE(c.embedder().is_departing(w));
        if (t->state == TabState::Embedded) ASSERT_TRUE(c.embedder().is_embedded(w));
    }
}

}  // namespace

TEST_F(ContainerTest, RandomInterleavingsKeepInvariants) {
    std::mt19937 rng(20261019);
    auto pick = [&rng](std::size_t n) {
        return std::uniform_int_distribution<std::size_t>(0, n - 1)(rng);
    };

    std::map<pid_t, WindowID> window_of;  // spawned clients still running
    std::vector<WindowID> alive;          // windows not yet destroyed
    WindowID next_window = 500;

    auto forget_window = [&alive](WindowID w) {
        alive.erase(std::remove(alive.begin(), alive.end(), w), alive.end());
    };
    auto run = [this](const std::string &line) {
        try {
            container.execute(parse_command(line));
        } catch (const Error &e) {
            EXPECT_EQ(e.kind(), ErrorKind::UnknownTarget) << line;
        }
    };

    for (int step = 0; step < 600; ++step) {
        std::size_t n = container.registry().size();
        switch (pick(9)) {
            case 0: {  // open
                TabId id = container.open(SpawnSpec{{"st"}, {}});
                pid_t pid = *container.registry().find(id)->child_process;
                WindowID w = next_window++;
                ws.pids[w] = pid;
                window_of[pid] = w;
                break;
            }
            case 1: {  // a spawned client creates its window
                if (window_of.empty()) break;
                auto it = std::next(window_of.begin(), static_cast<long>(pick(window_of.size())));
                WindowID w = it->second;
                if (std::find(alive.begin(), alive.end(), w) != alive.end()) break;
                alive.push_back(w);
                container.handle(ev::Create{w, CONTAINER, false});
                break;
            }
            case 2: {  // handshake notify, possibly late or duplicated
                if (alive.empty()) break;
                WindowID w = alive[pick(alive.size())];
                container.handle(ev::Reparent{w, CONTAINER});
                break;
            }
            case 3: {  // close
                if (n == 0) break;
                run("close-tab " + std::to_string(pick(n)));
                break;
            }
            case 4: {  // window destroyed
                if (alive.empty()) break;
                WindowID w = alive[pick(alive.size())];
                forget_window(w);
                container.handle(ev::Destroy{w});
                break;
            }
            case 5: {  // process exited
                if (window_of.empty()) break;
                auto it = std::next(window_of.begin(), static_cast<long>(pick(window_of.size())));
                pid_t pid = it->first;
                window_of.erase(it);
                container.handle_exit(ExitStatus{pid, true, 0, 0});
                break;
            }
            case 6: {  // reorder
                if (n == 0) break;
                run("reorder-tab " + std::to_string(pick(n)) + " " + std::to_string(pick(n)));
                break;
            }
            case 7: {  // detach
                if (n == 0) break;
                run("detach-tab " + std::to_string(pick(n)));
                break;
            }
            case 8: {  // a window goes back to root, or remaps itself
                if (alive.empty()) break;
                WindowID w = alive[pick(alive.size())];
                if (pick(2) == 0)
                    container.handle(ev::Reparent{w, ROOT});
                else
                    container.handle(ev::MapRequest{w});
                break;
            }
        }
        SCOPED_TRACE("step " + std::to_string(step));
        expect_consistent(container);
        if (HasFatalFailure()) return;
    }
    EXPECT_GT(event_count("tab-embedded"), 0u);
}
