#pragma once

#include "events.hpp"
#include "geometry.hpp"
#include "window_system.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <xcb/xcb.h>
#include <xcb/xproto.h>

namespace tabmux {

// -----------------------------
// X Connection wrapper
// -----------------------------
//
// Owns the xcb connection and the container window, and is the X11
// implementation of WindowSystem. Requests on client windows are unchecked;
// their errors come back through the event queue and are logged by
// translate().
class XConnection : public WindowSystem {
public:
    XConnection();
    ~XConnection() override;

    XConnection(const XConnection&) = delete;
    XConnection &operator=(const XConnection&) = delete;

    // Connect / disconnect
    bool connect();
    void disconnect();

    // Accessors
    xcb_connection_t *conn() { return conn_; }
    xcb_screen_t *screen() { return screen_; }
    int screen_number() const { return screen_num_; }
    int fd() const;
    bool has_error() const;
    void flush();

    // Creates the container: top-level, WM_CLASS name/name, WM_DELETE_WINDOW
    // and substructure redirection so clients cannot map or move themselves.
    bool create_container(const std::string &name, Size size);
    void destroy_container();
    Size container_size();

    // Grab keys on the container, ignoring Lock and NumLock.
    void grab_key(uint8_t keycode, uint16_t modifiers);
    void ungrab_keys();

    void set_wm_name(const std::string &name);

    xcb_atom_t atom(const std::string &name);

    // Pixel for "#rrggbb" in the default colormap; black if it cannot be
    // allocated.
    uint32_t alloc_color(const std::string &hex);

    // Classifies one X event. nullopt for events the container has no use for.
    std::optional<WindowEvent> translate(const xcb_generic_event_t *ev);

    // WindowSystem
    WindowID root() const override { return root_; }
    WindowID container() const override { return container_; }
    void watch_client(WindowID w) override;
    void reparent(WindowID w, WindowID parent, int x, int y) override;
    void map(WindowID w) override;
    void unmap(WindowID w) override;
    void configure(WindowID w, const Geometry &g) override;
    void focus(WindowID w) override;
    void send_xembed(WindowID w, XEmbedMessage msg, uint32_t detail = 0,
                     uint32_t data1 = 0, uint32_t data2 = 0) override;
    void close_window(WindowID w) override;
    std::string window_title(WindowID w) override;
    bool window_urgent(WindowID w) override;
    std::optional<pid_t> window_pid(WindowID w) override;
    void set_container_property(const std::string &name, const std::string &value) override;

private:
    bool check(xcb_void_cookie_t cookie, const char *what);
    void intern_atoms();
    std::string string_property(WindowID w, xcb_atom_t prop, xcb_atom_t type, xcb_atom_t *actual = nullptr);
    bool supports_delete(WindowID w);

    xcb_connection_t *conn_ = nullptr;
    const xcb_setup_t *setup_ = nullptr;
    xcb_screen_t *screen_ = nullptr;
    int screen_num_ = 0;
    xcb_window_t root_ = 0;
    xcb_window_t container_ = 0;

    std::map<std::string, xcb_atom_t> atoms_;
    xcb_atom_t wm_protocols_ = XCB_NONE;
    xcb_atom_t wm_delete_ = XCB_NONE;
    xcb_atom_t xembed_ = XCB_NONE;
    xcb_atom_t net_wm_name_ = XCB_NONE;
    xcb_atom_t net_wm_pid_ = XCB_NONE;
    xcb_atom_t utf8_string_ = XCB_NONE;
};

}  // namespace tabmux
