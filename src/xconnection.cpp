#include "xconnection.hpp"

#include "config.hpp"
#include "log.hpp"
#include "strings.hpp"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <unistd.h>
#include <vector>

#include <xcb/xcb_event.h>

namespace tabmux {

namespace {

template <typename T>
using Reply = std::unique_ptr<T, decltype(&std::free)>;

template <typename T>
Reply<T> own(T *p) { return Reply<T>(p, &std::free); }

// WM_HINTS flags bit for XUrgencyHint
constexpr uint32_t URGENCY_HINT = 1 << 8;

const uint16_t IGNORED_MODS[] = {0, XCB_MOD_MASK_LOCK, XCB_MOD_MASK_2, XCB_MOD_MASK_LOCK | XCB_MOD_MASK_2};

}  // namespace

XConnection::XConnection() {}
XConnection::~XConnection() { disconnect(); }

bool XConnection::connect() {
    conn_ = xcb_connect(nullptr, &screen_num_);
    if (xcb_connection_has_error(conn_)) {
        TABMUX_LOG_ERROR("x11", "cannot open display");
        return false;
    }
    setup_ = xcb_get_setup(conn_);
    xcb_screen_iterator_t iter = xcb_setup_roots_iterator(setup_);
    for (int i = 0; i < screen_num_; ++i) xcb_screen_next(&iter);
    screen_ = iter.data;
    if (!screen_) return false;
    root_ = screen_->root;
    intern_atoms();
    return true;
}

void XConnection::disconnect() {
    if (conn_) { xcb_disconnect(conn_); conn_ = nullptr; }
    screen_ = nullptr;
    container_ = 0;
}

int XConnection::fd() const {
    return conn_ ? xcb_get_file_descriptor(conn_) : -1;
}

bool XConnection::has_error() const {
    return !conn_ || xcb_connection_has_error(conn_) != 0;
}

void XConnection::flush() {
    if (conn_) xcb_flush(conn_);
}

void XConnection::intern_atoms() {
    const char *names[] = {"WM_PROTOCOLS", "WM_DELETE_WINDOW", "_XEMBED", "_NET_WM_NAME",
                           "_NET_WM_PID", "UTF8_STRING", "_TABMUX_SOCKET", "_TABMUX_ERROR"};
    std::vector<xcb_intern_atom_cookie_t> cookies;
    for (const char *n : names)
        cookies.push_back(xcb_intern_atom(conn_, 0, static_cast<uint16_t>(std::strlen(n)), n));
    for (size_t i = 0; i < cookies.size(); ++i) {
        auto reply = own(xcb_intern_atom_reply(conn_, cookies[i], nullptr));
        atoms_[names[i]] = reply ? reply->atom : XCB_NONE;
    }
    wm_protocols_ = atoms_["WM_PROTOCOLS"];
    wm_delete_ = atoms_["WM_DELETE_WINDOW"];
    xembed_ = atoms_["_XEMBED"];
    net_wm_name_ = atoms_["_NET_WM_NAME"];
    net_wm_pid_ = atoms_["_NET_WM_PID"];
    utf8_string_ = atoms_["UTF8_STRING"];
}

xcb_atom_t XConnection::atom(const std::string &name) {
    auto it = atoms_.find(name);
    if (it != atoms_.end()) return it->second;
    auto reply = own(xcb_intern_atom_reply(
        conn_, xcb_intern_atom(conn_, 0, static_cast<uint16_t>(name.size()), name.c_str()), nullptr));
    xcb_atom_t a = reply ? reply->atom : XCB_NONE;
    atoms_[name] = a;
    return a;
}

bool XConnection::check(xcb_void_cookie_t cookie, const char *what) {
    auto err = own(xcb_request_check(conn_, cookie));
    if (!err) return true;
    TABMUX_LOG_ERROR("x11", "{} failed: {}", what, xcb_event_get_error_label(err->error_code));
    return false;
}

// -----------------------------
// Container window
// -----------------------------

bool XConnection::create_container(const std::string &name, Size size) {
    container_ = xcb_generate_id(conn_);
    uint32_t mask = XCB_CW_BACK_PIXEL | XCB_CW_EVENT_MASK;
    uint32_t values[] = {
        screen_->black_pixel,
        XCB_EVENT_MASK_SUBSTRUCTURE_REDIRECT | XCB_EVENT_MASK_SUBSTRUCTURE_NOTIFY |
            XCB_EVENT_MASK_STRUCTURE_NOTIFY | XCB_EVENT_MASK_FOCUS_CHANGE | XCB_EVENT_MASK_EXPOSURE |
            XCB_EVENT_MASK_BUTTON_PRESS | XCB_EVENT_MASK_KEY_PRESS,
    };
    auto cookie = xcb_create_window_checked(conn_, XCB_COPY_FROM_PARENT, container_, root_, 0, 0,
                                            static_cast<uint16_t>(size.w), static_cast<uint16_t>(size.h), 0,
                                            XCB_WINDOW_CLASS_INPUT_OUTPUT, screen_->root_visual, mask, values);
    if (!check(cookie, "create container window")) {
        container_ = 0;
        return false;
    }

    std::string wm_class = name + '\0' + name + '\0';
    xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, container_, XCB_ATOM_WM_CLASS, XCB_ATOM_STRING, 8,
                        static_cast<uint32_t>(wm_class.size()), wm_class.data());
    xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, container_, wm_protocols_, XCB_ATOM_ATOM, 32, 1, &wm_delete_);
    uint32_t pid = static_cast<uint32_t>(getpid());
    xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, container_, net_wm_pid_, XCB_ATOM_CARDINAL, 32, 1, &pid);
    set_wm_name(name);

    if (!check(xcb_map_window_checked(conn_, container_), "map container window")) return false;
    flush();
    return true;
}

void XConnection::destroy_container() {
    if (!conn_ || !container_) return;
    xcb_destroy_window(conn_, container_);
    container_ = 0;
    flush();
}

Size XConnection::container_size() {
    auto geo = own(xcb_get_geometry_reply(conn_, xcb_get_geometry(conn_, container_), nullptr));
    if (!geo) return {0, 0};
    return {geo->width, geo->height};
}

void XConnection::grab_key(uint8_t keycode, uint16_t modifiers) {
    for (uint16_t extra : IGNORED_MODS) {
        xcb_grab_key(conn_, 1, container_, static_cast<uint16_t>(modifiers | extra), keycode,
                     XCB_GRAB_MODE_ASYNC, XCB_GRAB_MODE_ASYNC);
    }
}

void XConnection::ungrab_keys() {
    xcb_ungrab_key(conn_, XCB_GRAB_ANY, container_, XCB_MOD_MASK_ANY);
}

void XConnection::set_wm_name(const std::string &name) {
    xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, container_, XCB_ATOM_WM_NAME, XCB_ATOM_STRING, 8,
                        static_cast<uint32_t>(name.size()), name.data());
    xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, container_, net_wm_name_, utf8_string_, 8,
                        static_cast<uint32_t>(name.size()), name.data());
}

uint32_t XConnection::alloc_color(const std::string &hex) {
    auto norm = hex_color_sanitize(hex);
    if (!norm) {
        TABMUX_LOG_WARN("x11", "bad color {}", hex);
        return screen_->black_pixel;
    }
    unsigned long rgb = std::strtoul(norm->c_str() + 1, nullptr, 16);
    uint16_t r = static_cast<uint16_t>(((rgb >> 16) & 0xff) * 257);
    uint16_t g = static_cast<uint16_t>(((rgb >> 8) & 0xff) * 257);
    uint16_t b = static_cast<uint16_t>((rgb & 0xff) * 257);
    auto reply = own(xcb_alloc_color_reply(conn_, xcb_alloc_color(conn_, screen_->default_colormap, r, g, b), nullptr));
    if (!reply) {
        TABMUX_LOG_WARN("x11", "cannot allocate color {}", hex);
        return screen_->black_pixel;
    }
    return reply->pixel;
}

// -----------------------------
// Event classification
// -----------------------------

std::optional<WindowEvent> XConnection::translate(const xcb_generic_event_t *ev) {
    uint8_t type = XCB_EVENT_RESPONSE_TYPE(ev);
    switch (type) {
        case 0: {
            auto *err = reinterpret_cast<const xcb_generic_error_t*>(ev);
            // clients vanish between our requests; BadWindow is routine
            TABMUX_LOG_DEBUG("x11", "{} error from {} (resource {})", xcb_event_get_error_label(err->error_code),
                             xcb_event_get_request_label(err->major_code), err->resource_id);
            return std::nullopt;
        }
        case XCB_CREATE_NOTIFY: {
            auto *e = reinterpret_cast<const xcb_create_notify_event_t*>(ev);
            return WindowEvent{ev::Create{e->window, e->parent, e->override_redirect != 0}};
        }
        case XCB_REPARENT_NOTIFY: {
            auto *e = reinterpret_cast<const xcb_reparent_notify_event_t*>(ev);
            return WindowEvent{ev::Reparent{e->window, e->parent}};
        }
        case XCB_DESTROY_NOTIFY: {
            auto *e = reinterpret_cast<const xcb_destroy_notify_event_t*>(ev);
            if (e->window == container_) return std::nullopt;
            return WindowEvent{ev::Destroy{e->window}};
        }
        case XCB_MAP_REQUEST: {
            auto *e = reinterpret_cast<const xcb_map_request_event_t*>(ev);
            return WindowEvent{ev::MapRequest{e->window}};
        }
        case XCB_CONFIGURE_REQUEST: {
            auto *e = reinterpret_cast<const xcb_configure_request_event_t*>(ev);
            return WindowEvent{ev::ConfigureRequest{e->window}};
        }
        case XCB_CONFIGURE_NOTIFY: {
            auto *e = reinterpret_cast<const xcb_configure_notify_event_t*>(ev);
            if (e->window != container_) return std::nullopt;
            return WindowEvent{ev::Resize{e->width, e->height}};
        }
        case XCB_PROPERTY_NOTIFY: {
            auto *e = reinterpret_cast<const xcb_property_notify_event_t*>(ev);
            if (e->window == container_) return std::nullopt;
            if (e->atom == XCB_ATOM_WM_NAME || e->atom == net_wm_name_)
                return WindowEvent{ev::PropertyChange{e->window, ev::Property::Title}};
            if (e->atom == XCB_ATOM_WM_HINTS)
                return WindowEvent{ev::PropertyChange{e->window, ev::Property::Hints}};
            return std::nullopt;
        }
        case XCB_CLIENT_MESSAGE: {
            auto *e = reinterpret_cast<const xcb_client_message_event_t*>(ev);
            if (e->format != 32) return std::nullopt;
            if (e->type == xembed_)
                return WindowEvent{ev::XEmbed{e->window, e->data.data32[1], e->data.data32[2]}};
            if (e->type == wm_protocols_ && e->window == container_ && e->data.data32[0] == wm_delete_)
                return WindowEvent{ev::DeleteRequest{}};
            return std::nullopt;
        }
        case XCB_FOCUS_IN:
        case XCB_FOCUS_OUT: {
            auto *e = reinterpret_cast<const xcb_focus_in_event_t*>(ev);
            if (e->event != container_) return std::nullopt;
            if (e->detail == XCB_NOTIFY_DETAIL_INFERIOR || e->detail == XCB_NOTIFY_DETAIL_POINTER)
                return std::nullopt;
            return WindowEvent{ev::FocusChange{type == XCB_FOCUS_IN ? ev::Focus::In : ev::Focus::Out}};
        }
        case XCB_EXPOSE: {
            auto *e = reinterpret_cast<const xcb_expose_event_t*>(ev);
            if (e->window != container_ || e->count != 0) return std::nullopt;
            return WindowEvent{ev::Expose{}};
        }
        case XCB_KEY_PRESS: {
            auto *e = reinterpret_cast<const xcb_key_press_event_t*>(ev);
            return WindowEvent{ev::KeyPress{e->detail, e->state}};
        }
        case XCB_BUTTON_PRESS: {
            auto *e = reinterpret_cast<const xcb_button_press_event_t*>(ev);
            if (e->event != container_) return std::nullopt;
            return WindowEvent{ev::ButtonPress{e->detail, e->event_x, e->event_y}};
        }
        default:
            TABMUX_LOG_TRACE("x11", "ignoring {}", xcb_event_get_label(type));
            return std::nullopt;
    }
}

// -----------------------------
// WindowSystem
// -----------------------------

void XConnection::watch_client(WindowID w) {
    uint32_t mask = XCB_EVENT_MASK_PROPERTY_CHANGE | XCB_EVENT_MASK_STRUCTURE_NOTIFY;
    xcb_change_window_attributes(conn_, w, XCB_CW_EVENT_MASK, &mask);
}

void XConnection::reparent(WindowID w, WindowID parent, int x, int y) {
    xcb_reparent_window(conn_, w, parent, static_cast<int16_t>(x), static_cast<int16_t>(y));
}

void XConnection::map(WindowID w) {
    xcb_map_window(conn_, w);
}

void XConnection::unmap(WindowID w) {
    xcb_unmap_window(conn_, w);
}

void XConnection::configure(WindowID w, const Geometry &g) {
    uint16_t mask = XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y | XCB_CONFIG_WINDOW_WIDTH |
                    XCB_CONFIG_WINDOW_HEIGHT | XCB_CONFIG_WINDOW_BORDER_WIDTH | XCB_CONFIG_WINDOW_STACK_MODE;
    uint32_t values[] = {static_cast<uint32_t>(g.x), static_cast<uint32_t>(g.y), static_cast<uint32_t>(g.w),
                         static_cast<uint32_t>(g.h), 0, XCB_STACK_MODE_ABOVE};
    xcb_configure_window(conn_, w, mask, values);

    // a refused ConfigureRequest must still be answered; synthetic notifies
    // carry root coordinates
    Geometry at = g;
    auto origin = own(xcb_translate_coordinates_reply(
        conn_, xcb_translate_coordinates(conn_, container_, root_, 0, 0), nullptr));
    if (origin) at = offset(g, origin->dst_x, origin->dst_y);

    xcb_configure_notify_event_t ce = {};
    ce.response_type = XCB_CONFIGURE_NOTIFY;
    ce.event = w;
    ce.window = w;
    ce.above_sibling = XCB_NONE;
    ce.x = static_cast<int16_t>(at.x);
    ce.y = static_cast<int16_t>(at.y);
    ce.width = static_cast<uint16_t>(g.w);
    ce.height = static_cast<uint16_t>(g.h);
    ce.border_width = 0;
    ce.override_redirect = 0;
    xcb_send_event(conn_, 0, w, XCB_EVENT_MASK_STRUCTURE_NOTIFY, reinterpret_cast<const char*>(&ce));
}

void XConnection::focus(WindowID w) {
    xcb_set_input_focus(conn_, XCB_INPUT_FOCUS_PARENT, w, XCB_CURRENT_TIME);
}

void XConnection::send_xembed(WindowID w, XEmbedMessage msg, uint32_t detail, uint32_t data1, uint32_t data2) {
    xcb_client_message_event_t ev = {};
    ev.response_type = XCB_CLIENT_MESSAGE;
    ev.window = w;
    ev.type = xembed_;
    ev.format = 32;
    ev.data.data32[0] = XCB_CURRENT_TIME;
    ev.data.data32[1] = static_cast<uint32_t>(msg);
    ev.data.data32[2] = detail;
    ev.data.data32[3] = data1;
    ev.data.data32[4] = data2;
    xcb_send_event(conn_, 0, w, XCB_EVENT_MASK_NO_EVENT, reinterpret_cast<const char*>(&ev));
}

bool XConnection::supports_delete(WindowID w) {
    auto reply = own(xcb_get_property_reply(
        conn_, xcb_get_property(conn_, 0, w, wm_protocols_, XCB_ATOM_ATOM, 0, 32), nullptr));
    if (!reply || reply->format != 32) return false;
    auto *atoms = static_cast<const xcb_atom_t*>(xcb_get_property_value(reply.get()));
    int n = xcb_get_property_value_length(reply.get()) / 4;
    for (int i = 0; i < n; ++i) {
        if (atoms[i] == wm_delete_) return true;
    }
    return false;
}

void XConnection::close_window(WindowID w) {
    if (!supports_delete(w)) {
        TABMUX_LOG_DEBUG("x11", "window {} ignores WM_DELETE_WINDOW, killing client", w);
        xcb_kill_client(conn_, w);
        return;
    }
    xcb_client_message_event_t ev = {};
    ev.response_type = XCB_CLIENT_MESSAGE;
    ev.window = w;
    ev.type = wm_protocols_;
    ev.format = 32;
    ev.data.data32[0] = wm_delete_;
    ev.data.data32[1] = XCB_CURRENT_TIME;
    xcb_send_event(conn_, 0, w, XCB_EVENT_MASK_NO_EVENT, reinterpret_cast<const char*>(&ev));
}

std::string XConnection::string_property(WindowID w, xcb_atom_t prop, xcb_atom_t type, xcb_atom_t *actual) {
    auto reply = own(xcb_get_property_reply(conn_, xcb_get_property(conn_, 0, w, prop, type, 0, 1024), nullptr));
    if (!reply || reply->format != 8) return std::string();
    if (actual) *actual = reply->type;
    int len = xcb_get_property_value_length(reply.get());
    std::string s(static_cast<const char*>(xcb_get_property_value(reply.get())), static_cast<size_t>(len));
    while (!s.empty() && s.back() == '\0') s.pop_back();
    return s;
}

std::string XConnection::window_title(WindowID w) {
    std::string title = string_property(w, net_wm_name_, utf8_string_);
    if (!title.empty()) return title;
    xcb_atom_t type = XCB_NONE;
    title = string_property(w, XCB_ATOM_WM_NAME, XCB_GET_PROPERTY_TYPE_ANY, &type);
    // STRING is Latin-1 by definition
    if (type == XCB_ATOM_STRING) title = latin1_to_utf8(title);
    return title;
}

bool XConnection::window_urgent(WindowID w) {
    auto reply = own(xcb_get_property_reply(
        conn_, xcb_get_property(conn_, 0, w, XCB_ATOM_WM_HINTS, XCB_ATOM_WM_HINTS, 0, 9), nullptr));
    if (!reply || reply->format != 32 || xcb_get_property_value_length(reply.get()) < 4) return false;
    uint32_t flags = *static_cast<const uint32_t*>(xcb_get_property_value(reply.get()));
    return (flags & URGENCY_HINT) != 0;
}

std::optional<pid_t> XConnection::window_pid(WindowID w) {
    auto reply = own(xcb_get_property_reply(
        conn_, xcb_get_property(conn_, 0, w, net_wm_pid_, XCB_ATOM_CARDINAL, 0, 1), nullptr));
    if (!reply || reply->format != 32 || xcb_get_property_value_length(reply.get()) < 4) return std::nullopt;
    return static_cast<pid_t>(*static_cast<const uint32_t*>(xcb_get_property_value(reply.get())));
}

void XConnection::set_container_property(const std::string &name, const std::string &value) {
    xcb_change_property(conn_, XCB_PROP_MODE_REPLACE, container_, atom(name), utf8_string_, 8,
                        static_cast<uint32_t>(value.size()), value.data());
}

}  // namespace tabmux
