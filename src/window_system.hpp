#pragma once

#include "geometry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>

namespace tabmux {

using WindowID = uint32_t;

// XEmbed message opcodes.
enum class XEmbedMessage : uint32_t {
    EmbeddedNotify = 0,
    WindowActivate = 1,
    WindowDeactivate = 2,
    RequestFocus = 3,
    FocusIn = 4,
    FocusOut = 5,
    FocusNext = 6,
    FocusPrev = 7,
    ModalityOn = 10,
    ModalityOff = 11,
};

constexpr uint32_t XEMBED_FOCUS_CURRENT = 0;
constexpr uint32_t XEMBED_VERSION = 0;

// The requests the container makes of the window system. XConnection is the
// X11 implementation; tests substitute a recorder.
class WindowSystem {
public:
    virtual ~WindowSystem() = default;

    virtual WindowID root() const = 0;
    virtual WindowID container() const = 0;

    // Select the client events we track (property and structure changes).
    virtual void watch_client(WindowID w) = 0;
    virtual void reparent(WindowID w, WindowID parent, int x, int y) = 0;
    virtual void map(WindowID w) = 0;
    virtual void unmap(WindowID w) = 0;
    // Move/resize, border 0, raised to the top of the stack.
    virtual void configure(WindowID w, const Geometry &g) = 0;
    virtual void focus(WindowID w) = 0;
    virtual void send_xembed(WindowID w, XEmbedMessage msg, uint32_t detail = 0,
                             uint32_t data1 = 0, uint32_t data2 = 0) = 0;

    // WM_DELETE_WINDOW if the client takes it, KillClient otherwise.
    virtual void close_window(WindowID w) = 0;

    virtual std::string window_title(WindowID w) = 0;
    virtual bool window_urgent(WindowID w) = 0;
    virtual std::optional<pid_t> window_pid(WindowID w) = 0;

    // String property on the container window, e.g. the last control error.
    virtual void set_container_property(const std::string &name, const std::string &value) = 0;
};

}  // namespace tabmux
