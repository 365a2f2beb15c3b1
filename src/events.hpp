#pragma once

#include "window_system.hpp"

#include <cstdint>
#include <variant>

namespace tabmux {

// Window-system events the container reacts to, already classified by the
// X layer. Anything else never leaves XConnection::translate.
namespace ev {

struct Create { WindowID window; WindowID parent; bool override_redirect; };
struct Reparent { WindowID window; WindowID parent; };
struct Destroy { WindowID window; };
struct MapRequest { WindowID window; };
struct ConfigureRequest { WindowID window; };
struct Resize { int w, h; };  // ConfigureNotify on the container
enum class Property { Title, Hints };
struct PropertyChange { WindowID window; Property what; };
struct XEmbed { WindowID window; uint32_t opcode; uint32_t detail; };
struct DeleteRequest {};      // WM_DELETE_WINDOW on the container
enum class Focus { In, Out };
struct FocusChange { Focus what; };
struct Expose {};
struct KeyPress { uint8_t keycode; uint16_t state; };
struct ButtonPress { uint8_t button; int x, y; };

}  // namespace ev

using WindowEvent = std::variant<ev::Create, ev::Reparent, ev::Destroy, ev::MapRequest,
                                 ev::ConfigureRequest, ev::Resize, ev::PropertyChange, ev::XEmbed,
                                 ev::DeleteRequest, ev::FocusChange, ev::Expose, ev::KeyPress,
                                 ev::ButtonPress>;

}  // namespace tabmux
