#pragma once

#include "geometry.hpp"
#include "window_system.hpp"

#include <optional>
#include <set>
#include <unordered_map>

namespace tabmux {

// -----------------------------
// Embedder: the reparenting handshake and XEmbed signaling for adopted
// client windows
// -----------------------------
//
// Per window:  (unknown) --begin--> Pending --acknowledge--> Embedded
//              Pending/Embedded --release--> Retiring --forget--> (unknown)
//              Pending/Embedded --detach--> Detaching --left/forget--> (unknown)
//
// begin() unmaps the client and reparents it into the container; the
// ReparentNotify that follows is the acknowledgment. Adoption is one-shot
// per window. Retiring and Detaching windows may still show up inside the
// container (late notifies, a remap after WM_DELETE_WINDOW) and must not be
// adopted again.
class Embedder {
public:
    enum class Phase { Pending, Embedded, Retiring, Detaching };

    explicit Embedder(WindowSystem &ws);

    // Starts adopting w at the content origin. False if w is already known.
    bool begin(WindowID w, const Geometry &content);

    // ReparentNotify for w. True when it completes a pending handshake, in
    // which case EMBEDDED_NOTIFY is sent and w is sized to content. False if
    // w was not pending or went to a parent other than the container.
    bool acknowledge(WindowID w, WindowID parent, const Geometry &content);

    // Maps, raises and focuses an embedded window and tells it it is active.
    void show(WindowID w, const Geometry &content);
    // Tells an embedded window it lost focus and unmaps it.
    void hide(WindowID w);
    void resize(WindowID w, const Geometry &content);
    void refocus(WindowID w);
    void set_window_active(WindowID w, bool active);

    // Drops protocol state; unmaps if mapped and optionally asks the client
    // to close. The window is then retiring until forget().
    void release(WindowID w, bool request_close);

    // Hands w back to the root window, mapped. Detaching until the
    // ReparentNotify away from the container arrives.
    void detach(WindowID w);

    // ReparentNotify of w to a parent other than the container. True if it
    // completes a detach.
    bool left(WindowID w);

    // DestroyNotify for a retiring or detaching window. True if it was one.
    bool forget(WindowID w);

    std::optional<Phase> phase(WindowID w) const;
    bool is_pending(WindowID w) const;
    bool is_embedded(WindowID w) const;
    bool is_mapped(WindowID w) const { return mapped_.count(w) != 0; }
    bool is_retiring(WindowID w) const { return retiring_.count(w) != 0; }
    bool is_detaching(WindowID w) const { return detaching_.count(w) != 0; }
    // Released or detached and not yet gone.
    bool is_departing(WindowID w) const { return is_retiring(w) || is_detaching(w); }

private:
    WindowSystem &ws_;
    std::unordered_map<WindowID, Phase> windows_;
    std::set<WindowID> mapped_;
    std::set<WindowID> retiring_;
    std::set<WindowID> detaching_;
};

}  // namespace tabmux
