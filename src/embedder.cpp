#include "embedder.hpp"

#include "log.hpp"

namespace tabmux {

Embedder::Embedder(WindowSystem &ws) : ws_(ws) {}

bool Embedder::begin(WindowID w, const Geometry &content) {
    if (w == ws_.container() || w == ws_.root()) {
        TABMUX_LOG_WARN("embed", "refusing to adopt window {}", w);
        return false;
    }
    if (windows_.count(w)) {
        TABMUX_LOG_DEBUG("embed", "window {} already in flight", w);
        return false;
    }
    retiring_.erase(w);
    detaching_.erase(w);
    windows_[w] = Phase::Pending;
    ws_.watch_client(w);
    ws_.unmap(w);
    ws_.reparent(w, ws_.container(), content.x, content.y);
    TABMUX_LOG_DEBUG("embed", "adopting window {}", w);
    return true;
}

bool Embedder::acknowledge(WindowID w, WindowID parent, const Geometry &content) {
    auto it = windows_.find(w);
    if (it == windows_.end() || it->second != Phase::Pending) return false;
    if (parent != ws_.container()) {
        TABMUX_LOG_WARN("embed", "window {} went to parent {} during the handshake", w, parent);
        windows_.erase(it);
        return false;
    }
    it->second = Phase::Embedded;
    ws_.send_xembed(w, XEmbedMessage::EmbeddedNotify, 0, ws_.container(), XEMBED_VERSION);
    ws_.configure(w, content);
    TABMUX_LOG_DEBUG("embed", "window {} embedded", w);
    return true;
}

void Embedder::show(WindowID w, const Geometry &content) {
    if (!is_embedded(w)) return;
    ws_.configure(w, content);
    ws_.map(w);
    mapped_.insert(w);
    ws_.focus(w);
    ws_.send_xembed(w, XEmbedMessage::WindowActivate);
    ws_.send_xembed(w, XEmbedMessage::FocusIn, XEMBED_FOCUS_CURRENT);
}

void Embedder::hide(WindowID w) {
    if (!is_embedded(w)) return;
    ws_.send_xembed(w, XEmbedMessage::FocusOut);
    ws_.send_xembed(w, XEmbedMessage::WindowDeactivate);
    if (mapped_.erase(w)) ws_.unmap(w);
}

void Embedder::resize(WindowID w, const Geometry &content) {
    if (is_embedded(w)) ws_.configure(w, content);
}

void Embedder::refocus(WindowID w) {
    if (!is_embedded(w) || !is_mapped(w)) return;
    ws_.focus(w);
    ws_.send_xembed(w, XEmbedMessage::FocusIn, XEMBED_FOCUS_CURRENT);
}

void Embedder::set_window_active(WindowID w, bool active) {
    if (!is_embedded(w)) return;
    ws_.send_xembed(w, active ? XEmbedMessage::WindowActivate : XEmbedMessage::WindowDeactivate);
}

void Embedder::release(WindowID w, bool request_close) {
    auto it = windows_.find(w);
    if (it == windows_.end()) return;
    windows_.erase(it);
    if (mapped_.erase(w)) ws_.unmap(w);
    retiring_.insert(w);
    if (request_close) ws_.close_window(w);
}

void Embedder::detach(WindowID w) {
    auto it = windows_.find(w);
    if (it == windows_.end()) return;
    windows_.erase(it);
    mapped_.erase(w);
    detaching_.insert(w);
    ws_.reparent(w, ws_.root(), 0, 0);
    ws_.map(w);
}

bool Embedder::left(WindowID w) {
    return detaching_.erase(w) != 0;
}

bool Embedder::forget(WindowID w) {
    mapped_.erase(w);
    windows_.erase(w);
    bool retired = retiring_.erase(w) != 0;
    bool detached = detaching_.erase(w) != 0;
    return retired || detached;
}

std::optional<Embedder::Phase> Embedder::phase(WindowID w) const {
    auto it = windows_.find(w);
    if (it != windows_.end()) return it->second;
    if (retiring_.count(w)) return Phase::Retiring;
    if (detaching_.count(w)) return Phase::Detaching;
    return std::nullopt;
}

bool Embedder::is_pending(WindowID w) const {
    auto it = windows_.find(w);
    return it != windows_.end() && it->second == Phase::Pending;
}

bool Embedder::is_embedded(WindowID w) const {
    auto it = windows_.find(w);
    return it != windows_.end() && it->second == Phase::Embedded;
}

}  // namespace tabmux
