#include "geometry.hpp"

#include <algorithm>

namespace tabmux {

Geometry offset(const Geometry &g, int dx, int dy) {
    return {g.x + dx, g.y + dy, g.w, g.h};
}

Layout compute_layout(Size container, std::size_t tab_count, const LayoutConfig &cfg) {
    Layout l;
    l.container = container;
    l.tab_count = tab_count;

    int w = std::max(container.w, 1);
    int h = std::max(container.h, 1);
    int sh = std::clamp(cfg.strip_height, 0, h);
    int min_w = std::max(cfg.min_tab_width, 1);

    l.strip = {0, 0, w, sh};
    l.content = {0, sh, w, std::max(1, h - sh)};

    if (tab_count == 0) {
        l.tab_width = w;
        return l;
    }

    int natural = w / static_cast<int>(tab_count);
    if (natural >= min_w) {
        l.tab_width = natural;
        l.visible_tabs = tab_count;
    } else {
        l.tab_width = min_w;
        l.visible_tabs = std::min<std::size_t>(tab_count, std::max(1, w / min_w));
        l.overflow = true;
    }
    return l;
}

std::size_t first_visible_tab(const Layout &l, std::optional<std::size_t> active) {
    if (!l.overflow || l.visible_tabs == 0) return 0;
    std::size_t last_start = l.tab_count - l.visible_tabs;
    if (!active) return 0;
    std::size_t a = std::min(*active, l.tab_count - 1);
    std::size_t first = a + 1 > l.visible_tabs ? a + 1 - l.visible_tabs : 0;
    return std::min(first, last_start);
}

std::optional<Geometry> tab_rect(const Layout &l, std::size_t first_visible, std::size_t index) {
    if (index < first_visible || index >= first_visible + l.visible_tabs || index >= l.tab_count)
        return std::nullopt;
    int slot = static_cast<int>(index - first_visible);
    Geometry g{l.strip.x + slot * l.tab_width, l.strip.y, l.tab_width, l.strip.h};
    // last tab takes the rounding remainder, but never shrinks below tab_width
    if (!l.overflow && index + 1 == l.tab_count)
        g.w = std::max(l.tab_width, l.strip.w - g.x);
    return g;
}

std::optional<std::size_t> tab_at(const Layout &l, std::size_t first_visible, int x, int y) {
    if (l.tab_count == 0 || l.tab_width <= 0) return std::nullopt;
    if (x < l.strip.x || y < l.strip.y || y >= l.strip.y + l.strip.h || x >= l.strip.x + l.strip.w)
        return std::nullopt;
    std::size_t slot = static_cast<std::size_t>((x - l.strip.x) / l.tab_width);
    if (slot >= l.visible_tabs) slot = l.visible_tabs - 1;
    std::size_t index = first_visible + slot;
    if (index >= l.tab_count) return std::nullopt;
    return index;
}

}  // namespace tabmux
