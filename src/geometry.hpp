#pragma once

#include <cstddef>
#include <optional>

namespace tabmux {

struct Geometry { int x, y, w, h; };
struct Size { int w, h; };

inline bool operator==(const Geometry &a, const Geometry &b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}
inline bool operator!=(const Geometry &a, const Geometry &b) { return !(a == b); }

// g moved by (dx, dy), e.g. from container to root coordinates.
Geometry offset(const Geometry &g, int dx, int dy);

struct LayoutConfig {
    int strip_height = 20;
    int min_tab_width = 80;
};

// Result of laying out the container. Tabs never get narrower than
// min_tab_width: when width / tab_count would fall below it the strip
// overflows, every tab is min_tab_width wide and only visible_tabs of them
// are drawn, scrolled so the active one stays in view.
struct Layout {
    Size container{0, 0};
    Geometry strip{0, 0, 0, 0};
    Geometry content{0, 0, 1, 1};
    int tab_width = 0;
    std::size_t tab_count = 0;
    std::size_t visible_tabs = 0;
    bool overflow = false;
};

Layout compute_layout(Size container, std::size_t tab_count, const LayoutConfig &cfg);

// Index of the leftmost drawn tab.
std::size_t first_visible_tab(const Layout &l, std::optional<std::size_t> active);

// Rectangle of tab `index` inside the strip, or nullopt if it is scrolled out.
std::optional<Geometry> tab_rect(const Layout &l, std::size_t first_visible, std::size_t index);

// Tab under strip coordinates (x, y).
std::optional<std::size_t> tab_at(const Layout &l, std::size_t first_visible, int x, int y);

}  // namespace tabmux
