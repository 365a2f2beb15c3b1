#include "tab_strip.hpp"

#include "container.hpp"
#include "log.hpp"
#include "xconnection.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>

namespace tabmux {

namespace {

constexpr int TEXT_PAD = 4;
// image_text_8 takes at most 255 bytes
constexpr size_t MAX_TEXT = 255;

}  // namespace

TabStrip::TabStrip(XConnection &xc) : xc_(xc) {}

TabStrip::~TabStrip() {
    if (!xc_.conn() || xc_.has_error()) return;
    release_font();
    if (gc_) xcb_free_gc(xc_.conn(), gc_);
}

void TabStrip::release_font() {
    if (font_) {
        xcb_close_font(xc_.conn(), font_);
        font_ = 0;
    }
}

void TabStrip::apply(const Config &cfg) {
    xcb_connection_t *c = xc_.conn();
    release_font();

    auto open = [&](const std::string &name) -> bool {
        xcb_font_t f = xcb_generate_id(c);
        auto cookie = xcb_open_font_checked(c, f, static_cast<uint16_t>(name.size()), name.c_str());
        if (auto *err = xcb_request_check(c, cookie)) {
            std::free(err);
            return false;
        }
        font_ = f;
        return true;
    };
    if (!open(cfg.font)) {
        TABMUX_LOG_WARN("strip", "font '{}' not found, using fixed", cfg.font);
        if (!open("fixed")) {
            TABMUX_LOG_ERROR("strip", "cannot open font 'fixed'");
            return;
        }
    }

    std::unique_ptr<xcb_query_font_reply_t, decltype(&std::free)> info(
        xcb_query_font_reply(c, xcb_query_font(c, font_), nullptr), &std::free);
    if (info) {
        ascent_ = info->font_ascent;
        descent_ = info->font_descent;
        char_width_ = std::max<int>(1, info->max_bounds.character_width);
    }

    active_ = xc_.alloc_color(cfg.colors.active);
    inactive_ = xc_.alloc_color(cfg.colors.inactive);
    urgent_ = xc_.alloc_color(cfg.colors.urgent);
    text_ = xc_.alloc_color(cfg.colors.text);

    uint32_t values[] = {text_, inactive_, font_, 0};
    uint32_t mask = XCB_GC_FOREGROUND | XCB_GC_BACKGROUND | XCB_GC_FONT | XCB_GC_GRAPHICS_EXPOSURES;
    if (!gc_) {
        gc_ = xcb_generate_id(c);
        xcb_create_gc(c, gc_, xc_.container(), mask, values);
    } else {
        xcb_change_gc(c, gc_, mask, values);
    }
}

std::string TabStrip::fit_title(const std::string &title, int width) const {
    int room = (width - 2 * TEXT_PAD) / char_width_;
    if (room <= 0) return std::string();
    size_t max = std::min(static_cast<size_t>(room), MAX_TEXT);
    if (title.size() <= max) return title;
    if (max <= 2) return title.substr(0, max);
    return title.substr(0, max - 2) + "..";
}

void TabStrip::draw(const Container &container) {
    if (!gc_ || !font_) return;
    xcb_connection_t *c = xc_.conn();
    const Layout &l = container.layout();
    const Geometry &strip = l.strip;
    if (strip.w <= 0 || strip.h <= 0) return;

    xcb_pixmap_t pm = xcb_generate_id(c);
    xcb_create_pixmap(c, xc_.screen()->root_depth, pm, xc_.container(),
                      static_cast<uint16_t>(strip.w), static_cast<uint16_t>(strip.h));

    auto fill = [&](uint32_t pixel, const Geometry &r) {
        xcb_change_gc(c, gc_, XCB_GC_FOREGROUND, &pixel);
        xcb_rectangle_t rect = {static_cast<int16_t>(r.x), static_cast<int16_t>(r.y),
                                static_cast<uint16_t>(r.w), static_cast<uint16_t>(r.h)};
        xcb_poly_fill_rectangle(c, pm, gc_, 1, &rect);
    };

    fill(inactive_, Geometry{0, 0, strip.w, strip.h});

    const TabRegistry &reg = container.registry();
    auto active = reg.active();
    std::size_t first = container.first_visible();
    int baseline = (strip.h + ascent_ - descent_) / 2;

    for (std::size_t i = 0; i < reg.size(); ++i) {
        auto rect = tab_rect(l, first, i);
        if (!rect) continue;
        const Tab *t = reg.find(*reg.at(i));
        uint32_t bg = inactive_;
        if (active == t->id) bg = active_;
        else if (t->urgent) bg = urgent_;
        fill(bg, *rect);

        std::string label = fit_title(t->title, rect->w);
        if (label.empty()) continue;
        uint32_t colors[] = {text_, bg};
        xcb_change_gc(c, gc_, XCB_GC_FOREGROUND | XCB_GC_BACKGROUND, colors);
        xcb_image_text_8(c, static_cast<uint8_t>(label.size()), pm, gc_,
                         static_cast<int16_t>(rect->x + TEXT_PAD), static_cast<int16_t>(baseline), label.c_str());
    }

    xcb_copy_area(c, pm, xc_.container(), gc_, 0, 0, static_cast<int16_t>(strip.x), static_cast<int16_t>(strip.y),
                  static_cast<uint16_t>(strip.w), static_cast<uint16_t>(strip.h));
    xcb_free_pixmap(c, pm);
}

}  // namespace tabmux
