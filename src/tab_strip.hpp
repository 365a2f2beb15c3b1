#pragma once

#include "config.hpp"

#include <cstdint>
#include <string>

#include <xcb/xcb.h>

namespace tabmux {

class Container;
class XConnection;

// -----------------------------
// Tab strip: draws the row of tab titles along the top of the container
// with the core X font and a GC, through an off-screen pixmap
// -----------------------------
class TabStrip {
public:
    explicit TabStrip(XConnection &xc);
    ~TabStrip();

    TabStrip(const TabStrip&) = delete;
    TabStrip &operator=(const TabStrip&) = delete;

    // (Re)loads the font and allocates the colors. Falls back to "fixed"
    // when the configured font is missing.
    void apply(const Config &cfg);

    void draw(const Container &c);

private:
    void release_font();
    std::string fit_title(const std::string &title, int width) const;

    XConnection &xc_;
    xcb_gcontext_t gc_ = 0;
    xcb_font_t font_ = 0;
    int ascent_ = 0;
    int descent_ = 0;
    int char_width_ = 6;

    uint32_t active_ = 0;
    uint32_t inactive_ = 0;
    uint32_t urgent_ = 0;
    uint32_t text_ = 0;
};

}  // namespace tabmux
