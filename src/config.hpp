#pragma once

#include "geometry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tabmux {

// X modifier bits as they appear in key event state.
enum ModMask : uint16_t {
    MOD_SHIFT = 1 << 0,
    MOD_LOCK = 1 << 1,
    MOD_CONTROL = 1 << 2,
    MOD_ALT = 1 << 3,
    MOD_SUPER = 1 << 6,
};

struct Keybind {
    uint16_t modifiers = 0;
    uint8_t keycode = 0;
    std::string command;  // a control command line, e.g. "next-tab"
};

struct Colors {
    std::string active = "#222222";
    std::string inactive = "#444444";
    std::string urgent = "#aa2222";
    std::string text = "#ffffff";
};

struct Config {
    LayoutConfig layout;
    bool focus_new = true;
    bool exit_when_empty = false;
    std::string font = "fixed";
    Colors colors;
    std::vector<Keybind> keybinds;
};

Config default_config();

// Normalizes "#rgb"/"#rrggbb" (case-insensitive) to "#rrggbb".
std::optional<std::string> hex_color_sanitize(const std::string &c);
std::optional<uint16_t> parse_modifiers(const std::string &s);

// Applies one "set"/"bind"/"unbind-all" line to cfg. Blank lines and
// comments succeed without effect. On failure *error describes the problem
// and cfg is left untouched.
bool apply_directive(Config &cfg, const std::string &line, std::string *error);

// -----------------------------
// Config loader: runs the configuration script and reads directives from its
// stdout, then watches the file for changes
// -----------------------------
class ConfigLoader {
public:
    explicit ConfigLoader(std::string path);
    ~ConfigLoader();

    ConfigLoader(const ConfigLoader&) = delete;
    ConfigLoader &operator=(const ConfigLoader&) = delete;

    // Search order: $TABMUX_CONFIG, $XDG_CONFIG_HOME/tabmux/config.sh,
    // $HOME/.config/tabmux/config.sh. Empty when none exists.
    static std::string find_config();

    const std::string &path() const { return path_; }

    // Defaults overlaid with the script's directives. A missing file yields
    // the defaults.
    Config run_once() const;

    // Non-blocking inotify descriptor for the dispatcher, -1 if unavailable.
    int watch();
    int fd() const { return inotify_fd_; }

    // Drains pending inotify events; true if the file changed.
    bool consume_events();

private:
    std::string path_;
    int inotify_fd_ = -1;
    int watch_desc_ = -1;
};

}  // namespace tabmux
