#include "config.hpp"

#include "log.hpp"
#include "strings.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace tabmux {

Config default_config() {
    Config cfg;
    const uint16_t cs = MOD_CONTROL | MOD_SHIFT;
    cfg.keybinds = {
        {cs, 43, "prev-tab"},        // h
        {cs, 44, "move-tab -1"},     // j
        {cs, 45, "move-tab 1"},      // k
        {cs, 46, "next-tab"},        // l
        {cs, 22, "detach-tab active"},  // BackSpace
        {cs, 9, "detach-all"},       // Escape
    };
    for (uint8_t i = 0; i < 9; ++i)
        cfg.keybinds.push_back({MOD_CONTROL, static_cast<uint8_t>(10 + i), "activate-tab " + std::to_string(i)});
    return cfg;
}

std::optional<std::string> hex_color_sanitize(const std::string &c) {
    if (c.size() != 4 && c.size() != 7) return std::nullopt;
    if (c[0] != '#') return std::nullopt;
    std::string out = "#";
    for (size_t i = 1; i < c.size(); ++i) {
        char ch = static_cast<char>(std::tolower(static_cast<unsigned char>(c[i])));
        if (!std::isxdigit(static_cast<unsigned char>(ch))) return std::nullopt;
        out += ch;
        if (c.size() == 4) out += ch;
    }
    return out;
}

std::optional<uint16_t> parse_modifiers(const std::string &s) {
    if (s == "none") return 0;
    uint16_t mask = 0;
    size_t start = 0;
    while (start <= s.size()) {
        size_t plus = s.find('+', start);
        std::string part = s.substr(start, plus == std::string::npos ? std::string::npos : plus - start);
        if (part == "shift") mask |= MOD_SHIFT;
        else if (part == "lock") mask |= MOD_LOCK;
        else if (part == "ctrl" || part == "control") mask |= MOD_CONTROL;
        else if (part == "alt" || part == "mod1") mask |= MOD_ALT;
        else if (part == "super" || part == "mod4") mask |= MOD_SUPER;
        else return std::nullopt;
        if (plus == std::string::npos) break;
        start = plus + 1;
    }
    return mask;
}

namespace {

bool fail(std::string *error, const std::string &msg) {
    if (error) *error = msg;
    return false;
}

bool apply_set(Config &cfg, const std::string &key, const std::string &value, std::string *error) {
    if (key == "strip-height" || key == "min-tab-width") {
        auto v = parse_integer(value);
        if (!v || *v < 0 || *v > 10000) return fail(error, key + ": expected a pixel count");
        if (key == "strip-height") cfg.layout.strip_height = static_cast<int>(*v);
        else cfg.layout.min_tab_width = static_cast<int>(*v);
        return true;
    }
    if (key == "focus-new" || key == "exit-when-empty") {
        auto b = parse_bool(value);
        if (!b) return fail(error, key + ": expected true or false");
        (key == "focus-new" ? cfg.focus_new : cfg.exit_when_empty) = *b;
        return true;
    }
    if (key == "font") {
        if (value.empty()) return fail(error, "font: empty name");
        cfg.font = value;
        return true;
    }
    if (key.rfind("color-", 0) == 0) {
        auto col = hex_color_sanitize(value);
        if (!col) return fail(error, key + ": expected #rrggbb");
        std::string which = key.substr(6);
        if (which == "active") cfg.colors.active = *col;
        else if (which == "inactive") cfg.colors.inactive = *col;
        else if (which == "urgent") cfg.colors.urgent = *col;
        else if (which == "text") cfg.colors.text = *col;
        else return fail(error, "unknown color " + which);
        return true;
    }
    return fail(error, "unknown setting " + key);
}

}  // namespace

bool apply_directive(Config &cfg, const std::string &line, std::string *error) {
    std::string text = trim(line);
    if (text.empty() || text[0] == '#') return true;

    std::vector<std::string> words;
    if (!split_words(text, words, error)) return false;

    const std::string &verb = words[0];
    if (verb == "set") {
        if (words.size() != 3) return fail(error, "usage: set KEY VALUE");
        return apply_set(cfg, words[1], words[2], error);
    }
    if (verb == "bind") {
        if (words.size() < 4) return fail(error, "usage: bind MODS KEYCODE COMMAND...");
        auto mods = parse_modifiers(words[1]);
        if (!mods) return fail(error, "bad modifiers " + words[1]);
        auto key = parse_integer(words[2]);
        if (!key || *key < 8 || *key > 255) return fail(error, "bad keycode " + words[2]);
        Keybind kb;
        kb.modifiers = *mods;
        kb.keycode = static_cast<uint8_t>(*key);
        kb.command = join_words({words.begin() + 3, words.end()});
        // a later binding for the same key replaces the earlier one
        for (auto it = cfg.keybinds.begin(); it != cfg.keybinds.end();) {
            if (it->keycode == kb.keycode && it->modifiers == kb.modifiers) it = cfg.keybinds.erase(it);
            else ++it;
        }
        cfg.keybinds.push_back(std::move(kb));
        return true;
    }
    if (verb == "unbind-all") {
        cfg.keybinds.clear();
        return true;
    }
    return fail(error, "unknown directive " + verb);
}

// -----------------------------
// ConfigLoader
// -----------------------------

ConfigLoader::ConfigLoader(std::string path) : path_(std::move(path)) {}

ConfigLoader::~ConfigLoader() {
    if (inotify_fd_ >= 0) {
        if (watch_desc_ >= 0) inotify_rm_watch(inotify_fd_, watch_desc_);
        close(inotify_fd_);
    }
}

std::string ConfigLoader::find_config() {
    if (const char *env = std::getenv("TABMUX_CONFIG")) {
        if (*env) return env;
    }
    std::error_code ec;
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME")) {
        fs::path p = fs::path(xdg) / "tabmux" / "config.sh";
        if (*xdg && fs::exists(p, ec)) return p.string();
    }
    if (const char *home = std::getenv("HOME")) {
        fs::path p = fs::path(home) / ".config" / "tabmux" / "config.sh";
        if (fs::exists(p, ec)) return p.string();
    }
    return {};
}

Config ConfigLoader::run_once() const {
    Config cfg = default_config();
    std::error_code ec;
    if (path_.empty() || !fs::exists(path_, ec)) {
        if (!path_.empty()) TABMUX_LOG_WARN("config", "{} does not exist, using defaults", path_);
        return cfg;
    }

    std::string cmd = "/bin/sh " + shell_quote(path_);
    FILE *p = popen(cmd.c_str(), "r");
    if (!p) {
        TABMUX_LOG_ERROR("config", "cannot run {}", path_);
        return cfg;
    }
    char buf[512];
    std::string line;
    int lineno = 0;
    while (fgets(buf, sizeof(buf), p)) {
        line += buf;
        if (line.back() != '\n' && !feof(p)) continue;
        ++lineno;
        std::string err;
        if (!apply_directive(cfg, line, &err))
            TABMUX_LOG_WARN("config", "{} line {}: {}", path_, lineno, err);
        line.clear();
    }
    int status = pclose(p);
    if (status != 0) TABMUX_LOG_WARN("config", "{} exited with status {}", path_, status);
    TABMUX_LOG_DEBUG("config", "loaded {} ({} keybinds)", path_, cfg.keybinds.size());
    return cfg;
}

int ConfigLoader::watch() {
    if (path_.empty() || inotify_fd_ >= 0) return inotify_fd_;
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        TABMUX_LOG_WARN("config", "inotify unavailable, config reload disabled");
        return -1;
    }
    // editors replace files by rename, so watch the directory
    fs::path dir = fs::path(path_).parent_path();
    if (dir.empty()) dir = ".";
    watch_desc_ = inotify_add_watch(inotify_fd_, dir.c_str(), IN_CLOSE_WRITE | IN_MOVED_TO | IN_CREATE);
    if (watch_desc_ < 0) TABMUX_LOG_WARN("config", "cannot watch {}", dir.string());
    return inotify_fd_;
}

bool ConfigLoader::consume_events() {
    if (inotify_fd_ < 0) return false;
    std::string name = fs::path(path_).filename().string();
    bool changed = false;
    alignas(inotify_event) char buf[4096];
    ssize_t len;
    while ((len = read(inotify_fd_, buf, sizeof(buf))) > 0) {
        for (char *ptr = buf; ptr < buf + len;) {
            auto *ev = reinterpret_cast<inotify_event*>(ptr);
            if (ev->len > 0 && name == ev->name) changed = true;
            ptr += sizeof(inotify_event) + ev->len;
        }
    }
    return changed;
}

}  // namespace tabmux
