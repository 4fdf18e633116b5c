#include "settings.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <vector>

Settings loadSettings(const std::string& path, std::string* outWarnings) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string warnings;
    int warnCount = 0;

    std::string line;
    for (int lineNo = 1; std::getline(f, line); ++lineNo) {
        stripUtf8Bom(line);
        line = trim(stripIniComment(line));
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        bool ok = true;
        if (key == "tile_size") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.tileSize = std::clamp(v, 8, 64);
        } else if (key == "hud_height") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.hudHeight = std::clamp(v, 80, 320);
        } else if (key == "start_fullscreen") {
            ok = parseBool(val, s.startFullscreen);
        } else if (key == "vsync") {
            ok = parseBool(val, s.vsync);
        } else if (key == "player_name") {
            if (!val.empty()) s.playerName = val.substr(0, 24);
        } else if (key == "fov_radius") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.fovRadius = std::clamp(v, 0, 200);
        } else if (key == "content_file") {
            s.contentFile = val;
        } else if (key == "save_file") {
            if (!val.empty()) s.saveFile = val;
        } else if (key.rfind("bind_", 0) == 0) {
            // Handled by KeyBinds::loadOverridesFromIni.
        } else {
            appendWarning(warnings, lineNo, "Unknown setting: " + key, warnCount);
            continue;
        }

        if (!ok) appendWarning(warnings, lineNo, "Invalid value for " + key + ": " + val, warnCount);
    }

    if (outWarnings) *outWarnings = warnings;
    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# TombCrawl settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart the game.

# Rendering / UI
# tile_size: 8..64 pixels per map cell
tile_size = 16
hud_height = 140
start_fullscreen = false
vsync = true

# Shown on the HUD
player_name = stranger

# Torch radius (0 = content default)
fov_radius = 0

# Optional tuning overrides (map size, spawn tables, monster stats, spells).
# Example: content_file = tombcrawl_content.ini
content_file =

save_file = tombcrawl_save.dat

# -----------------------------------------------------------------------------
# Keybindings
#
# Rebind keys by adding entries of the form:
#   bind_<action> = key[, key, ...]
#
# Modifiers: shift, ctrl, alt. Example: shift+comma
# Set a binding to "none" to disable it.
# -----------------------------------------------------------------------------

# Movement
bind_up = up, kp_8, k
bind_down = down, kp_2, j
bind_left = left, kp_4, h
bind_right = right, kp_6, l
bind_up_left = home, kp_7, y
bind_up_right = pageup, kp_9, u
bind_down_left = end, kp_1, b
bind_down_right = pagedown, kp_3, n

# Actions
bind_wait = kp_5, period
bind_pickup = g
bind_inventory = i
bind_drop = d
bind_stairs_down = shift+comma, less
bind_character = c
bind_confirm = enter, kp_enter
bind_cancel = escape
bind_fullscreen = alt+enter
)INI";

    return true;
}

bool updateIniKey(const std::string& path, const std::string& key, const std::string& value) {
    std::ifstream in(path);
    if (!in) return false;

    std::vector<std::string> lines;
    std::string line;

    bool found = false;
    while (std::getline(in, line)) {
        // Strip comments for matching, but preserve the original line for output when not matching.
        const std::string raw = stripIniComment(line);

        auto eq = raw.find('=');
        if (eq != std::string::npos) {
            std::string k = trim(raw.substr(0, eq));
            if (!k.empty() && toLower(k) == toLower(key)) {
                lines.push_back(key + " = " + value);
                found = true;
                continue;
            }
        }

        lines.push_back(line);
    }
    in.close();

    if (!found) {
        // Append at end.
        lines.push_back(key + " = " + value);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;

    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i];
        if (i + 1 < lines.size()) out << "\n";
    }
    return true;
}
