#pragma once

#include "sdl.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "game.hpp"

// Configurable keybindings loaded from tombcrawl_settings.ini.
//
// The binding format is:
//   bind_<action> = key[, key, ...]
//
// Each key can be:
//   - a single character: w, ., ?
//   - a named key: up, down, left, right, tab, enter, escape, pageup, f1, kp_8, ...
// Modifiers can be prefixed with: shift+, ctrl+, alt+  (example: shift+comma)
//
// Notes:
//   * We treat bindings as (keycode + required modifiers). Extra modifiers do NOT match.
//   * While a menu is open, letter keys pick menu options before any binding is considered.

enum class KeyAction : uint8_t {
    None = 0,
    Up,
    Down,
    Left,
    Right,
    UpLeft,
    UpRight,
    DownLeft,
    DownRight,
    Wait,
    Pickup,
    Inventory,
    Drop,
    StairsDown,
    Character,
    Confirm,
    Cancel,
    ToggleFullscreen,
};

struct KeyChord {
    SDL_Keycode key = SDLK_UNKNOWN;
    Uint16 mods = KMOD_NONE; // only SHIFT/CTRL/ALT bits are used
};

struct KeyActionHash {
    size_t operator()(KeyAction a) const noexcept { return static_cast<size_t>(a); }
};

class KeyBinds {
public:
    static KeyBinds defaults();
    void loadOverridesFromIni(const std::string& settingsPath);

    KeyAction mapKey(SDL_Keycode key, Uint16 mods) const;

    // Full translation of a key press into an engine intent, taking the
    // current engine state (menus, targeting) into account.
    Intent intentFor(const Game& game, SDL_Keycode key, Uint16 mods) const;

    static std::optional<KeyAction> parseActionName(const std::string& bindKey);
    static std::optional<KeyChord> parseChord(const std::string& token);

private:
    std::unordered_map<KeyAction, std::vector<KeyChord>, KeyActionHash> binds;

    static Uint16 normalizeMods(Uint16 mods);
    static bool chordMatches(const KeyChord& chord, SDL_Keycode key, Uint16 mods);

    static std::vector<KeyChord> parseChordList(const std::string& value);
    static SDL_Keycode parseKeycode(const std::string& keyName);
};
