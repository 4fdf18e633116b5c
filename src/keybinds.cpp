#include "keybinds.hpp"

#include "text_utils.hpp"

#include <cctype>
#include <fstream>

Uint16 KeyBinds::normalizeMods(Uint16 mods) {
    return mods & (KMOD_SHIFT | KMOD_CTRL | KMOD_ALT);
}

bool KeyBinds::chordMatches(const KeyChord& chord, SDL_Keycode key, Uint16 mods) {
    return chord.key == key && chord.mods == normalizeMods(mods);
}

SDL_Keycode KeyBinds::parseKeycode(const std::string& keyNameIn) {
    std::string keyName = trim(toLower(keyNameIn));
    if (keyName.empty()) return SDLK_UNKNOWN;

    // Single character (letters are treated case-insensitively).
    if (keyName.size() == 1) {
        return static_cast<SDL_Keycode>(static_cast<unsigned char>(keyName[0]));
    }

    // Directional / navigation
    if (keyName == "up") return SDLK_UP;
    if (keyName == "down") return SDLK_DOWN;
    if (keyName == "left") return SDLK_LEFT;
    if (keyName == "right") return SDLK_RIGHT;
    if (keyName == "pageup" || keyName == "pgup") return SDLK_PAGEUP;
    if (keyName == "pagedown" || keyName == "pgdn") return SDLK_PAGEDOWN;
    if (keyName == "home") return SDLK_HOME;
    if (keyName == "end") return SDLK_END;

    // Control keys
    if (keyName == "enter" || keyName == "return") return SDLK_RETURN;
    if (keyName == "escape" || keyName == "esc") return SDLK_ESCAPE;
    if (keyName == "tab") return SDLK_TAB;
    if (keyName == "space") return SDLK_SPACE;
    if (keyName == "backspace") return SDLK_BACKSPACE;

    // Punctuation (named)
    if (keyName == "comma") return SDLK_COMMA;
    if (keyName == "period" || keyName == "dot") return SDLK_PERIOD;
    if (keyName == "slash") return SDLK_SLASH;
    if (keyName == "less") return SDLK_LESS;
    if (keyName == "greater") return SDLK_GREATER;

    // Keypad
    if (keyName == "kp_enter") return SDLK_KP_ENTER;
    if (keyName == "kp_0") return SDLK_KP_0;
    if (keyName == "kp_1") return SDLK_KP_1;
    if (keyName == "kp_2") return SDLK_KP_2;
    if (keyName == "kp_3") return SDLK_KP_3;
    if (keyName == "kp_4") return SDLK_KP_4;
    if (keyName == "kp_5") return SDLK_KP_5;
    if (keyName == "kp_6") return SDLK_KP_6;
    if (keyName == "kp_7") return SDLK_KP_7;
    if (keyName == "kp_8") return SDLK_KP_8;
    if (keyName == "kp_9") return SDLK_KP_9;

    // Fallback: SDL's own key name parsing ("Left Shift", "Keypad 8", ...).
    return SDL_GetKeyFromName(keyNameIn.c_str());
}

std::optional<KeyChord> KeyBinds::parseChord(const std::string& tokenIn) {
    std::string token = trim(tokenIn);
    if (token.empty()) return std::nullopt;

    std::vector<std::string> parts = splitOn(token, '+');
    if (parts.empty()) return std::nullopt;

    Uint16 mods = KMOD_NONE;

    // All parts except the last are modifiers.
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        std::string m = toLower(parts[i]);
        if (m == "shift") mods |= KMOD_SHIFT;
        else if (m == "ctrl" || m == "control") mods |= KMOD_CTRL;
        else if (m == "alt") mods |= KMOD_ALT;
        else return std::nullopt;
    }

    SDL_Keycode key = parseKeycode(parts.back());
    if (key == SDLK_UNKNOWN) return std::nullopt;

    KeyChord chord;
    chord.key = key;
    chord.mods = normalizeMods(mods);
    return chord;
}

std::vector<KeyChord> KeyBinds::parseChordList(const std::string& valueIn) {
    std::string value = trim(valueIn);
    if (value.empty()) return {};
    std::string vLow = toLower(value);
    if (vLow == "none" || vLow == "unbound" || vLow == "disabled") return {};

    std::vector<KeyChord> out;
    for (const auto& part : splitOn(value, ',')) {
        auto chord = parseChord(part);
        if (chord.has_value()) out.push_back(*chord);
    }
    return out;
}

std::optional<KeyAction> KeyBinds::parseActionName(const std::string& bindKeyIn) {
    std::string key = trim(toLower(bindKeyIn));
    if (key.rfind("bind_", 0) != 0) return std::nullopt;
    std::string name = key.substr(5);

    // Movement
    if (name == "up") return KeyAction::Up;
    if (name == "down") return KeyAction::Down;
    if (name == "left") return KeyAction::Left;
    if (name == "right") return KeyAction::Right;
    if (name == "up_left" || name == "upleft") return KeyAction::UpLeft;
    if (name == "up_right" || name == "upright") return KeyAction::UpRight;
    if (name == "down_left" || name == "downleft") return KeyAction::DownLeft;
    if (name == "down_right" || name == "downright") return KeyAction::DownRight;

    // Core actions
    if (name == "wait") return KeyAction::Wait;
    if (name == "pickup" || name == "pick_up") return KeyAction::Pickup;
    if (name == "inventory" || name == "inv") return KeyAction::Inventory;
    if (name == "drop") return KeyAction::Drop;
    if (name == "stairs_down" || name == "stairsdown" || name == "descend") return KeyAction::StairsDown;
    if (name == "character" || name == "char") return KeyAction::Character;
    if (name == "confirm" || name == "ok") return KeyAction::Confirm;
    if (name == "cancel" || name == "escape") return KeyAction::Cancel;
    if (name == "fullscreen" || name == "toggle_fullscreen") return KeyAction::ToggleFullscreen;

    return std::nullopt;
}

KeyBinds KeyBinds::defaults() {
    KeyBinds kb;

    auto add = [&](KeyAction a, SDL_Keycode key, Uint16 mods = KMOD_NONE) {
        kb.binds[a].push_back({key, normalizeMods(mods)});
    };

    // Movement: arrows, numpad and vi-keys.
    add(KeyAction::Up, SDLK_UP);
    add(KeyAction::Up, SDLK_KP_8);
    add(KeyAction::Up, SDLK_k);

    add(KeyAction::Down, SDLK_DOWN);
    add(KeyAction::Down, SDLK_KP_2);
    add(KeyAction::Down, SDLK_j);

    add(KeyAction::Left, SDLK_LEFT);
    add(KeyAction::Left, SDLK_KP_4);
    add(KeyAction::Left, SDLK_h);

    add(KeyAction::Right, SDLK_RIGHT);
    add(KeyAction::Right, SDLK_KP_6);
    add(KeyAction::Right, SDLK_l);

    add(KeyAction::UpLeft, SDLK_HOME);
    add(KeyAction::UpLeft, SDLK_KP_7);
    add(KeyAction::UpLeft, SDLK_y);

    add(KeyAction::UpRight, SDLK_PAGEUP);
    add(KeyAction::UpRight, SDLK_KP_9);
    add(KeyAction::UpRight, SDLK_u);

    add(KeyAction::DownLeft, SDLK_END);
    add(KeyAction::DownLeft, SDLK_KP_1);
    add(KeyAction::DownLeft, SDLK_b);

    add(KeyAction::DownRight, SDLK_PAGEDOWN);
    add(KeyAction::DownRight, SDLK_KP_3);
    add(KeyAction::DownRight, SDLK_n);

    // Actions
    add(KeyAction::Wait, SDLK_KP_5);
    add(KeyAction::Wait, SDLK_PERIOD);

    add(KeyAction::Pickup, SDLK_g);
    add(KeyAction::Inventory, SDLK_i);
    add(KeyAction::Drop, SDLK_d);

    add(KeyAction::StairsDown, SDLK_COMMA, KMOD_SHIFT);
    add(KeyAction::StairsDown, SDLK_LESS);

    add(KeyAction::Character, SDLK_c);

    add(KeyAction::Confirm, SDLK_RETURN);
    add(KeyAction::Confirm, SDLK_KP_ENTER);
    add(KeyAction::Cancel, SDLK_ESCAPE);

    add(KeyAction::ToggleFullscreen, SDLK_RETURN, KMOD_ALT);

    return kb;
}

void KeyBinds::loadOverridesFromIni(const std::string& settingsPath) {
    std::ifstream in(settingsPath);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        line = stripIniComment(line);

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        auto act = parseActionName(key);
        if (!act.has_value()) continue;

        binds[*act] = parseChordList(val);
    }
}

KeyAction KeyBinds::mapKey(SDL_Keycode key, Uint16 mods) const {
    Uint16 nm = normalizeMods(mods);

    // Modified chords first so alt+enter is not read as plain enter.
    static const KeyAction order[] = {
        KeyAction::ToggleFullscreen,
        KeyAction::Confirm,
        KeyAction::Cancel,
        KeyAction::Inventory,
        KeyAction::Drop,
        KeyAction::Pickup,
        KeyAction::Character,
        KeyAction::StairsDown,
        KeyAction::Wait,
        KeyAction::Up,
        KeyAction::Down,
        KeyAction::Left,
        KeyAction::Right,
        KeyAction::UpLeft,
        KeyAction::UpRight,
        KeyAction::DownLeft,
        KeyAction::DownRight,
    };

    for (KeyAction a : order) {
        auto it = binds.find(a);
        if (it == binds.end()) continue;
        for (const auto& chord : it->second) {
            if (chordMatches(chord, key, nm)) return a;
        }
    }
    return KeyAction::None;
}

namespace {

bool directionOf(KeyAction a, int& dx, int& dy) {
    dx = 0;
    dy = 0;
    switch (a) {
        case KeyAction::Up:        dy = -1; break;
        case KeyAction::Down:      dy = 1; break;
        case KeyAction::Left:      dx = -1; break;
        case KeyAction::Right:     dx = 1; break;
        case KeyAction::UpLeft:    dx = -1; dy = -1; break;
        case KeyAction::UpRight:   dx = 1; dy = -1; break;
        case KeyAction::DownLeft:  dx = -1; dy = 1; break;
        case KeyAction::DownRight: dx = 1; dy = 1; break;
        default: return false;
    }
    return true;
}

} // namespace

Intent KeyBinds::intentFor(const Game& game, SDL_Keycode key, Uint16 mods) const {
    const KeyAction a = mapKey(key, mods);

    // The character sheet closes on any key.
    if (game.characterSheetOpen()) return Intent::of(IntentKind::Cancel);

    switch (game.state()) {
        case EngineState::InventoryMenu:
        case EngineState::LevelUp: {
            if (normalizeMods(mods) == KMOD_NONE && key >= SDLK_a && key <= SDLK_z) {
                return Intent::choose(static_cast<int>(key - SDLK_a));
            }
            // Any other key closes the inventory; the level-up choice cannot be skipped.
            if (game.state() == EngineState::InventoryMenu) return Intent::of(IntentKind::Cancel);
            return Intent{};
        }
        case EngineState::Targeting: {
            int dx = 0, dy = 0;
            if (directionOf(a, dx, dy)) return Intent::move(dx, dy);
            if (a == KeyAction::Confirm) return Intent::of(IntentKind::Confirm);
            if (a == KeyAction::Cancel) return Intent::of(IntentKind::Cancel);
            return Intent{};
        }
        case EngineState::AwaitingInput: {
            int dx = 0, dy = 0;
            if (directionOf(a, dx, dy)) return Intent::move(dx, dy);
            switch (a) {
                case KeyAction::Wait:       return Intent::of(IntentKind::Wait);
                case KeyAction::Pickup:     return Intent::of(IntentKind::Pickup);
                case KeyAction::Inventory:  return Intent::of(IntentKind::OpenInventory);
                case KeyAction::Drop:       return Intent::of(IntentKind::OpenDropMenu);
                case KeyAction::StairsDown: return Intent::of(IntentKind::DescendStairs);
                case KeyAction::Character:  return Intent::of(IntentKind::ShowCharacter);
                default: return Intent{};
            }
        }
        default:
            return Intent{};
    }
}
