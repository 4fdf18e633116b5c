#pragma once
#include "common.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class Dungeon;

// Death behavior is stored as a tag (not a function) so entities stay
// copyable and serializable. combat.cpp dispatches on it.
enum class DeathKind : uint8_t {
    Player = 0,
    Monster,
};

struct Fighter {
    int maxHp = 1;
    int hp = 1;
    int defense = 0;
    int power = 0;
    // Monsters: XP awarded to whoever kills them.
    // Player: experience accumulated toward the next character level.
    int xp = 0;
    DeathKind onDeath = DeathKind::Monster;
};

enum class AiKind : uint8_t {
    Basic = 0,
    Confused,
};

// Monster brain. A confused AI owns a copy of the brain it replaced and
// hands it back once `turnsRemaining` runs out. Confusing an already
// confused monster nests another layer, up to MAX_LAYERS in total.
struct Ai {
    static constexpr int MAX_LAYERS = 64;

    AiKind kind = AiKind::Basic;
    int turnsRemaining = 0;
    std::unique_ptr<Ai> previous;

    Ai() = default;
    Ai(const Ai& o);
    Ai& operator=(const Ai& o);
    Ai(Ai&&) noexcept = default;
    Ai& operator=(Ai&&) noexcept = default;

    static Ai basic();
    static Ai confused(Ai prior, int turns);

    // Number of brains in the chain, this one included.
    int layers() const;
};

bool operator==(const Ai& a, const Ai& b);
inline bool operator!=(const Ai& a, const Ai& b) { return !(a == b); }

// Usable item effects. Append-only (stored in save files).
enum class ItemKind : uint8_t {
    Heal = 0,
    Lightning,
    Fireball,
    Confuse,
};

enum class EquipSlot : uint8_t {
    RightHand = 0,
    LeftHand,
};

inline const char* equipSlotName(EquipSlot s) {
    switch (s) {
        case EquipSlot::RightHand: return "right hand";
        case EquipSlot::LeftHand:  return "left hand";
        default:                   return "?";
    }
}

struct Equipment {
    EquipSlot slot = EquipSlot::RightHand;
    bool equipped = false;
    int powerBonus = 0;
    int defenseBonus = 0;
    int maxHpBonus = 0;
};

// The one object type of the simulation: player, monsters, items, corpses and stairs.
// Capabilities are optional slots; an entity with none of them is an inert prop.
struct Entity {
    Vec2i pos{0, 0};
    char glyph = '?';
    Color color;
    std::string name;

    bool blocks = false;
    bool alive = false;

    // Drawn on explored tiles even when out of sight (stairs).
    bool alwaysVisible = false;

    // Character level (only meaningful for the player).
    int level = 0;

    std::optional<Fighter> fighter;
    std::optional<Ai> ai;
    std::optional<ItemKind> item;
    std::optional<Equipment> equipment;

    Entity() = default;
    Entity(int x, int y, char glyph, std::string name, Color color, bool blocks);

    float distanceTo(const Entity& other) const { return distance(pos, other.pos); }
    float distanceTo(int x, int y) const { return distance(pos, Vec2i{x, y}); }

    // Can be moved into the inventory.
    bool isCollectible() const { return item.has_value() || equipment.has_value(); }
};

// True if the tile is a wall or holds a blocking entity.
bool isBlocked(const Dungeon& dung, const std::vector<Entity>& ents, int x, int y);
