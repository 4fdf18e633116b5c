#pragma once

#include "dungeon.hpp"
#include "entity.hpp"
#include "rng.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One step of a depth-keyed step function: from `level` onward the value is `value`.
struct Transition {
    int level = 0;
    int value = 0;
};

// Must be sorted ascending by level; callers own that invariant.
using TransitionTable = std::vector<Transition>;

// Value of the entry with the largest level <= `level`, or 0 if none qualifies.
int fromDungeonLevel(const TransitionTable& table, int level);

template <typename T>
struct Weighted {
    int weight = 0;
    T value{};
};

// Index of a candidate picked with probability proportional to its weight.
// Negative weights count as zero. Returns -1 when the total weight is zero.
int weightedIndex(RNG& rng, const std::vector<int>& weights);

template <typename T>
std::optional<T> weightedChoice(RNG& rng, const std::vector<Weighted<T>>& candidates) {
    std::vector<int> weights;
    weights.reserve(candidates.size());
    for (const auto& c : candidates) weights.push_back(c.weight);
    const int i = weightedIndex(rng, weights);
    if (i < 0) return std::nullopt;
    return candidates[static_cast<size_t>(i)].value;
}

enum class MonsterKind : uint8_t {
    Orc = 0,
    Troll,
};

inline constexpr int MONSTER_KIND_COUNT = static_cast<int>(MonsterKind::Troll) + 1;

// Things that can be found lying on the floor.
enum class LootKind : uint8_t {
    Heal = 0,
    Lightning,
    Fireball,
    Confuse,
    Sword,
    Shield,
};

inline constexpr int LOOT_KIND_COUNT = static_cast<int>(LootKind::Shield) + 1;

struct MonsterDef {
    const char* id = "";
    std::string name;
    char glyph = '?';
    Color color;
    int hp = 1;
    int defense = 0;
    int power = 0;
    int xp = 0;
    TransitionTable weight;
};

struct SpellTuning {
    int healAmount = 40;
    int lightningDamage = 40;
    int lightningRange = 5;
    int fireballDamage = 25;
    int fireballRadius = 3;
    int confuseRange = 8;
    int confuseTurns = 10;
};

struct Progression {
    int levelUpBase = 200;
    int levelUpFactor = 150;
    int levelUpHp = 20;

    int xpToNext(int charLevel) const { return levelUpBase + charLevel * levelUpFactor; }
};

// All depth scaling and tuning numbers, passed explicitly to whoever needs them.
struct ContentTables {
    TransitionTable maxMonsters{{1, 2}, {4, 3}, {6, 5}};
    TransitionTable maxItems{{1, 1}, {4, 2}};
    std::array<MonsterDef, MONSTER_KIND_COUNT> monsters;
    std::array<TransitionTable, LOOT_KIND_COUNT> lootWeights;
    SpellTuning spells;
    Progression progression;
    int fovRadius = 10;
    bool fovLightWalls = true;

    ContentTables();

    const MonsterDef& monster(MonsterKind k) const { return monsters[static_cast<size_t>(k)]; }
};

Entity makePlayer(int x, int y);
Entity makeMonster(const ContentTables& content, MonsterKind kind, int x, int y);
Entity makeLoot(LootKind kind, int x, int y);
Entity makeDagger(int x, int y);
Entity makeStairs(int x, int y);

inline constexpr const char* STAIRS_NAME = "stairs";

// Spawn monsters and loot inside `room` for the given depth. Each spawn lands on a
// random interior tile and is skipped if that tile is blocked (by a wall, one of
// `spawned`, or `reserved`).
void populateRoom(const Room& room, const Dungeon& dung, std::vector<Entity>& spawned, int depth,
                  const ContentTables& content, RNG& rng, Vec2i reserved);

bool parseMonsterKindId(const std::string& id, MonsterKind& out);
bool parseLootKindId(const std::string& id, LootKind& out);

constexpr int MAX_TABLE_VALUE = 1000000;

// Parses "1:2, 4:3, 6:5" into a table sorted by level. Values are clamped to
// [0, MAX_TABLE_VALUE]; `clamped` (if given) reports whether any was.
bool parseTransitionTable(const std::string& raw, TransitionTable& out, bool* clamped = nullptr);

// Load tuning overrides from a user-editable INI-ish file on top of whatever
// `content`/`gen` already hold. Returns false only if the file could not be
// read. Parsing issues are reported in outWarnings.
bool loadContentIni(const std::string& path, ContentTables& content, DungeonGenConfig& gen,
                    std::string* outWarnings = nullptr);
