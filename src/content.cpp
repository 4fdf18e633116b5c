#include "content.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

ContentTables::ContentTables() {
    MonsterDef& orc = monsters[static_cast<size_t>(MonsterKind::Orc)];
    orc.id = "orc";
    orc.name = "orc";
    orc.glyph = 'o';
    orc.color = colors::DesaturatedGreen;
    orc.hp = 20;
    orc.defense = 0;
    orc.power = 4;
    orc.xp = 35;
    orc.weight = {{1, 80}};

    MonsterDef& troll = monsters[static_cast<size_t>(MonsterKind::Troll)];
    troll.id = "troll";
    troll.name = "troll";
    troll.glyph = 'T';
    troll.color = colors::DarkerGreen;
    troll.hp = 30;
    troll.defense = 2;
    troll.power = 8;
    troll.xp = 100;
    troll.weight = {{3, 15}, {5, 30}, {7, 60}};

    // Everything but healing potions is absent on the first floors and phases in with depth.
    lootWeights[static_cast<size_t>(LootKind::Heal)] = {{1, 35}};
    lootWeights[static_cast<size_t>(LootKind::Lightning)] = {{4, 25}};
    lootWeights[static_cast<size_t>(LootKind::Fireball)] = {{6, 25}};
    lootWeights[static_cast<size_t>(LootKind::Confuse)] = {{2, 10}};
    lootWeights[static_cast<size_t>(LootKind::Sword)] = {{4, 5}};
    lootWeights[static_cast<size_t>(LootKind::Shield)] = {{8, 15}};
}

int fromDungeonLevel(const TransitionTable& table, int level) {
    for (auto it = table.rbegin(); it != table.rend(); ++it) {
        if (level >= it->level) return it->value;
    }
    return 0;
}

int weightedIndex(RNG& rng, const std::vector<int>& weights) {
    int64_t total = 0;
    for (int w : weights) total += std::max(0, w);
    if (total <= 0) return -1;

    int64_t roll = static_cast<int64_t>(rng.nextU32() % static_cast<uint64_t>(total));
    for (size_t i = 0; i < weights.size(); ++i) {
        const int64_t w = std::max(0, weights[i]);
        if (roll < w) return static_cast<int>(i);
        roll -= w;
    }
    return -1;
}

Entity makePlayer(int x, int y) {
    Entity p(x, y, '@', "player", colors::White, true);
    p.alive = true;
    p.level = 1;
    Fighter f;
    f.maxHp = 100;
    f.hp = 100;
    f.defense = 1;
    f.power = 2;
    f.xp = 0;
    f.onDeath = DeathKind::Player;
    p.fighter = f;
    return p;
}

Entity makeMonster(const ContentTables& content, MonsterKind kind, int x, int y) {
    const MonsterDef& def = content.monster(kind);
    Entity m(x, y, def.glyph, def.name, def.color, true);
    m.alive = true;
    Fighter f;
    f.maxHp = def.hp;
    f.hp = def.hp;
    f.defense = def.defense;
    f.power = def.power;
    f.xp = def.xp;
    f.onDeath = DeathKind::Monster;
    m.fighter = f;
    m.ai = Ai::basic();
    return m;
}

namespace {

Entity makeEquipment(int x, int y, char glyph, const char* name, Color color, EquipSlot slot, int power, int defense) {
    Entity e(x, y, glyph, name, color, false);
    Equipment eq;
    eq.slot = slot;
    eq.powerBonus = power;
    eq.defenseBonus = defense;
    e.equipment = eq;
    return e;
}

Entity makeScroll(int x, int y, const char* name, ItemKind kind) {
    Entity e(x, y, '#', name, colors::LightYellow, false);
    e.item = kind;
    return e;
}

} // namespace

Entity makeLoot(LootKind kind, int x, int y) {
    switch (kind) {
        case LootKind::Heal: {
            Entity e(x, y, '!', "healing potion", colors::Violet, false);
            e.item = ItemKind::Heal;
            return e;
        }
        case LootKind::Lightning: return makeScroll(x, y, "scroll of lightning bolt", ItemKind::Lightning);
        case LootKind::Fireball:  return makeScroll(x, y, "scroll of fireball", ItemKind::Fireball);
        case LootKind::Confuse:   return makeScroll(x, y, "scroll of confusion", ItemKind::Confuse);
        case LootKind::Sword:     return makeEquipment(x, y, '/', "sword", colors::Sky, EquipSlot::RightHand, 3, 0);
        case LootKind::Shield:    return makeEquipment(x, y, '[', "shield", colors::DarkerOrange, EquipSlot::LeftHand, 0, 1);
        default: break;
    }
    return Entity(x, y, '?', "thing", colors::White, false);
}

Entity makeDagger(int x, int y) {
    return makeEquipment(x, y, '-', "dagger", colors::Sky, EquipSlot::RightHand, 2, 0);
}

Entity makeStairs(int x, int y) {
    Entity s(x, y, '<', STAIRS_NAME, colors::White, false);
    s.alwaysVisible = true;
    return s;
}

void populateRoom(const Room& room, const Dungeon& dung, std::vector<Entity>& spawned, int depth,
                  const ContentTables& content, RNG& rng, Vec2i reserved) {
    auto blocked = [&](int x, int y) {
        if (x == reserved.x && y == reserved.y) return true;
        return isBlocked(dung, spawned, x, y);
    };

    std::vector<Weighted<MonsterKind>> monsterChances;
    for (int i = 0; i < MONSTER_KIND_COUNT; ++i) {
        const MonsterKind k = static_cast<MonsterKind>(i);
        monsterChances.push_back({fromDungeonLevel(content.monster(k).weight, depth), k});
    }

    std::vector<Weighted<LootKind>> lootChances;
    for (int i = 0; i < LOOT_KIND_COUNT; ++i) {
        lootChances.push_back({fromDungeonLevel(content.lootWeights[static_cast<size_t>(i)], depth), static_cast<LootKind>(i)});
    }

    const int numMonsters = rng.range(0, std::max(0, fromDungeonLevel(content.maxMonsters, depth)));
    for (int i = 0; i < numMonsters; ++i) {
        const int x = rng.range(room.x1 + 1, room.x2 - 1);
        const int y = rng.range(room.y1 + 1, room.y2 - 1);
        if (blocked(x, y)) continue;

        const std::optional<MonsterKind> kind = weightedChoice(rng, monsterChances);
        if (!kind) continue;
        spawned.push_back(makeMonster(content, *kind, x, y));
    }

    const int numItems = rng.range(0, std::max(0, fromDungeonLevel(content.maxItems, depth)));
    for (int i = 0; i < numItems; ++i) {
        const int x = rng.range(room.x1 + 1, room.x2 - 1);
        const int y = rng.range(room.y1 + 1, room.y2 - 1);
        if (blocked(x, y)) continue;

        const std::optional<LootKind> kind = weightedChoice(rng, lootChances);
        if (!kind) continue;
        spawned.push_back(makeLoot(*kind, x, y));
    }
}

bool parseMonsterKindId(const std::string& id, MonsterKind& out) {
    const std::string v = toLower(trim(id));
    if (v == "orc") { out = MonsterKind::Orc; return true; }
    if (v == "troll") { out = MonsterKind::Troll; return true; }
    return false;
}

bool parseLootKindId(const std::string& id, LootKind& out) {
    const std::string v = toLower(trim(id));
    if (v == "heal" || v == "healing_potion" || v == "potion") { out = LootKind::Heal; return true; }
    if (v == "lightning" || v == "lightning_bolt") { out = LootKind::Lightning; return true; }
    if (v == "fireball") { out = LootKind::Fireball; return true; }
    if (v == "confuse" || v == "confusion") { out = LootKind::Confuse; return true; }
    if (v == "sword") { out = LootKind::Sword; return true; }
    if (v == "shield") { out = LootKind::Shield; return true; }
    return false;
}

bool parseTransitionTable(const std::string& raw, TransitionTable& out, bool* clamped) {
    TransitionTable table;
    bool anyClamped = false;
    for (const std::string& entry : splitOn(raw, ',')) {
        if (entry.empty()) continue;
        const size_t colon = entry.find(':');
        if (colon == std::string::npos) return false;
        Transition t;
        if (!parseInt(entry.substr(0, colon), t.level)) return false;
        if (!parseInt(entry.substr(colon + 1), t.value)) return false;
        const int v = std::clamp(t.value, 0, MAX_TABLE_VALUE);
        if (v != t.value) anyClamped = true;
        t.value = v;
        table.push_back(t);
    }
    std::stable_sort(table.begin(), table.end(), [](const Transition& a, const Transition& b) { return a.level < b.level; });
    out = std::move(table);
    if (clamped) *clamped = anyClamped;
    return true;
}

namespace {

bool setPositive(const std::string& val, int& dst, int lo, int hi) {
    int v = 0;
    if (!parseInt(val, v)) return false;
    dst = std::clamp(v, lo, hi);
    return true;
}

} // namespace

bool loadContentIni(const std::string& path, ContentTables& content, DungeonGenConfig& gen, std::string* outWarnings) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (outWarnings) *outWarnings = "Could not open content file: " + path + "\n";
        return false;
    }

    std::string contents;
    {
        std::ostringstream oss;
        oss << f.rdbuf();
        contents = oss.str();
    }

    std::istringstream iss(contents);
    std::string line;

    std::string warnings;
    int warnCount = 0;

    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        stripUtf8Bom(line);
        line = trim(stripIniComment(line));
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        const std::vector<std::string> toks = splitOn(key, '.');
        if (toks.size() < 2) {
            appendWarning(warnings, lineNo, "Unknown key: " + key, warnCount);
            continue;
        }

        const std::string& head = toks[0];
        bool ok = true;
        bool clamped = false;

        if (head == "map" && toks.size() == 2) {
            if (toks[1] == "width") ok = setPositive(val, gen.width, 10, 400);
            else if (toks[1] == "height") ok = setPositive(val, gen.height, 10, 400);
            else { appendWarning(warnings, lineNo, "Unknown map field: " + toks[1], warnCount); continue; }
        } else if (head == "room" && toks.size() == 2) {
            if (toks[1] == "min_size") ok = setPositive(val, gen.roomMinSize, 2, 100);
            else if (toks[1] == "max_size") ok = setPositive(val, gen.roomMaxSize, 2, 100);
            else if (toks[1] == "max_attempts" || toks[1] == "max_rooms") ok = setPositive(val, gen.maxRooms, 1, 10000);
            else { appendWarning(warnings, lineNo, "Unknown room field: " + toks[1], warnCount); continue; }
        } else if (head == "table" && toks.size() == 2) {
            if (toks[1] == "max_monsters") ok = parseTransitionTable(val, content.maxMonsters, &clamped);
            else if (toks[1] == "max_items") ok = parseTransitionTable(val, content.maxItems, &clamped);
            else { appendWarning(warnings, lineNo, "Unknown table: " + toks[1], warnCount); continue; }
        } else if (head == "monster" && toks.size() == 3) {
            MonsterKind mk;
            if (!parseMonsterKindId(toks[1], mk)) {
                appendWarning(warnings, lineNo, "Unknown monster id: " + toks[1], warnCount);
                continue;
            }
            MonsterDef& def = content.monsters[static_cast<size_t>(mk)];
            const std::string& field = toks[2];
            if (field == "hp" || field == "hp_max") ok = setPositive(val, def.hp, 1, 100000);
            else if (field == "defense" || field == "def") ok = setPositive(val, def.defense, 0, 100000);
            else if (field == "power" || field == "atk") ok = setPositive(val, def.power, 0, 100000);
            else if (field == "xp") ok = setPositive(val, def.xp, 0, 1000000);
            else if (field == "weight") ok = parseTransitionTable(val, def.weight, &clamped);
            else { appendWarning(warnings, lineNo, "Unknown monster field: " + field, warnCount); continue; }
        } else if (head == "item" && toks.size() == 3) {
            LootKind lk;
            if (!parseLootKindId(toks[1], lk)) {
                appendWarning(warnings, lineNo, "Unknown item id: " + toks[1], warnCount);
                continue;
            }
            if (toks[2] != "weight") {
                appendWarning(warnings, lineNo, "Unknown item field: " + toks[2], warnCount);
                continue;
            }
            ok = parseTransitionTable(val, content.lootWeights[static_cast<size_t>(lk)], &clamped);
        } else if (head == "spell" && toks.size() == 2) {
            SpellTuning& s = content.spells;
            const std::string& field = toks[1];
            if (field == "heal_amount") ok = setPositive(val, s.healAmount, 0, 100000);
            else if (field == "lightning_damage") ok = setPositive(val, s.lightningDamage, 0, 100000);
            else if (field == "lightning_range") ok = setPositive(val, s.lightningRange, 0, 1000);
            else if (field == "fireball_damage") ok = setPositive(val, s.fireballDamage, 0, 100000);
            else if (field == "fireball_radius") ok = setPositive(val, s.fireballRadius, 0, 1000);
            else if (field == "confuse_range") ok = setPositive(val, s.confuseRange, 0, 1000);
            else if (field == "confuse_turns") ok = setPositive(val, s.confuseTurns, 1, 1000);
            else { appendWarning(warnings, lineNo, "Unknown spell field: " + field, warnCount); continue; }
        } else if (head == "level_up" && toks.size() == 2) {
            Progression& p = content.progression;
            if (toks[1] == "base") ok = setPositive(val, p.levelUpBase, 1, 1000000);
            else if (toks[1] == "factor") ok = setPositive(val, p.levelUpFactor, 0, 1000000);
            else if (toks[1] == "hp") ok = setPositive(val, p.levelUpHp, 1, 100000);
            else { appendWarning(warnings, lineNo, "Unknown level_up field: " + toks[1], warnCount); continue; }
        } else if (head == "fov" && toks.size() == 2) {
            if (toks[1] == "radius") ok = setPositive(val, content.fovRadius, 1, 200);
            else if (toks[1] == "light_walls") ok = parseBool(val, content.fovLightWalls);
            else { appendWarning(warnings, lineNo, "Unknown fov field: " + toks[1], warnCount); continue; }
        } else {
            appendWarning(warnings, lineNo, "Unknown key: " + key, warnCount);
            continue;
        }

        if (!ok) appendWarning(warnings, lineNo, "Invalid value for " + key + ": " + val, warnCount);
        else if (clamped) appendWarning(warnings, lineNo, "Table value out of range for " + key + " (clamped to 0.." + std::to_string(MAX_TABLE_VALUE) + ")", warnCount);
    }

    if (outWarnings) *outWarnings = warnings;
    return true;
}
