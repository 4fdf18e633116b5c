#include "ai.hpp"
#include "combat.hpp"
#include "content.hpp"
#include "dungeon.hpp"
#include "entity_store.hpp"
#include "fov.hpp"
#include "game.hpp"
#include "inventory.hpp"
#include "message_log.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "spells.hpp"
#include "text_utils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

// Visibility without geometry: everything is visible unless `hidden` says otherwise.
class StubFov final : public VisibilityQuery {
public:
    std::set<std::pair<int, int>> hidden;

    void reset(const Dungeon&) override {}
    void recompute(int, int, int, bool) override {}
    bool isVisible(int x, int y) const override { return hidden.count({x, y}) == 0; }
};

// One big open room: floor on 1..w-2 x 1..h-2.
Dungeon openDungeon(int w, int h) {
    Dungeon d(w, h);
    d.carveRoom(Room{0, 0, w - 1, h - 1});
    return d;
}

Entity orcAt(const ContentTables& content, int x, int y) {
    return makeMonster(content, MonsterKind::Orc, x, y);
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }
}

void test_room_geometry() {
    const Room a = Room::fromSize(0, 0, 5, 5);
    const Room touching = Room::fromSize(5, 0, 5, 5);
    const Room apart = Room::fromSize(6, 0, 5, 5);

    expect(a.intersects(touching), "Rooms sharing a wall line intersect");
    expect(!a.intersects(apart), "Separated rooms do not intersect");
    expect(a.center() == Vec2i{2, 2}, "Room center");
    expect(a.containsStrictly(a.center()), "Center lies in the interior");
    expect(!a.containsStrictly(Vec2i{0, 2}), "Wall line is not interior");
}

void test_generator_layout() {
    const ContentTables content;
    const DungeonGenConfig cfg;

    for (uint32_t seed = 1; seed <= 25; ++seed) {
        RNG rng(seed);
        GeneratedLevel lvl = generateDungeon(cfg, content, 1, rng);
        const std::string tag = " (seed " + std::to_string(seed) + ")";

        expect(lvl.ok(), "Default config places rooms" + tag);
        if (!lvl.ok()) continue;

        expect(lvl.dungeon.width == cfg.width && lvl.dungeon.height == cfg.height, "Map dimensions" + tag);

        for (size_t i = 0; i < lvl.rooms.size(); ++i) {
            for (size_t j = i + 1; j < lvl.rooms.size(); ++j) {
                expect(!lvl.rooms[i].intersects(lvl.rooms[j]), "Accepted rooms never overlap" + tag);
            }
        }

        expect(lvl.playerStart == lvl.rooms.front().center(), "Player starts in the first room" + tag);
        expect(lvl.stairs == lvl.rooms.back().center(), "Stairs sit in the last room" + tag);
        expect(!lvl.dungeon.at(lvl.playerStart.x, lvl.playerStart.y).blocked, "Player start is floor" + tag);

        expect(!lvl.spawned.empty() && lvl.spawned.back().name == STAIRS_NAME, "Stairs are spawned last" + tag);
        expect(lvl.spawned.back().alwaysVisible, "Stairs stay visible once explored" + tag);

        for (const Room& r : lvl.rooms) {
            for (int y = r.y1 + 1; y < r.y2; ++y) {
                for (int x = r.x1 + 1; x < r.x2; ++x) {
                    expect(!lvl.dungeon.at(x, y).blocked, "Room interior is carved" + tag);
                }
            }

            int monsters = 0;
            int items = 0;
            for (const Entity& e : lvl.spawned) {
                if (!r.containsStrictly(e.pos)) continue;
                if (e.fighter) ++monsters;
                if (e.isCollectible()) ++items;
            }
            expect(monsters <= 2, "At most 2 monsters per room on level 1" + tag);
            expect(items <= 1, "At most 1 item per room on level 1" + tag);
        }

        std::set<std::pair<int, int>> occupied;
        for (const Entity& e : lvl.spawned) {
            if (e.name == STAIRS_NAME) continue;
            expect(e.pos != lvl.playerStart, "Nothing spawns on the player start" + tag);
            if (e.fighter) {
                expect(e.name == "orc", "Only orcs on level 1" + tag);
                expect(occupied.insert({e.pos.x, e.pos.y}).second, "Monsters never share a tile" + tag);
            }
            if (e.item) expect(*e.item == ItemKind::Heal, "Only healing potions on level 1" + tag);
        }
    }
}

void test_generator_no_rooms() {
    const ContentTables content;
    DungeonGenConfig cfg;
    cfg.width = 5;
    cfg.height = 5;

    RNG rng(9u);
    GeneratedLevel lvl = generateDungeon(cfg, content, 1, rng);
    expect(!lvl.ok(), "Map too small for any room");
    expect(lvl.spawned.empty(), "No stairs without rooms");
}

void test_generator_deterministic() {
    const ContentTables content;
    const DungeonGenConfig cfg;

    RNG a(1234u);
    RNG b(1234u);
    GeneratedLevel la = generateDungeon(cfg, content, 3, a);
    GeneratedLevel lb = generateDungeon(cfg, content, 3, b);

    expect(la.rooms.size() == lb.rooms.size(), "Same seed, same room count");
    expect(la.spawned.size() == lb.spawned.size(), "Same seed, same spawns");
    bool same = la.dungeon.tiles.size() == lb.dungeon.tiles.size();
    for (size_t i = 0; same && i < la.dungeon.tiles.size(); ++i) {
        same = la.dungeon.tiles[i].blocked == lb.dungeon.tiles[i].blocked;
    }
    expect(same, "Same seed, same tiles");
}

void test_transition_tables() {
    const TransitionTable t{{1, 2}, {4, 3}, {6, 5}};
    expect(fromDungeonLevel(t, 0) == 0, "Below the first entry yields 0");
    expect(fromDungeonLevel(t, 1) == 2, "Level 1");
    expect(fromDungeonLevel(t, 3) == 2, "Level 3 keeps level 1 value");
    expect(fromDungeonLevel(t, 4) == 3, "Level 4");
    expect(fromDungeonLevel(t, 99) == 5, "Deep levels keep the last value");
    expect(fromDungeonLevel(TransitionTable{}, 5) == 0, "Empty table yields 0");

    int prev = 0;
    for (int lvl = 0; lvl < 20; ++lvl) {
        const int v = fromDungeonLevel(t, lvl);
        expect(v >= prev, "Increasing table stays monotonic");
        prev = v;
    }

    TransitionTable parsed;
    expect(parseTransitionTable("6:5, 1:2 ,4:3", parsed), "Parse transition table");
    expect(parsed.size() == 3 && parsed[0].level == 1 && parsed[1].level == 4 && parsed[2].level == 6,
           "Parsed table is sorted by level");

    TransitionTable untouched{{1, 7}};
    expect(!parseTransitionTable("1:2, nope", untouched), "Malformed table is rejected");
    expect(untouched.size() == 1 && untouched[0].value == 7, "Rejected parse leaves the table alone");
}

void test_weighted_choice() {
    RNG rng(5u);
    expect(weightedIndex(rng, {0, 0, 0}) == -1, "Zero total weight picks nothing");
    expect(weightedIndex(rng, {}) == -1, "Empty candidates pick nothing");

    for (int i = 0; i < 200; ++i) {
        expect(weightedIndex(rng, {0, 5, 0}) == 1, "Only the weighted candidate is picked");
    }

    const std::vector<Weighted<MonsterKind>> none{{0, MonsterKind::Orc}, {0, MonsterKind::Troll}};
    expect(!weightedChoice(rng, none).has_value(), "weightedChoice with zero total");

    bool sawFirst = false;
    bool sawSecond = false;
    for (int i = 0; i < 200; ++i) {
        const int pick = weightedIndex(rng, {2147483647, 2147483647});
        expect(pick == 0 || pick == 1, "Huge weights still pick a candidate");
        sawFirst = sawFirst || pick == 0;
        sawSecond = sawSecond || pick == 1;
    }
    expect(sawFirst && sawSecond, "Huge weights pick both candidates");
}

void test_entity_store() {
    EntityStore store;
    store.add(makePlayer(1, 1));
    store.add(Entity(2, 2, 'a', "a", colors::White, false));
    store.add(Entity(3, 3, 'b', "b", colors::White, false));
    store.add(Entity(4, 4, 'c', "c", colors::White, false));

    Entity removed = store.removeSwap(1);
    expect(removed.name == "a", "removeSwap returns the removed entity");
    expect(store.size() == 3, "removeSwap shrinks the store");
    expect(store[1].name == "c", "Last entity takes the freed slot");
    expect(store[2].name == "b", "Other slots are untouched");

    auto pair = store.mutTwo(2, 0);
    expect(pair.first.name == "b" && pair.second.name == "player", "mutTwo keeps argument order");
    pair.first.pos = Vec2i{9, 9};
    pair.second.pos = Vec2i{8, 8};
    expect(store[2].pos == Vec2i{9, 9} && store[0].pos == Vec2i{8, 8}, "mutTwo views alias the store");

    store.truncate(1);
    expect(store.size() == 1 && store.player().name == "player", "truncate keeps the player");
}

void test_message_log_trim() {
    MessageLog log;
    for (int i = 0; i < 401; ++i) log.add("msg " + std::to_string(i));
    expect(log.size() == 301, "Log drops the oldest lines once full");
    expect(log.messages().front().text == "msg 100", "Oldest surviving line");
    expect(log.back().text == "msg 400", "Newest line kept");
}

void test_fov_walls_block_sight() {
    Dungeon d(12, 3);
    d.carveHTunnel(1, 4, 1);
    d.carveHTunnel(6, 10, 1);

    ShadowcastFov fov;
    fov.reset(d);
    fov.recompute(1, 1, 10, true);

    expect(fov.isVisible(1, 1), "Origin is visible");
    expect(fov.isVisible(4, 1), "Open corridor is visible");
    expect(fov.isVisible(5, 1), "Lit wall is visible");
    expect(!fov.isVisible(7, 1), "Tiles behind a wall are hidden");

    fov.recompute(1, 1, 2, true);
    expect(!fov.isVisible(4, 1), "Radius limits sight");
}

void test_combat_scenarios() {
    const ContentTables content;
    EntityStore store;
    Inventory inv;
    MessageLog log;

    store.add(makePlayer(1, 1));
    store.player().fighter->power = 5;

    Entity target = orcAt(content, 2, 1);
    target.fighter->defense = 2;
    target.fighter->hp = 4;
    target.fighter->maxHp = 4;
    const size_t orc = store.add(std::move(target));

    AttackOutcome first = attack(store, EntityStore::PLAYER, orc, inv, log);
    expect(first.damage == 3, "Damage is power minus defense");
    expect(store[orc].fighter->hp == 1, "Monster keeps 1 hp");
    expect(store[orc].alive && !first.killed, "Monster survives the first hit");
    expect(log.count("Player attacks orc for 3 hit points.") == 1, "One attack message");

    AttackOutcome second = attack(store, EntityStore::PLAYER, orc, inv, log);
    expect(second.killed, "Second hit kills");
    expect(second.xp == content.monster(MonsterKind::Orc).xp, "Kill yields the monster's XP");
    expect(store.player().fighter->xp == second.xp, "Player is credited with the XP");

    const Entity& corpse = store[orc];
    expect(!corpse.alive, "Corpse is not alive");
    expect(corpse.glyph == '%', "Corpse glyph");
    expect(corpse.name == "remains of orc", "Corpse name");
    expect(!corpse.blocks && !corpse.fighter && !corpse.ai, "Corpse is inert");
    expect(log.count("Orc is dead! You gain 35 experience points.") == 1, "Death message");
}

void test_damage_floor_and_single_death() {
    const ContentTables content;
    EntityStore store;
    Inventory inv;
    MessageLog log;

    store.add(makePlayer(1, 1));
    const size_t troll = store.add(makeMonster(content, MonsterKind::Troll, 2, 1));
    store[troll].fighter->defense = 50;

    const int hpBefore = store[troll].fighter->hp;
    AttackOutcome out = attack(store, EntityStore::PLAYER, troll, inv, log);
    expect(out.damage == 0, "Damage floors at zero");
    expect(store[troll].fighter->hp == hpBefore, "No damage, no hp change");
    expect(log.back().text == "Player attacks troll but it has no effect!", "No-effect message");

    Entity orc = orcAt(content, 3, 3);
    auto xp = applyDamage(orc, 1000, log);
    expect(xp.has_value() && *xp == 35, "Killing blow returns the XP");
    expect(!applyDamage(orc, 1000, log).has_value(), "A corpse cannot die again");
    expect(log.count("Orc is dead! You gain 35 experience points.") == 1, "Death runs once");

    Entity player = makePlayer(0, 0);
    applyDamage(player, 500, log);
    expect(!player.alive && player.glyph == '%', "Player death marks the body");
    expect(player.fighter.has_value(), "Player keeps its fighter after death");
    expect(log.count("You died!") == 1, "Player death message");
}

void test_monster_attacks_player() {
    const ContentTables content;
    const Dungeon d = openDungeon(10, 10);
    StubFov fov;
    EntityStore store;
    Inventory inv;
    MessageLog log;
    RNG rng(3u);

    store.add(makePlayer(2, 2));
    const size_t orc = store.add(orcAt(content, 6, 2));

    AiContext ctx{d, store, inv, fov, log, rng};
    aiTakeTurn(ctx, orc);
    expect(store[orc].pos == Vec2i{5, 2}, "Monster steps toward a visible player");

    store[orc].pos = Vec2i{3, 3};
    aiTakeTurn(ctx, orc);
    expect(store.player().fighter->hp == 100 - (4 - 1), "Adjacent monster attacks");

    fov.hidden.insert({7, 7});
    store[orc].pos = Vec2i{7, 7};
    aiTakeTurn(ctx, orc);
    expect(store[orc].pos == Vec2i{7, 7}, "Unseen monster idles");
}

void test_confusion_reverts() {
    const ContentTables content;
    const Dungeon d = openDungeon(20, 20);
    StubFov fov;
    EntityStore store;
    Inventory inv;
    MessageLog log;
    RNG rng(11u);

    store.add(makePlayer(2, 2));
    const size_t orc = store.add(orcAt(content, 10, 10));

    SpellTuning tuning;
    tuning.confuseTurns = 3;
    tuning.confuseRange = 20;
    SpellContext sctx{store, inv, fov, log, tuning};
    expect(castConfuse(sctx, EntityStore::PLAYER) == UseResult::Used, "Confusion finds the orc");
    expect(store[orc].ai->kind == AiKind::Confused, "Orc is confused");
    expect(store[orc].ai->previous && store[orc].ai->previous->kind == AiKind::Basic, "Prior brain is kept");

    AiContext ctx{d, store, inv, fov, log, rng};
    aiTakeTurn(ctx, orc);
    aiTakeTurn(ctx, orc);
    expect(store[orc].ai->kind == AiKind::Confused && store[orc].ai->turnsRemaining == 1, "Two turns in");
    expect(store.player().fighter->hp == 100, "Confused monster does not attack");

    aiTakeTurn(ctx, orc);
    expect(store[orc].ai->kind == AiKind::Basic, "Basic AI is restored on the third turn");
    expect(log.count("The orc is no longer confused!") == 1, "Recovery message");

    for (int i = 0; i < Ai::MAX_LAYERS + 10; ++i) {
        expect(castConfuse(sctx, EntityStore::PLAYER) == UseResult::Used, "Repeated confusion is accepted");
    }
    expect(store[orc].ai->layers() == Ai::MAX_LAYERS, "Confusion nesting stops at the layer limit");
    expect(store[orc].ai->turnsRemaining == 3, "Confusing at the limit refreshes the duration");

}

void test_lightning_range() {
    const ContentTables content;
    StubFov fov;
    EntityStore store;
    Inventory inv;
    MessageLog log;

    store.add(makePlayer(1, 1));
    const size_t orc = store.add(orcAt(content, 7, 1));

    SpellTuning tuning;
    SpellContext ctx{store, inv, fov, log, tuning};

    expect(castLightning(ctx, EntityStore::PLAYER) == UseResult::Cancelled, "Distance 6 is out of range 5");
    expect(log.back().text == "No enemy is close enough to strike.", "Out of range message");

    store[orc].pos = Vec2i{6, 1};
    fov.hidden.insert({6, 1});
    expect(castLightning(ctx, EntityStore::PLAYER) == UseResult::Cancelled, "Unseen targets are skipped");

    fov.hidden.clear();
    store[orc].fighter->hp = 40;
    expect(castLightning(ctx, EntityStore::PLAYER) == UseResult::Used, "Distance 5 is in range");
    expect(!store[orc].alive, "Lightning kills");
    expect(store.player().fighter->xp == 35, "Lightning kill credits XP");
}

void test_fireball_self_exclusion() {
    const ContentTables content;
    StubFov fov;
    EntityStore store;
    Inventory inv;
    MessageLog log;

    store.add(makePlayer(5, 5));
    store.player().fighter->hp = 10;
    store.player().fighter->xp = 50;
    const size_t orc = store.add(orcAt(content, 6, 5));
    const size_t farOrc = store.add(orcAt(content, 15, 5));

    SpellTuning tuning;
    SpellContext ctx{store, inv, fov, log, tuning};

    expect(castFireball(ctx, EntityStore::PLAYER, std::nullopt) == UseResult::Cancelled, "No target cancels");
    expect(store[orc].alive, "Cancelled fireball hurts nobody");

    expect(castFireball(ctx, EntityStore::PLAYER, Vec2i{5, 5}) == UseResult::Used, "Fireball is cast");
    expect(!store.player().alive, "Caster inside the blast dies");
    expect(!store[orc].alive, "Orc inside the blast dies");
    expect(store[farOrc].alive && store[farOrc].fighter->hp == 20, "Orc outside the blast is untouched");
    expect(store.player().fighter->xp == 85, "Only the orc's XP is credited, never the caster's own");
    expect(log.count("The player gets burned for 25 hit points.") == 1, "Caster burn message");
}

void test_heal_at_full_health() {
    StubFov fov;
    EntityStore store;
    Inventory inv;
    MessageLog log;

    store.add(makePlayer(1, 1));
    SpellTuning tuning;
    SpellContext ctx{store, inv, fov, log, tuning};

    expect(castHeal(ctx, EntityStore::PLAYER) == UseResult::Cancelled, "Heal at full hp is refused");
    expect(log.back().text == "You are already at full health.", "Full health message");

    store.player().fighter->hp = 80;
    expect(castHeal(ctx, EntityStore::PLAYER) == UseResult::Used, "Heal when hurt");
    expect(store.player().fighter->hp == 100, "Heal is capped at max hp");
}

void test_inventory_full_pickup() {
    EntityStore store;
    Inventory inv;
    MessageLog log;

    store.add(makePlayer(2, 2));
    for (size_t i = 0; i < Inventory::CAPACITY; ++i) {
        expect(inv.add(makeLoot(LootKind::Heal, 0, 0)), "Inventory accepts up to capacity");
    }
    expect(inv.full(), "Inventory is full");

    store.add(makeLoot(LootKind::Lightning, 2, 2));
    const size_t before = store.size();

    expect(!pickUp(store, inv, log), "27th item is refused");
    expect(store.size() == before, "Map entity stays on the map");
    expect(store[1].pos == Vec2i{2, 2}, "Map entity is untouched");
    expect(inv.size() == Inventory::CAPACITY, "Inventory unchanged");
    expect(log.size() == 1, "Exactly one message");
    expect(log.count("Your inventory is full, cannot pick up scroll of lightning bolt.") == 1, "Full message");
}

void test_equipment_bonuses() {
    EntityStore store;
    Inventory inv;
    MessageLog log;

    store.add(makePlayer(2, 2));
    Entity dagger = makeDagger(0, 0);
    dagger.equipment->equipped = true;
    inv.add(std::move(dagger));
    expect(fullPower(store, EntityStore::PLAYER, inv) == 4, "Dagger adds 2 power");

    store.add(makeLoot(LootKind::Sword, 2, 2));
    expect(pickUp(store, inv, log), "Pick up the sword");
    expect(store.size() == 1, "Sword left the map");
    expect(!inv[1].equipment->equipped, "Occupied hand is not auto-equipped");

    toggleEquip(inv, 1, log);
    expect(inv[1].equipment->equipped && !inv[0].equipment->equipped, "Equipping swaps the right hand");
    expect(fullPower(store, EntityStore::PLAYER, inv) == 5, "Sword adds 3 power");

    store.add(makeLoot(LootKind::Shield, 2, 2));
    expect(pickUp(store, inv, log), "Pick up the shield");
    expect(inv[2].equipment->equipped, "Free hand is auto-equipped");
    expect(fullDefense(store, EntityStore::PLAYER, inv) == 2, "Shield adds 1 defense");
    expect(log.back().text == "Equipped shield on left hand.", "Equip message");

    expect(dropItem(store, inv, 2, log), "Drop the shield");
    expect(fullDefense(store, EntityStore::PLAYER, inv) == 1, "Dropped shield no longer counts");
    expect(store.size() == 2 && store[1].pos == Vec2i{2, 2}, "Shield lies at the player's feet");
    expect(!store[1].equipment->equipped, "Dropped equipment is unequipped");

    Entity monster = makePlayer(3, 3);
    monster.fighter->onDeath = DeathKind::Monster;
    const size_t other = store.add(std::move(monster));
    expect(fullPower(store, other, inv) == 2, "Equipment only counts for the player");
}

// A small hand-built level: open room, player at (2,2).
std::unique_ptr<Game> makeTestGame(StubFov** outFov = nullptr) {
    auto fov = std::make_unique<StubFov>();
    if (outFov) *outFov = fov.get();
    auto g = std::make_unique<Game>(std::move(fov));
    expect(g->newGame(77u), "newGame succeeds");
    return g;
}

void test_game_new_game() {
    auto g = makeTestGame();
    expect(g->state() == EngineState::AwaitingInput, "Fresh game awaits input");
    expect(g->depth() == 1, "Fresh game starts at depth 1");
    expect(g->player().alive && g->player().level == 1, "Fresh player");
    expect(g->inventory().size() == 1 && g->inventory()[0].name == "dagger", "Starting dagger");
    expect(g->inventory()[0].equipment->equipped, "Starting dagger is equipped");
    expect(g->playerPower() == 4, "Dagger counted in power");
    expect(!g->log().empty(), "Welcome message");

    const Vec2i p = g->player().pos;
    expect(g->dungeon().at(p.x, p.y).explored, "Player tile is explored");

    const std::vector<std::string> sheet = g->characterSheet();
    expect(sheet.size() >= 9 && sheet[2] == "Level: 1", "Character sheet level");
    expect(sheet[4] == "Experience to level up: 350", "Character sheet XP threshold");
}

void test_game_move_and_stairs() {
    auto g = makeTestGame();
    // Empty levels below so nothing can hit the player right after the descent.
    ContentTables quiet;
    quiet.maxMonsters.clear();
    g->setContent(quiet, DungeonGenConfig{});
    g->installLevel(openDungeon(12, 12), {makeStairs(4, 2)}, Vec2i{2, 2});

    g->handleIntent(Intent::of(IntentKind::DescendStairs));
    expect(g->depth() == 1, "No descent off the stairs");
    expect(g->log().back().text == "There are no stairs here.", "No stairs message");

    g->handleIntent(Intent::move(1, 0));
    g->handleIntent(Intent::move(1, 0));
    expect(g->player().pos == Vec2i{4, 2}, "Player walked onto the stairs");
    expect(g->playerOnStairs(), "Standing on the stairs");

    g->handleIntent(Intent::move(0, -5));
    expect(g->player().pos == Vec2i{4, 2}, "Walls block movement");

    g->playerMut().fighter->hp = 40;
    g->handleIntent(Intent::of(IntentKind::DescendStairs));
    expect(g->depth() == 2, "Descended one level");
    expect(g->player().fighter->hp == 90, "Descent heals half of max hp");
    expect(g->inventory().size() == 1, "Inventory survives descent");
    expect(g->dungeon().width == g->genConfig().width, "New level uses the generator config");
}

void test_game_targeting_cancel_and_confirm() {
    StubFov* fov = nullptr;
    auto g = makeTestGame(&fov);

    std::vector<Entity> spawned;
    spawned.push_back(orcAt(g->content(), 8, 8));
    g->installLevel(openDungeon(12, 12), std::move(spawned), Vec2i{2, 2});
    g->inventoryMut().add(makeLoot(LootKind::Fireball, 0, 0));

    g->handleIntent(Intent::useItem(1));
    expect(g->state() == EngineState::Targeting, "Fireball asks for a target");
    expect(g->targetCursor() == g->player().pos, "Cursor starts on the player");

    g->handleIntent(Intent::move(1, 1));
    expect(g->targetCursor() == Vec2i{3, 3}, "Direction keys move the cursor");

    g->handleIntent(Intent::of(IntentKind::Cancel));
    expect(g->state() == EngineState::AwaitingInput, "Cancel leaves targeting");
    expect(g->inventory().size() == 2, "Cancelled scroll is kept");
    expect(g->entities()[1].pos == Vec2i{8, 8}, "Cancel does not spend a turn");
    expect(g->entities()[1].fighter->hp == 20, "Cancel hurts nobody");
    expect(g->log().back().text == "Cancelled", "Cancel message");

    g->handleIntent(Intent::useItem(1));
    g->handleIntent(Intent::targetTile(8, 8));
    fov->hidden.insert({8, 8});
    g->handleIntent(Intent::of(IntentKind::Confirm));
    expect(g->state() == EngineState::Targeting, "Unseen tiles cannot be targeted");

    fov->hidden.clear();
    g->handleIntent(Intent::of(IntentKind::Confirm));
    expect(g->state() == EngineState::AwaitingInput, "Confirm resolves the spell");
    expect(g->inventory().size() == 1, "Scroll is consumed");
    expect(!g->entities()[1].alive, "Orc burned to death");
    expect(g->player().fighter->hp == 100, "Player outside the blast");
}

void test_game_menus() {
    auto g = makeTestGame();
    g->installLevel(openDungeon(12, 12), {}, Vec2i{2, 2});
    g->inventoryMut().add(makeLoot(LootKind::Heal, 0, 0));

    g->handleIntent(Intent::of(IntentKind::OpenInventory));
    expect(g->state() == EngineState::InventoryMenu && g->menuMode() == MenuMode::Use, "Inventory opens");
    const Menu m = g->currentMenu();
    expect(m.options.size() == 2, "One option per item");
    expect(m.options[0] == "dagger (on right hand)", "Equipped suffix");

    g->handleIntent(Intent::choose(1));
    expect(g->state() == EngineState::AwaitingInput, "Choosing closes the menu");
    expect(g->inventory().size() == 2, "Heal at full health is not consumed");
    expect(g->log().back().text == "Cancelled", "Refused heal is reported");

    g->handleIntent(Intent::of(IntentKind::OpenDropMenu));
    expect(g->menuMode() == MenuMode::Drop, "Drop menu opens");
    g->handleIntent(Intent::choose(1));
    expect(g->inventory().size() == 1, "Potion dropped");
    expect(g->entities().size() == 2, "Potion is back on the map");

    g->handleIntent(Intent::of(IntentKind::OpenInventory));
    g->handleIntent(Intent::of(IntentKind::Wait));
    expect(g->state() == EngineState::AwaitingInput, "Any other key closes the menu");

    g->handleIntent(Intent::of(IntentKind::Pickup));
    expect(g->inventory().size() == 2, "Potion picked up again");

    g->handleIntent(Intent::of(IntentKind::ShowCharacter));
    expect(g->characterSheetOpen(), "Character sheet opens");
    g->handleIntent(Intent::move(1, 0));
    expect(!g->characterSheetOpen(), "Next key closes the character sheet");
    expect(g->player().pos == Vec2i{2, 2}, "Closing key is not also a move");

    Game empty;
    expect(empty.inventoryMenu("x").options.front() == "Inventory is empty.", "Empty inventory placeholder");

    std::vector<std::string> letters(Menu::MAX_OPTIONS, "option");
    expect(makeMenu("full", letters).options.size() == 26, "26 options fit");
}

void test_game_level_up() {
    auto g = makeTestGame();
    g->installLevel(openDungeon(12, 12), {}, Vec2i{2, 2});

    g->playerMut().fighter->xp = 360;
    g->handleIntent(Intent::of(IntentKind::Wait));
    expect(g->state() == EngineState::LevelUp, "Enough XP opens the level-up menu");
    expect(g->player().level == 2, "Character level raised");
    expect(g->player().fighter->xp == 10, "Threshold is subtracted");
    expect(g->currentMenu().options.size() == 3, "Three stat choices");

    g->handleIntent(Intent::move(1, 0));
    g->handleIntent(Intent::choose(5));
    expect(g->state() == EngineState::LevelUp, "Only a stat choice closes the menu");

    g->handleIntent(Intent::choose(0));
    expect(g->state() == EngineState::AwaitingInput, "Choice closes the menu");
    expect(g->player().fighter->maxHp == 120 && g->player().fighter->hp == 120, "Constitution raises hp");
    expect(g->xpToNextLevel() == 500, "Next threshold grows with level");
}

void test_game_player_death() {
    auto g = makeTestGame();
    std::vector<Entity> spawned;
    Entity brute = orcAt(g->content(), 3, 2);
    brute.fighter->power = 500;
    spawned.push_back(std::move(brute));
    g->installLevel(openDungeon(12, 12), std::move(spawned), Vec2i{2, 2});

    g->handleIntent(Intent::of(IntentKind::Wait));
    expect(!g->player().alive, "Player was killed");
    expect(g->isGameOver(), "Death ends the game");

    g->handleIntent(Intent::move(0, 1));
    expect(g->player().pos == Vec2i{2, 2}, "No input after death");
}

void test_save_roundtrip() {
    auto g = makeTestGame();
    g->handleIntent(Intent::of(IntentKind::Wait));
    g->handleIntent(Intent::move(1, 0));

    const std::vector<uint8_t> blob = g->saveSnapshot();

    auto loaded = makeTestGame();
    std::string err;
    expect(loaded->loadSnapshot(blob, &err), "Snapshot loads: " + err);
    expect(loaded->depth() == g->depth(), "Depth restored");
    expect(loaded->player().pos == g->player().pos, "Player position restored");
    expect(loaded->player().fighter->hp == g->player().fighter->hp, "Player hp restored");
    expect(loaded->entities().size() == g->entities().size(), "Entity count restored");
    expect(loaded->inventory().size() == g->inventory().size(), "Inventory restored");
    expect(loaded->log().size() == g->log().size(), "Message log restored");
    expect(loaded->rng().state == g->rng().state, "RNG state restored");
    expect(loaded->saveSnapshot() == blob, "Snapshot of a loaded game is identical");

    const std::filesystem::path path = std::filesystem::temp_directory_path() / "tombcrawl_test_save.dat";
    expect(g->saveToFile(path.string()), "Save to file");
    auto fromFile = makeTestGame();
    expect(fromFile->loadFromFile(path.string()), "Load from file");
    expect(fromFile->player().pos == g->player().pos, "File roundtrip keeps the player");

    Entity deep = orcAt(ContentTables{}, 1, 1);
    for (int i = 1; i < Ai::MAX_LAYERS; ++i) deep.ai = Ai::confused(std::move(*deep.ai), 5);
    const Ai deepAi = *deep.ai;
    const size_t deepIdx = g->entitiesMut().add(std::move(deep));
    auto deepLoaded = makeTestGame();
    expect(deepLoaded->loadSnapshot(g->saveSnapshot(), &err), "Fully nested confusion survives a save: " + err);
    expect(deepIdx < deepLoaded->entities().size() && deepLoaded->entities()[deepIdx].ai &&
               *deepLoaded->entities()[deepIdx].ai == deepAi,
           "Nested brains round-trip");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

void test_save_corruption_keeps_state() {
    auto g = makeTestGame();
    std::vector<uint8_t> blob = g->saveSnapshot();

    auto target = makeTestGame();
    target->handleIntent(Intent::of(IntentKind::Wait));
    const std::vector<uint8_t> before = target->saveSnapshot();

    std::vector<uint8_t> flipped = blob;
    flipped[flipped.size() / 2] ^= 0x5Au;
    std::string err;
    expect(!target->loadSnapshot(flipped, &err), "Corrupted snapshot is rejected");
    expect(!err.empty(), "Corruption is explained");

    std::vector<uint8_t> truncated(blob.begin(), blob.begin() + 20);
    expect(!target->loadSnapshot(truncated, &err), "Truncated snapshot is rejected");

    std::vector<uint8_t> wrongMagic = blob;
    wrongMagic[0] ^= 0xFFu;
    expect(!target->loadSnapshot(wrongMagic, &err), "Foreign data is rejected");

    expect(target->saveSnapshot() == before, "Failed loads leave the game untouched");

    auto missing = makeTestGame();
    expect(!missing->loadFromFile("/nonexistent/tombcrawl_none.dat"), "Missing file fails");
}

void test_content_ini() {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "tombcrawl_test_content.ini";
    {
        std::ofstream f(path);
        f << "# tuning\n"
          << "map.width = 60\n"
          << "monster.orc.hp = 12\n"
          << "this line has no equals\n"
          << "monster.dragon.hp = 5\n"
          << "table.max_monsters = 4:3, 1:2\n"
          << "spell.fireball_radius = nope\n"
          << "fov.radius = 6 ; inline comment\n";
    }

    ContentTables content;
    DungeonGenConfig gen;
    std::string warnings;
    expect(loadContentIni(path.string(), content, gen, &warnings), "Content file is read");
    expect(gen.width == 60, "Map width override");
    expect(content.monster(MonsterKind::Orc).hp == 12, "Monster stat override");
    expect(content.maxMonsters.size() == 2 && content.maxMonsters[0].level == 1, "Table override sorted");
    expect(content.spells.fireballRadius == 3, "Invalid value keeps the default");
    expect(content.fovRadius == 6, "Inline comments are stripped");
    expect(warnings.find("Line 4:") != std::string::npos, "Missing '=' reported with its line");
    expect(warnings.find("dragon") != std::string::npos, "Unknown monster reported");
    expect(warnings.find("Line 7:") != std::string::npos, "Invalid value reported");

    {
        std::ofstream f(path);
        f << "item.heal.weight = 1:2147483647\n"
          << "item.confuse.weight = 1:2147483647, 3:-4\n";
    }
    ContentTables heavy;
    DungeonGenConfig heavyGen;
    std::string heavyWarnings;
    expect(loadContentIni(path.string(), heavy, heavyGen, &heavyWarnings), "Oversized weights file is read");
    expect(heavy.lootWeights[static_cast<size_t>(LootKind::Heal)][0].value == MAX_TABLE_VALUE, "Oversized weight is clamped");
    expect(heavy.lootWeights[static_cast<size_t>(LootKind::Confuse)][1].value == 0, "Negative weight is clamped");
    expect(heavyWarnings.find("Line 1:") != std::string::npos && heavyWarnings.find("Line 2:") != std::string::npos,
           "Clamped table values are reported");
    RNG lootRng(9u);
    for (int i = 0; i < 50; ++i) {
        expect(weightedIndex(lootRng, {heavy.lootWeights[static_cast<size_t>(LootKind::Heal)][0].value,
                                       heavy.lootWeights[static_cast<size_t>(LootKind::Confuse)][0].value}) >= 0,
               "Clamped weights still roll loot");
    }

    ContentTables untouched;
    DungeonGenConfig gen2;
    expect(!loadContentIni("/nonexistent/tombcrawl.ini", untouched, gen2), "Missing content file");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

void test_seed_parsing() {
    uint32_t seed = 0;
    expect(parseSeed("12345", seed) && seed == 12345u, "Decimal seed");
    expect(parseSeed("0xDEADBEEF", seed) && seed == 0xDEADBEEFu, "Hex seed");
    expect(parseSeed("4294967295", seed) && seed == 4294967295u, "Largest seed");

    seed = 7u;
    expect(!parseSeed("4294967296", seed), "Seed above 32 bits is rejected");
    expect(!parseSeed("99999999999999999999999", seed), "Overlong seed is rejected");
    expect(!parseSeed("-1", seed), "Negative seed is rejected");
    expect(!parseSeed("12abc", seed), "Trailing junk is rejected");
    expect(!parseSeed("", seed), "Empty seed is rejected");
    expect(seed == 7u, "Rejected seeds leave the output alone");
}

void test_settings_ini() {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "tombcrawl_test_settings.ini";
    expect(writeDefaultSettings(path.string()), "Write default settings");

    std::string warnings;
    Settings s = loadSettings(path.string(), &warnings);
    expect(warnings.empty(), "Default settings load cleanly: " + warnings);
    expect(s.tileSize == 16 && s.vsync, "Default values");

    expect(updateIniKey(path.string(), "tile_size", "200"), "Update a key");
    expect(updateIniKey(path.string(), "mystery", "1"), "Append a key");
    s = loadSettings(path.string(), &warnings);
    expect(s.tileSize == 64, "Tile size is clamped");
    expect(warnings.find("mystery") != std::string::npos, "Unknown setting reported");

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

} // namespace

int main() {
    std::cout << "Running TombCrawl tests...\n";

    test_rng_reproducible();
    test_room_geometry();
    test_generator_layout();
    test_generator_no_rooms();
    test_generator_deterministic();
    test_transition_tables();
    test_weighted_choice();
    test_entity_store();
    test_message_log_trim();
    test_fov_walls_block_sight();

    test_combat_scenarios();
    test_damage_floor_and_single_death();
    test_monster_attacks_player();
    test_confusion_reverts();
    test_lightning_range();
    test_fireball_self_exclusion();
    test_heal_at_full_health();

    test_inventory_full_pickup();
    test_equipment_bonuses();

    test_game_new_game();
    test_game_move_and_stairs();
    test_game_targeting_cancel_and_confirm();
    test_game_menus();
    test_game_level_up();
    test_game_player_death();

    test_save_roundtrip();
    test_save_corruption_keeps_state();

    test_content_ini();
    test_settings_ini();
    test_seed_parsing();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
