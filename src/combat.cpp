#include "combat.hpp"

#include "entity_store.hpp"
#include "inventory.hpp"

#include <algorithm>

namespace {

void playerDeath(Entity& player, MessageLog& log) {
    log.add("You died!", colors::Red);
    player.glyph = '%';
    player.color = colors::DarkRed;
}

void monsterDeath(Entity& monster, MessageLog& log) {
    const int xp = monster.fighter ? monster.fighter->xp : 0;
    log.add(capitalized(monster.name) + " is dead! You gain " + std::to_string(xp) + " experience points.", colors::Orange);
    monster.glyph = '%';
    monster.color = colors::DarkRed;
    monster.blocks = false;
    monster.fighter.reset();
    monster.ai.reset();
    monster.name = "remains of " + monster.name;
}

} // namespace

std::string capitalized(std::string s) {
    if (!s.empty() && s[0] >= 'a' && s[0] <= 'z') s[0] = static_cast<char>(s[0] - 'a' + 'A');
    return s;
}

void runDeath(Entity& e, MessageLog& log) {
    if (!e.fighter) return;
    e.alive = false;
    switch (e.fighter->onDeath) {
        case DeathKind::Player:  playerDeath(e, log); break;
        case DeathKind::Monster: monsterDeath(e, log); break;
        default: break;
    }
}

std::optional<int> applyDamage(Entity& target, int damage, MessageLog& log) {
    if (!target.alive || !target.fighter) return std::nullopt;

    if (damage > 0) target.fighter->hp -= damage;
    if (target.fighter->hp > 0) return std::nullopt;

    // Read the reward before death strips the fighter.
    const int xp = target.fighter->xp;
    runDeath(target, log);
    return xp;
}

void creditXp(Entity& player, int xp) {
    if (!player.fighter || xp <= 0) return;
    player.fighter->xp += xp;
}

AttackOutcome attack(EntityStore& store, size_t attacker, size_t defender, const Inventory& inv, MessageLog& log) {
    const int power = fullPower(store, attacker, inv);
    const int defense = fullDefense(store, defender, inv);

    auto pair = store.mutTwo(attacker, defender);
    Entity& a = pair.first;
    Entity& d = pair.second;

    AttackOutcome out;
    out.damage = std::max(0, power - defense);

    if (out.damage > 0) {
        log.add(capitalized(a.name) + " attacks " + d.name + " for " + std::to_string(out.damage) + " hit points.");
        if (auto xp = applyDamage(d, out.damage, log)) {
            out.killed = true;
            out.xp = *xp;
            if (attacker == EntityStore::PLAYER) creditXp(a, *xp);
        }
    } else {
        log.add(capitalized(a.name) + " attacks " + d.name + " but it has no effect!");
    }
    return out;
}
