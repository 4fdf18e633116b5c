#pragma once
#include "entity.hpp"
#include "message_log.hpp"

#include <cstddef>
#include <optional>
#include <string>

class EntityStore;
class Inventory;

struct AttackOutcome {
    int damage = 0;
    bool killed = false;
    // XP yielded by the kill (0 if none). Only credited when the attacker is the player.
    int xp = 0;
};

// Unattributed damage. Reduces hp on a living fighter and runs its death
// behavior the moment hp drops to 0 or below. Returns the victim's XP reward
// if (and only if) this call killed it. Dead or fighter-less targets are ignored.
std::optional<int> applyDamage(Entity& target, int damage, MessageLog& log);

// Dispatch on Fighter::onDeath. Marks the entity dead; monsters become
// non-blocking "remains of X" with their fighter and AI stripped.
void runDeath(Entity& e, MessageLog& log);

// Melee: damage = full power - full defense, floored at zero.
// attacker and defender must be distinct valid indices (aborts otherwise).
AttackOutcome attack(EntityStore& store, size_t attacker, size_t defender, const Inventory& inv, MessageLog& log);

// Adds kill XP to the player's running total.
void creditXp(Entity& player, int xp);

// "orc" -> "Orc"
std::string capitalized(std::string s);
