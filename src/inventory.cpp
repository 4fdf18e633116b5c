#include "inventory.hpp"

#include "entity_store.hpp"

#include <utility>

bool Inventory::add(Entity&& e) {
    if (full()) return false;
    ents.push_back(std::move(e));
    return true;
}

Entity Inventory::take(size_t i) {
    if (i >= ents.size()) contractViolation("Inventory::take index out of range");
    Entity out = std::move(ents[i]);
    ents.erase(ents.begin() + static_cast<std::ptrdiff_t>(i));
    return out;
}

StatBonus Inventory::equippedBonus() const {
    StatBonus b;
    for (const Entity& e : ents) {
        if (!e.equipment || !e.equipment->equipped) continue;
        b.power += e.equipment->powerBonus;
        b.defense += e.equipment->defenseBonus;
        b.maxHp += e.equipment->maxHpBonus;
    }
    return b;
}

std::optional<size_t> Inventory::equippedIn(EquipSlot slot) const {
    for (size_t i = 0; i < ents.size(); ++i) {
        const auto& eq = ents[i].equipment;
        if (eq && eq->equipped && eq->slot == slot) return i;
    }
    return std::nullopt;
}

int fullPower(const EntityStore& store, size_t idx, const Inventory& inv) {
    const Entity& e = store[idx];
    if (!e.fighter) return 0;
    const int bonus = (idx == EntityStore::PLAYER) ? inv.equippedBonus().power : 0;
    return e.fighter->power + bonus;
}

int fullDefense(const EntityStore& store, size_t idx, const Inventory& inv) {
    const Entity& e = store[idx];
    if (!e.fighter) return 0;
    const int bonus = (idx == EntityStore::PLAYER) ? inv.equippedBonus().defense : 0;
    return e.fighter->defense + bonus;
}

int fullMaxHp(const EntityStore& store, size_t idx, const Inventory& inv) {
    const Entity& e = store[idx];
    if (!e.fighter) return 0;
    const int bonus = (idx == EntityStore::PLAYER) ? inv.equippedBonus().maxHp : 0;
    return e.fighter->maxHp + bonus;
}

void equip(Inventory& inv, size_t slot, MessageLog& log) {
    if (slot >= inv.size()) return;
    Entity& e = inv[slot];
    if (!e.equipment || e.equipment->equipped) return;

    if (auto old = inv.equippedIn(e.equipment->slot)) {
        dequip(inv, *old, log);
    }

    e.equipment->equipped = true;
    log.add("Equipped " + e.name + " on " + equipSlotName(e.equipment->slot) + ".", colors::LightGreen);
}

void dequip(Inventory& inv, size_t slot, MessageLog& log) {
    if (slot >= inv.size()) return;
    Entity& e = inv[slot];
    if (!e.equipment || !e.equipment->equipped) return;

    e.equipment->equipped = false;
    log.add("Dequipped " + e.name + " from " + equipSlotName(e.equipment->slot) + ".", colors::LightYellow);
}

void toggleEquip(Inventory& inv, size_t slot, MessageLog& log) {
    if (slot >= inv.size() || !inv[slot].equipment) return;
    if (inv[slot].equipment->equipped) {
        dequip(inv, slot, log);
    } else {
        equip(inv, slot, log);
    }
}

bool pickUp(EntityStore& store, Inventory& inv, MessageLog& log) {
    const Vec2i p = store.player().pos;
    const std::optional<size_t> idx = store.collectibleAt(p.x, p.y);
    if (!idx) return false;

    if (inv.full()) {
        log.add("Your inventory is full, cannot pick up " + store[*idx].name + ".", colors::Red);
        return false;
    }

    // removeSwap moves the last map entity into *idx; nothing below keeps an index.
    Entity e = store.removeSwap(*idx);
    log.add("You picked up a " + e.name + "!", colors::Green);

    const bool autoEquip = e.equipment && !inv.equippedIn(e.equipment->slot);
    inv.add(std::move(e));
    if (autoEquip) equip(inv, inv.size() - 1, log);
    return true;
}

bool dropItem(EntityStore& store, Inventory& inv, size_t slot, MessageLog& log) {
    if (slot >= inv.size()) return false;

    dequip(inv, slot, log);

    Entity e = inv.take(slot);
    e.pos = store.player().pos;
    log.add("You dropped a " + e.name + ".", colors::Yellow);
    store.add(std::move(e));
    return true;
}
