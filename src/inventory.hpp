#pragma once
#include "entity.hpp"
#include "message_log.hpp"

#include <cstddef>
#include <optional>
#include <vector>

class EntityStore;

// Sum of the bonuses granted by everything currently equipped.
struct StatBonus {
    int power = 0;
    int defense = 0;
    int maxHp = 0;
};

// Entities the player carries. They left the map store by value and are
// addressed by slot (0..CAPACITY-1, shown as letters a..z).
class Inventory {
public:
    static constexpr size_t CAPACITY = 26;

    size_t size() const { return ents.size(); }
    bool empty() const { return ents.empty(); }
    bool full() const { return ents.size() >= CAPACITY; }

    Entity& operator[](size_t i) { return ents[i]; }
    const Entity& operator[](size_t i) const { return ents[i]; }

    const std::vector<Entity>& items() const { return ents; }

    // Returns false (and leaves `e` untouched) when full.
    bool add(Entity&& e);

    // Removes slot `i`, shifting later slots down.
    Entity take(size_t i);

    void clear() { ents.clear(); }

    StatBonus equippedBonus() const;

    // Slot of the equipped entity occupying `slot`, if any.
    std::optional<size_t> equippedIn(EquipSlot slot) const;

private:
    std::vector<Entity> ents;
};

// Base stats plus equipment. Only the player (EntityStore::PLAYER) owns the
// inventory, every other entity reports its base values.
int fullPower(const EntityStore& store, size_t idx, const Inventory& inv);
int fullDefense(const EntityStore& store, size_t idx, const Inventory& inv);
int fullMaxHp(const EntityStore& store, size_t idx, const Inventory& inv);

// Equipment handling on inventory slots. Non-equipment slots are ignored.
// equip() first dequips whatever already occupies the same body slot.
void equip(Inventory& inv, size_t slot, MessageLog& log);
void dequip(Inventory& inv, size_t slot, MessageLog& log);
void toggleEquip(Inventory& inv, size_t slot, MessageLog& log);

// Moves the first collectible on the player's tile into the inventory.
// Returns false if there was nothing to pick up or the inventory is full
// (the map entity then stays where it is).
bool pickUp(EntityStore& store, Inventory& inv, MessageLog& log);

// Puts inventory slot `slot` back on the map under the player.
bool dropItem(EntityStore& store, Inventory& inv, size_t slot, MessageLog& log);
