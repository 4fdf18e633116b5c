#pragma once
#include "entity.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

class Dungeon;

// Insertion-ordered, index-addressed collection of every entity on the
// current level. The player always lives in slot PLAYER.
//
// Indices are the only way to refer to an entity and they are NOT stable:
// removeSwap() moves the last entity into the freed slot. Never keep an
// index across a removal; look the entity up again (position + liveness).
class EntityStore {
public:
    static constexpr size_t PLAYER = 0;

    size_t add(Entity e);

    size_t size() const { return ents.size(); }
    bool empty() const { return ents.empty(); }

    Entity& operator[](size_t i) { return ents[i]; }
    const Entity& operator[](size_t i) const { return ents[i]; }

    Entity& player() { return ents[PLAYER]; }
    const Entity& player() const { return ents[PLAYER]; }

    const std::vector<Entity>& all() const { return ents; }

    std::vector<Entity>::iterator begin() { return ents.begin(); }
    std::vector<Entity>::iterator end() { return ents.end(); }
    std::vector<Entity>::const_iterator begin() const { return ents.begin(); }
    std::vector<Entity>::const_iterator end() const { return ents.end(); }

    // O(1) removal: the former last entity takes index `i`.
    // Invalidates any index previously held for that entity.
    Entity removeSwap(size_t i);

    // Keeps the first `n` entities (used to drop a level's contents while keeping the player).
    void truncate(size_t n);
    void clear() { ents.clear(); }

    // Two independent mutable views into distinct slots (attacker/defender).
    // Equal or out-of-range indices are a contract violation and abort.
    std::pair<Entity&, Entity&> mutTwo(size_t first, size_t second);

    bool isBlocked(const Dungeon& dung, int x, int y) const;

    // First entity (other than `exclude`) with a Fighter slot standing on (x,y).
    std::optional<size_t> fighterAt(int x, int y, std::optional<size_t> exclude = std::nullopt) const;

    // First collectible entity standing on (x,y), skipping the player.
    std::optional<size_t> collectibleAt(int x, int y) const;

private:
    std::vector<Entity> ents;
};
