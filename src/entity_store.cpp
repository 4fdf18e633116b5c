#include "entity_store.hpp"

#include "dungeon.hpp"

#include <algorithm>
#include <utility>

size_t EntityStore::add(Entity e) {
    ents.push_back(std::move(e));
    return ents.size() - 1;
}

Entity EntityStore::removeSwap(size_t i) {
    if (i >= ents.size()) contractViolation("EntityStore::removeSwap index out of range");
    Entity out = std::move(ents[i]);
    if (i + 1 != ents.size()) {
        ents[i] = std::move(ents.back());
    }
    ents.pop_back();
    return out;
}

void EntityStore::truncate(size_t n) {
    if (n < ents.size()) ents.erase(ents.begin() + static_cast<std::ptrdiff_t>(n), ents.end());
}

std::pair<Entity&, Entity&> EntityStore::mutTwo(size_t first, size_t second) {
    if (first == second) contractViolation("EntityStore::mutTwo called with the same index twice");
    if (first >= ents.size() || second >= ents.size()) contractViolation("EntityStore::mutTwo index out of range");

    // Split at the larger index: [begin, split) and [split, end) cannot overlap,
    // and each side is indexed exactly once.
    const size_t split = std::max(first, second);
    const auto low = ents.begin();
    const auto high = ents.begin() + static_cast<std::ptrdiff_t>(split);

    if (first < second) {
        return {low[static_cast<std::ptrdiff_t>(first)], high[0]};
    }
    return {high[0], low[static_cast<std::ptrdiff_t>(second)]};
}

bool EntityStore::isBlocked(const Dungeon& dung, int x, int y) const {
    return ::isBlocked(dung, ents, x, y);
}

std::optional<size_t> EntityStore::fighterAt(int x, int y, std::optional<size_t> exclude) const {
    for (size_t i = 0; i < ents.size(); ++i) {
        if (exclude && *exclude == i) continue;
        const Entity& e = ents[i];
        if (e.fighter && e.pos.x == x && e.pos.y == y) return i;
    }
    return std::nullopt;
}

std::optional<size_t> EntityStore::collectibleAt(int x, int y) const {
    for (size_t i = 0; i < ents.size(); ++i) {
        if (i == PLAYER) continue;
        const Entity& e = ents[i];
        if (e.isCollectible() && e.pos.x == x && e.pos.y == y) return i;
    }
    return std::nullopt;
}
