#include "entity.hpp"

#include "dungeon.hpp"

#include <algorithm>
#include <utility>

Ai::Ai(const Ai& o)
    : kind(o.kind),
      turnsRemaining(o.turnsRemaining),
      previous(o.previous ? std::make_unique<Ai>(*o.previous) : nullptr) {}

Ai& Ai::operator=(const Ai& o) {
    if (this == &o) return *this;
    kind = o.kind;
    turnsRemaining = o.turnsRemaining;
    previous = o.previous ? std::make_unique<Ai>(*o.previous) : nullptr;
    return *this;
}

Ai Ai::basic() {
    return Ai{};
}

Ai Ai::confused(Ai prior, int turns) {
    Ai a;
    a.kind = AiKind::Confused;
    a.turnsRemaining = turns;
    a.previous = std::make_unique<Ai>(std::move(prior));
    return a;
}

int Ai::layers() const {
    int n = 1;
    for (const Ai* a = previous.get(); a; a = a->previous.get()) ++n;
    return n;
}

bool operator==(const Ai& a, const Ai& b) {
    if (a.kind != b.kind || a.turnsRemaining != b.turnsRemaining) return false;
    if (static_cast<bool>(a.previous) != static_cast<bool>(b.previous)) return false;
    if (!a.previous) return true;
    return *a.previous == *b.previous;
}

Entity::Entity(int x, int y, char glyph_, std::string name_, Color color_, bool blocks_)
    : pos{x, y}, glyph(glyph_), color(color_), name(std::move(name_)), blocks(blocks_) {}

bool isBlocked(const Dungeon& dung, const std::vector<Entity>& ents, int x, int y) {
    if (dung.isWall(x, y)) return true;
    return std::any_of(ents.begin(), ents.end(), [&](const Entity& e) {
        return e.blocks && e.pos.x == x && e.pos.y == y;
    });
}
