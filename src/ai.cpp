#include "ai.hpp"

#include "combat.hpp"
#include "dungeon.hpp"
#include "entity_store.hpp"
#include "fov.hpp"
#include "inventory.hpp"

#include <cmath>
#include <utility>

void moveBy(const Dungeon& dung, EntityStore& store, size_t idx, int dx, int dy) {
    Entity& e = store[idx];
    const int nx = e.pos.x + dx;
    const int ny = e.pos.y + dy;
    if (store.isBlocked(dung, nx, ny)) return;
    e.pos = Vec2i{nx, ny};
}

void moveTowards(const Dungeon& dung, EntityStore& store, size_t idx, Vec2i target) {
    const Vec2i from = store[idx].pos;
    const int dx = target.x - from.x;
    const int dy = target.y - from.y;
    const float dist = std::sqrt(static_cast<float>(dx * dx + dy * dy));
    if (dist <= 0.0f) return;

    const int sx = static_cast<int>(std::lround(static_cast<float>(dx) / dist));
    const int sy = static_cast<int>(std::lround(static_cast<float>(dy) / dist));
    moveBy(dung, store, idx, sx, sy);
}

namespace {

void basicTurn(AiContext& ctx, size_t idx) {
    const Entity& self = ctx.store[idx];
    // A monster you can see can see you.
    if (!ctx.fov.isVisible(self.pos.x, self.pos.y)) return;

    const Entity& player = ctx.store.player();
    if (self.distanceTo(player) >= 2.0f) {
        moveTowards(ctx.dungeon, ctx.store, idx, player.pos);
    } else if (player.alive && player.fighter && player.fighter->hp > 0) {
        attack(ctx.store, idx, EntityStore::PLAYER, ctx.inv, ctx.log);
    }
}

void confusedTurn(AiContext& ctx, size_t idx) {
    const int dx = ctx.rng.range(-1, 1);
    const int dy = ctx.rng.range(-1, 1);
    moveBy(ctx.dungeon, ctx.store, idx, dx, dy);

    Entity& self = ctx.store[idx];
    Ai& ai = *self.ai;
    --ai.turnsRemaining;
    if (ai.turnsRemaining > 0) return;

    Ai restored = ai.previous ? std::move(*ai.previous) : Ai::basic();
    self.ai = std::move(restored);
    ctx.log.add("The " + self.name + " is no longer confused!", colors::Red);
}

} // namespace

void aiTakeTurn(AiContext& ctx, size_t idx) {
    const Entity& self = ctx.store[idx];
    if (!self.ai || !self.alive) return;

    switch (self.ai->kind) {
        case AiKind::Basic:    basicTurn(ctx, idx); break;
        case AiKind::Confused: confusedTurn(ctx, idx); break;
        default: break;
    }
}

void runMonsterTurns(AiContext& ctx) {
    // Nothing is created or removed while monsters act, so indices stay valid for the sweep.
    for (size_t i = 0; i < ctx.store.size(); ++i) {
        if (i == EntityStore::PLAYER) continue;
        if (!ctx.store[i].ai) continue;
        aiTakeTurn(ctx, i);
    }
}
