#include "spells.hpp"

#include "combat.hpp"
#include "entity_store.hpp"
#include "fov.hpp"
#include "inventory.hpp"

#include <algorithm>
#include <utility>

std::optional<size_t> closestHostile(const EntityStore& store, size_t caster, int range, const VisibilityQuery& fov) {
    std::optional<size_t> best;
    float bestDist = static_cast<float>(range) + 1.0f;

    const Entity& c = store[caster];
    for (size_t i = 0; i < store.size(); ++i) {
        if (i == caster) continue;
        const Entity& e = store[i];
        if (!e.fighter || !e.ai) continue;
        if (!fov.isVisible(e.pos.x, e.pos.y)) continue;

        const float d = c.distanceTo(e);
        if (d < bestDist) {
            best = i;
            bestDist = d;
        }
    }
    return best;
}

UseResult castHeal(SpellContext& ctx, size_t caster) {
    Entity& e = ctx.store[caster];
    if (!e.fighter) return UseResult::Cancelled;

    const int maxHp = fullMaxHp(ctx.store, caster, ctx.inv);
    if (e.fighter->hp >= maxHp) {
        ctx.log.add("You are already at full health.", colors::Red);
        return UseResult::Cancelled;
    }

    ctx.log.add("Your wounds start to feel better!", colors::LightViolet);
    e.fighter->hp = std::min(maxHp, e.fighter->hp + ctx.tuning.healAmount);
    return UseResult::Used;
}

UseResult castLightning(SpellContext& ctx, size_t caster) {
    const std::optional<size_t> target = closestHostile(ctx.store, caster, ctx.tuning.lightningRange, ctx.fov);
    if (!target) {
        ctx.log.add("No enemy is close enough to strike.", colors::Red);
        return UseResult::Cancelled;
    }

    const int dmg = ctx.tuning.lightningDamage;
    auto pair = ctx.store.mutTwo(caster, *target);
    ctx.log.add("A lightning bolt strikes the " + pair.second.name + " with a loud thunder! The damage is " +
                    std::to_string(dmg) + " hit points.",
                colors::LightBlue);

    if (auto xp = applyDamage(pair.second, dmg, ctx.log)) {
        if (caster == EntityStore::PLAYER) creditXp(pair.first, *xp);
    }
    return UseResult::Used;
}

UseResult castConfuse(SpellContext& ctx, size_t caster) {
    const std::optional<size_t> target = closestHostile(ctx.store, caster, ctx.tuning.confuseRange, ctx.fov);
    if (!target) {
        ctx.log.add("No enemy is close enough to strike.", colors::Red);
        return UseResult::Cancelled;
    }

    Entity& e = ctx.store[*target];
    if (e.ai->kind == AiKind::Confused && e.ai->layers() >= Ai::MAX_LAYERS) {
        e.ai->turnsRemaining = ctx.tuning.confuseTurns;
    } else {
        Ai prior = std::move(*e.ai);
        e.ai = Ai::confused(std::move(prior), ctx.tuning.confuseTurns);
    }
    ctx.log.add("The eyes of the " + e.name + " look vacant, as he starts to stumble around!", colors::LightGreen);
    return UseResult::Used;
}

UseResult castFireball(SpellContext& ctx, size_t caster, std::optional<Vec2i> target) {
    if (!target) return UseResult::Cancelled;

    const int radius = ctx.tuning.fireballRadius;
    const int dmg = ctx.tuning.fireballDamage;
    ctx.log.add("The fireball explodes, burning everything within " + std::to_string(radius) + " tiles!", colors::Orange);

    // XP is summed here and credited once after the sweep so the caster is
    // never mutated while it may itself be one of the victims.
    int xpToCaster = 0;
    for (size_t i = 0; i < ctx.store.size(); ++i) {
        Entity& e = ctx.store[i];
        if (!e.fighter || !e.alive) continue;
        if (e.distanceTo(target->x, target->y) > static_cast<float>(radius)) continue;

        ctx.log.add("The " + e.name + " gets burned for " + std::to_string(dmg) + " hit points.", colors::Orange);
        if (auto xp = applyDamage(e, dmg, ctx.log)) {
            if (i != caster) xpToCaster += *xp;
        }
    }

    if (caster == EntityStore::PLAYER) creditXp(ctx.store[caster], xpToCaster);
    return UseResult::Used;
}
