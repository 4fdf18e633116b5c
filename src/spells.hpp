#pragma once
#include "common.hpp"
#include "content.hpp"
#include "message_log.hpp"

#include <cstddef>
#include <optional>

class EntityStore;
class Inventory;
class VisibilityQuery;

enum class UseResult : uint8_t {
    Used = 0,
    Cancelled,
};

// Everything an item effect may read or touch.
struct SpellContext {
    EntityStore& store;
    const Inventory& inv;
    const VisibilityQuery& fov;
    MessageLog& log;
    const SpellTuning& tuning;
};

// Closest visible entity with both a Fighter and an AI (i.e. a hostile) whose
// distance to the caster is below range + 1.
std::optional<size_t> closestHostile(const EntityStore& store, size_t caster, int range, const VisibilityQuery& fov);

UseResult castHeal(SpellContext& ctx, size_t caster);
UseResult castLightning(SpellContext& ctx, size_t caster);
UseResult castConfuse(SpellContext& ctx, size_t caster);

// `target` is the tile picked during targeting; nullopt means the player backed out.
// Damages every fighter within the radius, the caster included, but never
// credits the caster for its own death.
UseResult castFireball(SpellContext& ctx, size_t caster, std::optional<Vec2i> target);
