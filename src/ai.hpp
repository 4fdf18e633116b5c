#pragma once
#include "common.hpp"
#include "message_log.hpp"
#include "rng.hpp"

#include <cstddef>

class Dungeon;
class EntityStore;
class Inventory;
class VisibilityQuery;

struct AiContext {
    const Dungeon& dungeon;
    EntityStore& store;
    const Inventory& inv;
    const VisibilityQuery& fov;
    MessageLog& log;
    RNG& rng;
};

// Step by (dx,dy) unless the destination is a wall or holds a blocking entity.
void moveBy(const Dungeon& dung, EntityStore& store, size_t idx, int dx, int dy);

// One step toward `target`; the direction is normalized and rounded, so it may be diagonal.
void moveTowards(const Dungeon& dung, EntityStore& store, size_t idx, Vec2i target);

// One decision for the AI-capable entity at `idx`.
void aiTakeTurn(AiContext& ctx, size_t idx);

// Every AI-capable entity except the player acts once, in ascending store order.
void runMonsterTurns(AiContext& ctx);
