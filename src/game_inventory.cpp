#include "game.hpp"

#include "inventory.hpp"

SpellContext Game::spellContext() {
    return SpellContext{store_, inv_, *fov_, log_, content_.spells};
}

bool Game::useItem(size_t slot) {
    if (slot >= inv_.size()) return false;
    Entity& e = inv_[slot];

    if (e.equipment) {
        toggleEquip(inv_, slot, log_);
        return true;
    }

    if (!e.item) {
        log_.add("The " + e.name + " cannot be used.", colors::White);
        return false;
    }

    SpellContext ctx = spellContext();
    UseResult result = UseResult::Cancelled;
    switch (*e.item) {
        case ItemKind::Heal:      result = castHeal(ctx, EntityStore::PLAYER); break;
        case ItemKind::Lightning: result = castLightning(ctx, EntityStore::PLAYER); break;
        case ItemKind::Confuse:   result = castConfuse(ctx, EntityStore::PLAYER); break;
        case ItemKind::Fireball:
            // Suspends the turn until a tile is confirmed or targeting is cancelled.
            pendingSlot_ = slot;
            cursor_ = store_.player().pos;
            state_ = EngineState::Targeting;
            log_.add("Left-click a target tile for the fireball, or right-click to cancel.", colors::LightCyan);
            return false;
        default:
            break;
    }

    if (result == UseResult::Used) {
        inv_.take(slot);
        return true;
    }
    log_.add("Cancelled", colors::White);
    return false;
}

bool Game::finishTargeting(std::optional<Vec2i> target) {
    state_ = EngineState::AwaitingInput;

    SpellContext ctx = spellContext();
    if (castFireball(ctx, EntityStore::PLAYER, target) == UseResult::Used) {
        if (pendingSlot_ < inv_.size()) inv_.take(pendingSlot_);
        return true;
    }
    log_.add("Cancelled", colors::White);
    return false;
}
