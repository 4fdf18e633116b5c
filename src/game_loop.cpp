#include "game.hpp"

#include "ai.hpp"
#include "combat.hpp"

#include <algorithm>

void Game::handleIntent(const Intent& in) {
    if (in.kind == IntentKind::None) return;

    // The character sheet swallows whatever comes next.
    if (showCharacter_) {
        showCharacter_ = false;
        return;
    }

    switch (state_) {
        case EngineState::AwaitingInput: handleAwaitingInput(in); break;
        case EngineState::InventoryMenu: handleMenu(in); break;
        case EngineState::Targeting:     handleTargeting(in); break;
        case EngineState::LevelUp:       handleLevelUp(in); break;
        case EngineState::RunningMonsterTurns:
        case EngineState::GameOver:
        default:
            break;
    }
}

void Game::handleAwaitingInput(const Intent& in) {
    switch (in.kind) {
        case IntentKind::Move:
            playerMoveOrAttack(in.x, in.y);
            endPlayerTurn();
            break;
        case IntentKind::Wait:
            endPlayerTurn();
            break;
        case IntentKind::Pickup:
            pickUp(store_, inv_, log_);
            endPlayerTurn();
            break;
        case IntentKind::OpenInventory:
            state_ = EngineState::InventoryMenu;
            menuMode_ = MenuMode::Use;
            break;
        case IntentKind::OpenDropMenu:
            state_ = EngineState::InventoryMenu;
            menuMode_ = MenuMode::Drop;
            break;
        case IntentKind::UseItem:
            if (in.index >= 0 && useItem(static_cast<size_t>(in.index))) endPlayerTurn();
            break;
        case IntentKind::DropItem:
            if (in.index >= 0) dropItem(store_, inv_, static_cast<size_t>(in.index), log_);
            break;
        case IntentKind::DescendStairs:
            if (!playerOnStairs()) {
                log_.add("There are no stairs here.", colors::White);
                break;
            }
            if (nextLevel()) endPlayerTurn();
            break;
        case IntentKind::ShowCharacter:
            showCharacter_ = true;
            break;
        default:
            break;
    }
}

void Game::handleMenu(const Intent& in) {
    // Any key that is not a listed option closes the menu.
    state_ = EngineState::AwaitingInput;
    if (in.kind != IntentKind::ChooseOption) return;
    if (in.index < 0 || static_cast<size_t>(in.index) >= inv_.size()) return;

    const size_t slot = static_cast<size_t>(in.index);
    if (menuMode_ == MenuMode::Drop) {
        dropItem(store_, inv_, slot, log_);
        return;
    }
    if (useItem(slot)) endPlayerTurn();
}

void Game::handleTargeting(const Intent& in) {
    switch (in.kind) {
        case IntentKind::Move:
            cursor_.x = clampi(cursor_.x + in.x, 0, std::max(0, dung_.width - 1));
            cursor_.y = clampi(cursor_.y + in.y, 0, std::max(0, dung_.height - 1));
            break;
        case IntentKind::TargetTile:
            cursor_.x = clampi(in.x, 0, std::max(0, dung_.width - 1));
            cursor_.y = clampi(in.y, 0, std::max(0, dung_.height - 1));
            break;
        case IntentKind::Confirm:
            if (!fov_->isVisible(cursor_.x, cursor_.y)) break;
            if (finishTargeting(cursor_)) endPlayerTurn();
            break;
        case IntentKind::Cancel:
            finishTargeting(std::nullopt);
            break;
        default:
            break;
    }
}

void Game::handleLevelUp(const Intent& in) {
    if (in.kind != IntentKind::ChooseOption) return;
    Entity& p = store_.player();
    if (!p.fighter) return;

    switch (in.index) {
        case 0:
            p.fighter->maxHp += content_.progression.levelUpHp;
            p.fighter->hp += content_.progression.levelUpHp;
            break;
        case 1:
            p.fighter->power += 1;
            break;
        case 2:
            p.fighter->defense += 1;
            break;
        default:
            return;
    }

    state_ = EngineState::AwaitingInput;
    checkLevelUp();
}

void Game::playerMoveOrAttack(int dx, int dy) {
    const Vec2i p = store_.player().pos;
    const int tx = p.x + dx;
    const int ty = p.y + dy;

    if (auto target = store_.fighterAt(tx, ty, EntityStore::PLAYER)) {
        attack(store_, EntityStore::PLAYER, *target, inv_, log_);
    } else {
        moveBy(dung_, store_, EntityStore::PLAYER, dx, dy);
    }
}

void Game::endPlayerTurn() {
    if (fovDirty_ || store_.player().pos != lastFovPos_) refreshFov();

    if (!store_.player().alive) {
        state_ = EngineState::GameOver;
        return;
    }

    state_ = EngineState::RunningMonsterTurns;
    AiContext ctx{dung_, store_, inv_, *fov_, log_, rng_};
    runMonsterTurns(ctx);

    if (!store_.player().alive) {
        state_ = EngineState::GameOver;
        return;
    }

    state_ = EngineState::AwaitingInput;
    checkLevelUp();
}

void Game::checkLevelUp() {
    Entity& p = store_.player();
    if (!p.fighter) return;

    const int needed = xpToNextLevel();
    if (p.fighter->xp < needed) return;

    p.level += 1;
    p.fighter->xp -= needed;
    log_.add("Your battle skills grow stronger! You reached level " + std::to_string(p.level) + "!", colors::Yellow);
    state_ = EngineState::LevelUp;
}
