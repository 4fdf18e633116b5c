#include "game.hpp"

#include <algorithm>
#include <utility>

Menu makeMenu(std::string header, std::vector<std::string> options) {
    if (options.size() > Menu::MAX_OPTIONS) contractViolation("Cannot have a menu with more than 26 options.");
    Menu m;
    m.header = std::move(header);
    m.options = std::move(options);
    return m;
}

Game::Game(std::unique_ptr<VisibilityQuery> fov) : fov_(std::move(fov)) {
    if (!fov_) fov_ = std::make_unique<ShadowcastFov>();
    store_.add(makePlayer(0, 0));
}

void Game::setContent(const ContentTables& content, const DungeonGenConfig& gen) {
    content_ = content;
    gen_ = gen;
}

std::optional<GeneratedLevel> Game::generateLevel(int depth, RNG& rng) const {
    for (int attempt = 0; attempt < GEN_RETRIES; ++attempt) {
        GeneratedLevel lvl = generateDungeon(gen_, content_, depth, rng);
        if (lvl.ok()) return lvl;
    }
    return std::nullopt;
}

bool Game::newGame(uint32_t seed) {
    RNG rng(seed);
    std::optional<GeneratedLevel> lvl = generateLevel(1, rng);
    if (!lvl) {
        log_.add("The dungeon could not be generated.", colors::Red);
        return false;
    }

    rng_ = rng;
    depth_ = 1;
    state_ = EngineState::AwaitingInput;
    menuMode_ = MenuMode::Use;
    showCharacter_ = false;
    pendingSlot_ = 0;

    store_.clear();
    store_.add(makePlayer(0, 0));

    inv_.clear();
    Entity dagger = makeDagger(0, 0);
    dagger.equipment->equipped = true;
    inv_.add(std::move(dagger));

    log_.clear();
    installLevel(std::move(lvl->dungeon), std::move(lvl->spawned), lvl->playerStart);

    log_.add("Welcome stranger! Prepare to perish in the Tombs of the Ancient Kings.", colors::Red);
    return true;
}

bool Game::nextLevel() {
    RNG rng = rng_;
    std::optional<GeneratedLevel> lvl = generateLevel(depth_ + 1, rng);
    if (!lvl) {
        log_.add("The stairs lead nowhere. You stay where you are.", colors::Red);
        return false;
    }
    rng_ = rng;

    log_.add("You take a moment to rest, and recover your strength.", colors::Violet);
    Entity& p = store_.player();
    if (p.fighter) {
        const int maxHp = playerMaxHp();
        p.fighter->hp = std::min(maxHp, p.fighter->hp + maxHp / 2);
    }

    log_.add("After a rare moment of peace, you descend deeper into the heart of the dungeon...", colors::Red);
    ++depth_;
    installLevel(std::move(lvl->dungeon), std::move(lvl->spawned), lvl->playerStart);
    return true;
}

void Game::installLevel(Dungeon dung, std::vector<Entity> spawned, Vec2i playerStart) {
    dung_ = std::move(dung);

    if (store_.empty()) store_.add(makePlayer(0, 0));
    store_.truncate(1);
    for (Entity& e : spawned) store_.add(std::move(e));
    store_.player().pos = playerStart;

    fov_->reset(dung_);
    fovDirty_ = true;
    refreshFov();
}

void Game::refreshFov() {
    const Vec2i p = store_.player().pos;
    fov_->recompute(p.x, p.y, content_.fovRadius, content_.fovLightWalls);

    for (int y = 0; y < dung_.height; ++y) {
        for (int x = 0; x < dung_.width; ++x) {
            if (fov_->isVisible(x, y)) dung_.at(x, y).explored = true;
        }
    }

    lastFovPos_ = p;
    fovDirty_ = false;
}

bool Game::playerOnStairs() const {
    if (store_.empty()) return false;
    const Vec2i p = store_.player().pos;
    for (size_t i = 1; i < store_.size(); ++i) {
        const Entity& e = store_[i];
        if (e.pos == p && e.name == STAIRS_NAME) return true;
    }
    return false;
}

Menu Game::inventoryMenu(const std::string& header) const {
    std::vector<std::string> options;
    if (inv_.empty()) {
        options.push_back("Inventory is empty.");
    } else {
        for (const Entity& e : inv_.items()) {
            std::string text = e.name;
            if (e.equipment && e.equipment->equipped) {
                text += " (on ";
                text += equipSlotName(e.equipment->slot);
                text += ")";
            }
            options.push_back(std::move(text));
        }
    }
    return makeMenu(header, std::move(options));
}

Menu Game::levelUpMenu() const {
    const Entity& p = store_.player();
    const int hp = content_.progression.levelUpHp;
    const int baseMaxHp = p.fighter ? p.fighter->maxHp : 0;
    const int basePower = p.fighter ? p.fighter->power : 0;
    const int baseDefense = p.fighter ? p.fighter->defense : 0;

    return makeMenu("Level up! Choose a stat to raise:", {
        "Constitution (+" + std::to_string(hp) + " HP, from " + std::to_string(baseMaxHp) + ")",
        "Strength (+1 attack, from " + std::to_string(basePower) + ")",
        "Agility (+1 defense, from " + std::to_string(baseDefense) + ")",
    });
}

Menu Game::currentMenu() const {
    switch (state_) {
        case EngineState::InventoryMenu:
            if (menuMode_ == MenuMode::Drop) {
                return inventoryMenu("Press the key next to an item to drop it, or any other to cancel.");
            }
            return inventoryMenu("Press the key next to an item to use it, or any other to cancel.");
        case EngineState::LevelUp:
            return levelUpMenu();
        default:
            return Menu{};
    }
}

std::vector<std::string> Game::characterSheet() const {
    const Entity& p = store_.player();
    const int xp = p.fighter ? p.fighter->xp : 0;

    std::vector<std::string> lines;
    lines.push_back("Character information");
    lines.push_back("");
    lines.push_back("Level: " + std::to_string(p.level));
    lines.push_back("Experience: " + std::to_string(xp));
    lines.push_back("Experience to level up: " + std::to_string(xpToNextLevel()));
    lines.push_back("");
    lines.push_back("Maximum HP: " + std::to_string(playerMaxHp()));
    lines.push_back("Attack: " + std::to_string(playerPower()));
    lines.push_back("Defense: " + std::to_string(playerDefense()));
    return lines;
}
