#pragma once
#include "common.hpp"
#include "content.hpp"
#include "dungeon.hpp"
#include "entity_store.hpp"
#include "fov.hpp"
#include "inventory.hpp"
#include "message_log.hpp"
#include "rng.hpp"
#include "spells.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// What the player asked for this poll. The presentation layer maps raw
// keys/mouse to these; the core never sees raw input.
enum class IntentKind : uint8_t {
    None = 0,
    Move,           // dx, dy (also moves the targeting cursor)
    Wait,
    Pickup,
    OpenInventory,
    OpenDropMenu,
    UseItem,        // index = inventory slot
    DropItem,       // index = inventory slot
    DescendStairs,
    ShowCharacter,
    TargetTile,     // x, y
    Confirm,
    Cancel,
    ChooseOption,   // index = menu option
};

struct Intent {
    IntentKind kind = IntentKind::None;
    int x = 0;
    int y = 0;
    int index = 0;

    static Intent of(IntentKind k) { Intent i; i.kind = k; return i; }
    static Intent move(int dx, int dy) { Intent i; i.kind = IntentKind::Move; i.x = dx; i.y = dy; return i; }
    static Intent useItem(int slot) { Intent i; i.kind = IntentKind::UseItem; i.index = slot; return i; }
    static Intent dropItem(int slot) { Intent i; i.kind = IntentKind::DropItem; i.index = slot; return i; }
    static Intent targetTile(int x, int y) { Intent i; i.kind = IntentKind::TargetTile; i.x = x; i.y = y; return i; }
    static Intent choose(int option) { Intent i; i.kind = IntentKind::ChooseOption; i.index = option; return i; }
};

// Stored in save files; append-only.
enum class EngineState : uint8_t {
    AwaitingInput = 0,
    InventoryMenu,
    Targeting,
    LevelUp,
    // Transient: only observable while monsters are acting.
    RunningMonsterTurns,
    GameOver,
};

enum class MenuMode : uint8_t {
    Use = 0,
    Drop,
};

// Letter-keyed option list (a..z). The presentation layer draws it, the core builds it.
struct Menu {
    static constexpr size_t MAX_OPTIONS = 26;

    std::string header;
    std::vector<std::string> options;
};

// Aborts if there are more options than letters.
Menu makeMenu(std::string header, std::vector<std::string> options);

class Game {
public:
    static constexpr int GEN_RETRIES = 10;

    // `fov` defaults to ShadowcastFov. Tests pass a scripted stub.
    explicit Game(std::unique_ptr<VisibilityQuery> fov = nullptr);

    // Tuning for every level generated from now on.
    void setContent(const ContentTables& content, const DungeonGenConfig& gen);
    const ContentTables& content() const { return content_; }
    const DungeonGenConfig& genConfig() const { return gen_; }

    // Starts a fresh run at depth 1. Returns false (and keeps the current
    // state) if the generator could not place a single room.
    bool newGame(uint32_t seed);

    // Feed one intent to the turn engine.
    void handleIntent(const Intent& in);

    // Regenerates the dungeon one level deeper. Heals half of max hp on success.
    bool nextLevel();

    EngineState state() const { return state_; }
    bool isGameOver() const { return state_ == EngineState::GameOver; }
    MenuMode menuMode() const { return menuMode_; }
    bool characterSheetOpen() const { return showCharacter_; }

    int depth() const { return depth_; }

    const Dungeon& dungeon() const { return dung_; }
    Dungeon& dungeonMut() { return dung_; }
    const EntityStore& entities() const { return store_; }
    EntityStore& entitiesMut() { return store_; }
    const Entity& player() const { return store_.player(); }
    Entity& playerMut() { return store_.player(); }
    const Inventory& inventory() const { return inv_; }
    Inventory& inventoryMut() { return inv_; }
    const MessageLog& log() const { return log_; }
    MessageLog& logMut() { return log_; }
    const VisibilityQuery& fov() const { return *fov_; }
    RNG& rng() { return rng_; }

    Vec2i targetCursor() const { return cursor_; }

    int playerPower() const { return fullPower(store_, EntityStore::PLAYER, inv_); }
    int playerDefense() const { return fullDefense(store_, EntityStore::PLAYER, inv_); }
    int playerMaxHp() const { return fullMaxHp(store_, EntityStore::PLAYER, inv_); }
    int xpToNextLevel() const { return content_.progression.xpToNext(store_.player().level); }

    bool playerOnStairs() const;

    // Inventory (use or drop) or level-up menu, depending on state().
    Menu currentMenu() const;
    Menu inventoryMenu(const std::string& header) const;
    Menu levelUpMenu() const;
    std::vector<std::string> characterSheet() const;

    // Recompute visibility around the player and mark what is seen as explored.
    void refreshFov();

    // Swap in an already built level (map + non-player entities) and put the
    // player at `playerStart`. Used by level generation and by tests.
    void installLevel(Dungeon dung, std::vector<Entity> spawned, Vec2i playerStart);

    // Persistence (game_save.cpp).
    std::vector<uint8_t> saveSnapshot() const;
    // Parses into a scratch game first; on failure nothing changes and
    // `err` (if given) says why.
    bool loadSnapshot(const std::vector<uint8_t>& blob, std::string* err = nullptr);
    bool saveToFile(const std::string& path);
    bool loadFromFile(const std::string& path);

private:
    ContentTables content_;
    DungeonGenConfig gen_;

    RNG rng_;
    Dungeon dung_;
    EntityStore store_;
    Inventory inv_;
    MessageLog log_;
    std::unique_ptr<VisibilityQuery> fov_;

    int depth_ = 1;
    EngineState state_ = EngineState::AwaitingInput;
    MenuMode menuMode_ = MenuMode::Use;
    bool showCharacter_ = false;

    // Targeting (fireball): the inventory slot that will be consumed and the cursor.
    size_t pendingSlot_ = 0;
    Vec2i cursor_{0, 0};

    // Player position at the last FOV recompute.
    Vec2i lastFovPos_{-1, -1};
    bool fovDirty_ = true;

    // game.cpp
    // Retries the generator up to GEN_RETRIES times; nullopt if every pass placed zero rooms.
    std::optional<GeneratedLevel> generateLevel(int depth, RNG& rng) const;

    // game_loop.cpp
    void handleAwaitingInput(const Intent& in);
    void handleMenu(const Intent& in);
    void handleTargeting(const Intent& in);
    void handleLevelUp(const Intent& in);
    void playerMoveOrAttack(int dx, int dy);
    void endPlayerTurn();
    void checkLevelUp();

    // game_inventory.cpp
    // Returns true if the action spent the player's turn.
    bool useItem(size_t slot);
    bool finishTargeting(std::optional<Vec2i> target);
    SpellContext spellContext();
};
