#include "game.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace {

constexpr uint32_t SAVE_MAGIC = 0x56534354u; // 'TCSV'
constexpr uint32_t SAVE_VERSION = 1u;

// Sanity caps so a corrupted length field cannot trigger a huge allocation.
constexpr uint32_t MAX_STRING_LEN = 1u << 16;
constexpr uint32_t MAX_ENTITIES = 1u << 16;
constexpr int32_t MAX_MAP_DIM = 1024;

uint32_t crc32(const uint8_t* data, size_t n) {
    static uint32_t table[256];
    static bool inited = false;
    if (!inited) {
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        inited = true;
    }

    uint32_t crc = 0xFFFFFFFFu;
    for (size_t i = 0; i < n; ++i) {
        crc = table[(crc ^ data[i]) & 0xFFu] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

uint32_t readU32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
        | (static_cast<uint32_t>(p[1]) << 8)
        | (static_cast<uint32_t>(p[2]) << 16)
        | (static_cast<uint32_t>(p[3]) << 24);
}

void appendU32LE(std::vector<uint8_t>& s, uint32_t v) {
    s.push_back(static_cast<uint8_t>(v & 0xFFu));
    s.push_back(static_cast<uint8_t>((v >> 8) & 0xFFu));
    s.push_back(static_cast<uint8_t>((v >> 16) & 0xFFu));
    s.push_back(static_cast<uint8_t>((v >> 24) & 0xFFu));
}

template <typename T>
void writePod(std::ostream& out, const T& v) {
    out.write(reinterpret_cast<const char*>(&v), static_cast<std::streamsize>(sizeof(T)));
}

template <typename T>
bool readPod(std::istream& in, T& v) {
    return static_cast<bool>(in.read(reinterpret_cast<char*>(&v), static_cast<std::streamsize>(sizeof(T))));
}

void writeBool(std::ostream& out, bool b) {
    const uint8_t v = b ? 1 : 0;
    writePod(out, v);
}

bool readBool(std::istream& in, bool& b) {
    uint8_t v = 0;
    if (!readPod(in, v)) return false;
    b = (v != 0);
    return true;
}

void writeString(std::ostream& out, const std::string& s) {
    uint32_t len = static_cast<uint32_t>(s.size());
    writePod(out, len);
    if (len) out.write(s.data(), static_cast<std::streamsize>(len));
}

bool readString(std::istream& in, std::string& s) {
    uint32_t len = 0;
    if (!readPod(in, len)) return false;
    if (len > MAX_STRING_LEN) return false;
    s.assign(len, '\0');
    if (len) {
        if (!in.read(s.data(), static_cast<std::streamsize>(len))) return false;
    }
    return true;
}

void writeColor(std::ostream& out, Color c) {
    writePod(out, c.r);
    writePod(out, c.g);
    writePod(out, c.b);
    writePod(out, c.a);
}

bool readColor(std::istream& in, Color& c) {
    return readPod(in, c.r) && readPod(in, c.g) && readPod(in, c.b) && readPod(in, c.a);
}

void writeAi(std::ostream& out, const Ai& ai) {
    const uint8_t kind = static_cast<uint8_t>(ai.kind);
    const int32_t turns = ai.turnsRemaining;
    writePod(out, kind);
    writePod(out, turns);
    writeBool(out, static_cast<bool>(ai.previous));
    if (ai.previous) writeAi(out, *ai.previous);
}

bool readAi(std::istream& in, Ai& ai, int depth) {
    if (depth >= Ai::MAX_LAYERS) return false;
    uint8_t kind = 0;
    int32_t turns = 0;
    bool hasPrev = false;
    if (!readPod(in, kind) || !readPod(in, turns) || !readBool(in, hasPrev)) return false;
    if (kind > static_cast<uint8_t>(AiKind::Confused)) return false;

    ai.kind = static_cast<AiKind>(kind);
    ai.turnsRemaining = turns;
    ai.previous.reset();
    if (hasPrev) {
        auto prev = std::make_unique<Ai>();
        if (!readAi(in, *prev, depth + 1)) return false;
        ai.previous = std::move(prev);
    }
    return true;
}

void writeEntity(std::ostream& out, const Entity& e) {
    const int32_t x = e.pos.x;
    const int32_t y = e.pos.y;
    const int32_t level = e.level;
    writePod(out, x);
    writePod(out, y);
    writePod(out, e.glyph);
    writeColor(out, e.color);
    writeString(out, e.name);
    writeBool(out, e.blocks);
    writeBool(out, e.alive);
    writeBool(out, e.alwaysVisible);
    writePod(out, level);

    writeBool(out, e.fighter.has_value());
    if (e.fighter) {
        const Fighter& f = *e.fighter;
        const int32_t v[5] = {f.maxHp, f.hp, f.defense, f.power, f.xp};
        for (int32_t i : v) writePod(out, i);
        const uint8_t death = static_cast<uint8_t>(f.onDeath);
        writePod(out, death);
    }

    writeBool(out, e.ai.has_value());
    if (e.ai) writeAi(out, *e.ai);

    writeBool(out, e.item.has_value());
    if (e.item) {
        const uint8_t k = static_cast<uint8_t>(*e.item);
        writePod(out, k);
    }

    writeBool(out, e.equipment.has_value());
    if (e.equipment) {
        const Equipment& eq = *e.equipment;
        const uint8_t slot = static_cast<uint8_t>(eq.slot);
        const int32_t pw = eq.powerBonus;
        const int32_t df = eq.defenseBonus;
        const int32_t hp = eq.maxHpBonus;
        writePod(out, slot);
        writeBool(out, eq.equipped);
        writePod(out, pw);
        writePod(out, df);
        writePod(out, hp);
    }
}

bool readEntity(std::istream& in, Entity& e) {
    int32_t x = 0, y = 0, level = 0;
    if (!readPod(in, x) || !readPod(in, y)) return false;
    if (!readPod(in, e.glyph)) return false;
    if (!readColor(in, e.color)) return false;
    if (!readString(in, e.name)) return false;
    if (!readBool(in, e.blocks) || !readBool(in, e.alive) || !readBool(in, e.alwaysVisible)) return false;
    if (!readPod(in, level)) return false;
    e.pos = Vec2i{x, y};
    e.level = level;

    bool has = false;
    if (!readBool(in, has)) return false;
    e.fighter.reset();
    if (has) {
        int32_t v[5] = {0, 0, 0, 0, 0};
        for (int32_t& i : v) {
            if (!readPod(in, i)) return false;
        }
        uint8_t death = 0;
        if (!readPod(in, death) || death > static_cast<uint8_t>(DeathKind::Monster)) return false;
        Fighter f;
        f.maxHp = v[0];
        f.hp = v[1];
        f.defense = v[2];
        f.power = v[3];
        f.xp = v[4];
        f.onDeath = static_cast<DeathKind>(death);
        e.fighter = f;
    }

    if (!readBool(in, has)) return false;
    e.ai.reset();
    if (has) {
        Ai ai;
        if (!readAi(in, ai, 0)) return false;
        e.ai = std::move(ai);
    }

    if (!readBool(in, has)) return false;
    e.item.reset();
    if (has) {
        uint8_t k = 0;
        if (!readPod(in, k) || k > static_cast<uint8_t>(ItemKind::Confuse)) return false;
        e.item = static_cast<ItemKind>(k);
    }

    if (!readBool(in, has)) return false;
    e.equipment.reset();
    if (has) {
        uint8_t slot = 0;
        Equipment eq;
        int32_t pw = 0, df = 0, hp = 0;
        if (!readPod(in, slot) || slot > static_cast<uint8_t>(EquipSlot::LeftHand)) return false;
        if (!readBool(in, eq.equipped)) return false;
        if (!readPod(in, pw) || !readPod(in, df) || !readPod(in, hp)) return false;
        eq.slot = static_cast<EquipSlot>(slot);
        eq.powerBonus = pw;
        eq.defenseBonus = df;
        eq.maxHpBonus = hp;
        e.equipment = eq;
    }
    return true;
}

} // namespace

std::vector<uint8_t> Game::saveSnapshot() const {
    std::ostringstream mem(std::ios::binary);

    writePod(mem, SAVE_MAGIC);
    writePod(mem, SAVE_VERSION);
    writePod(mem, rng_.state);

    // Monster turns never outlive handleIntent(); store the state they resolve to.
    EngineState st = state_;
    if (st == EngineState::RunningMonsterTurns) st = EngineState::AwaitingInput;
    writePod(mem, static_cast<uint8_t>(st));
    writePod(mem, static_cast<uint8_t>(menuMode_));
    const int32_t depth = depth_;
    writePod(mem, depth);
    const uint32_t pending = static_cast<uint32_t>(pendingSlot_);
    const int32_t cx = cursor_.x;
    const int32_t cy = cursor_.y;
    writePod(mem, pending);
    writePod(mem, cx);
    writePod(mem, cy);

    // Tile grid
    const int32_t w = dung_.width;
    const int32_t h = dung_.height;
    writePod(mem, w);
    writePod(mem, h);
    for (const Tile& t : dung_.tiles) {
        const uint8_t flags = static_cast<uint8_t>((t.blocked ? 1u : 0u) | (t.blockSight ? 2u : 0u) | (t.explored ? 4u : 0u));
        writePod(mem, flags);
    }

    // Message log
    const uint32_t msgCount = static_cast<uint32_t>(log_.size());
    writePod(mem, msgCount);
    for (const Message& m : log_.messages()) {
        writeString(mem, m.text);
        writeColor(mem, m.color);
    }

    const uint32_t invCount = static_cast<uint32_t>(inv_.size());
    writePod(mem, invCount);
    for (const Entity& e : inv_.items()) writeEntity(mem, e);

    const uint32_t entCount = static_cast<uint32_t>(store_.size());
    writePod(mem, entCount);
    for (const Entity& e : store_) writeEntity(mem, e);

    const std::string payload = mem.str();
    std::vector<uint8_t> out(payload.begin(), payload.end());

    // Integrity footer (CRC32 over everything before it)
    const uint32_t c = crc32(out.data(), out.size());
    appendU32LE(out, c);
    return out;
}

bool Game::loadSnapshot(const std::vector<uint8_t>& blob, std::string* err) {
    auto fail = [&](const char* why) {
        if (err) *err = why;
        return false;
    };

    if (blob.size() < 12u) return fail("Save data is corrupted or truncated.");

    const uint32_t magic = readU32LE(blob.data());
    const uint32_t version = readU32LE(blob.data() + 4);
    if (magic != SAVE_MAGIC || version == 0u || version > SAVE_VERSION) {
        return fail("Save data is invalid or from another version.");
    }

    const uint32_t storedCrc = readU32LE(blob.data() + (blob.size() - 4u));
    if (storedCrc != crc32(blob.data(), blob.size() - 4u)) {
        return fail("Save data failed its integrity check (CRC mismatch).");
    }

    const std::string payload(reinterpret_cast<const char*>(blob.data()), blob.size() - 4u);
    std::istringstream in(payload, std::ios::binary | std::ios::in);

    const char* truncated = "Save data is corrupted or truncated.";

    uint32_t magic2 = 0, version2 = 0;
    if (!readPod(in, magic2) || !readPod(in, version2)) return fail(truncated);

    // Everything lands in scratch values first; the live game is only touched once parsing succeeded.
    uint32_t rngState = 0;
    uint8_t st = 0, mode = 0;
    int32_t depth = 0;
    uint32_t pending = 0;
    int32_t cx = 0, cy = 0;
    if (!readPod(in, rngState) || !readPod(in, st) || !readPod(in, mode) || !readPod(in, depth)) return fail(truncated);
    if (!readPod(in, pending) || !readPod(in, cx) || !readPod(in, cy)) return fail(truncated);
    if (st > static_cast<uint8_t>(EngineState::GameOver) || mode > static_cast<uint8_t>(MenuMode::Drop) || depth < 1) {
        return fail(truncated);
    }

    int32_t w = 0, h = 0;
    if (!readPod(in, w) || !readPod(in, h)) return fail(truncated);
    if (w <= 0 || h <= 0 || w > MAX_MAP_DIM || h > MAX_MAP_DIM) return fail(truncated);

    Dungeon dung(w, h);
    for (Tile& t : dung.tiles) {
        uint8_t flags = 0;
        if (!readPod(in, flags)) return fail(truncated);
        t.blocked = (flags & 1u) != 0;
        t.blockSight = (flags & 2u) != 0;
        t.explored = (flags & 4u) != 0;
    }

    MessageLog log;
    uint32_t msgCount = 0;
    if (!readPod(in, msgCount) || msgCount > MAX_ENTITIES) return fail(truncated);
    for (uint32_t i = 0; i < msgCount; ++i) {
        std::string text;
        Color c;
        if (!readString(in, text) || !readColor(in, c)) return fail(truncated);
        log.add(std::move(text), c);
    }

    Inventory inv;
    uint32_t invCount = 0;
    if (!readPod(in, invCount) || invCount > Inventory::CAPACITY) return fail(truncated);
    for (uint32_t i = 0; i < invCount; ++i) {
        Entity e;
        if (!readEntity(in, e)) return fail(truncated);
        inv.add(std::move(e));
    }

    EntityStore store;
    uint32_t entCount = 0;
    if (!readPod(in, entCount) || entCount == 0 || entCount > MAX_ENTITIES) return fail(truncated);
    for (uint32_t i = 0; i < entCount; ++i) {
        Entity e;
        if (!readEntity(in, e)) return fail(truncated);
        store.add(std::move(e));
    }
    if (!store.player().fighter) return fail("Save data has no player.");

    rng_.state = rngState ? rngState : 0x12345678u;
    state_ = static_cast<EngineState>(st);
    if (state_ == EngineState::RunningMonsterTurns) state_ = EngineState::AwaitingInput;
    menuMode_ = static_cast<MenuMode>(mode);
    showCharacter_ = false;
    depth_ = depth;
    pendingSlot_ = pending;
    cursor_ = Vec2i{cx, cy};

    dung_ = std::move(dung);
    log_ = std::move(log);
    inv_ = std::move(inv);
    store_ = std::move(store);

    fov_->reset(dung_);
    refreshFov();
    return true;
}

bool Game::saveToFile(const std::string& path) {
    const std::vector<uint8_t> payload = saveSnapshot();
    const std::filesystem::path p(path);

    std::error_code ec;
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);

    // Write to a temporary file first, then replace the target.
    const std::filesystem::path tmp = p.string() + ".tmp";
    std::ofstream out(tmp, std::ios::binary);
    if (!out) {
        log_.add("Failed to save (cannot open file).", colors::Red);
        return false;
    }

    out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
    out.flush();
    if (!out.good()) {
        log_.add("Failed to save (write error).", colors::Red);
        out.close();
        std::filesystem::remove(tmp, ec);
        return false;
    }
    out.close();

    ec.clear();
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        // On Windows, rename fails if destination exists; remove then retry.
        std::error_code ec2;
        std::filesystem::remove(p, ec2);
        ec.clear();
        std::filesystem::rename(tmp, p, ec);
    }
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp, ec2);
        log_.add("Failed to save (cannot replace file).", colors::Red);
        return false;
    }
    return true;
}

bool Game::loadFromFile(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        log_.add("No save file found.", colors::Red);
        return false;
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    std::string err;
    if (!loadSnapshot(bytes, &err)) {
        log_.add(err, colors::Red);
        return false;
    }
    return true;
}
