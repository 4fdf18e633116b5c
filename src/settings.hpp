#pragma once

#include <string>

// Simple user-editable settings file (INI-ish: key = value).
// The file is created next to the save file (SDL_GetPrefPath) on first run.
struct Settings {
    int tileSize = 16;
    int hudHeight = 140;
    bool startFullscreen = false;

    // vsync: enables SDL_Renderer vsync (lower CPU usage, smoother rendering).
    bool vsync = true;

    // Shown on the HUD.
    std::string playerName = "stranger";

    // Torch radius. 0 keeps the content default.
    int fovRadius = 0;

    // Optional content overrides (see loadContentIni). Relative paths are
    // resolved against the data directory.
    std::string contentFile;

    // Save file name; relative paths are resolved against the data directory.
    std::string saveFile = "tombcrawl_save.dat";
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
// Unknown keys and bad values are reported in outWarnings (bind_* keys are left to KeyBinds).
Settings loadSettings(const std::string& path, std::string* outWarnings = nullptr);

// Update (or append) a single key=value entry in the settings file.
// Returns false if the file could not be read/written.
bool updateIniKey(const std::string& path, const std::string& key, const std::string& value);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
