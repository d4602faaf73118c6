#pragma once

#include <cstdint>
#include <string>

// Simple user-editable settings file (INI-ish: key = value).
// The CLI creates it in its per-user directory (SDL_GetPrefPath) on first run.
struct Settings {
    // RNG seed for the play-through (0 = derive from the clock).
    uint32_t seed = 0;

    // Where the entity definition files live, and which ones to load.
    std::string dataDir = "data";
    std::string contextFile = "town_square.dat";
    std::string heroFile = "hero.dat";
    std::string guardFile = "guard.dat";

    // Run the fight at the end of the scenario (CLI: --nocombat turns it off).
    bool combat = true;

    // Safety cap for open-ended loops (combat rounds, retried attacks).
    int maxRounds = 100;

    // Print each action's modifiers before delivering it.
    bool echoValues = false;
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
// Lines that could not be understood are reported in outWarnings.
Settings loadSettings(const std::string& path, std::string* outWarnings = nullptr);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
