#pragma once

#include "rng.hpp"
#include "settings.hpp"

#include <iosfwd>
#include <string>

// The sample play-through: a hero and a guard meet in a town square,
// search it, talk, fight to the death, then try out a healing scroll, a
// poisoned dagger and a scroll of courage.
//
// The play log goes to `out`; loader warnings go to `diag`.
// Returns false (with err) if a definition file cannot be read or an action
// could not be resolved.
bool runScenario(const Settings& settings, RNG& rng, std::ostream& out, std::ostream& diag, std::string* err = nullptr);

// Resolves a definition file name against the configured data directory.
std::string dataPath(const Settings& settings, const std::string& file);
