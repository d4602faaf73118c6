#include "settings.hpp"

#include "common.hpp"

#include <algorithm>
#include <fstream>
#include <string>

namespace {

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    return parseStrictInt(trim(v), out);
}

} // namespace

Settings loadSettings(const std::string& path, std::string* outWarnings) {
    Settings s;
    std::string warnings;

    std::ifstream f(path);
    if (!f) {
        if (outWarnings) outWarnings->clear();
        return s;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;

        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            warnings += "Line " + std::to_string(lineNo) + ": expected key = value\n";
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        bool ok = true;
        if (key == "seed") {
            uint32_t v = 0;
            ok = parseU32(val, v);
            if (ok) s.seed = v;
        } else if (key == "data_dir") {
            s.dataDir = val;
        } else if (key == "context_file") {
            s.contextFile = val;
        } else if (key == "hero_file") {
            s.heroFile = val;
        } else if (key == "guard_file") {
            s.guardFile = val;
        } else if (key == "combat") {
            bool b = true;
            ok = parseBool(val, b);
            if (ok) s.combat = b;
        } else if (key == "max_rounds") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.maxRounds = std::clamp(v, 1, 10000);
        } else if (key == "echo_values") {
            bool b = false;
            ok = parseBool(val, b);
            if (ok) s.echoValues = b;
        }

        if (!ok) warnings += "Line " + std::to_string(lineNo) + ": bad value for " + key + "\n";
    }

    if (outWarnings) *outWarnings = warnings;
    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# CardFRP settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and run again.

# RNG seed (0 = derive from the clock). The CLI flag --seed overrides this.
seed = 0

# Entity definition files (relative names are looked up in data_dir).
data_dir = data
context_file = town_square.dat
hero_file = hero.dat
guard_file = guard.dat

# combat: true/false  (false skips the fight; same as --nocombat)
combat = true

# max_rounds: 1..10000  (cap for combat rounds and retried attacks)
max_rounds = 100

# echo_values: true/false  (print each action's modifiers before it is delivered)
echo_values = false
)INI";

    return static_cast<bool>(f);
}
