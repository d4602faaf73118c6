#include "sdl.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include "common.hpp"
#include "dice.hpp"
#include "entity.hpp"
#include "entity_loader.hpp"
#include "rng.hpp"
#include "scenario.hpp"
#include "settings.hpp"
#include "version.hpp"

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << CARDFRP_APPNAME << " " << CARDFRP_VERSION << "\n"
        << "Usage: " << (exe ? exe : "cardfrp") << " [options]\n\n"
        << "Runs the sample play-through (town square, hero, guard) unless --roll or --check is given.\n\n"
        << "Options:\n"
        << "  --seed <n>           Use a specific RNG seed\n"
        << "  --nocombat           Skip the fight at the end of the play-through\n"
        << "  --data-dir <path>    Directory holding the entity definition files\n"
        << "  --config <path>      Settings file to use\n"
        << "  --portable           Keep the settings file next to the executable\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "  --roll <formula>     Roll a dice formula (e.g. 3D6+2) and exit\n"
        << "  --count <n>          Number of rolls for --roll (default 1)\n"
        << "  --check <file>       Load a definition file, print what it defines, and exit\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

static int rollCommand(const std::string& formula, int count, RNG& rng) {
    DiceFormula d;
    std::string err;
    if (!parseDice(formula, d, &err)) {
        std::cerr << err << "\n";
        return 1;
    }
    std::cout << diceToString(d) << ":";
    for (int i = 0; i < count; ++i) std::cout << " " << rollDice(rng, d);
    std::cout << "\n";
    return 0;
}

static int checkCommand(const std::string& path) {
    auto e = makeObject("object");
    std::string warnings;
    if (!loadEntityFile(path, *e, &warnings)) {
        std::cerr << warnings;
        return 1;
    }
    if (!warnings.empty()) std::cerr << path << ":\n" << warnings;

    auto dump = [](const Entity& x, const std::string& indent) {
        std::cout << indent << x.label() << "\n";
        for (const auto& kv : x.attributes()) {
            std::cout << indent << "    " << kv.first << " = " << kv.second.text() << "\n";
        }
    };
    dump(*e, "");
    for (const auto& o : e->objects) dump(*o, "    ");
    return warnings.empty() ? 0 : 2;
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "cardfrp");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << CARDFRP_APPNAME << " " << CARDFRP_VERSION << "\n";
        return 0;
    }

    const std::optional<std::string> checkArg = parseStringArg(argc, argv, "--check");
    if (checkArg) return checkCommand(*checkArg);

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    const std::optional<std::string> configArg = parseStringArg(argc, argv, "--config");
    const std::optional<std::string> dataDirArg = parseStringArg(argc, argv, "--data-dir");
    const bool portable = hasFlag(argc, argv, "--portable");
    const bool resetSettings = hasFlag(argc, argv, "--reset-settings");

    std::filesystem::path settingsPathFs;
    if (configArg && !configArg->empty()) {
        settingsPathFs = std::filesystem::path(*configArg);
    } else {
        std::filesystem::path baseDir;
        if (portable) {
            // Portable mode: keep the settings next to the executable (if possible).
            if (char* p = SDL_GetBasePath()) {
                baseDir = std::filesystem::path(p);
                SDL_free(p);
            } else {
                baseDir = std::filesystem::current_path();
            }
        } else if (char* p = SDL_GetPrefPath("cardfrp", CARDFRP_APPNAME)) {
            baseDir = std::filesystem::path(p);
            SDL_free(p);
        } else {
            baseDir = std::filesystem::current_path();
        }

        std::error_code ec;
        std::filesystem::create_directories(baseDir, ec);
        if (ec) std::cerr << "Could not create " << baseDir.string() << ": " << ec.message() << "\n";
        settingsPathFs = baseDir / "cardfrp_settings.ini";
    }
    const std::string settingsPath = settingsPathFs.string();

    // Load or create settings.
    if (resetSettings) {
        std::error_code ec;
        const std::filesystem::path bak = settingsPath + ".bak";
        std::filesystem::remove(bak, ec);
        if (std::filesystem::exists(settingsPathFs)) {
            std::filesystem::rename(settingsPathFs, bak, ec);
            if (ec) std::cerr << "Could not back up " << settingsPath << ": " << ec.message() << "\n";
        }
        if (!writeDefaultSettings(settingsPath)) std::cerr << "Could not write " << settingsPath << "\n";
    } else if (!std::filesystem::exists(settingsPathFs)) {
        if (!writeDefaultSettings(settingsPath)) std::cerr << "Could not write " << settingsPath << "\n";
    }

    std::string warnings;
    Settings settings = loadSettings(settingsPath, &warnings);
    if (!warnings.empty()) std::cerr << settingsPath << ":\n" << warnings;

    if (dataDirArg && !dataDirArg->empty()) settings.dataDir = *dataDirArg;
    if (hasFlag(argc, argv, "--nocombat")) settings.combat = false;

    // Priority: CLI --seed > settings seed > clock.
    uint32_t seed = settings.seed;
    if (const std::optional<std::string> seedArg = parseStringArg(argc, argv, "--seed")) {
        if (!parseU32(*seedArg, seed)) {
            std::cerr << "Invalid --seed value: " << *seedArg << "\n";
            SDL_Quit();
            return 1;
        }
    }
    if (seed == 0) seed = SDL_GetTicks() ^ 0x9E3779B9u;
    RNG rng(seed);

    int rc = 0;
    if (const std::optional<std::string> rollArg = parseStringArg(argc, argv, "--roll")) {
        int count = 1;
        if (const std::optional<std::string> countArg = parseStringArg(argc, argv, "--count")) {
            if (!parseStrictInt(trim(*countArg), count) || count < 1) {
                std::cerr << "Invalid --count value: " << *countArg << "\n";
                SDL_Quit();
                return 1;
            }
        }
        rc = rollCommand(*rollArg, count, rng);
    } else {
        std::cout << CARDFRP_APPNAME << " " << CARDFRP_VERSION << " (seed " << seed << ")\n\n";
        std::string err;
        if (!runScenario(settings, rng, std::cout, std::cerr, &err)) {
            std::cerr << "Scenario failed: " << err << "\n";
            rc = 1;
        }
    }

    SDL_Quit();
    return rc;
}
