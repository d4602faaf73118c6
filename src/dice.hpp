#pragma once

#include "rng.hpp"

#include <cstdint>
#include <string>

enum class DiceKind : uint8_t {
    Constant = 0,
    Dice,
    Range,
};

// A parsed dice formula. Examples:
//   "3D6+2" => Dice  {count 3, sides 6, bonus 2}
//   "d%"    => Dice  {count 1, sides 100}
//   "4-12"  => Range {lo 4, hi 12}
//   "-3"    => Constant {bonus -3}
struct DiceFormula {
    DiceKind kind = DiceKind::Constant;
    int count = 0;
    int sides = 0;
    int bonus = 0;
    int lo = 0;
    int hi = 0;
};

DiceFormula constantDice(int value);

// Parses a formula. On failure returns false and, if err is set, stores a
// message starting with "malformed formula".
bool parseDice(const std::string& text, DiceFormula& out, std::string* err = nullptr);

// Rolls the formula. Dice sum `count` independent draws over [1, sides] plus
// bonus; ranges draw once over [lo, hi]; constants return the constant.
int rollDice(RNG& rng, const DiceFormula& d);

// Convenience for one-shot rolls of formula text (parse + roll).
bool rollFormula(RNG& rng, const std::string& text, int& out, std::string* err = nullptr);

// Pretty-prints a formula (e.g., "1D6+2", "4-12", "5").
std::string diceToString(const DiceFormula& d);
