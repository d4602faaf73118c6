#include "dice.hpp"

#include "common.hpp"

#include <climits>
#include <cstdint>
#include <sstream>
#include <vector>

namespace {

bool fail(std::string* err, const std::string& text, const char* why) {
    if (err) *err = "malformed formula '" + text + "': " + why;
    return false;
}

bool isDigits(const std::string& s) {
    return !s.empty() && s[0] != '-' && isIntegerText(s);
}

} // namespace

DiceFormula constantDice(int value) {
    DiceFormula d;
    d.kind = DiceKind::Constant;
    d.bonus = value;
    return d;
}

bool parseDice(const std::string& raw, DiceFormula& out, std::string* err) {
    const std::string text = trim(raw);
    if (text.empty()) return fail(err, raw, "empty expression");

    // Plain numbers (optionally negative) are constants.
    int constant = 0;
    if (isIntegerText(text)) {
        if (!parseStrictInt(text, constant)) return fail(err, raw, "number out of range");
        out = constantDice(constant);
        return true;
    }

    char delimiter = 0;
    if (text.find('D') != std::string::npos) delimiter = 'D';
    else if (text.find('d') != std::string::npos) delimiter = 'd';
    else if (text.find('-') != std::string::npos) delimiter = '-';
    if (delimiter == 0) return fail(err, raw, "unrecognized dice expression");

    const std::vector<std::string> values = splitOn(text, delimiter);
    if (values.size() != 2) return fail(err, raw, "expected exactly two operands");

    if (delimiter == '-') {
        int lo = 0;
        int hi = 0;
        if (!isDigits(values[0]) || !isDigits(values[1]) ||
            !parseStrictInt(values[0], lo) || !parseStrictInt(values[1], hi)) {
            return fail(err, raw, "non-numeric value in range");
        }
        if (lo >= hi) return fail(err, raw, "illegal range");
        if (static_cast<int64_t>(hi) - lo + 1 > INT_MAX) return fail(err, raw, "range too large");

        DiceFormula d;
        d.kind = DiceKind::Range;
        d.lo = lo;
        d.hi = hi;
        out = d;
        return true;
    }

    DiceFormula d;
    d.kind = DiceKind::Dice;

    // An omitted count means one die.
    if (values[0].empty()) {
        d.count = 1;
    } else if (!isDigits(values[0]) || !parseStrictInt(values[0], d.count)) {
        return fail(err, raw, "non-numeric dice count");
    }

    // Faces, with an optional +K after them.
    std::string faces = values[1];
    const size_t plus = faces.find('+');
    if (plus != std::string::npos) {
        const std::string bonus = faces.substr(plus + 1);
        faces = faces.substr(0, plus);
        if (!isDigits(bonus) || !parseStrictInt(bonus, d.bonus)) {
            return fail(err, raw, "non-numeric bonus");
        }
    }

    if (faces == "%") {
        d.sides = 100;
    } else if (!isDigits(faces) || !parseStrictInt(faces, d.sides)) {
        return fail(err, raw, "non-numeric dice type");
    }
    if (d.sides < 1) return fail(err, raw, "dice need at least one face");

    // The largest roll must still be an int.
    if (static_cast<int64_t>(d.count) * d.sides + d.bonus > INT_MAX) return fail(err, raw, "roll too large");

    out = d;
    return true;
}

int rollDice(RNG& rng, const DiceFormula& d) {
    switch (d.kind) {
        case DiceKind::Dice: {
            int sum = d.bonus;
            for (int i = 0; i < d.count; ++i) {
                sum += rng.range(1, d.sides);
            }
            return sum;
        }
        case DiceKind::Range:
            return rng.range(d.lo, d.hi);
        case DiceKind::Constant:
        default:
            return d.bonus;
    }
}

bool rollFormula(RNG& rng, const std::string& text, int& out, std::string* err) {
    DiceFormula d;
    if (!parseDice(text, d, err)) return false;
    out = rollDice(rng, d);
    return true;
}

std::string diceToString(const DiceFormula& d) {
    std::ostringstream ss;
    switch (d.kind) {
        case DiceKind::Dice:
            ss << d.count << "D" << d.sides;
            if (d.bonus > 0) ss << "+" << d.bonus;
            break;
        case DiceKind::Range:
            ss << d.lo << "-" << d.hi;
            break;
        case DiceKind::Constant:
        default:
            ss << d.bonus;
            break;
    }
    return ss.str();
}
