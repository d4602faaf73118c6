#include "entity_loader.hpp"

#include "entity.hpp"

#include <cctype>
#include <fstream>
#include <istream>

namespace {

void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF && static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

void appendWarning(std::string& w, int lineNo, const std::string& msg, int& warnCount, int warnLimit = 30) {
    if (warnCount < warnLimit) {
        w += "Line " + std::to_string(lineNo) + ": " + msg + "\n";
    } else if (warnCount == warnLimit) {
        w += "(more warnings omitted...)\n";
    }
    ++warnCount;
}

} // namespace

bool lexDefinitionLine(const std::string& line, std::string& key, std::string& value, bool& hasValue, bool& quoted) {
    key.clear();
    value.clear();
    hasValue = false;
    quoted = false;

    const size_t eol = line.size();
    size_t start = 0;
    while (start < eol && isSpace(line[start])) ++start;
    if (start >= eol || line[start] == '#') return false;

    size_t end = start + 1;
    while (end < eol && !isSpace(line[end])) ++end;
    key = line.substr(start, end - start);

    start = end;
    while (start < eol && isSpace(line[start])) ++start;
    if (start >= eol || line[start] == '#') return true;

    hasValue = true;
    if (line[start] == '"' || line[start] == '\'') {
        // Scan to the closing quote (or end of line).
        const char quote = line[start];
        ++start;
        end = start;
        while (end < eol && line[end] != quote) ++end;
        quoted = true;
    } else {
        end = start + 1;
        while (end < eol && !isSpace(line[end])) ++end;
    }
    value = line.substr(start, end - start);
    return true;
}

void loadEntityStream(std::istream& in, Entity& into, std::string* outWarnings) {
    std::string warnings;
    int warnCount = 0;

    Entity* cur = &into;
    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (lineNo == 1) stripUtf8Bom(line);
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::string key, value;
        bool hasValue = false;
        bool quoted = false;
        if (!lexDefinitionLine(line, key, value, hasValue, quoted)) continue;

        if (key == "OBJECT") {
            cur = into.addObject(makeObject("object"));
            continue;
        }
        if (!hasValue) {
            appendWarning(warnings, lineNo, "no value for " + key, warnCount);
            continue;
        }

        if (key == "NAME") {
            cur->name = value;
        } else if (key == "DESCRIPTION") {
            cur->description = value;
        } else if (quoted) {
            cur->set(key, AttrValue(value));
        } else {
            cur->set(key, AttrValue::parse(value));
        }
    }

    if (outWarnings) *outWarnings = warnings;
}

bool loadEntityFile(const std::string& path, Entity& into, std::string* outWarnings) {
    std::ifstream f(path);
    if (!f) {
        if (outWarnings) *outWarnings = "Unable to read attributes from " + path + "\n";
        return false;
    }
    loadEntityStream(f, into, outWarnings);
    return true;
}
