#pragma once

#include <iosfwd>
#include <string>

struct Entity;

// Entity definition files are line oriented:
//
//   # comment
//   NAME        "town square"
//   DESCRIPTION 'center of village'
//   ACTIONS     SEARCH
//   LIFE        16          <- unquoted integers are stored as integers
//   OBJECT                  <- following lines describe a new owned object
//   NAME        bench
//
// OBJECT sections are one level deep: each one is added to the entity being
// loaded, never to the previous object.

// Returns false only if the file could not be read. Parsing issues are
// reported in outWarnings.
bool loadEntityFile(const std::string& path, Entity& into, std::string* outWarnings = nullptr);

// Same, from an already open stream.
void loadEntityStream(std::istream& in, Entity& into, std::string* outWarnings = nullptr);

// Splits one definition line into a key and a (possibly quoted) value.
// Returns false for blank and comment lines. hasValue is false when the line
// holds only a key; quoted is true when the value was quoted.
bool lexDefinitionLine(const std::string& line, std::string& key, std::string& value, bool& hasValue, bool& quoted);
