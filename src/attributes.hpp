#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

// The three shapes an attribute value can take.
//   Integer: 16, -3
//   Formula: "D6+2", "4-12", or numeric text such as "10"
//   List:    "10,30" (one entry per sub-verb of a compound action)
enum class AttrKind : uint8_t {
    Integer = 0,
    Formula,
    List,
};

class AttrValue {
public:
    AttrValue() = default;
    AttrValue(int v) : kind_(AttrKind::Integer), num_(v) {}
    AttrValue(const char* text) : AttrValue(std::string(text ? text : "")) {}
    AttrValue(std::string text);

    // Like the string constructor, but strict integer text becomes an Integer.
    static AttrValue parse(const std::string& text);

    AttrKind kind() const { return kind_; }
    bool isInteger() const { return kind_ == AttrKind::Integer; }

    // Integer value, or Formula text that is a plain integer.
    bool toInt(int& out) const;

    // Canonical text form ("16", "D6", "10,30").
    std::string text() const;

    // List entries; non-list values yield a single entry.
    std::vector<std::string> items() const;

    bool operator==(const AttrValue& o) const { return kind_ == o.kind_ && num_ == o.num_ && text_ == o.text_; }
    bool operator!=(const AttrValue& o) const { return !(*this == o); }

private:
    AttrKind kind_ = AttrKind::Integer;
    int num_ = 0;
    std::string text_;
};

// A named bag of attributes. Keys are free-form; callers use dot-segmented
// names ("RESISTANCE.ATTACK.slash") by convention only.
class AttributeStore {
public:
    explicit AttributeStore(std::string name = "", std::string description = "");
    virtual ~AttributeStore() = default;

    std::string name;
    std::string description;

    // Lookup. Returns nullptr when the attribute is absent.
    virtual const AttrValue* get(const std::string& key) const;

    // Local lookup only (never delegated).
    const AttrValue* getLocal(const std::string& key) const;

    // Always writes locally, replacing any previous value.
    void set(const std::string& key, AttrValue value);

    bool has(const std::string& key) const { return get(key) != nullptr; }

    // Integer read with "missing means 0". Returns false (and fills err) only
    // when the attribute exists but does not hold an integer.
    bool readInt(const std::string& key, int& out, std::string* err = nullptr) const;

    const std::map<std::string, AttrValue>& attributes() const { return attrs_; }

    // "name(description)", or just the name.
    std::string label() const;

private:
    std::map<std::string, AttrValue> attrs_;
};
