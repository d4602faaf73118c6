#include "attributes.hpp"

#include "common.hpp"

#include <utility>

AttrValue::AttrValue(std::string text)
    : kind_(text.find(',') != std::string::npos ? AttrKind::List : AttrKind::Formula),
      text_(std::move(text)) {}

AttrValue AttrValue::parse(const std::string& text) {
    int v = 0;
    if (parseStrictInt(text, v)) return AttrValue(v);
    return AttrValue(text);
}

bool AttrValue::toInt(int& out) const {
    if (kind_ == AttrKind::Integer) {
        out = num_;
        return true;
    }
    if (kind_ == AttrKind::Formula) return parseStrictInt(trim(text_), out);
    return false;
}

std::string AttrValue::text() const {
    if (kind_ == AttrKind::Integer) return std::to_string(num_);
    return text_;
}

std::vector<std::string> AttrValue::items() const {
    if (kind_ != AttrKind::List) return {text()};
    std::vector<std::string> out;
    for (const std::string& part : splitOn(text_, ',')) {
        out.push_back(trim(part));
    }
    return out;
}

AttributeStore::AttributeStore(std::string n, std::string descr)
    : name(std::move(n)), description(std::move(descr)) {}

const AttrValue* AttributeStore::get(const std::string& key) const {
    return getLocal(key);
}

const AttrValue* AttributeStore::getLocal(const std::string& key) const {
    auto it = attrs_.find(key);
    return it == attrs_.end() ? nullptr : &it->second;
}

void AttributeStore::set(const std::string& key, AttrValue value) {
    attrs_[key] = std::move(value);
}

bool AttributeStore::readInt(const std::string& key, int& out, std::string* err) const {
    const AttrValue* v = get(key);
    if (!v) {
        out = 0;
        return true;
    }
    if (v->toInt(out)) return true;
    if (err) *err = name + ": attribute " + key + " is not an integer ('" + v->text() + "')";
    return false;
}

std::string AttributeStore::label() const {
    if (description.empty()) return name;
    return name + "(" + description + ")";
}
