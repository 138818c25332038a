#include "symcache/symbol_key.hpp"

namespace symcache {

std::string SymbolKey::to_string() const {
    return name + "/" + identifier + "/" + filename;
}

std::string validate_component(const std::string& component) {
    if (component.empty()) return "must not be empty";
    if (component.size() > MAX_KEY_FIELD_LENGTH) {
        return "must be at most " + std::to_string(MAX_KEY_FIELD_LENGTH) + " characters";
    }
    if (component.find("..") != std::string::npos ||
        component.find('/') != std::string::npos ||
        component.find('\\') != std::string::npos) {
        return "path traversal or separator characters not allowed: " + component;
    }
    for (unsigned char c : component) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) return "invalid characters in path component: " + component;
    }
    return {};
}

std::string validate_key(const SymbolKey& key) {
    auto err = validate_component(key.name);
    if (!err.empty()) return "invalid name: " + err;
    err = validate_component(key.identifier);
    if (!err.empty()) return "invalid identifier: " + err;
    err = validate_component(key.filename);
    if (!err.empty()) return "invalid filename: " + err;
    return {};
}

}  // namespace symcache
