#pragma once

#include <string>

namespace symcache {

/// Identifies one cacheable symbol file: (name, identifier, filename).
///
/// e.g. ("chrome.dll.pdb", "ABCD1234", "chrome.dll.pdb"). The identifier is
/// the build/debug GUID the debugger asks for.
struct SymbolKey {
    std::string name;
    std::string identifier;
    std::string filename;

    /// "name/identifier/filename", used in log lines and as the URL suffix.
    std::string to_string() const;

    bool operator==(const SymbolKey& other) const = default;
};

/// Maximum length of a single key field.
constexpr size_t MAX_KEY_FIELD_LENGTH = 255;

/// Check that a single key field is safe to use as a path component.
/// Returns error message or empty string on success.
std::string validate_component(const std::string& component);

/// Validate all three fields of a key.
/// Returns error message (naming the offending field) or empty string.
std::string validate_key(const SymbolKey& key);

}  // namespace symcache
