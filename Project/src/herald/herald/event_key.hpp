#pragma once

#include "symbol.hpp"

#include <string>
#include <variant>

namespace Herald {

// Strings compare byte for byte. A Symbol never equals a string.
using EventKey = std::variant<std::string, Symbol>;

struct WildcardKey {
    explicit constexpr WildcardKey() = default;
};

// Handlers registered under WILDCARD fire on every emission.
inline constexpr WildcardKey WILDCARD {};

std::string toString(const EventKey& key);

}
