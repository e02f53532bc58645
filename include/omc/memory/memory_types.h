#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace omc::memory {

enum class MemoryType { Fact, Preference, Goal, Opinion, Experience, Achievement };

const char* toString(MemoryType type);

/// Case-insensitive; nullopt for unknown names
std::optional<MemoryType> parseMemoryType(std::string_view name);

/// Canonical spelling of `name`, or "fact" when it is not a known type
std::string normalizeMemoryType(std::string_view name);

} // namespace omc::memory
