#include <omc/config/config_helpers.h>
#include <omc/memory/memory_types.h>

namespace omc::memory {

const char* toString(MemoryType type) {
    switch (type) {
        case MemoryType::Fact:
            return "fact";
        case MemoryType::Preference:
            return "preference";
        case MemoryType::Goal:
            return "goal";
        case MemoryType::Opinion:
            return "opinion";
        case MemoryType::Experience:
            return "experience";
        case MemoryType::Achievement:
            return "achievement";
    }
    return "fact";
}

std::optional<MemoryType> parseMemoryType(std::string_view name) {
    auto lower = config::toLower(config::trimmed(name));
    if (lower == "fact")
        return MemoryType::Fact;
    if (lower == "preference")
        return MemoryType::Preference;
    if (lower == "goal")
        return MemoryType::Goal;
    if (lower == "opinion")
        return MemoryType::Opinion;
    if (lower == "experience")
        return MemoryType::Experience;
    if (lower == "achievement")
        return MemoryType::Achievement;
    return std::nullopt;
}

std::string normalizeMemoryType(std::string_view name) {
    auto parsed = parseMemoryType(name);
    return toString(parsed.value_or(MemoryType::Fact));
}

} // namespace omc::memory
