#pragma once

#include <cstdint>
#include <cstdio>
#include <random>
#include <sstream>
#include <string>

namespace omc::core {

/**
 * Generate a UUID v4 string (xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx).
 */
inline std::string generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng);
    uint64_t b = dist(rng);

    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF), static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0x0000FFFFFFFFFFFFull));
    return std::string(buf);
}

/**
 * Generate a prefixed short id: prefix + "_" + first 12 hex chars of a UUID v4.
 * Used for memories (mem_), entities (ent_) and contexts (ctx_).
 */
inline std::string generatePrefixedId(const std::string& prefix) {
    std::string uuid = generateUUID();
    std::string hex;
    hex.reserve(12);
    for (char c : uuid) {
        if (c == '-')
            continue;
        hex.push_back(c);
        if (hex.size() == 12)
            break;
    }
    return prefix + "_" + hex;
}

inline std::string generateMemoryId() {
    return generatePrefixedId("mem");
}

inline std::string generateEntityId() {
    return generatePrefixedId("ent");
}

inline std::string generateContextId() {
    return generatePrefixedId("ctx");
}

/**
 * Chunk ids are derived, never random: parent + "_chunk_" + position.
 */
inline std::string makeChunkId(const std::string& parentMemoryId, size_t position) {
    return parentMemoryId + "_chunk_" + std::to_string(position);
}

/**
 * FNV-1a 64-bit short hash, returning lower 32 bits as hex string.
 */
inline std::string shortHash(const std::string& s) {
    std::uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= static_cast<std::uint64_t>(c);
        h *= 1099511628211ull;
    }
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << (h & 0xffffffffull);
    return oss.str();
}

} // namespace omc::core
