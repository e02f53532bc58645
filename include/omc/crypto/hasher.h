#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace omc::crypto {

// Incremental SHA-256 over arbitrary byte sequences. Used for cache keys.
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init();
    void update(std::span<const std::byte> data);
    void update(std::string_view text);

    // Little-endian IEEE-754 bytes of each float
    void update(std::span<const float> values);

    // Returns the lowercase hex digest and resets the hasher
    std::string finalize();

    // Static utility for one-shot hashing
    static std::string hash(std::span<const std::byte> data);
    static std::string hash(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace omc::crypto
