#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace blockship::block {

/**
 * @brief Universally unique lexicographically sortable identifier
 *
 * 128 bits: a 48-bit big-endian millisecond timestamp followed by 80 bits of
 * entropy. The canonical text form is 26 characters of Crockford base32,
 * so the string order of two ids matches their creation order. Every block
 * directory is named by its id.
 */
class Ulid {
public:
    static constexpr std::size_t kEncodedSize = 26;
    static constexpr std::size_t kEntropySize = 10;

    Ulid() = default;

    /// Parse the 26-character text form. Lower case letters are accepted.
    static std::optional<Ulid> parse(std::string_view text);

    static Ulid from_parts(std::uint64_t timestamp_ms,
                           const std::array<std::uint8_t, kEntropySize>& entropy);

    std::uint64_t timestamp_ms() const noexcept;
    std::string to_string() const;

    const std::array<std::uint8_t, 16>& bytes() const noexcept { return bytes_; }

    bool operator==(const Ulid& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const Ulid& other) const noexcept { return bytes_ != other.bytes_; }
    bool operator<(const Ulid& other) const noexcept { return bytes_ < other.bytes_; }

private:
    std::array<std::uint8_t, 16> bytes_{};
};

} // namespace blockship::block

namespace std {

template<>
struct hash<blockship::block::Ulid> {
    std::size_t operator()(const blockship::block::Ulid& id) const noexcept {
        std::size_t h = 0xcbf29ce484222325ULL;
        for (auto byte : id.bytes()) {
            h ^= byte;
            h *= 0x100000001b3ULL;
        }
        return h;
    }
};

} // namespace std
