#include "blockship/block/ulid.hpp"

namespace blockship::block {
namespace {

constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// 26 * 5 = 130 bits of text carry a 128-bit value: the first character only
// contributes its low 3 bits.
constexpr std::size_t kPadBits = 2;

int decode_char(char c) {
    if (c >= 'a' && c <= 'z') {
        c = static_cast<char>(c - 'a' + 'A');
    }
    for (int i = 0; i < 32; ++i) {
        if (kAlphabet[i] == c) {
            return i;
        }
    }
    return -1;
}

bool get_bit(const std::array<std::uint8_t, 16>& bytes, std::size_t bit) {
    return (bytes[bit / 8] >> (7 - bit % 8)) & 1U;
}

void set_bit(std::array<std::uint8_t, 16>& bytes, std::size_t bit) {
    bytes[bit / 8] |= static_cast<std::uint8_t>(1U << (7 - bit % 8));
}

} // namespace

std::optional<Ulid> Ulid::parse(std::string_view text) {
    if (text.size() != kEncodedSize) {
        return std::nullopt;
    }

    Ulid id;
    for (std::size_t i = 0; i < kEncodedSize; ++i) {
        const int value = decode_char(text[i]);
        if (value < 0) {
            return std::nullopt;
        }
        if (i == 0 && value > 7) {
            return std::nullopt; // overflows 128 bits
        }
        for (int b = 0; b < 5; ++b) {
            if (!((value >> (4 - b)) & 1)) {
                continue;
            }
            const std::size_t text_bit = i * 5 + static_cast<std::size_t>(b);
            if (text_bit >= kPadBits) {
                set_bit(id.bytes_, text_bit - kPadBits);
            }
        }
    }
    return id;
}

Ulid Ulid::from_parts(std::uint64_t timestamp_ms,
                      const std::array<std::uint8_t, kEntropySize>& entropy) {
    Ulid id;
    for (std::size_t i = 0; i < 6; ++i) {
        id.bytes_[i] = static_cast<std::uint8_t>(timestamp_ms >> (8 * (5 - i)));
    }
    for (std::size_t i = 0; i < kEntropySize; ++i) {
        id.bytes_[6 + i] = entropy[i];
    }
    return id;
}

std::uint64_t Ulid::timestamp_ms() const noexcept {
    std::uint64_t ts = 0;
    for (std::size_t i = 0; i < 6; ++i) {
        ts = (ts << 8) | bytes_[i];
    }
    return ts;
}

std::string Ulid::to_string() const {
    std::string out(kEncodedSize, '0');
    for (std::size_t i = 0; i < kEncodedSize; ++i) {
        int value = 0;
        for (int b = 0; b < 5; ++b) {
            const std::size_t text_bit = i * 5 + static_cast<std::size_t>(b);
            value <<= 1;
            if (text_bit >= kPadBits && get_bit(bytes_, text_bit - kPadBits)) {
                value |= 1;
            }
        }
        out[i] = kAlphabet[value];
    }
    return out;
}

} // namespace blockship::block
