#include "litevox/packed_array.hpp"

#include <stdexcept>
#include <string>

namespace litevox {

namespace {

constexpr uint64_t lowMask(int bits) {
    return bits >= 64 ? ~0ULL : (1ULL << bits) - 1;
}

struct FieldLocation {
    size_t word;
    int bit;
};

FieldLocation locate(size_t wordCount, uint64_t fieldIndex, int bitsPerField) {
    if (bitsPerField < 1 || bitsPerField > 64) {
        throw std::invalid_argument("Packed field width must be 1-64 bits, got " +
                                    std::to_string(bitsPerField));
    }
    uint64_t offset = fieldIndex * static_cast<uint64_t>(bitsPerField);
    uint64_t word = offset / 64;
    if (word >= wordCount) {
        throw std::out_of_range("Packed field " + std::to_string(fieldIndex) +
                                " starts past the end of a " + std::to_string(wordCount) +
                                "-word array");
    }
    return {static_cast<size_t>(word), static_cast<int>(offset % 64)};
}

}  // namespace

uint64_t getField(std::span<const int64_t> words, uint64_t fieldIndex, int bitsPerField) {
    auto [w, bit] = locate(words.size(), fieldIndex, bitsPerField);

    uint64_t value = static_cast<uint64_t>(words[w]) >> bit;

    // High part continues in the low bits of the next word
    if (bit + bitsPerField > 64 && w + 1 < words.size()) {
        value |= static_cast<uint64_t>(words[w + 1]) << (64 - bit);
    }

    return value & lowMask(bitsPerField);
}

void setField(std::span<int64_t> words, uint64_t fieldIndex, int bitsPerField, uint64_t value) {
    auto [w, bit] = locate(words.size(), fieldIndex, bitsPerField);

    const uint64_t mask = lowMask(bitsPerField);
    value &= mask;

    uint64_t low = static_cast<uint64_t>(words[w]);
    low = (low & ~(mask << bit)) | (value << bit);
    words[w] = static_cast<int64_t>(low);

    if (bit + bitsPerField > 64 && w + 1 < words.size()) {
        int highBits = bit + bitsPerField - 64;
        uint64_t highMask = lowMask(highBits);
        uint64_t high = static_cast<uint64_t>(words[w + 1]);
        high = (high & ~highMask) | (value >> (64 - bit));
        words[w + 1] = static_cast<int64_t>(high);
    }
}

}  // namespace litevox
