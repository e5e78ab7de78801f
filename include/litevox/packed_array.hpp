#pragma once

/**
 * @file packed_array.hpp
 * @brief Fixed-width unsigned fields packed into 64-bit words
 *
 * Fields are laid out back to back starting at bit 0 of word 0. A field's
 * width need not divide 64, so a field may start near the top of one word
 * and continue in the low bits of the next. Reading treats the two words as
 * one little-endian 128-bit window; the last word has no successor and is
 * read alone.
 *
 * Words are stored as int64_t to match the NBT long-array representation;
 * all bit arithmetic is done on the unsigned reinterpretation.
 */

#include <cstdint>
#include <span>

namespace litevox {

/// Minimum field width able to hold every index in [0, paletteSize).
/// Never less than 2, so palettes of 0, 1 or 2 entries all use 2 bits.
[[nodiscard]] constexpr int requiredBits(uint64_t paletteSize) {
    if (paletteSize <= 2) return 2;
    // ceil(log2(n)) == bit length of (n - 1)
    int bits = 64 - __builtin_clzll(paletteSize - 1);
    return bits < 2 ? 2 : bits;
}

/// Number of 64-bit words needed to hold fieldCount fields of the given width
[[nodiscard]] constexpr uint64_t requiredWordCount(uint64_t fieldCount, int bitsPerField) {
    return (fieldCount * static_cast<uint64_t>(bitsPerField) + 63) / 64;
}

/// Number of whole fields that fit in wordCount words
[[nodiscard]] constexpr uint64_t fieldCapacity(uint64_t wordCount, int bitsPerField) {
    return wordCount * 64 / static_cast<uint64_t>(bitsPerField);
}

/// Read field fieldIndex. Throws std::out_of_range if the field's first
/// word is past the end of the array, std::invalid_argument for a width
/// outside [1, 64].
[[nodiscard]] uint64_t getField(std::span<const int64_t> words, uint64_t fieldIndex, int bitsPerField);

/// Overwrite field fieldIndex with the low bitsPerField bits of value.
/// Bits belonging to any other field are left untouched. Same failure
/// conditions as getField.
void setField(std::span<int64_t> words, uint64_t fieldIndex, int bitsPerField, uint64_t value);

}  // namespace litevox
