#pragma once

/**
 * @file nbt.hpp
 * @brief In-memory NBT tag tree
 *
 * Tags are move-only (lists and compounds own their children through
 * unique_ptr); use clone() for a deep copy. Equality is deep, bitwise for
 * floating point values, and ignores the order of compound entries.
 *
 * NbtCompound keeps insertion order, which makes written documents stable.
 */

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace litevox {

// Tag ids as they appear on the wire
enum class NbtType : uint8_t {
    End = 0,
    Byte = 1,
    Short = 2,
    Int = 3,
    Long = 4,
    Float = 5,
    Double = 6,
    ByteArray = 7,
    String = 8,
    List = 9,
    Compound = 10,
    IntArray = 11,
    LongArray = 12,
};

[[nodiscard]] std::string_view nbtTypeName(NbtType type);

// ============================================================================
// NbtError
// ============================================================================

class NbtError : public std::runtime_error {
public:
    enum class Kind : uint8_t {
        Malformed,     ///< Byte stream is not valid (compressed) NBT
        MissingField,  ///< Named field not present in a compound
        WrongType,     ///< Named field present with a different tag type
    };

    NbtError(Kind kind, const std::string& message, std::string field = {})
        : std::runtime_error(message), kind_(kind), field_(std::move(field)) {}

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] const std::string& field() const { return field_; }

private:
    Kind kind_;
    std::string field_;
};

class NbtList;
class NbtCompound;

// Variant index == NbtType value
using NbtValue = std::variant<
    std::monostate,
    int8_t,
    int16_t,
    int32_t,
    int64_t,
    float,
    double,
    std::vector<int8_t>,
    std::string,
    std::unique_ptr<NbtList>,
    std::unique_ptr<NbtCompound>,
    std::vector<int32_t>,
    std::vector<int64_t>
>;

// ============================================================================
// NbtTag
// ============================================================================

class NbtTag {
public:
    NbtTag() = default;
    NbtTag(int8_t v) : value_(v) {}
    NbtTag(int16_t v) : value_(v) {}
    NbtTag(int32_t v) : value_(v) {}
    NbtTag(int64_t v) : value_(v) {}
    NbtTag(float v) : value_(v) {}
    NbtTag(double v) : value_(v) {}
    NbtTag(std::string v) : value_(std::move(v)) {}
    NbtTag(const char* v) : value_(std::string(v)) {}
    NbtTag(std::vector<int8_t> v) : value_(std::move(v)) {}
    NbtTag(std::vector<int32_t> v) : value_(std::move(v)) {}
    NbtTag(std::vector<int64_t> v) : value_(std::move(v)) {}
    NbtTag(NbtList list);
    NbtTag(NbtCompound compound);

    NbtTag(NbtTag&&) noexcept = default;
    NbtTag& operator=(NbtTag&&) noexcept = default;
    NbtTag(const NbtTag&) = delete;
    NbtTag& operator=(const NbtTag&) = delete;
    ~NbtTag();

    [[nodiscard]] NbtTag clone() const;

    [[nodiscard]] NbtType type() const { return static_cast<NbtType>(value_.index()); }

    /// Primitive or array payload, nullptr if the tag holds another type
    template<typename T>
    [[nodiscard]] const T* getIf() const { return std::get_if<T>(&value_); }

    template<typename T>
    [[nodiscard]] T* getIf() { return std::get_if<T>(&value_); }

    [[nodiscard]] const NbtList* asList() const;
    [[nodiscard]] NbtList* asList();
    [[nodiscard]] const NbtCompound* asCompound() const;
    [[nodiscard]] NbtCompound* asCompound();

    [[nodiscard]] const NbtValue& value() const { return value_; }

    bool operator==(const NbtTag& other) const;
    bool operator!=(const NbtTag& other) const { return !(*this == other); }

private:
    NbtValue value_;
};

// ============================================================================
// NbtList - homogeneous sequence of tags
// ============================================================================

class NbtList {
public:
    NbtList() = default;
    explicit NbtList(NbtType elementType) : elementType_(elementType) {}

    NbtList(NbtList&&) noexcept = default;
    NbtList& operator=(NbtList&&) noexcept = default;
    NbtList(const NbtList&) = delete;
    NbtList& operator=(const NbtList&) = delete;

    [[nodiscard]] NbtList clone() const;

    /// Element type; End for a list that has never held anything
    [[nodiscard]] NbtType elementType() const { return elementType_; }

    /// Append. The first element fixes the type of an untyped list;
    /// a mismatching element throws NbtError (WrongType).
    void push(NbtTag tag);

    [[nodiscard]] size_t size() const { return items_.size(); }
    [[nodiscard]] bool empty() const { return items_.empty(); }

    [[nodiscard]] const NbtTag& operator[](size_t index) const { return items_[index]; }
    [[nodiscard]] NbtTag& operator[](size_t index) { return items_[index]; }

    [[nodiscard]] auto begin() const { return items_.begin(); }
    [[nodiscard]] auto end() const { return items_.end(); }

    bool operator==(const NbtList& other) const;

private:
    NbtType elementType_ = NbtType::End;
    std::vector<NbtTag> items_;
};

// ============================================================================
// NbtCompound - named tags in insertion order
// ============================================================================

class NbtCompound {
public:
    using Entry = std::pair<std::string, NbtTag>;

    NbtCompound() = default;

    NbtCompound(NbtCompound&&) noexcept = default;
    NbtCompound& operator=(NbtCompound&&) noexcept = default;
    NbtCompound(const NbtCompound&) = delete;
    NbtCompound& operator=(const NbtCompound&) = delete;

    [[nodiscard]] NbtCompound clone() const;

    /// Insert or replace (a replaced entry keeps its position)
    void insert(std::string name, NbtTag value);

    /// Remove an entry (no-op if absent). Returns true if something was removed.
    bool remove(std::string_view name);

    [[nodiscard]] const NbtTag* find(std::string_view name) const;
    [[nodiscard]] NbtTag* find(std::string_view name);
    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }

    // ---- Required fields (throw NbtError naming the field) ----

    [[nodiscard]] int8_t getByte(std::string_view name) const;
    [[nodiscard]] int16_t getShort(std::string_view name) const;
    [[nodiscard]] int32_t getInt(std::string_view name) const;
    [[nodiscard]] int64_t getLong(std::string_view name) const;
    [[nodiscard]] float getFloat(std::string_view name) const;
    [[nodiscard]] double getDouble(std::string_view name) const;
    [[nodiscard]] const std::string& getString(std::string_view name) const;
    [[nodiscard]] const std::vector<int8_t>& getByteArray(std::string_view name) const;
    [[nodiscard]] const std::vector<int32_t>& getIntArray(std::string_view name) const;
    [[nodiscard]] const std::vector<int64_t>& getLongArray(std::string_view name) const;
    [[nodiscard]] const NbtList& getList(std::string_view name) const;
    [[nodiscard]] const NbtCompound& getCompound(std::string_view name) const;

    // ---- Optional fields (nullptr if absent or of another type) ----

    [[nodiscard]] const NbtList* findList(std::string_view name) const;
    [[nodiscard]] const NbtCompound* findCompound(std::string_view name) const;

    bool operator==(const NbtCompound& other) const;

private:
    [[nodiscard]] const NbtTag& require(std::string_view name, NbtType expected) const;

    std::vector<Entry> entries_;
};

}  // namespace litevox
