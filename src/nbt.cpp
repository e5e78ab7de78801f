#include "litevox/nbt.hpp"

#include <algorithm>
#include <bit>
#include <type_traits>

namespace litevox {

std::string_view nbtTypeName(NbtType type) {
    switch (type) {
        case NbtType::End: return "End";
        case NbtType::Byte: return "Byte";
        case NbtType::Short: return "Short";
        case NbtType::Int: return "Int";
        case NbtType::Long: return "Long";
        case NbtType::Float: return "Float";
        case NbtType::Double: return "Double";
        case NbtType::ByteArray: return "ByteArray";
        case NbtType::String: return "String";
        case NbtType::List: return "List";
        case NbtType::Compound: return "Compound";
        case NbtType::IntArray: return "IntArray";
        case NbtType::LongArray: return "LongArray";
    }
    return "Unknown";
}

// ============================================================================
// NbtTag
// ============================================================================

NbtTag::NbtTag(NbtList list)
    : value_(std::make_unique<NbtList>(std::move(list))) {}

NbtTag::NbtTag(NbtCompound compound)
    : value_(std::make_unique<NbtCompound>(std::move(compound))) {}

NbtTag::~NbtTag() = default;

NbtTag NbtTag::clone() const {
    NbtTag result;
    std::visit([&result](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::unique_ptr<NbtList>>) {
            result.value_ = std::make_unique<NbtList>(v->clone());
        } else if constexpr (std::is_same_v<T, std::unique_ptr<NbtCompound>>) {
            result.value_ = std::make_unique<NbtCompound>(v->clone());
        } else {
            result.value_.template emplace<T>(v);
        }
    }, value_);
    return result;
}

const NbtList* NbtTag::asList() const {
    auto* p = std::get_if<std::unique_ptr<NbtList>>(&value_);
    return p ? p->get() : nullptr;
}

NbtList* NbtTag::asList() {
    auto* p = std::get_if<std::unique_ptr<NbtList>>(&value_);
    return p ? p->get() : nullptr;
}

const NbtCompound* NbtTag::asCompound() const {
    auto* p = std::get_if<std::unique_ptr<NbtCompound>>(&value_);
    return p ? p->get() : nullptr;
}

NbtCompound* NbtTag::asCompound() {
    auto* p = std::get_if<std::unique_ptr<NbtCompound>>(&value_);
    return p ? p->get() : nullptr;
}

bool NbtTag::operator==(const NbtTag& other) const {
    if (value_.index() != other.value_.index()) {
        return false;
    }
    return std::visit([&other](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        const T& w = std::get<T>(other.value_);
        if constexpr (std::is_same_v<T, std::unique_ptr<NbtList>> ||
                      std::is_same_v<T, std::unique_ptr<NbtCompound>>) {
            return *v == *w;
        } else if constexpr (std::is_same_v<T, float>) {
            return std::bit_cast<uint32_t>(v) == std::bit_cast<uint32_t>(w);
        } else if constexpr (std::is_same_v<T, double>) {
            return std::bit_cast<uint64_t>(v) == std::bit_cast<uint64_t>(w);
        } else {
            return v == w;
        }
    }, value_);
}

// ============================================================================
// NbtList
// ============================================================================

NbtList NbtList::clone() const {
    NbtList result(elementType_);
    result.items_.reserve(items_.size());
    for (const auto& item : items_) {
        result.items_.push_back(item.clone());
    }
    return result;
}

void NbtList::push(NbtTag tag) {
    if (tag.type() == NbtType::End) {
        throw NbtError(NbtError::Kind::WrongType, "Cannot store an End tag in a list");
    }
    if (elementType_ == NbtType::End) {
        elementType_ = tag.type();
    } else if (tag.type() != elementType_) {
        throw NbtError(NbtError::Kind::WrongType,
                       "List of " + std::string(nbtTypeName(elementType_)) +
                           " cannot hold a " + std::string(nbtTypeName(tag.type())));
    }
    items_.push_back(std::move(tag));
}

bool NbtList::operator==(const NbtList& other) const {
    return elementType_ == other.elementType_ && items_ == other.items_;
}

// ============================================================================
// NbtCompound
// ============================================================================

NbtCompound NbtCompound::clone() const {
    NbtCompound result;
    result.entries_.reserve(entries_.size());
    for (const auto& [name, tag] : entries_) {
        result.entries_.emplace_back(name, tag.clone());
    }
    return result;
}

void NbtCompound::insert(std::string name, NbtTag value) {
    if (NbtTag* existing = find(name)) {
        *existing = std::move(value);
        return;
    }
    entries_.emplace_back(std::move(name), std::move(value));
}

bool NbtCompound::remove(std::string_view name) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const Entry& e) { return e.first == name; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

const NbtTag* NbtCompound::find(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (entry.first == name) return &entry.second;
    }
    return nullptr;
}

NbtTag* NbtCompound::find(std::string_view name) {
    for (auto& entry : entries_) {
        if (entry.first == name) return &entry.second;
    }
    return nullptr;
}

const NbtTag& NbtCompound::require(std::string_view name, NbtType expected) const {
    const NbtTag* tag = find(name);
    if (!tag) {
        throw NbtError(NbtError::Kind::MissingField,
                       "Missing field '" + std::string(name) + "'", std::string(name));
    }
    if (tag->type() != expected) {
        throw NbtError(NbtError::Kind::WrongType,
                       "Field '" + std::string(name) + "' is " +
                           std::string(nbtTypeName(tag->type())) + ", expected " +
                           std::string(nbtTypeName(expected)),
                       std::string(name));
    }
    return *tag;
}

int8_t NbtCompound::getByte(std::string_view name) const {
    return *require(name, NbtType::Byte).getIf<int8_t>();
}

int16_t NbtCompound::getShort(std::string_view name) const {
    return *require(name, NbtType::Short).getIf<int16_t>();
}

int32_t NbtCompound::getInt(std::string_view name) const {
    return *require(name, NbtType::Int).getIf<int32_t>();
}

int64_t NbtCompound::getLong(std::string_view name) const {
    return *require(name, NbtType::Long).getIf<int64_t>();
}

float NbtCompound::getFloat(std::string_view name) const {
    return *require(name, NbtType::Float).getIf<float>();
}

double NbtCompound::getDouble(std::string_view name) const {
    return *require(name, NbtType::Double).getIf<double>();
}

const std::string& NbtCompound::getString(std::string_view name) const {
    return *require(name, NbtType::String).getIf<std::string>();
}

const std::vector<int8_t>& NbtCompound::getByteArray(std::string_view name) const {
    return *require(name, NbtType::ByteArray).getIf<std::vector<int8_t>>();
}

const std::vector<int32_t>& NbtCompound::getIntArray(std::string_view name) const {
    return *require(name, NbtType::IntArray).getIf<std::vector<int32_t>>();
}

const std::vector<int64_t>& NbtCompound::getLongArray(std::string_view name) const {
    return *require(name, NbtType::LongArray).getIf<std::vector<int64_t>>();
}

const NbtList& NbtCompound::getList(std::string_view name) const {
    return *require(name, NbtType::List).asList();
}

const NbtCompound& NbtCompound::getCompound(std::string_view name) const {
    return *require(name, NbtType::Compound).asCompound();
}

const NbtList* NbtCompound::findList(std::string_view name) const {
    const NbtTag* tag = find(name);
    return tag ? tag->asList() : nullptr;
}

const NbtCompound* NbtCompound::findCompound(std::string_view name) const {
    const NbtTag* tag = find(name);
    return tag ? tag->asCompound() : nullptr;
}

bool NbtCompound::operator==(const NbtCompound& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    // Order-insensitive: compounds are keyed, not sequenced
    for (const auto& [name, tag] : entries_) {
        const NbtTag* theirs = other.find(name);
        if (!theirs || *theirs != tag) {
            return false;
        }
    }
    return true;
}

}  // namespace litevox
