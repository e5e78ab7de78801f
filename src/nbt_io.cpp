#include "litevox/nbt_io.hpp"

#include <bit>
#include <limits>

namespace litevox {

namespace {

[[noreturn]] void malformed(const std::string& message) {
    throw NbtError(NbtError::Kind::Malformed, "Invalid NBT data: " + message);
}

// ============================================================================
// Encoding
// ============================================================================

class Encoder {
public:
    explicit Encoder(std::vector<uint8_t>& out) : out_(out) {}

    void writeU8(uint8_t value) { out_.push_back(value); }

    void writeI16(int16_t value) { writeBE(static_cast<uint16_t>(value), 2); }
    void writeI32(int32_t value) { writeBE(static_cast<uint32_t>(value), 4); }
    void writeI64(int64_t value) { writeBE(static_cast<uint64_t>(value), 8); }

    void writeString(std::string_view str) {
        if (str.size() > std::numeric_limits<uint16_t>::max()) {
            throw NbtError(NbtError::Kind::Malformed, "NBT string longer than 65535 bytes");
        }
        writeBE(str.size(), 2);
        out_.insert(out_.end(), str.begin(), str.end());
    }

    void writePayload(const NbtTag& tag);
    void writeCompound(const NbtCompound& compound);
    void writeList(const NbtList& list);

private:
    void writeBE(uint64_t value, int bytes) {
        for (int i = bytes - 1; i >= 0; --i) {
            out_.push_back(static_cast<uint8_t>(value >> (i * 8)));
        }
    }

    void writeLength(size_t size) {
        if (size > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
            throw NbtError(NbtError::Kind::Malformed, "NBT array or list too long");
        }
        writeI32(static_cast<int32_t>(size));
    }

    std::vector<uint8_t>& out_;
};

void Encoder::writeCompound(const NbtCompound& compound) {
    for (const auto& [name, tag] : compound) {
        writeU8(static_cast<uint8_t>(tag.type()));
        writeString(name);
        writePayload(tag);
    }
    writeU8(static_cast<uint8_t>(NbtType::End));
}

void Encoder::writeList(const NbtList& list) {
    writeU8(static_cast<uint8_t>(list.elementType()));
    writeLength(list.size());
    for (const auto& item : list) {
        writePayload(item);
    }
}

void Encoder::writePayload(const NbtTag& tag) {
    switch (tag.type()) {
        case NbtType::End:
            break;
        case NbtType::Byte:
            writeU8(static_cast<uint8_t>(*tag.getIf<int8_t>()));
            break;
        case NbtType::Short:
            writeI16(*tag.getIf<int16_t>());
            break;
        case NbtType::Int:
            writeI32(*tag.getIf<int32_t>());
            break;
        case NbtType::Long:
            writeI64(*tag.getIf<int64_t>());
            break;
        case NbtType::Float:
            writeBE(std::bit_cast<uint32_t>(*tag.getIf<float>()), 4);
            break;
        case NbtType::Double:
            writeBE(std::bit_cast<uint64_t>(*tag.getIf<double>()), 8);
            break;
        case NbtType::ByteArray: {
            const auto& bytes = *tag.getIf<std::vector<int8_t>>();
            writeLength(bytes.size());
            for (int8_t b : bytes) writeU8(static_cast<uint8_t>(b));
            break;
        }
        case NbtType::String:
            writeString(*tag.getIf<std::string>());
            break;
        case NbtType::List:
            writeList(*tag.asList());
            break;
        case NbtType::Compound:
            writeCompound(*tag.asCompound());
            break;
        case NbtType::IntArray: {
            const auto& ints = *tag.getIf<std::vector<int32_t>>();
            writeLength(ints.size());
            for (int32_t v : ints) writeI32(v);
            break;
        }
        case NbtType::LongArray: {
            const auto& longs = *tag.getIf<std::vector<int64_t>>();
            writeLength(longs.size());
            for (int64_t v : longs) writeI64(v);
            break;
        }
    }
}

// ============================================================================
// Decoding
// ============================================================================

class Decoder {
public:
    explicit Decoder(std::span<const uint8_t> data) : data_(data) {}

    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }

    uint8_t readU8() {
        ensure(1);
        return data_[pos_++];
    }

    int16_t readI16() { return static_cast<int16_t>(readBE(2)); }
    int32_t readI32() { return static_cast<int32_t>(readBE(4)); }
    int64_t readI64() { return static_cast<int64_t>(readBE(8)); }

    std::string readString() {
        size_t length = static_cast<size_t>(readBE(2));
        ensure(length);
        std::string result(reinterpret_cast<const char*>(data_.data() + pos_), length);
        pos_ += length;
        return result;
    }

    NbtTag readPayload(NbtType type, int depth);
    NbtCompound readCompound(int depth);
    NbtList readList(int depth);

private:
    void ensure(size_t len) const {
        if (len > remaining()) {
            malformed("unexpected end of data at offset " + std::to_string(pos_));
        }
    }

    uint64_t readBE(int bytes) {
        ensure(static_cast<size_t>(bytes));
        uint64_t value = 0;
        for (int i = 0; i < bytes; ++i) {
            value = (value << 8) | data_[pos_++];
        }
        return value;
    }

    // Array/list lengths are signed on the wire; each element needs at
    // least minElementSize bytes, which bounds allocations on corrupt input.
    size_t readLength(size_t minElementSize) {
        int32_t length = readI32();
        if (length < 0) {
            malformed("negative length " + std::to_string(length));
        }
        if (minElementSize > 0 && static_cast<size_t>(length) > remaining() / minElementSize) {
            malformed("length " + std::to_string(length) + " exceeds remaining data");
        }
        return static_cast<size_t>(length);
    }

    static NbtType toType(uint8_t id) {
        if (id > static_cast<uint8_t>(NbtType::LongArray)) {
            malformed("unknown tag id " + std::to_string(id));
        }
        return static_cast<NbtType>(id);
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

NbtCompound Decoder::readCompound(int depth) {
    if (depth > MAX_NBT_DEPTH) {
        malformed("nesting deeper than " + std::to_string(MAX_NBT_DEPTH));
    }
    NbtCompound compound;
    while (true) {
        NbtType type = toType(readU8());
        if (type == NbtType::End) {
            break;
        }
        std::string name = readString();
        compound.insert(std::move(name), readPayload(type, depth + 1));
    }
    return compound;
}

NbtList Decoder::readList(int depth) {
    if (depth > MAX_NBT_DEPTH) {
        malformed("nesting deeper than " + std::to_string(MAX_NBT_DEPTH));
    }
    NbtType elementType = toType(readU8());
    size_t count = readLength(elementType == NbtType::End ? 0 : 1);

    NbtList list(elementType);
    if (elementType == NbtType::End) {
        // Only an empty list may be untyped
        if (count != 0) {
            malformed("non-empty list of End tags");
        }
        return list;
    }
    for (size_t i = 0; i < count; ++i) {
        list.push(readPayload(elementType, depth + 1));
    }
    return list;
}

NbtTag Decoder::readPayload(NbtType type, int depth) {
    switch (type) {
        case NbtType::End:
            malformed("unexpected End tag");
        case NbtType::Byte:
            return NbtTag(static_cast<int8_t>(readU8()));
        case NbtType::Short:
            return NbtTag(readI16());
        case NbtType::Int:
            return NbtTag(readI32());
        case NbtType::Long:
            return NbtTag(readI64());
        case NbtType::Float:
            return NbtTag(std::bit_cast<float>(static_cast<uint32_t>(readBE(4))));
        case NbtType::Double:
            return NbtTag(std::bit_cast<double>(readBE(8)));
        case NbtType::ByteArray: {
            size_t length = readLength(1);
            std::vector<int8_t> bytes(length);
            for (auto& b : bytes) b = static_cast<int8_t>(readU8());
            return NbtTag(std::move(bytes));
        }
        case NbtType::String:
            return NbtTag(readString());
        case NbtType::List:
            return NbtTag(readList(depth));
        case NbtType::Compound:
            return NbtTag(readCompound(depth));
        case NbtType::IntArray: {
            size_t length = readLength(4);
            std::vector<int32_t> ints(length);
            for (auto& v : ints) v = readI32();
            return NbtTag(std::move(ints));
        }
        case NbtType::LongArray: {
            size_t length = readLength(8);
            std::vector<int64_t> longs(length);
            for (auto& v : longs) v = readI64();
            return NbtTag(std::move(longs));
        }
    }
    malformed("unknown tag type");
}

}  // namespace

std::vector<uint8_t> encodeNbt(const NbtCompound& root, std::string_view rootName) {
    std::vector<uint8_t> out;
    out.reserve(1024);

    Encoder encoder(out);
    encoder.writeU8(static_cast<uint8_t>(NbtType::Compound));
    encoder.writeString(rootName);
    encoder.writeCompound(root);
    return out;
}

NbtDocument decodeNbt(std::span<const uint8_t> data) {
    Decoder decoder(data);

    uint8_t rootType = decoder.readU8();
    if (rootType != static_cast<uint8_t>(NbtType::Compound)) {
        malformed("root tag is not a compound");
    }

    NbtDocument doc;
    doc.rootName = decoder.readString();
    doc.root = decoder.readCompound(0);
    return doc;
}

NbtDocument readNbt(std::span<const uint8_t> data, Compression compression) {
    std::vector<uint8_t> raw = decompress(data, compression);
    return decodeNbt(raw);
}

std::vector<uint8_t> writeNbt(const NbtCompound& root, std::string_view rootName,
                              Compression compression) {
    std::vector<uint8_t> raw = encodeNbt(root, rootName);
    return compress(raw, compression);
}

}  // namespace litevox
