#pragma once

/**
 * @file error.hpp
 * @brief Exceptions raised while decoding schematic documents
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace litevox {

class NbtError;

enum class ErrorKind : uint8_t {
    MalformedDocument,    ///< Tree decode or decompression failed
    UnsupportedVersion,   ///< Root Version field is not the supported one
    MissingField,         ///< A required named field is absent
    WrongType,            ///< A named field has an unexpected tag type
    MalformedBlockState,  ///< A palette entry is not a valid block state
    Unknown,
};

[[nodiscard]] std::string_view errorKindName(ErrorKind kind);

/// Single error type reported to callers of the schematic codec. Carries the
/// kind and, where one applies, the name of the offending field.
class SchematicError : public std::runtime_error {
public:
    SchematicError(ErrorKind kind, const std::string& message, std::string field = {})
        : std::runtime_error(message), kind_(kind), field_(std::move(field)) {}

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    [[nodiscard]] const std::string& field() const { return field_; }

private:
    ErrorKind kind_;
    std::string field_;
};

class UnsupportedVersionError : public SchematicError {
public:
    explicit UnsupportedVersionError(int32_t version)
        : SchematicError(ErrorKind::UnsupportedVersion,
                         "Schematic uses version " + std::to_string(version) +
                             ", which is unsupported",
                         "Version"),
          version_(version) {}

    [[nodiscard]] int32_t version() const { return version_; }

private:
    int32_t version_;
};

/// Map an NBT access or decode failure onto the schematic error kinds,
/// keeping the field name. A non-empty context prefixes the message.
[[nodiscard]] SchematicError toSchematicError(const NbtError& error, std::string_view context = {});

}  // namespace litevox
