#include "litevox/error.hpp"
#include "litevox/nbt.hpp"

namespace litevox {

std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedDocument: return "malformed document";
        case ErrorKind::UnsupportedVersion: return "unsupported version";
        case ErrorKind::MissingField: return "missing field";
        case ErrorKind::WrongType: return "wrong type";
        case ErrorKind::MalformedBlockState: return "malformed block state";
        case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

SchematicError toSchematicError(const NbtError& error, std::string_view context) {
    ErrorKind kind = ErrorKind::Unknown;
    switch (error.kind()) {
        case NbtError::Kind::Malformed: kind = ErrorKind::MalformedDocument; break;
        case NbtError::Kind::MissingField: kind = ErrorKind::MissingField; break;
        case NbtError::Kind::WrongType: kind = ErrorKind::WrongType; break;
    }

    std::string message;
    if (!context.empty()) {
        message.append(context);
        message.append(": ");
    }
    message.append(error.what());
    return SchematicError(kind, message, error.field());
}

}  // namespace litevox
