#include "RegisterTypes.h"

#include "DecodedValue.h"

namespace registers {

namespace {

struct TypeName {
    const char* name;
    RegisterType type;
};

constexpr TypeName kTypeNames[] = {
    {"uint16", RegisterType::UInt16},
    {"int16", RegisterType::Int16},
    {"bool16", RegisterType::Bool16},
    {"enum16", RegisterType::Enum16},
    {"bitmask16", RegisterType::Bitmask16},
    {"command16", RegisterType::Command16},
    {"uint32", RegisterType::UInt32},
    {"int32", RegisterType::Int32},
    {"ip32", RegisterType::Ip32},
    {"mac48", RegisterType::Mac48},
    {"ascii", RegisterType::Ascii},
};

} // namespace

const RegisterDescriptor* RegisterMap::find(const std::string& name) const {
    for (const auto& descriptor : registers) {
        if (descriptor.name == name) {
            return &descriptor;
        }
    }
    return nullptr;
}

bool parseRegisterType(const std::string& name, RegisterType& type) {
    for (const auto& entry : kTypeNames) {
        if (name == entry.name) {
            type = entry.type;
            return true;
        }
    }
    return false;
}

std::string registerTypeToString(RegisterType type) {
    for (const auto& entry : kTypeNames) {
        if (entry.type == type) {
            return entry.name;
        }
    }
    return "unsupported";
}

bool isNumericType(RegisterType type) noexcept {
    switch (type) {
        case RegisterType::UInt16:
        case RegisterType::Int16:
        case RegisterType::Command16:
        case RegisterType::UInt32:
        case RegisterType::Int32:
            return true;
        default:
            return false;
    }
}

bool isSignedType(RegisterType type) noexcept {
    return type == RegisterType::Int16 || type == RegisterType::Int32;
}

std::uint16_t impliedWordCount(RegisterType type) noexcept {
    switch (type) {
        case RegisterType::UInt32:
        case RegisterType::Int32:
        case RegisterType::Ip32:
            return 2;
        case RegisterType::Mac48:
            return 3;
        case RegisterType::Ascii:
        case RegisterType::Unsupported:
            return 0;
        default:
            return 1;
    }
}

const char* endiannessToString(Endianness endianness) noexcept {
    return endianness == Endianness::Big ? "big" : "little";
}

const DecodedValue* findValue(const ValueMap& values, const std::string& name) {
    for (const auto& entry : values) {
        if (entry.name == name) {
            return &entry.value;
        }
    }
    return nullptr;
}

std::optional<double> numericValue(const DecodedValue& value) {
    if (const auto* number = std::get_if<double>(&value)) {
        return *number;
    }
    return std::nullopt;
}

const char* errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Transport:
            return "transport";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::DeviceException:
            return "device_exception";
        case ErrorKind::Framing:
            return "framing";
        case ErrorKind::UnsupportedType:
            return "unsupported_type";
        case ErrorKind::Decode:
            return "decode";
    }
    return "decode";
}

bool isLinkError(ErrorKind kind) noexcept {
    return kind == ErrorKind::Transport || kind == ErrorKind::Timeout || kind == ErrorKind::Framing;
}

} // namespace registers
