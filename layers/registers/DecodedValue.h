#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace registers {

enum class ErrorKind {
    Transport,
    Timeout,
    DeviceException,
    Framing,
    UnsupportedType,
    Decode
};

struct DecodeError {
    ErrorKind kind = ErrorKind::Decode;
    std::string message;
};

using FlagSet = std::vector<std::string>;

// bool: bool16; double: scaled numbers and unmapped enum values;
// string: enum labels, ascii, ip32, mac48; FlagSet: bitmask16.
using DecodedValue = std::variant<bool, double, std::string, FlagSet, DecodeError>;

struct NamedValue {
    std::string name;
    DecodedValue value;
};

// One entry per descriptor, in register-map order.
using ValueMap = std::vector<NamedValue>;

inline bool isError(const DecodedValue& value) {
    return std::holds_alternative<DecodeError>(value);
}

const DecodedValue* findValue(const ValueMap& values, const std::string& name);
std::optional<double> numericValue(const DecodedValue& value);
const char* errorKindToString(ErrorKind kind) noexcept;

// Transport-class errors say nothing about the register itself, only about the link.
bool isLinkError(ErrorKind kind) noexcept;

} // namespace registers
