#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "layers/protocol/ModbusTypes.h"

namespace registers {

enum class RegisterType {
    UInt16,
    Int16,
    Bool16,
    Enum16,
    Bitmask16,
    Command16,
    UInt32,
    Int32,
    Ip32,
    Mac48,
    Ascii,
    Unsupported
};

enum class Endianness {
    Big,   // first word read is the high half
    Little
};

// Raw value (enum16) or bit mask (bitmask16) to label, in document order.
using SymbolMap = std::vector<std::pair<std::uint16_t, std::string>>;

struct RegisterDescriptor {
    std::string name;
    RegisterType type = RegisterType::UInt16;
    std::string typeName = "uint16";
    std::uint16_t address = 0;
    protocol::FunctionCode function = protocol::FunctionCode::ReadHoldingRegisters;
    protocol::FunctionCode writeFunction = protocol::FunctionCode::WriteSingleRegister;
    double scale = 1.0;
    std::uint16_t wordCount = 1;
    SymbolMap symbolMap;
    std::optional<double> minimum; // engineering units, write path only
    std::optional<double> maximum;
    std::string unit;
    bool writable = true;
};

struct RegisterMap {
    std::uint8_t slaveId = 1;
    Endianness endianness = Endianness::Big;
    RegisterDescriptor probe;
    std::vector<RegisterDescriptor> registers;

    const RegisterDescriptor* find(const std::string& name) const;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

bool parseRegisterType(const std::string& name, RegisterType& type);
std::string registerTypeToString(RegisterType type);
bool isNumericType(RegisterType type) noexcept;
bool isSignedType(RegisterType type) noexcept;

// Words consumed by a type; ascii and unsupported descriptors use their explicit count.
std::uint16_t impliedWordCount(RegisterType type) noexcept;

const char* endiannessToString(Endianness endianness) noexcept;

} // namespace registers
