#pragma once

#include <cstdint>
#include <vector>

namespace protocol {

enum class FunctionCode : std::uint8_t {
    ReadHoldingRegisters = 0x03,
    ReadInputRegisters = 0x04,
    WriteSingleRegister = 0x06,
    WriteMultipleRegisters = 0x10
};

struct ModbusRequest {
    std::uint8_t slaveId = 1;
    FunctionCode function = FunctionCode::ReadHoldingRegisters;
    std::uint16_t startAddress = 0;
    std::uint16_t count = 0;
    std::vector<std::uint16_t> values; // Для записей
};

struct ModbusResponse {
    std::uint8_t slaveId = 0;
    FunctionCode function = FunctionCode::ReadHoldingRegisters;
    std::vector<std::uint16_t> values;
    bool isException = false;
    std::uint8_t exceptionCode = 0;
};

} // namespace protocol
