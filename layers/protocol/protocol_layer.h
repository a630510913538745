#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "ModbusTypes.h"

namespace protocol {

// Raised for any RTU frame that cannot be trusted: bad CRC, foreign slave id,
// wrong function echo or truncated payload.
class FrameError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RtuFrameCodec {
public:
    // Exception response: slave + function|0x80 + code + crc(2)
    static constexpr std::size_t kExceptionFrameSize = 5;
    static constexpr std::size_t kHeaderSize = 2;

    // Полный RTU фрейм: PDU с адресом ведомого и CRC (младший байт первым)
    std::vector<std::uint8_t> createFrame(const ModbusRequest& request) const;

    // Size of a normal (non-exception) response to the request, CRC included.
    std::size_t expectedResponseSize(const ModbusRequest& request) const;

    // Validates a complete response frame against the request that produced it.
    // Exception responses are returned with isException set, everything else
    // that does not match throws FrameError.
    ModbusResponse parseResponse(const std::vector<std::uint8_t>& frame, const ModbusRequest& request) const;

    static std::uint16_t crc16(const std::uint8_t* data, std::size_t size);
    static std::uint16_t crc16(const std::vector<std::uint8_t>& data);

    static std::string functionToString(FunctionCode code);
    static bool parseFunction(const std::string& name, FunctionCode& code);
    static bool functionFromCode(int raw, FunctionCode& code);
    static bool isReadFunction(FunctionCode code) noexcept;
    static bool isWriteFunction(FunctionCode code) noexcept;

    static std::string exceptionToString(std::uint8_t exceptionCode);

private:
    std::vector<std::uint8_t> createPdu(const ModbusRequest& request) const;
};

} // namespace protocol
