#include "protocol_layer.h"

namespace protocol {

namespace {

std::uint16_t readBigEndian(const std::vector<std::uint8_t>& frame, std::size_t offset) {
    return static_cast<std::uint16_t>((frame[offset] << 8) | frame[offset + 1]);
}

} // namespace

std::vector<std::uint8_t> RtuFrameCodec::createFrame(const ModbusRequest& request) const {
    auto frame = createPdu(request);
    const auto crc = crc16(frame);
    frame.push_back(static_cast<std::uint8_t>(crc & 0xFF));
    frame.push_back(static_cast<std::uint8_t>((crc >> 8) & 0xFF));
    return frame;
}

std::size_t RtuFrameCodec::expectedResponseSize(const ModbusRequest& request) const {
    if (isReadFunction(request.function)) {
        return 3 + static_cast<std::size_t>(request.count) * 2 + 2; // slave + func + byteCount + data + crc(2)
    }
    return 8; // slave + func + addr(2) + qty/value(2) + crc(2)
}

ModbusResponse RtuFrameCodec::parseResponse(const std::vector<std::uint8_t>& frame,
                                            const ModbusRequest& request) const {
    if (frame.size() < kExceptionFrameSize) {
        throw FrameError("Frame too short: " + std::to_string(frame.size()) + " bytes");
    }

    const auto expected = static_cast<std::uint16_t>((frame[frame.size() - 1] << 8) | frame[frame.size() - 2]);
    const auto actual = crc16(frame.data(), frame.size() - 2);
    if (actual != expected) {
        throw FrameError("CRC mismatch");
    }

    if (frame[0] != request.slaveId) {
        throw FrameError("Response from unexpected slave " + std::to_string(frame[0]));
    }

    ModbusResponse response;
    response.slaveId = frame[0];
    response.function = request.function;

    const auto func = frame[1];
    if ((func & 0x80U) != 0U) {
        if ((func & 0x7FU) != static_cast<std::uint8_t>(request.function)) {
            throw FrameError("Exception for unexpected function " + std::to_string(func & 0x7FU));
        }
        response.isException = true;
        response.exceptionCode = frame[2];
        return response;
    }

    if (func != static_cast<std::uint8_t>(request.function)) {
        throw FrameError("Unexpected function in response: " + std::to_string(func));
    }

    if (frame.size() != expectedResponseSize(request)) {
        throw FrameError("Unexpected response length " + std::to_string(frame.size()));
    }

    if (isReadFunction(request.function)) {
        const std::size_t byteCount = frame[2];
        if (byteCount != static_cast<std::size_t>(request.count) * 2) {
            throw FrameError("Byte count " + std::to_string(byteCount) + " does not match request");
        }
        response.values.reserve(request.count);
        for (std::size_t i = 0; i < byteCount; i += 2) {
            response.values.push_back(readBigEndian(frame, 3 + i));
        }
        return response;
    }

    // Ответ на запись: эхо адреса и значения (0x06) или количества (0x10)
    const auto address = readBigEndian(frame, 2);
    const auto echoed = readBigEndian(frame, 4);
    if (address != request.startAddress) {
        throw FrameError("Write echo address mismatch");
    }
    if (request.function == FunctionCode::WriteSingleRegister) {
        const auto value = request.values.empty() ? 0 : request.values.front();
        if (echoed != value) {
            throw FrameError("Write echo value mismatch");
        }
    } else if (echoed != request.values.size()) {
        throw FrameError("Write echo quantity mismatch");
    }
    response.values = request.values;
    return response;
}

std::uint16_t RtuFrameCodec::crc16(const std::uint8_t* data, std::size_t size) {
    std::uint16_t crc = 0xFFFF;
    for (std::size_t n = 0; n < size; ++n) {
        crc ^= data[n];
        for (int i = 0; i < 8; ++i) {
            if ((crc & 0x01U) != 0U) {
                crc >>= 1;
                crc ^= 0xA001;
            } else {
                crc >>= 1;
            }
        }
    }
    return crc;
}

std::uint16_t RtuFrameCodec::crc16(const std::vector<std::uint8_t>& data) {
    return crc16(data.data(), data.size());
}

std::string RtuFrameCodec::functionToString(FunctionCode code) {
    switch (code) {
        case FunctionCode::ReadHoldingRegisters:
            return "read_holding";
        case FunctionCode::ReadInputRegisters:
            return "read_input";
        case FunctionCode::WriteSingleRegister:
            return "write_single";
        case FunctionCode::WriteMultipleRegisters:
            return "write_multiple";
    }
    return "unknown";
}

bool RtuFrameCodec::parseFunction(const std::string& name, FunctionCode& code) {
    if (name == "read_holding") {
        code = FunctionCode::ReadHoldingRegisters;
        return true;
    }
    if (name == "read_input") {
        code = FunctionCode::ReadInputRegisters;
        return true;
    }
    if (name == "write_single") {
        code = FunctionCode::WriteSingleRegister;
        return true;
    }
    if (name == "write_multiple") {
        code = FunctionCode::WriteMultipleRegisters;
        return true;
    }
    return false;
}

bool RtuFrameCodec::functionFromCode(int raw, FunctionCode& code) {
    switch (raw) {
        case 0x03:
        case 0x04:
        case 0x06:
        case 0x10:
            code = static_cast<FunctionCode>(raw);
            return true;
        default:
            return false;
    }
}

bool RtuFrameCodec::isReadFunction(FunctionCode code) noexcept {
    return code == FunctionCode::ReadHoldingRegisters || code == FunctionCode::ReadInputRegisters;
}

bool RtuFrameCodec::isWriteFunction(FunctionCode code) noexcept {
    return code == FunctionCode::WriteSingleRegister || code == FunctionCode::WriteMultipleRegisters;
}

std::string RtuFrameCodec::exceptionToString(std::uint8_t exceptionCode) {
    switch (exceptionCode) {
        case 0x01:
            return "illegal function";
        case 0x02:
            return "illegal data address";
        case 0x03:
            return "illegal data value";
        case 0x04:
            return "slave device failure";
        case 0x05:
            return "acknowledge";
        case 0x06:
            return "slave device busy";
        case 0x0B:
            return "gateway target failed to respond";
        default:
            return "exception code " + std::to_string(exceptionCode);
    }
}

std::vector<std::uint8_t> RtuFrameCodec::createPdu(const ModbusRequest& request) const {
    std::vector<std::uint8_t> pdu;
    pdu.push_back(request.slaveId);
    pdu.push_back(static_cast<std::uint8_t>(request.function));

    pdu.push_back(static_cast<std::uint8_t>((request.startAddress >> 8) & 0xFF));
    pdu.push_back(static_cast<std::uint8_t>(request.startAddress & 0xFF));

    if (request.function == FunctionCode::WriteSingleRegister) {
        const auto value = request.values.empty() ? 0 : request.values.front();
        pdu.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
        pdu.push_back(static_cast<std::uint8_t>(value & 0xFF));
        return pdu;
    }

    if (request.function == FunctionCode::WriteMultipleRegisters) {
        const auto quantity = static_cast<std::uint16_t>(request.values.size());
        pdu.push_back(static_cast<std::uint8_t>((quantity >> 8) & 0xFF));
        pdu.push_back(static_cast<std::uint8_t>(quantity & 0xFF));
        pdu.push_back(static_cast<std::uint8_t>(request.values.size() * 2));
        for (const auto v : request.values) {
            pdu.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
            pdu.push_back(static_cast<std::uint8_t>(v & 0xFF));
        }
        return pdu;
    }

    pdu.push_back(static_cast<std::uint8_t>((request.count >> 8) & 0xFF));
    pdu.push_back(static_cast<std::uint8_t>(request.count & 0xFF));
    return pdu;
}

} // namespace protocol
