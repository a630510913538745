#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/serial_port.hpp>

#include "ITransport.h"
#include "layers/protocol/protocol_layer.h"

namespace transport {

// Modbus RTU master on a boost::asio serial port. Every transaction is
// synchronous and bounded by SerialParams::timeout.
class RtuClient final : public ITransport {
public:
    explicit RtuClient(SerialParams params);
    ~RtuClient() override;

    RtuClient(const RtuClient&) = delete;
    RtuClient& operator=(const RtuClient&) = delete;

    std::vector<std::uint16_t> readRegisters(std::uint16_t address,
                                             std::uint16_t count,
                                             protocol::FunctionCode function) override;
    void writeSingleRegister(std::uint16_t address,
                             std::uint16_t value,
                             protocol::FunctionCode function) override;

    const SerialParams& params() const noexcept { return params_; }
    bool isOpen() const { return port_.is_open(); }
    void close();

private:
    using Clock = std::chrono::steady_clock;

    protocol::ModbusResponse transact(const protocol::ModbusRequest& request);
    protocol::ModbusResponse exchange(const protocol::ModbusRequest& request);

    void open();
    void clearLineBuffer();
    void writeAll(const std::vector<std::uint8_t>& frame, Clock::time_point deadline);
    void readExact(std::vector<std::uint8_t>& buffer, std::size_t offset, std::size_t size,
                   Clock::time_point deadline);
    void runUntil(const boost::system::error_code& result, Clock::time_point deadline, const char* operation);

    SerialParams params_;
    protocol::RtuFrameCodec codec_;
    boost::asio::io_context ioContext_;
    boost::asio::serial_port port_;
};

// Device nodes that look like serial lines, sorted so scans are repeatable.
std::vector<std::string> listSerialPorts();

TransportFactory makeRtuTransportFactory();

} // namespace transport
