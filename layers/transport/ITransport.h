#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "layers/protocol/ModbusTypes.h"

namespace transport {

enum class Parity {
    None,
    Even,
    Odd
};

enum class ConnectionPolicy {
    PerCall,  // open before every transaction, close after it
    KeepOpen  // hold the line until a fatal error or destruction
};

struct SerialParams {
    std::string port;
    std::uint32_t baudRate = 9600;
    Parity parity = Parity::None;
    std::uint8_t stopBits = 1;
    std::uint8_t slaveId = 1;
    std::chrono::milliseconds timeout{200};
    ConnectionPolicy policy = ConnectionPolicy::PerCall;
};

class TransportError : public std::runtime_error {
public:
    enum class Kind {
        LineUnavailable,
        Timeout,
        DeviceException,
        Framing
    };

    TransportError(Kind kind, const std::string& message, std::uint8_t exceptionCode = 0);

    Kind kind() const noexcept { return kind_; }
    std::uint8_t exceptionCode() const noexcept { return exceptionCode_; }

    // The line itself is gone; retrying on the same connection is pointless.
    bool isFatal() const noexcept { return kind_ == Kind::LineUnavailable; }

private:
    Kind kind_;
    std::uint8_t exceptionCode_;
};

// One slave on one serial line. Implementations are single-owner: callers
// never issue two transactions concurrently.
class ITransport {
public:
    virtual ~ITransport() = default;

    virtual std::vector<std::uint16_t> readRegisters(std::uint16_t address,
                                                     std::uint16_t count,
                                                     protocol::FunctionCode function) = 0;
    virtual void writeSingleRegister(std::uint16_t address,
                                     std::uint16_t value,
                                     protocol::FunctionCode function) = 0;
};

using TransportPtr = std::unique_ptr<ITransport>;
using TransportFactory = std::function<TransportPtr(const SerialParams&)>;
using PortLister = std::function<std::vector<std::string>()>;

const char* parityToString(Parity parity) noexcept;
bool parseParity(const std::string& text, Parity& parity);
const char* errorKindToString(TransportError::Kind kind) noexcept;

} // namespace transport
