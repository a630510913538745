#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "layers/registers/RegisterTypes.h"
#include "layers/transport/ITransport.h"

namespace application {

using LogCallback = std::function<void(const std::string&)>;

// Serial line settings that answered the probe.
struct Candidate {
    std::string port;
    std::uint32_t baudRate = 0;
    transport::Parity parity = transport::Parity::None;

    std::string toString() const;
};

bool operator==(const Candidate& lhs, const Candidate& rhs);

struct DiscoveryOptions {
    std::vector<std::uint32_t> baudRates{115200, 57600, 38400, 19200, 9600};
    std::vector<transport::Parity> parities{transport::Parity::None};
    std::uint8_t stopBits = 1;
    std::chrono::milliseconds timeout{200};
    std::chrono::milliseconds settleDelay{50};
};

// Sweeps ports x parities x baud rates and returns the first combination on
// which the probe register decodes without an error.
class Discovery {
public:
    Discovery(transport::TransportFactory factory, transport::PortLister portLister, DiscoveryOptions options = {});

    void setLogCallback(LogCallback cb);

    // cancelled is checked before every candidate.
    std::optional<Candidate> discover(std::uint8_t slaveId,
                                      registers::Endianness endianness,
                                      const registers::RegisterDescriptor& probe,
                                      const std::function<bool()>& cancelled = {}) const;

    bool probeCandidate(const Candidate& candidate,
                        std::uint8_t slaveId,
                        registers::Endianness endianness,
                        const registers::RegisterDescriptor& probe) const;

    std::vector<std::string> listPorts() const;

    const DiscoveryOptions& options() const noexcept { return options_; }

private:
    void log(const std::string& message) const;

    transport::TransportFactory factory_;
    transport::PortLister portLister_;
    DiscoveryOptions options_;
    LogCallback logCallback_;
};

} // namespace application
