#include "discovery.h"

#include <thread>
#include <utility>

#include "acquisition.h"

namespace application {

std::string Candidate::toString() const {
    return port + "@" + std::to_string(baudRate) + " " + transport::parityToString(parity);
}

bool operator==(const Candidate& lhs, const Candidate& rhs) {
    return lhs.port == rhs.port && lhs.baudRate == rhs.baudRate && lhs.parity == rhs.parity;
}

Discovery::Discovery(transport::TransportFactory factory, transport::PortLister portLister, DiscoveryOptions options)
    : factory_(std::move(factory)), portLister_(std::move(portLister)), options_(std::move(options)) {}

void Discovery::setLogCallback(LogCallback cb) {
    logCallback_ = std::move(cb);
}

std::vector<std::string> Discovery::listPorts() const {
    if (!portLister_) {
        return {};
    }
    try {
        return portLister_();
    } catch (const std::exception& e) {
        log(std::string("Port enumeration failed: ") + e.what());
        return {};
    }
}

std::optional<Candidate> Discovery::discover(std::uint8_t slaveId,
                                             registers::Endianness endianness,
                                             const registers::RegisterDescriptor& probe,
                                             const std::function<bool()>& cancelled) const {
    for (const auto& port : listPorts()) {
        for (const auto parity : options_.parities) {
            for (const auto baud : options_.baudRates) {
                if (cancelled && cancelled()) {
                    return std::nullopt;
                }
                Candidate candidate{port, baud, parity};
                if (probeCandidate(candidate, slaveId, endianness, probe)) {
                    return candidate;
                }
            }
        }
    }
    return std::nullopt;
}

bool Discovery::probeCandidate(const Candidate& candidate,
                               std::uint8_t slaveId,
                               registers::Endianness endianness,
                               const registers::RegisterDescriptor& probe) const {
    transport::SerialParams params;
    params.port = candidate.port;
    params.baudRate = candidate.baudRate;
    params.parity = candidate.parity;
    params.stopBits = options_.stopBits;
    params.slaveId = slaveId;
    params.timeout = options_.timeout;
    params.policy = transport::ConnectionPolicy::PerCall;

    try {
        auto client = factory_(params);
        if (!client) {
            return false;
        }
        if (options_.settleDelay.count() > 0) {
            std::this_thread::sleep_for(options_.settleDelay);
        }
        const auto value = acquire(*client, probe, endianness);
        if (const auto* error = std::get_if<registers::DecodeError>(&value)) {
            log(candidate.toString() + ": " + error->message);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        log(candidate.toString() + ": " + e.what());
        return false;
    }
}

void Discovery::log(const std::string& message) const {
    if (logCallback_) {
        logCallback_(message);
    }
}

} // namespace application
