#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "layers/transport/ITransport.h"

namespace transport {

// Simulated slave: a register table shared by every handle created through
// share(), so one "device" can be reached through many throwaway clients.
class InMemoryRegisterTransport final : public ITransport {
    struct Bank;

    // Only share() can attach a handle to an existing bank.
    class SharedTag {
        friend class InMemoryRegisterTransport;
        explicit SharedTag() = default;
    };

public:
    InMemoryRegisterTransport();
    InMemoryRegisterTransport(SharedTag, std::shared_ptr<Bank> bank);

    std::vector<std::uint16_t> readRegisters(std::uint16_t address,
                                             std::uint16_t count,
                                             protocol::FunctionCode function) override;
    void writeSingleRegister(std::uint16_t address,
                             std::uint16_t value,
                             protocol::FunctionCode function) override;

    TransportPtr share() const;

    void setRegister(std::uint16_t address, std::uint16_t value);
    void setRegisters(std::uint16_t address, const std::vector<std::uint16_t>& values);
    std::uint16_t registerValue(std::uint16_t address) const;

    // Every access touching the address fails with the given kind.
    void failAddress(std::uint16_t address, TransportError::Kind kind);
    void clearFailures();

    // Offline devices fail every call with LineUnavailable.
    void setOffline(bool offline);

    std::size_t readCount() const;
    std::size_t writeCount() const;

private:
    struct Bank {
        mutable std::mutex mutex;
        std::map<std::uint16_t, std::uint16_t> registers;
        std::map<std::uint16_t, TransportError::Kind> failures;
        bool offline = false;
        std::size_t reads = 0;
        std::size_t writes = 0;
    };

    std::optional<TransportError::Kind> failureFor(std::uint16_t address, std::uint16_t count) const;

    std::shared_ptr<Bank> bank_;
};

} // namespace transport
