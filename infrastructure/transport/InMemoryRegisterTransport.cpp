#include "InMemoryRegisterTransport.h"

#include <string>

#include "layers/protocol/protocol_layer.h"

namespace transport {

InMemoryRegisterTransport::InMemoryRegisterTransport()
    : bank_(std::make_shared<Bank>()) {}

InMemoryRegisterTransport::InMemoryRegisterTransport(SharedTag, std::shared_ptr<Bank> bank)
    : bank_(std::move(bank)) {}

std::vector<std::uint16_t> InMemoryRegisterTransport::readRegisters(std::uint16_t address,
                                                                    std::uint16_t count,
                                                                    protocol::FunctionCode function) {
    if (!protocol::RtuFrameCodec::isReadFunction(function)) {
        throw TransportError(TransportError::Kind::DeviceException, "Illegal function", 0x01);
    }

    std::lock_guard<std::mutex> lock(bank_->mutex);
    ++bank_->reads;
    if (bank_->offline) {
        throw TransportError(TransportError::Kind::LineUnavailable, "Simulated device is offline");
    }
    if (const auto failure = failureFor(address, count)) {
        throw TransportError(*failure, "Simulated failure at address " + std::to_string(address));
    }

    std::vector<std::uint16_t> values;
    values.reserve(count);
    for (std::uint32_t offset = 0; offset < count; ++offset) {
        const auto it = bank_->registers.find(static_cast<std::uint16_t>(address + offset));
        values.push_back(it == bank_->registers.end() ? 0 : it->second);
    }
    return values;
}

void InMemoryRegisterTransport::writeSingleRegister(std::uint16_t address,
                                                    std::uint16_t value,
                                                    protocol::FunctionCode function) {
    if (!protocol::RtuFrameCodec::isWriteFunction(function)) {
        throw TransportError(TransportError::Kind::DeviceException, "Illegal function", 0x01);
    }

    std::lock_guard<std::mutex> lock(bank_->mutex);
    ++bank_->writes;
    if (bank_->offline) {
        throw TransportError(TransportError::Kind::LineUnavailable, "Simulated device is offline");
    }
    if (const auto failure = failureFor(address, 1)) {
        throw TransportError(*failure, "Simulated failure at address " + std::to_string(address));
    }
    bank_->registers[address] = value;
}

TransportPtr InMemoryRegisterTransport::share() const {
    return std::make_unique<InMemoryRegisterTransport>(SharedTag{}, bank_);
}

void InMemoryRegisterTransport::setRegister(std::uint16_t address, std::uint16_t value) {
    std::lock_guard<std::mutex> lock(bank_->mutex);
    bank_->registers[address] = value;
}

void InMemoryRegisterTransport::setRegisters(std::uint16_t address, const std::vector<std::uint16_t>& values) {
    std::lock_guard<std::mutex> lock(bank_->mutex);
    for (std::size_t offset = 0; offset < values.size(); ++offset) {
        bank_->registers[static_cast<std::uint16_t>(address + offset)] = values[offset];
    }
}

std::uint16_t InMemoryRegisterTransport::registerValue(std::uint16_t address) const {
    std::lock_guard<std::mutex> lock(bank_->mutex);
    const auto it = bank_->registers.find(address);
    return it == bank_->registers.end() ? 0 : it->second;
}

void InMemoryRegisterTransport::failAddress(std::uint16_t address, TransportError::Kind kind) {
    std::lock_guard<std::mutex> lock(bank_->mutex);
    bank_->failures[address] = kind;
}

void InMemoryRegisterTransport::clearFailures() {
    std::lock_guard<std::mutex> lock(bank_->mutex);
    bank_->failures.clear();
}

void InMemoryRegisterTransport::setOffline(bool offline) {
    std::lock_guard<std::mutex> lock(bank_->mutex);
    bank_->offline = offline;
}

std::size_t InMemoryRegisterTransport::readCount() const {
    std::lock_guard<std::mutex> lock(bank_->mutex);
    return bank_->reads;
}

std::size_t InMemoryRegisterTransport::writeCount() const {
    std::lock_guard<std::mutex> lock(bank_->mutex);
    return bank_->writes;
}

std::optional<TransportError::Kind> InMemoryRegisterTransport::failureFor(std::uint16_t address,
                                                                          std::uint16_t count) const {
    for (std::uint32_t offset = 0; offset < count; ++offset) {
        const auto it = bank_->failures.find(static_cast<std::uint16_t>(address + offset));
        if (it != bank_->failures.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

} // namespace transport
