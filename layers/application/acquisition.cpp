#include "acquisition.h"

#include <system_error>

#include "layers/registers/register_codec.h"

namespace application {

namespace {

registers::ErrorKind toErrorKind(transport::TransportError::Kind kind) {
    switch (kind) {
        case transport::TransportError::Kind::Timeout:
            return registers::ErrorKind::Timeout;
        case transport::TransportError::Kind::DeviceException:
            return registers::ErrorKind::DeviceException;
        case transport::TransportError::Kind::Framing:
            return registers::ErrorKind::Framing;
        case transport::TransportError::Kind::LineUnavailable:
            break;
    }
    return registers::ErrorKind::Transport;
}

} // namespace

registers::DecodedValue acquire(transport::ITransport& transport,
                                const registers::RegisterDescriptor& descriptor,
                                registers::Endianness endianness) {
    if (descriptor.type == registers::RegisterType::Unsupported) {
        return registers::decode(descriptor, {}, endianness);
    }

    try {
        const auto words = transport.readRegisters(descriptor.address, registers::wordsToRead(descriptor),
                                                   descriptor.function);
        return registers::decode(descriptor, words, endianness);
    } catch (const transport::TransportError& e) {
        if (e.isFatal()) {
            throw;
        }
        return registers::DecodeError{toErrorKind(e.kind()), e.what()};
    } catch (const std::system_error& e) {
        return registers::DecodeError{registers::ErrorKind::Transport, e.what()};
    } catch (const std::exception& e) {
        return registers::DecodeError{registers::ErrorKind::Decode, e.what()};
    }
}

registers::ValueMap acquireAll(transport::ITransport& transport,
                               const std::vector<registers::RegisterDescriptor>& descriptors,
                               registers::Endianness endianness) {
    registers::ValueMap values;
    values.reserve(descriptors.size());
    for (const auto& descriptor : descriptors) {
        values.push_back({descriptor.name, acquire(transport, descriptor, endianness)});
    }
    return values;
}

bool isSilentPass(const registers::ValueMap& values) {
    if (values.empty()) {
        return false;
    }
    for (const auto& entry : values) {
        const auto* error = std::get_if<registers::DecodeError>(&entry.value);
        if (!error || !registers::isLinkError(error->kind)) {
            return false;
        }
    }
    return true;
}

} // namespace application
