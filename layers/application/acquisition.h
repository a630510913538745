#pragma once

#include <vector>

#include "layers/registers/DecodedValue.h"
#include "layers/registers/RegisterTypes.h"
#include "layers/transport/ITransport.h"

namespace application {

// Reads and decodes one descriptor. Every failure is folded into the returned
// value except a fatal TransportError (the line is gone), which propagates.
registers::DecodedValue acquire(transport::ITransport& transport,
                                const registers::RegisterDescriptor& descriptor,
                                registers::Endianness endianness);

// One pass over the register list, one entry per descriptor in list order.
registers::ValueMap acquireAll(transport::ITransport& transport,
                               const std::vector<registers::RegisterDescriptor>& descriptors,
                               registers::Endianness endianness);

// True when the pass produced nothing but link-level errors, i.e. nobody answered.
bool isSilentPass(const registers::ValueMap& values);

} // namespace application
