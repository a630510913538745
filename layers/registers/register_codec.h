#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "DecodedValue.h"
#include "RegisterTypes.h"

namespace registers {

// Words a read of this descriptor must fetch.
std::uint16_t wordsToRead(const RegisterDescriptor& descriptor) noexcept;

// Never throws for malformed input: short reads and unknown types come back as DecodeError.
DecodedValue decode(const RegisterDescriptor& descriptor,
                    const std::vector<std::uint16_t>& words,
                    Endianness endianness);

// Single-register write path. Text is what a user typed: a number, a bool word
// (1/0, true/false, on/off, yes/no) or an enum label.
bool encode(const RegisterDescriptor& descriptor, const std::string& text, std::uint16_t& raw, std::string& error);
bool encodeNumber(const RegisterDescriptor& descriptor, double value, std::uint16_t& raw, std::string& error);

// Full-width inverse of decode for numeric types, uint32/int32 included. Words
// come out in the order decode expects them for the given endianness.
bool encodeWords(const RegisterDescriptor& descriptor,
                 double value,
                 Endianness endianness,
                 std::vector<std::uint16_t>& words,
                 std::string& error);

std::string wordsToAscii(const std::vector<std::uint16_t>& words);
std::string wordsToIp(const std::vector<std::uint16_t>& words);
std::string wordsToMac(const std::vector<std::uint16_t>& words);

} // namespace registers
