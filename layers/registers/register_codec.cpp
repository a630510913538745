#include "register_codec.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace registers {

namespace {

std::string toLowerAscii(const std::string& src) {
    std::string out = src;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string trimmed(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::uint8_t> wordsToBytes(const std::vector<std::uint16_t>& words) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(words.size() * 2);
    for (const auto word : words) {
        bytes.push_back(static_cast<std::uint8_t>((word >> 8) & 0xFF));
        bytes.push_back(static_cast<std::uint8_t>(word & 0xFF));
    }
    return bytes;
}

bool parseDouble(const std::string& text, double& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE) {
        return false;
    }
    out = value;
    return true;
}

bool parseBoolWord(const std::string& text, bool& out) {
    const auto lower = toLowerAscii(text);
    if (lower == "1" || lower == "true" || lower == "on" || lower == "yes") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "off" || lower == "no") {
        out = false;
        return true;
    }
    return false;
}

double effectiveScale(const RegisterDescriptor& descriptor) {
    return descriptor.scale == 0.0 ? 1.0 : descriptor.scale;
}

double clampToBounds(const RegisterDescriptor& descriptor, double value) {
    if (descriptor.minimum) {
        value = std::max(*descriptor.minimum, value);
    }
    if (descriptor.maximum) {
        value = std::min(*descriptor.maximum, value);
    }
    return value;
}

std::uint32_t combineWords(std::uint16_t first, std::uint16_t second, Endianness endianness) {
    if (endianness == Endianness::Big) {
        return (static_cast<std::uint32_t>(first) << 16) | second;
    }
    return (static_cast<std::uint32_t>(second) << 16) | first;
}

DecodeError shortRead(const RegisterDescriptor& descriptor, std::size_t got) {
    return {ErrorKind::Decode, "Register " + descriptor.name + " needs " + std::to_string(wordsToRead(descriptor)) +
                                   " words, got " + std::to_string(got)};
}

} // namespace

std::uint16_t wordsToRead(const RegisterDescriptor& descriptor) noexcept {
    const auto implied = impliedWordCount(descriptor.type);
    return implied != 0 ? implied : descriptor.wordCount;
}

DecodedValue decode(const RegisterDescriptor& descriptor,
                    const std::vector<std::uint16_t>& words,
                    Endianness endianness) {
    if (descriptor.type == RegisterType::Unsupported) {
        return DecodeError{ErrorKind::UnsupportedType, "Unsupported register type '" + descriptor.typeName + "'"};
    }

    const std::size_t needed = wordsToRead(descriptor);
    if (needed == 0 || words.size() < needed) {
        return shortRead(descriptor, words.size());
    }

    const std::uint16_t word = words[0];
    switch (descriptor.type) {
        case RegisterType::UInt16:
        case RegisterType::Command16:
            return static_cast<double>(word) * descriptor.scale;

        case RegisterType::Int16: {
            const std::int32_t value = word >= 0x8000 ? static_cast<std::int32_t>(word) - 0x10000 : word;
            return static_cast<double>(value) * descriptor.scale;
        }

        case RegisterType::Bool16:
            return word != 0;

        case RegisterType::Enum16:
            for (const auto& [raw, label] : descriptor.symbolMap) {
                if (raw == word) {
                    return label;
                }
            }
            return static_cast<double>(word);

        case RegisterType::Bitmask16: {
            FlagSet flags;
            for (const auto& [mask, label] : descriptor.symbolMap) {
                if ((word & mask) != 0) {
                    flags.push_back(label);
                }
            }
            return flags;
        }

        case RegisterType::UInt32:
        case RegisterType::Int32: {
            const std::uint32_t raw = combineWords(words[0], words[1], endianness);
            std::int64_t value = raw;
            if (descriptor.type == RegisterType::Int32 && (raw & 0x80000000U) != 0U) {
                value -= static_cast<std::int64_t>(1) << 32;
            }
            return static_cast<double>(value) * descriptor.scale;
        }

        case RegisterType::Ip32:
            return wordsToIp({words[0], words[1]});

        case RegisterType::Mac48:
            return wordsToMac({words[0], words[1], words[2]});

        case RegisterType::Ascii:
            return wordsToAscii(std::vector<std::uint16_t>(words.begin(), words.begin() + static_cast<std::ptrdiff_t>(needed)));

        case RegisterType::Unsupported:
            break;
    }

    return DecodeError{ErrorKind::UnsupportedType, "Unsupported register type '" + descriptor.typeName + "'"};
}

bool encode(const RegisterDescriptor& descriptor, const std::string& text, std::uint16_t& raw, std::string& error) {
    const auto value = trimmed(text);
    if (value.empty()) {
        error = "Value for " + descriptor.name + " is empty";
        return false;
    }

    if (descriptor.type == RegisterType::Bool16) {
        bool flag = false;
        if (!parseBoolWord(value, flag)) {
            error = "Value '" + value + "' is not a boolean (use 1/0, true/false, on/off)";
            return false;
        }
        raw = flag ? 1 : 0;
        return true;
    }

    if (descriptor.type == RegisterType::Enum16) {
        const auto lower = toLowerAscii(value);
        for (const auto& [code, label] : descriptor.symbolMap) {
            if (toLowerAscii(label) == lower) {
                raw = code;
                return true;
            }
        }
    }

    double number = 0.0;
    if (!parseDouble(value, number)) {
        if (descriptor.type == RegisterType::Enum16) {
            error = "Unknown label '" + value + "' for " + descriptor.name;
        } else {
            error = "Value '" + value + "' is not a number";
        }
        return false;
    }
    return encodeNumber(descriptor, number, raw, error);
}

bool encodeNumber(const RegisterDescriptor& descriptor, double value, std::uint16_t& raw, std::string& error) {
    if (!std::isfinite(value)) {
        error = "Value for " + descriptor.name + " must be finite";
        return false;
    }

    switch (descriptor.type) {
        case RegisterType::Bool16:
            raw = value != 0.0 ? 1 : 0;
            return true;

        case RegisterType::Enum16: {
            const double rounded = std::round(value);
            if (rounded < 0.0 || rounded > 65535.0) {
                error = "Enum value out of range [0..65535]";
                return false;
            }
            raw = static_cast<std::uint16_t>(rounded);
            return true;
        }

        case RegisterType::UInt16:
        case RegisterType::Int16:
        case RegisterType::Command16:
            break;

        default:
            error = "Type " + descriptor.typeName + " cannot be written as a single register";
            return false;
    }

    const double scaled = std::round(clampToBounds(descriptor, value) / effectiveScale(descriptor));
    if (isSignedType(descriptor.type)) {
        if (scaled < -32768.0 || scaled > 32767.0) {
            error = "Value for " + descriptor.name + " out of int16 range after scaling";
            return false;
        }
        raw = static_cast<std::uint16_t>(static_cast<std::int16_t>(scaled));
        return true;
    }

    if (scaled < 0.0 || scaled > 65535.0) {
        error = "Value for " + descriptor.name + " out of uint16 range after scaling";
        return false;
    }
    raw = static_cast<std::uint16_t>(scaled);
    return true;
}

bool encodeWords(const RegisterDescriptor& descriptor,
                 double value,
                 Endianness endianness,
                 std::vector<std::uint16_t>& words,
                 std::string& error) {
    if (descriptor.type != RegisterType::UInt32 && descriptor.type != RegisterType::Int32) {
        std::uint16_t raw = 0;
        if (!encodeNumber(descriptor, value, raw, error)) {
            return false;
        }
        words = {raw};
        return true;
    }

    if (!std::isfinite(value)) {
        error = "Value for " + descriptor.name + " must be finite";
        return false;
    }

    const double scaled = std::round(clampToBounds(descriptor, value) / effectiveScale(descriptor));
    std::uint32_t raw = 0;
    if (descriptor.type == RegisterType::Int32) {
        if (scaled < -2147483648.0 || scaled > 2147483647.0) {
            error = "Value for " + descriptor.name + " out of int32 range after scaling";
            return false;
        }
        raw = static_cast<std::uint32_t>(static_cast<std::int64_t>(scaled) & 0xFFFFFFFF);
    } else {
        if (scaled < 0.0 || scaled > 4294967295.0) {
            error = "Value for " + descriptor.name + " out of uint32 range after scaling";
            return false;
        }
        raw = static_cast<std::uint32_t>(scaled);
    }

    const auto high = static_cast<std::uint16_t>(raw >> 16);
    const auto low = static_cast<std::uint16_t>(raw & 0xFFFF);
    if (endianness == Endianness::Big) {
        words = {high, low};
    } else {
        words = {low, high};
    }
    return true;
}

std::string wordsToAscii(const std::vector<std::uint16_t>& words) {
    std::string out;
    for (const auto byte : wordsToBytes(words)) {
        if (byte < 0x80) {
            out.push_back(static_cast<char>(byte));
        }
    }
    while (!out.empty() && out.back() == '\0') {
        out.pop_back();
    }
    return trimmed(out);
}

std::string wordsToIp(const std::vector<std::uint16_t>& words) {
    std::ostringstream out;
    bool first = true;
    for (const auto byte : wordsToBytes(words)) {
        if (!first) {
            out << '.';
        }
        out << static_cast<int>(byte);
        first = false;
    }
    return out.str();
}

std::string wordsToMac(const std::vector<std::uint16_t>& words) {
    auto bytes = wordsToBytes(words);
    if (bytes.size() > 6) {
        bytes.resize(6);
    }

    std::string out;
    char octet[3] = {0};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i != 0) {
            out.push_back(':');
        }
        std::snprintf(octet, sizeof(octet), "%02X", bytes[i]);
        out += octet;
    }
    return out;
}

} // namespace registers
