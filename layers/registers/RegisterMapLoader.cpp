#include "RegisterMapLoader.h"

#include <charconv>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <set>
#include <sstream>

#include "layers/protocol/protocol_layer.h"

namespace registers {

namespace json = boost::json;

namespace {

const json::value* field(const json::object& obj, std::initializer_list<const char*> keys) {
    for (const auto* key : keys) {
        const auto it = obj.find(key);
        if (it != obj.end() && !it->value().is_null()) {
            return &it->value();
        }
    }
    return nullptr;
}

bool toInteger(const json::value& value, std::int64_t& out) {
    if (value.is_int64()) {
        out = value.as_int64();
        return true;
    }
    if (value.is_uint64()) {
        if (value.as_uint64() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return false;
        }
        out = static_cast<std::int64_t>(value.as_uint64());
        return true;
    }
    if (value.is_double()) {
        const double d = value.as_double();
        if (!std::isfinite(d) || std::trunc(d) != d || std::fabs(d) > 9.0e15) {
            return false;
        }
        out = static_cast<std::int64_t>(d);
        return true;
    }
    return false;
}

bool parseIntegerText(std::string text, std::int64_t& out) {
    int base = 10;
    if (text.rfind("0x", 0) == 0 || text.rfind("0X", 0) == 0) {
        text = text.substr(2);
        base = 16;
    }
    if (text.empty()) {
        return false;
    }

    std::int64_t parsed = 0;
    const auto* begin = text.data();
    const auto* end = begin + text.size();
    const auto res = std::from_chars(begin, end, parsed, base);
    if (res.ec != std::errc() || res.ptr != end) {
        return false;
    }
    out = parsed;
    return true;
}

// Integers may also be given as decimal or 0x-prefixed strings.
bool parseIntegerFlexible(const json::value& value, std::int64_t& out) {
    if (toInteger(value, out)) {
        return true;
    }
    return value.is_string() && parseIntegerText(std::string(value.as_string().c_str()), out);
}

bool toDouble(const json::value& value, double& out) {
    if (value.is_double()) {
        out = value.as_double();
        return true;
    }
    if (value.is_int64()) {
        out = static_cast<double>(value.as_int64());
        return true;
    }
    if (value.is_uint64()) {
        out = static_cast<double>(value.as_uint64());
        return true;
    }
    return false;
}

std::string describe(const std::string& name) {
    return name.empty() ? std::string("register") : "register '" + name + "'";
}

double requireDouble(const json::value& value, const std::string& name, const char* key) {
    double out = 0.0;
    if (!toDouble(value, out) || !std::isfinite(out)) {
        throw ConfigError(describe(name) + ": '" + key + "' must be a finite number");
    }
    return out;
}

protocol::FunctionCode requireFunction(const json::value& value, const std::string& name, const char* key, bool forRead) {
    std::int64_t raw = 0;
    protocol::FunctionCode code{};
    if (value.is_string()) {
        // Named form, e.g. "read_input".
        if (!protocol::RtuFrameCodec::parseFunction(std::string(value.as_string().c_str()), code)) {
            throw ConfigError(describe(name) + ": unknown function name in '" + key + "'");
        }
        raw = static_cast<std::uint8_t>(code);
    } else if (!toInteger(value, raw) || !protocol::RtuFrameCodec::functionFromCode(static_cast<int>(raw), code)) {
        throw ConfigError(describe(name) + ": unsupported function code in '" + key + "'");
    }
    const bool ok = forRead ? protocol::RtuFrameCodec::isReadFunction(code)
                            : protocol::RtuFrameCodec::isWriteFunction(code);
    if (!ok) {
        throw ConfigError(describe(name) + ": function " + std::to_string(raw) + " cannot be used for " +
                          (forRead ? "reading" : "writing"));
    }
    return code;
}

SymbolMap parseSymbolMap(const json::value& value, const std::string& name) {
    if (!value.is_object()) {
        throw ConfigError(describe(name) + ": 'map' must be an object");
    }

    SymbolMap symbols;
    for (const auto& entry : value.as_object()) {
        std::int64_t key = 0;
        if (!parseIntegerText(std::string(entry.key()), key) || key < 0 || key > 0xFFFF) {
            throw ConfigError(describe(name) + ": map key '" + std::string(entry.key()) +
                              "' is not an integer in 0..65535");
        }
        if (!entry.value().is_string()) {
            throw ConfigError(describe(name) + ": map label for key '" + std::string(entry.key()) +
                              "' must be a string");
        }
        symbols.emplace_back(static_cast<std::uint16_t>(key), std::string(entry.value().as_string().c_str()));
    }
    return symbols;
}

} // namespace

RegisterDescriptor parseDescriptor(const json::object& object) {
    RegisterDescriptor descriptor;

    const auto* name = field(object, {"name"});
    if (!name || !name->is_string() || name->as_string().empty()) {
        throw ConfigError("register without a 'name'");
    }
    descriptor.name = name->as_string().c_str();

    const auto* type = field(object, {"type"});
    if (!type || !type->is_string()) {
        throw ConfigError(describe(descriptor.name) + ": missing 'type'");
    }
    descriptor.typeName = type->as_string().c_str();
    if (!parseRegisterType(descriptor.typeName, descriptor.type)) {
        descriptor.type = RegisterType::Unsupported;
    }

    const auto* address = field(object, {"address"});
    std::int64_t rawAddress = 0;
    if (!address || !parseIntegerFlexible(*address, rawAddress) || rawAddress < 0 || rawAddress > 0xFFFF) {
        throw ConfigError(describe(descriptor.name) + ": 'address' must be an integer in 0..65535");
    }
    descriptor.address = static_cast<std::uint16_t>(rawAddress);

    if (const auto* function = field(object, {"function", "functionCode"})) {
        descriptor.function = requireFunction(*function, descriptor.name, "function", true);
    }
    if (const auto* function = field(object, {"write_function", "writeFunctionCode"})) {
        descriptor.writeFunction = requireFunction(*function, descriptor.name, "write_function", false);
    }

    if (const auto* scale = field(object, {"scale"})) {
        descriptor.scale = requireDouble(*scale, descriptor.name, "scale");
    }
    if (isNumericType(descriptor.type) && descriptor.scale == 0.0) {
        throw ConfigError(describe(descriptor.name) + ": 'scale' must be non-zero");
    }

    const auto* words = field(object, {"words", "wordCount"});
    const auto implied = impliedWordCount(descriptor.type);
    if (words) {
        std::int64_t count = 0;
        if (!toInteger(*words, count) || count <= 0 || count > 125) {
            throw ConfigError(describe(descriptor.name) + ": 'words' must be an integer in 1..125");
        }
        descriptor.wordCount = static_cast<std::uint16_t>(count);
    } else if (descriptor.type == RegisterType::Ascii) {
        throw ConfigError(describe(descriptor.name) + ": ascii registers need 'words'");
    } else {
        descriptor.wordCount = implied != 0 ? implied : 1;
    }
    if (implied != 0) {
        descriptor.wordCount = implied;
    }
    if (static_cast<std::uint32_t>(descriptor.address) + descriptor.wordCount > 0x10000U) {
        throw ConfigError(describe(descriptor.name) + ": register range runs past address 65535");
    }

    if (const auto* map = field(object, {"map", "symbolMap"})) {
        descriptor.symbolMap = parseSymbolMap(*map, descriptor.name);
    }
    if ((descriptor.type == RegisterType::Enum16 || descriptor.type == RegisterType::Bitmask16) &&
        descriptor.symbolMap.empty()) {
        throw ConfigError(describe(descriptor.name) + ": " + descriptor.typeName + " needs a non-empty 'map'");
    }

    if (const auto* bounds = field(object, {"bounds"})) {
        if (!bounds->is_array() || bounds->as_array().size() != 2) {
            throw ConfigError(describe(descriptor.name) + ": 'bounds' must be [min, max]");
        }
        descriptor.minimum = requireDouble(bounds->as_array()[0], descriptor.name, "bounds");
        descriptor.maximum = requireDouble(bounds->as_array()[1], descriptor.name, "bounds");
    }
    if (const auto* minimum = field(object, {"min"})) {
        descriptor.minimum = requireDouble(*minimum, descriptor.name, "min");
    }
    if (const auto* maximum = field(object, {"max"})) {
        descriptor.maximum = requireDouble(*maximum, descriptor.name, "max");
    }
    if (descriptor.minimum && descriptor.maximum && *descriptor.minimum > *descriptor.maximum) {
        throw ConfigError(describe(descriptor.name) + ": 'min' is greater than 'max'");
    }

    if (const auto* unit = field(object, {"unit"})) {
        if (!unit->is_string()) {
            throw ConfigError(describe(descriptor.name) + ": 'unit' must be a string");
        }
        descriptor.unit = unit->as_string().c_str();
    }
    if (const auto* writable = field(object, {"writable"})) {
        if (!writable->is_bool()) {
            throw ConfigError(describe(descriptor.name) + ": 'writable' must be true or false");
        }
        descriptor.writable = writable->as_bool();
    }

    return descriptor;
}

RegisterMap parseRegisterMap(const json::value& document) {
    if (!document.is_object()) {
        throw ConfigError("register map must be a JSON object");
    }
    const auto& root = document.as_object();

    RegisterMap map;

    const auto* slave = field(root, {"slave_id", "slaveId"});
    std::int64_t slaveId = 0;
    if (!slave || !toInteger(*slave, slaveId) || slaveId < 1 || slaveId > 247) {
        throw ConfigError("'slave_id' must be an integer in 1..247");
    }
    map.slaveId = static_cast<std::uint8_t>(slaveId);

    if (const auto* endianness = field(root, {"endianness"})) {
        const std::string text = endianness->is_string() ? std::string(endianness->as_string().c_str()) : std::string();
        if (text == "big") {
            map.endianness = Endianness::Big;
        } else if (text == "little") {
            map.endianness = Endianness::Little;
        } else {
            throw ConfigError("'endianness' must be \"big\" or \"little\"");
        }
    }

    const auto* list = field(root, {"registers"});
    if (!list || !list->is_array() || list->as_array().empty()) {
        throw ConfigError("'registers' must be a non-empty array");
    }

    std::set<std::string> names;
    for (const auto& item : list->as_array()) {
        if (!item.is_object()) {
            throw ConfigError("every entry of 'registers' must be an object");
        }
        auto descriptor = parseDescriptor(item.as_object());
        if (!names.insert(descriptor.name).second) {
            throw ConfigError("duplicate register name '" + descriptor.name + "'");
        }
        map.registers.push_back(std::move(descriptor));
    }

    const auto* probe = field(root, {"probe"});
    if (!probe) {
        map.probe = map.registers.front();
    } else if (probe->is_string()) {
        const auto* named = map.find(probe->as_string().c_str());
        if (!named) {
            throw ConfigError("probe refers to unknown register '" + std::string(probe->as_string().c_str()) + "'");
        }
        map.probe = *named;
    } else if (probe->is_object()) {
        map.probe = parseDescriptor(probe->as_object());
    } else {
        throw ConfigError("'probe' must be a register object or a register name");
    }
    if (map.probe.type == RegisterType::Unsupported) {
        throw ConfigError("probe register '" + map.probe.name + "' has an unsupported type");
    }

    return map;
}

RegisterMap parseRegisterMap(const std::string& jsonText) {
    boost::system::error_code ec;
    const auto document = json::parse(jsonText, ec);
    if (ec) {
        throw ConfigError("Invalid JSON: " + ec.message());
    }
    return parseRegisterMap(document);
}

RegisterMap loadRegisterMap(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ConfigError("Cannot open register map '" + path + "'");
    }
    std::ostringstream content;
    content << input.rdbuf();
    try {
        return parseRegisterMap(content.str());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

} // namespace registers
