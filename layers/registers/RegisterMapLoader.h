#pragma once

#include <string>

#include <boost/json.hpp>

#include "RegisterTypes.h"

namespace registers {

// All loaders validate the whole document and throw ConfigError on the first
// problem, naming the offending register.
RegisterMap loadRegisterMap(const std::string& path);
RegisterMap parseRegisterMap(const std::string& jsonText);
RegisterMap parseRegisterMap(const boost::json::value& document);

RegisterDescriptor parseDescriptor(const boost::json::object& object);

} // namespace registers
