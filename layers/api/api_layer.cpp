#include "api_layer.h"

#include <chrono>

#include "layers/application/crystal_wear.h"

namespace api {

namespace json = boost::json;

namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kNotConnected = -32001;
constexpr int kTransportFailure = -32002;

std::int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

int writeStatusToCode(application::WriteStatus status) {
    switch (status) {
        case application::WriteStatus::NotConnected:
            return kNotConnected;
        case application::WriteStatus::TransportFailed:
        case application::WriteStatus::TimedOut:
            return kTransportFailure;
        default:
            break;
    }
    return kInvalidParams;
}

// Writes take text; plain JSON numbers and booleans are accepted too.
bool valueAsText(const json::value& value, std::string& out) {
    if (value.is_string()) {
        out = value.as_string().c_str();
        return true;
    }
    if (value.is_bool()) {
        out = value.as_bool() ? "1" : "0";
        return true;
    }
    if (value.is_number()) {
        out = json::serialize(value);
        return true;
    }
    return false;
}

json::object statusObject(application::LinkState state, const std::optional<application::Candidate>& candidate) {
    json::object result;
    result["state"] = application::linkStateToString(state);
    result["connected"] = state == application::LinkState::Connected;
    result["candidate"] = candidateToJson(candidate);
    return result;
}

} // namespace

json::value valueToJson(const registers::DecodedValue& value) {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag;
    }
    if (const auto* number = std::get_if<double>(&value)) {
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return json::value(*text);
    }
    if (const auto* flags = std::get_if<registers::FlagSet>(&value)) {
        json::array out;
        for (const auto& label : *flags) {
            out.emplace_back(label);
        }
        return out;
    }
    const auto& error = std::get<registers::DecodeError>(value);
    return json::object{{"error", registers::errorKindToString(error.kind)}, {"message", error.message}};
}

json::object valuesToJson(const registers::ValueMap& values) {
    json::object out;
    for (const auto& entry : values) {
        out[entry.name] = valueToJson(entry.value);
    }
    return out;
}

json::object descriptorToJson(const registers::RegisterDescriptor& descriptor) {
    json::object out;
    out["name"] = descriptor.name;
    out["type"] = descriptor.typeName;
    out["address"] = static_cast<int>(descriptor.address);
    out["function"] = static_cast<int>(descriptor.function);
    out["words"] = static_cast<int>(descriptor.wordCount);
    out["scale"] = descriptor.scale;
    out["writable"] = descriptor.writable;
    if (!descriptor.unit.empty()) {
        out["unit"] = descriptor.unit;
    }
    if (descriptor.minimum) {
        out["min"] = *descriptor.minimum;
    }
    if (descriptor.maximum) {
        out["max"] = *descriptor.maximum;
    }
    if (!descriptor.symbolMap.empty()) {
        json::object symbols;
        for (const auto& [raw, label] : descriptor.symbolMap) {
            symbols[std::to_string(raw)] = label;
        }
        out["map"] = symbols;
    }
    return out;
}

json::value candidateToJson(const std::optional<application::Candidate>& candidate) {
    if (!candidate) {
        return nullptr;
    }
    json::object out;
    out["port"] = candidate->port;
    out["baud_rate"] = static_cast<std::int64_t>(candidate->baudRate);
    out["parity"] = transport::parityToString(candidate->parity);
    return out;
}

ApiController::ApiController(application::ApplicationCore& appCore) : appCore_(appCore) {}

std::string ApiController::handleLine(const std::string& line) {
    boost::system::error_code ec;
    const auto request = json::parse(line, ec);
    if (ec) {
        return json::serialize(errorResponse(nullptr, kParseError, "Parse error: " + ec.message()));
    }
    return json::serialize(processRequest(request));
}

json::value ApiController::processRequest(const json::value& request) {
    if (request.is_array()) {
        return processBatch(request.as_array());
    }

    if (!request.is_object()) {
        return errorResponse(nullptr, kInvalidRequest, "Invalid JSON-RPC payload");
    }

    return processSingle(request.as_object());
}

json::array ApiController::processBatch(const json::array& requests) {
    json::array responses;
    for (const auto& item : requests) {
        if (!item.is_object()) {
            responses.emplace_back(errorResponse(nullptr, kInvalidRequest, "Batch item must be object"));
            continue;
        }
        responses.emplace_back(processSingle(item.as_object()));
    }
    return responses;
}

json::value ApiController::processSingle(const json::object& req) {
    const json::value id = req.contains("id") ? req.at("id") : json::value(nullptr);

    if (!req.contains("method") || !req.at("method").is_string()) {
        return errorResponse(id, kInvalidRequest, "Missing method");
    }

    const std::string method = req.at("method").as_string().c_str();
    const json::object params = req.contains("params") && req.at("params").is_object()
                                    ? req.at("params").as_object()
                                    : json::object{};

    if (method == "ping") {
        json::object result;
        result["status"] = "ok";
        result["service"] = "qmbmon";
        return okResponse(id, result);
    }

    if (method == "transport.serial_ports") {
        json::array ports;
        for (const auto& p : appCore_.listSerialPorts()) {
            ports.emplace_back(p);
        }
        return okResponse(id, json::object{{"ports", ports}});
    }

    if (method == "device.status") {
        auto result = statusObject(appCore_.linkState(), appCore_.activeCandidate());
        result["slave_id"] = static_cast<int>(appCore_.registerMap().slaveId);
        return okResponse(id, result);
    }

    if (method == "device.scan") {
        appCore_.requestScan();
        return okResponse(id, json::object{{"requested", true}});
    }

    if (method == "registers.list") {
        const auto& map = appCore_.registerMap();
        json::array registersJson;
        for (const auto& descriptor : map.registers) {
            registersJson.push_back(descriptorToJson(descriptor));
        }
        json::object result;
        result["slave_id"] = static_cast<int>(map.slaveId);
        result["endianness"] = registers::endiannessToString(map.endianness);
        result["probe"] = map.probe.name;
        result["registers"] = registersJson;
        return okResponse(id, result);
    }

    if (method == "values.latest") {
        const auto snapshot = appCore_.latestValues();
        if (!snapshot) {
            return okResponse(id, json::object{{"available", false}});
        }
        json::object wear;
        wear["CH1"] = application::crystalWearPercent(snapshot->values, "CH1");
        wear["CH2"] = application::crystalWearPercent(snapshot->values, "CH2");

        json::object result;
        result["available"] = true;
        result["timestamp_ms"] = toEpochMillis(snapshot->timestamp);
        result["values"] = valuesToJson(snapshot->values);
        result["crystal_wear_percent"] = wear;
        return okResponse(id, result);
    }

    if (method == "registers.write") {
        if (!params.contains("name") || !params.at("name").is_string() || !params.contains("value")) {
            return errorResponse(id, kInvalidParams, "name and value are required");
        }
        const std::string name = params.at("name").as_string().c_str();
        std::string text;
        if (!valueAsText(params.at("value"), text)) {
            return errorResponse(id, kInvalidParams, "value must be a string, number or boolean");
        }

        std::string error;
        const auto status = appCore_.write(name, text, error);
        if (status != application::WriteStatus::Ok) {
            return errorResponse(id, writeStatusToCode(status), error);
        }

        json::object result;
        result["accepted"] = true;
        result["name"] = name;
        result["input"] = text;
        return okResponse(id, result);
    }

    return errorResponse(id, kMethodNotFound, "Method not found");
}

json::value ApiController::eventToNotification(const application::LoopEvent& event) {
    json::object params;
    params["timestamp_ms"] = toEpochMillis(event.timestamp);

    json::object r;
    r["jsonrpc"] = "2.0";
    if (event.kind == application::LoopEvent::Kind::Status) {
        auto status = statusObject(event.state, event.candidate);
        for (const auto& item : status) {
            params[item.key()] = item.value();
        }
        params["reason"] = event.reason;
        r["method"] = "device.status";
    } else {
        params["candidate"] = candidateToJson(event.candidate);
        params["values"] = valuesToJson(event.values);
        r["method"] = "device.data";
    }
    r["params"] = params;
    return r;
}

json::value ApiController::errorResponse(const json::value& id, int code, const std::string& message) const {
    json::object r;
    r["jsonrpc"] = "2.0";
    r["id"] = id;
    json::object e;
    e["code"] = code;
    e["message"] = message;
    r["error"] = e;
    return r;
}

json::value ApiController::okResponse(const json::value& id, const json::value& result) const {
    json::object r;
    r["jsonrpc"] = "2.0";
    r["id"] = id;
    r["result"] = result;
    return r;
}

} // namespace api
