#pragma once

#include <boost/json.hpp>

#include <string>

#include "layers/application/application_layer.h"

namespace api {

// JSON-RPC 2.0 over a line-oriented stream: one request per line in, one
// response or notification per line out.
class ApiController {
public:
    explicit ApiController(application::ApplicationCore& appCore);

    // Parses a single line and returns the serialized reply.
    std::string handleLine(const std::string& line);

    boost::json::value processRequest(const boost::json::value& request);
    boost::json::array processBatch(const boost::json::array& requests);

    // device.status / device.data notifications.
    static boost::json::value eventToNotification(const application::LoopEvent& event);

private:
    boost::json::value processSingle(const boost::json::object& req);
    boost::json::value errorResponse(const boost::json::value& id, int code, const std::string& message) const;
    boost::json::value okResponse(const boost::json::value& id, const boost::json::value& result) const;

    application::ApplicationCore& appCore_;
};

boost::json::value valueToJson(const registers::DecodedValue& value);
boost::json::object valuesToJson(const registers::ValueMap& values);
boost::json::object descriptorToJson(const registers::RegisterDescriptor& descriptor);
boost::json::value candidateToJson(const std::optional<application::Candidate>& candidate);

} // namespace api
