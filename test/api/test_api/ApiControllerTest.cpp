#include <gtest/gtest.h>

#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <thread>

#include "infrastructure/transport/InMemoryRegisterTransport.h"
#include "layers/api/api_layer.h"

namespace api {
namespace test {

namespace json = boost::json;
using namespace std::chrono_literals;
using registers::RegisterDescriptor;
using registers::RegisterType;

class ApiControllerTest : public ::testing::Test {
protected:
    static RegisterDescriptor reg(const std::string& name, RegisterType type, std::uint16_t address) {
        RegisterDescriptor descriptor;
        descriptor.name = name;
        descriptor.type = type;
        descriptor.typeName = registers::registerTypeToString(type);
        descriptor.address = address;
        const auto implied = registers::impliedWordCount(type);
        descriptor.wordCount = implied != 0 ? implied : 1;
        return descriptor;
    }

    void SetUp() override {
        auto mode = reg("Mode", RegisterType::Enum16, 0);
        mode.symbolMap = {{0, "Off"}, {1, "On"}};
        registers::RegisterMap map;
        map.slaveId = 9;
        map.registers = {
            mode,
            reg("CH1_Frequency_0p01Hz", RegisterType::UInt32, 10),
            reg("CH1_MinFreq_Hz", RegisterType::UInt32, 12),
            reg("CH1_MaxFreq_Hz", RegisterType::UInt32, 14),
        };
        map.probe = mode;

        device_.setRegisters(10, {0x0000, 750});
        device_.setRegisters(12, {0x0000, 500});
        device_.setRegisters(14, {0x0000, 1500});

        application::PollLoopOptions options;
        options.scanInterval = 20ms;
        options.samplePeriod = 5ms;
        options.discovery.settleDelay = 0ms;
        options.discovery.baudRates = {9600};

        core_ = std::make_unique<application::ApplicationCore>(
            map,
            [this](const transport::SerialParams&) { return device_.share(); },
            [] { return std::vector<std::string>{"sim0"}; },
            options);
        controller_ = std::make_unique<ApiController>(*core_);
    }

    void TearDown() override { core_->stop(); }

    json::value call(const std::string& line) {
        const auto reply = json::parse(controller_->handleLine(line));
        EXPECT_TRUE(reply.is_object());
        return reply;
    }

    static const json::value& at(const json::value& value, std::initializer_list<const char*> keys) {
        const json::value* current = &value;
        for (const auto* key : keys) {
            current = &current->as_object().at(key);
        }
        return *current;
    }

    static std::string text(const json::value& value) { return value.as_string().c_str(); }

    static bool has(const json::value& reply, const char* key) {
        return reply.is_object() && reply.as_object().contains(key);
    }

    static std::int64_t errorCode(const json::value& reply) {
        if (!has(reply, "error")) {
            ADD_FAILURE() << "reply has no error: " << json::serialize(reply);
            return 0;
        }
        return at(reply, {"error", "code"}).as_int64();
    }

    bool startAndWaitForData() {
        core_->start();
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (std::chrono::steady_clock::now() < deadline) {
            core_->pollEvents();
            if (core_->latestValues()) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }

    transport::InMemoryRegisterTransport device_;
    std::unique_ptr<application::ApplicationCore> core_;
    std::unique_ptr<ApiController> controller_;
};

TEST_F(ApiControllerTest, handleLine_ProtocolErrors)
{
    EXPECT_EQ(-32700, errorCode(call("{oops")));
    EXPECT_EQ(-32600, errorCode(call("42")));
    EXPECT_EQ(-32600, errorCode(call(R"({"id": 1})")));
    EXPECT_EQ(-32601, errorCode(call(R"({"id": 1, "method": "modbus.read"})")));
}

TEST_F(ApiControllerTest, handleLine_PingEchoesId)
{
    const auto reply = call(R"({"jsonrpc": "2.0", "id": 7, "method": "ping"})");
    EXPECT_EQ(7, at(reply, {"id"}).as_int64());
    EXPECT_EQ("ok", text(at(reply, {"result", "status"})));
}

TEST_F(ApiControllerTest, handleLine_SerialPortsAndRegisterList)
{
    const auto ports = call(R"({"id": 1, "method": "transport.serial_ports"})");
    ASSERT_EQ(1U, at(ports, {"result", "ports"}).as_array().size());
    EXPECT_EQ("sim0", text(at(ports, {"result", "ports"}).as_array()[0]));

    const auto list = call(R"({"id": 2, "method": "registers.list"})");
    const auto& result = at(list, {"result"});
    EXPECT_EQ(9, at(result, {"slave_id"}).as_int64());
    EXPECT_EQ("Mode", text(at(result, {"probe"})));
    const auto& regs = at(result, {"registers"}).as_array();
    ASSERT_EQ(4U, regs.size());
    EXPECT_EQ("enum16", text(at(regs[0], {"type"})));
    EXPECT_EQ("On", text(at(regs[0], {"map", "1"})));
}

TEST_F(ApiControllerTest, handleLine_StatusAndValuesBeforeConnecting)
{
    const auto status = call(R"({"id": 1, "method": "device.status"})");
    EXPECT_EQ("disconnected", text(at(status, {"result", "state"})));
    EXPECT_TRUE(at(status, {"result", "candidate"}).is_null());

    const auto latest = call(R"({"id": 2, "method": "values.latest"})");
    EXPECT_FALSE(at(latest, {"result", "available"}).as_bool());

    const auto scan = call(R"({"id": 3, "method": "device.scan"})");
    EXPECT_TRUE(at(scan, {"result", "requested"}).as_bool());
}

TEST_F(ApiControllerTest, handleLine_WriteErrorsMapToCodes)
{
    EXPECT_EQ(-32602, errorCode(call(R"({"id": 1, "method": "registers.write", "params": {"name": "Mode"}})")));
    EXPECT_EQ(-32602, errorCode(call(R"({"id": 1, "method": "registers.write",
                                         "params": {"name": "Nope", "value": "1"}})")));
    EXPECT_EQ(-32602, errorCode(call(R"({"id": 1, "method": "registers.write",
                                         "params": {"name": "Mode", "value": "sideways"}})")));
    EXPECT_EQ(-32001, errorCode(call(R"({"id": 1, "method": "registers.write",
                                         "params": {"name": "Mode", "value": "On"}})")));
}

TEST_F(ApiControllerTest, handleLine_ValuesAndWriteWhileConnected)
{
    ASSERT_TRUE(startAndWaitForData());

    const auto latest = call(R"({"id": 1, "method": "values.latest"})");
    const auto& result = at(latest, {"result"});
    EXPECT_TRUE(at(result, {"available"}).as_bool());
    EXPECT_EQ("Off", text(at(result, {"values", "Mode"})));
    EXPECT_DOUBLE_EQ(750.0, at(result, {"values", "CH1_Frequency_0p01Hz"}).as_double());
    EXPECT_DOUBLE_EQ(75.0, at(result, {"crystal_wear_percent", "CH1"}).as_double());
    EXPECT_DOUBLE_EQ(0.0, at(result, {"crystal_wear_percent", "CH2"}).as_double());

    const auto write = call(R"({"id": 2, "method": "registers.write", "params": {"name": "Mode", "value": "on"}})");
    ASSERT_TRUE(has(write, "result")) << json::serialize(write);
    EXPECT_EQ(1, device_.registerValue(0));

    const auto numeric = call(R"({"id": 3, "method": "registers.write", "params": {"name": "Mode", "value": 0}})");
    ASSERT_TRUE(has(numeric, "result")) << json::serialize(numeric);
    EXPECT_EQ(0, device_.registerValue(0));
}

TEST_F(ApiControllerTest, handleLine_DeviceRejectingWriteIsTransportFailure)
{
    ASSERT_TRUE(startAndWaitForData());
    device_.failAddress(0, transport::TransportError::Kind::DeviceException);

    EXPECT_EQ(-32002, errorCode(call(R"({"id": 1, "method": "registers.write",
                                         "params": {"name": "Mode", "value": "On"}})")));
}

TEST_F(ApiControllerTest, processRequest_BatchAnswersEachItem)
{
    const auto reply = controller_->processRequest(json::parse(R"([{"id": 1, "method": "ping"}, 5])"));
    ASSERT_TRUE(reply.is_array());
    ASSERT_EQ(2U, reply.as_array().size());
    EXPECT_TRUE(has(reply.as_array()[0], "result"));
    EXPECT_TRUE(has(reply.as_array()[1], "error"));
}

TEST_F(ApiControllerTest, valueToJson_EveryAlternative)
{
    EXPECT_TRUE(valueToJson(registers::DecodedValue(true)).as_bool());
    EXPECT_DOUBLE_EQ(1.5, valueToJson(registers::DecodedValue(1.5)).as_double());
    EXPECT_EQ("ABC", text(valueToJson(registers::DecodedValue(std::string("ABC")))));

    const auto flags = valueToJson(registers::DecodedValue(registers::FlagSet{"RUNNING", "FAULT"}));
    ASSERT_TRUE(flags.is_array());
    EXPECT_EQ(2U, flags.as_array().size());

    const auto error = valueToJson(registers::DecodeError{registers::ErrorKind::Timeout, "no response"});
    ASSERT_TRUE(error.is_object());
    EXPECT_EQ("timeout", text(at(error, {"error"})));
    EXPECT_EQ("no response", text(at(error, {"message"})));
}

TEST_F(ApiControllerTest, eventToNotification_StatusAndData)
{
    application::LoopEvent status;
    status.kind = application::LoopEvent::Kind::Status;
    status.state = application::LinkState::Connected;
    status.reason = "Connected";
    status.candidate = application::Candidate{"/dev/ttyUSB0", 115200, transport::Parity::None};

    const auto statusJson = ApiController::eventToNotification(status);
    EXPECT_EQ("device.status", text(at(statusJson, {"method"})));
    EXPECT_TRUE(at(statusJson, {"params", "connected"}).as_bool());
    EXPECT_EQ("/dev/ttyUSB0", text(at(statusJson, {"params", "candidate", "port"})));
    EXPECT_EQ("N", text(at(statusJson, {"params", "candidate", "parity"})));

    application::LoopEvent data;
    data.kind = application::LoopEvent::Kind::Data;
    data.state = application::LinkState::Connected;
    data.values = {{"Mode", std::string("On")}};

    const auto dataJson = ApiController::eventToNotification(data);
    EXPECT_EQ("device.data", text(at(dataJson, {"method"})));
    EXPECT_EQ("On", text(at(dataJson, {"params", "values", "Mode"})));
}

} // namespace test
} // namespace api
