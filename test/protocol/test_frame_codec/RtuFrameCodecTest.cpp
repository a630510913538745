#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "layers/protocol/protocol_layer.h"

namespace protocol {
namespace test {

class RtuFrameCodecTest : public ::testing::Test {
protected:
    static ModbusRequest readRequest(std::uint16_t address, std::uint16_t count,
                                     FunctionCode function = FunctionCode::ReadHoldingRegisters) {
        ModbusRequest request;
        request.slaveId = 1;
        request.function = function;
        request.startAddress = address;
        request.count = count;
        return request;
    }

    static std::vector<std::uint8_t> withCrc(std::vector<std::uint8_t> pdu) {
        const auto crc = RtuFrameCodec::crc16(pdu);
        pdu.push_back(static_cast<std::uint8_t>(crc & 0xFF));
        pdu.push_back(static_cast<std::uint8_t>(crc >> 8));
        return pdu;
    }

    RtuFrameCodec codec_;
};

TEST_F(RtuFrameCodecTest, createFrame_ReadHoldingMatchesReferenceFrame)
{
    const std::vector<std::uint8_t> expected{0x01, 0x03, 0x00, 0x00, 0x00, 0x0A, 0xC5, 0xCD};
    EXPECT_EQ(expected, codec_.createFrame(readRequest(0, 10)));
}

TEST_F(RtuFrameCodecTest, createFrame_WriteSingleCarriesValue)
{
    ModbusRequest request;
    request.slaveId = 0x11;
    request.function = FunctionCode::WriteSingleRegister;
    request.startAddress = 0x0001;
    request.count = 1;
    request.values = {0x0003};

    const auto frame = codec_.createFrame(request);
    ASSERT_EQ(8U, frame.size());
    EXPECT_EQ(0x11, frame[0]);
    EXPECT_EQ(0x06, frame[1]);
    EXPECT_EQ(0x00, frame[2]);
    EXPECT_EQ(0x01, frame[3]);
    EXPECT_EQ(0x00, frame[4]);
    EXPECT_EQ(0x03, frame[5]);
}

TEST_F(RtuFrameCodecTest, createFrame_WriteMultipleWithOneValue)
{
    ModbusRequest request;
    request.slaveId = 1;
    request.function = FunctionCode::WriteMultipleRegisters;
    request.startAddress = 0x0010;
    request.count = 1;
    request.values = {0x1234};

    const auto frame = codec_.createFrame(request);
    const std::vector<std::uint8_t> pdu(frame.begin(), frame.end() - 2);
    EXPECT_EQ((std::vector<std::uint8_t>{0x01, 0x10, 0x00, 0x10, 0x00, 0x01, 0x02, 0x12, 0x34}), pdu);

    // Echo of address and quantity.
    EXPECT_NO_THROW(codec_.parseResponse(withCrc({0x01, 0x10, 0x00, 0x10, 0x00, 0x01}), request));
}

TEST_F(RtuFrameCodecTest, crc16_KnownVector)
{
    const std::vector<std::uint8_t> pdu{0x01, 0x03, 0x00, 0x00, 0x00, 0x01};
    EXPECT_EQ(0x0A84, RtuFrameCodec::crc16(pdu));
}

TEST_F(RtuFrameCodecTest, expectedResponseSize_ReadAndWrite)
{
    EXPECT_EQ(9U, codec_.expectedResponseSize(readRequest(0, 2)));
    ModbusRequest write;
    write.function = FunctionCode::WriteSingleRegister;
    EXPECT_EQ(8U, codec_.expectedResponseSize(write));
}

TEST_F(RtuFrameCodecTest, parseResponse_ReadReturnsBigEndianWords)
{
    const auto frame = withCrc({0x01, 0x03, 0x04, 0x12, 0x34, 0xAB, 0xCD});
    const auto response = codec_.parseResponse(frame, readRequest(0, 2));

    EXPECT_FALSE(response.isException);
    ASSERT_EQ(2U, response.values.size());
    EXPECT_EQ(0x1234, response.values[0]);
    EXPECT_EQ(0xABCD, response.values[1]);
}

TEST_F(RtuFrameCodecTest, parseResponse_ExceptionFrameIsReported)
{
    const auto frame = withCrc({0x01, 0x83, 0x02});
    const auto response = codec_.parseResponse(frame, readRequest(0, 2));

    EXPECT_TRUE(response.isException);
    EXPECT_EQ(0x02, response.exceptionCode);
}

TEST_F(RtuFrameCodecTest, parseResponse_BadCrcThrows)
{
    auto frame = withCrc({0x01, 0x03, 0x02, 0x00, 0x01});
    frame.back() ^= 0xFF;
    EXPECT_THROW(codec_.parseResponse(frame, readRequest(0, 1)), FrameError);
}

TEST_F(RtuFrameCodecTest, parseResponse_ForeignSlaveThrows)
{
    const auto frame = withCrc({0x02, 0x03, 0x02, 0x00, 0x01});
    EXPECT_THROW(codec_.parseResponse(frame, readRequest(0, 1)), FrameError);
}

TEST_F(RtuFrameCodecTest, parseResponse_WrongFunctionThrows)
{
    const auto frame = withCrc({0x01, 0x04, 0x02, 0x00, 0x01});
    EXPECT_THROW(codec_.parseResponse(frame, readRequest(0, 1)), FrameError);
}

TEST_F(RtuFrameCodecTest, parseResponse_ByteCountMismatchThrows)
{
    // Length matches a 1-word read but the byte count claims 4.
    const auto frame = withCrc({0x01, 0x03, 0x04, 0x00, 0x01});
    EXPECT_THROW(codec_.parseResponse(frame, readRequest(0, 1)), FrameError);
}

TEST_F(RtuFrameCodecTest, parseResponse_TruncatedFrameThrows)
{
    EXPECT_THROW(codec_.parseResponse({0x01, 0x03}, readRequest(0, 1)), FrameError);
}

TEST_F(RtuFrameCodecTest, parseResponse_WriteEchoMustMatch)
{
    ModbusRequest request;
    request.slaveId = 1;
    request.function = FunctionCode::WriteSingleRegister;
    request.startAddress = 5;
    request.count = 1;
    request.values = {42};

    EXPECT_NO_THROW(codec_.parseResponse(withCrc({0x01, 0x06, 0x00, 0x05, 0x00, 0x2A}), request));
    EXPECT_THROW(codec_.parseResponse(withCrc({0x01, 0x06, 0x00, 0x05, 0x00, 0x2B}), request), FrameError);
    EXPECT_THROW(codec_.parseResponse(withCrc({0x01, 0x06, 0x00, 0x06, 0x00, 0x2A}), request), FrameError);
}

TEST_F(RtuFrameCodecTest, functionFromCode_AcceptsOnlyKnownCodes)
{
    FunctionCode code{};
    EXPECT_TRUE(RtuFrameCodec::functionFromCode(4, code));
    EXPECT_EQ(FunctionCode::ReadInputRegisters, code);
    EXPECT_TRUE(RtuFrameCodec::isReadFunction(code));
    EXPECT_FALSE(RtuFrameCodec::functionFromCode(5, code));
    EXPECT_FALSE(RtuFrameCodec::isWriteFunction(FunctionCode::ReadHoldingRegisters));
}

} // namespace test
} // namespace protocol
