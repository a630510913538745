#include <gtest/gtest.h>

#include "infrastructure/transport/InMemoryRegisterTransport.h"

namespace transport {
namespace test {

using protocol::FunctionCode;

class InMemoryRegisterTransportTest : public ::testing::Test {
protected:
    InMemoryRegisterTransport device_;
};

TEST_F(InMemoryRegisterTransportTest, readRegisters_ReturnsStoredWordsAndZeroElsewhere)
{
    device_.setRegisters(10, {1, 2, 3});

    const auto words = device_.readRegisters(9, 5, FunctionCode::ReadHoldingRegisters);
    EXPECT_EQ((std::vector<std::uint16_t>{0, 1, 2, 3, 0}), words);
    EXPECT_EQ(1U, device_.readCount());
}

TEST_F(InMemoryRegisterTransportTest, share_SeesTheSameRegisters)
{
    auto handle = device_.share();
    handle->writeSingleRegister(7, 0xBEEF, FunctionCode::WriteSingleRegister);

    EXPECT_EQ(0xBEEF, device_.registerValue(7));
    EXPECT_EQ(1U, device_.writeCount());
}

TEST_F(InMemoryRegisterTransportTest, failAddress_HitsOverlappingReadsOnly)
{
    device_.failAddress(10, TransportError::Kind::Timeout);

    try {
        device_.readRegisters(9, 2, FunctionCode::ReadInputRegisters);
        ADD_FAILURE() << "read over a failing address succeeded";
    } catch (const TransportError& e) {
        EXPECT_EQ(TransportError::Kind::Timeout, e.kind());
        EXPECT_FALSE(e.isFatal());
    }
    EXPECT_NO_THROW(device_.readRegisters(11, 2, FunctionCode::ReadInputRegisters));

    device_.clearFailures();
    EXPECT_NO_THROW(device_.readRegisters(10, 1, FunctionCode::ReadInputRegisters));
}

TEST_F(InMemoryRegisterTransportTest, setOffline_FailsWithLineUnavailable)
{
    device_.setOffline(true);
    try {
        device_.readRegisters(0, 1, FunctionCode::ReadHoldingRegisters);
        ADD_FAILURE() << "offline device answered";
    } catch (const TransportError& e) {
        EXPECT_TRUE(e.isFatal());
    }
}

TEST_F(InMemoryRegisterTransportTest, readRegisters_WriteFunctionIsDeviceException)
{
    try {
        device_.readRegisters(0, 1, FunctionCode::WriteSingleRegister);
        ADD_FAILURE() << "read with a write function succeeded";
    } catch (const TransportError& e) {
        EXPECT_EQ(TransportError::Kind::DeviceException, e.kind());
        EXPECT_EQ(0x01, e.exceptionCode());
    }
}

} // namespace test
} // namespace transport
