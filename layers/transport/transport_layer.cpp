#include "transport_layer.h"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <termios.h>
#endif

namespace transport {

namespace {

template <typename Stream>
void closeStream(Stream& stream) {
    boost::system::error_code ec;
    stream.cancel(ec);
    stream.close(ec);
}

#ifndef _WIN32
// Legacy 8250 UARTs are registered for every possible ttyS index; the ones
// without hardware sit on the platform bus and never answer.
bool isPlatformPlaceholder(const std::string& fileName) {
    if (fileName.rfind("ttyS", 0) != 0) {
        return false;
    }
    std::error_code ec;
    const std::filesystem::path subsystem = "/sys/class/tty/" + fileName + "/device/subsystem";
    const auto target = std::filesystem::read_symlink(subsystem, ec);
    return !ec && target.filename() == "platform";
}
#endif

boost::asio::serial_port_base::parity toAsioParity(Parity parity) {
    using base = boost::asio::serial_port_base;
    switch (parity) {
        case Parity::Even:
            return base::parity(base::parity::even);
        case Parity::Odd:
            return base::parity(base::parity::odd);
        case Parity::None:
            break;
    }
    return base::parity(base::parity::none);
}

} // namespace

TransportError::TransportError(Kind kind, const std::string& message, std::uint8_t exceptionCode)
    : std::runtime_error(message), kind_(kind), exceptionCode_(exceptionCode) {}

const char* parityToString(Parity parity) noexcept {
    switch (parity) {
        case Parity::None:
            return "N";
        case Parity::Even:
            return "E";
        case Parity::Odd:
            return "O";
    }
    return "N";
}

bool parseParity(const std::string& text, Parity& parity) {
    if (text == "N" || text == "n" || text == "none") {
        parity = Parity::None;
        return true;
    }
    if (text == "E" || text == "e" || text == "even") {
        parity = Parity::Even;
        return true;
    }
    if (text == "O" || text == "o" || text == "odd") {
        parity = Parity::Odd;
        return true;
    }
    return false;
}

const char* errorKindToString(TransportError::Kind kind) noexcept {
    switch (kind) {
        case TransportError::Kind::LineUnavailable:
            return "line_unavailable";
        case TransportError::Kind::Timeout:
            return "timeout";
        case TransportError::Kind::DeviceException:
            return "device_exception";
        case TransportError::Kind::Framing:
            return "framing";
    }
    return "unknown";
}

RtuClient::RtuClient(SerialParams params)
    : params_(std::move(params)), port_(ioContext_) {}

RtuClient::~RtuClient() {
    close();
}

std::vector<std::uint16_t> RtuClient::readRegisters(std::uint16_t address,
                                                    std::uint16_t count,
                                                    protocol::FunctionCode function) {
    if (!protocol::RtuFrameCodec::isReadFunction(function)) {
        throw std::invalid_argument("Function " + protocol::RtuFrameCodec::functionToString(function) +
                                    " cannot read registers");
    }
    if (count == 0 || count > 125) {
        throw std::invalid_argument("Register count must be within 1..125");
    }

    protocol::ModbusRequest request;
    request.slaveId = params_.slaveId;
    request.function = function;
    request.startAddress = address;
    request.count = count;
    return transact(request).values;
}

void RtuClient::writeSingleRegister(std::uint16_t address, std::uint16_t value, protocol::FunctionCode function) {
    if (!protocol::RtuFrameCodec::isWriteFunction(function)) {
        throw std::invalid_argument("Function " + protocol::RtuFrameCodec::functionToString(function) +
                                    " cannot write registers");
    }

    protocol::ModbusRequest request;
    request.slaveId = params_.slaveId;
    request.function = function;
    request.startAddress = address;
    request.count = 1;
    request.values = {value};
    transact(request);
}

void RtuClient::close() {
    if (port_.is_open()) {
        closeStream(port_);
    }
}

protocol::ModbusResponse RtuClient::transact(const protocol::ModbusRequest& request) {
    if (!port_.is_open()) {
        open();
    }

    protocol::ModbusResponse response;
    try {
        response = exchange(request);
    } catch (const TransportError&) {
        if (params_.policy == ConnectionPolicy::PerCall) {
            close();
        }
        throw;
    }

    if (params_.policy == ConnectionPolicy::PerCall) {
        close();
    }

    if (response.isException) {
        throw TransportError(TransportError::Kind::DeviceException,
                             "Slave " + std::to_string(params_.slaveId) + " replied with " +
                                 protocol::RtuFrameCodec::exceptionToString(response.exceptionCode),
                             response.exceptionCode);
    }
    return response;
}

protocol::ModbusResponse RtuClient::exchange(const protocol::ModbusRequest& request) {
    clearLineBuffer();

    writeAll(codec_.createFrame(request), Clock::now() + params_.timeout);

    const auto deadline = Clock::now() + params_.timeout;
    std::vector<std::uint8_t> frame(protocol::RtuFrameCodec::kHeaderSize);
    readExact(frame, 0, protocol::RtuFrameCodec::kHeaderSize, deadline);

    const std::size_t total = (frame[1] & 0x80U) != 0U ? protocol::RtuFrameCodec::kExceptionFrameSize
                                                       : codec_.expectedResponseSize(request);
    frame.resize(total);
    readExact(frame, protocol::RtuFrameCodec::kHeaderSize, total - protocol::RtuFrameCodec::kHeaderSize, deadline);

    try {
        return codec_.parseResponse(frame, request);
    } catch (const protocol::FrameError& e) {
        throw TransportError(TransportError::Kind::Framing, e.what());
    }
}

void RtuClient::open() {
    using base = boost::asio::serial_port_base;

    boost::system::error_code ec;
    port_.open(params_.port, ec);
    if (ec) {
        throw TransportError(TransportError::Kind::LineUnavailable,
                             "Cannot open " + params_.port + ": " + ec.message());
    }

    auto apply = [this](const auto& option, const char* name) {
        boost::system::error_code optionEc;
        port_.set_option(option, optionEc);
        if (optionEc) {
            closeStream(port_);
            throw TransportError(TransportError::Kind::LineUnavailable,
                                 std::string("Cannot set ") + name + " on " + params_.port + ": " + optionEc.message());
        }
    };

    apply(base::baud_rate(params_.baudRate), "baud rate");
    apply(base::character_size(8), "character size");
    apply(toAsioParity(params_.parity), "parity");
    apply(base::stop_bits(params_.stopBits == 2 ? base::stop_bits::two : base::stop_bits::one), "stop bits");
    apply(base::flow_control(base::flow_control::none), "flow control");
}

void RtuClient::clearLineBuffer() {
#ifdef _WIN32
    const bool ok = ::PurgeComm(port_.native_handle(), PURGE_RXCLEAR | PURGE_TXCLEAR) != 0;
#else
    const bool ok = ::tcflush(port_.native_handle(), TCIOFLUSH) == 0;
#endif
    if (!ok) {
        closeStream(port_);
        throw TransportError(TransportError::Kind::LineUnavailable, "Cannot flush " + params_.port);
    }
}

void RtuClient::writeAll(const std::vector<std::uint8_t>& frame, Clock::time_point deadline) {
    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_write(port_, boost::asio::buffer(frame),
                             [&result](const boost::system::error_code& ec, std::size_t) { result = ec; });
    runUntil(result, deadline, "write");
}

void RtuClient::readExact(std::vector<std::uint8_t>& buffer, std::size_t offset, std::size_t size,
                          Clock::time_point deadline) {
    boost::system::error_code result = boost::asio::error::would_block;
    boost::asio::async_read(port_, boost::asio::buffer(buffer.data() + offset, size),
                            [&result](const boost::system::error_code& ec, std::size_t) { result = ec; });
    runUntil(result, deadline, "read");
}

void RtuClient::runUntil(const boost::system::error_code& result, Clock::time_point deadline, const char* operation) {
    ioContext_.restart();
    ioContext_.run_until(deadline);

    if (result == boost::asio::error::would_block) {
        // Deadline hit with the operation still queued: cancel it and drain the aborted handler.
        boost::system::error_code ignored;
        port_.cancel(ignored);
        ioContext_.restart();
        ioContext_.run();
        throw TransportError(TransportError::Kind::Timeout,
                             std::string("Timeout during ") + operation + " on " + params_.port);
    }

    if (result) {
        closeStream(port_);
        throw TransportError(TransportError::Kind::LineUnavailable,
                             std::string("Serial ") + operation + " error on " + params_.port + ": " + result.message());
    }
}

std::vector<std::string> listSerialPorts() {
    std::vector<std::string> ports;
#ifdef _WIN32
    for (int i = 1; i <= 256; ++i) {
        const std::string name = "COM" + std::to_string(i);
        char targetPath[256] = {0};
        if (QueryDosDeviceA(name.c_str(), targetPath, static_cast<DWORD>(sizeof(targetPath))) != 0) {
            ports.push_back(name);
        }
    }
#else
    // USB adapters first: they are where an instrument is almost always attached.
    const std::vector<std::string> prefixes = {"ttyUSB", "ttyACM", "ttyAMA", "rfcomm", "ttyS"};
    const std::filesystem::path devPath{"/dev"};
    std::vector<std::pair<std::size_t, std::string>> found;
    std::error_code ec;
    if (std::filesystem::exists(devPath, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(devPath, ec)) {
            const auto fileName = entry.path().filename().string();
            for (std::size_t rank = 0; rank < prefixes.size(); ++rank) {
                if (fileName.rfind(prefixes[rank], 0) == 0) {
                    if (!isPlatformPlaceholder(fileName)) {
                        found.emplace_back(rank, entry.path().string());
                    }
                    break;
                }
            }
        }
    }
    std::sort(found.begin(), found.end(), [](const auto& lhs, const auto& rhs) {
        if (lhs.first != rhs.first) {
            return lhs.first < rhs.first;
        }
        if (lhs.second.size() != rhs.second.size()) {
            return lhs.second.size() < rhs.second.size(); // ttyUSB2 before ttyUSB10
        }
        return lhs.second < rhs.second;
    });
    for (auto& item : found) {
        ports.push_back(std::move(item.second));
    }
#endif
    return ports;
}

TransportFactory makeRtuTransportFactory() {
    return [](const SerialParams& params) -> TransportPtr {
        return std::make_unique<RtuClient>(params);
    };
}

} // namespace transport
