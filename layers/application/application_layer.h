#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "poll_loop.h"
#include "layers/registers/DecodedValue.h"
#include "layers/registers/RegisterTypes.h"
#include "layers/transport/ITransport.h"

namespace application {

struct ValueSnapshot {
    registers::ValueMap values;
    std::chrono::system_clock::time_point timestamp;
};

// Front door for a consumer: owns the poll loop, keeps the last published
// values and turns write(name, text) into an encoded, queued register write.
class ApplicationCore {
public:
    ApplicationCore(registers::RegisterMap map,
                    transport::TransportFactory factory,
                    transport::PortLister portLister,
                    PollLoopOptions options = {});
    ~ApplicationCore();

    ApplicationCore(const ApplicationCore&) = delete;
    ApplicationCore& operator=(const ApplicationCore&) = delete;

    void setLogCallback(LogCallback cb);

    void start();
    void stop();

    // Drains the loop's events and refreshes the cached snapshot and state.
    std::vector<LoopEvent> pollEvents();

    WriteStatus write(const std::string& name,
                      const std::string& text,
                      std::string& error,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    void requestScan() { loop_.requestScan(); }
    LinkState linkState() const noexcept { return loop_.state(); }
    std::optional<Candidate> activeCandidate() const { return loop_.activeCandidate(); }
    std::optional<ValueSnapshot> latestValues() const;
    std::vector<std::string> listSerialPorts() const { return loop_.listPorts(); }

    const registers::RegisterMap& registerMap() const noexcept { return loop_.registerMap(); }
    PollLoop& pollLoop() noexcept { return loop_; }

private:
    void log(const std::string& message) const;

    PollLoop loop_;
    LogCallback logCallback_;

    mutable std::mutex snapshotMutex_;
    std::optional<ValueSnapshot> latest_;
};

} // namespace application
