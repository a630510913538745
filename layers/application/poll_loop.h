#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "EventQueue.h"
#include "discovery.h"
#include "layers/registers/DecodedValue.h"
#include "layers/registers/RegisterTypes.h"
#include "layers/transport/ITransport.h"

namespace application {

enum class LinkState {
    Disconnected,
    Connected
};

const char* linkStateToString(LinkState state) noexcept;

struct LoopEvent {
    enum class Kind {
        Status,
        Data
    };

    Kind kind = Kind::Status;
    LinkState state = LinkState::Disconnected;
    std::string reason;
    std::optional<Candidate> candidate;
    registers::ValueMap values;
    std::chrono::system_clock::time_point timestamp;
};

enum class WriteStatus {
    Ok,
    UnknownRegister,
    ReadOnly,
    InvalidValue,
    NotConnected,
    TransportFailed,
    TimedOut
};

const char* writeStatusToString(WriteStatus status) noexcept;

struct WriteOutcome {
    WriteStatus status = WriteStatus::Ok;
    std::string error;
};

// A write waiting for the worker. The worker claims it before touching the
// line, so a successful cancel() means the register is never written.
class WriteTicket {
public:
    WriteTicket(std::future<WriteOutcome> outcome, std::shared_ptr<std::atomic<bool>> claimed)
        : outcome_(std::move(outcome)), claimed_(std::move(claimed)) {}

    std::future<WriteOutcome>& outcome() noexcept { return outcome_; }
    bool cancel() noexcept { return !claimed_->exchange(true); }

private:
    std::future<WriteOutcome> outcome_;
    std::shared_ptr<std::atomic<bool>> claimed_;
};

struct PollLoopOptions {
    std::chrono::milliseconds scanInterval{2000};
    std::chrono::milliseconds samplePeriod{300};
    std::chrono::milliseconds timeout{200};
    std::uint8_t stopBits = 1;
    // Consecutive passes with nothing but link errors before the device is
    // considered gone. 0 disables the check.
    std::size_t maxSilentPasses = 3;
    std::size_t eventCapacity = 1024;
    // Skips discovery and always connects with these settings.
    std::optional<Candidate> fixedCandidate;
    DiscoveryOptions discovery;
};

// Disconnected/Connected state machine that owns the transport on a single
// worker thread. Consumers only see the event queue and the write futures.
class PollLoop {
public:
    PollLoop(registers::RegisterMap map,
             transport::TransportFactory factory,
             transport::PortLister portLister,
             PollLoopOptions options = {});
    ~PollLoop();

    PollLoop(const PollLoop&) = delete;
    PollLoop& operator=(const PollLoop&) = delete;

    // Must be called before start().
    void setLogCallback(LogCallback cb);

    void start();
    void stop();
    bool isRunning() const noexcept { return worker_.joinable(); }

    // One iteration on the caller's thread. Returns how long the worker would
    // sleep afterwards. Only valid while the worker is not running.
    std::chrono::milliseconds step();

    void requestScan();
    WriteTicket submitWrite(const registers::RegisterDescriptor& descriptor, std::uint16_t raw);

    EventQueue<LoopEvent>& events() noexcept { return events_; }
    LinkState state() const noexcept { return state_.load(); }
    std::optional<Candidate> activeCandidate() const;
    const registers::RegisterMap& registerMap() const noexcept { return map_; }
    std::vector<std::string> listPorts() const { return discovery_.listPorts(); }

private:
    struct PendingWrite {
        registers::RegisterDescriptor descriptor;
        std::uint16_t raw = 0;
        std::promise<WriteOutcome> promise;
        std::shared_ptr<std::atomic<bool>> claimed;
    };

    void run();
    std::chrono::milliseconds connectStep();
    std::chrono::milliseconds pollStep();
    bool openDurable(const Candidate& candidate);
    bool probeDurable(const Candidate& candidate);
    void executePendingWrites();
    void markConnected(const Candidate& candidate);
    void markDisconnected(const std::string& reason, const std::string& writeError);
    void waitFor(std::chrono::milliseconds duration);
    void log(const std::string& message) const;

    registers::RegisterMap map_;
    transport::TransportFactory factory_;
    PollLoopOptions options_;
    Discovery discovery_;
    LogCallback logCallback_;
    EventQueue<LoopEvent> events_;

    std::thread worker_;
    std::atomic<bool> stopRequested_{false};
    std::atomic<LinkState> state_{LinkState::Disconnected};

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    bool scanRequested_ = false;
    std::deque<PendingWrite> pendingWrites_;
    std::optional<Candidate> activeCandidate_;

    // Worker-only.
    transport::TransportPtr client_;
    std::size_t silentPasses_ = 0;
    bool waitingLogged_ = false;
};

} // namespace application
