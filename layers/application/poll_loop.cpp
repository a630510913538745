#include "poll_loop.h"

#include <stdexcept>
#include <utility>

#include "acquisition.h"

namespace application {

namespace {

LoopEvent makeEvent(LoopEvent::Kind kind, LinkState state) {
    LoopEvent event;
    event.kind = kind;
    event.state = state;
    event.timestamp = std::chrono::system_clock::now();
    return event;
}

} // namespace

const char* linkStateToString(LinkState state) noexcept {
    return state == LinkState::Connected ? "connected" : "disconnected";
}

const char* writeStatusToString(WriteStatus status) noexcept {
    switch (status) {
        case WriteStatus::Ok:
            return "ok";
        case WriteStatus::UnknownRegister:
            return "unknown_register";
        case WriteStatus::ReadOnly:
            return "read_only";
        case WriteStatus::InvalidValue:
            return "invalid_value";
        case WriteStatus::NotConnected:
            return "not_connected";
        case WriteStatus::TransportFailed:
            return "transport_failed";
        case WriteStatus::TimedOut:
            return "timed_out";
    }
    return "unknown";
}

PollLoop::PollLoop(registers::RegisterMap map,
                   transport::TransportFactory factory,
                   transport::PortLister portLister,
                   PollLoopOptions options)
    : map_(std::move(map)),
      factory_(factory),
      options_(std::move(options)),
      discovery_(std::move(factory), std::move(portLister), options_.discovery),
      events_(options_.eventCapacity, [](const LoopEvent& event) { return event.kind == LoopEvent::Kind::Data; }) {}

PollLoop::~PollLoop() {
    stop();
}

void PollLoop::setLogCallback(LogCallback cb) {
    logCallback_ = cb;
    discovery_.setLogCallback(std::move(cb));
}

void PollLoop::start() {
    if (worker_.joinable()) {
        return;
    }
    stopRequested_ = false;
    worker_ = std::thread(&PollLoop::run, this);
}

void PollLoop::stop() {
    stopRequested_ = true;
    wakeup_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    client_.reset();
    markDisconnected("Stopped", "Acquisition stopped");
}

void PollLoop::requestScan() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        scanRequested_ = true;
    }
    wakeup_.notify_all();
}

WriteTicket PollLoop::submitWrite(const registers::RegisterDescriptor& descriptor, std::uint16_t raw) {
    std::promise<WriteOutcome> promise;
    auto claimed = std::make_shared<std::atomic<bool>>(false);
    WriteTicket ticket(promise.get_future(), claimed);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != LinkState::Connected) {
            claimed->store(true);
            promise.set_value({WriteStatus::NotConnected, "Device is not connected"});
            return ticket;
        }
        pendingWrites_.push_back(PendingWrite{descriptor, raw, std::move(promise), std::move(claimed)});
    }
    wakeup_.notify_all();
    return ticket;
}

std::optional<Candidate> PollLoop::activeCandidate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return activeCandidate_;
}

void PollLoop::run() {
    while (!stopRequested_) {
        const auto delay = step();
        if (stopRequested_) {
            break;
        }
        waitFor(delay);
    }
}

std::chrono::milliseconds PollLoop::step() {
    if (state_ == LinkState::Disconnected) {
        return connectStep();
    }
    return pollStep();
}

std::chrono::milliseconds PollLoop::connectStep() {
    std::optional<Candidate> candidate;
    if (options_.fixedCandidate) {
        if (openDurable(*options_.fixedCandidate) && probeDurable(*options_.fixedCandidate)) {
            candidate = options_.fixedCandidate;
        }
    } else {
        auto found = discovery_.discover(map_.slaveId, map_.endianness, map_.probe,
                                         [this] { return stopRequested_.load(); });
        if (found && openDurable(*found)) {
            candidate = std::move(found);
        }
    }

    if (!candidate) {
        if (!waitingLogged_) {
            log("Waiting for device...");
            waitingLogged_ = true;
        }
        return options_.scanInterval;
    }

    markConnected(*candidate);
    return std::chrono::milliseconds(0);
}

std::chrono::milliseconds PollLoop::pollStep() {
    executePendingWrites();
    if (!client_) {
        return options_.scanInterval;
    }

    registers::ValueMap values;
    try {
        values = acquireAll(*client_, map_.registers, map_.endianness);
    } catch (const transport::TransportError& e) {
        client_.reset();
        markDisconnected(std::string("Disconnected (") + transport::errorKindToString(e.kind()) + "): " + e.what() +
                             ". Waiting for device...",
                         "Device disconnected");
        return options_.scanInterval;
    }

    if (isSilentPass(values)) {
        ++silentPasses_;
        if (options_.maxSilentPasses != 0 && silentPasses_ >= options_.maxSilentPasses) {
            client_.reset();
            markDisconnected("Disconnected: device stopped responding. Waiting for device...", "Device disconnected");
            return options_.scanInterval;
        }
    } else {
        silentPasses_ = 0;
    }

    auto event = makeEvent(LoopEvent::Kind::Data, LinkState::Connected);
    event.candidate = activeCandidate();
    event.values = std::move(values);
    events_.push(std::move(event));
    return options_.samplePeriod;
}

bool PollLoop::openDurable(const Candidate& candidate) {
    transport::SerialParams params;
    params.port = candidate.port;
    params.baudRate = candidate.baudRate;
    params.parity = candidate.parity;
    params.stopBits = options_.stopBits;
    params.slaveId = map_.slaveId;
    params.timeout = options_.timeout;
    params.policy = transport::ConnectionPolicy::KeepOpen;

    try {
        client_ = factory_(params);
    } catch (const std::exception& e) {
        log("Cannot open " + candidate.toString() + ": " + e.what());
        client_.reset();
    }
    return client_ != nullptr;
}

bool PollLoop::probeDurable(const Candidate& candidate) {
    try {
        const auto value = acquire(*client_, map_.probe, map_.endianness);
        if (const auto* error = std::get_if<registers::DecodeError>(&value)) {
            log(candidate.toString() + ": " + error->message);
            client_.reset();
            return false;
        }
        return true;
    } catch (const transport::TransportError& e) {
        log(candidate.toString() + ": " + e.what());
        client_.reset();
        return false;
    }
}

void PollLoop::executePendingWrites() {
    std::deque<PendingWrite> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(pendingWrites_);
    }

    for (auto& write : batch) {
        if (write.claimed->exchange(true)) {
            // Withdrawn by the caller after its deadline.
            write.promise.set_value({WriteStatus::TimedOut, "Write cancelled"});
            continue;
        }
        if (!client_) {
            write.promise.set_value({WriteStatus::NotConnected, "Device disconnected"});
            continue;
        }
        try {
            client_->writeSingleRegister(write.descriptor.address, write.raw, write.descriptor.writeFunction);
            log("Wrote " + std::to_string(write.raw) + " to " + write.descriptor.name);
            write.promise.set_value({WriteStatus::Ok, {}});
        } catch (const transport::TransportError& e) {
            const auto status = e.kind() == transport::TransportError::Kind::Timeout ? WriteStatus::TimedOut
                                                                                    : WriteStatus::TransportFailed;
            write.promise.set_value({status, e.what()});
            if (e.isFatal()) {
                client_.reset();
                markDisconnected(std::string("Disconnected: ") + e.what() + ". Waiting for device...",
                                 "Device disconnected");
            }
        } catch (const std::invalid_argument& e) {
            write.promise.set_value({WriteStatus::InvalidValue, e.what()});
        } catch (const std::exception& e) {
            log("Write to " + write.descriptor.name + " failed: " + e.what());
            write.promise.set_value({WriteStatus::TransportFailed, e.what()});
        }
    }
}

void PollLoop::markConnected(const Candidate& candidate) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        activeCandidate_ = candidate;
        state_ = LinkState::Connected;
    }
    silentPasses_ = 0;
    waitingLogged_ = false;

    auto event = makeEvent(LoopEvent::Kind::Status, LinkState::Connected);
    event.reason = "Connected: " + candidate.toString() + ", slave " + std::to_string(map_.slaveId);
    event.candidate = candidate;
    events_.push(std::move(event));
}

void PollLoop::markDisconnected(const std::string& reason, const std::string& writeError) {
    bool wasConnected = false;
    std::deque<PendingWrite> orphaned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wasConnected = state_ == LinkState::Connected;
        state_ = LinkState::Disconnected;
        activeCandidate_.reset();
        orphaned.swap(pendingWrites_);
    }
    silentPasses_ = 0;

    for (auto& write : orphaned) {
        write.claimed->store(true);
        write.promise.set_value({WriteStatus::NotConnected, writeError});
    }

    if (wasConnected) {
        log(reason);
        auto event = makeEvent(LoopEvent::Kind::Status, LinkState::Disconnected);
        event.reason = reason;
        events_.push(std::move(event));
    }
}

void PollLoop::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    wakeup_.wait_for(lock, duration, [this] {
        return stopRequested_.load() || scanRequested_ || !pendingWrites_.empty();
    });
    scanRequested_ = false;
}

void PollLoop::log(const std::string& message) const {
    if (logCallback_) {
        logCallback_(message);
    }
}

} // namespace application
