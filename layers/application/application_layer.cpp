#include "application_layer.h"

#include <future>
#include <utility>

#include "layers/registers/register_codec.h"

namespace application {

ApplicationCore::ApplicationCore(registers::RegisterMap map,
                                 transport::TransportFactory factory,
                                 transport::PortLister portLister,
                                 PollLoopOptions options)
    : loop_(std::move(map), std::move(factory), std::move(portLister), std::move(options)) {}

ApplicationCore::~ApplicationCore() {
    stop();
}

void ApplicationCore::setLogCallback(LogCallback cb) {
    logCallback_ = cb;
    loop_.setLogCallback(std::move(cb));
}

void ApplicationCore::start() {
    loop_.start();
}

void ApplicationCore::stop() {
    loop_.stop();
}

std::vector<LoopEvent> ApplicationCore::pollEvents() {
    auto events = loop_.events().drain();
    for (const auto& event : events) {
        if (event.kind == LoopEvent::Kind::Data) {
            std::lock_guard<std::mutex> lock(snapshotMutex_);
            latest_ = ValueSnapshot{event.values, event.timestamp};
        }
    }
    return events;
}

std::optional<ValueSnapshot> ApplicationCore::latestValues() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return latest_;
}

WriteStatus ApplicationCore::write(const std::string& name,
                                   const std::string& text,
                                   std::string& error,
                                   std::chrono::milliseconds timeout) {
    const auto* descriptor = registerMap().find(name);
    if (!descriptor) {
        error = "Unknown register '" + name + "'";
        return WriteStatus::UnknownRegister;
    }
    if (!descriptor->writable) {
        error = "Register '" + name + "' is read-only";
        return WriteStatus::ReadOnly;
    }

    std::uint16_t raw = 0;
    if (!registers::encode(*descriptor, text, raw, error)) {
        return WriteStatus::InvalidValue;
    }

    auto ticket = loop_.submitWrite(*descriptor, raw);
    auto& future = ticket.outcome();
    if (future.wait_for(timeout) != std::future_status::ready) {
        if (ticket.cancel()) {
            error = "Write to '" + name + "' did not complete in time";
            log(error);
            return WriteStatus::TimedOut;
        }
        // Already on the line; the transport timeout bounds the wait.
        future.wait();
    }

    const auto outcome = future.get();
    if (outcome.status != WriteStatus::Ok) {
        error = outcome.error;
        log("Write to '" + name + "' failed (" + writeStatusToString(outcome.status) + "): " + error);
    }
    return outcome.status;
}

void ApplicationCore::log(const std::string& message) const {
    if (logCallback_) {
        logCallback_(message);
    }
}

} // namespace application
