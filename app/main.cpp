#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <thread>

#include "infrastructure/transport/InMemoryRegisterTransport.h"
#include "layers/api/api_layer.h"
#include "layers/application/application_layer.h"
#include "layers/registers/RegisterMapLoader.h"
#include "layers/transport/transport_layer.h"

namespace {

struct StartupOptions {
    std::string mapPath = "registers.json";

    std::string port;                         // fixed candidate, needs --baud too
    std::optional<std::uint32_t> baudRate;
    transport::Parity parity = transport::Parity::None;
    std::optional<std::uint8_t> slaveId;

    double scanIntervalSec = 2.0;
    double samplePeriodSec = 0.3;
    std::uint32_t timeoutMs = 200;

    bool simulate = false;
    bool showHelp = false;
};

struct InputLine {
    std::string text;
    bool eof = false;
};

void printUsage() {
    std::cout
        << "Usage: qmbmon [options]\n"
        << "Reads JSON-RPC requests from stdin, writes replies and device events to stdout.\n"
        << "Options:\n"
        << "  --map <file>                   Register map (default: registers.json)\n"
        << "  --port <path_or_name>          Skip discovery and use this serial port\n"
        << "  --baud <rate>                  Baud rate for --port\n"
        << "  --parity <N|E|O>               Parity for --port (default: N)\n"
        << "  --slave <id>                   Override the map's slave id (1..247)\n"
        << "  --scan-interval <sec>          Delay between discovery sweeps (default: 2)\n"
        << "  --sample-period <sec>          Delay between acquisition passes (default: 0.3)\n"
        << "  --timeout-ms <ms>              Per-transaction timeout (default: 200)\n"
        << "  --simulate                     Talk to an in-memory simulated device\n"
        << "  --help                         Show this help\n";
}

template <typename UInt>
bool parseUnsigned(const std::string& text, UInt& out) {
    try {
        std::size_t consumed = 0;
        unsigned long long value = std::stoull(text, &consumed);
        if (consumed != text.size() || value > static_cast<unsigned long long>(std::numeric_limits<UInt>::max())) {
            return false;
        }
        out = static_cast<UInt>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseSeconds(const std::string& text, double& out) {
    try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(value) || value <= 0.0) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::chrono::milliseconds toMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

std::optional<StartupOptions> parseArgs(int argc, char* argv[], std::string& error) {
    StartupOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto getValue = [&](const std::string& key) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            options.showHelp = true;
            continue;
        }
        if (arg == "--simulate") {
            options.simulate = true;
            continue;
        }
        if (arg == "--map") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.mapPath = *value;
            continue;
        }
        if (arg == "--port") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.port = *value;
            continue;
        }
        if (arg == "--baud") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            std::uint32_t baud = 0;
            if (!parseUnsigned(*value, baud) || baud == 0) {
                error = "Invalid --baud value: " + *value;
                return std::nullopt;
            }
            options.baudRate = baud;
            continue;
        }
        if (arg == "--parity") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            if (!transport::parseParity(*value, options.parity)) {
                error = "Invalid --parity value: " + *value + ". Use N, E or O";
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--slave") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            std::uint8_t slave = 0;
            if (!parseUnsigned(*value, slave) || slave < 1 || slave > 247) {
                error = "Invalid --slave value: " + *value + ". Use 1..247";
                return std::nullopt;
            }
            options.slaveId = slave;
            continue;
        }
        if (arg == "--scan-interval") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            if (!parseSeconds(*value, options.scanIntervalSec)) {
                error = "Invalid --scan-interval value: " + *value;
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--sample-period") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            if (!parseSeconds(*value, options.samplePeriodSec)) {
                error = "Invalid --sample-period value: " + *value;
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--timeout-ms") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            if (!parseUnsigned(*value, options.timeoutMs) || options.timeoutMs == 0) {
                error = "Invalid --timeout-ms value: " + *value;
                return std::nullopt;
            }
            continue;
        }

        error = "Unknown argument: " + arg;
        return std::nullopt;
    }

    if (options.port.empty() != !options.baudRate.has_value()) {
        error = "--port and --baud must be given together";
        return std::nullopt;
    }

    return options;
}

application::PollLoopOptions makeLoopOptions(const StartupOptions& options) {
    application::PollLoopOptions loop;
    loop.scanInterval = toMillis(options.scanIntervalSec);
    loop.samplePeriod = toMillis(options.samplePeriodSec);
    loop.timeout = std::chrono::milliseconds(options.timeoutMs);
    loop.discovery.timeout = loop.timeout;
    if (!options.port.empty()) {
        loop.fixedCandidate = application::Candidate{options.port, *options.baudRate, options.parity};
    }
    return loop;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string parseError;
    const auto parsed = parseArgs(argc, argv, parseError);
    if (!parsed) {
        std::cerr << parseError << "\n\n";
        printUsage();
        return 2;
    }

    const auto options = *parsed;
    if (options.showHelp) {
        printUsage();
        return 0;
    }

    registers::RegisterMap map;
    try {
        map = registers::loadRegisterMap(options.mapPath);
    } catch (const registers::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }
    if (options.slaveId) {
        map.slaveId = *options.slaveId;
    }

    transport::TransportFactory factory = transport::makeRtuTransportFactory();
    transport::PortLister portLister = [] { return transport::listSerialPorts(); };

    transport::InMemoryRegisterTransport simulator;
    if (options.simulate) {
        factory = [&simulator](const transport::SerialParams&) { return simulator.share(); };
        portLister = [] { return std::vector<std::string>{"sim0"}; };
    }

    application::ApplicationCore appCore(std::move(map), factory, portLister, makeLoopOptions(options));
    appCore.setLogCallback([](const std::string& message) {
        std::cerr << "[qmbmon] " << message << std::endl;
    });
    api::ApiController controller(appCore);

    std::cerr << "Register map: " << options.mapPath << " (" << appCore.registerMap().registers.size()
              << " registers, slave " << static_cast<int>(appCore.registerMap().slaveId) << ")" << std::endl;

    application::EventQueue<InputLine> input;
    std::thread reader([&input] {
        std::string line;
        while (std::getline(std::cin, line)) {
            input.push(InputLine{line, false});
        }
        input.push(InputLine{{}, true});
    });

    appCore.start();

    bool running = true;
    while (running) {
        for (const auto& event : appCore.pollEvents()) {
            std::cout << boost::json::serialize(api::ApiController::eventToNotification(event)) << std::endl;
        }

        const auto line = input.waitPop(std::chrono::milliseconds(50));
        if (!line) {
            continue;
        }
        if (line->eof) {
            running = false;
            continue;
        }
        if (line->text.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        std::cout << controller.handleLine(line->text) << std::endl;
    }

    appCore.stop();
    for (const auto& event : appCore.pollEvents()) {
        std::cout << boost::json::serialize(api::ApiController::eventToNotification(event)) << std::endl;
    }
    reader.join();
    return 0;
}
