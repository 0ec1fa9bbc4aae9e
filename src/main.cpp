#include <iostream>
#include <signal.h>
#include <atomic>
#include <chrono>
#include <memory>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "hw/hvg2020.hpp"
#include "hw/posix_serial_port.hpp"
#include "hw/sim_gauge_port.hpp"
#include "ipc/feed.hpp"
#include "ipc/telemetry_pub.hpp"
#include "ipc/control_rep.hpp"
#include "control/acquisition.hpp"
#include "control/runner.hpp"
#include "control/commands.hpp"

// Global flag for clean shutdown
std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested.store(true);
}

int main(int argc, char** argv) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    AgentConfig cfg;
    try {
        cfg = AgentConfig::from_args(argc, argv);
        if (cfg.show_help) {
            std::cout << AgentConfig::usage();
            return 0;
        }
        cfg.validate();
    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n" << AgentConfig::usage();
        return 2;
    }

    Logger::set_level(cfg.log_level);
    Logger log("main");

    try {
        std::unique_ptr<ISerialPort> port;
        if (cfg.simulate) {
            log.info("Using simulated HVG-2020 gauge");
            auto sim = std::make_unique<SimGaugePort>(cfg.port.empty() ? "SIM" : cfg.port);
            sim->simulate_healthy_gauge(980.0, 0.5);
            port = std::move(sim);
        } else {
            SerialSettings settings;
            settings.port = cfg.port;
            settings.baud = cfg.baud;
            port = std::make_unique<PosixSerialPort>(settings);
        }

        GaugeTiming timing;
        timing.verify_after_reopen = cfg.verify_after_reopen;
        auto gauge = std::make_unique<HVG2020Gauge>(std::move(port), timing);

        TelemetryPub telemetry_pub(cfg.telemetry_address);
        ControlRep control_rep(cfg.control_address);

        if (!telemetry_pub.is_connected()) {
            log.error("Failed to bind telemetry publisher");
            return 1;
        }
        if (!control_rep.is_connected()) {
            log.error("Failed to bind control responder");
            return 1;
        }

        AggregatedFeed<TelemetryPub> feed("pressure", telemetry_pub);

        AgentSettings settings;
        settings.f_sample = cfg.sampling_frequency;
        PressureAgent agent(std::move(gauge), feed, settings);
        ProcessRunner runner(agent);

        log.info("Telemetry: " + telemetry_pub.get_bind_address());
        log.info("Control:   " + control_rep.get_bind_address());

        AcqParams startup;
        startup.test_mode = cfg.test_mode;
        OpResult started = runner.start(startup);
        if (!started.ok) {
            log.error(started.message);
            return 1;
        }

        while (!shutdown_requested.load()) {
            if (control_rep.poll(std::chrono::milliseconds(100))) {
                std::string cmd = control_rep.recv();
                if (!control_rep.reply(handle_command(runner, cmd))) {
                    log.warn("failed to send reply to control request");
                }
            }
            if (cfg.test_mode && runner.wait(std::chrono::milliseconds(0))) break;
        }

        log.info("Stopping acquisition...");
        runner.shutdown();

        auto session = runner.session();
        OpResult result = session ? session->result() : OpResult{true, ""};
        log.info("Samples published: " + std::to_string(agent.samples_published()));
        log.info("Shutdown complete.");

        if (cfg.test_mode && session && session->finished() && !result.ok) return 1;

    } catch (const std::exception& e) {
        log.error(std::string("Fatal error: ") + e.what());
        return 1;
    }

    return 0;
}
